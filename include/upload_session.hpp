#ifndef UPLOAD_SESSION_HPP
#define UPLOAD_SESSION_HPP

#include "config.hpp"
#include "package.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <string>

namespace Pkgdepot {

/**
 * @brief Snapshot of one upload session, as reported by UploadSessions::status().
 */
struct UploadStatus
{
    std::string id;
    PartitionKey partition;
    std::uint64_t declaredLength = 0;
    std::uint64_t received = 0;
    bool finalized = false;
};

/**
 * @class UploadSessions
 * @brief Reassembles uploaded package archives from sequential chunks.
 *
 * Every session owns a staging directory <data>/.uploads/<id>/ holding the
 * single file the chunks are appended to, in the order they arrive. Bytes
 * are hashed as they are written so finalize() never re-reads the file.
 *
 * The session table is guarded by one mutex; each session additionally has
 * its own mutex, so chunks for different sessions are written in parallel
 * while writes to the same session are serialized.
 */
class UploadSessions
{
public:
    using Clock = std::chrono::steady_clock;

    explicit UploadSessions(const Config& config);

    UploadSessions(const UploadSessions&) = delete;
    UploadSessions& operator=(const UploadSessions&) = delete;

    /**
     * @brief Opens a session for an archive of `declaredLength` bytes bound
     *        for `partition`.
     *
     * @param expectedSha256 Optional hex SHA-256 the assembled bytes must match.
     * @return The new session id (32 lowercase hex characters).
     * @throws InputError (InvalidPath) for a bad partition,
     *         (ChecksumMismatch) for a malformed expected checksum.
     * @throws IoError if the staging directory cannot be created.
     */
    std::string open(const PartitionKey& partition,
                     std::uint64_t declaredLength,
                     const std::string& expectedSha256 = "");

    /**
     * @brief Appends one chunk to the session's staging file.
     *
     * @throws NotFoundError for an unknown (or discarded) session.
     * @throws InputError (SizeMismatch) if the chunk is larger than the
     *         configured maximum or would overflow the declared length,
     *         (InvalidState) if the session is already finalized.
     * @throws IoError if the staging file cannot be written.
     */
    void writeChunk(const std::string& id, const void* data, std::size_t size);
    void writeChunk(const std::string& id, const std::string& bytes)
    {
        writeChunk(id, bytes.data(), bytes.size());
    }

    /**
     * @brief Completes the session and returns the path of the assembled
     *        archive. The file is not validated here.
     *
     * Finalizing an already finalized session returns the same path.
     *
     * @throws InputError (IncompleteUpload) if fewer bytes than declared
     *         have arrived. The session stays open for more chunks.
     * @throws InputError (ChecksumMismatch) if an expected SHA-256 was given
     *         and does not match; the session is discarded.
     */
    std::filesystem::path finalize(const std::string& id);

    /**
     * @brief Drops a session and removes its staging directory.
     *
     * @throws NotFoundError for an unknown session.
     */
    void discard(const std::string& id);

    /**
     * @brief Discards every session idle for longer than the configured
     *        session timeout as of `now`.
     *
     * @return Number of sessions discarded.
     */
    std::size_t discardExpired(Clock::time_point now);

    /**
     * @brief Removes staging directories that belong to no live session,
     *        such as those left behind by a previous process.
     *
     * @return Number of directories removed.
     */
    std::size_t purgeAll();

    /**
     * @throws NotFoundError for an unknown session.
     */
    UploadStatus status(const std::string& id) const;

    /// Number of live sessions.
    std::size_t size() const;

    /// <data>/.uploads
    std::filesystem::path stagingRoot() const;

private:
    struct Session;

    std::shared_ptr<Session> lookup(const std::string& id) const;
    void forget(const std::string& id);

    const Config& config;
    mutable std::mutex mapMutex;
    std::map<std::string, std::shared_ptr<Session>> sessions;
};

} // namespace Pkgdepot

#endif // UPLOAD_SESSION_HPP
