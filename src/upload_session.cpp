#include "upload_session.hpp"
#include "checksum.hpp"
#include "error.hpp"
#include "utils.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <set>
#include <vector>

namespace fs = std::filesystem;

namespace Pkgdepot {

struct UploadSessions::Session
{
    Session(const std::string& sessionId, const PartitionKey& key, std::uint64_t length,
            const std::string& expected, const fs::path& dir)
        : id(sessionId), partition(key), declaredLength(length), expectedSha256(expected),
          directory(dir), file(dir / "upload.part"), sha256(Digest::sha256()),
          lastActivity(Clock::now()) {}

    std::mutex mutex;
    const std::string id;
    const PartitionKey partition;
    const std::uint64_t declaredLength;
    const std::string expectedSha256;
    const fs::path directory;
    const fs::path file;
    std::ofstream out;
    Digest sha256;
    std::uint64_t received = 0;
    Clock::time_point lastActivity;
    bool finalized = false;
    bool discarded = false;
};

namespace {

    const char* stagingDirName = ".uploads";

    void removeStaging(const fs::path& dir)
    {
        std::error_code ec;
        fs::remove_all(dir, ec);
        if (ec) {
            log_warning("Failed to remove upload staging directory " + dir.string() + ": " +
                        ec.message());
        }
    }

    std::string normalizeChecksum(const std::string& hex)
    {
        std::string out = trim(hex);
        std::transform(out.begin(), out.end(), out.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        if (out.empty()) {
            return out;
        }
        bool valid = out.size() == 64 &&
                     std::all_of(out.begin(), out.end(),
                                 [](unsigned char c) { return std::isxdigit(c) != 0; });
        if (!valid) {
            throw InputError(InputError::Kind::ChecksumMismatch,
                             "expected SHA-256 '" + hex + "' is not 64 hex digits");
        }
        return out;
    }

} // anonymous namespace

UploadSessions::UploadSessions(const Config& config)
    : config(config)
{
}

fs::path UploadSessions::stagingRoot() const
{
    return config.dataPath / stagingDirName;
}

std::shared_ptr<UploadSessions::Session> UploadSessions::lookup(const std::string& id) const
{
    std::lock_guard<std::mutex> lock(mapMutex);
    auto it = sessions.find(id);
    if (it == sessions.end()) {
        throw NotFoundError("upload session " + id);
    }
    return it->second;
}

void UploadSessions::forget(const std::string& id)
{
    std::lock_guard<std::mutex> lock(mapMutex);
    sessions.erase(id);
}

// ============================================================================
// Session lifecycle
// ============================================================================

std::string UploadSessions::open(const PartitionKey& partition,
                                 std::uint64_t declaredLength,
                                 const std::string& expectedSha256)
{
    validatePathComponent(partition.repo, "repository");
    validatePathComponent(partition.arch, "architecture");
    std::string expected = normalizeChecksum(expectedSha256);

    std::string id;
    {
        std::lock_guard<std::mutex> lock(mapMutex);
        do {
            id = randomHex(32);
        } while (sessions.count(id) != 0);
        // Reserve the id until the session is ready.
        sessions[id] = nullptr;
    }

    fs::path dir = stagingRoot() / id;
    std::shared_ptr<Session> session;
    try {
        std::error_code ec;
        fs::create_directories(dir, ec);
        if (ec) {
            throw IoError("Unable to create upload staging directory", dir, ec);
        }

        session = std::make_shared<Session>(id, partition, declaredLength, expected, dir);
        session->out.open(session->file, std::ios::binary | std::ios::trunc);
        if (!session->out.is_open()) {
            throw IoError("Unable to create upload staging file", session->file,
                          std::make_error_code(std::errc::io_error));
        }
    } catch (const std::exception&) {
        removeStaging(dir);
        forget(id);
        throw;
    }

    {
        std::lock_guard<std::mutex> lock(mapMutex);
        sessions[id] = session;
    }

    log_message("Opened upload session " + id + " for " + partition.toString() + " (" +
                std::to_string(declaredLength) + " bytes)");
    return id;
}

void UploadSessions::writeChunk(const std::string& id, const void* data, std::size_t size)
{
    std::shared_ptr<Session> session = lookup(id);
    if (!session) {
        throw NotFoundError("upload session " + id);
    }

    std::lock_guard<std::mutex> lock(session->mutex);
    if (session->discarded) {
        throw NotFoundError("upload session " + id);
    }
    if (session->finalized) {
        throw InputError(InputError::Kind::InvalidState,
                         "upload session " + id + " is already finalized");
    }
    if (size > config.maxChunkSize) {
        throw InputError(InputError::Kind::SizeMismatch,
                         "chunk of " + std::to_string(size) + " bytes exceeds the maximum of " +
                         std::to_string(config.maxChunkSize));
    }
    if (size > session->declaredLength - session->received) {
        throw InputError(InputError::Kind::SizeMismatch,
                         "chunk of " + std::to_string(size) + " bytes overflows declared length " +
                         std::to_string(session->declaredLength) + " (" +
                         std::to_string(session->received) + " already received)");
    }

    session->out.write(static_cast<const char*>(data), static_cast<std::streamsize>(size));
    if (!session->out) {
        throw IoError("Unable to write upload chunk", session->file,
                      std::make_error_code(std::errc::io_error));
    }
    session->sha256.update(data, size);
    session->received += size;
    session->lastActivity = Clock::now();

    log_debug("Upload " + id + ": " + std::to_string(session->received) + "/" +
              std::to_string(session->declaredLength) + " bytes");
}

fs::path UploadSessions::finalize(const std::string& id)
{
    std::shared_ptr<Session> session = lookup(id);
    if (!session) {
        throw NotFoundError("upload session " + id);
    }

    std::string actual;
    {
        std::lock_guard<std::mutex> lock(session->mutex);
        if (session->discarded) {
            throw NotFoundError("upload session " + id);
        }
        if (session->finalized) {
            return session->file;
        }
        if (session->received < session->declaredLength) {
            throw InputError(InputError::Kind::IncompleteUpload,
                             "received " + std::to_string(session->received) + " of " +
                             std::to_string(session->declaredLength) + " bytes");
        }

        session->out.close();
        if (!session->out) {
            throw IoError("Unable to flush upload staging file", session->file,
                          std::make_error_code(std::errc::io_error));
        }

        actual = session->sha256.hexDigest();
        if (session->expectedSha256.empty() || actual == session->expectedSha256) {
            session->finalized = true;
            session->lastActivity = Clock::now();
            log_message("Finalized upload session " + id + " (" +
                        std::to_string(session->received) + " bytes)");
            return session->file;
        }

        session->discarded = true;
        removeStaging(session->directory);
    }

    forget(id);
    log_warning("Discarded upload session " + id + " after checksum mismatch");
    throw InputError(InputError::Kind::ChecksumMismatch,
                     "expected " + session->expectedSha256 + ", got " + actual);
}

void UploadSessions::discard(const std::string& id)
{
    std::shared_ptr<Session> session = lookup(id);
    if (!session) {
        throw NotFoundError("upload session " + id);
    }

    {
        std::lock_guard<std::mutex> lock(session->mutex);
        if (session->discarded) {
            throw NotFoundError("upload session " + id);
        }
        session->discarded = true;
        if (session->out.is_open()) {
            session->out.close();
        }
        removeStaging(session->directory);
    }

    forget(id);
    log_message("Discarded upload session " + id);
}

std::size_t UploadSessions::discardExpired(Clock::time_point now)
{
    std::vector<std::shared_ptr<Session>> candidates;
    {
        std::lock_guard<std::mutex> lock(mapMutex);
        for (const auto& entry : sessions) {
            if (entry.second) {
                candidates.push_back(entry.second);
            }
        }
    }

    const auto timeout = std::chrono::seconds(
        static_cast<std::chrono::seconds::rep>(config.sessionTimeout));
    std::size_t count = 0;
    for (const auto& session : candidates) {
        {
            std::lock_guard<std::mutex> lock(session->mutex);
            if (session->discarded || now - session->lastActivity <= timeout) {
                continue;
            }
            session->discarded = true;
            if (session->out.is_open()) {
                session->out.close();
            }
            removeStaging(session->directory);
        }
        forget(session->id);
        log_message("Upload session " + session->id + " expired");
        ++count;
    }
    return count;
}

std::size_t UploadSessions::purgeAll()
{
    const fs::path root = stagingRoot();
    std::error_code ec;
    if (!fs::is_directory(root, ec)) {
        return 0;
    }

    std::set<std::string> live;
    {
        std::lock_guard<std::mutex> lock(mapMutex);
        for (const auto& entry : sessions) {
            live.insert(entry.first);
        }
    }

    std::vector<fs::path> entries;
    try {
        for (const auto& entry : fs::directory_iterator(root)) {
            entries.push_back(entry.path());
        }
    } catch (const fs::filesystem_error& e) {
        throw toIoError("Unable to list upload staging area", e);
    }

    std::size_t removed = 0;
    for (const auto& path : entries) {
        if (live.count(path.filename().string()) != 0) {
            continue;
        }
        std::error_code removeEc;
        fs::remove_all(path, removeEc);
        if (removeEc) {
            log_warning("Failed to remove stale upload " + path.string() + ": " +
                        removeEc.message());
            continue;
        }
        ++removed;
    }

    if (removed > 0) {
        log_message("Purged " + std::to_string(removed) + " stale upload(s)");
    }
    return removed;
}

UploadStatus UploadSessions::status(const std::string& id) const
{
    std::shared_ptr<Session> session = lookup(id);
    if (!session) {
        throw NotFoundError("upload session " + id);
    }

    std::lock_guard<std::mutex> lock(session->mutex);
    UploadStatus result;
    result.id = session->id;
    result.partition = session->partition;
    result.declaredLength = session->declaredLength;
    result.received = session->received;
    result.finalized = session->finalized;
    return result;
}

std::size_t UploadSessions::size() const
{
    std::lock_guard<std::mutex> lock(mapMutex);
    std::size_t count = 0;
    for (const auto& entry : sessions) {
        if (entry.second) {
            ++count;
        }
    }
    return count;
}

} // namespace Pkgdepot
