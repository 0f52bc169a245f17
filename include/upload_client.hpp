#ifndef UPLOAD_CLIENT_HPP
#define UPLOAD_CLIENT_HPP

#include "config.hpp"
#include "package.hpp"

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace Pkgdepot {

/**
 * @brief Server's answer to an upload initiation.
 */
struct UploadPlan
{
    std::string uploadId;
    std::uint64_t chunkSize = 0;
    std::uint32_t totalChunks = 0;
    std::string expiresAt;
};

/**
 * @brief Server's acknowledgement of one chunk: its 1-based number and the
 *        MD5 of the bytes it received.
 */
struct ChunkReceipt
{
    std::uint32_t chunkNumber = 0;
    std::string checksum;
};

/**
 * @class UploadClient
 * @brief Pushes a package archive to a remote repository service using its
 *        chunked upload protocol:
 *
 *     POST   <url>/upload/initiate
 *     POST   <url>/upload/<id>/chunks/<n>    (n = 1 .. total_chunks)
 *     POST   <url>/upload/<id>/complete
 *     DELETE <url>/upload/<id>               (abort)
 *
 * Request and response bodies are JSON.
 */
class UploadClient
{
public:
    /**
     * @param config Supplies the base URL, chunk size and retry count.
     */
    explicit UploadClient(const Config& config);

    /// Overrides the configured base URL.
    void setBaseUrl(const std::string& url) { baseUrl = url; }
    const std::string& getBaseUrl() const { return baseUrl; }

    /**
     * @brief Uploads `file` into `partition`.
     *
     * Each chunk is attempted up to the configured number of times; a chunk
     * whose acknowledged MD5 differs from the local one counts as a failed
     * attempt. If a chunk still fails the remote session is aborted.
     *
     * @return The body of the completion response (the stored package record).
     * @throws TransportError on HTTP or protocol failures.
     * @throws IoError if the file cannot be read.
     */
    std::string push(const std::filesystem::path& file, const PartitionKey& partition);

    // ------------------------------------------------------------------
    // Protocol helpers
    // ------------------------------------------------------------------

    static std::string initiateBody(const std::string& filename,
                                    std::uint64_t size,
                                    const std::string& sha256,
                                    const PartitionKey& partition,
                                    std::uint64_t chunkSize);

    /**
     * @throws TransportError if a required field is missing or malformed.
     */
    static UploadPlan parseInitiateResponse(const std::string& body);

    /**
     * @throws TransportError if a required field is missing or malformed.
     */
    static ChunkReceipt parseChunkResponse(const std::string& body);

    static std::string completeBody(const std::vector<ChunkReceipt>& chunks);

    /**
     * @brief Joins the base URL and a relative path with exactly one '/'.
     */
    static std::string endpoint(const std::string& base, const std::string& path);

private:
    struct Response
    {
        long status = 0;
        std::string body;
    };

    Response request(const std::string& method,
                     const std::string& url,
                     const std::string& body,
                     const char* contentType) const;

    std::vector<ChunkReceipt> sendChunks(const std::filesystem::path& file,
                                         const UploadPlan& plan) const;
    void abort(const std::string& uploadId) const;

    std::string baseUrl;
    std::uint64_t chunkSize;
    unsigned retries;
};

} // namespace Pkgdepot

#endif // UPLOAD_CLIENT_HPP
