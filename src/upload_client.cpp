#include "upload_client.hpp"
#include "checksum.hpp"
#include "error.hpp"
#include "utils.hpp"

#include <curl/curl.h>
#include <yaml-cpp/yaml.h>

#include <chrono>
#include <fstream>
#include <memory>
#include <thread>

namespace fs = std::filesystem;

namespace Pkgdepot {

namespace {

    using CurlHandle = std::unique_ptr<CURL, void (*)(CURL*)>;
    using HeaderList = std::unique_ptr<curl_slist, void (*)(curl_slist*)>;

    const char* jsonType = "application/json";
    const char* octetType = "application/octet-stream";

    void expectSuccess(long status, const std::string& body, const std::string& what)
    {
        if (status < 200 || status >= 300) {
            throw TransportError(what + " failed with HTTP " + std::to_string(status) +
                                 (body.empty() ? std::string() : ": " + body),
                                 status);
        }
    }

    YAML::Node parseJson(const std::string& body, const char* what)
    {
        try {
            YAML::Node node = YAML::Load(body);
            if (!node.IsMap()) {
                throw TransportError(std::string("Malformed ") + what + " response");
            }
            return node;
        } catch (const YAML::Exception& e) {
            throw TransportError(std::string("Malformed ") + what + " response: " + e.what());
        }
    }

    template <typename T>
    T requireField(const YAML::Node& node, const char* key, const char* what)
    {
        const YAML::Node value = node[key];
        if (!value || value.IsNull()) {
            throw TransportError(std::string(what) + " response lacks '" + key + "'");
        }
        try {
            return value.as<T>();
        } catch (const YAML::Exception& e) {
            throw TransportError(std::string(what) + " response has a malformed '" + key +
                                 "': " + e.what());
        }
    }

    YAML::Emitter& jsonEmitter(YAML::Emitter& out)
    {
        out.SetMapFormat(YAML::Flow);
        out.SetSeqFormat(YAML::Flow);
        out.SetStringFormat(YAML::DoubleQuoted);
        return out;
    }

} // anonymous namespace

UploadClient::UploadClient(const Config& config)
    : baseUrl(config.clientUrl),
      chunkSize(config.clientChunkSize),
      retries(config.clientRetries == 0 ? 1 : config.clientRetries)
{
}

// ============================================================================
// Protocol helpers
// ============================================================================

std::string UploadClient::endpoint(const std::string& base, const std::string& path)
{
    std::string url = base;
    while (!url.empty() && url.back() == '/') {
        url.pop_back();
    }
    std::string rest = path;
    while (!rest.empty() && rest.front() == '/') {
        rest.erase(0, 1);
    }
    return url + "/" + rest;
}

std::string UploadClient::initiateBody(const std::string& filename,
                                       std::uint64_t size,
                                       const std::string& sha256,
                                       const PartitionKey& partition,
                                       std::uint64_t chunkSize)
{
    YAML::Emitter out;
    jsonEmitter(out);
    out << YAML::BeginMap;
    out << YAML::Key << "filename" << YAML::Value << filename;
    out << YAML::Key << "size" << YAML::Value << size;
    out << YAML::Key << "sha256" << YAML::Value << sha256;
    out << YAML::Key << "repo" << YAML::Value << partition.repo;
    out << YAML::Key << "arch" << YAML::Value << partition.arch;
    out << YAML::Key << "chunk_size" << YAML::Value << chunkSize;
    out << YAML::EndMap;
    return out.c_str();
}

UploadPlan UploadClient::parseInitiateResponse(const std::string& body)
{
    YAML::Node node = parseJson(body, "initiate");
    UploadPlan plan;
    plan.uploadId = requireField<std::string>(node, "upload_id", "initiate");
    plan.chunkSize = requireField<std::uint64_t>(node, "chunk_size", "initiate");
    plan.totalChunks = requireField<std::uint32_t>(node, "total_chunks", "initiate");
    if (node["expires_at"]) {
        plan.expiresAt = requireField<std::string>(node, "expires_at", "initiate");
    }
    if (plan.uploadId.empty() || plan.chunkSize == 0) {
        throw TransportError("initiate response has an empty upload id or chunk size");
    }
    return plan;
}

ChunkReceipt UploadClient::parseChunkResponse(const std::string& body)
{
    YAML::Node node = parseJson(body, "chunk");
    ChunkReceipt receipt;
    receipt.chunkNumber = requireField<std::uint32_t>(node, "chunk_number", "chunk");
    receipt.checksum = requireField<std::string>(node, "checksum", "chunk");
    return receipt;
}

std::string UploadClient::completeBody(const std::vector<ChunkReceipt>& chunks)
{
    YAML::Emitter out;
    jsonEmitter(out);
    out << YAML::BeginMap;
    out << YAML::Key << "chunks" << YAML::Value << YAML::BeginSeq;
    for (const auto& chunk : chunks) {
        out << YAML::BeginMap;
        out << YAML::Key << "chunk_number" << YAML::Value << chunk.chunkNumber;
        out << YAML::Key << "checksum" << YAML::Value << chunk.checksum;
        out << YAML::EndMap;
    }
    out << YAML::EndSeq;
    out << YAML::EndMap;
    return out.c_str();
}

// ============================================================================
// HTTP
// ============================================================================

UploadClient::Response UploadClient::request(const std::string& method,
                                             const std::string& url,
                                             const std::string& body,
                                             const char* contentType) const
{
    CurlHandle curl(curl_easy_init(), curl_easy_cleanup);
    if (!curl) {
        throw TransportError("Failed to initialize curl");
    }

    HeaderList headers(nullptr, curl_slist_free_all);
    if (contentType) {
        std::string header = std::string("Content-Type: ") + contentType;
        curl_slist* list = curl_slist_append(nullptr, header.c_str());
        if (!list) {
            throw TransportError("Failed to build request headers");
        }
        headers.reset(list);
    }

    Response response;
    curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, writeCallback);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &response.body);
    curl_easy_setopt(curl.get(), CURLOPT_USERAGENT, "pkgdepot/1.0");
    curl_easy_setopt(curl.get(), CURLOPT_CONNECTTIMEOUT, 15L);
    curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT, 300L);
    if (headers) {
        curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, headers.get());
    }

    if (method == "POST") {
        curl_easy_setopt(curl.get(), CURLOPT_POST, 1L);
        curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDS, body.data());
        curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDSIZE_LARGE,
                         static_cast<curl_off_t>(body.size()));
    } else {
        curl_easy_setopt(curl.get(), CURLOPT_CUSTOMREQUEST, method.c_str());
    }

    CURLcode res = curl_easy_perform(curl.get());
    if (res != CURLE_OK) {
        throw TransportError(method + " " + url + ": " + curl_easy_strerror(res));
    }
    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &response.status);
    log_debug(method + " " + url + " -> " + std::to_string(response.status));
    return response;
}

// ============================================================================
// Upload
// ============================================================================

std::vector<ChunkReceipt> UploadClient::sendChunks(const fs::path& file,
                                                   const UploadPlan& plan) const
{
    std::ifstream in(file, std::ios::binary);
    if (!in.is_open()) {
        throw IoError("Unable to open package", file,
                      std::make_error_code(std::errc::no_such_file_or_directory));
    }

    std::vector<ChunkReceipt> receipts;
    std::string chunk;
    for (std::uint32_t number = 1; number <= plan.totalChunks; ++number) {
        chunk.resize(plan.chunkSize);
        in.read(&chunk[0], static_cast<std::streamsize>(chunk.size()));
        if (in.bad()) {
            throw IoError("Unable to read package", file,
                          std::make_error_code(std::errc::io_error));
        }
        chunk.resize(static_cast<std::size_t>(in.gcount()));
        if (chunk.empty()) {
            throw TransportError("Server expects " + std::to_string(plan.totalChunks) +
                                 " chunks but the file ends after " +
                                 std::to_string(number - 1));
        }

        const std::string localMd5 = md5Hex(chunk);
        const std::string url = endpoint(baseUrl, "upload/" + plan.uploadId + "/chunks/" +
                                                  std::to_string(number));
        bool sent = false;
        for (unsigned attempt = 1; attempt <= retries && !sent; ++attempt) {
            try {
                Response r = request("POST", url, chunk, octetType);
                expectSuccess(r.status, r.body, "Chunk " + std::to_string(number));
                ChunkReceipt receipt = parseChunkResponse(r.body);
                if (receipt.checksum != localMd5) {
                    throw TransportError("Chunk " + std::to_string(number) +
                                         " checksum mismatch: sent " + localMd5 +
                                         ", server has " + receipt.checksum);
                }
                receipt.chunkNumber = number;
                receipts.push_back(receipt);
                sent = true;
            } catch (const TransportError& e) {
                if (attempt == retries) {
                    throw;
                }
                log_warning(std::string(e.what()) + " (attempt " + std::to_string(attempt) +
                            " of " + std::to_string(retries) + ")");
                std::this_thread::sleep_for(std::chrono::milliseconds(500 * attempt));
            }
        }
        log_debug("Sent chunk " + std::to_string(number) + "/" +
                  std::to_string(plan.totalChunks));
    }
    return receipts;
}

void UploadClient::abort(const std::string& uploadId) const
{
    try {
        Response r = request("DELETE", endpoint(baseUrl, "upload/" + uploadId), "", nullptr);
        expectSuccess(r.status, r.body, "Abort");
        log_message("Aborted remote upload " + uploadId);
    } catch (const TransportError& e) {
        log_warning("Could not abort remote upload " + uploadId + ": " + e.what());
    }
}

std::string UploadClient::push(const fs::path& file, const PartitionKey& partition)
{
    validatePathComponent(partition.repo, "repository");
    validatePathComponent(partition.arch, "architecture");

    std::error_code ec;
    std::uint64_t size = fs::file_size(file, ec);
    if (ec) {
        throw IoError("Unable to stat package", file, ec);
    }
    const std::string sha256 = sha256File(file);
    const std::string filename = file.filename().string();

    log_message("Uploading " + filename + " (" + std::to_string(size) + " bytes) to " +
                baseUrl + " [" + partition.toString() + "]");

    Response initiated = request("POST", endpoint(baseUrl, "upload/initiate"),
                                 initiateBody(filename, size, sha256, partition, chunkSize),
                                 jsonType);
    expectSuccess(initiated.status, initiated.body, "Upload initiation");
    UploadPlan plan = parseInitiateResponse(initiated.body);
    log_debug("Upload " + plan.uploadId + ": " + std::to_string(plan.totalChunks) +
              " chunk(s) of " + std::to_string(plan.chunkSize) + " bytes");

    std::vector<ChunkReceipt> receipts;
    try {
        receipts = sendChunks(file, plan);
    } catch (const Error&) {
        abort(plan.uploadId);
        throw;
    }

    Response completed = request("POST",
                                 endpoint(baseUrl, "upload/" + plan.uploadId + "/complete"),
                                 completeBody(receipts), jsonType);
    expectSuccess(completed.status, completed.body, "Upload completion");

    log_message("Uploaded " + filename + " to " + partition.toString());
    return completed.body;
}

} // namespace Pkgdepot
