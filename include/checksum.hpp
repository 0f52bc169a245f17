#ifndef CHECKSUM_HPP
#define CHECKSUM_HPP

#include <string>
#include <cstddef>
#include <filesystem>

typedef struct evp_md_ctx_st EVP_MD_CTX;
typedef struct evp_md_st EVP_MD;

namespace Pkgdepot {

/**
 * @class Digest
 * @brief Incremental message digest backed by OpenSSL's EVP interface.
 *
 * A Digest can be fed any number of update() calls and is finalized once by
 * hexDigest(); further updates after that throw.
 */
class Digest
{
public:
    static Digest sha256();
    static Digest md5();

    Digest(Digest&& other) noexcept;
    Digest& operator=(Digest&& other) noexcept;
    Digest(const Digest&) = delete;
    Digest& operator=(const Digest&) = delete;
    ~Digest();

    void update(const void* data, std::size_t size);
    void update(const std::string& data) { update(data.data(), data.size()); }

    /**
     * @brief Finalizes the digest and returns it as lowercase hex.
     */
    std::string hexDigest();

private:
    explicit Digest(const EVP_MD* md);

    EVP_MD_CTX* ctx;
    bool finished = false;
};

std::string sha256Hex(const std::string& data);
std::string md5Hex(const std::string& data);

/**
 * @brief Computes the SHA-256 of a file's contents, reading it in blocks.
 *
 * @throws IoError if the file cannot be read.
 */
std::string sha256File(const std::filesystem::path& path);

} // namespace Pkgdepot

#endif // CHECKSUM_HPP
