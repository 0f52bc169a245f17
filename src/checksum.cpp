#include "checksum.hpp"
#include "error.hpp"

#include <openssl/evp.h>

#include <fstream>
#include <stdexcept>
#include <vector>

namespace Pkgdepot {

Digest::Digest(const EVP_MD* md)
    : ctx(EVP_MD_CTX_new())
{
    if (!ctx) {
        throw std::runtime_error("EVP_MD_CTX_new failed");
    }
    if (EVP_DigestInit_ex(ctx, md, nullptr) != 1) {
        EVP_MD_CTX_free(ctx);
        throw std::runtime_error("EVP_DigestInit_ex failed");
    }
}

Digest Digest::sha256()
{
    return Digest(EVP_sha256());
}

Digest Digest::md5()
{
    return Digest(EVP_md5());
}

Digest::Digest(Digest&& other) noexcept
    : ctx(other.ctx), finished(other.finished)
{
    other.ctx = nullptr;
}

Digest& Digest::operator=(Digest&& other) noexcept
{
    if (this != &other) {
        EVP_MD_CTX_free(ctx);
        ctx = other.ctx;
        finished = other.finished;
        other.ctx = nullptr;
    }
    return *this;
}

Digest::~Digest()
{
    EVP_MD_CTX_free(ctx);
}

void Digest::update(const void* data, std::size_t size)
{
    if (finished || !ctx) {
        throw std::logic_error("Digest updated after finalization");
    }
    if (size == 0) {
        return;
    }
    if (EVP_DigestUpdate(ctx, data, size) != 1) {
        throw std::runtime_error("EVP_DigestUpdate failed");
    }
}

std::string Digest::hexDigest()
{
    if (finished || !ctx) {
        throw std::logic_error("Digest finalized twice");
    }

    unsigned char raw[EVP_MAX_MD_SIZE];
    unsigned int len = 0;
    if (EVP_DigestFinal_ex(ctx, raw, &len) != 1) {
        throw std::runtime_error("EVP_DigestFinal_ex failed");
    }
    finished = true;

    static const char digits[] = "0123456789abcdef";
    std::string hex;
    hex.reserve(len * 2);
    for (unsigned int i = 0; i < len; ++i) {
        hex.push_back(digits[raw[i] >> 4]);
        hex.push_back(digits[raw[i] & 0x0f]);
    }
    return hex;
}

std::string sha256Hex(const std::string& data)
{
    Digest d = Digest::sha256();
    d.update(data);
    return d.hexDigest();
}

std::string md5Hex(const std::string& data)
{
    Digest d = Digest::md5();
    d.update(data);
    return d.hexDigest();
}

std::string sha256File(const std::filesystem::path& path)
{
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        throw IoError("Unable to open file for hashing", path,
                      std::make_error_code(std::errc::no_such_file_or_directory));
    }

    Digest d = Digest::sha256();
    std::vector<char> buffer(65536);
    while (in) {
        in.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        d.update(buffer.data(), static_cast<std::size_t>(in.gcount()));
    }
    if (in.bad()) {
        throw IoError("Unable to read file for hashing", path,
                      std::make_error_code(std::errc::io_error));
    }
    return d.hexDigest();
}

} // namespace Pkgdepot
