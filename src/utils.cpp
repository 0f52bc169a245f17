#include "utils.hpp"
#include "error.hpp"

#include <fstream>
#include <iostream>
#include <mutex>
#include <random>
#include <sstream>
#include <atomic>

namespace fs = std::filesystem;

namespace Pkgdepot {

namespace {
    // So output from concurrent requests isn't garbled
    std::mutex logMutex;
    std::atomic<bool> verboseLogging{false};

    void emit(const char* color, const char* tag, const std::string& message)
    {
        std::lock_guard<std::mutex> lock(logMutex);
        std::cerr << color << tag << COLOR_RESET << message << std::endl;
    }
}

void set_verbose(bool verbose)
{
    verboseLogging = verbose;
}

void log_debug(const std::string &message)
{
    if (verboseLogging) {
        emit(COLOR_DEBUG, "[DEBUG] ", message);
    }
}

void log_message(const std::string &message)
{
    emit(COLOR_INFO, "[INFO] ", message);
}

void log_warning(const std::string &message)
{
    emit(COLOR_WARN, "[WARN] ", message);
}

void log_error(const std::string &message)
{
    emit(COLOR_ERROR, "[ERROR] ", message);
}

/**
 * @brief libcurl callback function. Appends downloaded data into a std::string.
 */
size_t writeCallback(void* contents, size_t size, size_t nmemb, void* userp)
{
    size_t totalSize      = size * nmemb;
    std::string* response = static_cast<std::string*>(userp);

    try {
        response->append(static_cast<char*>(contents), totalSize);
    } catch (const std::exception& e) {
        log_error(std::string("Error appending data to response: ") + e.what());
        return 0; // Signal failure to libcurl
    }

    return totalSize;
}

std::string trim(const std::string& s)
{
    const char *whitespace = " \t\n\r\f\v";
    size_t first = s.find_first_not_of(whitespace);
    if (first == std::string::npos) {
        return "";
    }
    size_t last = s.find_last_not_of(whitespace);
    return s.substr(first, last - first + 1);
}

bool endsWith(const std::string& s, const std::string& suffix)
{
    return s.size() >= suffix.size() &&
           s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

std::string randomHex(std::size_t length)
{
    static const char digits[] = "0123456789abcdef";
    thread_local std::mt19937 mt(std::random_device{}());
    std::uniform_int_distribution<int> dist(0, 15);

    std::string out;
    out.reserve(length);
    for (std::size_t i = 0; i < length; ++i) {
        out.push_back(digits[dist(mt)]);
    }
    return out;
}

fs::path tempPathFor(const fs::path& target)
{
    return target.parent_path() / ("." + target.filename().string() + ".tmp-" + randomHex(8));
}

fs::path writeTempFile(const fs::path& target, const std::string& data)
{
    fs::path tmp = tempPathFor(target);
    std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
        throw IoError("Unable to create file", tmp,
                      std::make_error_code(std::errc::io_error));
    }
    out.write(data.data(), static_cast<std::streamsize>(data.size()));
    out.close();
    if (!out) {
        std::error_code ignored;
        fs::remove(tmp, ignored);
        throw IoError("Unable to write file", tmp,
                      std::make_error_code(std::errc::io_error));
    }
    return tmp;
}

void replaceFile(const fs::path& tmp, const fs::path& target)
{
    std::error_code ec;
    fs::rename(tmp, target, ec);
    if (ec) {
        std::error_code ignored;
        fs::remove(tmp, ignored);
        throw IoError("Unable to rename " + tmp.filename().string() + " into place", target, ec);
    }
}

void writeFileAtomic(const fs::path& target, const std::string& data)
{
    replaceFile(writeTempFile(target, data), target);
}

std::string readFile(const fs::path& path)
{
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        throw IoError("Unable to open file", path,
                      std::make_error_code(std::errc::no_such_file_or_directory));
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();
    if (in.bad()) {
        throw IoError("Unable to read file", path,
                      std::make_error_code(std::errc::io_error));
    }
    return buffer.str();
}

} // namespace Pkgdepot
