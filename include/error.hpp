#ifndef ERROR_HPP
#define ERROR_HPP

#include <stdexcept>
#include <string>
#include <system_error>
#include <filesystem>

namespace Pkgdepot {

/**
 * @class Error
 * @brief Base of every failure raised by pkgdepot. Callers that only need a
 *        message can catch this (or std::runtime_error) and use what().
 */
class Error : public std::runtime_error
{
public:
    explicit Error(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @class InputError
 * @brief Rejected caller input: a malformed archive, bad metadata, a bad
 *        upload or a bad path. Never leaves storage modified.
 */
class InputError : public Error
{
public:
    enum class Kind {
        CorruptArchive,
        MissingMetadata,
        MissingRequiredField,
        SizeMismatch,
        IncompleteUpload,
        ChecksumMismatch,
        ArchMismatch,
        InvalidPath,
        InvalidState
    };

    InputError(Kind kind, const std::string& message)
        : Error(std::string(kindName(kind)) + ": " + message), kind_(kind) {}

    Kind kind() const { return kind_; }

    static const char* kindName(Kind kind);

private:
    Kind kind_;
};

/**
 * @class IoError
 * @brief Filesystem failure. Always carries the path it happened at.
 */
class IoError : public Error
{
public:
    IoError(const std::string& what,
            const std::filesystem::path& path,
            std::error_code ec)
        : Error(what + " at " + path.string() + ": " + ec.message()),
          path_(path), code_(ec) {}

    const std::filesystem::path& path() const { return path_; }
    std::error_code code() const { return code_; }

private:
    std::filesystem::path path_;
    std::error_code code_;
};

/**
 * @class NotFoundError
 * @brief A package edition, upload session or repository file does not exist.
 */
class NotFoundError : public Error
{
public:
    explicit NotFoundError(const std::string& message)
        : Error("not found: " + message) {}
};

/**
 * @class ConfigError
 * @brief The configuration file exists but cannot be used.
 */
class ConfigError : public Error
{
public:
    explicit ConfigError(const std::string& message)
        : Error("configuration error: " + message) {}
};

/**
 * @class TransportError
 * @brief Upload client failure talking to a remote repository service.
 */
class TransportError : public Error
{
public:
    TransportError(const std::string& message, long status = 0)
        : Error(message), status_(status) {}

    /// HTTP status of the failed request, 0 when no response was received.
    long status() const { return status_; }

private:
    long status_;
};

/**
 * @brief Wraps a std::filesystem::filesystem_error into an IoError, keeping
 *        the first path reported by the library.
 */
IoError toIoError(const std::string& what, const std::filesystem::filesystem_error& e);

} // namespace Pkgdepot

#endif // ERROR_HPP
