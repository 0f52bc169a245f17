#ifndef UTILS_HPP
#define UTILS_HPP

#include <string>
#include <vector>
#include <cstddef>
#include <filesystem>

// ANSI color codes for console output.
#define COLOR_RESET "\033[0m"
#define COLOR_DEBUG "\033[36m"
#define COLOR_INFO  "\033[32m"
#define COLOR_WARN  "\033[33m"
#define COLOR_ERROR "\033[31m"

namespace Pkgdepot {

/**
 * @brief Enables or disables debug-level log output.
 *
 * @param verbose True to print log_debug() messages.
 */
void set_verbose(bool verbose);

/**
 * @brief Logs a debug message to standard error with cyan coloring.
 *        Only printed when verbose logging is enabled.
 *
 * @param message The message to log.
 */
void log_debug(const std::string &message);

/**
 * @brief Logs an informational message to standard error with green coloring.
 *
 * @param message The message to log.
 */
void log_message(const std::string &message);

/**
 * @brief Logs a warning message to standard error with yellow coloring.
 *
 * @param message The warning message to log.
 */
void log_warning(const std::string &message);

/**
 * @brief Logs an error message to standard error with red coloring.
 *
 * @param message The error message to log.
 */
void log_error(const std::string &message);

// ---------------------------------------------------------------------------
// Other utility function declarations
// ---------------------------------------------------------------------------

/**
 * @brief libcurl write callback function.
 *
 * Appends data received from a libcurl request to a std::string.
 *
 * @param contents Pointer to the received data.
 * @param size Size of each element.
 * @param nmemb Number of elements.
 * @param userp Pointer to the std::string to append data to.
 * @return The total number of bytes processed.
 */
size_t writeCallback(void* contents, size_t size, size_t nmemb, void* userp);

/**
 * @brief Removes leading and trailing whitespace from the given string.
 */
std::string trim(const std::string& s);

/**
 * @brief Returns true if `s` ends with `suffix`.
 */
bool endsWith(const std::string& s, const std::string& suffix);

/**
 * @brief Creates a random lowercase hex string of `length` characters,
 *        used for session ids and temporary file names.
 */
std::string randomHex(std::size_t length);

/**
 * @brief Builds a temporary path next to `target` (same directory, hence same
 *        filesystem) so that a later rename onto `target` is atomic.
 */
std::filesystem::path tempPathFor(const std::filesystem::path& target);

/**
 * @brief Writes `data` to a fresh temporary file beside `target`.
 *
 * @return Path of the temporary file; the caller renames or removes it.
 * @throws IoError if the file cannot be written. Nothing is left behind.
 */
std::filesystem::path writeTempFile(const std::filesystem::path& target, const std::string& data);

/**
 * @brief Renames `tmp` over `target`. On failure `tmp` is removed.
 *
 * @throws IoError annotated with the target path.
 */
void replaceFile(const std::filesystem::path& tmp, const std::filesystem::path& target);

/**
 * @brief Writes `data` to `target` atomically: the bytes go to a temporary
 *        file in the same directory which is then renamed over `target`.
 *
 * @throws IoError annotated with the failing path.
 */
void writeFileAtomic(const std::filesystem::path& target, const std::string& data);

/**
 * @brief Reads a whole file into a string.
 *
 * @throws IoError if the file cannot be opened or read.
 */
std::string readFile(const std::filesystem::path& path);

} // namespace Pkgdepot

#endif // UTILS_HPP
