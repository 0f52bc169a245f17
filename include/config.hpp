#ifndef CONFIG_HPP
#define CONFIG_HPP

#include <cstdint>
#include <filesystem>
#include <string>

namespace Pkgdepot {

/**
 * @class Config
 * @brief Runtime settings, built once at startup and passed by reference to
 *        PackageStore, UploadSessions and UploadClient.
 */
class Config
{
public:
    /// Default location of the configuration file.
    static constexpr const char* defaultPath = "/etc/pkgdepot/pkgdepot.yaml";

    // storage:
    std::filesystem::path dataPath = "data";
    std::string defaultRepo = "default";
    std::string defaultArch = "x86_64";
    bool useSymlinks = true;

    // uploads:
    std::uint64_t maxChunkSize = 8 * 1024 * 1024;
    std::uint64_t sessionTimeout = 24 * 60 * 60; // seconds

    // client:
    std::string clientUrl = "http://127.0.0.1:3000/api/packages";
    std::uint64_t clientChunkSize = 1024 * 1024;
    unsigned clientRetries = 3;

    /**
     * @brief Loads configuration from a file on disk.
     *
     * A missing file yields the defaults (with a warning). Keys left out of
     * the file keep their default values. A relative data path is made
     * absolute against the current directory.
     *
     * @param path Path to the YAML configuration file.
     * @return A fully populated Config instance.
     * @throws ConfigError if the file is not valid YAML or a value has the
     *         wrong type.
     */
    static Config loadFromFile(const std::string& path);

    /**
     * @brief Parses configuration from YAML text. Same rules as loadFromFile().
     */
    static Config loadFromString(const std::string& text);

    /**
     * @brief Saves the current configuration to a file.
     * @param path Path to the file where configuration should be saved.
     * @throws IoError if the file cannot be written.
     */
    void saveToFile(const std::string& path) const;

    /**
     * @brief Renders the configuration as YAML, in the layout loadFromFile() reads.
     */
    std::string toYaml() const;

    /**
     * @brief Prints the effective configuration to standard output.
     */
    void print() const;
};

} // namespace Pkgdepot

#endif // CONFIG_HPP
