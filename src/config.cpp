#include "config.hpp"
#include "error.hpp"
#include "package.hpp"
#include "utils.hpp"

#include <yaml-cpp/yaml.h>

#include <iostream>

namespace fs = std::filesystem;

namespace Pkgdepot {

namespace {

    template <typename T>
    void readValue(const YAML::Node& section, const char* sectionName, const char* key, T& target)
    {
        const YAML::Node value = section[key];
        if (!value || value.IsNull()) {
            return;
        }
        try {
            target = value.as<T>();
        } catch (const YAML::Exception& e) {
            throw ConfigError(std::string(sectionName) + "." + key + ": " + e.what());
        }
    }

    YAML::Node section(const YAML::Node& root, const char* name)
    {
        const YAML::Node node = root[name];
        if (node && !node.IsNull() && !node.IsMap()) {
            throw ConfigError(std::string("'") + name + "' must be a mapping");
        }
        return node;
    }

    void applyDocument(Config& config, const YAML::Node& root)
    {
        if (!root || root.IsNull()) {
            return;
        }
        if (!root.IsMap()) {
            throw ConfigError("top level must be a mapping");
        }

        if (const YAML::Node storage = section(root, "storage")) {
            std::string dataPath;
            readValue(storage, "storage", "data_path", dataPath);
            if (!dataPath.empty()) {
                config.dataPath = dataPath;
            }
            readValue(storage, "storage", "default_repo", config.defaultRepo);
            readValue(storage, "storage", "default_arch", config.defaultArch);
            readValue(storage, "storage", "use_symlinks", config.useSymlinks);
        }

        if (const YAML::Node uploads = section(root, "uploads")) {
            readValue(uploads, "uploads", "max_chunk_size", config.maxChunkSize);
            readValue(uploads, "uploads", "session_timeout", config.sessionTimeout);
        }

        if (const YAML::Node client = section(root, "client")) {
            readValue(client, "client", "url", config.clientUrl);
            readValue(client, "client", "chunk_size", config.clientChunkSize);
            readValue(client, "client", "retries", config.clientRetries);
        }

        if (config.maxChunkSize == 0) {
            throw ConfigError("uploads.max_chunk_size must be greater than zero");
        }
        if (config.clientChunkSize == 0) {
            throw ConfigError("client.chunk_size must be greater than zero");
        }
        validatePathComponent(config.defaultRepo, "default repository");
        validatePathComponent(config.defaultArch, "default architecture");
    }

    void makeAbsolute(Config& config)
    {
        if (config.dataPath.is_relative()) {
            std::error_code ec;
            fs::path absolute = fs::absolute(config.dataPath, ec);
            if (ec) {
                throw IoError("Unable to resolve data path", config.dataPath, ec);
            }
            config.dataPath = absolute.lexically_normal();
        }
    }

} // anonymous namespace

Config Config::loadFromString(const std::string& text)
{
    Config config;
    YAML::Node root;
    try {
        root = YAML::Load(text);
    } catch (const YAML::Exception& e) {
        throw ConfigError(e.what());
    }
    try {
        applyDocument(config, root);
    } catch (const InputError& e) {
        throw ConfigError(e.what());
    }
    makeAbsolute(config);
    return config;
}

Config Config::loadFromFile(const std::string& path)
{
    std::error_code ec;
    if (!fs::exists(path, ec)) {
        log_warning("Configuration file not found: " + path + " (using defaults)");
        Config config;
        makeAbsolute(config);
        return config;
    }

    Config config = loadFromString(readFile(path));
    log_debug("Loaded configuration from " + path);
    return config;
}

std::string Config::toYaml() const
{
    YAML::Emitter out;
    out << YAML::BeginMap;

    out << YAML::Key << "storage" << YAML::Value << YAML::BeginMap;
    out << YAML::Key << "data_path" << YAML::Value << dataPath.string();
    out << YAML::Key << "default_repo" << YAML::Value << defaultRepo;
    out << YAML::Key << "default_arch" << YAML::Value << defaultArch;
    out << YAML::Key << "use_symlinks" << YAML::Value << useSymlinks;
    out << YAML::EndMap;

    out << YAML::Key << "uploads" << YAML::Value << YAML::BeginMap;
    out << YAML::Key << "max_chunk_size" << YAML::Value << maxChunkSize;
    out << YAML::Key << "session_timeout" << YAML::Value << sessionTimeout;
    out << YAML::EndMap;

    out << YAML::Key << "client" << YAML::Value << YAML::BeginMap;
    out << YAML::Key << "url" << YAML::Value << clientUrl;
    out << YAML::Key << "chunk_size" << YAML::Value << clientChunkSize;
    out << YAML::Key << "retries" << YAML::Value << clientRetries;
    out << YAML::EndMap;

    out << YAML::EndMap;
    return std::string(out.c_str()) + "\n";
}

void Config::saveToFile(const std::string& path) const
{
    // Adds a comment header
    std::string text = "# pkgdepot configuration\n\n" + toYaml();

    fs::path target(path);
    if (target.has_parent_path()) {
        std::error_code ec;
        fs::create_directories(target.parent_path(), ec);
        if (ec) {
            throw IoError("Unable to create configuration directory", target.parent_path(), ec);
        }
    }
    writeFileAtomic(target, text);
}

void Config::print() const
{
    std::cout << toYaml();
}

} // namespace Pkgdepot
