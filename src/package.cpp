#include "package.hpp"
#include "error.hpp"

#include <yaml-cpp/yaml.h>

namespace Pkgdepot {

// ============================================================================
// Naming
// ============================================================================

std::string PackageMetadata::fullVersion() const
{
    return version + "-" + release;
}

std::string PackageMetadata::entryName() const
{
    return name + "-" + fullVersion();
}

std::string PackageMetadata::editionKey() const
{
    return entryName() + "-" + arch;
}

std::string PackageMetadata::archiveFilename(const std::string& extension) const
{
    return editionKey() + extension;
}

void validatePathComponent(const std::string& component, const char* what)
{
    if (component.empty()) {
        throw InputError(InputError::Kind::InvalidPath,
                         std::string(what) + " cannot be empty");
    }
    if (component == "." || component == "..") {
        throw InputError(InputError::Kind::InvalidPath,
                         std::string("invalid ") + what + ": '" + component + "'");
    }
    if (component.find_first_of(std::string("/\\\0", 3)) != std::string::npos) {
        throw InputError(InputError::Kind::InvalidPath,
                         std::string(what) + " cannot contain path separators or NUL");
    }
}

// ============================================================================
// Sidecar (JSON written through yaml-cpp's flow emitter)
// ============================================================================

namespace {

    void emitList(YAML::Emitter& out, const char* key, const std::vector<std::string>& values)
    {
        out << YAML::Key << key << YAML::Value << YAML::BeginSeq;
        for (const auto& v : values) {
            out << v;
        }
        out << YAML::EndSeq;
    }

    std::vector<std::string> readList(const YAML::Node& node, const char* key)
    {
        std::vector<std::string> values;
        const YAML::Node list = node[key];
        if (list && list.IsSequence()) {
            for (const auto& item : list) {
                values.push_back(item.as<std::string>());
            }
        }
        return values;
    }

    std::string readString(const YAML::Node& node, const char* key)
    {
        const YAML::Node value = node[key];
        return value ? value.as<std::string>() : std::string();
    }

} // anonymous namespace

std::string toSidecar(const PackageMetadata& pkg)
{
    YAML::Emitter out;
    out.SetMapFormat(YAML::Flow);
    out.SetSeqFormat(YAML::Flow);
    out.SetStringFormat(YAML::DoubleQuoted);

    out << YAML::BeginMap;
    out << YAML::Key << "name" << YAML::Value << pkg.name;
    if (pkg.base) {
        out << YAML::Key << "base" << YAML::Value << *pkg.base;
    }
    out << YAML::Key << "version" << YAML::Value << pkg.version;
    out << YAML::Key << "release" << YAML::Value << pkg.release;
    out << YAML::Key << "arch" << YAML::Value << pkg.arch;
    out << YAML::Key << "repo" << YAML::Value << pkg.repo;
    out << YAML::Key << "filename" << YAML::Value << pkg.filename;
    out << YAML::Key << "description" << YAML::Value << pkg.description;
    out << YAML::Key << "url" << YAML::Value << pkg.url;
    out << YAML::Key << "packager" << YAML::Value << pkg.packager;
    out << YAML::Key << "builddate" << YAML::Value << pkg.buildDate;
    out << YAML::Key << "isize" << YAML::Value << pkg.installedSize;
    out << YAML::Key << "csize" << YAML::Value << pkg.compressedSize;
    out << YAML::Key << "sha256" << YAML::Value << pkg.sha256;
    out << YAML::Key << "md5" << YAML::Value << pkg.md5;
    emitList(out, "license", pkg.licenses);
    emitList(out, "groups", pkg.groups);
    emitList(out, "depends", pkg.depends);
    emitList(out, "optdepends", pkg.optdepends);
    emitList(out, "provides", pkg.provides);
    emitList(out, "conflicts", pkg.conflicts);
    emitList(out, "replaces", pkg.replaces);
    emitList(out, "files", pkg.files);
    out << YAML::EndMap;

    if (!out.good()) {
        throw Error("Failed to serialize sidecar for " + pkg.name + ": " + out.GetLastError());
    }
    return std::string(out.c_str()) + "\n";
}

PackageMetadata fromSidecar(const std::string& text)
{
    PackageMetadata pkg;
    try {
        YAML::Node node = YAML::Load(text);
        if (!node.IsMap()) {
            throw InputError(InputError::Kind::CorruptArchive, "sidecar is not an object");
        }

        pkg.name        = node["name"].as<std::string>();
        if (node["base"]) {
            pkg.base = node["base"].as<std::string>();
        }
        pkg.version     = node["version"].as<std::string>();
        pkg.release     = node["release"].as<std::string>();
        pkg.arch        = node["arch"].as<std::string>();
        pkg.repo        = readString(node, "repo");
        pkg.filename    = node["filename"].as<std::string>();
        pkg.description = readString(node, "description");
        pkg.url         = readString(node, "url");
        pkg.packager    = readString(node, "packager");
        pkg.buildDate   = node["builddate"] ? node["builddate"].as<std::int64_t>() : 0;
        pkg.installedSize  = node["isize"] ? node["isize"].as<std::uint64_t>() : 0;
        pkg.compressedSize = node["csize"] ? node["csize"].as<std::uint64_t>() : 0;
        pkg.sha256      = readString(node, "sha256");
        pkg.md5         = readString(node, "md5");
        pkg.licenses    = readList(node, "license");
        pkg.groups      = readList(node, "groups");
        pkg.depends     = readList(node, "depends");
        pkg.optdepends  = readList(node, "optdepends");
        pkg.provides    = readList(node, "provides");
        pkg.conflicts   = readList(node, "conflicts");
        pkg.replaces    = readList(node, "replaces");
        pkg.files       = readList(node, "files");
    }
    catch (const YAML::Exception& e) {
        throw InputError(InputError::Kind::CorruptArchive,
                         std::string("malformed sidecar: ") + e.what());
    }
    return pkg;
}

} // namespace Pkgdepot
