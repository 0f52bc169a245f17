#include "pkginfo.hpp"
#include "error.hpp"
#include "utils.hpp"

#include <sstream>
#include <stdexcept>

namespace Pkgdepot {

namespace {

    void splitPkgver(const std::string& pkgver, PkgInfo& info)
    {
        size_t dash = pkgver.rfind('-');
        if (dash == std::string::npos) {
            info.version = pkgver;
            info.release.reset();
            return;
        }
        info.version = pkgver.substr(0, dash);
        std::string rel = pkgver.substr(dash + 1);
        if (rel.empty()) {
            info.release.reset();
        } else {
            info.release = rel;
        }
    }

    template <typename T>
    std::optional<T> parseNumber(const std::string& key, const std::string& value)
    {
        try {
            size_t consumed = 0;
            long long parsed = std::stoll(value, &consumed);
            if (consumed == value.size() && parsed >= 0) {
                return static_cast<T>(parsed);
            }
        } catch (const std::exception&) {
            // fall through to the warning below
        }
        log_warning("Ignoring non-numeric .PKGINFO value " + key + " = " + value);
        return std::nullopt;
    }

} // anonymous namespace

PkgInfo PkgInfo::parse(const std::string& content)
{
    PkgInfo info;
    std::istringstream stream(content);
    std::string rawLine;

    while (std::getline(stream, rawLine)) {
        std::string line = trim(rawLine);
        // Skips comments or empty lines
        if (line.empty() || line[0] == '#') {
            continue;
        }

        size_t eq = line.find('=');
        if (eq == std::string::npos) {
            log_debug("Skipping .PKGINFO line without '=': " + line);
            continue;
        }
        std::string key   = trim(line.substr(0, eq));
        std::string value = trim(line.substr(eq + 1));

        if (key == "pkgname") {
            info.name = value;
        } else if (key == "pkgbase") {
            info.base = value;
        } else if (key == "pkgver") {
            splitPkgver(value, info);
        } else if (key == "pkgdesc") {
            info.description = value;
        } else if (key == "url") {
            info.url = value;
        } else if (key == "builddate") {
            if (auto n = parseNumber<std::int64_t>(key, value)) {
                info.buildDate = n;
            }
        } else if (key == "packager") {
            info.packager = value;
        } else if (key == "size") {
            if (auto n = parseNumber<std::uint64_t>(key, value)) {
                info.size = n;
            }
        } else if (key == "arch") {
            info.arch = value;
        } else if (key == "license") {
            info.licenses.push_back(value);
        } else if (key == "group") {
            info.groups.push_back(value);
        } else if (key == "depend") {
            info.depends.push_back(value);
        } else if (key == "optdepend") {
            info.optdepends.push_back(value);
        } else if (key == "provides") {
            info.provides.push_back(value);
        } else if (key == "conflict") {
            info.conflicts.push_back(value);
        } else if (key == "replaces") {
            info.replaces.push_back(value);
        }
    }
    return info;
}

std::vector<std::string> PkgInfo::missingRequiredFields() const
{
    std::vector<std::string> missing;
    if (!name || name->empty()) {
        missing.push_back("pkgname");
    }
    if (!version || version->empty()) {
        missing.push_back("pkgver");
    }
    if (!release || release->empty()) {
        missing.push_back("pkgrel");
    }
    if (!arch || arch->empty()) {
        missing.push_back("arch");
    }
    return missing;
}

PackageMetadata PkgInfo::toMetadata() const
{
    std::vector<std::string> missing = missingRequiredFields();
    if (!missing.empty()) {
        std::string list;
        for (const auto& field : missing) {
            list += (list.empty() ? "" : ", ") + field;
        }
        throw InputError(InputError::Kind::MissingRequiredField,
                         ".PKGINFO lacks required field(s): " + list);
    }

    PackageMetadata pkg;
    pkg.name          = *name;
    pkg.base          = base;
    pkg.version       = *version;
    pkg.release       = *release;
    pkg.arch          = *arch;
    pkg.description   = description.value_or("");
    pkg.url           = url.value_or("");
    pkg.packager      = packager.value_or("");
    pkg.buildDate     = buildDate.value_or(0);
    pkg.installedSize = size.value_or(0);
    pkg.licenses      = licenses;
    pkg.groups        = groups;
    pkg.depends       = depends;
    pkg.optdepends    = optdepends;
    pkg.provides      = provides;
    pkg.conflicts     = conflicts;
    pkg.replaces      = replaces;
    return pkg;
}

} // namespace Pkgdepot
