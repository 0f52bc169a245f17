#ifndef PACKAGE_HPP
#define PACKAGE_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace Pkgdepot {

/**
 * @class PartitionKey
 * @brief Identifies one (repository, architecture) pair. Each partition has
 *        its own package set, desc/files index pair and regeneration lock.
 */
struct PartitionKey
{
    std::string repo;
    std::string arch;

    /// "<repo>/<arch>", for log messages.
    std::string toString() const { return repo + "/" + arch; }

    bool operator==(const PartitionKey& other) const
    {
        return repo == other.repo && arch == other.arch;
    }
    bool operator<(const PartitionKey& other) const
    {
        return repo != other.repo ? repo < other.repo : arch < other.arch;
    }
};

/**
 * @class PackageMetadata
 * @brief Everything known about one stored package edition.
 *
 * Identity fields (name, version, release, arch) come from .PKGINFO; the
 * checksums, compressed size, filename and repo are filled in when the
 * archive is parsed and stored.
 */
struct PackageMetadata
{
    std::string name;
    std::optional<std::string> base;
    std::string version;            // pkgver without the release, epoch kept
    std::string release;            // pkgrel
    std::string arch;
    std::string description;
    std::string url;
    std::vector<std::string> licenses;
    std::vector<std::string> groups;
    std::vector<std::string> depends;
    std::vector<std::string> optdepends;
    std::vector<std::string> provides;
    std::vector<std::string> conflicts;
    std::vector<std::string> replaces;
    std::string packager;
    std::int64_t buildDate = 0;
    std::uint64_t installedSize = 0;
    std::uint64_t compressedSize = 0;
    std::string sha256;
    std::string md5;
    std::string filename;
    std::string repo;
    std::vector<std::string> files;

    /// "<version>-<release>", the value pacman expects in %VERSION%.
    std::string fullVersion() const;

    /// "<name>-<version>-<release>", the per-package directory in the indexes.
    std::string entryName() const;

    /// "<name>-<version>-<release>-<arch>", the edition key.
    std::string editionKey() const;

    /// Stored archive filename for the given extension (e.g. ".pkg.tar.zst").
    std::string archiveFilename(const std::string& extension) const;
};

/**
 * @brief Serializes a package record to the JSON sidecar format.
 *
 * The sidecar keeps everything the index generator needs, including the
 * file list, so regeneration never re-reads package archives.
 */
std::string toSidecar(const PackageMetadata& pkg);

/**
 * @brief Parses a sidecar written by toSidecar().
 *
 * @throws InputError (CorruptArchive) if the document is malformed.
 */
PackageMetadata fromSidecar(const std::string& text);

/**
 * @brief Validates one path component used to build storage paths
 *        (repository, architecture, package name or requested filename).
 *
 * @throws InputError (InvalidPath) on empty, ".", "..", or values containing
 *         '/', '\\' or NUL.
 */
void validatePathComponent(const std::string& component, const char* what);

} // namespace Pkgdepot

#endif // PACKAGE_HPP
