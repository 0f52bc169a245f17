#ifndef DB_GENERATOR_HPP
#define DB_GENERATOR_HPP

#include "package.hpp"

#include <string>
#include <vector>

namespace Pkgdepot {

/**
 * @brief One member of a generated index archive, as read back by
 *        Database::readArchive().
 */
struct IndexMember
{
    std::string path;
    bool isDirectory = false;
    std::string content;
};

/**
 * @class Database
 * @brief Renders a partition's package set into the two pacman index
 *        archives (<repo>.db.tar.gz and <repo>.files.tar.gz) and reads them
 *        back.
 *
 * Rendering is a pure function of the package set: packages are sorted by
 * name, tar headers carry fixed ownership and permissions with the package
 * build date as mtime, and the gzip header timestamp is disabled, so the same
 * input always produces the same bytes.
 */
class Database
{
public:
    /**
     * @brief Renders the desc block for one package.
     *
     * Sections appear in pacman's order, each as "%FIELD%", one line per value
     * and a terminating blank line. A field with no value produces no section.
     */
    static std::string renderDesc(const PackageMetadata& pkg);

    /**
     * @brief Renders the files block: "%FILES%" followed by one path per line.
     */
    static std::string renderFiles(const PackageMetadata& pkg);

    /**
     * @brief Builds the compressed desc index. Each package contributes a
     *        "<name>-<version>-<release>/" directory holding "desc".
     *
     * @throws Error if libarchive fails to produce the archive.
     */
    static std::string buildDescArchive(std::vector<PackageMetadata> packages);

    /**
     * @brief Builds the compressed files index. Each package directory holds
     *        "desc" and "files".
     *
     * @throws Error if libarchive fails to produce the archive.
     */
    static std::string buildFilesArchive(std::vector<PackageMetadata> packages);

    /**
     * @brief Parses a desc block produced by renderDesc() (or repo-add).
     *
     * @throws InputError (CorruptArchive) on malformed numeric fields.
     */
    static PackageMetadata parseDesc(const std::string& text);

    /**
     * @brief Parses a files block into its path list.
     */
    static std::vector<std::string> parseFiles(const std::string& text);

    /**
     * @brief Lists every member of a compressed index archive in stream order.
     *
     * @throws InputError (CorruptArchive) if the bytes are not a readable archive.
     */
    static std::vector<IndexMember> readArchive(const std::string& bytes);

    /**
     * @brief Orders packages by name, then version and release.
     */
    static void sortPackages(std::vector<PackageMetadata>& packages);
};

} // namespace Pkgdepot

#endif // DB_GENERATOR_HPP
