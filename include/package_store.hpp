#ifndef PACKAGE_STORE_HPP
#define PACKAGE_STORE_HPP

#include "config.hpp"
#include "package.hpp"

#include <cstddef>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace Pkgdepot {

/**
 * @brief Optional exact-match filters for PackageStore::list(). An unset
 *        field matches everything.
 */
struct ListFilter
{
    std::optional<std::string> name;
    std::optional<std::string> repo;
    std::optional<std::string> arch;
};

/**
 * @brief A file served from a partition, as returned by PackageStore::resolve().
 */
struct ResolvedFile
{
    enum class Kind {
        Package,
        DescIndex,
        FilesIndex
    };

    Kind kind;
    std::filesystem::path path;

    static const char* kindName(Kind kind);
};

/**
 * @class PackageStore
 * @brief Stores package archives and their metadata sidecars, and keeps each
 *        partition's desc and files indexes in step with them.
 *
 * On-disk layout, relative to the configured data path:
 *
 *     <repo>/os/<arch>/<name>-<version>-<release>-<arch><ext>
 *     <repo>/os/<arch>/metadata/<name>.json
 *     <repo>/os/<arch>/<repo>.db.tar.gz      (<repo>.db points here)
 *     <repo>/os/<arch>/<repo>.files.tar.gz   (<repo>.files points here)
 *
 * Mutations of one partition (add, remove, regenerate) are serialized by
 * that partition's mutex; different partitions proceed in parallel and
 * list() never waits. Every file is published by renaming a temporary file
 * from the same directory, so readers see either the old or the new version.
 */
class PackageStore
{
public:
    explicit PackageStore(const Config& config);

    PackageStore(const PackageStore&) = delete;
    PackageStore& operator=(const PackageStore&) = delete;

    /**
     * @brief Parses the archive at `archivePath`, stores it in `partition`
     *        and regenerates the partition's indexes.
     *
     * A stored edition with the same package name is replaced, including
     * its archive file.
     *
     * @return The stored record.
     * @throws InputError if the archive is invalid (see ArchiveParser), or
     *         (ArchMismatch) if its architecture is neither the partition's
     *         nor "any".
     * @throws IoError on filesystem failures.
     */
    PackageMetadata add(const PartitionKey& partition, const std::filesystem::path& archivePath);

    /**
     * @brief Lists stored packages, ordered by repository, architecture and
     *        name. Sidecars that cannot be read are skipped with a warning.
     */
    std::vector<PackageMetadata> list(const ListFilter& filter = ListFilter()) const;

    /**
     * @brief Deletes the package `name` from `partition` and regenerates.
     *
     * @throws NotFoundError if no such package is stored. Nothing is created
     *         or regenerated in that case.
     */
    void remove(const std::string& name, const PartitionKey& partition);

    /**
     * @brief Rebuilds and publishes both indexes of `partition` from its
     *        sidecars. A failure leaves the published indexes untouched.
     */
    void regenerate(const PartitionKey& partition);

    /**
     * @brief Regenerates every partition found on disk.
     * @return Number of partitions regenerated.
     */
    std::size_t regenerateAll();

    /**
     * @brief Maps a requested filename to the file serving it.
     *
     * Accepts package archives (.pkg.tar[.zst|.xz|.gz|.bz2|.lz4]),
     * "<repo>.db[.tar.gz]" and "<repo>.files[.tar.gz]".
     *
     * @throws InputError (InvalidPath) for unsafe path components.
     * @throws NotFoundError for unknown file types or missing files.
     */
    ResolvedFile resolve(const PartitionKey& partition, const std::string& filename) const;

    /**
     * @brief Every partition present on disk, sorted.
     */
    std::vector<PartitionKey> partitions() const;

    std::filesystem::path partitionDir(const PartitionKey& partition) const;
    std::filesystem::path metadataDir(const PartitionKey& partition) const;
    std::filesystem::path descArchivePath(const PartitionKey& partition) const;
    std::filesystem::path filesArchivePath(const PartitionKey& partition) const;

    /**
     * @brief Atomically points `pointer` at `targetName`, a file in the same
     *        directory.
     *
     * With `useSymlink` a relative symlink is created under a temporary name
     * and renamed over `pointer`; if the filesystem refuses symlinks, or
     * `useSymlink` is false, the target is copied and the copy renamed
     * instead.
     *
     * @throws IoError if neither method succeeds.
     */
    static void publishPointer(const std::filesystem::path& pointer,
                               const std::string& targetName,
                               bool useSymlink);

private:
    std::mutex& partitionLock(const PartitionKey& partition);
    void regenerateLocked(const PartitionKey& partition);
    std::vector<PackageMetadata> loadPartition(const PartitionKey& partition) const;

    const Config& config;
    std::mutex registryMutex;
    std::map<PartitionKey, std::unique_ptr<std::mutex>> locks;
};

} // namespace Pkgdepot

#endif // PACKAGE_STORE_HPP
