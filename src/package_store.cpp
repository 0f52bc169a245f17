#include "package_store.hpp"
#include "archive_parser.hpp"
#include "db_generator.hpp"
#include "error.hpp"
#include "utils.hpp"

#include <algorithm>
#include <set>

namespace fs = std::filesystem;

namespace Pkgdepot {

// ============================================================================
// Helper Functions
// ============================================================================

namespace {

    const char* packageSuffixes[] = {
        ".pkg.tar",
        ".pkg.tar.zst",
        ".pkg.tar.xz",
        ".pkg.tar.gz",
        ".pkg.tar.bz2",
        ".pkg.tar.lz4",
    };

    bool isPackageFilename(const std::string& filename)
    {
        for (const char* suffix : packageSuffixes) {
            if (endsWith(filename, suffix) && filename.size() > std::string(suffix).size()) {
                return true;
            }
        }
        return false;
    }

    void validatePartition(const PartitionKey& partition)
    {
        validatePathComponent(partition.repo, "repository");
        validatePathComponent(partition.arch, "architecture");
    }

    void ensureDirectory(const fs::path& dir)
    {
        std::error_code ec;
        fs::create_directories(dir, ec);
        if (ec) {
            throw IoError("Unable to create directory", dir, ec);
        }
    }

    std::vector<fs::path> listDirectory(const fs::path& dir)
    {
        std::vector<fs::path> entries;
        std::error_code ec;
        if (!fs::is_directory(dir, ec)) {
            return entries;
        }
        try {
            for (const auto& entry : fs::directory_iterator(dir)) {
                entries.push_back(entry.path());
            }
        } catch (const fs::filesystem_error& e) {
            throw toIoError("Unable to list directory", e);
        }
        std::sort(entries.begin(), entries.end());
        return entries;
    }

    // Copies `source` to a temporary file beside `target` and returns its path.
    fs::path copyToTemp(const fs::path& source, const fs::path& target)
    {
        fs::path tmp = tempPathFor(target);
        std::error_code ec;
        fs::copy_file(source, tmp, fs::copy_options::overwrite_existing, ec);
        if (ec) {
            std::error_code ignored;
            fs::remove(tmp, ignored);
            throw IoError("Unable to copy " + source.string(), tmp, ec);
        }
        return tmp;
    }

    void copyFileAtomic(const fs::path& source, const fs::path& target)
    {
        replaceFile(copyToTemp(source, target), target);
    }

    void removeIfPresent(const fs::path& path)
    {
        std::error_code ec;
        fs::remove(path, ec);
        if (ec) {
            throw IoError("Unable to remove file", path, ec);
        }
    }

    void removeQuietly(const fs::path& path)
    {
        if (path.empty()) {
            return;
        }
        std::error_code ec;
        fs::remove(path, ec);
        if (ec) {
            log_warning("Failed to remove " + path.string() + ": " + ec.message());
        }
    }

    /*
     * Publishes the files index and then the desc index. Both are fully
     * written to temporaries first. If the desc rename fails, the previous
     * files index is put back, so either both archives are replaced or
     * neither is.
     */
    void publishIndexPair(const fs::path& filesTarget, const std::string& filesData,
                          const fs::path& descTarget, const std::string& descData)
    {
        fs::path filesTmp = writeTempFile(filesTarget, filesData);
        fs::path descTmp;
        fs::path backup;
        try {
            descTmp = writeTempFile(descTarget, descData);

            std::error_code ec;
            if (fs::is_regular_file(filesTarget, ec)) {
                backup = tempPathFor(filesTarget);
                fs::copy_file(filesTarget, backup, ec);
                if (ec) {
                    throw IoError("Unable to keep a copy of the files index", backup, ec);
                }
            }
            replaceFile(filesTmp, filesTarget);
        } catch (const Error&) {
            removeQuietly(filesTmp);
            removeQuietly(descTmp);
            removeQuietly(backup);
            throw;
        }

        try {
            replaceFile(descTmp, descTarget);
        } catch (const Error&) {
            std::error_code ec;
            if (backup.empty()) {
                fs::remove(filesTarget, ec);
            } else {
                fs::rename(backup, filesTarget, ec);
            }
            if (ec) {
                log_error("Could not restore " + filesTarget.string() + ": " + ec.message());
            }
            throw;
        }
        removeQuietly(backup);
    }

} // anonymous namespace

const char* ResolvedFile::kindName(Kind kind)
{
    switch (kind) {
        case Kind::Package:    return "package";
        case Kind::DescIndex:  return "db";
        case Kind::FilesIndex: return "files";
    }
    return "unknown";
}

PackageStore::PackageStore(const Config& config)
    : config(config)
{
}

// ============================================================================
// Paths
// ============================================================================

fs::path PackageStore::partitionDir(const PartitionKey& partition) const
{
    return config.dataPath / partition.repo / "os" / partition.arch;
}

fs::path PackageStore::metadataDir(const PartitionKey& partition) const
{
    return partitionDir(partition) / "metadata";
}

fs::path PackageStore::descArchivePath(const PartitionKey& partition) const
{
    return partitionDir(partition) / (partition.repo + ".db.tar.gz");
}

fs::path PackageStore::filesArchivePath(const PartitionKey& partition) const
{
    return partitionDir(partition) / (partition.repo + ".files.tar.gz");
}

std::vector<PartitionKey> PackageStore::partitions() const
{
    std::set<PartitionKey> found;
    for (const auto& repoDir : listDirectory(config.dataPath)) {
        std::string repo = repoDir.filename().string();
        // Hidden entries hold upload staging, not repositories.
        if (repo.empty() || repo[0] == '.') {
            continue;
        }
        for (const auto& archDir : listDirectory(repoDir / "os")) {
            std::error_code ec;
            if (fs::is_directory(archDir, ec)) {
                found.insert(PartitionKey{repo, archDir.filename().string()});
            }
        }
    }
    return std::vector<PartitionKey>(found.begin(), found.end());
}

std::mutex& PackageStore::partitionLock(const PartitionKey& partition)
{
    std::lock_guard<std::mutex> lock(registryMutex);
    std::unique_ptr<std::mutex>& slot = locks[partition];
    if (!slot) {
        slot = std::make_unique<std::mutex>();
    }
    return *slot;
}

// ============================================================================
// Reading
// ============================================================================

std::vector<PackageMetadata> PackageStore::loadPartition(const PartitionKey& partition) const
{
    std::vector<PackageMetadata> packages;
    for (const auto& path : listDirectory(metadataDir(partition))) {
        if (path.extension() != ".json") {
            continue;
        }
        try {
            packages.push_back(fromSidecar(readFile(path)));
        } catch (const Error& e) {
            log_warning("Skipping unreadable metadata " + path.string() + ": " + e.what());
        }
    }
    return packages;
}

std::vector<PackageMetadata> PackageStore::list(const ListFilter& filter) const
{
    std::vector<PackageMetadata> result;
    for (const auto& partition : partitions()) {
        if (filter.repo && *filter.repo != partition.repo) {
            continue;
        }
        if (filter.arch && *filter.arch != partition.arch) {
            continue;
        }

        std::vector<PackageMetadata> packages = loadPartition(partition);
        std::sort(packages.begin(), packages.end(),
                  [](const PackageMetadata& a, const PackageMetadata& b) { return a.name < b.name; });
        for (auto& pkg : packages) {
            if (filter.name && *filter.name != pkg.name) {
                continue;
            }
            result.push_back(std::move(pkg));
        }
    }
    return result;
}

ResolvedFile PackageStore::resolve(const PartitionKey& partition, const std::string& filename) const
{
    validatePartition(partition);
    validatePathComponent(filename, "filename");

    ResolvedFile resolved;
    if (filename == partition.repo + ".db" || filename == partition.repo + ".db.tar.gz") {
        resolved.kind = ResolvedFile::Kind::DescIndex;
    } else if (filename == partition.repo + ".files" ||
               filename == partition.repo + ".files.tar.gz") {
        resolved.kind = ResolvedFile::Kind::FilesIndex;
    } else if (isPackageFilename(filename)) {
        resolved.kind = ResolvedFile::Kind::Package;
    } else {
        throw NotFoundError("unsupported file type: " + filename);
    }

    resolved.path = partitionDir(partition) / filename;
    std::error_code ec;
    if (!fs::is_regular_file(resolved.path, ec)) {
        throw NotFoundError(filename + " in " + partition.toString());
    }
    return resolved;
}

// ============================================================================
// Mutations
// ============================================================================

PackageMetadata PackageStore::add(const PartitionKey& partition, const fs::path& archivePath)
{
    validatePartition(partition);

    ParsedArchive parsed = ArchiveParser::parse(archivePath);
    PackageMetadata pkg = std::move(parsed.metadata);

    if (pkg.arch != partition.arch && pkg.arch != "any") {
        throw InputError(InputError::Kind::ArchMismatch,
                         pkg.editionKey() + " cannot be stored in " + partition.toString());
    }
    validatePathComponent(pkg.name, "package name");

    pkg.repo = partition.repo;
    pkg.filename = pkg.archiveFilename(parsed.extension);
    validatePathComponent(pkg.filename, "package filename");

    std::lock_guard<std::mutex> lock(partitionLock(partition));

    const fs::path dir = partitionDir(partition);
    const fs::path sidecar = metadataDir(partition) / (pkg.name + ".json");
    ensureDirectory(metadataDir(partition));

    std::optional<std::string> previousFilename;
    std::optional<std::string> previousSidecar;
    std::error_code ec;
    if (fs::is_regular_file(sidecar, ec)) {
        try {
            previousSidecar = readFile(sidecar);
            previousFilename = fromSidecar(*previousSidecar).filename;
        } catch (const Error& e) {
            log_warning("Replacing unreadable metadata " + sidecar.string() + ": " + e.what());
        }
    }

    // The archive stays under a temporary name until its sidecar is in place.
    const fs::path archiveTarget = dir / pkg.filename;
    fs::path archiveTmp = copyToTemp(archivePath, archiveTarget);
    try {
        writeFileAtomic(sidecar, toSidecar(pkg));
    } catch (const Error&) {
        removeQuietly(archiveTmp);
        throw;
    }
    try {
        replaceFile(archiveTmp, archiveTarget);
    } catch (const Error&) {
        try {
            if (previousSidecar) {
                writeFileAtomic(sidecar, *previousSidecar);
            } else {
                removeIfPresent(sidecar);
            }
        } catch (const Error& restoreError) {
            log_error("Could not restore " + sidecar.string() + ": " + restoreError.what());
        }
        throw;
    }

    if (previousFilename && *previousFilename != pkg.filename) {
        try {
            validatePathComponent(*previousFilename, "package filename");
            removeIfPresent(dir / *previousFilename);
            log_message("Replaced " + *previousFilename + " with " + pkg.filename);
        } catch (const Error& e) {
            log_warning("Could not remove previous edition of " + pkg.name + ": " + e.what());
        }
    }

    log_message("Stored " + pkg.editionKey() + " in " + partition.toString());
    regenerateLocked(partition);
    return pkg;
}

void PackageStore::remove(const std::string& name, const PartitionKey& partition)
{
    validatePartition(partition);
    validatePathComponent(name, "package name");

    const fs::path sidecar = metadataDir(partition) / (name + ".json");
    std::error_code ec;
    if (!fs::is_directory(metadataDir(partition), ec)) {
        throw NotFoundError("package " + name + " in " + partition.toString());
    }

    std::lock_guard<std::mutex> lock(partitionLock(partition));

    if (!fs::is_regular_file(sidecar, ec)) {
        throw NotFoundError("package " + name + " in " + partition.toString());
    }

    std::string removed = name;
    try {
        PackageMetadata pkg = fromSidecar(readFile(sidecar));
        if (!pkg.filename.empty()) {
            validatePathComponent(pkg.filename, "package filename");
            removeIfPresent(partitionDir(partition) / pkg.filename);
        }
        removed = pkg.editionKey();
    } catch (const InputError& e) {
        log_warning("Removing unreadable metadata " + sidecar.string() +
                    " without its archive: " + e.what());
    }
    removeIfPresent(sidecar);

    log_message("Removed " + removed + " from " + partition.toString());
    regenerateLocked(partition);
}

void PackageStore::regenerate(const PartitionKey& partition)
{
    validatePartition(partition);
    std::lock_guard<std::mutex> lock(partitionLock(partition));
    regenerateLocked(partition);
}

std::size_t PackageStore::regenerateAll()
{
    std::vector<PartitionKey> all = partitions();
    for (const auto& partition : all) {
        regenerate(partition);
    }
    return all.size();
}

void PackageStore::regenerateLocked(const PartitionKey& partition)
{
    const fs::path dir = partitionDir(partition);
    ensureDirectory(dir);

    std::vector<PackageMetadata> packages = loadPartition(partition);

    // Both archives are built before anything is written.
    std::string descArchive = Database::buildDescArchive(packages);
    std::string filesArchive = Database::buildFilesArchive(packages);

    publishIndexPair(filesArchivePath(partition), filesArchive,
                     descArchivePath(partition), descArchive);

    publishPointer(dir / (partition.repo + ".db"), partition.repo + ".db.tar.gz",
                   config.useSymlinks);
    publishPointer(dir / (partition.repo + ".files"), partition.repo + ".files.tar.gz",
                   config.useSymlinks);

    log_message("Regenerated " + partition.toString() + " index (" +
                std::to_string(packages.size()) + " package(s))");
}

void PackageStore::publishPointer(const fs::path& pointer, const std::string& targetName,
                                  bool useSymlink)
{
    std::error_code ec;
    if (useSymlink) {
        fs::path tmp = tempPathFor(pointer);
        fs::create_symlink(targetName, tmp, ec);
        if (!ec) {
            fs::rename(tmp, pointer, ec);
            if (!ec) {
                return;
            }
            std::error_code ignored;
            fs::remove(tmp, ignored);
            throw IoError("Unable to publish " + targetName, pointer, ec);
        }
        log_warning("Cannot create symlink " + pointer.string() + " (" + ec.message() +
                    "); publishing a copy instead");
    }

    copyFileAtomic(pointer.parent_path() / targetName, pointer);
}

} // namespace Pkgdepot
