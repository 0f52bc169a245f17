#ifndef ARCHIVE_PARSER_HPP
#define ARCHIVE_PARSER_HPP

#include "package.hpp"

#include <filesystem>
#include <string>

namespace Pkgdepot {

/**
 * @brief Result of parsing one package archive.
 */
struct ParsedArchive
{
    /// Metadata, file list, checksums and compressed size. repo and filename
    /// are left empty; the store fills them in.
    PackageMetadata metadata;

    /// Filename suffix matching the detected compression, e.g. ".pkg.tar.zst".
    std::string extension;
};

/**
 * @class ArchiveParser
 * @brief Reads a compressed package archive in one streaming pass.
 *
 * The raw file is read in fixed-size blocks. Each block is fed to the SHA-256
 * and MD5 digests and then handed to libarchive, which detects the outer
 * compression and walks the inner tar stream. Nothing is written to disk.
 */
class ArchiveParser
{
public:
    /// Size of the raw read buffer handed to libarchive.
    static constexpr std::size_t readBlockSize = 65536;

    /// Upper bound on the size of a .PKGINFO entry.
    static constexpr std::size_t maxPkgInfoSize = 1024 * 1024;

    /**
     * @brief Parses the package archive at `path`.
     *
     * @throws InputError CorruptArchive if the stream cannot be decompressed or
     *         is not a tar container, MissingMetadata if it has no .PKGINFO,
     *         MissingRequiredField if .PKGINFO lacks name, version, release or
     *         architecture.
     * @throws IoError if the file cannot be read.
     */
    static ParsedArchive parse(const std::filesystem::path& path);

    /**
     * @brief Maps a libarchive filter code to a package filename suffix.
     */
    static std::string extensionForFilter(int filterCode);

    /**
     * @brief True for entries that carry package metadata rather than
     *        installed files (.PKGINFO, .MTREE, .BUILDINFO, .INSTALL, ...).
     */
    static bool isInternalEntry(const std::string& path);
};

} // namespace Pkgdepot

#endif // ARCHIVE_PARSER_HPP
