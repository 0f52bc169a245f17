#include "archive_parser.hpp"
#include "checksum.hpp"
#include "error.hpp"
#include "pkginfo.hpp"
#include "utils.hpp"

#include <archive.h>
#include <archive_entry.h>

#include <cerrno>
#include <fstream>
#include <memory>
#include <optional>
#include <vector>

namespace fs = std::filesystem;

namespace Pkgdepot {

// ============================================================================
// Helper Functions
// ============================================================================

namespace {

    const char* pkgInfoEntry = ".PKGINFO";

    /**
     * Raw byte source handed to libarchive. Every block read from disk passes
     * through the digests before libarchive sees it, so the checksums cover
     * the compressed bytes exactly as stored.
     */
    struct RawSource
    {
        explicit RawSource(const fs::path& p)
            : path(p), in(p, std::ios::binary), buffer(ArchiveParser::readBlockSize),
              sha256(Digest::sha256()), md5(Digest::md5()) {}

        fs::path path;
        std::ifstream in;
        std::vector<char> buffer;
        Digest sha256;
        Digest md5;
        std::uint64_t bytesRead = 0;
        bool readFailed = false;

        // Returns the number of bytes placed in `buffer`, 0 at end of file.
        std::size_t next()
        {
            if (!in) {
                return 0;
            }
            in.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
            if (in.bad()) {
                readFailed = true;
                return 0;
            }
            std::size_t got = static_cast<std::size_t>(in.gcount());
            sha256.update(buffer.data(), got);
            md5.update(buffer.data(), got);
            bytesRead += got;
            return got;
        }
    };

    la_ssize_t readCallback(struct archive* a, void* clientData, const void** block)
    {
        RawSource* src = static_cast<RawSource*>(clientData);
        std::size_t got = src->next();
        if (src->readFailed) {
            archive_set_error(a, EIO, "read error on %s", src->path.c_str());
            return -1;
        }
        *block = src->buffer.data();
        return static_cast<la_ssize_t>(got);
    }

    using ArchiveReader = std::unique_ptr<struct archive, int (*)(struct archive*)>;

    [[noreturn]] void failCorrupt(struct archive* a, const RawSource& src, const std::string& what)
    {
        if (src.readFailed) {
            throw IoError("Unable to read package archive", src.path,
                          std::make_error_code(std::errc::io_error));
        }
        const char* detail = archive_error_string(a);
        throw InputError(InputError::Kind::CorruptArchive,
                         what + " in " + src.path.filename().string() +
                         (detail ? std::string(": ") + detail : std::string()));
    }

    std::string readEntryText(struct archive* a, const RawSource& src)
    {
        std::string text;
        char block[8192];
        while (true) {
            la_ssize_t n = archive_read_data(a, block, sizeof(block));
            if (n == 0) {
                break;
            }
            if (n < 0) {
                failCorrupt(a, src, "Failed to read .PKGINFO");
            }
            text.append(block, static_cast<std::size_t>(n));
            if (text.size() > ArchiveParser::maxPkgInfoSize) {
                throw InputError(InputError::Kind::CorruptArchive,
                                 ".PKGINFO exceeds " +
                                 std::to_string(ArchiveParser::maxPkgInfoSize) + " bytes");
            }
        }
        return text;
    }

    std::string normalizeEntryPath(const std::string& raw, bool isDirectory)
    {
        std::string path = raw;
        while (path.rfind("./", 0) == 0) {
            path.erase(0, 2);
        }
        if (isDirectory && !path.empty() && path.back() != '/') {
            path.push_back('/');
        }
        return path;
    }

} // anonymous namespace

// ============================================================================
// ArchiveParser
// ============================================================================

std::string ArchiveParser::extensionForFilter(int filterCode)
{
    switch (filterCode) {
        case ARCHIVE_FILTER_NONE:  return ".pkg.tar";
        case ARCHIVE_FILTER_GZIP:  return ".pkg.tar.gz";
        case ARCHIVE_FILTER_BZIP2: return ".pkg.tar.bz2";
        case ARCHIVE_FILTER_XZ:    return ".pkg.tar.xz";
        case ARCHIVE_FILTER_LZ4:   return ".pkg.tar.lz4";
        case ARCHIVE_FILTER_ZSTD:  return ".pkg.tar.zst";
        default:                   return ".pkg.tar.zst";
    }
}

bool ArchiveParser::isInternalEntry(const std::string& path)
{
    return !path.empty() && path[0] == '.';
}

ParsedArchive ArchiveParser::parse(const fs::path& path)
{
    RawSource src(path);
    if (!src.in.is_open()) {
        std::error_code ec;
        bool exists = fs::exists(path, ec);
        throw IoError("Unable to open package archive", path,
                      exists ? std::make_error_code(std::errc::permission_denied)
                             : std::make_error_code(std::errc::no_such_file_or_directory));
    }

    ArchiveReader reader(archive_read_new(), archive_read_free);
    if (!reader) {
        throw Error("archive_read_new failed");
    }
    struct archive* a = reader.get();
    archive_read_support_filter_all(a);
    archive_read_support_format_all(a);

    if (archive_read_open(a, &src, nullptr, readCallback, nullptr) != ARCHIVE_OK) {
        failCorrupt(a, src, "Unrecognized or corrupt compressed stream");
    }

    std::optional<PkgInfo> info;
    std::vector<std::string> files;
    bool sawHeader = false;

    while (true) {
        struct archive_entry* entry = nullptr;
        int r = archive_read_next_header(a, &entry);
        if (r == ARCHIVE_EOF) {
            break;
        }
        if (r == ARCHIVE_WARN) {
            const char* warning = archive_error_string(a);
            log_debug(std::string("libarchive warning: ") + (warning ? warning : "unknown"));
        } else if (r != ARCHIVE_OK) {
            failCorrupt(a, src, "Corrupt archive entry");
        }

        if (!sawHeader) {
            sawHeader = true;
            if ((archive_format(a) & ARCHIVE_FORMAT_BASE_MASK) != ARCHIVE_FORMAT_TAR) {
                throw InputError(InputError::Kind::CorruptArchive,
                                 path.filename().string() + " is not a tar archive (" +
                                 archive_format_name(a) + ")");
            }
        }

        const char* rawName = archive_entry_pathname(entry);
        if (!rawName) {
            if (archive_read_data_skip(a) < ARCHIVE_WARN) {
                failCorrupt(a, src, "Corrupt data for unnamed entry");
            }
            continue;
        }
        bool isDirectory = archive_entry_filetype(entry) == AE_IFDIR;
        std::string entryPath = normalizeEntryPath(rawName, isDirectory);

        if (entryPath == pkgInfoEntry) {
            // A later .PKGINFO replaces an earlier one.
            if (info) {
                log_warning("Duplicate .PKGINFO in " + path.filename().string() +
                            "; using the last one");
            }
            info = PkgInfo::parse(readEntryText(a, src));
            continue;
        }

        if (!entryPath.empty() && !isInternalEntry(entryPath)) {
            files.push_back(entryPath);
        }
        if (archive_read_data_skip(a) < ARCHIVE_WARN) {
            failCorrupt(a, src, "Corrupt data for " + entryPath);
        }
    }

    std::string extension = extensionForFilter(archive_filter_code(a, 0));

    // Hash whatever follows the tar end-of-archive marker as well.
    while (src.next() > 0) {
    }
    if (src.readFailed) {
        throw IoError("Unable to read package archive", path,
                      std::make_error_code(std::errc::io_error));
    }

    if (!info) {
        throw InputError(InputError::Kind::MissingMetadata,
                         path.filename().string() + " contains no .PKGINFO");
    }

    ParsedArchive result;
    result.metadata = info->toMetadata();
    result.metadata.files = std::move(files);
    result.metadata.compressedSize = src.bytesRead;
    result.metadata.sha256 = src.sha256.hexDigest();
    result.metadata.md5 = src.md5.hexDigest();
    result.extension = extension;

    log_debug("Parsed " + path.filename().string() + ": " + result.metadata.editionKey() +
              " (" + std::to_string(result.metadata.files.size()) + " files)");
    return result;
}

} // namespace Pkgdepot
