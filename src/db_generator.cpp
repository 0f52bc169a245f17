#include "db_generator.hpp"
#include "error.hpp"
#include "utils.hpp"

#include <archive.h>
#include <archive_entry.h>

#include <algorithm>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <tuple>

namespace Pkgdepot {

// ============================================================================
// Helper Functions
// ============================================================================

namespace {

    using ArchiveWriter = std::unique_ptr<struct archive, int (*)(struct archive*)>;
    using ArchiveReader = std::unique_ptr<struct archive, int (*)(struct archive*)>;
    using EntryHandle   = std::unique_ptr<struct archive_entry, void (*)(struct archive_entry*)>;

    void appendSection(std::string& out, const char* field, const std::vector<std::string>& values)
    {
        std::string body;
        for (const auto& v : values) {
            // An empty line would end the section early for any reader.
            if (!v.empty()) {
                body += v + "\n";
            }
        }
        if (body.empty()) {
            return;
        }
        out += "%";
        out += field;
        out += "%\n";
        out += body;
        out += "\n";
    }

    void appendSection(std::string& out, const char* field, const std::string& value)
    {
        appendSection(out, field, std::vector<std::string>{value});
    }

    la_ssize_t appendToString(struct archive*, void* clientData, const void* buffer, size_t length)
    {
        std::string* out = static_cast<std::string*>(clientData);
        out->append(static_cast<const char*>(buffer), length);
        return static_cast<la_ssize_t>(length);
    }

    [[noreturn]] void failWrite(struct archive* a, const std::string& what)
    {
        const char* detail = archive_error_string(a);
        throw Error("Failed to generate index: " + what +
                    (detail ? std::string(": ") + detail : std::string()));
    }

    /**
     * Streams tar entries with normalized headers into a gzip-compressed
     * in-memory buffer.
     */
    class IndexWriter
    {
    public:
        IndexWriter()
            : writer(archive_write_new(), archive_write_free)
        {
            struct archive* a = writer.get();
            if (!a) {
                throw Error("archive_write_new failed");
            }
            if (archive_write_add_filter_gzip(a) != ARCHIVE_OK) {
                failWrite(a, "gzip filter unavailable");
            }
            // Without this the gzip header records the current time.
            if (archive_write_set_filter_option(a, "gzip", "timestamp", nullptr) != ARCHIVE_OK) {
                log_warning("libarchive cannot disable gzip timestamps; index bytes will vary");
            }
            if (archive_write_set_format_pax_restricted(a) != ARCHIVE_OK) {
                failWrite(a, "pax format unavailable");
            }
            if (archive_write_open(a, &output, nullptr, appendToString, nullptr) != ARCHIVE_OK) {
                failWrite(a, "cannot open output");
            }
        }

        void addDirectory(const std::string& path, std::int64_t mtime)
        {
            EntryHandle entry = makeEntry(path, mtime);
            archive_entry_set_filetype(entry.get(), AE_IFDIR);
            archive_entry_set_perm(entry.get(), 0755);
            archive_entry_set_size(entry.get(), 0);
            if (archive_write_header(writer.get(), entry.get()) != ARCHIVE_OK) {
                failWrite(writer.get(), "header for " + path);
            }
        }

        void addFile(const std::string& path, const std::string& content, std::int64_t mtime)
        {
            EntryHandle entry = makeEntry(path, mtime);
            archive_entry_set_filetype(entry.get(), AE_IFREG);
            archive_entry_set_perm(entry.get(), 0644);
            archive_entry_set_size(entry.get(), static_cast<la_int64_t>(content.size()));
            if (archive_write_header(writer.get(), entry.get()) != ARCHIVE_OK) {
                failWrite(writer.get(), "header for " + path);
            }
            la_ssize_t written = archive_write_data(writer.get(), content.data(), content.size());
            if (written < 0 || static_cast<size_t>(written) != content.size()) {
                failWrite(writer.get(), "data for " + path);
            }
        }

        std::string finish()
        {
            if (archive_write_close(writer.get()) != ARCHIVE_OK) {
                failWrite(writer.get(), "closing archive");
            }
            return std::move(output);
        }

    private:
        static EntryHandle makeEntry(const std::string& path, std::int64_t mtime)
        {
            EntryHandle entry(archive_entry_new(), archive_entry_free);
            if (!entry) {
                throw Error("archive_entry_new failed");
            }
            archive_entry_set_pathname(entry.get(), path.c_str());
            archive_entry_set_mtime(entry.get(), static_cast<time_t>(mtime), 0);
            archive_entry_set_uid(entry.get(), 0);
            archive_entry_set_gid(entry.get(), 0);
            archive_entry_set_uname(entry.get(), "root");
            archive_entry_set_gname(entry.get(), "root");
            return entry;
        }

        ArchiveWriter writer;
        std::string output;
    };

    std::uint64_t parseUnsigned(const std::string& field, const std::string& value)
    {
        try {
            size_t consumed = 0;
            unsigned long long n = std::stoull(value, &consumed);
            if (consumed == value.size()) {
                return n;
            }
        } catch (const std::exception&) {
            // reported below
        }
        throw InputError(InputError::Kind::CorruptArchive,
                         "malformed %" + field + "% value '" + value + "'");
    }

} // anonymous namespace

// ============================================================================
// Rendering
// ============================================================================

std::string Database::renderDesc(const PackageMetadata& pkg)
{
    std::string out;
    appendSection(out, "FILENAME", pkg.filename);
    appendSection(out, "NAME", pkg.name);
    if (pkg.base) {
        appendSection(out, "BASE", *pkg.base);
    }
    appendSection(out, "VERSION", pkg.fullVersion());
    appendSection(out, "DESC", pkg.description);
    appendSection(out, "GROUPS", pkg.groups);
    appendSection(out, "CSIZE", std::to_string(pkg.compressedSize));
    appendSection(out, "ISIZE", std::to_string(pkg.installedSize));
    appendSection(out, "SHA256SUM", pkg.sha256);
    appendSection(out, "MD5SUM", pkg.md5);
    appendSection(out, "URL", pkg.url);
    appendSection(out, "LICENSE", pkg.licenses);
    appendSection(out, "ARCH", pkg.arch);
    if (pkg.buildDate > 0) {
        appendSection(out, "BUILDDATE", std::to_string(pkg.buildDate));
    }
    appendSection(out, "PACKAGER", pkg.packager);
    appendSection(out, "DEPENDS", pkg.depends);
    appendSection(out, "OPTDEPENDS", pkg.optdepends);
    appendSection(out, "PROVIDES", pkg.provides);
    appendSection(out, "CONFLICTS", pkg.conflicts);
    appendSection(out, "REPLACES", pkg.replaces);
    return out;
}

std::string Database::renderFiles(const PackageMetadata& pkg)
{
    std::string out = "%FILES%\n";
    for (const auto& file : pkg.files) {
        out += file + "\n";
    }
    return out;
}

void Database::sortPackages(std::vector<PackageMetadata>& packages)
{
    std::sort(packages.begin(), packages.end(),
              [](const PackageMetadata& a, const PackageMetadata& b) {
                  return std::tie(a.name, a.version, a.release) <
                         std::tie(b.name, b.version, b.release);
              });
}

std::string Database::buildDescArchive(std::vector<PackageMetadata> packages)
{
    sortPackages(packages);
    IndexWriter writer;
    for (const auto& pkg : packages) {
        const std::string dir = pkg.entryName() + "/";
        writer.addDirectory(dir, pkg.buildDate);
        writer.addFile(dir + "desc", renderDesc(pkg), pkg.buildDate);
    }
    return writer.finish();
}

std::string Database::buildFilesArchive(std::vector<PackageMetadata> packages)
{
    sortPackages(packages);
    IndexWriter writer;
    for (const auto& pkg : packages) {
        const std::string dir = pkg.entryName() + "/";
        writer.addDirectory(dir, pkg.buildDate);
        writer.addFile(dir + "desc", renderDesc(pkg), pkg.buildDate);
        writer.addFile(dir + "files", renderFiles(pkg), pkg.buildDate);
    }
    return writer.finish();
}

// ============================================================================
// Reading back
// ============================================================================

PackageMetadata Database::parseDesc(const std::string& text)
{
    PackageMetadata pkg;
    std::istringstream stream(text);
    std::string line;
    std::string field;
    std::vector<std::string> values;

    auto commit = [&]() {
        if (field.empty()) {
            return;
        }
        const std::string first = values.empty() ? std::string() : values.front();
        if (field == "FILENAME") {
            pkg.filename = first;
        } else if (field == "NAME") {
            pkg.name = first;
        } else if (field == "BASE") {
            pkg.base = first;
        } else if (field == "VERSION") {
            size_t dash = first.rfind('-');
            pkg.version = dash == std::string::npos ? first : first.substr(0, dash);
            pkg.release = dash == std::string::npos ? "" : first.substr(dash + 1);
        } else if (field == "DESC") {
            pkg.description = first;
        } else if (field == "GROUPS") {
            pkg.groups = values;
        } else if (field == "CSIZE") {
            pkg.compressedSize = parseUnsigned(field, first);
        } else if (field == "ISIZE") {
            pkg.installedSize = parseUnsigned(field, first);
        } else if (field == "SHA256SUM") {
            pkg.sha256 = first;
        } else if (field == "MD5SUM") {
            pkg.md5 = first;
        } else if (field == "URL") {
            pkg.url = first;
        } else if (field == "LICENSE") {
            pkg.licenses = values;
        } else if (field == "ARCH") {
            pkg.arch = first;
        } else if (field == "BUILDDATE") {
            pkg.buildDate = static_cast<std::int64_t>(parseUnsigned(field, first));
        } else if (field == "PACKAGER") {
            pkg.packager = first;
        } else if (field == "DEPENDS") {
            pkg.depends = values;
        } else if (field == "OPTDEPENDS") {
            pkg.optdepends = values;
        } else if (field == "PROVIDES") {
            pkg.provides = values;
        } else if (field == "CONFLICTS") {
            pkg.conflicts = values;
        } else if (field == "REPLACES") {
            pkg.replaces = values;
        }
        field.clear();
        values.clear();
    };

    while (std::getline(stream, line)) {
        if (field.empty()) {
            if (line.size() > 2 && line.front() == '%' && line.back() == '%') {
                field = line.substr(1, line.size() - 2);
            }
            continue;
        }
        if (line.empty()) {
            commit();
        } else {
            values.push_back(line);
        }
    }
    commit();
    return pkg;
}

std::vector<std::string> Database::parseFiles(const std::string& text)
{
    std::vector<std::string> files;
    std::istringstream stream(text);
    std::string line;
    bool inFiles = false;
    while (std::getline(stream, line)) {
        if (line == "%FILES%") {
            inFiles = true;
            continue;
        }
        if (inFiles && !line.empty()) {
            files.push_back(line);
        }
    }
    return files;
}

std::vector<IndexMember> Database::readArchive(const std::string& bytes)
{
    ArchiveReader reader(archive_read_new(), archive_read_free);
    struct archive* a = reader.get();
    if (!a) {
        throw Error("archive_read_new failed");
    }
    archive_read_support_filter_all(a);
    archive_read_support_format_all(a);

    auto fail = [a](const std::string& what) {
        const char* detail = archive_error_string(a);
        throw InputError(InputError::Kind::CorruptArchive,
                         what + (detail ? std::string(": ") + detail : std::string()));
    };

    if (archive_read_open_memory(a, bytes.data(), bytes.size()) != ARCHIVE_OK) {
        fail("Unreadable index archive");
    }

    std::vector<IndexMember> members;
    struct archive_entry* entry = nullptr;
    int r = ARCHIVE_OK;
    while ((r = archive_read_next_header(a, &entry)) == ARCHIVE_OK || r == ARCHIVE_WARN) {
        IndexMember member;
        const char* name = archive_entry_pathname(entry);
        member.path = name ? name : "";
        member.isDirectory = archive_entry_filetype(entry) == AE_IFDIR;
        char block[8192];
        la_ssize_t n;
        while ((n = archive_read_data(a, block, sizeof(block))) > 0) {
            member.content.append(block, static_cast<size_t>(n));
        }
        if (n < 0) {
            fail("Corrupt index member " + member.path);
        }
        members.push_back(std::move(member));
    }
    if (r != ARCHIVE_EOF) {
        fail("Corrupt index archive");
    }
    return members;
}

} // namespace Pkgdepot
