#include "archive_parser.hpp"
#include "checksum.hpp"
#include "error.hpp"
#include "test_helpers.hpp"
#include "utils.hpp"

#include <archive.h>

#include <string>
#include <vector>

#include <gtest/gtest.h>

using namespace Pkgdepot;

TEST(ArchiveParserTest, ParsesPackage)
{
    Pkgdepot::Test::ScratchDir dir("parser");
    auto path = Pkgdepot::Test::buildPackage(dir.path(), "foo", "1.0.0", "1", "x86_64",
                                   "depend = glibc\ndepend = zlib\n");

    ParsedArchive parsed = ArchiveParser::parse(path);
    const PackageMetadata& pkg = parsed.metadata;
    EXPECT_EQ("foo", pkg.name);
    EXPECT_EQ("1.0.0", pkg.version);
    EXPECT_EQ("1", pkg.release);
    EXPECT_EQ("x86_64", pkg.arch);
    EXPECT_EQ("The foo package", pkg.description);
    EXPECT_EQ(4096u, pkg.installedSize);
    EXPECT_EQ(1700000000, pkg.buildDate);
    EXPECT_EQ((std::vector<std::string>{"glibc", "zlib"}), pkg.depends);
    EXPECT_EQ((std::vector<std::string>{"usr/", "usr/bin/", "usr/bin/foo"}), pkg.files);
    EXPECT_EQ(".pkg.tar.gz", parsed.extension);

    std::string raw = readFile(path);
    EXPECT_EQ(raw.size(), pkg.compressedSize);
    EXPECT_EQ(sha256Hex(raw), pkg.sha256);
    EXPECT_EQ(md5Hex(raw), pkg.md5);
    EXPECT_TRUE(pkg.filename.empty());
    EXPECT_TRUE(pkg.repo.empty());
}

TEST(ArchiveParserTest, UncompressedTarAndDotSlashPaths)
{
    Pkgdepot::Test::ScratchDir dir("parser");
    auto path = dir / "bar.pkg.tar";
    Pkgdepot::Test::writeArchive(path, {
        {"./.PKGINFO", Pkgdepot::Test::pkgInfoText("bar", "2.1", "3", "any"), false},
        {"./.MTREE", "mtree data", false},
        {"./.INSTALL", "post_install() { :; }", false},
        {"./etc", "", true},
        {"./etc/bar.conf", "key=value\n", false},
    }, Pkgdepot::Test::Compression::None);

    ParsedArchive parsed = ArchiveParser::parse(path);
    EXPECT_EQ("bar", parsed.metadata.name);
    EXPECT_EQ("any", parsed.metadata.arch);
    EXPECT_EQ(".pkg.tar", parsed.extension);
    EXPECT_EQ((std::vector<std::string>{"etc/", "etc/bar.conf"}), parsed.metadata.files);
}

TEST(ArchiveParserTest, MissingMetadata)
{
    Pkgdepot::Test::ScratchDir dir("parser");
    auto path = dir / "nometa.pkg.tar.gz";
    Pkgdepot::Test::writeArchive(path, {{"usr/bin/tool", "binary", false}});

    try {
        ArchiveParser::parse(path);
        FAIL() << "archive without .PKGINFO accepted";
    } catch (const InputError& e) {
        EXPECT_EQ(InputError::Kind::MissingMetadata, e.kind());
    }
}

TEST(ArchiveParserTest, MissingRequiredField)
{
    Pkgdepot::Test::ScratchDir dir("parser");
    auto path = dir / "noarch.pkg.tar.gz";
    Pkgdepot::Test::writeArchive(path, {{".PKGINFO", "pkgname = foo\npkgver = 1-1\n", false}});

    try {
        ArchiveParser::parse(path);
        FAIL() << "archive without arch accepted";
    } catch (const InputError& e) {
        EXPECT_EQ(InputError::Kind::MissingRequiredField, e.kind());
    }
}

TEST(ArchiveParserTest, CorruptStream)
{
    Pkgdepot::Test::ScratchDir dir("parser");
    auto good = Pkgdepot::Test::buildPackage(dir.path(), "foo", "1.0.0", "1", "x86_64");
    std::string bytes = readFile(good);

    // Valid gzip header, stream cut off halfway
    writeFileAtomic(dir / "broken.pkg.tar.gz", bytes.substr(0, bytes.size() / 2));
    try {
        ArchiveParser::parse(dir / "broken.pkg.tar.gz");
        FAIL() << "corrupt stream accepted";
    } catch (const InputError& e) {
        EXPECT_EQ(InputError::Kind::CorruptArchive, e.kind());
    }

    writeFileAtomic(dir / "garbage.pkg.tar.gz", "this is not an archive at all");
    try {
        ArchiveParser::parse(dir / "garbage.pkg.tar.gz");
        FAIL() << "garbage accepted";
    } catch (const InputError& e) {
        EXPECT_EQ(InputError::Kind::CorruptArchive, e.kind());
    }
}

TEST(ArchiveParserTest, MissingFile)
{
    Pkgdepot::Test::ScratchDir dir("parser");
    EXPECT_THROW(ArchiveParser::parse(dir / "absent.pkg.tar.zst"), IoError);
}

TEST(ArchiveParserTest, DuplicatePkgInfoLastWins)
{
    Pkgdepot::Test::ScratchDir dir("parser");
    auto path = dir / "dup.pkg.tar.gz";
    Pkgdepot::Test::writeArchive(path, {
        {".PKGINFO", Pkgdepot::Test::pkgInfoText("first", "1", "1", "x86_64"), false},
        {"usr/share/doc", "", true},
        {".PKGINFO", Pkgdepot::Test::pkgInfoText("second", "2", "1", "x86_64"), false},
    });

    ParsedArchive parsed = ArchiveParser::parse(path);
    EXPECT_EQ("second", parsed.metadata.name);
    EXPECT_EQ("2", parsed.metadata.version);
    EXPECT_EQ((std::vector<std::string>{"usr/share/doc/"}), parsed.metadata.files);
}

TEST(ArchiveParserTest, ExtensionForFilter)
{
    EXPECT_EQ(".pkg.tar.zst", ArchiveParser::extensionForFilter(ARCHIVE_FILTER_ZSTD));
    EXPECT_EQ(".pkg.tar.xz", ArchiveParser::extensionForFilter(ARCHIVE_FILTER_XZ));
    EXPECT_EQ(".pkg.tar.gz", ArchiveParser::extensionForFilter(ARCHIVE_FILTER_GZIP));
    EXPECT_EQ(".pkg.tar.bz2", ArchiveParser::extensionForFilter(ARCHIVE_FILTER_BZIP2));
    EXPECT_EQ(".pkg.tar", ArchiveParser::extensionForFilter(ARCHIVE_FILTER_NONE));
}

TEST(ArchiveParserTest, InternalEntries)
{
    EXPECT_TRUE(ArchiveParser::isInternalEntry(".PKGINFO"));
    EXPECT_TRUE(ArchiveParser::isInternalEntry(".BUILDINFO"));
    EXPECT_TRUE(ArchiveParser::isInternalEntry(".MTREE"));
    EXPECT_FALSE(ArchiveParser::isInternalEntry("usr/bin/foo"));
    EXPECT_FALSE(ArchiveParser::isInternalEntry("etc/.hidden"));
}
