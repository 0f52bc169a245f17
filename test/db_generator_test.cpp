#include "db_generator.hpp"
#include "error.hpp"

#include <string>
#include <vector>

#include <gtest/gtest.h>

using namespace Pkgdepot;

static PackageMetadata samplePackage(const std::string& name)
{
    PackageMetadata pkg;
    pkg.name = name;
    pkg.version = "1.0.0";
    pkg.release = "1";
    pkg.arch = "x86_64";
    pkg.description = "The " + name + " tool";
    pkg.url = "https://example.org/" + name;
    pkg.licenses = {"MIT"};
    pkg.packager = "Jane <jane@example.org>";
    pkg.buildDate = 1700000000;
    pkg.installedSize = 4096;
    pkg.compressedSize = 1234;
    pkg.sha256 = std::string(64, 'a');
    pkg.md5 = std::string(32, 'b');
    pkg.filename = name + "-1.0.0-1-x86_64.pkg.tar.gz";
    pkg.repo = "default";
    pkg.depends = {"glibc"};
    pkg.files = {"usr/", "usr/bin/", "usr/bin/" + name};
    return pkg;
}

static const IndexMember* findMember(const std::vector<IndexMember>& members,
                                     const std::string& path)
{
    for (const auto& m : members) {
        if (m.path == path) {
            return &m;
        }
    }
    return nullptr;
}

TEST(DatabaseTest, RenderDesc)
{
    std::string expected =
        "%FILENAME%\nfoo-1.0.0-1-x86_64.pkg.tar.gz\n\n"
        "%NAME%\nfoo\n\n"
        "%VERSION%\n1.0.0-1\n\n"
        "%DESC%\nThe foo tool\n\n"
        "%CSIZE%\n1234\n\n"
        "%ISIZE%\n4096\n\n"
        "%SHA256SUM%\n" + std::string(64, 'a') + "\n\n"
        "%MD5SUM%\n" + std::string(32, 'b') + "\n\n"
        "%URL%\nhttps://example.org/foo\n\n"
        "%LICENSE%\nMIT\n\n"
        "%ARCH%\nx86_64\n\n"
        "%BUILDDATE%\n1700000000\n\n"
        "%PACKAGER%\nJane <jane@example.org>\n\n"
        "%DEPENDS%\nglibc\n\n";
    EXPECT_EQ(expected, Database::renderDesc(samplePackage("foo")));
}

TEST(DatabaseTest, RenderDescOptionalSections)
{
    PackageMetadata pkg = samplePackage("foo");
    pkg.base = std::string("foo-split");
    pkg.groups = {"tools", "devel"};
    pkg.optdepends = {"bash: completions"};
    pkg.provides = {"libfoo.so=1-64"};
    pkg.conflicts = {"foo-git"};
    pkg.replaces = {"oldfoo"};
    std::string desc = Database::renderDesc(pkg);

    EXPECT_NE(std::string::npos, desc.find("%NAME%\nfoo\n\n%BASE%\nfoo-split\n\n%VERSION%"));
    EXPECT_NE(std::string::npos, desc.find("%GROUPS%\ntools\ndevel\n\n%CSIZE%"));
    EXPECT_NE(std::string::npos,
              desc.find("%DEPENDS%\nglibc\n\n%OPTDEPENDS%\nbash: completions\n\n"
                        "%PROVIDES%\nlibfoo.so=1-64\n\n%CONFLICTS%\nfoo-git\n\n"
                        "%REPLACES%\noldfoo\n\n"));
}

TEST(DatabaseTest, EmptyFieldsEmitNoSection)
{
    PackageMetadata pkg = samplePackage("foo");
    pkg.description.clear();
    pkg.url.clear();
    pkg.packager.clear();
    pkg.licenses.clear();
    pkg.depends.clear();
    pkg.md5.clear();
    pkg.buildDate = 0;
    std::string desc = Database::renderDesc(pkg);

    EXPECT_EQ(std::string::npos, desc.find("%DESC%"));
    EXPECT_EQ(std::string::npos, desc.find("%URL%"));
    EXPECT_EQ(std::string::npos, desc.find("%PACKAGER%"));
    EXPECT_EQ(std::string::npos, desc.find("%LICENSE%"));
    EXPECT_EQ(std::string::npos, desc.find("%DEPENDS%"));
    EXPECT_EQ(std::string::npos, desc.find("%MD5SUM%"));
    EXPECT_EQ(std::string::npos, desc.find("%BUILDDATE%"));
    EXPECT_EQ(std::string::npos, desc.find("%%"));
    EXPECT_EQ(std::string::npos, desc.find("%\n\n"));
}

TEST(DatabaseTest, RenderFiles)
{
    EXPECT_EQ("%FILES%\nusr/\nusr/bin/\nusr/bin/foo\n",
              Database::renderFiles(samplePackage("foo")));
    EXPECT_EQ((std::vector<std::string>{"usr/", "usr/bin/", "usr/bin/foo"}),
              Database::parseFiles(Database::renderFiles(samplePackage("foo"))));
}

TEST(DatabaseTest, DescRoundTrip)
{
    PackageMetadata pkg = samplePackage("foo");
    pkg.version = "2:1.0-rc1";
    pkg.base = std::string("foo-base");
    pkg.groups = {"tools"};
    pkg.licenses = {"MIT", "GPL-2.0-only"};
    pkg.optdepends = {"python: scripting"};
    pkg.provides = {"foo-bin"};
    pkg.conflicts = {"foo-git"};
    pkg.replaces = {"foo-old"};

    PackageMetadata back = Database::parseDesc(Database::renderDesc(pkg));
    EXPECT_EQ(pkg.filename, back.filename);
    EXPECT_EQ(pkg.name, back.name);
    EXPECT_EQ(pkg.base, back.base);
    EXPECT_EQ(pkg.version, back.version);
    EXPECT_EQ(pkg.release, back.release);
    EXPECT_EQ(pkg.description, back.description);
    EXPECT_EQ(pkg.groups, back.groups);
    EXPECT_EQ(pkg.compressedSize, back.compressedSize);
    EXPECT_EQ(pkg.installedSize, back.installedSize);
    EXPECT_EQ(pkg.sha256, back.sha256);
    EXPECT_EQ(pkg.md5, back.md5);
    EXPECT_EQ(pkg.url, back.url);
    EXPECT_EQ(pkg.licenses, back.licenses);
    EXPECT_EQ(pkg.arch, back.arch);
    EXPECT_EQ(pkg.buildDate, back.buildDate);
    EXPECT_EQ(pkg.packager, back.packager);
    EXPECT_EQ(pkg.depends, back.depends);
    EXPECT_EQ(pkg.optdepends, back.optdepends);
    EXPECT_EQ(pkg.provides, back.provides);
    EXPECT_EQ(pkg.conflicts, back.conflicts);
    EXPECT_EQ(pkg.replaces, back.replaces);
}

TEST(DatabaseTest, ParseDescRejectsBadNumbers)
{
    try {
        Database::parseDesc("%NAME%\nfoo\n\n%CSIZE%\nlots\n\n");
        FAIL() << "non-numeric CSIZE accepted";
    } catch (const InputError& e) {
        EXPECT_EQ(InputError::Kind::CorruptArchive, e.kind());
    }
}

TEST(DatabaseTest, DescArchiveLayout)
{
    std::vector<IndexMember> members =
        Database::readArchive(Database::buildDescArchive({samplePackage("foo")}));
    ASSERT_EQ(2u, members.size());
    EXPECT_TRUE(members[0].isDirectory);
    EXPECT_EQ(0u, members[0].path.rfind("foo-1.0.0-1", 0));

    const IndexMember* desc = findMember(members, "foo-1.0.0-1/desc");
    ASSERT_NE(nullptr, desc);
    EXPECT_FALSE(desc->isDirectory);
    PackageMetadata pkg = Database::parseDesc(desc->content);
    EXPECT_EQ("foo", pkg.name);
    EXPECT_EQ("1.0.0", pkg.version);
    EXPECT_EQ("1", pkg.release);
    EXPECT_EQ("x86_64", pkg.arch);
}

TEST(DatabaseTest, FilesArchiveLayout)
{
    std::vector<IndexMember> members =
        Database::readArchive(Database::buildFilesArchive({samplePackage("foo")}));
    ASSERT_EQ(3u, members.size());
    ASSERT_NE(nullptr, findMember(members, "foo-1.0.0-1/desc"));
    const IndexMember* files = findMember(members, "foo-1.0.0-1/files");
    ASSERT_NE(nullptr, files);
    EXPECT_EQ("%FILES%\nusr/\nusr/bin/\nusr/bin/foo\n", files->content);
}

TEST(DatabaseTest, PackagesSortedByName)
{
    std::vector<IndexMember> members = Database::readArchive(
        Database::buildDescArchive({samplePackage("zeta"), samplePackage("alpha"),
                                    samplePackage("mid")}));
    std::vector<std::string> descs;
    for (const auto& m : members) {
        if (!m.isDirectory) {
            descs.push_back(m.path);
        }
    }
    EXPECT_EQ((std::vector<std::string>{"alpha-1.0.0-1/desc", "mid-1.0.0-1/desc",
                                        "zeta-1.0.0-1/desc"}),
              descs);
}

TEST(DatabaseTest, OutputIsDeterministic)
{
    std::vector<PackageMetadata> forward = {samplePackage("a"), samplePackage("b")};
    std::vector<PackageMetadata> reversed = {samplePackage("b"), samplePackage("a")};

    std::string first = Database::buildDescArchive(forward);
    EXPECT_EQ(first, Database::buildDescArchive(forward));
    EXPECT_EQ(first, Database::buildDescArchive(reversed));
    EXPECT_EQ(Database::buildFilesArchive(forward), Database::buildFilesArchive(reversed));

    // gzip magic, and no timestamp in the gzip header
    ASSERT_GT(first.size(), 10u);
    EXPECT_EQ('\x1f', first[0]);
    EXPECT_EQ('\x8b', first[1]);
    EXPECT_EQ(std::string(4, '\0'), first.substr(4, 4));
}

TEST(DatabaseTest, EmptyPackageSet)
{
    std::string bytes = Database::buildDescArchive({});
    EXPECT_FALSE(bytes.empty());
    EXPECT_TRUE(Database::readArchive(bytes).empty());
}

TEST(DatabaseTest, ReadArchiveRejectsGarbage)
{
    EXPECT_THROW(Database::readArchive("definitely not a tarball"), InputError);
}
