#ifndef PKGINFO_HPP
#define PKGINFO_HPP

#include "package.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace Pkgdepot {

/**
 * @class PkgInfo
 * @brief Typed view of a package's .PKGINFO record.
 *
 * .PKGINFO is a list of "key = value" lines. Scalar keys overwrite earlier
 * values, list keys (license, group, depend, optdepend, provides, conflict,
 * replaces) append in the order they appear. Unknown keys are ignored so
 * records written by newer packaging tools still parse.
 */
class PkgInfo
{
public:
    std::optional<std::string> name;
    std::optional<std::string> base;
    std::optional<std::string> version;
    std::optional<std::string> release;
    std::optional<std::string> arch;
    std::optional<std::string> description;
    std::optional<std::string> url;
    std::optional<std::string> packager;
    std::optional<std::int64_t> buildDate;
    std::optional<std::uint64_t> size;
    std::vector<std::string> licenses;
    std::vector<std::string> groups;
    std::vector<std::string> depends;
    std::vector<std::string> optdepends;
    std::vector<std::string> provides;
    std::vector<std::string> conflicts;
    std::vector<std::string> replaces;

    /**
     * @brief Parses the text of a .PKGINFO entry.
     *
     * Comment lines ('#') and blank lines are skipped. "pkgver" is split at its
     * last '-' into version and release. Never throws for unknown or malformed
     * lines; a malformed numeric value is ignored with a warning.
     *
     * @param content The full text of the entry.
     * @return The parsed record; required fields may still be missing.
     */
    static PkgInfo parse(const std::string& content);

    /**
     * @brief Names of the required fields (pkgname, pkgver, pkgrel, arch)
     *        this record lacks, in that order.
     */
    std::vector<std::string> missingRequiredFields() const;

    /**
     * @brief Copies the record into a PackageMetadata.
     *
     * @throws InputError (MissingRequiredField) if a required field is absent.
     */
    PackageMetadata toMetadata() const;
};

} // namespace Pkgdepot

#endif // PKGINFO_HPP
