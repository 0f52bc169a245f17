#include "error.hpp"

namespace Pkgdepot {

const char* InputError::kindName(Kind kind)
{
    switch (kind) {
        case Kind::CorruptArchive:       return "CorruptArchive";
        case Kind::MissingMetadata:      return "MissingMetadata";
        case Kind::MissingRequiredField: return "MissingRequiredField";
        case Kind::SizeMismatch:         return "SizeMismatch";
        case Kind::IncompleteUpload:     return "IncompleteUpload";
        case Kind::ChecksumMismatch:     return "ChecksumMismatch";
        case Kind::ArchMismatch:         return "ArchMismatch";
        case Kind::InvalidPath:          return "InvalidPath";
        case Kind::InvalidState:         return "InvalidState";
    }
    return "InputError";
}

IoError toIoError(const std::string& what, const std::filesystem::filesystem_error& e)
{
    return IoError(what, e.path1(), e.code());
}

} // namespace Pkgdepot
