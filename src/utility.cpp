#include "ism/utility.hpp"

namespace imagesmith {

std::string_view to_string(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::DuplicateName:
        return "DuplicateName";
    case ErrorKind::UnknownUnit:
        return "UnknownUnit";
    case ErrorKind::DanglingReference:
        return "DanglingReference";
    case ErrorKind::CyclicDependency:
        return "CyclicDependency";
    case ErrorKind::ConflictingBase:
        return "ConflictingBase";
    case ErrorKind::MissingBase:
        return "MissingBase";
    case ErrorKind::UnreadableFile:
        return "UnreadableFile";
    case ErrorKind::BuildError:
        return "BuildError";
    case ErrorKind::Timeout:
        return "Timeout";
    case ErrorKind::IOError:
        return "IOError";
    case ErrorKind::ManifestError:
        return "ManifestError";
    case ErrorKind::InvalidArgument:
        return "InvalidArgument";
    }
    return "Unknown";
}

bool Error::structural() const {
    switch (kind) {
    case ErrorKind::DuplicateName:
    case ErrorKind::UnknownUnit:
    case ErrorKind::DanglingReference:
    case ErrorKind::CyclicDependency:
    case ErrorKind::ConflictingBase:
    case ErrorKind::MissingBase:
    case ErrorKind::ManifestError:
        return true;
    default:
        return false;
    }
}

} // namespace imagesmith
