#include <pinion/error.hpp>

namespace pinion {

const char* PinionError::code_name(Code c) {
    switch (c) {
        case IO:                        return "IO";
        case Parse:                     return "Parse";
        case Version:                   return "Version";
        case Config:                    return "Config";
        case Manifest:                  return "Manifest";
        case Network:                   return "Network";
        case NotFound:                  return "NotFound";
        case Duplicate:                 return "Duplicate";
        case InvalidArg:                return "InvalidArg";
        case SourceKindConflict:        return "SourceKindConflict";
        case VersionConflict:           return "VersionConflict";
        case PackageNotFound:           return "PackageNotFound";
        case RevisionConflict:          return "RevisionConflict";
        case DownloadFailed:            return "DownloadFailed";
        case ChecksumMismatch:          return "ChecksumMismatch";
        case InvalidArchive:            return "InvalidArchive";
        case ArchiveTooLarge:           return "ArchiveTooLarge";
        case SubdirectoryNotFound:      return "SubdirectoryNotFound";
        case MalformedPackageStructure: return "MalformedPackageStructure";
        case InstallFailed:             return "InstallFailed";
    }
    return "Unknown";
}

std::string PinionError::format() const {
    std::string result = "error[";
    result += code_name(code);
    result += "]: ";
    result += message;

    if (!hint.empty()) {
        result += "\n  hint: ";
        result += hint;
    }

    return result;
}

} // namespace pinion
