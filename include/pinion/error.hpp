#pragma once

#include <string>

namespace pinion {

struct PinionError {
    enum Code {
        IO,
        Parse,
        Version,
        Config,
        Manifest,
        Network,
        NotFound,
        Duplicate,
        InvalidArg,
        SourceKindConflict,
        VersionConflict,
        PackageNotFound,
        RevisionConflict,
        DownloadFailed,
        ChecksumMismatch,
        InvalidArchive,
        ArchiveTooLarge,
        SubdirectoryNotFound,
        MalformedPackageStructure,
        InstallFailed
    };

    Code code;
    std::string message;
    std::string hint;

    PinionError() = default;
    PinionError(Code c, std::string msg)
        : code(c), message(std::move(msg)) {}
    PinionError(Code c, std::string msg, std::string h)
        : code(c), message(std::move(msg)), hint(std::move(h)) {}

    std::string format() const;
    static const char* code_name(Code c);
};

} // namespace pinion
