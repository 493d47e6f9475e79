#pragma once

#include <pinion/result.hpp>
#include <optional>
#include <string>
#include <vector>

namespace pinion {

struct LocalSource {
    std::string path;  // relative paths are taken from the project root
};

struct GitSource {
    std::string url;
    std::vector<std::string> revisions;      // "revision" (string or list)
    std::optional<bool> warn_unpinned;       // default true
    std::optional<std::string> subdirectory;
};

struct TarballSource {
    std::string url;                          // URL or local path
    std::optional<std::string> name;          // install name fallback
    std::optional<std::string> sha256;
    std::optional<std::string> subdirectory;
};

struct RegistrySource {
    std::string package;                      // "org/name"
    std::vector<std::string> versions;        // raw constraint strings
    bool install_prerelease = false;
};

// One entry of a project's `packages` list, as written
struct PackageDecl {
    // Exactly one of these source types
    std::optional<LocalSource> local;
    std::optional<GitSource> git;
    std::optional<TarballSource> tarball;
    std::optional<RegistrySource> registry;

    Status validate() const;

    // Short description for diagnostics: the source key and its value
    std::string describe() const;

    bool operator==(const PackageDecl& o) const;
    bool operator!=(const PackageDecl& o) const { return !(*this == o); }
};

} // namespace pinion
