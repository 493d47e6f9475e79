#pragma once

#include <pinion/context.hpp>
#include <pinion/package.hpp>
#include <pinion/result.hpp>
#include <pinion/source.hpp>
#include <optional>
#include <string>
#include <vector>

namespace pinion {

constexpr const char* kLockFile = "pinion.lock";

struct LockedPackage {
    std::string name;                        // install directory name
    std::string source;                      // "<kind>+<identity>", e.g. "git+https://..."
    std::string version;                     // PinnedPackage::version()
    std::optional<std::string> subdirectory;
    std::optional<std::string> sha256;
};

struct LockFile {
    std::string root_name;
    std::string root_version;
    std::vector<LockedPackage> packages;

    // Needs project names, so packages may be fetched
    static Result<LockFile> from_pinned(const std::string& root_name,
                                        const std::string& root_version,
                                        const std::vector<PinnedPackage>& pinned,
                                        const ResolverContext& ctx);

    // Parse a pinion.lock file from disk
    static Result<LockFile> load(const std::string& path);

    // Write pinion.lock to disk (sorted, deterministic)
    Status save(const std::string& path) const;

    // Find a locked package by name (nullptr if not found)
    const LockedPackage* find(const std::string& name) const;

    // Declarations that pin exactly what is locked
    Result<std::vector<PackageDecl>> to_declarations() const;
};

} // namespace pinion
