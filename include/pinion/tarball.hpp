#pragma once

#include <pinion/archive.hpp>
#include <pinion/context.hpp>
#include <pinion/result.hpp>
#include <pinion/staging.hpp>

#include <filesystem>
#include <optional>
#include <string>

namespace pinion {

enum class ArchiveOrigin { Local, Remote };

struct TarballRequest {
    std::string reference;                   // URL or filesystem path
    std::string label;                       // used in messages and temp names
    std::optional<std::string> sha256;
    std::optional<std::string> subdirectory;
};

// A validated archive extracted into a private directory
struct StagedTarball {
    ArchiveOrigin origin = ArchiveOrigin::Remote;
    std::filesystem::path archive_path;
    ScopedPath download;                     // only for remote archives
    ScopedPath staging;
    std::filesystem::path package_root;      // inside staging
    ArchiveSummary summary;
};

// Step 1: an existing local file is used in place, anything else is
// downloaded into a private file under the download area
Status acquire_tarball(const TarballRequest& req, const ResolverContext& ctx,
                       StagedTarball& out);

// Step 2: ChecksumMismatch when the SHA-256 of `archive` differs from
// `expected` (compared case-insensitively)
Status verify_checksum(const std::filesystem::path& archive,
                       const std::string& expected, const std::string& label);

// Steps 1 to 6: acquire, checksum, format, size, root discovery, extract
Result<StagedTarball> stage_tarball(const TarballRequest& req,
                                    const ResolverContext& ctx);

// Step 7: moves the package root to `dest`, replacing a prior install
Status install_staged(StagedTarball& staged, const std::filesystem::path& dest);

} // namespace pinion
