#pragma once

#include <pinion/result.hpp>

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace pinion {

// What a tarball holds, gathered by reading headers only
struct ArchiveSummary {
    uint64_t total_size = 0;                // sum of uncompressed member sizes
    size_t entry_count = 0;
    std::vector<std::string> top_level_dirs;  // sorted, unique
};

// Reads every header of a compressed tar archive (gzip, bzip2, xz, zstd).
// Uncompressed tars, other formats, corrupt data and member paths that are
// absolute or contain ".." fail with InvalidArchive.
Result<ArchiveSummary> inspect_archive(const std::filesystem::path& archive);

// ArchiveTooLarge when the uncompressed size exceeds `limit`
Status check_archive_size(const ArchiveSummary& summary, uint64_t limit,
                          const std::string& label);

// Picks the directory inside the archive that becomes the installed package.
// With a subdirectory it must be one of the top-level directories; without
// one there must be exactly one top-level directory.
Result<std::string> find_package_root(const ArchiveSummary& summary,
                                      const std::optional<std::string>& subdirectory,
                                      const std::string& label);

// Extracts everything under the existing directory `dest`, refusing
// absolute paths, ".." and writes through symlinks
Status extract_archive(const std::filesystem::path& archive,
                       const std::filesystem::path& dest);

} // namespace pinion
