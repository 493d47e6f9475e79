#pragma once

#include <pinion/result.hpp>

#include <filesystem>
#include <string>

namespace pinion {

// Owns a file or directory and removes it (recursively) when destroyed,
// unless release() was called first.
class ScopedPath {
public:
    ScopedPath() = default;
    explicit ScopedPath(std::filesystem::path path) : path_(std::move(path)) {}
    ~ScopedPath();

    ScopedPath(ScopedPath&& other) noexcept;
    ScopedPath& operator=(ScopedPath&& other) noexcept;
    ScopedPath(const ScopedPath&) = delete;
    ScopedPath& operator=(const ScopedPath&) = delete;

    const std::filesystem::path& path() const { return path_; }
    bool empty() const { return path_.empty(); }

    // Stop owning the path and hand it back
    std::filesystem::path release();

    // Remove the owned path now
    void reset();

private:
    std::filesystem::path path_;
};

// Managed directory for downloaded archives and staged extractions.
//
// Layout:
//   <root>/pinion-<label>-<random>.tar.gz   private download target
//   <root>/pinion-<label>-<random>/         private staging directory
class DownloadArea {
public:
    DownloadArea() : root_(default_root()) {}
    explicit DownloadArea(std::filesystem::path root) : root_(std::move(root)) {}

    // $PINION_DOWNLOADS_DIR, else <system temp>/pinion-downloads
    static std::filesystem::path default_root();

    const std::filesystem::path& root() const { return root_; }

    Status ensure() const;

    // Exclusively created, empty, owner-only file
    Result<ScopedPath> make_temp_file(const std::string& label,
                                      const std::string& suffix) const;

    // Exclusively created empty directory
    Result<ScopedPath> make_temp_dir(const std::string& label) const;

private:
    std::filesystem::path root_;
};

// 16 random lowercase hex characters
std::string random_suffix();

// Maps a package identity onto something usable inside a file name
std::string sanitize_label(const std::string& label);

Status copy_tree(const std::filesystem::path& from,
                 const std::filesystem::path& to);

// Moves `staged` (a directory or symlink) to `dest`, replacing whatever is
// there. The previous `dest` is renamed aside first and put back if the
// move fails, so a failed install leaves the prior one in place. Falls
// back to copy+delete when `staged` lives on another filesystem.
Status replace_path(const std::filesystem::path& staged,
                    const std::filesystem::path& dest);

} // namespace pinion
