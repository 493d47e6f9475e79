#include <pinion/archive.hpp>
#include <pinion/log.hpp>
#include <pinion/version.hpp>

#include <archive.h>
#include <archive_entry.h>

#include <algorithm>
#include <set>

namespace fs = std::filesystem;

namespace pinion {

namespace {

constexpr size_t kBlockSize = 10240;

struct ArchiveReader {
    ArchiveReader() : handle(archive_read_new()) {
        if (handle) {
            archive_read_support_filter_all(handle);
            archive_read_support_format_tar(handle);
            archive_read_support_format_gnutar(handle);
        }
    }
    ~ArchiveReader() {
        if (handle) {
            archive_read_close(handle);
            archive_read_free(handle);
        }
    }
    ArchiveReader(const ArchiveReader&) = delete;
    ArchiveReader& operator=(const ArchiveReader&) = delete;

    struct archive* handle;
};

struct DiskWriter {
    DiskWriter() : handle(archive_write_disk_new()) {
        if (handle) {
            archive_write_disk_set_options(handle,
                ARCHIVE_EXTRACT_TIME | ARCHIVE_EXTRACT_PERM |
                ARCHIVE_EXTRACT_SECURE_NODOTDOT |
                ARCHIVE_EXTRACT_SECURE_SYMLINKS);
            archive_write_disk_set_standard_lookup(handle);
        }
    }
    ~DiskWriter() {
        if (handle) {
            archive_write_close(handle);
            archive_write_free(handle);
        }
    }
    DiskWriter(const DiskWriter&) = delete;
    DiskWriter& operator=(const DiskWriter&) = delete;

    struct archive* handle;
};

std::string archive_message(struct archive* a) {
    const char* s = archive_error_string(a);
    return s ? s : "unknown libarchive error";
}

PinionError invalid(const fs::path& path, const std::string& why) {
    return PinionError{PinionError::InvalidArchive,
        path.string() + " is not a valid compressed tar archive: " + why};
}

// Opens the archive and insists on a compression filter over the tar data
Status open_compressed(ArchiveReader& reader, const fs::path& path) {
    if (!reader.handle) {
        return PinionError{PinionError::IO, "archive_read_new failed"};
    }
    if (archive_read_open_filename(reader.handle, path.c_str(), kBlockSize) != ARCHIVE_OK) {
        return invalid(path, archive_message(reader.handle));
    }
    if (archive_filter_code(reader.handle, 0) == ARCHIVE_FILTER_NONE) {
        return invalid(path, "archive is not compressed");
    }
    return ok_status();
}

// "./a/b" -> "a/b"; empty for the archive root itself
std::string normalize_member(std::string name) {
    while (name.compare(0, 2, "./") == 0) name.erase(0, 2);
    if (name == ".") name.clear();
    while (!name.empty() && name.back() == '/') name.pop_back();
    return name;
}

bool is_unsafe_member(const std::string& name) {
    if (!name.empty() && name.front() == '/') return true;
    size_t start = 0;
    while (start <= name.size()) {
        size_t end = name.find('/', start);
        if (end == std::string::npos) end = name.size();
        if (name.compare(start, end - start, "..") == 0 && end - start == 2) return true;
        start = end + 1;
    }
    return false;
}

} // namespace

Result<ArchiveSummary> inspect_archive(const fs::path& path) {
    ArchiveReader reader;
    PINION_TRY(open_compressed(reader, path));

    ArchiveSummary summary;
    std::set<std::string> dirs;
    struct archive_entry* entry = nullptr;

    for (;;) {
        int r = archive_read_next_header(reader.handle, &entry);
        if (r == ARCHIVE_EOF) break;
        if (r == ARCHIVE_WARN) {
            log::debug("%s: %s", path.c_str(), archive_message(reader.handle).c_str());
        } else if (r != ARCHIVE_OK) {
            return invalid(path, archive_message(reader.handle));
        }

        const char* raw = archive_entry_pathname(entry);
        if (!raw) return invalid(path, "member without a path");
        std::string name = normalize_member(raw);
        if (is_unsafe_member(name)) {
            return invalid(path, "unsafe member path '" + std::string(raw) + "'");
        }

        ++summary.entry_count;
        if (archive_entry_size_is_set(entry) && archive_entry_size(entry) > 0) {
            summary.total_size += static_cast<uint64_t>(archive_entry_size(entry));
        }

        if (name.empty()) continue;
        auto slash = name.find('/');
        if (slash != std::string::npos) {
            dirs.insert(name.substr(0, slash));
        } else if (archive_entry_filetype(entry) == AE_IFDIR) {
            dirs.insert(name);
        }

        // Corrupt compressed data only shows up while reading member bodies
        if (archive_read_data_skip(reader.handle) != ARCHIVE_OK) {
            return invalid(path, archive_message(reader.handle));
        }
    }

    summary.top_level_dirs.assign(dirs.begin(), dirs.end());
    return Result<ArchiveSummary>::ok(std::move(summary));
}

Status check_archive_size(const ArchiveSummary& summary, uint64_t limit,
                          const std::string& label) {
    if (summary.total_size > limit) {
        return PinionError{PinionError::ArchiveTooLarge,
            "Tarball " + label + " is too large: " +
            std::to_string(summary.total_size) + " bytes uncompressed exceeds the limit of " +
            std::to_string(limit) + " bytes",
            "raise [tarball] max-size in pinion.config.toml if this package is trusted"};
    }
    return ok_status();
}

Result<std::string> find_package_root(const ArchiveSummary& summary,
                                      const std::optional<std::string>& subdirectory,
                                      const std::string& label) {
    const auto& dirs = summary.top_level_dirs;
    if (subdirectory) {
        std::string wanted = normalize_member(*subdirectory);
        if (std::find(dirs.begin(), dirs.end(), wanted) == dirs.end()) {
            return PinionError{PinionError::SubdirectoryNotFound,
                "Subdirectory '" + *subdirectory + "' not found in tarball " + label +
                "; top-level directories: " + quote_list(dirs)};
        }
        return Result<std::string>::ok(std::move(wanted));
    }

    if (dirs.size() != 1) {
        return PinionError{PinionError::MalformedPackageStructure,
            "Tarball " + label + " must contain exactly one top-level directory, found " +
            std::to_string(dirs.size()) + ": " + quote_list(dirs),
            "declare `subdirectory` to pick one"};
    }
    return Result<std::string>::ok(dirs.front());
}

Status extract_archive(const fs::path& path, const fs::path& dest) {
    ArchiveReader reader;
    PINION_TRY(open_compressed(reader, path));
    DiskWriter writer;
    if (!writer.handle) {
        return PinionError{PinionError::IO, "archive_write_disk_new failed"};
    }

    // Member paths are checked here and then rooted at `root`, so the
    // writer sees absolute paths; the root itself must not contain symlinks.
    std::error_code ec;
    fs::path root = fs::canonical(dest, ec);
    if (ec) {
        return PinionError{PinionError::IO,
            "cannot resolve extraction directory " + dest.string() + ": " + ec.message()};
    }

    struct archive_entry* entry = nullptr;
    for (;;) {
        int r = archive_read_next_header(reader.handle, &entry);
        if (r == ARCHIVE_EOF) break;
        if (r != ARCHIVE_OK && r != ARCHIVE_WARN) {
            return invalid(path, archive_message(reader.handle));
        }

        const char* raw = archive_entry_pathname(entry);
        if (!raw) return invalid(path, "member without a path");
        std::string name = normalize_member(raw);
        if (is_unsafe_member(name)) {
            return invalid(path, "unsafe member path '" + name + "'");
        }
        fs::path target = name.empty() ? root : root / name;
        archive_entry_set_pathname(entry, target.c_str());

        // Hardlink targets are archive-relative as well
        if (const char* link = archive_entry_hardlink(entry)) {
            std::string link_name = normalize_member(link);
            if (is_unsafe_member(link_name)) {
                return invalid(path, "unsafe hardlink target '" + link_name + "'");
            }
            archive_entry_set_hardlink(entry, (root / link_name).c_str());
        }

        if (archive_write_header(writer.handle, entry) < ARCHIVE_WARN) {
            return PinionError{PinionError::InvalidArchive,
                "cannot extract '" + name + "' from " + path.string() + ": " +
                archive_message(writer.handle)};
        }

        if (archive_entry_size(entry) > 0) {
            const void* buf = nullptr;
            size_t size = 0;
            la_int64_t offset = 0;
            for (;;) {
                int dr = archive_read_data_block(reader.handle, &buf, &size, &offset);
                if (dr == ARCHIVE_EOF) break;
                if (dr < ARCHIVE_WARN) {
                    return invalid(path, archive_message(reader.handle));
                }
                if (archive_write_data_block(writer.handle, buf, size, offset) < ARCHIVE_WARN) {
                    return PinionError{PinionError::IO,
                        "cannot write '" + name + "': " + archive_message(writer.handle)};
                }
            }
        }

        if (archive_write_finish_entry(writer.handle) < ARCHIVE_WARN) {
            return PinionError{PinionError::IO,
                "cannot finish '" + name + "': " + archive_message(writer.handle)};
        }
    }
    return ok_status();
}

} // namespace pinion
