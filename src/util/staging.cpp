#include <pinion/staging.hpp>
#include <pinion/log.hpp>

#include <cerrno>
#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <random>
#include <system_error>

#include <fcntl.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace pinion {

// ---- ScopedPath ----

ScopedPath::~ScopedPath() {
    reset();
}

ScopedPath::ScopedPath(ScopedPath&& other) noexcept
    : path_(std::move(other.path_)) {
    other.path_.clear();
}

ScopedPath& ScopedPath::operator=(ScopedPath&& other) noexcept {
    if (this != &other) {
        reset();
        path_ = std::move(other.path_);
        other.path_.clear();
    }
    return *this;
}

fs::path ScopedPath::release() {
    fs::path out = std::move(path_);
    path_.clear();
    return out;
}

void ScopedPath::reset() {
    if (path_.empty()) return;
    std::error_code ec;
    fs::remove_all(path_, ec);
    if (ec) {
        log::debug("could not remove %s: %s", path_.c_str(), ec.message().c_str());
    }
    path_.clear();
}

// ---- random names ----

static void fill_random_bytes(uint8_t* buf, size_t len) {
    std::ifstream urandom("/dev/urandom", std::ios::binary);
    if (urandom.is_open()) {
        urandom.read(reinterpret_cast<char*>(buf), static_cast<std::streamsize>(len));
        if (static_cast<size_t>(urandom.gcount()) == len) return;
    }
    std::random_device rd;
    std::mt19937_64 gen(rd());
    std::uniform_int_distribution<unsigned> dist(0, 255);
    for (size_t i = 0; i < len; ++i) {
        buf[i] = static_cast<uint8_t>(dist(gen));
    }
}

std::string random_suffix() {
    static const char hex_chars[] = "0123456789abcdef";
    uint8_t bytes[8];
    fill_random_bytes(bytes, sizeof(bytes));
    std::string out;
    out.reserve(16);
    for (uint8_t b : bytes) {
        out += hex_chars[b >> 4];
        out += hex_chars[b & 0x0F];
    }
    return out;
}

std::string sanitize_label(const std::string& label) {
    std::string out;
    for (char c : label) {
        bool keep = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
                    (c >= '0' && c <= '9') || c == '-' || c == '_' || c == '.';
        out += keep ? c : '_';
    }
    if (out.size() > 48) out = out.substr(out.size() - 48);
    if (out.empty()) out = "pkg";
    return out;
}

// ---- DownloadArea ----

fs::path DownloadArea::default_root() {
    if (const char* env = std::getenv("PINION_DOWNLOADS_DIR")) {
        if (*env) return fs::path(env);
    }
    std::error_code ec;
    fs::path tmp = fs::temp_directory_path(ec);
    if (ec) tmp = "/tmp";
    return tmp / "pinion-downloads";
}

Status DownloadArea::ensure() const {
    std::error_code ec;
    fs::create_directories(root_, ec);
    if (ec) {
        return PinionError{PinionError::IO,
            "cannot create download directory " + root_.string() + ": " + ec.message()};
    }
    return ok_status();
}

Result<ScopedPath> DownloadArea::make_temp_file(const std::string& label,
                                                const std::string& suffix) const {
    PINION_TRY(ensure());
    // A collision only happens on a repeated random suffix; try a few times
    for (int i = 0; i < 8; ++i) {
        fs::path p = root_ / ("pinion-" + sanitize_label(label) + "-" +
                              random_suffix() + suffix);
        int fd = ::open(p.c_str(), O_WRONLY | O_CREAT | O_EXCL, 0600);
        if (fd >= 0) {
            ::close(fd);
            return Result<ScopedPath>::ok(ScopedPath(p));
        }
        if (errno != EEXIST) {
            return PinionError{PinionError::IO,
                "cannot create temporary file " + p.string() + ": " +
                std::error_code(errno, std::generic_category()).message()};
        }
    }
    return PinionError{PinionError::IO,
        "cannot create a unique temporary file in " + root_.string()};
}

Result<ScopedPath> DownloadArea::make_temp_dir(const std::string& label) const {
    PINION_TRY(ensure());
    for (int i = 0; i < 8; ++i) {
        fs::path p = root_ / ("pinion-" + sanitize_label(label) + "-" + random_suffix());
        std::error_code ec;
        if (fs::create_directory(p, ec)) {
            return Result<ScopedPath>::ok(ScopedPath(p));
        }
        if (ec) {
            return PinionError{PinionError::IO,
                "cannot create temporary directory " + p.string() + ": " + ec.message()};
        }
    }
    return PinionError{PinionError::IO,
        "cannot create a unique temporary directory in " + root_.string()};
}

// ---- tree operations ----

Status copy_tree(const fs::path& from, const fs::path& to) {
    std::error_code ec;
    fs::copy(from, to,
             fs::copy_options::recursive | fs::copy_options::copy_symlinks, ec);
    if (ec) {
        return PinionError{PinionError::InstallFailed,
            "cannot copy " + from.string() + " to " + to.string() + ": " + ec.message()};
    }
    return ok_status();
}

static Status move_path(const fs::path& from, const fs::path& to) {
    std::error_code ec;
    fs::rename(from, to, ec);
    if (!ec) return ok_status();
    if (ec != std::errc::cross_device_link) {
        return PinionError{PinionError::InstallFailed,
            "cannot move " + from.string() + " to " + to.string() + ": " + ec.message()};
    }

    log::debug("%s is on another filesystem, copying", from.c_str());
    auto copied = copy_tree(from, to);
    if (copied.is_err()) {
        fs::remove_all(to, ec);
        return copied;
    }
    fs::remove_all(from, ec);
    return ok_status();
}

Status replace_path(const fs::path& staged, const fs::path& dest) {
    std::error_code ec;
    fs::create_directories(dest.parent_path(), ec);
    if (ec) {
        return PinionError{PinionError::InstallFailed,
            "cannot create " + dest.parent_path().string() + ": " + ec.message()};
    }

    fs::path backup;
    if (fs::symlink_status(dest, ec).type() != fs::file_type::not_found) {
        backup = dest.parent_path() /
                 ("." + dest.filename().string() + ".old-" + random_suffix());
        fs::rename(dest, backup, ec);
        if (ec) {
            return PinionError{PinionError::InstallFailed,
                "cannot move aside existing install " + dest.string() + ": " + ec.message()};
        }
    }

    auto moved = move_path(staged, dest);
    if (moved.is_err()) {
        if (!backup.empty()) {
            std::error_code restore_ec;
            fs::rename(backup, dest, restore_ec);
            if (restore_ec) {
                log::error("could not restore %s from %s: %s", dest.c_str(),
                           backup.c_str(), restore_ec.message().c_str());
            }
        }
        return moved;
    }

    if (!backup.empty()) {
        // remove_all does not follow a symlinked previous install
        fs::remove_all(backup, ec);
        if (ec) {
            log::warn("could not remove previous install %s: %s",
                      backup.c_str(), ec.message().c_str());
        }
    }
    return ok_status();
}

} // namespace pinion
