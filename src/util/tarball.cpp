#include <pinion/tarball.hpp>
#include <pinion/log.hpp>
#include <pinion/sha256.hpp>
#include <pinion/transport.hpp>

namespace fs = std::filesystem;

namespace pinion {

static const char kFileScheme[] = "file://";

// A local path, a file:// URL, or nothing when the reference is remote
static std::optional<fs::path> local_archive(const std::string& reference,
                                             const ResolverContext& ctx) {
    std::string ref = reference;
    if (ref.compare(0, sizeof(kFileScheme) - 1, kFileScheme) == 0) {
        ref = ref.substr(sizeof(kFileScheme) - 1);
    } else if (ref.find("://") != std::string::npos) {
        return std::nullopt;
    }

    std::error_code ec;
    fs::path p = ctx.resolve_path(ref);
    if (fs::is_regular_file(p, ec)) return p;
    return std::nullopt;
}

Status acquire_tarball(const TarballRequest& req, const ResolverContext& ctx,
                       StagedTarball& out) {
    if (auto local = local_archive(req.reference, ctx)) {
        log::debug("using local tarball %s", local->c_str());
        out.origin = ArchiveOrigin::Local;
        out.archive_path = *local;
        return ok_status();
    }

    if (!ctx.transport) {
        return PinionError{PinionError::InvalidArg,
            "cannot download " + req.reference + ": no transport configured"};
    }

    auto file = ctx.downloads.make_temp_file(req.label, ".tar.gz");
    if (file.is_err()) return std::move(file).error();
    out.origin = ArchiveOrigin::Remote;
    out.download = std::move(file).value();
    out.archive_path = out.download.path();

    return download_with_retry(*ctx.transport, req.reference, out.archive_path, ctx.retry);
}

Status verify_checksum(const fs::path& archive, const std::string& expected,
                       const std::string& label) {
    auto actual = SHA256::hash_file(archive);
    if (actual.is_err()) return std::move(actual).error();

    if (!SHA256::hex_equal(actual.value(), expected)) {
        return PinionError{PinionError::ChecksumMismatch,
            "Checksum mismatch for tarball " + label + ": expected " + expected +
            ", got " + actual.value(),
            "the archive changed upstream or the declared sha256 is wrong"};
    }
    log::debug("checksum ok for %s", label.c_str());
    return ok_status();
}

Result<StagedTarball> stage_tarball(const TarballRequest& req, const ResolverContext& ctx) {
    StagedTarball staged;

    PINION_TRY(acquire_tarball(req, ctx, staged));

    if (req.sha256) {
        PINION_TRY(verify_checksum(staged.archive_path, *req.sha256, req.label));
    }

    auto summary = inspect_archive(staged.archive_path);
    if (summary.is_err()) return std::move(summary).error();
    staged.summary = std::move(summary).value();

    PINION_TRY(check_archive_size(staged.summary, ctx.max_tarball_size, req.label));

    auto root = find_package_root(staged.summary, req.subdirectory, req.label);
    if (root.is_err()) return std::move(root).error();

    auto dir = ctx.downloads.make_temp_dir(req.label);
    if (dir.is_err()) return std::move(dir).error();
    staged.staging = std::move(dir).value();

    PINION_TRY(extract_archive(staged.archive_path, staged.staging.path()));
    staged.package_root = staged.staging.path() / root.value();

    // The extracted tree is all that is needed from here on
    staged.download.reset();

    log::debug("staged %s at %s", req.label.c_str(), staged.package_root.c_str());
    return Result<StagedTarball>::ok(std::move(staged));
}

Status install_staged(StagedTarball& staged, const fs::path& dest) {
    if (staged.package_root.empty()) {
        return PinionError{PinionError::InstallFailed, "nothing staged to install at " + dest.string()};
    }
    PINION_TRY(replace_path(staged.package_root, dest));
    staged.package_root.clear();
    staged.staging.reset();
    return ok_status();
}

} // namespace pinion
