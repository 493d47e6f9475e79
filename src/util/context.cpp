#include <pinion/context.hpp>

namespace fs = std::filesystem;

namespace pinion {

fs::path ResolverContext::resolve_path(const std::string& p) const {
    fs::path path(p);
    if (path.is_relative()) path = project_root / path;
    return path.lexically_normal();
}

ResolverContext make_context(const Config& config, const fs::path& project_root) {
    ResolverContext ctx;
    ctx.project_root = project_root;
    ctx.install_root = ctx.resolve_path(config.install.path.value_or(kDefaultInstallDir));
    if (config.install.downloads) {
        ctx.downloads = DownloadArea(ctx.resolve_path(*config.install.downloads));
    }

    const auto& net = config.network;
    if (net.attempts) ctx.retry.max_attempts = *net.attempts;
    if (net.backoff_ms) ctx.retry.initial_backoff = std::chrono::milliseconds(*net.backoff_ms);
    if (net.max_backoff_ms) ctx.retry.max_backoff = std::chrono::milliseconds(*net.max_backoff_ms);

    if (config.tarball.max_size) ctx.max_tarball_size = *config.tarball.max_size;
    return ctx;
}

} // namespace pinion
