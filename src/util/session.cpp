#include <pinion/session.hpp>
#include <pinion/log.hpp>
#include <pinion/resolver.hpp>

namespace fs = std::filesystem;

namespace pinion {

Result<std::unique_ptr<Session>> Session::open(const fs::path& project_root) {
    std::error_code ec;
    fs::path root = fs::absolute(project_root, ec);
    if (ec) {
        return PinionError{PinionError::IO, "cannot resolve path: " + project_root.string()};
    }

    auto config = Config::load_layered(root.string());
    if (config.is_err()) return std::move(config).error();

    auto manifest = Manifest::load((root / kManifestFile).string());
    if (manifest.is_err()) return std::move(manifest).error();

    auto s = std::make_unique<Session>(Key{});
    s->config_ = std::move(config).value();
    s->manifest_ = std::move(manifest).value();
    if (s->config_.log.level) log::set_level(*s->config_.log.level);

    s->ctx_ = make_context(s->config_, root);
    s->ctx_.root_project_name = s->manifest_.package.name;

    s->transport_ = std::make_unique<DefaultTransport>(
        s->config_.network.timeout_seconds.value_or(300));
    s->ctx_.transport = s->transport_.get();
    s->ctx_.loader = &s->loader_;

    if (s->config_.registry.index) {
        auto index = TomlRegistryIndex::load(s->ctx_.resolve_path(*s->config_.registry.index).string());
        if (index.is_err()) return std::move(index).error();
        s->registry_ = std::move(index).value();
        s->ctx_.registry = &*s->registry_;
    }

    return Result<std::unique_ptr<Session>>::ok(std::move(s));
}

Result<std::unique_ptr<Session>> Session::discover(const fs::path& start_dir) {
    auto root = find_project_root(start_dir);
    if (root.is_err()) return std::move(root).error();
    log::debug("project root: %s", root.value().c_str());
    return open(root.value());
}

fs::path Session::lock_path() const {
    return ctx_.project_root / kLockFile;
}

Result<std::vector<PinnedPackage>> Session::resolve(bool use_lock) {
    std::error_code ec;
    if (use_lock && fs::exists(lock_path(), ec)) {
        auto lock = LockFile::load(lock_path().string());
        if (lock.is_err()) return std::move(lock).error();
        auto decls = lock.value().to_declarations();
        if (decls.is_err()) return std::move(decls).error();

        // The lock already lists every transitive package
        auto listing = PackageListing::from_declarations(decls.value());
        if (listing.is_err()) return std::move(listing).error();
        log::info("using %s", lock_path().c_str());
        return listing.value().resolved(ctx_);
    }

    DependencyResolver resolver(ctx_);
    return resolver.resolve(manifest_.packages);
}

Status Session::install(const std::vector<PinnedPackage>& pinned) {
    DependencyResolver resolver(ctx_);
    return resolver.install(pinned);
}

Status Session::write_lock(const std::vector<PinnedPackage>& pinned) {
    auto lock = LockFile::from_pinned(manifest_.package.name, manifest_.package.version,
                                      pinned, ctx_);
    if (lock.is_err()) return std::move(lock).error();
    return lock.value().save(lock_path().string());
}

} // namespace pinion
