#include <pinion/package.hpp>
#include <pinion/log.hpp>
#include <pinion/manifest.hpp>
#include <pinion/name.hpp>
#include <pinion/registry.hpp>
#include <pinion/transport.hpp>

#include <algorithm>
#include <cctype>
#include <tuple>

namespace fs = std::filesystem;

namespace pinion {

const char* source_kind_name(SourceKind kind) {
    switch (kind) {
        case SourceKind::Local:   return "local";
        case SourceKind::Git:     return "git";
        case SourceKind::Tarball: return "tarball";
        case SourceKind::Hub:     return "hub";
    }
    return "unknown";
}

// Variant alternatives are declared in SourceKind order
static SourceKind kind_of_index(size_t index) {
    return static_cast<SourceKind>(index);
}

static std::string lowercase(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

// ---------------------------------------------------------------------------
// UnpinnedPackage
// ---------------------------------------------------------------------------

Result<UnpinnedPackage> UnpinnedPackage::from_declaration(const PackageDecl& decl) {
    PINION_TRY(decl.validate());

    if (decl.local) {
        return Result<UnpinnedPackage>::ok(UnpinnedPackage(LocalUnpinned{decl.local->path}));
    }
    if (decl.git) {
        GitUnpinned g;
        g.url = decl.git->url;
        g.revisions = decl.git->revisions;
        g.warn_unpinned = decl.git->warn_unpinned.value_or(true);
        g.subdirectory = decl.git->subdirectory;
        return Result<UnpinnedPackage>::ok(UnpinnedPackage(std::move(g)));
    }
    if (decl.tarball) {
        TarballUnpinned t;
        t.url = decl.tarball->url;
        t.name = decl.tarball->name;
        if (decl.tarball->sha256) t.sha256 = lowercase(*decl.tarball->sha256);
        t.subdirectory = decl.tarball->subdirectory;
        return Result<UnpinnedPackage>::ok(UnpinnedPackage(std::move(t)));
    }

    auto set = ConstraintSet::parse(decl.registry->versions, decl.registry->install_prerelease);
    if (set.is_err()) return std::move(set).error();
    return Result<UnpinnedPackage>::ok(
        UnpinnedPackage(RegistryUnpinned{decl.registry->package, std::move(set).value()}));
}

SourceKind UnpinnedPackage::source_kind() const {
    return kind_of_index(spec_.index());
}

std::string UnpinnedPackage::identity() const {
    switch (source_kind()) {
        case SourceKind::Local:
            return as<LocalUnpinned>().path;
        case SourceKind::Git:
            return as<GitUnpinned>().url;
        case SourceKind::Tarball: {
            const auto& t = as<TarballUnpinned>();
            return t.subdirectory ? t.url + "#" + *t.subdirectory : t.url;
        }
        case SourceKind::Hub:
            return as<RegistryUnpinned>().package;
    }
    return "";
}

Result<UnpinnedPackage> UnpinnedPackage::incorporate(const UnpinnedPackage& other) const {
    if (source_kind() != other.source_kind()) {
        return PinionError{PinionError::SourceKindConflict,
            "Cannot incorporate " + other.identity() + " (" +
            source_kind_name(other.source_kind()) + ") in " + identity() + " (" +
            source_kind_name(source_kind()) + "): mismatched types"};
    }

    switch (source_kind()) {
        case SourceKind::Local:
            return Result<UnpinnedPackage>::ok(other);

        case SourceKind::Git: {
            GitUnpinned merged = as<GitUnpinned>();
            const auto& o = other.as<GitUnpinned>();
            merged.revisions.insert(merged.revisions.end(),
                                    o.revisions.begin(), o.revisions.end());
            merged.warn_unpinned = merged.warn_unpinned && o.warn_unpinned;
            if (!merged.subdirectory) merged.subdirectory = o.subdirectory;
            return Result<UnpinnedPackage>::ok(UnpinnedPackage(std::move(merged)));
        }

        case SourceKind::Tarball: {
            TarballUnpinned merged = as<TarballUnpinned>();
            const auto& o = other.as<TarballUnpinned>();
            if (merged.sha256 && o.sha256 && *merged.sha256 != *o.sha256) {
                return PinionError{PinionError::InvalidArg,
                    "Conflicting checksums declared for tarball " + identity() +
                    ": " + *merged.sha256 + " and " + *o.sha256};
            }
            if (!merged.sha256) merged.sha256 = o.sha256;
            if (!merged.name) merged.name = o.name;
            return Result<UnpinnedPackage>::ok(UnpinnedPackage(std::move(merged)));
        }

        case SourceKind::Hub: {
            RegistryUnpinned merged = as<RegistryUnpinned>();
            merged.versions = ConstraintSet::merge(merged.versions,
                                                   other.as<RegistryUnpinned>().versions);
            return Result<UnpinnedPackage>::ok(UnpinnedPackage(std::move(merged)));
        }
    }
    return PinionError{PinionError::InvalidArg, "unknown package kind"};
}

static Result<PinnedPackage> resolve_git(const GitUnpinned& g) {
    std::vector<std::string> distinct;
    for (const auto& rev : g.revisions) {
        if (rev.empty()) continue;
        if (std::find(distinct.begin(), distinct.end(), rev) == distinct.end()) {
            distinct.push_back(rev);
        }
    }
    if (distinct.size() > 1) {
        return PinionError{PinionError::RevisionConflict,
            "git dependencies should contain exactly one version. " + g.url +
            " contains: " + quote_list(distinct)};
    }

    GitPinned pinned;
    pinned.url = g.url;
    pinned.revision = distinct.empty() ? "HEAD" : distinct.front();
    pinned.warn_unpinned = g.warn_unpinned;
    pinned.subdirectory = g.subdirectory;
    return Result<PinnedPackage>::ok(PinnedPackage(std::move(pinned)));
}

static Result<PinnedPackage> resolve_registry(const RegistryUnpinned& r,
                                              const ResolverContext& ctx) {
    if (!ctx.registry) {
        return PinionError{PinionError::InvalidArg,
            "package " + r.package + " needs a registry index but none is configured",
            "set [registry] index in pinion.config.toml"};
    }

    auto not_found = [&r] {
        return PinionError{PinionError::PackageNotFound,
            "Package " + r.package + " was not found in the package index"};
    };

    auto names = ctx.registry->list_package_names();
    if (names.is_err()) return not_found();
    const auto& all = names.value();
    if (std::find(all.begin(), all.end(), r.package) == all.end()) return not_found();

    auto available = ctx.registry->list_versions(r.package);
    if (available.is_err()) return not_found();

    auto prefix_error = [&r](PinionError e) {
        e.message = "Version error for package " + r.package + ": " + e.message;
        return e;
    };
    auto version = resolve_version(r.versions, available.value(), r.versions.allow_prerelease)
                       .map_err(prefix_error);
    if (version.is_err()) return std::move(version).error();

    auto latest = latest_version(r.versions, available.value(), r.versions.allow_prerelease);

    RegistryPinned pinned;
    pinned.package = r.package;
    pinned.version = version.value();
    pinned.version_latest = latest.is_ok() ? latest.value() : version.value();
    return Result<PinnedPackage>::ok(PinnedPackage(std::move(pinned)));
}

Result<PinnedPackage> UnpinnedPackage::resolved(const ResolverContext& ctx) const {
    switch (source_kind()) {
        case SourceKind::Local:
            return Result<PinnedPackage>::ok(PinnedPackage(LocalPinned{as<LocalUnpinned>().path}));
        case SourceKind::Git:
            return resolve_git(as<GitUnpinned>());
        case SourceKind::Tarball: {
            const auto& t = as<TarballUnpinned>();
            return Result<PinnedPackage>::ok(
                PinnedPackage(TarballPinned{t.url, t.name, t.sha256, t.subdirectory}));
        }
        case SourceKind::Hub:
            return resolve_registry(as<RegistryUnpinned>(), ctx);
    }
    return PinionError{PinionError::InvalidArg, "unknown package kind"};
}

// ---------------------------------------------------------------------------
// PinnedPackage
// ---------------------------------------------------------------------------

PinnedPackage::PinnedPackage(Spec spec)
    : spec_(std::move(spec)), state_(std::make_shared<FetchState>()) {}

SourceKind PinnedPackage::source_kind() const {
    return kind_of_index(spec_.index());
}

std::string PinnedPackage::name() const {
    switch (source_kind()) {
        case SourceKind::Local:   return as<LocalPinned>().path;
        case SourceKind::Git:     return as<GitPinned>().url;
        case SourceKind::Tarball: {
            const auto& t = as<TarballPinned>();
            return t.name.value_or(t.url);
        }
        case SourceKind::Hub:     return as<RegistryPinned>().package;
    }
    return "";
}

std::string PinnedPackage::version() const {
    switch (source_kind()) {
        case SourceKind::Local:   return as<LocalPinned>().path;
        case SourceKind::Git:     return as<GitPinned>().revision;
        case SourceKind::Tarball: return as<TarballPinned>().url;
        case SourceKind::Hub:     return as<RegistryPinned>().version;
    }
    return "";
}

std::optional<std::string> PinnedPackage::version_latest() const {
    if (source_kind() != SourceKind::Hub) return std::nullopt;
    return as<RegistryPinned>().version_latest;
}

std::string PinnedPackage::to_string() const {
    switch (source_kind()) {
        case SourceKind::Local:
            return "local " + as<LocalPinned>().path;
        case SourceKind::Git: {
            const auto& g = as<GitPinned>();
            std::string s = "git " + g.url + "@" + g.revision;
            if (g.subdirectory) s += " (" + *g.subdirectory + ")";
            return s;
        }
        case SourceKind::Tarball: {
            const auto& t = as<TarballPinned>();
            std::string s = "tarball " + t.url;
            if (t.subdirectory) s += "#" + *t.subdirectory;
            return s;
        }
        case SourceKind::Hub: {
            const auto& r = as<RegistryPinned>();
            return r.package + "@" + r.version;
        }
    }
    return "";
}

bool PinnedPackage::operator==(const PinnedPackage& o) const {
    if (source_kind() != o.source_kind()) return false;
    switch (source_kind()) {
        case SourceKind::Local:
            return as<LocalPinned>().path == o.as<LocalPinned>().path;
        case SourceKind::Git: {
            const auto& a = as<GitPinned>();
            const auto& b = o.as<GitPinned>();
            return std::tie(a.url, a.revision, a.warn_unpinned, a.subdirectory) ==
                   std::tie(b.url, b.revision, b.warn_unpinned, b.subdirectory);
        }
        case SourceKind::Tarball: {
            const auto& a = as<TarballPinned>();
            const auto& b = o.as<TarballPinned>();
            return std::tie(a.url, a.name, a.sha256, a.subdirectory) ==
                   std::tie(b.url, b.name, b.sha256, b.subdirectory);
        }
        case SourceKind::Hub: {
            const auto& a = as<RegistryPinned>();
            const auto& b = o.as<RegistryPinned>();
            return std::tie(a.package, a.version, a.version_latest) ==
                   std::tie(b.package, b.version, b.version_latest);
        }
    }
    return false;
}

// ---- staging ----

static Status stage_git(const GitPinned& g, const ResolverContext& ctx, FetchState& state) {
    if (!ctx.transport) {
        return PinionError{PinionError::InvalidArg,
            "cannot clone " + g.url + ": no transport configured"};
    }
    if (g.revision == "HEAD" && g.warn_unpinned) {
        log::warn("The git package \"%s\" is not pinned.\n"
                  "  This can introduce breaking changes into your project without warning!",
                  g.url.c_str());
    }

    auto dir = ctx.downloads.make_temp_dir(g.url);
    if (dir.is_err()) return std::move(dir).error();
    ScopedPath checkout = std::move(dir).value();

    fs::path repo = checkout.path() / "repo";
    PINION_TRY(clone_with_retry(*ctx.transport, g.url, g.revision, repo, ctx.retry));

    fs::path root = repo;
    if (g.subdirectory) {
        root = repo / *g.subdirectory;
        std::error_code ec;
        if (!fs::is_directory(root, ec)) {
            return PinionError{PinionError::SubdirectoryNotFound,
                "Subdirectory '" + *g.subdirectory + "' not found in " + g.url +
                " at " + g.revision};
        }
    }

    state.checkout = std::move(checkout);
    state.package_root = root;
    return ok_status();
}

static TarballRequest registry_request(const RegistryPinned& r, const RegistryVersionInfo& info) {
    TarballRequest req;
    req.reference = info.download_url;
    req.label = r.package + "@" + r.version;
    req.sha256 = info.sha256;
    return req;
}

static Result<RegistryVersionInfo> registry_info(const RegistryPinned& r,
                                                 const ResolverContext& ctx) {
    if (!ctx.registry) {
        return PinionError{PinionError::InvalidArg,
            "package " + r.package + " needs a registry index but none is configured"};
    }
    return ctx.registry->fetch_version_metadata(r.package, r.version);
}

Status PinnedPackage::stage(const ResolverContext& ctx) const {
    switch (source_kind()) {
        case SourceKind::Local:
            return ok_status();

        case SourceKind::Git:
            if (!state_->package_root.empty()) return ok_status();
            return stage_git(as<GitPinned>(), ctx, *state_);

        case SourceKind::Tarball: {
            if (state_->tarball) return ok_status();
            const auto& t = as<TarballPinned>();
            TarballRequest req{t.url, t.name.value_or(t.url), t.sha256, t.subdirectory};
            auto staged = stage_tarball(req, ctx);
            if (staged.is_err()) return std::move(staged).error();
            state_->tarball = std::move(staged).value();
            return ok_status();
        }

        case SourceKind::Hub: {
            if (state_->tarball) return ok_status();
            const auto& r = as<RegistryPinned>();
            auto info = registry_info(r, ctx);
            if (info.is_err()) return std::move(info).error();
            auto staged = stage_tarball(registry_request(r, info.value()), ctx);
            if (staged.is_err()) return std::move(staged).error();
            state_->tarball = std::move(staged).value();
            return ok_status();
        }
    }
    return PinionError{PinionError::InvalidArg, "unknown package kind"};
}

Result<ProjectMetadata> PinnedPackage::fetch_metadata(const ResolverContext& ctx) const {
    if (state_->metadata) return Result<ProjectMetadata>::ok(*state_->metadata);

    ProjectMetadata meta;
    switch (source_kind()) {
        case SourceKind::Hub: {
            // The index already carries everything; nothing is downloaded
            const auto& r = as<RegistryPinned>();
            auto info = registry_info(r, ctx);
            if (info.is_err()) return std::move(info).error();
            meta.name = info.value().name;
            meta.version = info.value().version;
            meta.packages = info.value().packages;
            break;
        }

        case SourceKind::Local:
        case SourceKind::Git:
        case SourceKind::Tarball: {
            if (!ctx.loader) {
                return PinionError{PinionError::InvalidArg,
                    "cannot read " + name() + ": no project loader configured"};
            }
            PINION_TRY(stage(ctx));

            fs::path root;
            if (source_kind() == SourceKind::Local) {
                root = ctx.resolve_path(as<LocalPinned>().path);
            } else if (source_kind() == SourceKind::Git) {
                root = state_->package_root;
            } else {
                root = state_->tarball->package_root;
            }

            auto loaded = ctx.loader->load_project(root);
            if (loaded.is_ok()) {
                meta = std::move(loaded).value();
            } else if (source_kind() == SourceKind::Tarball &&
                       loaded.error().code == PinionError::NotFound) {
                // Plain archives without a descriptor install under their declared name
                log::debug("tarball %s has no %s", name().c_str(), kManifestFile);
                meta.name = as<TarballPinned>().name.value_or("");
            } else {
                return std::move(loaded).error();
            }
            break;
        }
    }

    state_->metadata = meta;
    return Result<ProjectMetadata>::ok(std::move(meta));
}

static std::string last_segment(const std::string& id) {
    auto slash = id.find_last_of('/');
    return slash == std::string::npos ? id : id.substr(slash + 1);
}

Result<std::string> PinnedPackage::project_name(const ResolverContext& ctx) const {
    auto meta = fetch_metadata(ctx);
    if (meta.is_err()) return std::move(meta).error();

    std::string raw = meta.value().name;
    if (raw.empty()) {
        if (source_kind() == SourceKind::Tarball && as<TarballPinned>().name) {
            raw = *as<TarballPinned>().name;
        } else if (source_kind() == SourceKind::Hub) {
            raw = last_segment(as<RegistryPinned>().package);
        } else {
            return PinionError{PinionError::Manifest,
                "cannot tell which name " + to_string() + " installs under",
                "add a [package] name to its pinion.toml or declare `name`"};
        }
    }

    auto name = InstallName::parse(raw);
    if (name.is_err()) return std::move(name).error();
    return Result<std::string>::ok(name.value().str());
}

Result<fs::path> PinnedPackage::install_path(const ResolverContext& ctx) const {
    return project_name(ctx).map(
        [&ctx](const std::string& name) { return ctx.install_root / name; });
}

static Status install_local(const LocalPinned& l, const ResolverContext& ctx,
                            const fs::path& dest) {
    std::error_code ec;
    fs::path source = fs::absolute(ctx.resolve_path(l.path), ec);
    if (ec || !fs::is_directory(source, ec)) {
        return PinionError{PinionError::NotFound, "local package " + l.path + " does not exist"};
    }

    fs::create_directories(dest.parent_path(), ec);
    fs::path temp = dest.parent_path() / ("." + dest.filename().string() + ".new-" + random_suffix());
    ScopedPath staged(temp);

    fs::create_directory_symlink(source, temp, ec);
    if (ec) {
        log::debug("symlink unavailable (%s), copying %s", ec.message().c_str(), source.c_str());
        PINION_TRY(copy_tree(source, temp));
    }

    PINION_TRY(replace_path(temp, dest));
    staged.release();
    return ok_status();
}

Status PinnedPackage::install(const ResolverContext& ctx) const {
    auto dest = install_path(ctx);
    if (dest.is_err()) return std::move(dest).error();

    log::info("installing %s -> %s", to_string().c_str(), dest.value().c_str());

    switch (source_kind()) {
        case SourceKind::Local:
            return install_local(as<LocalPinned>(), ctx, dest.value());

        case SourceKind::Git: {
            PINION_TRY(stage(ctx));
            PINION_TRY(replace_path(state_->package_root, dest.value()));
            state_->package_root.clear();
            state_->checkout.reset();
            return ok_status();
        }

        case SourceKind::Tarball:
        case SourceKind::Hub: {
            PINION_TRY(stage(ctx));
            auto status = install_staged(*state_->tarball, dest.value());
            state_->tarball.reset();
            return status;
        }
    }
    return PinionError{PinionError::InvalidArg, "unknown package kind"};
}

} // namespace pinion
