#include <pinion/resolver.hpp>
#include <pinion/log.hpp>

#include <algorithm>
#include <unordered_set>

namespace pinion {

// ---------------------------------------------------------------------------
// PackageListing
// ---------------------------------------------------------------------------

Result<PackageListing> PackageListing::from_declarations(const std::vector<PackageDecl>& decls) {
    PackageListing listing;
    PINION_TRY(listing.update_from(decls));
    return Result<PackageListing>::ok(std::move(listing));
}

Status PackageListing::incorporate(const UnpinnedPackage& pkg) {
    std::string key = pkg.identity();
    auto it = index_.find(key);
    if (it == index_.end()) {
        index_.emplace(key, packages_.size());
        packages_.push_back(pkg);
        return ok_status();
    }

    auto merged = packages_[it->second].incorporate(pkg);
    if (merged.is_err()) return std::move(merged).error();
    packages_[it->second] = std::move(merged).value();
    return ok_status();
}

Status PackageListing::update_from(const std::vector<PackageDecl>& decls) {
    for (const auto& decl : decls) {
        auto pkg = UnpinnedPackage::from_declaration(decl);
        if (pkg.is_err()) return std::move(pkg).error();
        PINION_TRY(incorporate(pkg.value()));
    }
    return ok_status();
}

const UnpinnedPackage* PackageListing::find(const std::string& identity) const {
    auto it = index_.find(identity);
    return it == index_.end() ? nullptr : &packages_[it->second];
}

Result<std::vector<PinnedPackage>> PackageListing::resolved(const ResolverContext& ctx) const {
    std::vector<PinnedPackage> out;
    out.reserve(packages_.size());
    for (const auto& pkg : packages_) {
        auto pinned = pkg.resolved(ctx);
        if (pinned.is_err()) return std::move(pinned).error();
        out.push_back(std::move(pinned).value());
    }
    return Result<std::vector<PinnedPackage>>::ok(std::move(out));
}

// ---------------------------------------------------------------------------
// DependencyResolver
// ---------------------------------------------------------------------------

DependencyResolver::DependencyResolver(const ResolverContext& ctx)
    : ctx_(ctx) {}

Result<std::vector<PinnedPackage>> DependencyResolver::resolve(
    const std::vector<PackageDecl>& decls)
{
    PackageListing final_listing;
    std::vector<PackageDecl> seen;
    std::unordered_map<std::string, PinnedPackage> discovered;

    auto unseen = [&seen](const std::vector<PackageDecl>& in) {
        std::vector<PackageDecl> fresh;
        for (const auto& d : in) {
            if (std::find(seen.begin(), seen.end(), d) != seen.end()) continue;
            if (std::find(fresh.begin(), fresh.end(), d) != fresh.end()) continue;
            fresh.push_back(d);
        }
        return fresh;
    };

    std::vector<PackageDecl> pending = unseen(decls);
    int round = 0;
    while (!pending.empty()) {
        ++round;
        log::debug("resolution round %d: %zu new declaration(s)", round, pending.size());
        seen.insert(seen.end(), pending.begin(), pending.end());

        auto pending_listing = PackageListing::from_declarations(pending);
        if (pending_listing.is_err()) return std::move(pending_listing).error();
        for (const auto& pkg : pending_listing.value().packages()) {
            PINION_TRY(final_listing.incorporate(pkg));
        }

        // Pin with everything known so far, then read each package's own
        // declarations
        std::vector<PackageDecl> next;
        for (const auto& pkg : pending_listing.value().packages()) {
            std::string key = pkg.identity();
            auto pinned = final_listing.find(key)->resolved(ctx_);
            if (pinned.is_err()) return std::move(pinned).error();

            auto it = discovered.find(key);
            if (it == discovered.end() || it->second != pinned.value()) {
                discovered.erase(key);
                it = discovered.emplace(key, std::move(pinned).value()).first;
            }

            auto meta = it->second.fetch_metadata(ctx_);
            if (meta.is_err()) return std::move(meta).error();
            auto fresh = unseen(meta.value().packages);
            next.insert(next.end(), fresh.begin(), fresh.end());
        }
        pending = unseen(next);
    }

    auto pinned = final_listing.resolved(ctx_);
    if (pinned.is_err()) return std::move(pinned).error();

    // Reuse the objects that already staged their content
    std::vector<PinnedPackage> out;
    out.reserve(pinned.value().size());
    for (size_t i = 0; i < pinned.value().size(); ++i) {
        const auto& p = pinned.value()[i];
        auto it = discovered.find(final_listing.packages()[i].identity());
        out.push_back(it != discovered.end() && it->second == p ? it->second : p);
    }

    PINION_TRY(check_unique_names(out));
    return Result<std::vector<PinnedPackage>>::ok(std::move(out));
}

Status DependencyResolver::check_unique_names(const std::vector<PinnedPackage>& pinned) {
    auto duplicate = [](const std::string& name) {
        return PinionError{PinionError::Duplicate,
            "Found duplicate project \"" + name + "\". This occurs when a dependency "
            "has the same project name as some other dependency."};
    };

    std::unordered_set<std::string> names;
    if (!ctx_.root_project_name.empty()) names.insert(ctx_.root_project_name);

    for (const auto& p : pinned) {
        auto name = p.project_name(ctx_);
        if (name.is_err()) return std::move(name).error();
        if (!names.insert(name.value()).second) return duplicate(name.value());
    }
    return ok_status();
}

Status DependencyResolver::install(const std::vector<PinnedPackage>& pinned) {
    for (const auto& p : pinned) {
        PINION_TRY(p.install(ctx_));
    }
    log::info("installed %zu package(s) into %s", pinned.size(), ctx_.install_root.c_str());
    return ok_status();
}

} // namespace pinion
