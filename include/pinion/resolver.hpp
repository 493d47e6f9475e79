#pragma once

#include <pinion/context.hpp>
#include <pinion/package.hpp>
#include <pinion/result.hpp>
#include <pinion/source.hpp>

#include <string>
#include <unordered_map>
#include <vector>

namespace pinion {

// Unpinned packages keyed by identity, in first-seen order. Adding a second
// declaration of a known identity merges it into the first.
class PackageListing {
public:
    static Result<PackageListing> from_declarations(const std::vector<PackageDecl>& decls);

    Status incorporate(const UnpinnedPackage& pkg);
    Status update_from(const std::vector<PackageDecl>& decls);

    const std::vector<UnpinnedPackage>& packages() const { return packages_; }
    const UnpinnedPackage* find(const std::string& identity) const;
    size_t size() const { return packages_.size(); }
    bool empty() const { return packages_.empty(); }

    // Pins every entry, in order
    Result<std::vector<PinnedPackage>> resolved(const ResolverContext& ctx) const;

private:
    std::vector<UnpinnedPackage> packages_;
    std::unordered_map<std::string, size_t> index_;
};

class DependencyResolver {
public:
    explicit DependencyResolver(const ResolverContext& ctx);

    // Declarations -> pinned list covering every transitive package. Each
    // round reads the metadata of newly pinned packages for the next round's
    // declarations; a declaration seen before is not queued again.
    Result<std::vector<PinnedPackage>> resolve(const std::vector<PackageDecl>& decls);

    // Installs in list order, stopping at the first failure
    Status install(const std::vector<PinnedPackage>& pinned);

    // Duplicate when two packages (or a package and the root project)
    // install under the same name
    Status check_unique_names(const std::vector<PinnedPackage>& pinned);

private:
    const ResolverContext& ctx_;
};

} // namespace pinion
