#include <pinion/source.hpp>
#include <pinion/version.hpp>

#include <cctype>
#include <tuple>

namespace pinion {

Status PackageDecl::validate() const {
    int source_count = 0;
    if (local.has_value()) ++source_count;
    if (git.has_value()) ++source_count;
    if (tarball.has_value()) ++source_count;
    if (registry.has_value()) ++source_count;

    if (source_count == 0) {
        return PinionError{PinionError::Manifest,
            "package declaration has no source",
            "specify one of: local, git, tarball, or package"};
    }
    if (source_count > 1) {
        return PinionError{PinionError::Manifest,
            "package declaration " + describe() + " has multiple sources",
            "local, git, tarball, and package are mutually exclusive"};
    }

    if (local && local->path.empty()) {
        return PinionError{PinionError::Manifest, "local package has empty path"};
    }

    if (git) {
        if (git->url.empty()) {
            return PinionError{PinionError::Manifest, "git package has empty URL"};
        }
        if (git->url.front() == '-') {
            return PinionError{PinionError::Manifest,
                "git package URL '" + git->url + "' starts with '-'"};
        }
        for (const auto& rev : git->revisions) {
            if (rev.empty()) {
                return PinionError{PinionError::Manifest,
                    "git package " + git->url + " has an empty revision"};
            }
            if (rev.front() == '-') {
                return PinionError{PinionError::Manifest,
                    "git package " + git->url + " has revision '" + rev +
                    "' starting with '-'"};
            }
        }
        if (git->subdirectory && git->subdirectory->empty()) {
            return PinionError{PinionError::Manifest,
                "git package " + git->url + " has an empty subdirectory"};
        }
    }

    if (tarball) {
        if (tarball->url.empty()) {
            return PinionError{PinionError::Manifest, "tarball package has empty URL"};
        }
        if (tarball->sha256) {
            const auto& h = *tarball->sha256;
            bool hex = h.size() == 64;
            for (char c : h) {
                if (!std::isxdigit(static_cast<unsigned char>(c))) hex = false;
            }
            if (!hex) {
                return PinionError{PinionError::Manifest,
                    "tarball " + tarball->url + " has malformed sha256 '" + h + "'",
                    "expected 64 hexadecimal characters"};
            }
        }
        if (tarball->subdirectory && tarball->subdirectory->empty()) {
            return PinionError{PinionError::Manifest,
                "tarball " + tarball->url + " has an empty subdirectory"};
        }
    }

    if (registry) {
        if (registry->package.empty()) {
            return PinionError{PinionError::Manifest, "registry package has empty name"};
        }
        if (registry->versions.empty()) {
            return PinionError{PinionError::Manifest,
                "registry package '" + registry->package + "' has no version",
                "add version = \"<constraint>\""};
        }
        auto parsed = ConstraintSet::parse(registry->versions);
        if (parsed.is_err()) {
            return PinionError{PinionError::Manifest,
                "registry package '" + registry->package + "' has invalid version: " +
                parsed.error().message};
        }
    }

    return ok_status();
}

std::string PackageDecl::describe() const {
    if (local) return "local '" + local->path + "'";
    if (git) return "git '" + git->url + "'";
    if (tarball) return "tarball '" + tarball->url + "'";
    if (registry) return "package '" + registry->package + "'";
    return "<empty>";
}

bool PackageDecl::operator==(const PackageDecl& o) const {
    auto local_eq = [](const LocalSource& a, const LocalSource& b) {
        return a.path == b.path;
    };
    auto git_eq = [](const GitSource& a, const GitSource& b) {
        return std::tie(a.url, a.revisions, a.warn_unpinned, a.subdirectory) ==
               std::tie(b.url, b.revisions, b.warn_unpinned, b.subdirectory);
    };
    auto tarball_eq = [](const TarballSource& a, const TarballSource& b) {
        return std::tie(a.url, a.name, a.sha256, a.subdirectory) ==
               std::tie(b.url, b.name, b.sha256, b.subdirectory);
    };
    auto registry_eq = [](const RegistrySource& a, const RegistrySource& b) {
        return std::tie(a.package, a.versions, a.install_prerelease) ==
               std::tie(b.package, b.versions, b.install_prerelease);
    };
    auto opt_eq = [](const auto& a, const auto& b, auto eq) {
        if (a.has_value() != b.has_value()) return false;
        return !a.has_value() || eq(*a, *b);
    };
    return opt_eq(local, o.local, local_eq) && opt_eq(git, o.git, git_eq) &&
           opt_eq(tarball, o.tarball, tarball_eq) &&
           opt_eq(registry, o.registry, registry_eq);
}

} // namespace pinion
