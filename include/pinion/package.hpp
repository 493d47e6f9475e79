#pragma once

#include <pinion/context.hpp>
#include <pinion/project.hpp>
#include <pinion/result.hpp>
#include <pinion/source.hpp>
#include <pinion/staging.hpp>
#include <pinion/tarball.hpp>
#include <pinion/version.hpp>

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace pinion {

enum class SourceKind { Local, Git, Tarball, Hub };

// "local", "git", "tarball", "hub"
const char* source_kind_name(SourceKind kind);

// ---------------------------------------------------------------------------
// Unpinned: one or more merged declarations of the same package
// ---------------------------------------------------------------------------

struct LocalUnpinned {
    std::string path;
};

struct GitUnpinned {
    std::string url;
    std::vector<std::string> revisions;
    bool warn_unpinned = true;
    std::optional<std::string> subdirectory;
};

struct TarballUnpinned {
    std::string url;
    std::optional<std::string> name;
    std::optional<std::string> sha256;
    std::optional<std::string> subdirectory;
};

struct RegistryUnpinned {
    std::string package;
    ConstraintSet versions;
};

class PinnedPackage;

class UnpinnedPackage {
public:
    using Spec = std::variant<LocalUnpinned, GitUnpinned, TarballUnpinned, RegistryUnpinned>;

    explicit UnpinnedPackage(Spec spec) : spec_(std::move(spec)) {}

    static Result<UnpinnedPackage> from_declaration(const PackageDecl& decl);

    SourceKind source_kind() const;

    // Declarations with equal identities describe the same package
    std::string identity() const;

    const Spec& spec() const { return spec_; }
    template<typename T> const T& as() const { return std::get<T>(spec_); }

    // Merge of this declaration with a later one of the same identity
    Result<UnpinnedPackage> incorporate(const UnpinnedPackage& other) const;

    // Settle on exactly one version. No network access except registry
    // index lookups.
    Result<PinnedPackage> resolved(const ResolverContext& ctx) const;

private:
    Spec spec_;
};

// ---------------------------------------------------------------------------
// Pinned: exactly one concrete version
// ---------------------------------------------------------------------------

struct LocalPinned {
    std::string path;
};

struct GitPinned {
    std::string url;
    std::string revision;               // "HEAD" when none was declared
    bool warn_unpinned = true;
    std::optional<std::string> subdirectory;
};

struct TarballPinned {
    std::string url;
    std::optional<std::string> name;
    std::optional<std::string> sha256;
    std::optional<std::string> subdirectory;
};

struct RegistryPinned {
    std::string package;
    std::string version;
    std::string version_latest;
};

// Content fetched for a pinned package. Copies of a PinnedPackage share one
// FetchState so a package is downloaded and extracted at most once.
struct FetchState {
    std::optional<StagedTarball> tarball;    // tarball and hub packages
    ScopedPath checkout;                     // git packages
    std::filesystem::path package_root;      // git: checkout or its subdirectory
    std::optional<ProjectMetadata> metadata;
};

class PinnedPackage {
public:
    using Spec = std::variant<LocalPinned, GitPinned, TarballPinned, RegistryPinned>;

    explicit PinnedPackage(Spec spec);

    SourceKind source_kind() const;

    // Local path, git URL, tarball name (or URL), registry package id
    std::string name() const;

    // Registry version, git revision, local path or tarball reference
    std::string version() const;

    // Newest version in the index that fits the constraints, prereleases
    // included when allowed. Registry packages only.
    std::optional<std::string> version_latest() const;

    std::string to_string() const;

    const Spec& spec() const { return spec_; }
    template<typename T> const T& as() const { return std::get<T>(spec_); }

    // The package's own descriptor; fetches and stages it on first use
    Result<ProjectMetadata> fetch_metadata(const ResolverContext& ctx) const;

    // Directory name under the install root
    Result<std::string> project_name(const ResolverContext& ctx) const;

    // <install_root>/<project_name>
    Result<std::filesystem::path> install_path(const ResolverContext& ctx) const;

    Status install(const ResolverContext& ctx) const;

    // Compares the pinned values only, never the fetch state
    bool operator==(const PinnedPackage& o) const;
    bool operator!=(const PinnedPackage& o) const { return !(*this == o); }

private:
    Status stage(const ResolverContext& ctx) const;

    Spec spec_;
    std::shared_ptr<FetchState> state_;
};

} // namespace pinion
