#pragma once

#include <pinion/config.hpp>
#include <pinion/context.hpp>
#include <pinion/lockfile.hpp>
#include <pinion/manifest.hpp>
#include <pinion/package.hpp>
#include <pinion/project.hpp>
#include <pinion/registry.hpp>
#include <pinion/result.hpp>
#include <pinion/transport.hpp>

#include <filesystem>
#include <memory>
#include <optional>
#include <vector>

namespace pinion {

// A project opened for resolution: its manifest, effective config and the
// default file/curl/git collaborators, wired into one ResolverContext.
class Session {
    struct Key {};

public:
    // Reads <project_root>/pinion.toml, the layered config and, when
    // [registry] index is set, the registry index. Applies [log] level.
    static Result<std::unique_ptr<Session>> open(const std::filesystem::path& project_root);

    // Opens the nearest project at or above start_dir
    static Result<std::unique_ptr<Session>> discover(const std::filesystem::path& start_dir);

    explicit Session(Key) {}
    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;

    const Manifest& manifest() const { return manifest_; }
    const Config& config() const { return config_; }
    const ResolverContext& context() const { return ctx_; }
    std::filesystem::path lock_path() const;

    // Pins the manifest's packages, or exactly what pinion.lock records
    // when `use_lock` is set and a lock file exists
    Result<std::vector<PinnedPackage>> resolve(bool use_lock = false);

    Status install(const std::vector<PinnedPackage>& pinned);

    Status write_lock(const std::vector<PinnedPackage>& pinned);

private:
    Config config_;
    Manifest manifest_;
    TomlProjectLoader loader_;
    std::unique_ptr<DefaultTransport> transport_;
    std::optional<TomlRegistryIndex> registry_;
    ResolverContext ctx_;
};

} // namespace pinion
