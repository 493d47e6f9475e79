#pragma once

#include <pinion/config.hpp>
#include <pinion/retry.hpp>
#include <pinion/staging.hpp>

#include <cstdint>
#include <filesystem>
#include <string>

namespace pinion {

class RegistryIndex;
class ProjectLoader;
class Transport;

constexpr uint64_t kDefaultMaxTarballSize = 1000000;
constexpr const char* kDefaultInstallDir = "pinion_packages";

// Everything a fetch or install needs, passed explicitly. The collaborators
// are borrowed; whoever builds the context keeps them alive.
struct ResolverContext {
    std::filesystem::path project_root;
    std::string root_project_name;
    std::filesystem::path install_root;
    DownloadArea downloads;
    RetryPolicy retry;
    uint64_t max_tarball_size = kDefaultMaxTarballSize;

    const RegistryIndex* registry = nullptr;
    const ProjectLoader* loader = nullptr;
    Transport* transport = nullptr;

    // Relative paths are taken from the project root
    std::filesystem::path resolve_path(const std::string& p) const;
};

// Applies configuration on top of the defaults. Collaborators and the root
// project name are left for the caller.
ResolverContext make_context(const Config& config,
                             const std::filesystem::path& project_root);

} // namespace pinion
