#pragma once

#include <pinion/log.hpp>
#include <pinion/result.hpp>
#include <cstdint>
#include <optional>
#include <string>

namespace pinion {

constexpr const char* kProjectConfigFile = "pinion.config.toml";

// [install]
struct InstallConfig {
    std::optional<std::string> path;       // relative to the project root
    std::optional<std::string> downloads;
};

// [network]
struct NetworkConfig {
    std::optional<int> attempts;
    std::optional<int> backoff_ms;
    std::optional<int> max_backoff_ms;
    std::optional<int> timeout_seconds;
};

// [tarball]
struct TarballConfig {
    std::optional<uint64_t> max_size;
};

// [registry]
struct RegistryConfig {
    std::optional<std::string> index;      // path of the index TOML
};

// [log]
struct LogConfig {
    std::optional<log::Level> level;
};

// Layered configuration: global, then project. Every field is optional so a
// later layer only overrides what it explicitly sets.
struct Config {
    InstallConfig install;
    NetworkConfig network;
    TarballConfig tarball;
    RegistryConfig registry;
    LogConfig log;

    // Load from a TOML config file (global or project-level)
    static Result<Config> load(const std::string& path);

    // Parse from TOML string
    static Result<Config> parse(const std::string& toml_str);

    // Merge another config on top (other's values override this)
    void merge(const Config& other);

    // Build effective config from layers: global -> project
    static Config effective(const std::optional<Config>& global,
                            const std::optional<Config>& project);

    // ~/.pinion/config.toml then <project_root>/pinion.config.toml; a
    // missing file is skipped, a broken one is an error
    static Result<Config> load_layered(const std::string& project_root);
};

// Discover the global config file path: ~/.pinion/config.toml
std::string global_config_path();

} // namespace pinion
