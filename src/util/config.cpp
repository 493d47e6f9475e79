#include <pinion/config.hpp>
#include <toml++/toml.hpp>

#include <climits>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace pinion {

static PinionError bad_value(const std::string& key, const std::string& why) {
    return PinionError{PinionError::Config, "config key '" + key + "' " + why};
}

static Result<std::optional<int64_t>> read_int(const toml::table& section,
                                               const std::string& section_name,
                                               const char* key, int64_t min) {
    const toml::node* node = section.get(key);
    if (!node) return Result<std::optional<int64_t>>::ok(std::nullopt);
    auto v = node->value<int64_t>();
    std::string full = section_name + "." + key;
    if (!v) return bad_value(full, "must be an integer");
    if (*v < min) return bad_value(full, "must be at least " + std::to_string(min));
    return Result<std::optional<int64_t>>::ok(v);
}

static Status read_int_into(const toml::table& section, const std::string& name,
                            const char* key, int64_t min, std::optional<int>& out) {
    auto v = read_int(section, name, key, min);
    if (v.is_err()) return std::move(v).error();
    if (v.value()) {
        if (*v.value() > INT_MAX) {
            return bad_value(name + "." + key, "must be at most " + std::to_string(INT_MAX));
        }
        out = static_cast<int>(*v.value());
    }
    return ok_status();
}

Result<Config> Config::parse(const std::string& toml_str) {
    toml::table doc;
    try {
        doc = toml::parse(toml_str);
    } catch (const toml::parse_error& e) {
        return PinionError{PinionError::Parse,
            std::string("config TOML parse error: ") + std::string(e.description())};
    }

    Config cfg;

    // [install] section
    if (auto install = doc["install"].as_table()) {
        if (auto v = (*install)["path"].value<std::string>()) cfg.install.path = *v;
        if (auto v = (*install)["downloads"].value<std::string>()) cfg.install.downloads = *v;
    }

    // [network] section
    if (auto net = doc["network"].as_table()) {
        PINION_TRY(read_int_into(*net, "network", "attempts", 1, cfg.network.attempts));
        PINION_TRY(read_int_into(*net, "network", "backoff-ms", 0, cfg.network.backoff_ms));
        PINION_TRY(read_int_into(*net, "network", "max-backoff-ms", 0,
                                 cfg.network.max_backoff_ms));
        PINION_TRY(read_int_into(*net, "network", "timeout-seconds", 1,
                                 cfg.network.timeout_seconds));
    }

    // [tarball] section
    if (auto tb = doc["tarball"].as_table()) {
        auto v = read_int(*tb, "tarball", "max-size", 1);
        if (v.is_err()) return std::move(v).error();
        if (v.value()) cfg.tarball.max_size = static_cast<uint64_t>(*v.value());
    }

    // [registry] section
    if (auto reg = doc["registry"].as_table()) {
        if (auto v = (*reg)["index"].value<std::string>()) cfg.registry.index = *v;
    }

    // [log] section
    if (auto lg = doc["log"].as_table()) {
        if (auto v = (*lg)["level"].value<std::string>()) {
            log::Level level;
            if (!log::parse_level(*v, level)) {
                return bad_value("log.level", "has unknown level '" + *v + "'");
            }
            cfg.log.level = level;
        }
    }

    return Result<Config>::ok(std::move(cfg));
}

Result<Config> Config::load(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return PinionError{PinionError::IO, "cannot open config file: " + path};
    }
    std::ostringstream ss;
    ss << file.rdbuf();
    auto cfg = Config::parse(ss.str());
    if (cfg.is_err()) {
        auto e = std::move(cfg).error();
        e.message = path + ": " + e.message;
        return e;
    }
    return cfg;
}

template<typename T>
static void override_with(std::optional<T>& dst, const std::optional<T>& src) {
    if (src.has_value()) dst = src;
}

void Config::merge(const Config& other) {
    override_with(install.path, other.install.path);
    override_with(install.downloads, other.install.downloads);
    override_with(network.attempts, other.network.attempts);
    override_with(network.backoff_ms, other.network.backoff_ms);
    override_with(network.max_backoff_ms, other.network.max_backoff_ms);
    override_with(network.timeout_seconds, other.network.timeout_seconds);
    override_with(tarball.max_size, other.tarball.max_size);
    override_with(registry.index, other.registry.index);
    override_with(log.level, other.log.level);
}

Config Config::effective(const std::optional<Config>& global,
                         const std::optional<Config>& project) {
    Config result;
    if (global.has_value()) result.merge(global.value());
    if (project.has_value()) result.merge(project.value());
    return result;
}

static Result<std::optional<Config>> load_if_present(const std::string& path) {
    std::error_code ec;
    if (path.empty() || !std::filesystem::exists(path, ec)) {
        return Result<std::optional<Config>>::ok(std::nullopt);
    }
    auto cfg = Config::load(path);
    if (cfg.is_err()) return std::move(cfg).error();
    return Result<std::optional<Config>>::ok(std::move(cfg).value());
}

Result<Config> Config::load_layered(const std::string& project_root) {
    auto global = load_if_present(global_config_path());
    if (global.is_err()) return std::move(global).error();

    auto project = load_if_present(
        (std::filesystem::path(project_root) / kProjectConfigFile).string());
    if (project.is_err()) return std::move(project).error();

    return Result<Config>::ok(effective(global.value(), project.value()));
}

std::string global_config_path() {
    const char* home = std::getenv("HOME");
    if (!home) home = std::getenv("USERPROFILE");
    if (!home) return "";
    return std::string(home) + "/.pinion/config.toml";
}

} // namespace pinion
