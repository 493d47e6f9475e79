#include <pinion/registry.hpp>
#include <pinion/version.hpp>
#include "toml_decl.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;

namespace pinion {

static PinionError index_error(const std::string& msg) {
    return PinionError{PinionError::Parse, "registry index: " + msg};
}

// Unparseable versions sort first so they never win a "latest" query
static bool version_less(const RegistryVersionInfo& a, const RegistryVersionInfo& b) {
    auto va = VersionSpecifier::parse(a.version);
    auto vb = VersionSpecifier::parse(b.version);
    if (va.is_err() || vb.is_err()) {
        if (va.is_err() != vb.is_err()) return va.is_err();
        return a.version < b.version;
    }
    return va.value().compare(vb.value()) < 0;
}

static Result<RegistryVersionInfo> parse_version_entry(const toml::table& tbl,
                                                       const std::string& id,
                                                       size_t index) {
    std::string where = "package '" + id + "' version[" + std::to_string(index) + "]";
    RegistryVersionInfo info;

    auto version = tbl["version"].value<std::string>();
    if (!version) return index_error(where + ": 'version' is required");
    info.version = *version;

    auto tarball = tbl["tarball"].value<std::string>();
    if (!tarball) return index_error(where + ": 'tarball' is required");
    info.download_url = *tarball;

    if (auto v = tbl["name"].value<std::string>()) info.name = *v;
    if (auto v = tbl["sha256"].value<std::string>()) info.sha256 = *v;

    if (const toml::node* deps = tbl.get("packages")) {
        auto arr = deps->as_array();
        if (!arr) return index_error(where + ": 'packages' must be an array");
        auto decls = detail::parse_package_decls(*arr, where + " packages");
        if (decls.is_err()) return std::move(decls).error();
        info.packages = std::move(decls).value();
    }
    return Result<RegistryVersionInfo>::ok(std::move(info));
}

Result<TomlRegistryIndex> TomlRegistryIndex::parse(const std::string& toml_str) {
    toml::table doc;
    try {
        doc = toml::parse(toml_str);
    } catch (const toml::parse_error& e) {
        return PinionError{PinionError::Parse,
            std::string("registry index TOML parse error: ") + std::string(e.description())};
    }

    TomlRegistryIndex index;
    auto arr = doc["package"].as_array();
    if (!arr) return Result<TomlRegistryIndex>::ok(std::move(index));

    for (const auto& elem : *arr) {
        auto tbl = elem.as_table();
        if (!tbl) return index_error("[[package]] entries must be tables");
        auto id = (*tbl)["id"].value<std::string>();
        if (!id || id->empty()) return index_error("[[package]] entry without 'id'");
        if (index.packages_.count(*id)) {
            return PinionError{PinionError::Duplicate,
                "registry index: package '" + *id + "' listed twice"};
        }

        std::vector<RegistryVersionInfo> versions;
        if (auto varr = (*tbl)["version"].as_array()) {
            size_t i = 0;
            for (const auto& v : *varr) {
                auto vt = v.as_table();
                if (!vt) return index_error("package '" + *id + "': versions must be tables");
                auto info = parse_version_entry(*vt, *id, i++);
                if (info.is_err()) return std::move(info).error();
                versions.push_back(std::move(info).value());
            }
        }
        std::stable_sort(versions.begin(), versions.end(), version_less);
        index.packages_.emplace(*id, std::move(versions));
    }

    return Result<TomlRegistryIndex>::ok(std::move(index));
}

Result<TomlRegistryIndex> TomlRegistryIndex::load(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return PinionError{PinionError::IO, "cannot open registry index: " + path};
    }
    std::ostringstream ss;
    ss << file.rdbuf();
    auto index = parse(ss.str());
    if (index.is_err()) return index;

    // Plain paths in a file-backed index are relative to the index itself
    fs::path base = fs::absolute(fs::path(path)).parent_path();
    for (auto& [id, versions] : index.value().packages_) {
        for (auto& info : versions) {
            if (info.download_url.find("://") == std::string::npos &&
                fs::path(info.download_url).is_relative()) {
                info.download_url = (base / info.download_url).lexically_normal().string();
            }
        }
    }
    return index;
}

Result<std::vector<std::string>> TomlRegistryIndex::list_package_names() const {
    std::vector<std::string> names;
    names.reserve(packages_.size());
    for (const auto& [id, versions] : packages_) names.push_back(id);
    return Result<std::vector<std::string>>::ok(std::move(names));
}

Result<std::vector<std::string>> TomlRegistryIndex::list_versions(const std::string& id) const {
    auto it = packages_.find(id);
    if (it == packages_.end()) {
        return PinionError{PinionError::NotFound, "package '" + id + "' is not in the index"};
    }
    std::vector<std::string> out;
    for (const auto& info : it->second) out.push_back(info.version);
    return Result<std::vector<std::string>>::ok(std::move(out));
}

Result<RegistryVersionInfo> TomlRegistryIndex::fetch_version_metadata(
    const std::string& id, const std::string& version) const {
    auto it = packages_.find(id);
    if (it != packages_.end()) {
        for (const auto& info : it->second) {
            if (info.version == version) return Result<RegistryVersionInfo>::ok(info);
        }
    }
    return PinionError{PinionError::NotFound,
        "version " + version + " of package '" + id + "' is not in the index"};
}

} // namespace pinion
