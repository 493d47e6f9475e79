#pragma once

#include <pinion/result.hpp>
#include <pinion/source.hpp>

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace pinion {

// One published version of a registry package
struct RegistryVersionInfo {
    std::string name;                    // project name it installs under
    std::string version;
    std::string download_url;
    std::optional<std::string> sha256;
    std::vector<PackageDecl> packages;   // its own declared packages
};

// Read-only view of a package index
class RegistryIndex {
public:
    virtual ~RegistryIndex() = default;

    virtual Result<std::vector<std::string>> list_package_names() const = 0;

    // Ascending by version order; NotFound for an unknown package
    virtual Result<std::vector<std::string>> list_versions(const std::string& id) const = 0;

    virtual Result<RegistryVersionInfo> fetch_version_metadata(
        const std::string& id, const std::string& version) const = 0;
};

// Index stored as TOML:
//
//   [[package]]
//   id = "org/name"
//   [[package.version]]
//   version = "0.1.2"
//   name = "name"
//   tarball = "https://example.com/name-0.1.2.tar.gz"
//   sha256 = "..."
//   packages = [ { package = "org/dep", version = ">=1.0.0" } ]
class TomlRegistryIndex : public RegistryIndex {
public:
    static Result<TomlRegistryIndex> parse(const std::string& toml_str);
    static Result<TomlRegistryIndex> load(const std::string& path);

    Result<std::vector<std::string>> list_package_names() const override;
    Result<std::vector<std::string>> list_versions(const std::string& id) const override;
    Result<RegistryVersionInfo> fetch_version_metadata(
        const std::string& id, const std::string& version) const override;

private:
    // id -> versions, ascending
    std::map<std::string, std::vector<RegistryVersionInfo>> packages_;
};

} // namespace pinion
