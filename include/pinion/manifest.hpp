#pragma once

#include <pinion/result.hpp>
#include <pinion/source.hpp>
#include <string>
#include <vector>

namespace pinion {

constexpr const char* kManifestFile = "pinion.toml";

// [package] section
struct PackageInfo {
    std::string name;
    std::string version;
};

// Complete pinion.toml
struct Manifest {
    PackageInfo package;
    std::vector<PackageDecl> packages;  // [[packages]], declaration order

    // Parse from TOML string
    static Result<Manifest> parse(const std::string& toml_str);

    // Parse from file path
    static Result<Manifest> load(const std::string& path);
};

} // namespace pinion
