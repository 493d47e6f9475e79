#pragma once

#include <pinion/result.hpp>
#include <pinion/source.hpp>
#include <filesystem>
#include <string>
#include <vector>

namespace pinion {

// What pinion needs from a package's own descriptor
struct ProjectMetadata {
    std::string name;
    std::string version;
    std::vector<PackageDecl> packages;
};

// Reads the descriptor of the project rooted at a directory
class ProjectLoader {
public:
    virtual ~ProjectLoader() = default;
    virtual Result<ProjectMetadata> load_project(const std::filesystem::path& root) const = 0;
};

// Reads <root>/pinion.toml
class TomlProjectLoader : public ProjectLoader {
public:
    Result<ProjectMetadata> load_project(const std::filesystem::path& root) const override;
};

// Check if dir contains a pinion.toml
bool has_manifest(const std::filesystem::path& dir);

// Walk up from start_dir to the nearest directory holding a pinion.toml
Result<std::filesystem::path> find_project_root(const std::filesystem::path& start_dir);

} // namespace pinion
