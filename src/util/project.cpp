#include <pinion/project.hpp>
#include <pinion/manifest.hpp>

namespace pinion {

namespace fs = std::filesystem;

bool has_manifest(const fs::path& dir) {
    std::error_code ec;
    return fs::is_regular_file(dir / kManifestFile, ec);
}

Result<fs::path> find_project_root(const fs::path& start_dir) {
    std::error_code ec;
    fs::path dir = fs::canonical(start_dir, ec);
    if (ec) {
        dir = fs::absolute(start_dir, ec);
        if (ec) {
            return PinionError{PinionError::IO, "cannot resolve path: " + start_dir.string()};
        }
    }

    while (true) {
        if (has_manifest(dir)) {
            return Result<fs::path>::ok(dir);
        }
        fs::path parent = dir.parent_path();
        if (parent == dir) {
            return PinionError{PinionError::NotFound,
                std::string("no ") + kManifestFile + " found in " + start_dir.string() +
                " or any parent directory"};
        }
        dir = parent;
    }
}

Result<ProjectMetadata> TomlProjectLoader::load_project(const fs::path& root) const {
    if (!has_manifest(root)) {
        return PinionError{PinionError::NotFound,
            std::string("no ") + kManifestFile + " found in " + root.string(),
            "every package must have a pinion.toml at its root"};
    }

    auto manifest = Manifest::load((root / kManifestFile).string());
    if (manifest.is_err()) return std::move(manifest).error();

    auto& m = manifest.value();
    if (m.package.name.empty()) {
        return PinionError{PinionError::Manifest,
            (root / kManifestFile).string() + ": [package] name is required"};
    }

    ProjectMetadata meta;
    meta.name = std::move(m.package.name);
    meta.version = std::move(m.package.version);
    meta.packages = std::move(m.packages);
    return Result<ProjectMetadata>::ok(std::move(meta));
}

} // namespace pinion
