#include <pinion/lockfile.hpp>
#include <toml++/toml.hpp>

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace pinion {

static std::string source_of(const PinnedPackage& p) {
    std::string kind = source_kind_name(p.source_kind());
    switch (p.source_kind()) {
        case SourceKind::Local:   return kind + "+" + p.as<LocalPinned>().path;
        case SourceKind::Git:     return kind + "+" + p.as<GitPinned>().url;
        case SourceKind::Tarball: return kind + "+" + p.as<TarballPinned>().url;
        case SourceKind::Hub:     return kind + "+" + p.as<RegistryPinned>().package;
    }
    return kind;
}

Result<LockFile> LockFile::from_pinned(const std::string& root_name,
                                       const std::string& root_version,
                                       const std::vector<PinnedPackage>& pinned,
                                       const ResolverContext& ctx) {
    LockFile lock;
    lock.root_name = root_name;
    lock.root_version = root_version;

    for (const auto& p : pinned) {
        auto name = p.project_name(ctx);
        if (name.is_err()) return std::move(name).error();

        LockedPackage lp;
        lp.name = name.value();
        lp.source = source_of(p);
        lp.version = p.version();
        if (p.source_kind() == SourceKind::Git) {
            lp.subdirectory = p.as<GitPinned>().subdirectory;
        } else if (p.source_kind() == SourceKind::Tarball) {
            lp.subdirectory = p.as<TarballPinned>().subdirectory;
            lp.sha256 = p.as<TarballPinned>().sha256;
        }
        lock.packages.push_back(std::move(lp));
    }
    return Result<LockFile>::ok(std::move(lock));
}

Result<LockFile> LockFile::load(const std::string& path) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        return PinionError{PinionError::NotFound, "lockfile not found: " + path,
                           "resolve without the lockfile to create one"};
    }

    toml::table doc;
    try {
        doc = toml::parse_file(path);
    } catch (const toml::parse_error& e) {
        return PinionError{PinionError::Parse,
            "cannot parse " + path + ": " + std::string(e.description())};
    }

    LockFile lock;
    if (auto root = doc["root"].as_table()) {
        if (auto v = (*root)["name"].value<std::string>()) lock.root_name = *v;
        if (auto v = (*root)["version"].value<std::string>()) lock.root_version = *v;
    }

    if (auto arr = doc["packages"].as_array()) {
        for (const auto& elem : *arr) {
            auto tbl = elem.as_table();
            if (!tbl) {
                return PinionError{PinionError::Parse, path + ": packages must be tables"};
            }
            LockedPackage lp;
            auto name = (*tbl)["name"].value<std::string>();
            auto source = (*tbl)["source"].value<std::string>();
            auto version = (*tbl)["version"].value<std::string>();
            if (!name || !source || !version) {
                return PinionError{PinionError::Parse,
                    path + ": every package needs name, source and version"};
            }
            lp.name = *name;
            lp.source = *source;
            lp.version = *version;
            if (auto v = (*tbl)["subdirectory"].value<std::string>()) lp.subdirectory = *v;
            if (auto v = (*tbl)["sha256"].value<std::string>()) lp.sha256 = *v;
            lock.packages.push_back(std::move(lp));
        }
    }
    return Result<LockFile>::ok(std::move(lock));
}

Status LockFile::save(const std::string& path) const {
    toml::table doc;

    toml::table root;
    root.insert("name", root_name);
    root.insert("version", root_version);
    doc.insert("root", std::move(root));

    std::vector<LockedPackage> sorted = packages;
    std::sort(sorted.begin(), sorted.end(),
              [](const LockedPackage& a, const LockedPackage& b) { return a.name < b.name; });

    toml::array arr;
    for (const auto& lp : sorted) {
        toml::table t;
        t.insert("name", lp.name);
        t.insert("source", lp.source);
        t.insert("version", lp.version);
        if (lp.subdirectory) t.insert("subdirectory", *lp.subdirectory);
        if (lp.sha256) t.insert("sha256", *lp.sha256);
        arr.push_back(std::move(t));
    }
    doc.insert("packages", std::move(arr));

    std::ofstream out(path);
    if (!out.is_open()) {
        return PinionError{PinionError::IO, "cannot write lockfile: " + path};
    }
    out << "# generated by pinion; do not edit\n" << doc << "\n";
    if (!out) {
        return PinionError{PinionError::IO, "failed writing lockfile: " + path};
    }
    return ok_status();
}

const LockedPackage* LockFile::find(const std::string& name) const {
    for (const auto& lp : packages) {
        if (lp.name == name) return &lp;
    }
    return nullptr;
}

Result<std::vector<PackageDecl>> LockFile::to_declarations() const {
    std::vector<PackageDecl> decls;
    for (const auto& lp : packages) {
        auto plus = lp.source.find('+');
        if (plus == std::string::npos) {
            return PinionError{PinionError::Parse,
                "locked package '" + lp.name + "' has malformed source '" + lp.source + "'"};
        }
        std::string kind = lp.source.substr(0, plus);
        std::string where = lp.source.substr(plus + 1);

        PackageDecl d;
        if (kind == "local") {
            d.local = LocalSource{where};
        } else if (kind == "git") {
            d.git = GitSource{where, {lp.version}, false, lp.subdirectory};
        } else if (kind == "tarball") {
            d.tarball = TarballSource{where, lp.name, lp.sha256, lp.subdirectory};
        } else if (kind == "hub") {
            d.registry = RegistrySource{where, {"=" + lp.version}, false};
        } else {
            return PinionError{PinionError::Parse,
                "locked package '" + lp.name + "' has unknown source kind '" + kind + "'"};
        }
        PINION_TRY(d.validate());
        decls.push_back(std::move(d));
    }
    return Result<std::vector<PackageDecl>>::ok(std::move(decls));
}

} // namespace pinion
