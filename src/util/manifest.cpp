#include <pinion/manifest.hpp>
#include "toml_decl.hpp"

#include <fstream>
#include <set>
#include <sstream>

namespace pinion {

namespace detail {

Result<std::vector<std::string>> string_or_list(const toml::node& node,
                                                const std::string& where) {
    std::vector<std::string> out;
    if (auto s = node.value<std::string>()) {
        out.push_back(*s);
        return Result<std::vector<std::string>>::ok(std::move(out));
    }
    if (auto arr = node.as_array()) {
        for (const auto& elem : *arr) {
            auto s = elem.value<std::string>();
            if (!s) {
                return PinionError{PinionError::Manifest,
                    where + " must contain only strings"};
            }
            out.push_back(*s);
        }
        return Result<std::vector<std::string>>::ok(std::move(out));
    }
    return PinionError{PinionError::Manifest,
        where + " must be a string or an array of strings"};
}

static Result<std::string> required_string(const toml::table& tbl, const char* key,
                                            const std::string& where) {
    auto v = tbl[key].value<std::string>();
    if (!v) {
        return PinionError{PinionError::Manifest,
            where + ": '" + key + "' must be a string"};
    }
    return Result<std::string>::ok(*v);
}

static Status check_keys(const toml::table& tbl, const std::set<std::string>& allowed,
                         const std::string& kind, const std::string& where) {
    for (const auto& [key, val] : tbl) {
        std::string k(key.str());
        if (!allowed.count(k)) {
            return PinionError{PinionError::Manifest,
                where + ": unknown key '" + k + "' for a " + kind + " package"};
        }
    }
    return ok_status();
}

static Result<std::optional<std::string>> optional_string(const toml::table& tbl,
                                                          const char* key,
                                                          const std::string& where) {
    const toml::node* node = tbl.get(key);
    if (!node) return Result<std::optional<std::string>>::ok(std::nullopt);
    auto v = node->value<std::string>();
    if (!v) {
        return PinionError{PinionError::Manifest,
            where + ": '" + key + "' must be a string"};
    }
    return Result<std::optional<std::string>>::ok(std::optional<std::string>(*v));
}

Result<PackageDecl> parse_package_decl(const toml::table& tbl, const std::string& where) {
    PackageDecl decl;

    if (tbl.contains("local")) {
        PINION_TRY(check_keys(tbl, {"local"}, "local", where));
        auto path = required_string(tbl, "local", where);
        if (path.is_err()) return std::move(path).error();
        decl.local = LocalSource{std::move(path).value()};
    }

    if (tbl.contains("git")) {
        PINION_TRY(check_keys(tbl, {"git", "revision", "warn-unpinned", "subdirectory"},
                              "git", where));
        GitSource gs;
        auto url = required_string(tbl, "git", where);
        if (url.is_err()) return std::move(url).error();
        gs.url = std::move(url).value();
        if (const toml::node* rev = tbl.get("revision")) {
            auto revs = string_or_list(*rev, where + ": 'revision'");
            if (revs.is_err()) return std::move(revs).error();
            gs.revisions = std::move(revs).value();
        }
        if (const toml::node* w = tbl.get("warn-unpinned")) {
            auto b = w->value<bool>();
            if (!b) {
                return PinionError{PinionError::Manifest,
                    where + ": 'warn-unpinned' must be a boolean"};
            }
            gs.warn_unpinned = *b;
        }
        auto sub = optional_string(tbl, "subdirectory", where);
        if (sub.is_err()) return std::move(sub).error();
        gs.subdirectory = std::move(sub).value();
        decl.git = std::move(gs);
    }

    if (tbl.contains("tarball")) {
        PINION_TRY(check_keys(tbl, {"tarball", "name", "sha256", "subdirectory"},
                              "tarball", where));
        TarballSource ts;
        auto url = required_string(tbl, "tarball", where);
        if (url.is_err()) return std::move(url).error();
        ts.url = std::move(url).value();
        for (auto [key, field] : {std::make_pair("name", &ts.name),
                                  std::make_pair("sha256", &ts.sha256),
                                  std::make_pair("subdirectory", &ts.subdirectory)}) {
            auto v = optional_string(tbl, key, where);
            if (v.is_err()) return std::move(v).error();
            *field = std::move(v).value();
        }
        decl.tarball = std::move(ts);
    }

    if (tbl.contains("package")) {
        PINION_TRY(check_keys(tbl, {"package", "version", "install-prerelease"},
                              "registry", where));
        RegistrySource rs;
        auto id = required_string(tbl, "package", where);
        if (id.is_err()) return std::move(id).error();
        rs.package = std::move(id).value();
        if (const toml::node* v = tbl.get("version")) {
            auto versions = string_or_list(*v, where + ": 'version'");
            if (versions.is_err()) return std::move(versions).error();
            rs.versions = std::move(versions).value();
        }
        if (const toml::node* p = tbl.get("install-prerelease")) {
            auto b = p->value<bool>();
            if (!b) {
                return PinionError{PinionError::Manifest,
                    where + ": 'install-prerelease' must be a boolean"};
            }
            rs.install_prerelease = *b;
        }
        decl.registry = std::move(rs);
    }

    auto status = decl.validate();
    if (status.is_err()) {
        auto e = std::move(status).error();
        e.message = where + ": " + e.message;
        return e;
    }
    return Result<PackageDecl>::ok(std::move(decl));
}

Result<std::vector<PackageDecl>> parse_package_decls(const toml::array& arr,
                                                     const std::string& where) {
    std::vector<PackageDecl> decls;
    size_t index = 0;
    for (const auto& elem : arr) {
        std::string item = where + "[" + std::to_string(index++) + "]";
        auto tbl = elem.as_table();
        if (!tbl) {
            return PinionError{PinionError::Manifest, item + " must be a table"};
        }
        auto decl = parse_package_decl(*tbl, item);
        if (decl.is_err()) return std::move(decl).error();
        decls.push_back(std::move(decl).value());
    }
    return Result<std::vector<PackageDecl>>::ok(std::move(decls));
}

} // namespace detail

// ---------------------------------------------------------------------------
// Manifest::parse
// ---------------------------------------------------------------------------

Result<Manifest> Manifest::parse(const std::string& toml_str) {
    toml::table doc;
    try {
        doc = toml::parse(toml_str);
    } catch (const toml::parse_error& e) {
        return PinionError{PinionError::Parse,
            std::string("TOML parse error: ") + std::string(e.description())};
    }

    Manifest m;

    // [package] section
    if (auto pkg = doc["package"].as_table()) {
        if (auto v = (*pkg)["name"].value<std::string>()) m.package.name = *v;
        if (auto v = (*pkg)["version"].value<std::string>()) m.package.version = *v;
    }

    // [[packages]] array-of-tables
    if (const toml::node* node = doc.get("packages")) {
        auto arr = node->as_array();
        if (!arr) {
            return PinionError{PinionError::Manifest,
                "'packages' must be an array of tables", "use [[packages]] entries"};
        }
        auto decls = detail::parse_package_decls(*arr, "packages");
        if (decls.is_err()) return std::move(decls).error();
        m.packages = std::move(decls).value();
    }

    return Result<Manifest>::ok(std::move(m));
}

// ---------------------------------------------------------------------------
// Manifest::load
// ---------------------------------------------------------------------------

Result<Manifest> Manifest::load(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return PinionError{PinionError::IO, "cannot open manifest file: " + path};
    }

    std::ostringstream ss;
    ss << file.rdbuf();
    auto m = Manifest::parse(ss.str());
    if (m.is_err()) {
        auto e = std::move(m).error();
        e.message = path + ": " + e.message;
        return e;
    }
    return m;
}

} // namespace pinion
