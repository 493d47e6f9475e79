#include <catch2/catch.hpp>
#include <pinion/manifest.hpp>

#include <cstdlib>

using namespace pinion;

static std::string fixture_dir() {
    const char* src = std::getenv("PINION_SOURCE_DIR");
    if (src) return std::string(src) + "/tests/fixtures";
#ifdef PINION_SOURCE_DIR
    return std::string(PINION_SOURCE_DIR) + "/tests/fixtures";
#else
    return "../tests/fixtures";
#endif
}

static PinionError parse_error(const std::string& toml) {
    auto r = Manifest::parse(toml);
    REQUIRE(r.is_err());
    return r.error();
}

// ===== Package section =====

TEST_CASE("parse package section", "[manifest]") {
    auto r = Manifest::parse(R"(
[package]
name = "analytics"
version = "1.0.0"
)");
    REQUIRE(r.is_ok());
    REQUIRE(r.value().package.name == "analytics");
    REQUIRE(r.value().package.version == "1.0.0");
    REQUIRE(r.value().packages.empty());
}

TEST_CASE("parse invalid TOML manifest", "[manifest]") {
    auto e = parse_error("[package\nname = ");
    REQUIRE(e.code == PinionError::Parse);
}

// ===== Package declarations =====

TEST_CASE("parse local declaration", "[manifest]") {
    auto r = Manifest::parse(R"(
[[packages]]
local = "libs/common"
)");
    REQUIRE(r.is_ok());
    REQUIRE(r.value().packages.size() == 1);
    REQUIRE(r.value().packages[0].local->path == "libs/common");
}

TEST_CASE("git revision accepts a string or a list", "[manifest]") {
    auto r = Manifest::parse(R"(
[[packages]]
git = "https://example.com/a.git"
revision = "v1"

[[packages]]
git = "https://example.com/b.git"
revision = ["main", "v2"]
warn-unpinned = false

[[packages]]
git = "https://example.com/c.git"
)");
    REQUIRE(r.is_ok());
    auto& p = r.value().packages;
    REQUIRE(p.size() == 3);
    REQUIRE(p[0].git->revisions == std::vector<std::string>{"v1"});
    REQUIRE(p[1].git->revisions == std::vector<std::string>{"main", "v2"});
    REQUIRE(p[1].git->warn_unpinned == std::optional<bool>(false));
    REQUIRE(p[2].git->revisions.empty());
    REQUIRE_FALSE(p[2].git->warn_unpinned.has_value());
}

TEST_CASE("parse tarball declaration", "[manifest]") {
    auto r = Manifest::parse(R"(
[[packages]]
tarball = "https://example.com/pkg.tar.gz"
name = "pkg"
subdirectory = "dir_1"
)");
    REQUIRE(r.is_ok());
    auto& t = *r.value().packages[0].tarball;
    REQUIRE(t.url == "https://example.com/pkg.tar.gz");
    REQUIRE(t.name == std::optional<std::string>("pkg"));
    REQUIRE(t.subdirectory == std::optional<std::string>("dir_1"));
    REQUIRE_FALSE(t.sha256.has_value());
}

TEST_CASE("parse registry declaration", "[manifest]") {
    auto r = Manifest::parse(R"(
[[packages]]
package = "acme/codegen"
version = [">=0.3.0", "<0.5.0"]
install-prerelease = true
)");
    REQUIRE(r.is_ok());
    auto& reg = *r.value().packages[0].registry;
    REQUIRE(reg.package == "acme/codegen");
    REQUIRE(reg.versions.size() == 2);
    REQUIRE(reg.install_prerelease);
}

TEST_CASE("declarations keep their order", "[manifest]") {
    auto r = Manifest::parse(R"(
[[packages]]
local = "b"
[[packages]]
local = "a"
[[packages]]
local = "c"
)");
    REQUIRE(r.is_ok());
    auto& p = r.value().packages;
    REQUIRE(p[0].local->path == "b");
    REQUIRE(p[1].local->path == "a");
    REQUIRE(p[2].local->path == "c");
}

// ===== Declaration errors =====

TEST_CASE("declaration without a source", "[manifest]") {
    auto e = parse_error("[[packages]]\nname = \"x\"\n");
    REQUIRE(e.code == PinionError::Manifest);
    REQUIRE(e.message == "packages[0]: package declaration has no source");
}

TEST_CASE("keys from another source kind are rejected", "[manifest]") {
    auto e = parse_error(R"(
[[packages]]
local = "a"

[[packages]]
git = "https://example.com/x.git"
sha256 = "abc"
)");
    REQUIRE(e.code == PinionError::Manifest);
    REQUIRE(e.message == "packages[1]: unknown key 'sha256' for a git package");
}

TEST_CASE("two sources in one declaration", "[manifest]") {
    auto e = parse_error(R"(
[[packages]]
tarball = "https://example.com/x.tar.gz"
package = "acme/x"
)");
    REQUIRE(e.code == PinionError::Manifest);
}

TEST_CASE("registry declaration needs a version", "[manifest]") {
    auto e = parse_error("[[packages]]\npackage = \"acme/x\"\n");
    REQUIRE(e.code == PinionError::Manifest);
    REQUIRE(e.message.find("has no version") != std::string::npos);
}

TEST_CASE("registry declaration with a bad constraint", "[manifest]") {
    auto e = parse_error("[[packages]]\npackage = \"acme/x\"\nversion = \"~>1\"\n");
    REQUIRE(e.code == PinionError::Manifest);
    REQUIRE(e.message.find("invalid version") != std::string::npos);
}

TEST_CASE("malformed sha256", "[manifest]") {
    auto e = parse_error(R"(
[[packages]]
tarball = "https://example.com/x.tar.gz"
sha256 = "not-a-digest"
)");
    REQUIRE(e.code == PinionError::Manifest);
    REQUIRE(e.message.find("malformed sha256") != std::string::npos);
}

TEST_CASE("revision list must hold strings", "[manifest]") {
    auto e = parse_error(R"(
[[packages]]
git = "https://example.com/x.git"
revision = ["v1", 2]
)");
    REQUIRE(e.code == PinionError::Manifest);
    REQUIRE(e.message.find("only strings") != std::string::npos);
}

TEST_CASE("packages must be an array of tables", "[manifest]") {
    auto e = parse_error("packages = \"libs\"\n");
    REQUIRE(e.code == PinionError::Manifest);
    REQUIRE(e.hint == "use [[packages]] entries");
}

// ===== Files =====

TEST_CASE("load manifest fixture", "[manifest]") {
    auto r = Manifest::load(fixture_dir() + "/project/pinion.toml");
    REQUIRE(r.is_ok());
    auto& m = r.value();
    REQUIRE(m.package.name == "analytics");
    REQUIRE(m.packages.size() == 4);
    REQUIRE(m.packages[0].local.has_value());
    REQUIRE(m.packages[1].git->subdirectory == std::optional<std::string>("core"));
    REQUIRE(m.packages[2].tarball->name == std::optional<std::string>("widgets"));
    REQUIRE(m.packages[3].registry->package == "acme/codegen");
}

TEST_CASE("load missing manifest", "[manifest]") {
    auto r = Manifest::load("/nonexistent/pinion.toml");
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == PinionError::IO);
}
