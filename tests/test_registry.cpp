#include <catch2/catch.hpp>
#include <pinion/registry.hpp>

#include <cstdlib>
#include <filesystem>

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

static const char* kSmallIndex = R"(
[[package]]
id = "org/b"
[[package.version]]
version = "1.10.0"
tarball = "https://example.com/b-1.10.0.tar.gz"
[[package.version]]
version = "1.2.0"
tarball = "https://example.com/b-1.2.0.tar.gz"
[[package.version]]
version = "1.2.0-rc1"
tarball = "https://example.com/b-1.2.0-rc1.tar.gz"

[[package]]
id = "org/a"
)";

TEST_CASE("index lists package ids", "[registry]") {
    auto r = TomlRegistryIndex::parse(kSmallIndex);
    REQUIRE(r.is_ok());
    auto names = r.value().list_package_names();
    REQUIRE(names.is_ok());
    REQUIRE(names.value() == std::vector<std::string>{"org/a", "org/b"});
}

TEST_CASE("versions come back in version order", "[registry]") {
    auto r = TomlRegistryIndex::parse(kSmallIndex);
    REQUIRE(r.is_ok());
    auto versions = r.value().list_versions("org/b");
    REQUIRE(versions.is_ok());
    REQUIRE(versions.value() ==
            std::vector<std::string>{"1.2.0-rc1", "1.2.0", "1.10.0"});

    auto none = r.value().list_versions("org/a");
    REQUIRE(none.is_ok());
    REQUIRE(none.value().empty());
}

TEST_CASE("unknown package is not found", "[registry]") {
    auto r = TomlRegistryIndex::parse(kSmallIndex);
    REQUIRE(r.is_ok());
    auto versions = r.value().list_versions("org/zzz");
    REQUIRE(versions.is_err());
    REQUIRE(versions.error().code == PinionError::NotFound);

    auto meta = r.value().fetch_version_metadata("org/b", "9.9.9");
    REQUIRE(meta.is_err());
    REQUIRE(meta.error().code == PinionError::NotFound);
}

TEST_CASE("unparseable versions sort first", "[registry]") {
    auto r = TomlRegistryIndex::parse(R"(
[[package]]
id = "org/x"
[[package.version]]
version = "1.0.0"
tarball = "a"
[[package.version]]
version = "nightly"
tarball = "b"
)");
    REQUIRE(r.is_ok());
    REQUIRE(r.value().list_versions("org/x").value() ==
            std::vector<std::string>{"nightly", "1.0.0"});
}

TEST_CASE("duplicate package id", "[registry]") {
    auto r = TomlRegistryIndex::parse(R"(
[[package]]
id = "org/x"
[[package]]
id = "org/x"
)");
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == PinionError::Duplicate);
}

TEST_CASE("version entry requires a tarball", "[registry]") {
    auto r = TomlRegistryIndex::parse(R"(
[[package]]
id = "org/x"
[[package.version]]
version = "1.0.0"
)");
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == PinionError::Parse);
    REQUIRE(r.error().message.find("'tarball' is required") != std::string::npos);
}

TEST_CASE("version dependencies are validated", "[registry]") {
    auto r = TomlRegistryIndex::parse(R"(
[[package]]
id = "org/x"
[[package.version]]
version = "1.0.0"
tarball = "a"
packages = [ { package = "org/y" } ]
)");
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == PinionError::Manifest);
}

TEST_CASE("load index fixture", "[registry]") {
    auto path = fixture_dir() + "/registry/index.toml";
    auto r = TomlRegistryIndex::load(path);
    REQUIRE(r.is_ok());
    auto& index = r.value();

    REQUIRE(index.list_versions("acme/codegen").value() ==
            std::vector<std::string>{"0.3.1", "0.4.0", "0.5.0-rc1"});

    auto meta = index.fetch_version_metadata("acme/codegen", "0.3.1");
    REQUIRE(meta.is_ok());
    REQUIRE(meta.value().name == "codegen");
    REQUIRE(meta.value().download_url ==
            "https://registry.example.com/acme/codegen/0.3.1.tar.gz");
    REQUIRE(meta.value().sha256.has_value());
    REQUIRE(meta.value().packages.size() == 1);
    REQUIRE(meta.value().packages[0].registry->package == "acme/utils");

    // relative tarball paths are taken from the index directory
    auto local = index.fetch_version_metadata("acme/codegen", "0.4.0");
    REQUIRE(local.is_ok());
    auto expected = (std::filesystem::absolute(path).parent_path() /
                     "tarballs/codegen-0.4.0.tar.gz").lexically_normal();
    REQUIRE(local.value().download_url == expected.string());

    auto abs = index.fetch_version_metadata("acme/utils", "1.2.0");
    REQUIRE(abs.value().download_url == "/srv/registry/utils-1.2.0.tar.gz");
    REQUIRE(abs.value().name.empty());
}

TEST_CASE("load missing index", "[registry]") {
    auto r = TomlRegistryIndex::load("/nonexistent/index.toml");
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == PinionError::IO);
}
