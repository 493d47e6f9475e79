#include <catch2/catch.hpp>
#include <pinion/sha256.hpp>
#include <pinion/tarball.hpp>
#include "test_helpers.hpp"

#include <cctype>

using namespace pinion;
using namespace pinion_test;

static TarballRequest request(const std::string& reference) {
    TarballRequest req;
    req.reference = reference;
    req.label = "example";
    return req;
}

TEST_CASE("local tarball is staged and installed", "[tarball]") {
    TempDir td;
    auto tgz = write_package_tarball(td, "pkg.tar.gz", "dir_1", "example");
    auto ctx = test_context(td);

    auto staged = stage_tarball(request(tgz.string()), ctx);
    REQUIRE(staged.is_ok());
    REQUIRE(staged.value().origin == ArchiveOrigin::Local);
    REQUIRE(staged.value().archive_path == tgz);
    REQUIRE(fs::is_regular_file(staged.value().package_root / "pinion.toml"));

    auto dest = ctx.install_root / "example";
    REQUIRE(install_staged(staged.value(), dest).is_ok());
    REQUIRE(read_file(dest / "src" / "example.txt") == "contents of example\n");
    REQUIRE(fs::exists(tgz));
    REQUIRE(count_entries(ctx.downloads.root()) == 0);
}

TEST_CASE("relative paths resolve against the project root", "[tarball]") {
    TempDir td;
    write_package_tarball(td, "vendor/pkg.tar.gz", "pkg", "example");
    auto ctx = test_context(td);

    auto staged = stage_tarball(request("vendor/pkg.tar.gz"), ctx);
    REQUIRE(staged.is_ok());
    REQUIRE(staged.value().origin == ArchiveOrigin::Local);
}

TEST_CASE("file URLs are read in place", "[tarball]") {
    TempDir td;
    auto tgz = write_package_tarball(td, "pkg.tar.gz", "pkg", "example");
    FakeTransport transport;
    auto ctx = test_context(td, &transport);

    auto staged = stage_tarball(request("file://" + tgz.string()), ctx);
    REQUIRE(staged.is_ok());
    REQUIRE(transport.http_calls == 0);
}

TEST_CASE("remote tarball is downloaded into the download area", "[tarball]") {
    LogCapture capture;
    TempDir td;
    FakeTransport transport;
    transport.payload = write_package_tarball(td, "served.tar.gz", "pkg-1.0", "example");
    transport.http_script = {network_error()};
    auto ctx = test_context(td, &transport);

    auto staged = stage_tarball(request("https://example.com/pkg.tar.gz"), ctx);
    REQUIRE(staged.is_ok());
    REQUIRE(transport.http_calls == 2);
    REQUIRE(staged.value().origin == ArchiveOrigin::Remote);
    // Only the staging directory remains; the download is gone
    REQUIRE(count_entries(ctx.downloads.root()) == 1);
    REQUIRE(staged.value().staging.path().parent_path() == ctx.downloads.root());

    REQUIRE(install_staged(staged.value(), ctx.install_root / "example").is_ok());
    REQUIRE(count_entries(ctx.downloads.root()) == 0);
}

TEST_CASE("staged files are removed when the result is dropped", "[tarball]") {
    TempDir td;
    FakeTransport transport;
    transport.payload = write_package_tarball(td, "served.tar.gz", "pkg", "example");
    auto ctx = test_context(td, &transport);
    {
        auto staged = stage_tarball(request("https://example.com/pkg.tar.gz"), ctx);
        REQUIRE(staged.is_ok());
        REQUIRE(count_entries(ctx.downloads.root()) == 1);
    }
    REQUIRE(count_entries(ctx.downloads.root()) == 0);
}

TEST_CASE("failed download leaves nothing behind", "[tarball]") {
    LogCapture capture;
    TempDir td;
    FakeTransport transport;
    for (int i = 0; i < 5; ++i) transport.http_script.push_back(network_error());
    auto ctx = test_context(td, &transport);

    auto staged = stage_tarball(request("https://example.com/pkg.tar.gz"), ctx);
    REQUIRE(staged.is_err());
    REQUIRE(staged.error().code == PinionError::DownloadFailed);
    REQUIRE(staged.error().message.find("after 5 attempts") != std::string::npos);
    REQUIRE(count_entries(ctx.downloads.root()) == 0);
}

TEST_CASE("remote tarball without a transport", "[tarball]") {
    TempDir td;
    auto ctx = test_context(td);
    auto staged = stage_tarball(request("https://example.com/pkg.tar.gz"), ctx);
    REQUIRE(staged.is_err());
    REQUIRE(staged.error().code == PinionError::InvalidArg);
}

TEST_CASE("checksum is verified before extraction", "[tarball]") {
    TempDir td;
    auto tgz = write_package_tarball(td, "pkg.tar.gz", "pkg", "example");
    auto ctx = test_context(td);
    auto actual = SHA256::hash_file(tgz);
    REQUIRE(actual.is_ok());

    SECTION("matching digest, any case") {
        auto req = request(tgz.string());
        std::string upper = actual.value();
        for (auto& c : upper) c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
        req.sha256 = upper;
        REQUIRE(stage_tarball(req, ctx).is_ok());
    }

    SECTION("wrong digest") {
        auto req = request(tgz.string());
        req.sha256 = std::string(64, '0');
        auto staged = stage_tarball(req, ctx);
        REQUIRE(staged.is_err());
        REQUIRE(staged.error().code == PinionError::ChecksumMismatch);
        REQUIRE(staged.error().message ==
                "Checksum mismatch for tarball example: expected " + std::string(64, '0') +
                ", got " + actual.value());
        REQUIRE(count_entries(ctx.downloads.root()) == 0);
    }
}

TEST_CASE("checksum mismatch is reported before any archive check", "[tarball]") {
    TempDir td;
    auto ctx = test_context(td);
    auto req_for = [](const fs::path& p) {
        auto req = request(p.string());
        req.sha256 = std::string(64, '0');
        return req;
    };

    SECTION("archive that is also too large") {
        auto tgz = td.path / "big.tar.gz";
        write_tarball(tgz, {dir_member("pkg/"),
                            file_member("pkg/blob", std::string(1000001, 'a'))});
        auto staged = stage_tarball(req_for(tgz), ctx);
        REQUIRE(staged.is_err());
        REQUIRE(staged.error().code == PinionError::ChecksumMismatch);
    }

    SECTION("archive without a package root") {
        auto tgz = td.path / "flat.tar.gz";
        write_tarball(tgz, {file_member("a.txt", "a"), file_member("b.txt", "b")});
        auto staged = stage_tarball(req_for(tgz), ctx);
        REQUIRE(staged.is_err());
        REQUIRE(staged.error().code == PinionError::ChecksumMismatch);
        REQUIRE(count_entries(ctx.downloads.root()) == 0);
        REQUIRE_FALSE(fs::exists(ctx.install_root));
    }
}

TEST_CASE("oversized tarball is refused", "[tarball]") {
    TempDir td;
    auto ctx = test_context(td);

    SECTION("one byte over the default limit") {
        auto tgz = td.path / "big.tar.gz";
        write_tarball(tgz, {dir_member("pkg/"),
                            file_member("pkg/blob", std::string(1000001, 'a'))});
        auto staged = stage_tarball(request(tgz.string()), ctx);
        REQUIRE(staged.is_err());
        REQUIRE(staged.error().code == PinionError::ArchiveTooLarge);
        REQUIRE_FALSE(fs::exists(ctx.install_root));
    }

    SECTION("exactly the limit") {
        auto tgz = td.path / "edge.tar.gz";
        write_tarball(tgz, {dir_member("pkg/"),
                            file_member("pkg/blob", std::string(1000000, 'a'))});
        REQUIRE(stage_tarball(request(tgz.string()), ctx).is_ok());
    }

    SECTION("configured limit") {
        ctx.max_tarball_size = 10;
        auto tgz = write_package_tarball(td, "pkg.tar.gz", "pkg", "example");
        auto staged = stage_tarball(request(tgz.string()), ctx);
        REQUIRE(staged.is_err());
        REQUIRE(staged.error().code == PinionError::ArchiveTooLarge);
    }
}

TEST_CASE("subdirectory selects the package root", "[tarball]") {
    TempDir td;
    auto tgz = td.path / "two.tar.gz";
    write_tarball(tgz, {
        dir_member("dir_1/"),
        file_member("dir_1/pinion.toml", "[package]\nname = \"one\"\n"),
        dir_member("dir_2/"),
        file_member("dir_2/pinion.toml", "[package]\nname = \"two\"\n"),
    });
    auto ctx = test_context(td);

    SECTION("declared") {
        auto req = request(tgz.string());
        req.subdirectory = "dir_2";
        auto staged = stage_tarball(req, ctx);
        REQUIRE(staged.is_ok());
        REQUIRE(staged.value().package_root.filename() == "dir_2");
    }

    SECTION("missing") {
        auto staged = stage_tarball(request(tgz.string()), ctx);
        REQUIRE(staged.is_err());
        REQUIRE(staged.error().code == PinionError::MalformedPackageStructure);
    }

    SECTION("not present") {
        auto req = request(tgz.string());
        req.subdirectory = "dir_9";
        auto staged = stage_tarball(req, ctx);
        REQUIRE(staged.is_err());
        REQUIRE(staged.error().code == PinionError::SubdirectoryNotFound);
    }
}

TEST_CASE("install replaces a previous install", "[tarball]") {
    TempDir td;
    auto ctx = test_context(td);
    auto dest = ctx.install_root / "example";
    td.write_file("pinion_packages/example/stale.txt", "old");

    auto tgz = write_package_tarball(td, "pkg.tar.gz", "pkg", "example");
    auto staged = stage_tarball(request(tgz.string()), ctx);
    REQUIRE(staged.is_ok());
    REQUIRE(install_staged(staged.value(), dest).is_ok());
    REQUIRE_FALSE(fs::exists(dest / "stale.txt"));
    REQUIRE(fs::exists(dest / "pinion.toml"));
    REQUIRE(count_entries(ctx.install_root) == 1);
}

TEST_CASE("installing twice from one staging fails", "[tarball]") {
    TempDir td;
    auto ctx = test_context(td);
    auto tgz = write_package_tarball(td, "pkg.tar.gz", "pkg", "example");
    auto staged = stage_tarball(request(tgz.string()), ctx);
    REQUIRE(staged.is_ok());
    REQUIRE(install_staged(staged.value(), ctx.install_root / "a").is_ok());

    auto again = install_staged(staged.value(), ctx.install_root / "b");
    REQUIRE(again.is_err());
    REQUIRE(again.error().code == PinionError::InstallFailed);
}
