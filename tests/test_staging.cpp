#include <catch2/catch.hpp>
#include <pinion/staging.hpp>
#include "test_helpers.hpp"

#include <sys/stat.h>

#include <cstdlib>
#include <set>

using namespace pinion;
using namespace pinion_test;

TEST_CASE("random suffix is 16 lowercase hex chars", "[staging]") {
    std::set<std::string> seen;
    for (int i = 0; i < 50; ++i) {
        auto s = random_suffix();
        REQUIRE(s.size() == 16);
        REQUIRE(s.find_first_not_of("0123456789abcdef") == std::string::npos);
        seen.insert(s);
    }
    REQUIRE(seen.size() == 50);
}

TEST_CASE("labels are made safe for file names", "[staging]") {
    REQUIRE(sanitize_label("github.com/acme/widgets.git") == "github.com_acme_widgets.git");
    REQUIRE(sanitize_label("") == "pkg");
    REQUIRE(sanitize_label(std::string(100, 'x')).size() == 48);
}

TEST_CASE("scoped path removes on destruction", "[staging]") {
    TempDir td;
    auto dir = td.path / "owned";
    td.write_file("owned/inner/file.txt", "x");
    {
        ScopedPath p(dir);
        REQUIRE(p.path() == dir);
    }
    REQUIRE_FALSE(fs::exists(dir));
}

TEST_CASE("scoped path release keeps the file", "[staging]") {
    TempDir td;
    auto file = td.write_file("kept.txt", "x");
    {
        ScopedPath p(file);
        REQUIRE(p.release() == file);
        REQUIRE(p.empty());
    }
    REQUIRE(fs::exists(file));
}

TEST_CASE("scoped path moves ownership", "[staging]") {
    TempDir td;
    auto file = td.write_file("moved.txt", "x");
    ScopedPath outer;
    {
        ScopedPath inner(file);
        outer = std::move(inner);
    }
    REQUIRE(fs::exists(file));
    outer.reset();
    REQUIRE_FALSE(fs::exists(file));
}

TEST_CASE("download area creates private temp files", "[staging]") {
    TempDir td;
    DownloadArea area(td.path / "dl");

    auto a = area.make_temp_file("pkg", ".tar.gz");
    auto b = area.make_temp_file("pkg", ".tar.gz");
    REQUIRE(a.is_ok());
    REQUIRE(b.is_ok());
    REQUIRE(a.value().path() != b.value().path());
    REQUIRE(a.value().path().parent_path() == area.root());
    REQUIRE(a.value().path().filename().string().rfind("pinion-pkg-", 0) == 0);

    struct stat st;
    REQUIRE(::stat(a.value().path().c_str(), &st) == 0);
    REQUIRE((st.st_mode & 0777) == 0600);
    REQUIRE(fs::file_size(a.value().path()) == 0);
}

TEST_CASE("download area creates temp directories", "[staging]") {
    TempDir td;
    DownloadArea area(td.path / "dl");
    {
        auto d = area.make_temp_dir("pkg");
        REQUIRE(d.is_ok());
        REQUIRE(fs::is_directory(d.value().path()));
        REQUIRE(count_entries(area.root()) == 1);
    }
    REQUIRE(count_entries(area.root()) == 0);
}

TEST_CASE("download area root comes from the environment", "[staging]") {
    ::setenv("PINION_DOWNLOADS_DIR", "/tmp/pinion-env-downloads", 1);
    REQUIRE(DownloadArea::default_root() == fs::path("/tmp/pinion-env-downloads"));
    ::unsetenv("PINION_DOWNLOADS_DIR");
    REQUIRE(DownloadArea::default_root().filename() == "pinion-downloads");
}

TEST_CASE("replace path installs into a fresh location", "[staging]") {
    TempDir td;
    td.write_file("staged/a.txt", "new");
    auto dest = td.path / "nested" / "dest";

    REQUIRE(replace_path(td.path / "staged", dest).is_ok());
    REQUIRE(read_file(dest / "a.txt") == "new");
    REQUIRE_FALSE(fs::exists(td.path / "staged"));
}

TEST_CASE("replace path swaps out an existing install", "[staging]") {
    TempDir td;
    td.write_file("staged/a.txt", "new");
    td.write_file("dest/old.txt", "old");

    REQUIRE(replace_path(td.path / "staged", td.path / "dest").is_ok());
    REQUIRE(read_file(td.path / "dest" / "a.txt") == "new");
    REQUIRE_FALSE(fs::exists(td.path / "dest" / "old.txt"));
    // no backup left behind
    REQUIRE(count_entries(td.path) == 1);
}

TEST_CASE("replace path restores the previous install on failure", "[staging]") {
    TempDir td;
    td.write_file("dest/old.txt", "old");

    auto r = replace_path(td.path / "does-not-exist", td.path / "dest");
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == PinionError::InstallFailed);
    REQUIRE(read_file(td.path / "dest" / "old.txt") == "old");
    REQUIRE(count_entries(td.path) == 1);
}

TEST_CASE("replace path replaces a symlink without following it", "[staging]") {
    TempDir td;
    td.write_file("target/keep.txt", "keep");
    fs::create_directory_symlink(td.path / "target", td.path / "dest");
    td.write_file("staged/a.txt", "new");

    REQUIRE(replace_path(td.path / "staged", td.path / "dest").is_ok());
    REQUIRE_FALSE(fs::is_symlink(td.path / "dest"));
    REQUIRE(read_file(td.path / "target" / "keep.txt") == "keep");
}

TEST_CASE("copy tree copies recursively", "[staging]") {
    TempDir td;
    td.write_file("src/a/b.txt", "b");
    REQUIRE(copy_tree(td.path / "src", td.path / "dst").is_ok());
    REQUIRE(read_file(td.path / "dst" / "a" / "b.txt") == "b");
}
