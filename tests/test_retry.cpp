#include <catch2/catch.hpp>
#include <pinion/retry.hpp>
#include <pinion/transport.hpp>
#include "test_helpers.hpp"

using namespace pinion;
using namespace pinion_test;

TEST_CASE("backoff doubles up to the cap", "[retry]") {
    RetryPolicy p;
    p.initial_backoff = std::chrono::milliseconds(100);
    p.max_backoff = std::chrono::milliseconds(350);
    REQUIRE(p.backoff_for(1).count() == 100);
    REQUIRE(p.backoff_for(2).count() == 200);
    REQUIRE(p.backoff_for(3).count() == 350);
    REQUIRE(p.backoff_for(10).count() == 350);
}

TEST_CASE("zero initial backoff never sleeps", "[retry]") {
    REQUIRE(instant_retry().backoff_for(4).count() == 0);
}

TEST_CASE("with_retry returns the first success", "[retry]") {
    LogCapture capture;
    int calls = 0;
    auto r = with_retry([&]() -> Result<int> {
        if (++calls < 3) return network_error();
        return Result<int>::ok(calls);
    }, instant_retry(), is_connection_error);

    REQUIRE(r.is_ok());
    REQUIRE(r.value() == 3);
    REQUIRE(capture.count(log::Warn) == 2);
}

TEST_CASE("with_retry stops at the attempt budget", "[retry]") {
    LogCapture capture;
    int calls = 0;
    auto r = with_retry([&]() -> Status {
        ++calls;
        return network_error("timed out");
    }, instant_retry(3), is_connection_error);

    REQUIRE(r.is_err());
    REQUIRE(calls == 3);
    REQUIRE(r.error().message == "timed out");
}

TEST_CASE("with_retry does not retry other errors", "[retry]") {
    int calls = 0;
    auto r = with_retry([&]() -> Status {
        ++calls;
        return PinionError{PinionError::ChecksumMismatch, "bad digest"};
    }, instant_retry(), is_connection_error);

    REQUIRE(calls == 1);
    REQUIRE(r.error().code == PinionError::ChecksumMismatch);
}

TEST_CASE("download_with_retry recovers from transient failures", "[retry]") {
    LogCapture capture;
    TempDir td;
    FakeTransport t;
    t.payload = td.write_file("payload", "data");
    t.http_script = {network_error(), network_error()};

    auto dest = td.path / "out";
    auto s = download_with_retry(t, "https://example.com/a.tar.gz", dest, instant_retry());
    REQUIRE(s.is_ok());
    REQUIRE(t.http_calls == 3);
    REQUIRE(read_file(dest) == "data");
}

TEST_CASE("download_with_retry reports an exhausted budget", "[retry]") {
    LogCapture capture;
    TempDir td;
    FakeTransport t;
    t.http_script = {network_error(), network_error(), network_error(),
                     network_error(), network_error()};

    auto s = download_with_retry(t, "https://example.com/a.tar.gz", td.path / "out", instant_retry());
    REQUIRE(s.is_err());
    REQUIRE(t.http_calls == 5);
    REQUIRE(s.error().code == PinionError::DownloadFailed);
    REQUIRE(s.error().message ==
            "failed to download https://example.com/a.tar.gz after 5 attempts: connection reset");
}

TEST_CASE("download_with_retry passes permanent failures through", "[retry]") {
    TempDir td;
    FakeTransport t;
    t.http_script = {PinionError{PinionError::DownloadFailed, "HTTP 404"}};

    auto s = download_with_retry(t, "https://example.com/a.tar.gz", td.path / "out", instant_retry());
    REQUIRE(t.http_calls == 1);
    REQUIRE(s.error().message == "HTTP 404");
}

TEST_CASE("clone_with_retry clears the destination between attempts", "[retry]") {
    LogCapture capture;
    TempDir td;
    FakeTransport t;
    t.git_script = {network_error()};
    auto dest = td.path / "clone";
    fs::create_directories(dest / "leftover");

    t.populate_clone = [](const fs::path& d) {
        REQUIRE_FALSE(fs::exists(d / "leftover"));
    };
    auto s = clone_with_retry(t, "https://example.com/r.git", "HEAD", dest, instant_retry());
    REQUIRE(s.is_ok());
    REQUIRE(t.git_calls == 2);
}
