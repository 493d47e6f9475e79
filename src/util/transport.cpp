#include <pinion/transport.hpp>
#include <pinion/log.hpp>

#include <curl/curl.h>

#include <fstream>
#include <memory>
#include <mutex>

namespace fs = std::filesystem;

namespace pinion {

namespace {

constexpr char kUserAgent[] = "pinion/0.1";

size_t write_to_stream(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* stream = static_cast<std::ofstream*>(userdata);
    size_t total = size * nmemb;
    stream->write(ptr, static_cast<std::streamsize>(total));
    return *stream ? total : 0;
}

Status ensure_curl_initialized() {
    static std::once_flag once;
    static CURLcode init_code = CURLE_OK;
    std::call_once(once, [] { init_code = curl_global_init(CURL_GLOBAL_DEFAULT); });
    if (init_code != CURLE_OK) {
        return PinionError{PinionError::Network,
            std::string("curl_global_init failed: ") + curl_easy_strerror(init_code)};
    }
    return ok_status();
}

bool is_connection_code(CURLcode code) {
    switch (code) {
        case CURLE_COULDNT_RESOLVE_PROXY:
        case CURLE_COULDNT_RESOLVE_HOST:
        case CURLE_COULDNT_CONNECT:
        case CURLE_OPERATION_TIMEDOUT:
        case CURLE_PARTIAL_FILE:
        case CURLE_GOT_NOTHING:
        case CURLE_SEND_ERROR:
        case CURLE_RECV_ERROR:
        case CURLE_SSL_CONNECT_ERROR:
            return true;
        default:
            return false;
    }
}

} // namespace

DefaultTransport::DefaultTransport(int timeout_seconds)
    : timeout_seconds_(timeout_seconds) {
    git_.set_timeout(timeout_seconds);
}

Status DefaultTransport::http_download(const std::string& url, const fs::path& dest) {
    PINION_TRY(ensure_curl_initialized());

    std::ofstream output(dest, std::ios::binary | std::ios::trunc);
    if (!output.is_open()) {
        return PinionError{PinionError::IO, "cannot open " + dest.string() + " for writing"};
    }

    std::unique_ptr<CURL, decltype(&curl_easy_cleanup)> handle(curl_easy_init(),
                                                               &curl_easy_cleanup);
    if (!handle) {
        return PinionError{PinionError::Network, "curl_easy_init failed"};
    }

    char errbuf[CURL_ERROR_SIZE] = {0};
    CURL* h = handle.get();
    curl_easy_setopt(h, CURLOPT_URL, url.c_str());
    curl_easy_setopt(h, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(h, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(h, CURLOPT_NOPROGRESS, 1L);
    curl_easy_setopt(h, CURLOPT_USERAGENT, kUserAgent);
    curl_easy_setopt(h, CURLOPT_ERRORBUFFER, errbuf);
    curl_easy_setopt(h, CURLOPT_WRITEFUNCTION, write_to_stream);
    curl_easy_setopt(h, CURLOPT_WRITEDATA, &output);
    if (timeout_seconds_ > 0) {
        curl_easy_setopt(h, CURLOPT_TIMEOUT, static_cast<long>(timeout_seconds_));
    }

    log::debug("GET %s", url.c_str());
    CURLcode rc = curl_easy_perform(h);
    output.close();

    if (rc != CURLE_OK) {
        std::string why = errbuf[0] ? errbuf : curl_easy_strerror(rc);
        if (is_connection_code(rc)) {
            return PinionError{PinionError::Network, why};
        }
        return PinionError{PinionError::DownloadFailed, "download of " + url + " failed: " + why};
    }
    if (!output) {
        return PinionError{PinionError::IO, "failed writing " + dest.string()};
    }

    long status = 0;
    curl_easy_getinfo(h, CURLINFO_RESPONSE_CODE, &status);
    // file:// transfers report 0
    if (status >= 500) {
        return PinionError{PinionError::Network,
            "server error " + std::to_string(status) + " for " + url};
    }
    if (status >= 400) {
        return PinionError{PinionError::DownloadFailed,
            "HTTP " + std::to_string(status) + " for " + url};
    }
    return ok_status();
}

Status DefaultTransport::git_clone(const std::string& url, const std::string& revision,
                                   const fs::path& dest) {
    if (!git_checked_) {
        auto version = git_.check_version();
        if (version.is_err()) return std::move(version).error();
        log::debug("using git %s", version.value().c_str());
        git_checked_ = true;
    }
    PINION_TRY(git_.clone(url, dest.string()));
    if (revision != "HEAD") {
        PINION_TRY(git_.checkout(dest.string(), revision));
    }
    return ok_status();
}

static Status exhausted(const std::string& url, const RetryPolicy& policy,
                        Status last) {
    if (last.is_ok() || !is_connection_error(last.error())) return last;
    return PinionError{PinionError::DownloadFailed,
        "failed to download " + url + " after " +
        std::to_string(std::max(policy.max_attempts, 1)) + " attempts: " +
        last.error().message};
}

Status download_with_retry(Transport& transport, const std::string& url,
                           const fs::path& dest, const RetryPolicy& policy) {
    log::info("downloading %s", url.c_str());
    auto last = with_retry([&] { return transport.http_download(url, dest); },
                           policy, is_connection_error, "download");
    return exhausted(url, policy, std::move(last));
}

Status clone_with_retry(Transport& transport, const std::string& url,
                        const std::string& revision, const fs::path& dest,
                        const RetryPolicy& policy) {
    log::info("cloning %s at %s", url.c_str(), revision.c_str());
    auto last = with_retry([&]() -> Status {
        std::error_code ec;
        fs::remove_all(dest, ec);
        return transport.git_clone(url, revision, dest);
    }, policy, is_connection_error, "git clone");
    return exhausted(url, policy, std::move(last));
}

} // namespace pinion
