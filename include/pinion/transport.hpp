#pragma once

#include <pinion/git.hpp>
#include <pinion/result.hpp>
#include <pinion/retry.hpp>

#include <filesystem>
#include <string>

namespace pinion {

// Network primitives used by package sources. Implementations make a
// single attempt; retrying is the caller's business (see with_retry).
// Connection-level failures must be reported as PinionError::Network.
class Transport {
public:
    virtual ~Transport() = default;

    // Writes the response body to `dest`, truncating it first
    virtual Status http_download(const std::string& url,
                                 const std::filesystem::path& dest) = 0;

    // Clones `url` into the not-yet-existing directory `dest` and checks
    // out `revision` ("HEAD" keeps the default branch)
    virtual Status git_clone(const std::string& url, const std::string& revision,
                             const std::filesystem::path& dest) = 0;
};

// libcurl for HTTP(S) and file:// URLs, the git CLI for clones. The git
// version is checked before the first clone.
class DefaultTransport : public Transport {
public:
    explicit DefaultTransport(int timeout_seconds = 300);

    Status http_download(const std::string& url,
                         const std::filesystem::path& dest) override;
    Status git_clone(const std::string& url, const std::string& revision,
                     const std::filesystem::path& dest) override;

private:
    GitCli git_;
    int timeout_seconds_;
    bool git_checked_ = false;
};

// Retries connection-level failures per `policy`. An exhausted budget
// becomes DownloadFailed naming the URL and the attempt count.
Status download_with_retry(Transport& transport, const std::string& url,
                           const std::filesystem::path& dest,
                           const RetryPolicy& policy);

// Same for clones; `dest` is cleared before every attempt
Status clone_with_retry(Transport& transport, const std::string& url,
                        const std::string& revision,
                        const std::filesystem::path& dest,
                        const RetryPolicy& policy);

} // namespace pinion
