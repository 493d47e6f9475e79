#pragma once

#include <pinion/result.hpp>
#include <string>
#include <vector>

namespace pinion {

struct CommandResult {
    int exit_code;
    std::string stdout_str;
    std::string stderr_str;
};

// Run an external command, capturing stdout and stderr.
// Fails with IO on pipe/fork/wait failure and on timeout.
Result<CommandResult> run_command(const std::vector<std::string>& args,
                                  const std::string& working_dir = "",
                                  int timeout_seconds = 60);

// True if git's stderr describes a connection-level failure (DNS, refused,
// reset, timed out) rather than a bad URL or a missing revision.
bool is_git_connection_failure(const std::string& stderr_text);

// Thin wrapper around the git command line
class GitCli {
public:
    // git >= 2.20 must be on PATH
    Result<std::string> check_version();

    // `git clone --quiet -- <url> <dest>`. Connection-level failures are
    // reported as Network so callers may retry them.
    Status clone(const std::string& url, const std::string& dest);

    // `git -C <repo> checkout --quiet <revision> --`
    Status checkout(const std::string& repo, const std::string& revision);

    void set_timeout(int seconds) { timeout_seconds_ = seconds; }
    int timeout() const { return timeout_seconds_; }

private:
    int timeout_seconds_ = 300;
};

} // namespace pinion
