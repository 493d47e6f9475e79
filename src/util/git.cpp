#include <pinion/git.hpp>
#include <pinion/log.hpp>

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <chrono>
#include <cstdio>
#include <cstring>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

namespace pinion {

// ---------------------------------------------------------------------------
// Subprocess
// ---------------------------------------------------------------------------

static void drain(int fd, std::string& out) {
    char buf[4096];
    ssize_t n;
    while ((n = read(fd, buf, sizeof(buf))) > 0) {
        out.append(buf, static_cast<size_t>(n));
    }
}

static void close_pair(int fds[2]) {
    if (fds[0] >= 0) close(fds[0]);
    if (fds[1] >= 0) close(fds[1]);
}

Result<CommandResult> run_command(const std::vector<std::string>& args,
                                  const std::string& working_dir,
                                  int timeout_seconds) {
    if (args.empty()) {
        return PinionError{PinionError::InvalidArg, "run_command: empty args"};
    }

    std::vector<const char*> argv;
    argv.reserve(args.size() + 1);
    for (const auto& a : args) argv.push_back(a.c_str());
    argv.push_back(nullptr);

    int out_pipe[2] = {-1, -1};
    int err_pipe[2] = {-1, -1};
    if (pipe(out_pipe) != 0 || pipe(err_pipe) != 0) {
        int saved = errno;
        close_pair(out_pipe);
        close_pair(err_pipe);
        return PinionError{PinionError::IO,
            std::string("pipe() failed: ") + strerror(saved)};
    }

    pid_t pid = fork();
    if (pid < 0) {
        int saved = errno;
        close_pair(out_pipe);
        close_pair(err_pipe);
        return PinionError{PinionError::IO,
            std::string("fork() failed: ") + strerror(saved)};
    }

    if (pid == 0) {
        close(out_pipe[0]);
        close(err_pipe[0]);
        dup2(out_pipe[1], STDOUT_FILENO);
        dup2(err_pipe[1], STDERR_FILENO);
        close(out_pipe[1]);
        close(err_pipe[1]);

        if (!working_dir.empty() && chdir(working_dir.c_str()) != 0) {
            _exit(127);
        }
        execvp(argv[0], const_cast<char* const*>(argv.data()));
        _exit(127);
    }

    close(out_pipe[1]);
    close(err_pipe[1]);
    fcntl(out_pipe[0], F_SETFL, O_NONBLOCK);
    fcntl(err_pipe[0], F_SETFL, O_NONBLOCK);

    std::string out_buf, err_buf;
    const auto deadline = std::chrono::steady_clock::now() +
                          std::chrono::seconds(timeout_seconds);

    for (;;) {
        if (std::chrono::steady_clock::now() >= deadline) {
            kill(pid, SIGKILL);
            waitpid(pid, nullptr, 0);
            close(out_pipe[0]);
            close(err_pipe[0]);
            return PinionError{PinionError::IO,
                args[0] + " timed out after " + std::to_string(timeout_seconds) + "s"};
        }

        pollfd fds[2] = {{out_pipe[0], POLLIN, 0}, {err_pipe[0], POLLIN, 0}};
        poll(fds, 2, 50);
        drain(out_pipe[0], out_buf);
        drain(err_pipe[0], err_buf);

        int status = 0;
        pid_t w = waitpid(pid, &status, WNOHANG);
        if (w == pid) {
            drain(out_pipe[0], out_buf);
            drain(err_pipe[0], err_buf);
            close(out_pipe[0]);
            close(err_pipe[0]);
            int exit_code = WIFEXITED(status) ? WEXITSTATUS(status) : -1;
            return Result<CommandResult>::ok(
                CommandResult{exit_code, std::move(out_buf), std::move(err_buf)});
        }
        if (w < 0) {
            int saved = errno;
            close(out_pipe[0]);
            close(err_pipe[0]);
            return PinionError{PinionError::IO,
                std::string("waitpid failed: ") + strerror(saved)};
        }
    }
}

static std::string trim_trailing(std::string s) {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) {
        s.pop_back();
    }
    return s;
}

bool is_git_connection_failure(const std::string& stderr_text) {
    static const char* const markers[] = {
        "Could not resolve host",
        "Connection refused",
        "Connection reset",
        "Connection timed out",
        "Operation timed out",
        "early EOF",
        "the remote end hung up unexpectedly",
        "Failed to connect",
    };
    for (const char* m : markers) {
        if (stderr_text.find(m) != std::string::npos) return true;
    }
    return false;
}

// ---------------------------------------------------------------------------
// GitCli
// ---------------------------------------------------------------------------

Result<std::string> GitCli::check_version() {
    auto r = run_command({"git", "--version"}, "", timeout_seconds_);
    if (r.is_err()) return std::move(r).error();

    auto& cmd = r.value();
    if (cmd.exit_code != 0) {
        return PinionError{PinionError::NotFound,
            "git not found or failed", "install git >= 2.20"};
    }

    std::string out = trim_trailing(cmd.stdout_str);
    auto pos = out.find("git version ");
    if (pos == std::string::npos) {
        return PinionError{PinionError::Parse,
            "unexpected git --version output: " + out};
    }
    std::string ver_str = out.substr(pos + 12);

    int major = 0, minor = 0;
    if (sscanf(ver_str.c_str(), "%d.%d", &major, &minor) < 2) {
        return PinionError{PinionError::Parse,
            "cannot parse git version: " + ver_str};
    }
    if (major < 2 || (major == 2 && minor < 20)) {
        return PinionError{PinionError::Version,
            "git version " + ver_str + " too old", "upgrade to git >= 2.20"};
    }
    return Result<std::string>::ok(std::move(ver_str));
}

Status GitCli::clone(const std::string& url, const std::string& dest) {
    log::debug("git clone %s %s", url.c_str(), dest.c_str());
    auto r = run_command({"git", "clone", "--quiet", "--", url, dest}, "", timeout_seconds_);
    if (r.is_err()) {
        // A timed-out clone is worth another attempt
        auto e = std::move(r).error();
        return PinionError{PinionError::Network, "git clone " + url + ": " + e.message};
    }

    auto& cmd = r.value();
    if (cmd.exit_code != 0) {
        std::string why = trim_trailing(cmd.stderr_str);
        if (is_git_connection_failure(why)) {
            return PinionError{PinionError::Network,
                "git clone " + url + " failed: " + why};
        }
        return PinionError{PinionError::DownloadFailed,
            "git clone " + url + " failed: " + why};
    }
    return ok_status();
}

Status GitCli::checkout(const std::string& repo, const std::string& revision) {
    log::debug("git -C %s checkout %s", repo.c_str(), revision.c_str());
    auto r = run_command({"git", "-C", repo, "checkout", "--quiet", revision, "--"},
                         "", timeout_seconds_);
    if (r.is_err()) return std::move(r).error();

    if (r.value().exit_code != 0) {
        return PinionError{PinionError::NotFound,
            "git checkout " + revision + " failed: " + trim_trailing(r.value().stderr_str)};
    }
    return ok_status();
}

} // namespace pinion
