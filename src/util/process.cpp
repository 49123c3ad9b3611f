#include <pkglint/process.hpp>
#include <pkglint/log.hpp>

#include <cerrno>
#include <chrono>
#include <cstring>

#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

namespace pkglint {

namespace {

// Closes the owned descriptor on scope exit
struct Fd {
    int fd = -1;
    Fd() = default;
    explicit Fd(int f) : fd(f) {}
    Fd(const Fd&) = delete;
    Fd& operator=(const Fd&) = delete;
    ~Fd() { reset(); }
    void reset() {
        if (fd >= 0) ::close(fd);
        fd = -1;
    }
};

std::string errno_str(const char* what) {
    return std::string(what) + " failed: " + std::strerror(errno);
}

// Returns false at EOF
bool drain(Fd& fd, std::string& buf) {
    char chunk[4096];
    ssize_t n = ::read(fd.fd, chunk, sizeof(chunk));
    if (n > 0) {
        buf.append(chunk, static_cast<size_t>(n));
        return true;
    }
    if (n < 0 && (errno == EINTR || errno == EAGAIN)) return true;
    fd.reset();
    return false;
}

} // namespace

Result<ProcessOutput> run_process(const std::vector<std::string>& args,
                                  const ProcessOptions& options) {
    if (args.empty()) {
        return LintError{LintError::InvalidArg, "run_process: empty argv"};
    }

    std::vector<char*> argv;
    argv.reserve(args.size() + 1);
    for (const auto& a : args) argv.push_back(const_cast<char*>(a.c_str()));
    argv.push_back(nullptr);

    int out_pipe[2];
    int err_pipe[2];
    if (::pipe(out_pipe) != 0) {
        return LintError{LintError::IO, errno_str("pipe()")};
    }
    if (::pipe(err_pipe) != 0) {
        ::close(out_pipe[0]);
        ::close(out_pipe[1]);
        return LintError{LintError::IO, errno_str("pipe()")};
    }
    Fd out_r(out_pipe[0]), out_w(out_pipe[1]);
    Fd err_r(err_pipe[0]), err_w(err_pipe[1]);

    log::trace("exec: %s", args[0].c_str());

    pid_t pid = ::fork();
    if (pid < 0) {
        return LintError{LintError::IO, errno_str("fork()")};
    }

    if (pid == 0) {
        ::dup2(out_w.fd, STDOUT_FILENO);
        ::dup2(err_w.fd, STDERR_FILENO);
        ::close(out_r.fd);
        ::close(err_r.fd);
        ::close(out_w.fd);
        ::close(err_w.fd);
        if (!options.working_dir.empty() &&
            ::chdir(options.working_dir.c_str()) != 0) {
            _exit(127);
        }
        ::execvp(argv[0], argv.data());
        _exit(127);
    }

    out_w.reset();
    err_w.reset();

    ProcessOutput result;
    auto deadline = std::chrono::steady_clock::now() +
                    std::chrono::seconds(options.timeout_seconds);

    while (out_r.fd >= 0 || err_r.fd >= 0) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now()).count();
        if (remaining <= 0) {
            ::kill(pid, SIGKILL);
            ::waitpid(pid, nullptr, 0);
            return LintError{LintError::IO,
                "'" + args[0] + "' timed out after " +
                std::to_string(options.timeout_seconds) + "s"};
        }

        pollfd fds[2];
        nfds_t nfds = 0;
        if (out_r.fd >= 0) fds[nfds++] = {out_r.fd, POLLIN, 0};
        if (err_r.fd >= 0) fds[nfds++] = {err_r.fd, POLLIN, 0};

        int ready = ::poll(fds, nfds, static_cast<int>(remaining));
        if (ready < 0) {
            if (errno == EINTR) continue;
            ::kill(pid, SIGKILL);
            ::waitpid(pid, nullptr, 0);
            return LintError{LintError::IO, errno_str("poll()")};
        }

        for (nfds_t i = 0; i < nfds; ++i) {
            if (!(fds[i].revents & (POLLIN | POLLHUP | POLLERR))) continue;
            if (fds[i].fd == out_r.fd) {
                drain(out_r, result.out);
            } else {
                drain(err_r, result.err);
            }
        }
    }

    int status = 0;
    while (::waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            return LintError{LintError::IO, errno_str("waitpid()")};
        }
    }
    result.exit_code = WIFEXITED(status) ? WEXITSTATUS(status) : -1;
    return Result<ProcessOutput>::ok(std::move(result));
}

} // namespace pkglint
