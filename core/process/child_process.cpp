#include "child_process.hpp"

#include <errno.h>
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

#include <chrono>
#include <cstring>
#include <mutex>

#include "logging/logger.hpp"

namespace coderun {
namespace process {

namespace {

constexpr int kPollIntervalMs = 20;
constexpr size_t kReadChunk = 64 * 1024;
// After the child is reaped, give in-flight pipe data this long to arrive
constexpr std::chrono::milliseconds kDrainGrace{250};
// After SIGKILL, stop polling and block in waitpid
constexpr std::chrono::milliseconds kKillGrace{2000};

std::once_flag g_sigpipe_once;

void close_fd(int &fd) {
    if (fd >= 0) {
        close(fd);
        fd = -1;
    }
}

void close_pair(int (&fds)[2]) {
    close_fd(fds[0]);
    close_fd(fds[1]);
}

bool set_nonblocking(int fd) {
    int flags = fcntl(fd, F_GETFL, 0);
    if (flags < 0) {
        return false;
    }
    return fcntl(fd, F_SETFL, flags | O_NONBLOCK) == 0;
}

int64_t elapsed_ms(execution::Clock::time_point since) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(execution::Clock::now() - since).count();
}

}  // namespace

ChildProcess::ChildProcess(std::string label, ProcessSpec spec) : label_(std::move(label)), spec_(std::move(spec)) {}

ChildProcess::~ChildProcess() {
    if (pid_ > 0) {
        LOG_WARN("[" << label_ << "] Child still running at destruction, killing (pid=" << pid_ << ")");
        force_terminate();
        ProcessResult discard;
        reap(true, discard);
    }
    close_fds();
}

ProcessResult ChildProcess::run(const execution::ExecutionContext &ctx) {
    ProcessResult result;

    if (ctx.should_stop()) {
        result.spawn_error = "Deadline expired before spawn";
        result.cancelled = ctx.cancelled();
        return result;
    }

    if (!spawn(result)) {
        LOG_DEBUG("[" << label_ << "] Spawn failed: " << result.spawn_error);
        return result;
    }
    result.started = true;

    auto started_at = execution::Clock::now();
    pump(ctx, result);
    result.duration_ms = elapsed_ms(started_at);

    close_fds();
    return result;
}

bool ChildProcess::spawn(ProcessResult &result) {
    // A child closing its stdin early must surface as EPIPE, not kill us
    std::call_once(g_sigpipe_once, [] { signal(SIGPIPE, SIG_IGN); });

    int in_pipe[2] = {-1, -1};
    int out_pipe[2] = {-1, -1};
    int err_pipe[2] = {-1, -1};
    int exec_pipe[2] = {-1, -1};

    if (pipe2(in_pipe, O_CLOEXEC) < 0 || pipe2(out_pipe, O_CLOEXEC) < 0 || pipe2(err_pipe, O_CLOEXEC) < 0 ||
        pipe2(exec_pipe, O_CLOEXEC) < 0) {
        result.spawn_error = "Failed to create pipes: " + std::string(strerror(errno));
        close_pair(in_pipe);
        close_pair(out_pipe);
        close_pair(err_pipe);
        close_pair(exec_pipe);
        return false;
    }

    // Build argv before fork: the child may only call async-signal-safe functions
    std::vector<char *> argv;
    argv.reserve(spec_.args.size() + 2);
    argv.push_back(const_cast<char *>(spec_.executable.c_str()));
    for (const auto &arg : spec_.args) {
        argv.push_back(const_cast<char *>(arg.c_str()));
    }
    argv.push_back(nullptr);

    pid_t pid = fork();
    if (pid < 0) {
        result.spawn_error = "Fork failed: " + std::string(strerror(errno));
        close_pair(in_pipe);
        close_pair(out_pipe);
        close_pair(err_pipe);
        close_pair(exec_pipe);
        return false;
    }

    if (pid == 0) {
        // Child process
        setpgid(0, 0);
        dup2(in_pipe[0], STDIN_FILENO);
        dup2(out_pipe[1], STDOUT_FILENO);
        dup2(err_pipe[1], STDERR_FILENO);

        execvp(argv[0], argv.data());

        // exec failed: report errno through the close-on-exec pipe
        int err = errno;
        ssize_t ignored = write(exec_pipe[1], &err, sizeof(err));
        (void)ignored;
        _exit(127);
    }

    // Parent process. Both sides call setpgid to close the race with kill(-pgid).
    setpgid(pid, pid);
    pid_ = pid;

    close_fd(in_pipe[0]);
    close_fd(out_pipe[1]);
    close_fd(err_pipe[1]);
    close_fd(exec_pipe[1]);

    int exec_errno = 0;
    ssize_t n = 0;
    do {
        n = read(exec_pipe[0], &exec_errno, sizeof(exec_errno));
    } while (n < 0 && errno == EINTR);
    close_fd(exec_pipe[0]);

    stdin_fd_ = in_pipe[1];
    stdout_fd_ = out_pipe[0];
    stderr_fd_ = err_pipe[0];

    if (n == static_cast<ssize_t>(sizeof(exec_errno))) {
        result.spawn_error = "Cannot execute '" + spec_.executable + "': " + std::string(strerror(exec_errno));
        ProcessResult discard;
        reap(true, discard);
        close_fds();
        return false;
    }

    set_nonblocking(stdin_fd_);
    set_nonblocking(stdout_fd_);
    set_nonblocking(stderr_fd_);

    LOG_DEBUG("[" << label_ << "] Spawned " << spec_.executable << " (pid=" << pid_ << ")");
    return true;
}

void ChildProcess::pump(const execution::ExecutionContext &ctx, ProcessResult &result) {
    static const std::string kNoInput;
    const std::string &input = spec_.stdin_data ? *spec_.stdin_data : kNoInput;
    size_t input_offset = 0;
    if (input.empty()) {
        close_fd(stdin_fd_);
    }

    const size_t cap = spec_.max_output_bytes;
    auto drain = [&result, cap](int &fd, std::string &target) {
        char buf[kReadChunk];
        while (fd >= 0) {
            ssize_t n = read(fd, buf, sizeof(buf));
            if (n > 0) {
                size_t room = target.size() < cap ? cap - target.size() : 0;
                size_t take = static_cast<size_t>(n) < room ? static_cast<size_t>(n) : room;
                target.append(buf, take);
                if (take < static_cast<size_t>(n)) {
                    result.truncated = true;
                }
                continue;
            }
            if (n == 0) {
                close_fd(fd);
                return;
            }
            if (errno == EINTR) {
                continue;
            }
            if (errno != EAGAIN && errno != EWOULDBLOCK) {
                close_fd(fd);
            }
            return;
        }
    };

    bool reaped = false;
    execution::Clock::time_point reaped_at{};
    execution::Clock::time_point killed_at{};

    while (true) {
        if (!reaped && !result.killed && ctx.should_stop()) {
            result.killed = true;
            result.cancelled = ctx.cancelled();
            killed_at = execution::Clock::now();
            LOG_DEBUG("[" << label_ << "] " << (result.cancelled ? "Cancelled" : "Deadline reached")
                          << ", killing process group " << pid_);
            force_terminate();
            close_fd(stdin_fd_);
        }

        if (!reaped && reap(false, result)) {
            reaped = true;
            reaped_at = execution::Clock::now();
        }

        bool outputs_open = stdout_fd_ >= 0 || stderr_fd_ >= 0;
        if (reaped && !outputs_open) {
            break;
        }
        if (reaped && execution::Clock::now() - reaped_at > kDrainGrace) {
            LOG_DEBUG("[" << label_ << "] Output pipes still open after exit, abandoning drain");
            break;
        }
        if (!reaped && result.killed && execution::Clock::now() - killed_at > kKillGrace) {
            LOG_WARN("[" << label_ << "] Child slow to die after SIGKILL, blocking on waitpid");
            reap(true, result);
            reaped = true;
            reaped_at = execution::Clock::now();
            continue;
        }

        struct pollfd pfds[3];
        nfds_t nfds = 0;
        int stdout_idx = -1;
        int stderr_idx = -1;
        int stdin_idx = -1;
        if (stdout_fd_ >= 0) {
            stdout_idx = static_cast<int>(nfds);
            pfds[nfds++] = {stdout_fd_, POLLIN, 0};
        }
        if (stderr_fd_ >= 0) {
            stderr_idx = static_cast<int>(nfds);
            pfds[nfds++] = {stderr_fd_, POLLIN, 0};
        }
        if (stdin_fd_ >= 0) {
            stdin_idx = static_cast<int>(nfds);
            pfds[nfds++] = {stdin_fd_, POLLOUT, 0};
        }

        int rc = poll(pfds, nfds, kPollIntervalMs);
        if (rc < 0) {
            if (errno == EINTR) {
                continue;
            }
            LOG_ERROR("[" << label_ << "] poll failed: " << strerror(errno));
            force_terminate();
            result.killed = true;
            reap(true, result);
            break;
        }
        if (rc == 0) {
            continue;
        }

        if (stdout_idx >= 0 && pfds[stdout_idx].revents != 0) {
            drain(stdout_fd_, result.stdout_data);
        }
        if (stderr_idx >= 0 && pfds[stderr_idx].revents != 0) {
            drain(stderr_fd_, result.stderr_data);
        }
        if (stdin_idx >= 0 && pfds[stdin_idx].revents != 0) {
            if ((pfds[stdin_idx].revents & (POLLERR | POLLHUP | POLLNVAL)) != 0) {
                close_fd(stdin_fd_);
                continue;
            }
            ssize_t w = write(stdin_fd_, input.data() + input_offset, input.size() - input_offset);
            if (w > 0) {
                input_offset += static_cast<size_t>(w);
                if (input_offset >= input.size()) {
                    close_fd(stdin_fd_);
                }
            } else if (w < 0 && errno != EINTR && errno != EAGAIN && errno != EWOULDBLOCK) {
                // EPIPE: child stopped reading, which is its business
                close_fd(stdin_fd_);
            }
        }
    }
}

bool ChildProcess::reap(bool block, ProcessResult &result) {
    if (pid_ <= 0) {
        return true;
    }

    int status = 0;
    pid_t rc;
    do {
        rc = waitpid(pid_, &status, block ? 0 : WNOHANG);
    } while (rc < 0 && errno == EINTR);

    if (rc == 0) {
        return false;
    }

    if (rc == pid_) {
        if (WIFEXITED(status)) {
            result.exit_code = WEXITSTATUS(status);
        } else if (WIFSIGNALED(status)) {
            result.term_signal = WTERMSIG(status);
        }
    } else if (errno != ECHILD) {
        LOG_WARN("[" << label_ << "] waitpid failed: " << strerror(errno));
    }

    // Anything the child left behind in its group goes with it
    kill(-pid_, SIGKILL);
    pid_ = -1;
    return true;
}

void ChildProcess::force_terminate() {
    if (pid_ > 0) {
        kill(-pid_, SIGKILL);
        kill(pid_, SIGKILL);
    }
}

void ChildProcess::close_fds() {
    close_fd(stdin_fd_);
    close_fd(stdout_fd_);
    close_fd(stderr_fd_);
}

}  // namespace process
}  // namespace coderun
