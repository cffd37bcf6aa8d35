#include "process/process_runner.hpp"
#include "process/failure_classifier.hpp"
#include "utils/error_log.hpp"
#include "utils/logger.hpp"
#include <array>
#include <cerrno>
#include <cstring>
#include <thread>
#include <vector>
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <spawn.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

extern char** environ;

namespace transcode_bench {
namespace {

// How often a running process is checked for timeout and cancellation
constexpr std::chrono::milliseconds kPollInterval{100};
// Sleep between reap attempts once the output pipe has closed
constexpr std::chrono::milliseconds kReapInterval{10};
constexpr size_t kReadChunkSize = 4096;

// RAII owner of a file descriptor
class UniqueFd {
public:
    UniqueFd() = default;
    explicit UniqueFd(int fd) : fd_(fd) {}
    ~UniqueFd() { reset(); }

    UniqueFd(const UniqueFd&) = delete;
    UniqueFd& operator=(const UniqueFd&) = delete;

    int get() const { return fd_; }

    void reset(int fd = -1) {
        if (fd_ >= 0) {
            close(fd_);
        }
        fd_ = fd;
    }

private:
    int fd_ = -1;
};

// RAII owner of posix_spawn attributes and file actions
struct SpawnSetup {
    posix_spawnattr_t attr;
    posix_spawn_file_actions_t actions;

    SpawnSetup() {
        posix_spawnattr_init(&attr);
        posix_spawn_file_actions_init(&actions);
    }

    ~SpawnSetup() {
        posix_spawn_file_actions_destroy(&actions);
        posix_spawnattr_destroy(&attr);
    }

    SpawnSetup(const SpawnSetup&) = delete;
    SpawnSetup& operator=(const SpawnSetup&) = delete;
};

// Close-on-exec so that workers spawned concurrently by other threads never
// inherit this pipe and hold it open
bool createPipe(int fds[2]) {
#if defined(__linux__)
    return pipe2(fds, O_CLOEXEC) == 0;
#else
    if (pipe(fds) != 0) {
        return false;
    }
    fcntl(fds[0], F_SETFD, FD_CLOEXEC);
    fcntl(fds[1], F_SETFD, FD_CLOEXEC);
    return true;
#endif
}

// Read everything currently available; returns false once the pipe is closed
bool drainPipe(int fd, std::string& output) {
    std::array<char, kReadChunkSize> buf{};
    while (true) {
        ssize_t r = read(fd, buf.data(), buf.size());
        if (r > 0) {
            output.append(buf.data(), static_cast<size_t>(r));
            continue;
        }
        if (r == 0) {
            return false;
        }
        if (errno == EINTR) {
            continue;
        }
        if (errno == EAGAIN || errno == EWOULDBLOCK) {
            return true;
        }
        return false;
    }
}

void killProcessGroup(pid_t pid) {
    // The child leads its own group; fall back to the pid alone if the group
    // is already gone
    if (kill(-pid, SIGKILL) != 0) {
        kill(pid, SIGKILL);
    }
}

int reapBlocking(pid_t pid) {
    int status = 0;
    while (waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            return -1;
        }
    }
    return status;
}

} // namespace

ProcessRunner::ProcessRunner(Command command, std::chrono::milliseconds timeout,
                             ErrorLog* error_log)
    : command_(std::move(command))
    , timeout_(timeout)
    , error_log_(error_log) {
}

ProcessRunResult ProcessRunner::run(const std::atomic<bool>* cancel_flag) {
    using Clock = std::chrono::steady_clock;

    ProcessRunResult result;

    if (command_.empty()) {
        result.failure = FailureReason::processError("empty command");
        recordFailure(result);
        return result;
    }

    int fds[2] = {-1, -1};
    if (!createPipe(fds)) {
        result.failure = FailureReason::processError(
            std::string("failed to create pipe: ") + std::strerror(errno));
        recordFailure(result);
        return result;
    }
    UniqueFd read_end(fds[0]);
    UniqueFd write_end(fds[1]);

    std::vector<char*> argv;
    argv.reserve(command_.argv.size() + 1);
    for (const auto& arg : command_.argv) {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }
    argv.push_back(nullptr);

    pid_t pid = -1;
    int spawn_ret;
    {
        SpawnSetup setup;
        posix_spawnattr_setflags(&setup.attr, POSIX_SPAWN_SETPGROUP);
        posix_spawnattr_setpgroup(&setup.attr, 0);
        posix_spawn_file_actions_addopen(&setup.actions, STDIN_FILENO, "/dev/null", O_RDONLY, 0);
        posix_spawn_file_actions_adddup2(&setup.actions, write_end.get(), STDOUT_FILENO);
        posix_spawn_file_actions_adddup2(&setup.actions, write_end.get(), STDERR_FILENO);

        spawn_ret = posix_spawnp(&pid, argv[0], &setup.actions, &setup.attr,
                                 argv.data(), environ);
    }
    write_end.reset();

    if (spawn_ret != 0) {
        result.failure = FailureReason::processError(
            "failed to start " + command_.argv[0] + ": " + std::strerror(spawn_ret));
        recordFailure(result);
        return result;
    }

    fcntl(read_end.get(), F_SETFL, fcntl(read_end.get(), F_GETFL, 0) | O_NONBLOCK);

    const auto deadline = Clock::now() + timeout_;
    bool pipe_open = true;
    bool exited = false;
    bool timed_out = false;
    int status = 0;

    while (true) {
        if (pipe_open) {
            struct pollfd pfd;
            pfd.fd = read_end.get();
            pfd.events = POLLIN;
            pfd.revents = 0;
            int ready = poll(&pfd, 1, static_cast<int>(kPollInterval.count()));
            if (ready > 0) {
                pipe_open = drainPipe(read_end.get(), result.output);
            } else if (ready < 0 && errno != EINTR) {
                pipe_open = false;
            }
        } else {
            pid_t r = waitpid(pid, &status, WNOHANG);
            if (r == pid) {
                exited = true;
                break;
            }
            if (r < 0 && errno != EINTR) {
                break;
            }
            std::this_thread::sleep_for(kReapInterval);
        }

        if (cancel_flag && cancel_flag->load(std::memory_order_acquire)) {
            result.cancelled = true;
            break;
        }

        if (Clock::now() >= deadline) {
            timed_out = true;
            break;
        }
    }

    if (!exited) {
        if (result.cancelled || timed_out) {
            killProcessGroup(pid);
        }
        status = reapBlocking(pid);
        if (pipe_open) {
            drainPipe(read_end.get(), result.output);
        }
    }

    if (result.cancelled) {
        result.failure = FailureReason::processError("cancelled");
        return result;
    }

    if (timed_out) {
        result.failure = FailureReason::timeout();
        recordFailure(result);
        return result;
    }

    if (status < 0) {
        result.failure = FailureReason::processError("failed to wait for process");
        recordFailure(result);
        return result;
    }

    if (WIFSIGNALED(status)) {
        result.failure = FailureReason::processError(
            "terminated by signal " + std::to_string(WTERMSIG(status)));
        recordFailure(result);
        return result;
    }

    if (!WIFEXITED(status)) {
        result.failure = FailureReason::processError("abnormal process termination");
        recordFailure(result);
        return result;
    }

    result.exit_code = WEXITSTATUS(status);

    if (result.exit_code > 0 && result.exit_code < 255) {
        result.failure = FailureClassifier::classify(result.output);
        recordFailure(result);
        return result;
    }

    // 255 is the encoder's exit status after a signal-initiated shutdown;
    // its summary lines are still present, so let the parser decide
    if (result.exit_code == 255) {
        Logger::warn("Encoder exited with status 255: " + command_.toString());
    }

    result.success = true;
    return result;
}

void ProcessRunner::recordFailure(const ProcessRunResult& result) const {
    if (result.failure) {
        Logger::debug("Process failed (" + result.failure->message + "): " + command_.toString());
    }
    if (!error_log_) {
        return;
    }
    if (result.output.empty() && result.failure) {
        error_log_->appendFailure(command_.toString(), result.failure->message);
    } else {
        error_log_->appendFailure(command_.toString(), result.output);
    }
}

} // namespace transcode_bench
