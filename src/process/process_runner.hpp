#ifndef PROCESS_RUNNER_HPP
#define PROCESS_RUNNER_HPP

#include "benchmark/benchmark_result.hpp"
#include "process/command.hpp"
#include <atomic>
#include <chrono>
#include <optional>
#include <string>

namespace transcode_bench {

class ErrorLog;

struct ProcessRunResult {
    bool success = false;       // Output is ready for parsing
    bool cancelled = false;     // Killed because a sibling failed
    int exit_code = -1;
    std::string output;         // Merged stdout and stderr
    std::optional<FailureReason> failure;
};

// Runs one external process to completion with captured output.
// The child gets its own process group and /dev/null as stdin; on timeout or
// cancellation the whole group is killed.
class ProcessRunner {
public:
    static constexpr std::chrono::milliseconds kDefaultTimeout{120000};

    explicit ProcessRunner(Command command,
                           std::chrono::milliseconds timeout = kDefaultTimeout,
                           ErrorLog* error_log = nullptr);

    // Blocks until the process exits, the timeout elapses, or cancel_flag is
    // raised. Failures are appended to the error log, cancellations are not.
    ProcessRunResult run(const std::atomic<bool>* cancel_flag = nullptr);

    const Command& command() const { return command_; }

private:
    void recordFailure(const ProcessRunResult& result) const;

    Command command_;
    std::chrono::milliseconds timeout_;
    ErrorLog* error_log_;
};

} // namespace transcode_bench

#endif // PROCESS_RUNNER_HPP
