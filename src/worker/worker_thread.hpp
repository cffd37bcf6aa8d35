#ifndef WORKER_THREAD_HPP
#define WORKER_THREAD_HPP

#include "benchmark/benchmark_result.hpp"
#include "process/command.hpp"
#include <atomic>
#include <chrono>
#include <functional>
#include <optional>
#include <thread>

namespace transcode_bench {

class ErrorLog;

// Results from one worker after its thread has finished
struct WorkerThreadResult {
    int worker_id;
    bool success;
    bool cancelled;                         // Killed because a sibling failed
    std::optional<WorkerResult> metrics;
    std::optional<FailureReason> failure;
};

// A thread that runs one encoder process and parses its report
class WorkerThread {
public:
    // Invoked on the worker thread right before it exits
    using CompletionCallback = std::function<void(const WorkerThreadResult&)>;

    WorkerThread(int worker_id,
                 const Command& command,
                 std::chrono::milliseconds timeout,
                 ErrorLog* error_log,
                 std::atomic<bool>& stop_flag,
                 CompletionCallback on_complete);

    ~WorkerThread();

    // Non-copyable, non-movable (owns thread)
    WorkerThread(const WorkerThread&) = delete;
    WorkerThread& operator=(const WorkerThread&) = delete;
    WorkerThread(WorkerThread&&) = delete;
    WorkerThread& operator=(WorkerThread&&) = delete;

    // Get result after thread has stopped
    WorkerThreadResult getResult() const;

    // Wait for thread to complete
    void join();

private:
    void run();

    int worker_id_;
    const Command& command_;
    std::chrono::milliseconds timeout_;
    ErrorLog* error_log_;
    std::atomic<bool>& stop_flag_;
    CompletionCallback on_complete_;

    WorkerThreadResult result_;

    std::jthread thread_;
};

} // namespace transcode_bench

#endif // WORKER_THREAD_HPP
