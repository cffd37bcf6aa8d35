#include "worker/worker_pool.hpp"
#include "worker/worker_thread.hpp"
#include "utils/logger.hpp"
#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <new>
#include <string>
#include <system_error>

namespace transcode_bench {

WorkerPool::WorkerPool(const PoolOptions& options, ErrorLog* error_log)
    : options_(options), error_log_(error_log) {
}

RunAggregate WorkerPool::aggregate(const std::vector<WorkerResult>& results) {
    RunAggregate agg;
    agg.workers = static_cast<int>(results.size());
    if (results.empty()) {
        return agg;
    }

    double total_speed = 0.0;
    double total_time = 0.0;
    double total_fps = 0.0;
    for (const auto& r : results) {
        total_speed += r.speed;
        total_time += r.time_s;
        total_fps += r.fps;
        agg.frame = std::max(agg.frame, r.frame);
        agg.rss_kb = std::max(agg.rss_kb, r.rss_kb);
    }

    const double n = static_cast<double>(results.size());
    agg.speed = total_speed / n;
    agg.time_s = total_time / n;
    agg.avg_fps = total_fps / n;
    return agg;
}

TrialOutcome WorkerPool::runTrial(int worker_count, const Command& command) {
    TrialOutcome outcome;

    if (worker_count < 1) {
        outcome.failure_reason = FailureReason::processError(
            "invalid worker count " + std::to_string(worker_count));
        return outcome;
    }

    Logger::debug("Starting trial with " + std::to_string(worker_count) + " worker(s)");

    std::atomic<bool> stop_flag{false};
    std::mutex mutex;
    std::condition_variable done_cv;
    int finished = 0;
    std::optional<FailureReason> first_failure;

    auto on_complete = [&](const WorkerThreadResult& result) {
        std::lock_guard<std::mutex> lock(mutex);
        finished++;
        if (!result.success && !result.cancelled && !first_failure) {
            first_failure = result.failure;
            stop_flag.store(true, std::memory_order_release);
        }
        done_cv.notify_one();
    };

    std::vector<std::unique_ptr<WorkerThread>> threads;
    std::string start_error;
    try {
        threads.reserve(worker_count);
        for (int i = 0; i < worker_count; i++) {
            threads.push_back(std::make_unique<WorkerThread>(
                i, command, options_.timeout, error_log_, stop_flag, on_complete));
        }
    } catch (const std::system_error& ex) {
        start_error = ex.what();
    } catch (const std::bad_alloc& ex) {
        start_error = ex.what();
    }

    if (!start_error.empty()) {
        // Stop the workers that did start before reporting
        stop_flag.store(true, std::memory_order_release);
        for (const auto& thread : threads) {
            thread->join();
        }
        outcome.failure_reason = FailureReason::processError(
            "failed to start worker " + std::to_string(threads.size()) + ": " + start_error);
        Logger::error("Trial with " + std::to_string(worker_count) +
                      " worker(s) failed: " + outcome.failure_reason->message);
        return outcome;
    }

    {
        std::unique_lock<std::mutex> lock(mutex);
        done_cv.wait(lock, [&] {
            return finished == worker_count || first_failure.has_value();
        });
    }

    // Siblings observe the flag within one poll interval and kill their process
    for (const auto& thread : threads) {
        thread->join();
    }

    if (first_failure) {
        Logger::info("Trial with " + std::to_string(worker_count) +
                     " worker(s) failed: " + first_failure->message);
        outcome.failure_reason = first_failure;
        return outcome;
    }

    std::vector<WorkerResult> results;
    results.reserve(worker_count);
    for (const auto& thread : threads) {
        auto result = thread->getResult();
        if (!result.metrics) {
            // Only reachable if a worker finished without reporting
            outcome.failure_reason = result.failure.value_or(
                FailureReason::processError("worker produced no metrics"));
            return outcome;
        }
        results.push_back(*result.metrics);
    }

    outcome.success = true;
    outcome.aggregate = aggregate(results);
    return outcome;
}

} // namespace transcode_bench
