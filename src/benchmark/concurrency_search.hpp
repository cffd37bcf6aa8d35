#ifndef CONCURRENCY_SEARCH_HPP
#define CONCURRENCY_SEARCH_HPP

#include "benchmark/benchmark_config.hpp"
#include "benchmark/benchmark_result.hpp"
#include "process/command.hpp"
#include "worker/worker_pool.hpp"
#include <cstdint>
#include <functional>
#include <limits>

namespace transcode_bench {

// Callback for progress updates, invoked after every trial
using TrialCallback = std::function<void(const TrialRecord&)>;

// Finds the largest worker count at which every worker still runs at
// real-time speed.
//
// The search keeps a bracket (max_pass, min_fail). A passing trial grows the
// candidate by ceil(speed) times (or by one near speed 1.0); a slow trial
// pulls it back to floor(count * speed). Candidates are always clamped inside
// the bracket, so each trial narrows it and the loop ends when the bracket
// closes, a trial errors, or the ceiling is reached.
class ConcurrencySearch {
public:
    // Sentinel for "no failing count seen yet"
    static constexpr int kUnboundedWorkers = std::numeric_limits<int32_t>::max();

    // Speed at which a worker keeps up with real time
    static constexpr double kRealTimeSpeed = 1.0;

    ConcurrencySearch(const SearchOptions& options, TrialExecutor& executor);

    BenchmarkResult run(const Command& command, TrialCallback trial_callback = nullptr);

private:
    // Candidate following a trial at `workers` that ran at `speed`
    static int64_t nextCandidate(int workers, double speed, bool passed);

    SearchOptions options_;
    TrialExecutor& executor_;
};

} // namespace transcode_bench

#endif // CONCURRENCY_SEARCH_HPP
