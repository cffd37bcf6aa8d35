#ifndef WORKER_POOL_HPP
#define WORKER_POOL_HPP

#include "benchmark/benchmark_config.hpp"
#include "benchmark/benchmark_result.hpp"
#include "process/command.hpp"
#include <optional>
#include <vector>

namespace transcode_bench {

class ErrorLog;

// Result of running one trial
struct TrialOutcome {
    bool success = false;
    std::optional<RunAggregate> aggregate;          // Present only if every worker completed
    std::optional<FailureReason> failure_reason;    // First failure observed
};

// Runs N copies of a command at once and reports the trial.
// Abstract so the search can be driven without spawning processes.
class TrialExecutor {
public:
    virtual ~TrialExecutor() = default;

    virtual TrialOutcome runTrial(int worker_count, const Command& command) = 0;

protected:
    TrialExecutor() = default;
};

// Fail-fast process pool: the first failing worker kills all of its
// siblings and the trial yields no metrics.
class WorkerPool : public TrialExecutor {
public:
    WorkerPool(const PoolOptions& options, ErrorLog* error_log);

    TrialOutcome runTrial(int worker_count, const Command& command) override;

    // Max of frames and memory, mean of speed, time and fps
    static RunAggregate aggregate(const std::vector<WorkerResult>& results);

private:
    PoolOptions options_;
    ErrorLog* error_log_;
};

} // namespace transcode_bench

#endif // WORKER_POOL_HPP
