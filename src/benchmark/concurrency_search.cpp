#include "benchmark/concurrency_search.hpp"
#include "utils/logger.hpp"
#include <algorithm>
#include <cmath>
#include <optional>
#include <sstream>

namespace transcode_bench {

ConcurrencySearch::ConcurrencySearch(const SearchOptions& options, TrialExecutor& executor)
    : options_(options), executor_(executor) {
}

int64_t ConcurrencySearch::nextCandidate(int workers, double speed, bool passed) {
    if (!passed) {
        return static_cast<int64_t>(std::floor(workers * speed));
    }
    if (speed > kRealTimeSpeed) {
        double factor = std::min(std::ceil(speed), static_cast<double>(kUnboundedWorkers));
        return static_cast<int64_t>(workers) * static_cast<int64_t>(factor);
    }
    return static_cast<int64_t>(workers) + 1;
}

BenchmarkResult ConcurrencySearch::run(const Command& command, TrialCallback trial_callback) {
    BenchmarkResult result;

    int total_workers = 1;
    int max_pass = 0;
    int min_fail = kUnboundedWorkers;
    bool external_limited = false;
    int trials = 0;
    std::optional<SearchOutcome> outcome;

    if (options_.ceiling && *options_.ceiling < 1) {
        result.outcome = SearchOutcome::Limited;
        result.failure_reasons.push_back(FailureReason::limited());
        return result;
    }

    auto record_trial = [&](const TrialRecord& record) {
        result.trial_history.push_back(record);
        if (trial_callback) {
            trial_callback(record);
        }
    };

    while (!outcome) {
        if (max_pass >= min_fail) {
            Logger::error("Search bracket collapsed: max_pass=" + std::to_string(max_pass) +
                          " min_fail=" + std::to_string(min_fail));
            outcome = SearchOutcome::Inconclusive;
            result.failure_reasons.push_back(FailureReason::inconclusive());
            break;
        }

        if (trials >= options_.max_trials) {
            Logger::error("Search gave up after " + std::to_string(trials) + " trials");
            outcome = SearchOutcome::Inconclusive;
            result.failure_reasons.push_back(FailureReason::inconclusive());
            break;
        }
        trials++;

        TrialOutcome trial = executor_.runTrial(total_workers, command);

        TrialRecord record;
        record.workers = total_workers;

        if (!trial.success || !trial.aggregate) {
            FailureReason reason = trial.failure_reason.value_or(
                FailureReason::processError("trial failed without a reason"));
            record.failure = reason;
            result.failure_reasons.push_back(reason);
            record_trial(record);
            outcome = SearchOutcome::Errored;
            break;
        }

        const RunAggregate& agg = *trial.aggregate;
        record.aggregate = agg;
        record.passed = agg.speed >= kRealTimeSpeed;
        record_trial(record);

        if (record.passed) {
            max_pass = total_workers;
            result.best = agg;
            if (options_.ceiling && max_pass >= *options_.ceiling) {
                outcome = SearchOutcome::Limited;
                result.failure_reasons.push_back(FailureReason::limited());
                break;
            }
        } else {
            min_fail = total_workers;
        }

        int64_t next = nextCandidate(total_workers, agg.speed, record.passed);

        // Keep the candidate strictly inside (max_pass, min_fail)
        if (next >= min_fail) {
            next = static_cast<int64_t>(min_fail) - 1;
        }
        if (next <= max_pass) {
            next = static_cast<int64_t>(max_pass) + 1;
        }

        if (options_.ceiling && next > *options_.ceiling) {
            next = *options_.ceiling;
            external_limited = true;
        }

        std::ostringstream decision;
        decision << "workers=" << total_workers << " speed=" << agg.speed
                 << " bracket=(" << max_pass << ", "
                 << (min_fail == kUnboundedWorkers ? std::string("inf") : std::to_string(min_fail))
                 << ") next=" << next << (external_limited ? " (ceiling)" : "");
        Logger::debug(decision.str());

        total_workers = static_cast<int>(next);

        if (min_fail - max_pass == 1) {
            outcome = SearchOutcome::Converged;
            result.failure_reasons.push_back(FailureReason::performance());
        }
    }

    result.outcome = *outcome;
    result.max_streams = max_pass;
    return result;
}

} // namespace transcode_bench
