#ifndef BENCHMARK_RESULT_HPP
#define BENCHMARK_RESULT_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace transcode_bench {

enum class FailureKind {
    Timeout,
    ProcessError,
    PerformanceFailure,
    ExternalLimit,
    Inconclusive,
    ParseError
};

// Why a process, trial or search did not succeed
struct FailureReason {
    FailureKind kind;
    std::string message;    // Short human-readable reason
    std::string detail;     // Raw process output for unclassified failures

    static FailureReason timeout() {
        return {FailureKind::Timeout, "failed_timeout", ""};
    }

    static FailureReason processError(std::string message, std::string detail = "") {
        return {FailureKind::ProcessError, std::move(message), std::move(detail)};
    }

    static FailureReason performance() {
        return {FailureKind::PerformanceFailure, "performance", ""};
    }

    static FailureReason limited(std::string message = "limited") {
        return {FailureKind::ExternalLimit, std::move(message), ""};
    }

    static FailureReason inconclusive(std::string message = "failed_inconclusive") {
        return {FailureKind::Inconclusive, std::move(message), ""};
    }

    static FailureReason parseError(std::string message) {
        return {FailureKind::ParseError, std::move(message), ""};
    }

    std::string getKindName() const {
        switch (kind) {
            case FailureKind::Timeout: return "timeout";
            case FailureKind::ProcessError: return "process_error";
            case FailureKind::PerformanceFailure: return "performance";
            case FailureKind::ExternalLimit: return "external_limit";
            case FailureKind::Inconclusive: return "inconclusive";
            case FailureKind::ParseError: return "parse_error";
        }
        return "unknown";
    }
};

// Metrics extracted from one encoder process
struct WorkerResult {
    int64_t frame = 0;          // Highest sampled frame number
    double speed = 0.0;         // Mean encode speed (output time / wall time)
    double time_s = 0.0;        // Elapsed time reported by the encoder
    double rss_kb = 0.0;        // Peak resident memory
    double fps = 0.0;           // Mean instantaneous frame rate
    int sampled_lines = 0;      // Progress lines that passed the ramp-up filter
};

// Summary of one trial in which every worker completed
struct RunAggregate {
    int workers = 0;
    int64_t frame = 0;          // Max across workers
    double speed = 0.0;         // Mean across workers
    double time_s = 0.0;        // Mean across workers
    double rss_kb = 0.0;        // Max across workers
    double avg_fps = 0.0;       // Mean across workers
};

// One entry of the search history
struct TrialRecord {
    int workers = 0;
    bool passed = false;                    // Ran to completion at speed >= 1.0
    std::optional<RunAggregate> aggregate;  // Absent when the trial errored
    std::optional<FailureReason> failure;   // Present when the trial errored

    std::string getStatusSymbol() const {
        return passed ? "[ok]" : "[fail]";
    }
};

enum class SearchOutcome {
    Errored,
    Limited,
    Converged,
    Inconclusive
};

inline const char* searchOutcomeName(SearchOutcome outcome) {
    switch (outcome) {
        case SearchOutcome::Errored: return "errored";
        case SearchOutcome::Limited: return "limited";
        case SearchOutcome::Converged: return "converged";
        case SearchOutcome::Inconclusive: return "inconclusive";
    }
    return "unknown";
}

// Result of searching the maximum worker count for one command
struct BenchmarkResult {
    int max_streams = 0;
    SearchOutcome outcome = SearchOutcome::Inconclusive;
    std::vector<FailureReason> failure_reasons;
    std::optional<RunAggregate> best;       // Metrics recorded at max_streams
    std::vector<TrialRecord> trial_history;
};

enum class DriverLimitStatus {
    Unlimited,      // Every requested session opened
    Limited,        // Driver enforces a cap below the request
    Incapable       // Not a single session could be opened
};

// Outcome of probing a GPU driver's session cap
struct DriverLimit {
    int configured_ceiling = 0;     // Estimate derived from the driver version
    int requested_streams = 0;      // configured_ceiling + 1
    int observed_streams = 0;       // Outputs the encoder actually opened
    bool limiting = false;
    DriverLimitStatus status = DriverLimitStatus::Incapable;
    std::optional<FailureReason> failure;

    // Ceiling to hand to the search, if any
    std::optional<int> getCeiling() const {
        if (status == DriverLimitStatus::Limited) {
            return observed_streams;
        }
        return std::nullopt;
    }
};

} // namespace transcode_bench

#endif // BENCHMARK_RESULT_HPP
