#ifndef BENCHMARK_CONFIG_HPP
#define BENCHMARK_CONFIG_HPP

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace transcode_bench {

struct BenchmarkConfig {
    // Required: path to the JSON test definitions
    std::string test_file;

    // Encoder binary used for every command
    std::string ffmpeg_path = "ffmpeg";

    // Directory holding the test media
    std::string video_dir = "./videos";

    // Result JSON path
    std::string output_path = "./output.json";

    // Optional: per-trial CSV export
    std::optional<std::string> csv_file;

    // Optional: hardware inventory JSON (GPU descriptions)
    std::optional<std::string> hwinfo_file;

    // Optional: 1-based GPU selection, 0 disables GPU tests (default: first GPU)
    std::optional<int> gpu_index;

    // Skip CPU tests
    bool disable_cpu = false;

    // Answer yes to every prompt
    bool assume_yes = false;

    // Debug logging
    bool debug = false;

    // Optional: log file path (default: transcode-benchmark.log)
    std::optional<std::string> log_file;

    // Encoder error log path
    std::string error_log_file = "./transcode-bench-log/ffmpeg_err_log.txt";

    // Per-process timeout in seconds
    double process_timeout = 120.0;

    // Upper bound on trials per search
    int max_trials = 64;
};

struct PoolOptions {
    std::chrono::milliseconds timeout{120000};
};

struct SearchOptions {
    // Advisory upper bound on worker count (from the driver probe)
    std::optional<int> ceiling;

    int max_trials = 64;
};

struct ProbeOptions {
    std::string ffmpeg_path = "ffmpeg";
    std::chrono::milliseconds timeout{120000};

    // Bitrate for every probe output stream
    std::string bitrate = "5M";
};

inline std::chrono::milliseconds timeoutFromSeconds(double seconds) {
    return std::chrono::milliseconds(static_cast<int64_t>(seconds * 1000.0));
}

inline PoolOptions makePoolOptions(const BenchmarkConfig& config) {
    PoolOptions options;
    options.timeout = timeoutFromSeconds(config.process_timeout);
    return options;
}

inline ProbeOptions makeProbeOptions(const BenchmarkConfig& config) {
    ProbeOptions options;
    options.ffmpeg_path = config.ffmpeg_path;
    options.timeout = timeoutFromSeconds(config.process_timeout);
    return options;
}

} // namespace transcode_bench

#endif // BENCHMARK_CONFIG_HPP
