#ifndef METRICS_PARSER_HPP
#define METRICS_PARSER_HPP

#include "benchmark/benchmark_result.hpp"
#include <cstdint>
#include <optional>
#include <string>

namespace transcode_bench {

// Extracts performance and resource metrics from the report an encoder
// writes when run with -benchmark.
//
// Recognized lines:
//   frame= 1234 fps= 75 q=28.0 size=N/A time=00:00:41.13 bitrate=N/A speed=2.47x
//   bench: utime=12.345s stime=0.678s rtime=16.789s
//   bench: maxrss=123456kB        (or KiB)
// Everything else is ignored.
class MetricsParser {
public:
    // Progress lines below this frame number are encoder ramp-up
    static constexpr int64_t kMinSampledFrame = 500;

    // Returns nullopt with error_message set when a summary line is missing
    // or malformed
    static std::optional<WorkerResult> parse(const std::string& output,
                                             std::string& error_message);

private:
    static std::optional<int64_t> parseInteger(const std::string& str);
    static std::optional<double> parseDouble(const std::string& str);
};

} // namespace transcode_bench

#endif // METRICS_PARSER_HPP
