#ifndef OUTPUT_FORMATTER_HPP
#define OUTPUT_FORMATTER_HPP

#include "benchmark/benchmark_runner.hpp"
#include "utils/result_writer.hpp"
#include <string>

namespace transcode_bench {

class OutputFormatter {
public:
    // Print host and selected device information
    static void printHeader(const HostDescription& host,
                            const std::optional<GpuDevice>& gpu,
                            const std::vector<std::string>& device_types);

    // Print the source file being benchmarked
    static void printFileStart(const TestFile& file, const std::optional<VideoInfo>& video);

    // Print "Test N (from -> to) on type" line
    static void printCommandStart(const TestCase& test, const std::string& type);

    // Print a single trial line
    static void printTrialResult(const TrialRecord& record);

    // Print the outcome of the GPU session-limit probe
    static void printDriverLimit(const DriverLimit& limit);

    // Print the result of one command
    static void printCommandSummary(const TestRecord& record);

    // Print the final summary
    static void printSummary(const SessionResult& session);

    // Print an error message
    static void printError(const std::string& message);

    // Print a line to the console and the log
    static void printInfo(const std::string& message);
};

} // namespace transcode_bench

#endif // OUTPUT_FORMATTER_HPP
