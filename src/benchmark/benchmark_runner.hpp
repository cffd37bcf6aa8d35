#ifndef BENCHMARK_RUNNER_HPP
#define BENCHMARK_RUNNER_HPP

#include "benchmark/benchmark_config.hpp"
#include "benchmark/benchmark_result.hpp"
#include "benchmark/concurrency_search.hpp"
#include "inventory/hardware_info.hpp"
#include "suite/test_suite.hpp"
#include "video/video_info.hpp"
#include "worker/worker_pool.hpp"
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace transcode_bench {

class ErrorLog;

// Result for one (test, device type) pair
struct TestRecord {
    nlohmann::json id;
    std::string type;
    std::optional<int> selected_gpu;
    std::optional<int> selected_cpu;
    BenchmarkResult result;

    std::string getIdString() const {
        return id.is_string() ? id.get<std::string>() : id.dump();
    }
};

struct SessionResult {
    std::vector<TestRecord> records;
    std::optional<DriverLimit> driver_limit;
    bool success = false;
    std::string error_message;
};

struct RunnerCallbacks {
    // A test file is about to be benchmarked; video is empty if it could not be read
    std::function<void(const TestFile&, const std::optional<VideoInfo>&)> on_file_start;

    // A command is about to be searched
    std::function<void(const TestCase&, const std::string& type)> on_command_start;

    // After every trial
    TrialCallback on_trial;

    // A command has its final record
    std::function<void(const TestRecord&)> on_command_done;

    // The session-limit probe finished
    std::function<void(const DriverLimit&)> on_driver_limit;

    // Yes/no question for the user; absent means "yes"
    std::function<bool(const std::string&)> confirm;
};

// Reads the stream properties of a source file; empty with error_message set on failure
using SourceAnalyzer =
    std::function<std::optional<VideoInfo>(const std::string& file_path, std::string& error_message)>;

// Runs every selected command of a test suite, one at a time
class BenchmarkRunner {
public:
    BenchmarkRunner(const BenchmarkConfig& config,
                    const TestSuite& suite,
                    std::optional<GpuDevice> gpu,
                    ErrorLog& error_log,
                    TrialExecutor& executor,
                    SourceAnalyzer analyzer = VideoAnalyzer::analyze);

    SessionResult run(const RunnerCallbacks& callbacks = {});

    // Device types to benchmark: "cpu" unless disabled, plus the GPU's type
    static std::vector<std::string> selectDeviceTypes(bool disable_cpu,
                                                      const std::optional<GpuDevice>& gpu);

    // Commands that run() will search
    int countCommands() const;

private:
    // Probe the GPU session cap once; disables GPU tests if it must
    void probeDriverLimit(SessionResult& session, const RunnerCallbacks& callbacks);

    // Build the encoder command for one template
    std::optional<Command> buildCommand(const TestArgument& argument,
                                        const std::string& video_path,
                                        std::string& error_message) const;

    BenchmarkConfig config_;
    const TestSuite& suite_;
    std::optional<GpuDevice> gpu_;
    ErrorLog& error_log_;
    TrialExecutor& executor_;
    SourceAnalyzer analyzer_;

    bool driver_probed_ = false;
    std::optional<int> gpu_ceiling_;
    std::optional<FailureReason> gpu_disabled_reason_;
};

} // namespace transcode_bench

#endif // BENCHMARK_RUNNER_HPP
