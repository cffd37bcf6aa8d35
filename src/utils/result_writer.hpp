#ifndef RESULT_WRITER_HPP
#define RESULT_WRITER_HPP

#include "benchmark/benchmark_runner.hpp"
#include "inventory/hardware_info.hpp"
#include "suite/test_suite.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace transcode_bench {

// Host description reported alongside the results
struct HostDescription {
    std::string os_name;
    std::string cpu_name;
    unsigned int cpu_threads = 0;
    size_t memory_mb = 0;
    std::vector<GpuDevice> gpus;

    // Query the running host; GPUs come from the inventory if one was given
    static HostDescription collect(const std::optional<HardwareInfo>& hardware);
};

class ResultWriter {
public:
    // Full result document: token, hwinfo and one entry per record
    static nlohmann::json toJson(const TestSuite& suite,
                                 const HostDescription& host,
                                 const SessionResult& session);

    static nlohmann::json recordToJson(const TestRecord& record);

    // Write with 4-space indentation, creating parent directories
    static bool writeToFile(const nlohmann::json& document,
                            const std::string& path,
                            std::string& error);
};

} // namespace transcode_bench

#endif // RESULT_WRITER_HPP
