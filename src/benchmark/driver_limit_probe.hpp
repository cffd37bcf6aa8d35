#ifndef DRIVER_LIMIT_PROBE_HPP
#define DRIVER_LIMIT_PROBE_HPP

#include "benchmark/benchmark_config.hpp"
#include "benchmark/benchmark_result.hpp"
#include "inventory/hardware_info.hpp"
#include "process/command.hpp"
#include <optional>
#include <string>

namespace transcode_bench {

class ErrorLog;

// Discovers how many simultaneous hardware encode sessions a GPU driver
// allows. A single encoder process is asked to open one output more than the
// driver version suggests; the outputs it actually opened are counted.
class DriverLimitProbe {
public:
    // Ceiling assumed when the driver version cannot be read
    static constexpr int kPermissiveCeiling = 8;

    DriverLimitProbe(const ProbeOptions& options, ErrorLog* error_log);

    // Probe the session cap of gpu
    DriverLimit run(const GpuDevice& gpu) const;

    // Command that opens `streams` encode outputs on gpu from one test source
    Command buildCommand(const GpuDevice& gpu, int streams) const;

    // Expected session cap for a driver version string
    static int ceilingForDriverVersion(const std::string& driver_version);

    // Major driver version: "550.54.14" -> 550, "31.0.15.5222" -> 552
    static std::optional<int> parseDriverMajor(const std::string& driver_version);

    // Count "Output #<n>, null, to 'pipe:'" markers
    static int countOpenedStreams(const std::string& output);

    // Classify a probe that asked for configured_ceiling + 1 streams
    static DriverLimit evaluate(int configured_ceiling, int observed_streams);

    // Failure reasons that still leave some sessions open
    static bool isSessionLimitReason(const std::string& reason);

private:
    ProbeOptions options_;
    ErrorLog* error_log_;
};

} // namespace transcode_bench

#endif // DRIVER_LIMIT_PROBE_HPP
