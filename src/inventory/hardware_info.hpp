#ifndef HARDWARE_INFO_HPP
#define HARDWARE_INFO_HPP

#include <optional>
#include <string>
#include <vector>

namespace transcode_bench {

// One GPU as described by the hardware inventory
struct GpuDevice {
    int index = 0;              // 0-based position in the inventory
    std::string vendor;
    std::string product;
    std::string bus_info;       // e.g. "pci@0000:01:00.0"
    std::string driver_version;

    // Device type tag used by test definitions ("nvidia", "amd", "intel"),
    // empty for unknown vendors
    std::string getDeviceType() const;

    // Whether the driver caps concurrent hardware encode sessions
    bool hasSessionLimit() const;

    // Value substituted for {gpu}: the bus identifier on Linux, the index
    // elsewhere
    std::string formatArgument() const;
};

struct GpuSelection {
    bool success = false;
    std::optional<GpuDevice> gpu;   // Empty when GPU tests are disabled
    std::string error_message;
};

struct HardwareInfo {
    std::vector<GpuDevice> gpus;

    // Resolve a 1-based GPU choice; 0 disables GPU tests, no choice picks
    // the first GPU if there is one
    GpuSelection selectGpu(std::optional<int> one_based_index) const;

    // Load the GPU list from inventory JSON:
    //   {"gpu": [{"vendor", "product", "businfo", "driver_version"}]}
    // The driver version may instead sit at configuration.driverversion.
    static std::optional<HardwareInfo> loadFromFile(const std::string& path,
                                                    std::string& error_message);

    static std::optional<HardwareInfo> parse(const std::string& json_text,
                                             std::string& error_message);
};

} // namespace transcode_bench

#endif // HARDWARE_INFO_HPP
