#ifndef SYSTEM_INFO_HPP
#define SYSTEM_INFO_HPP

#include <cstddef>
#include <string>

namespace transcode_bench {

class SystemInfo {
public:
    // Get CPU model name
    static std::string getCpuName();

    // Get number of hardware threads
    static unsigned int getThreadCount();

    // Get total physical memory in MB (0 if unknown)
    static size_t getTotalMemoryMB();

    // Human-readable OS name, e.g. "Ubuntu 24.04 LTS"
    static std::string getOsName();
};

} // namespace transcode_bench

#endif // SYSTEM_INFO_HPP
