#include "monitor/system_info.hpp"
#include <array>
#include <cstdint>
#include <cstdio>
#include <fstream>
#include <memory>
#include <sstream>
#include <thread>

#if defined(__APPLE__)
#include <sys/sysctl.h>
#include <sys/types.h>
#endif

namespace {

std::string trimLeading(const std::string& s) {
    size_t start = s.find_first_not_of(" \t");
    return (start != std::string::npos) ? s.substr(start) : "";
}

std::string trimTrailingNewline(std::string s) {
    while (!s.empty() && (s.back() == '\n' || s.back() == '\r')) {
        s.pop_back();
    }
    return s;
}

#if defined(__linux__)

std::string parseCpuinfoField(const std::string& field) {
    std::ifstream cpuinfo("/proc/cpuinfo");
    std::string line;
    while (std::getline(cpuinfo, line)) {
        if (line.find(field) == 0) {
            size_t pos = line.find(':');
            if (pos != std::string::npos) {
                return trimLeading(line.substr(pos + 1));
            }
        }
    }
    return "";
}

std::string tryDeviceTreeModel() {
    std::ifstream file("/sys/firmware/devicetree/base/model");
    if (!file.is_open()) return "";
    std::string model;
    std::getline(file, model);
    // Device tree strings may contain a trailing null byte
    if (!model.empty() && model.back() == '\0') {
        model.pop_back();
    }
    return trimLeading(model);
}

std::string tryLscpuModelName() {
    std::unique_ptr<FILE, decltype(&pclose)> pipe(
        popen("lscpu 2>/dev/null", "r"), pclose);
    if (!pipe) return "";

    std::array<char, 256> buffer{};
    while (fgets(buffer.data(), static_cast<int>(buffer.size()), pipe.get())) {
        std::string line(buffer.data());
        if (line.find("Model name:") == 0) {
            std::string model = trimTrailingNewline(trimLeading(line.substr(11)));
            if (!model.empty() && model != "-") return model;
        }
    }
    return "";
}

// Value of KEY= in /etc/os-release, unquoted
std::string osReleaseField(const std::string& key) {
    std::ifstream file("/etc/os-release");
    std::string line;
    const std::string prefix = key + "=";
    while (std::getline(file, line)) {
        if (line.compare(0, prefix.size(), prefix) == 0) {
            std::string value = line.substr(prefix.size());
            if (value.size() >= 2 && (value.front() == '"' || value.front() == '\'')) {
                value = value.substr(1, value.size() - 2);
            }
            return value;
        }
    }
    return "";
}

#endif // __linux__

} // namespace

namespace transcode_bench {

std::string SystemInfo::getCpuName() {
#if defined(__linux__)
    // 1. Try "model name" (x86 standard)
    std::string name = parseCpuinfoField("model name");
    if (!name.empty()) return name;

    // 2. Try "Hardware" field (some ARM boards)
    name = parseCpuinfoField("Hardware");
    if (!name.empty()) return name;

    // 3. Try device tree model file (ARM SoC description)
    name = tryDeviceTreeModel();
    if (!name.empty()) return name;

    // 4. Try lscpu output
    name = tryLscpuModelName();
    if (!name.empty()) return name;

    return "Unknown CPU";

#elif defined(__APPLE__)
    char buffer[256];
    size_t size = sizeof(buffer);
    if (sysctlbyname("machdep.cpu.brand_string", buffer, &size, nullptr, 0) == 0) {
        return std::string(buffer);
    }
    return "Unknown CPU";

#else
    return "Unknown CPU";
#endif
}

unsigned int SystemInfo::getThreadCount() {
    unsigned int count = std::thread::hardware_concurrency();
    return count > 0 ? count : 1;
}

size_t SystemInfo::getTotalMemoryMB() {
#if defined(__linux__)
    std::ifstream meminfo("/proc/meminfo");
    std::string line;
    while (std::getline(meminfo, line)) {
        if (line.compare(0, 9, "MemTotal:") == 0) {
            std::istringstream iss(line.substr(9));
            size_t kb = 0;
            iss >> kb;
            return kb / 1024;
        }
    }
    return 0;

#elif defined(__APPLE__)
    int64_t bytes = 0;
    size_t size = sizeof(bytes);
    if (sysctlbyname("hw.memsize", &bytes, &size, nullptr, 0) == 0) {
        return static_cast<size_t>(bytes / (1024 * 1024));
    }
    return 0;

#else
    return 0;
#endif
}

std::string SystemInfo::getOsName() {
#if defined(__linux__)
    std::string name = osReleaseField("PRETTY_NAME");
    return name.empty() ? "Linux" : name;
#elif defined(__APPLE__)
    return "macOS";
#else
    return "Unknown OS";
#endif
}

} // namespace transcode_bench
