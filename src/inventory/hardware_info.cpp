#include "inventory/hardware_info.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>

namespace transcode_bench {
namespace {

using json = nlohmann::json;

std::string toLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::string optionalString(const json& object, const char* key) {
    auto it = object.find(key);
    if (it == object.end() || !it->is_string()) {
        return "";
    }
    return it->get<std::string>();
}

} // namespace

std::string GpuDevice::getDeviceType() const {
    std::string v = toLower(vendor);
    if (v.find("nvidia") != std::string::npos) return "nvidia";
    if (v.find("intel") != std::string::npos) return "intel";
    if (v.find("amd") != std::string::npos ||
        v.find("advanced micro devices") != std::string::npos) return "amd";
    return "";
}

bool GpuDevice::hasSessionLimit() const {
    return getDeviceType() == "nvidia";
}

std::string GpuDevice::formatArgument() const {
#if defined(__linux__)
    if (!bus_info.empty()) {
        std::string arg = bus_info;
        std::replace(arg.begin(), arg.end(), '@', '-');
        return arg;
    }
#endif
    return std::to_string(index);
}

GpuSelection HardwareInfo::selectGpu(std::optional<int> one_based_index) const {
    GpuSelection selection;
    selection.success = true;

    if (!one_based_index) {
        if (!gpus.empty()) {
            selection.gpu = gpus.front();
        }
        return selection;
    }

    if (*one_based_index == 0) {
        return selection;
    }

    if (*one_based_index < 0 || static_cast<size_t>(*one_based_index) > gpus.size()) {
        selection.success = false;
        selection.error_message = "GPU " + std::to_string(*one_based_index) +
                                  " not found (" + std::to_string(gpus.size()) +
                                  " available)";
        return selection;
    }

    selection.gpu = gpus[static_cast<size_t>(*one_based_index) - 1];
    if (selection.gpu->getDeviceType().empty()) {
        selection.success = false;
        selection.error_message = "Unsupported GPU vendor: " + selection.gpu->vendor;
        selection.gpu.reset();
    }
    return selection;
}

std::optional<HardwareInfo> HardwareInfo::loadFromFile(const std::string& path,
                                                       std::string& error_message) {
    std::ifstream file(path);
    if (!file.is_open()) {
        error_message = "Failed to open hardware info file: " + path;
        return std::nullopt;
    }
    std::ostringstream contents;
    contents << file.rdbuf();
    return parse(contents.str(), error_message);
}

std::optional<HardwareInfo> HardwareInfo::parse(const std::string& json_text,
                                                std::string& error_message) {
    json root = json::parse(json_text, nullptr, false);
    if (root.is_discarded() || !root.is_object()) {
        error_message = "Hardware info is not a valid JSON object";
        return std::nullopt;
    }

    HardwareInfo info;
    auto gpus = root.find("gpu");
    if (gpus == root.end()) {
        return info;
    }
    if (!gpus->is_array()) {
        error_message = "Hardware info field 'gpu' must be an array";
        return std::nullopt;
    }

    int index = 0;
    for (const auto& entry : *gpus) {
        if (!entry.is_object()) {
            error_message = "Hardware info 'gpu' entries must be objects";
            return std::nullopt;
        }
        GpuDevice gpu;
        gpu.index = index++;
        gpu.vendor = optionalString(entry, "vendor");
        gpu.product = optionalString(entry, "product");
        gpu.bus_info = optionalString(entry, "businfo");
        gpu.driver_version = optionalString(entry, "driver_version");

        auto config = entry.find("configuration");
        if (gpu.driver_version.empty() && config != entry.end() && config->is_object()) {
            gpu.driver_version = optionalString(*config, "driverversion");
        }

        if (gpu.vendor.empty()) {
            error_message = "Hardware info GPU " + std::to_string(gpu.index) + " has no vendor";
            return std::nullopt;
        }
        info.gpus.push_back(std::move(gpu));
    }
    return info;
}

} // namespace transcode_bench
