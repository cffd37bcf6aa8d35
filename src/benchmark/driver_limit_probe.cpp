#include "benchmark/driver_limit_probe.hpp"
#include "process/process_runner.hpp"
#include "utils/logger.hpp"
#include <algorithm>
#include <array>
#include <cctype>
#include <charconv>
#include <iterator>
#include <regex>
#include <sstream>
#include <vector>

namespace transcode_bench {
namespace {

struct SessionBand {
    int min_major;
    int ceiling;
};

// Highest band first
constexpr std::array<SessionBand, 3> kSessionBands = {{
    {550, 8},
    {530, 5},
    {0, 3},
}};

#if defined(__linux__)
constexpr const char* kNvencBaseArgs =
    "-y -vsync 0 -hwaccel cuda -hwaccel_output_format cuda -t 50 "
    "-hwaccel_device {gpu} -f lavfi -i testsrc";
constexpr const char* kNvencOutputArgs =
    "-vf hwupload -c:a copy -c:v h264_nvenc -b:v {bitrate} -f null -";
#else
constexpr const char* kNvencBaseArgs =
    "-y -hwaccel cuda -hwaccel_output_format cuda -t 50 "
    "-hwaccel_device {gpu} -f lavfi -i testsrc";
constexpr const char* kNvencOutputArgs =
    "-vf hwupload -fps_mode passthrough -c:a copy -c:v h264_nvenc -b:v {bitrate} -f null -";
#endif

constexpr std::array<const char*, 2> kSessionLimitReasons = {
    "incompatible client key",
    "out of memory",
};

void appendWords(std::vector<std::string>& argv, const std::string& text) {
    std::istringstream iss(text);
    std::string word;
    while (iss >> word) {
        argv.push_back(word);
    }
}

std::vector<std::string> splitOn(const std::string& text, char sep) {
    std::vector<std::string> parts;
    std::string part;
    std::istringstream iss(text);
    while (std::getline(iss, part, sep)) {
        parts.push_back(part);
    }
    return parts;
}

bool isDigits(const std::string& s) {
    return !s.empty() && std::all_of(s.begin(), s.end(),
                                      [](unsigned char c) { return std::isdigit(c); });
}

std::optional<int> toInt(const std::string& s) {
    int value = 0;
    auto result = std::from_chars(s.data(), s.data() + s.size(), value);
    if (result.ec == std::errc() && result.ptr == s.data() + s.size()) {
        return value;
    }
    return std::nullopt;
}

} // namespace

DriverLimitProbe::DriverLimitProbe(const ProbeOptions& options, ErrorLog* error_log)
    : options_(options), error_log_(error_log) {
}

std::optional<int> DriverLimitProbe::parseDriverMajor(const std::string& driver_version) {
    auto parts = splitOn(driver_version, '.');
    if (parts.empty() || !std::all_of(parts.begin(), parts.end(), isDigits)) {
        return std::nullopt;
    }

    // Windows reports e.g. 31.0.15.5222; the last five digits of the final
    // two fields are the marketing version 552.22
    if (parts.size() == 4) {
        std::string digits = parts[2] + parts[3];
        if (digits.size() < 5) {
            return std::nullopt;
        }
        return toInt(digits.substr(digits.size() - 5, 3));
    }

    return toInt(parts[0]);
}

int DriverLimitProbe::ceilingForDriverVersion(const std::string& driver_version) {
    auto major = parseDriverMajor(driver_version);
    if (!major) {
        return kPermissiveCeiling;
    }
    for (const auto& band : kSessionBands) {
        if (*major >= band.min_major) {
            return band.ceiling;
        }
    }
    return kSessionBands.back().ceiling;
}

int DriverLimitProbe::countOpenedStreams(const std::string& output) {
    static const std::regex marker(R"(Output #\d+, null, to 'pipe:')");
    return static_cast<int>(std::distance(
        std::sregex_iterator(output.begin(), output.end(), marker),
        std::sregex_iterator()));
}

bool DriverLimitProbe::isSessionLimitReason(const std::string& reason) {
    return std::find(kSessionLimitReasons.begin(), kSessionLimitReasons.end(), reason) !=
           kSessionLimitReasons.end();
}

DriverLimit DriverLimitProbe::evaluate(int configured_ceiling, int observed_streams) {
    DriverLimit limit;
    limit.configured_ceiling = configured_ceiling;
    limit.requested_streams = configured_ceiling + 1;
    limit.observed_streams = observed_streams;

    if (observed_streams >= limit.requested_streams) {
        limit.status = DriverLimitStatus::Unlimited;
        limit.limiting = false;
    } else if (observed_streams > 0) {
        limit.status = DriverLimitStatus::Limited;
        limit.limiting = true;
    } else {
        limit.status = DriverLimitStatus::Incapable;
        limit.limiting = true;
    }
    return limit;
}

Command DriverLimitProbe::buildCommand(const GpuDevice& gpu, int streams) const {
    const std::string gpu_arg = gpu.formatArgument();

    Command command;
    command.argv.push_back(options_.ffmpeg_path);
    appendWords(command.argv, substitutePlaceholder(kNvencBaseArgs, "gpu", gpu_arg));

    const std::string output_args = substitutePlaceholder(kNvencOutputArgs, "bitrate", options_.bitrate);
    for (int i = 0; i < streams; i++) {
        appendWords(command.argv, output_args);
    }
    return command;
}

DriverLimit DriverLimitProbe::run(const GpuDevice& gpu) const {
    const int configured = ceilingForDriverVersion(gpu.driver_version);
    const Command command = buildCommand(gpu, configured + 1);

    Logger::info("Probing session limit of " + gpu.product + " (driver " +
                 (gpu.driver_version.empty() ? std::string("unknown") : gpu.driver_version) +
                 "): requesting " + std::to_string(configured + 1) + " streams");

    ProcessRunner runner(command, options_.timeout, error_log_);
    ProcessRunResult result = runner.run();

    int observed = 0;
    if (result.success || (result.failure && isSessionLimitReason(result.failure->message))) {
        observed = countOpenedStreams(result.output);
    }

    DriverLimit limit = evaluate(configured, observed);
    if (!result.success) {
        limit.failure = result.failure;
    }

    Logger::info("Session probe opened " + std::to_string(observed) + " of " +
                 std::to_string(limit.requested_streams) + " streams");
    return limit;
}

} // namespace transcode_bench
