#include "metrics/metrics_parser.hpp"
#include <algorithm>
#include <charconv>
#include <cstdlib>
#include <sstream>
#include <unordered_map>
#include <vector>

namespace transcode_bench {
namespace {

// Split on both '\n' and '\r': the encoder ends progress updates with '\r'
std::vector<std::string> splitLines(const std::string& text) {
    std::vector<std::string> lines;
    std::string current;
    for (char c : text) {
        if (c == '\n' || c == '\r') {
            if (!current.empty()) {
                lines.push_back(std::move(current));
                current.clear();
            }
        } else {
            current += c;
        }
    }
    if (!current.empty()) {
        lines.push_back(std::move(current));
    }
    return lines;
}

// "frame=  512 fps= 30" -> {"frame": "512", "fps": "30"}
std::unordered_map<std::string, std::string> parseKeyValues(const std::string& line) {
    std::string normalized;
    normalized.reserve(line.size());
    for (size_t i = 0; i < line.size(); i++) {
        normalized += line[i];
        if (line[i] == '=') {
            while (i + 1 < line.size() && (line[i + 1] == ' ' || line[i + 1] == '\t')) {
                i++;
            }
        }
    }

    std::unordered_map<std::string, std::string> values;
    std::istringstream iss(normalized);
    std::string token;
    while (iss >> token) {
        size_t pos = token.find('=');
        if (pos == std::string::npos || pos == 0) {
            continue;
        }
        values.emplace(token.substr(0, pos), token.substr(pos + 1));
    }
    return values;
}

std::string stripSuffix(std::string value, const std::string& suffix) {
    if (value.size() >= suffix.size() &&
        value.compare(value.size() - suffix.size(), suffix.size(), suffix) == 0) {
        value.erase(value.size() - suffix.size());
    }
    return value;
}

bool startsWith(const std::string& s, const char* prefix) {
    return s.rfind(prefix, 0) == 0;
}

} // namespace

std::optional<int64_t> MetricsParser::parseInteger(const std::string& str) {
    int64_t value;
    auto result = std::from_chars(str.data(), str.data() + str.size(), value);
    if (result.ec == std::errc() && result.ptr == str.data() + str.size()) {
        return value;
    }
    return std::nullopt;
}

std::optional<double> MetricsParser::parseDouble(const std::string& str) {
    if (str.empty()) {
        return std::nullopt;
    }
    char* end = nullptr;
    double value = std::strtod(str.c_str(), &end);
    if (end == str.c_str() + str.size()) {
        return value;
    }
    return std::nullopt;
}

std::optional<WorkerResult> MetricsParser::parse(const std::string& output,
                                                 std::string& error_message) {
    std::vector<int64_t> frames;
    double speed_total = 0.0;
    double fps_total = 0.0;
    int samples = 0;

    std::optional<double> rss_kb;
    std::optional<double> time_s;

    for (const auto& line : splitLines(output)) {
        if (startsWith(line, "frame=")) {
            auto values = parseKeyValues(line);
            auto frame = parseInteger(values["frame"]);
            if (!frame || *frame < kMinSampledFrame) {
                continue;
            }
            auto fps = parseDouble(values["fps"]);
            auto speed = parseDouble(stripSuffix(values["speed"], "x"));
            if (!fps || !speed) {
                continue;
            }
            frames.push_back(*frame);
            fps_total += *fps;
            speed_total += *speed;
            samples++;
        } else if (startsWith(line, "bench: maxrss")) {
            auto values = parseKeyValues(line);
            std::string raw = stripSuffix(stripSuffix(values["maxrss"], "KiB"), "kB");
            rss_kb = parseDouble(raw);
            if (!rss_kb) {
                error_message = "Malformed memory summary line: " + line;
                return std::nullopt;
            }
        } else if (startsWith(line, "bench: utime")) {
            auto values = parseKeyValues(line);
            const char* key = values.count("rtime") ? "rtime" : "utime";
            time_s = parseDouble(stripSuffix(values[key], "s"));
            if (!time_s) {
                error_message = "Malformed time summary line: " + line;
                return std::nullopt;
            }
        }
    }

    if (!rss_kb) {
        error_message = "Encoder output has no 'bench: maxrss' line";
        return std::nullopt;
    }
    if (!time_s) {
        error_message = "Encoder output has no 'bench: utime' line";
        return std::nullopt;
    }

    const int divisor = samples > 0 ? samples : 1;

    WorkerResult result;
    result.frame = frames.empty() ? 1 : *std::max_element(frames.begin(), frames.end());
    result.speed = speed_total / divisor;
    result.fps = fps_total / divisor;
    result.rss_kb = *rss_kb;
    result.time_s = *time_s;
    result.sampled_lines = samples;
    return result;
}

} // namespace transcode_bench
