#include "utils/cli_parser.hpp"
#include "transcode_bench/version.hpp"
#include <iostream>
#include <charconv>
#include <cmath>

namespace transcode_bench {

namespace {
// One day; keeps the millisecond conversion in range
constexpr double kMaxTimeoutSeconds = 86400.0;
} // namespace

std::optional<int> CliParser::parseInteger(const std::string& str) {
    int value;
    auto result = std::from_chars(str.data(), str.data() + str.size(), value);
    if (result.ec == std::errc() && result.ptr == str.data() + str.size()) {
        return value;
    }
    return std::nullopt;
}

std::optional<double> CliParser::parseDouble(const std::string& str) {
    double value;
    auto result = std::from_chars(str.data(), str.data() + str.size(), value);
    if (result.ec == std::errc() && result.ptr == str.data() + str.size() && std::isfinite(value)) {
        return value;
    }
    return std::nullopt;
}

CliParseResult CliParser::parse(int argc, char* argv[]) {
    return parse(std::vector<std::string>(argv, argv + argc));
}

CliParseResult CliParser::parse(const std::vector<std::string>& args) {
    CliParseResult result;
    result.success = true;
    result.show_help = false;
    result.show_version = false;

    auto fail = [&result](const std::string& message) {
        result.success = false;
        result.error_message = message;
        return result;
    };

    // Fetch the value following an option; nullopt if the option is last
    auto next_value = [&args](size_t& i) -> std::optional<std::string> {
        if (i + 1 >= args.size()) {
            return std::nullopt;
        }
        return args[++i];
    };

    for (size_t i = 1; i < args.size(); i++) {
        const std::string& arg = args[i];

        if (arg == "-h" || arg == "--help") {
            result.show_help = true;
            return result;
        }

        if (arg == "-v" || arg == "--version") {
            result.show_version = true;
            return result;
        }

        if (arg == "-y" || arg == "--yes") {
            result.config.assume_yes = true;
            continue;
        }

        if (arg == "--nocpu") {
            result.config.disable_cpu = true;
            continue;
        }

        if (arg == "--debug") {
            result.config.debug = true;
            continue;
        }

        if (arg == "--ffmpeg" || arg == "--videos" || arg == "--output" ||
            arg == "--csv-file" || arg == "--hwinfo" || arg == "--log-file" ||
            arg == "--error-log") {
            auto value = next_value(i);
            if (!value || value->empty()) {
                return fail("Missing value for " + arg);
            }
            if (arg == "--ffmpeg") {
                result.config.ffmpeg_path = *value;
            } else if (arg == "--videos") {
                result.config.video_dir = *value;
            } else if (arg == "--output") {
                result.config.output_path = *value;
            } else if (arg == "--csv-file") {
                result.config.csv_file = *value;
            } else if (arg == "--hwinfo") {
                result.config.hwinfo_file = *value;
            } else if (arg == "--log-file") {
                result.config.log_file = *value;
            } else {
                result.config.error_log_file = *value;
            }
            continue;
        }

        if (arg == "--gpu") {
            auto text = next_value(i);
            if (!text) {
                return fail("Missing value for --gpu");
            }
            auto value = parseInteger(*text);
            if (!value || *value < 0) {
                return fail("Invalid value for --gpu: must be a non-negative integer");
            }
            result.config.gpu_index = *value;
            continue;
        }

        if (arg == "--max-trials") {
            auto text = next_value(i);
            if (!text) {
                return fail("Missing value for --max-trials");
            }
            auto value = parseInteger(*text);
            if (!value || *value <= 0) {
                return fail("Invalid value for --max-trials: must be a positive integer");
            }
            result.config.max_trials = *value;
            continue;
        }

        if (arg == "--timeout") {
            auto text = next_value(i);
            if (!text) {
                return fail("Missing value for --timeout");
            }
            auto value = parseDouble(*text);
            if (!value || *value <= 0) {
                return fail("Invalid value for --timeout: must be a positive number");
            }
            if (*value > kMaxTimeoutSeconds) {
                return fail("Invalid value for --timeout: must be at most " +
                            std::to_string(static_cast<int>(kMaxTimeoutSeconds)) + " seconds");
            }
            result.config.process_timeout = *value;
            continue;
        }

        if (arg.size() > 1 && arg[0] == '-') {
            return fail("Unknown option: " + arg);
        }

        // Positional argument - test definitions
        if (result.config.test_file.empty()) {
            result.config.test_file = arg;
        } else {
            return fail("Too many arguments");
        }
    }

    if (result.config.test_file.empty()) {
        return fail("Missing test definition file");
    }

    return result;
}

void CliParser::printUsage(const std::string& program_name) {
    std::cout << "Usage: " << program_name << " [OPTIONS] <test_file>\n"
              << "\n"
              << "Transcoding benchmark - finds how many encoder processes run in real time at once\n"
              << "\n"
              << "Arguments:\n"
              << "  <test_file>            JSON test definitions\n"
              << "\n"
              << "Options:\n"
              << "      --ffmpeg PATH      Encoder binary (default: ffmpeg)\n"
              << "      --videos DIR       Directory holding the test media (default: ./videos)\n"
              << "      --output PATH      Result JSON (default: ./output.json)\n"
              << "      --csv-file PATH    Export every trial to a CSV file\n"
              << "      --hwinfo PATH      Hardware inventory JSON describing the GPUs\n"
              << "      --gpu N            GPU to test, 1-based; 0 disables GPU tests (default: first GPU)\n"
              << "      --nocpu            Skip CPU tests\n"
              << "      --timeout SEC      Per-process timeout (default: 120)\n"
              << "      --max-trials N     Trial budget per test (default: 64)\n"
              << "      --log-file PATH    Log file path (default: transcode-benchmark.log)\n"
              << "      --error-log PATH   Encoder error log (default: ./transcode-bench-log/ffmpeg_err_log.txt)\n"
              << "  -y, --yes              Answer yes to every prompt\n"
              << "      --debug            Log search decisions\n"
              << "  -h, --help             Show this help message\n"
              << "  -v, --version          Show version information\n"
              << "\n"
              << "Examples:\n"
              << "  " << program_name << " tests.json\n"
              << "  " << program_name << " --hwinfo hwinfo.json --gpu 1 --nocpu tests.json\n"
              << "  " << program_name << " --ffmpeg /usr/lib/jellyfin-ffmpeg/ffmpeg -y tests.json\n";
}

void CliParser::printVersion() {
    std::cout << PROGRAM_NAME << " version " << VERSION << "\n";
}

} // namespace transcode_bench
