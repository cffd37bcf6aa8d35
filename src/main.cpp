#include "utils/cli_parser.hpp"
#include "utils/output_formatter.hpp"
#include "utils/csv_exporter.hpp"
#include "utils/error_log.hpp"
#include "utils/logger.hpp"
#include "utils/result_writer.hpp"
#include "benchmark/benchmark_runner.hpp"
#include "worker/worker_pool.hpp"
#include <algorithm>
#include <cctype>
#include <iostream>

using namespace transcode_bench;

namespace {

// Ask a yes/no question on stdin; end of input counts as "no"
bool askYesNo(const std::string& question) {
    while (true) {
        std::cout << question << " [y/n] " << std::flush;
        std::string answer;
        if (!std::getline(std::cin, answer)) {
            std::cout << "\n";
            return false;
        }
        std::transform(answer.begin(), answer.end(), answer.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        if (answer == "y" || answer == "yes") {
            return true;
        }
        if (answer == "n" || answer == "no") {
            return false;
        }
    }
}

} // namespace

int main(int argc, char* argv[]) {
    // Parse command line arguments first to get log file path
    auto parse_result = CliParser::parse(argc, argv);

    // Initialize logger with configured or default path
    struct LoggerShutdownGuard {
        ~LoggerShutdownGuard() {
            Logger::shutdown();
        }
    } logger_shutdown_guard;
    (void)logger_shutdown_guard;

    const BenchmarkConfig& config = parse_result.config;

    const std::string log_file_path = config.log_file.value_or(Logger::defaultLogFilePath());
    std::string logger_error;
    if (!Logger::initialize(log_file_path, config.debug, logger_error)) {
        std::cerr << "Warning: Failed to initialize log file '" << log_file_path
                  << "': " << logger_error << "\n";
    } else {
        Logger::info("Log file: " + log_file_path);
        std::string cmdline;
        for (int i = 0; i < argc; i++) {
            if (i > 0) cmdline += ' ';
            cmdline += argv[i];
        }
        Logger::info("Command: " + cmdline);
    }

    if (!parse_result.success) {
        OutputFormatter::printError(parse_result.error_message);
        std::string help_hint = "Try '" + std::string(argv[0]) + " --help' for more information.";
        std::cerr << help_hint << "\n";
        Logger::error(help_hint);
        return 1;
    }

    if (parse_result.show_help) {
        CliParser::printUsage(argv[0]);
        return 0;
    }

    if (parse_result.show_version) {
        CliParser::printVersion();
        return 0;
    }

    std::string error;
    auto suite = TestSuite::loadFromFile(config.test_file, error);
    if (!suite) {
        OutputFormatter::printError(error);
        return 1;
    }

    std::optional<HardwareInfo> hardware;
    if (config.hwinfo_file) {
        hardware = HardwareInfo::loadFromFile(*config.hwinfo_file, error);
        if (!hardware) {
            OutputFormatter::printError(error);
            return 1;
        }
    }

    std::optional<GpuDevice> gpu;
    if (hardware) {
        GpuSelection selection = hardware->selectGpu(config.gpu_index);
        if (!selection.success) {
            OutputFormatter::printError(selection.error_message);
            return 1;
        }
        gpu = selection.gpu;
    } else if (config.gpu_index && *config.gpu_index > 0) {
        OutputFormatter::printError("--gpu requires a hardware inventory (--hwinfo)");
        return 1;
    }

    auto error_log = ErrorLog::open(config.error_log_file, error);
    if (!error_log) {
        OutputFormatter::printError(error);
        return 1;
    }

    const HostDescription host = HostDescription::collect(hardware);
    const auto device_types = BenchmarkRunner::selectDeviceTypes(config.disable_cpu, gpu);
    OutputFormatter::printHeader(host, gpu, device_types);

    WorkerPool pool(makePoolOptions(config), error_log.get());
    BenchmarkRunner runner(config, *suite, gpu, *error_log, pool);

    auto confirm = [&config](const std::string& question) {
        if (config.assume_yes) {
            Logger::info(question + " yes (--yes)");
            return true;
        }
        bool answer = askYesNo(question);
        Logger::info(question + (answer ? " yes" : " no"));
        return answer;
    };

    if (!device_types.empty()) {
        const int command_count = runner.countCommands();
        if (!confirm("Run " + std::to_string(command_count) + " test" +
                     (command_count == 1 ? "" : "s") + "?")) {
            OutputFormatter::printInfo("Aborted");
            return 1;
        }
    }

    RunnerCallbacks callbacks;
    callbacks.on_file_start = OutputFormatter::printFileStart;
    callbacks.on_command_start = OutputFormatter::printCommandStart;
    callbacks.on_trial = OutputFormatter::printTrialResult;
    callbacks.on_command_done = OutputFormatter::printCommandSummary;
    callbacks.on_driver_limit = OutputFormatter::printDriverLimit;
    callbacks.confirm = confirm;

    auto result = runner.run(callbacks);

    if (!result.success) {
        OutputFormatter::printError(result.error_message);
        return 1;
    }

    OutputFormatter::printSummary(result);

    if (!ResultWriter::writeToFile(ResultWriter::toJson(*suite, host, result),
                                   config.output_path, error)) {
        OutputFormatter::printError(error);
        return 1;
    }
    OutputFormatter::printInfo("Results written to: " + config.output_path);

    // Export CSV if requested
    if (config.csv_file) {
        std::string csv_error;
        if (!CsvExporter::exportToFile(result.records, *config.csv_file, csv_error)) {
            OutputFormatter::printError(csv_error);
            return 1;
        }
        Logger::info("CSV results exported to: " + *config.csv_file);
    }

    return 0;
}
