#include "benchmark/benchmark_runner.hpp"
#include "benchmark/driver_limit_probe.hpp"
#include "utils/error_log.hpp"
#include "utils/logger.hpp"
#include <algorithm>
#include <filesystem>
#include <utility>

namespace transcode_bench {

namespace {
constexpr const char* kCpuType = "cpu";
} // namespace

BenchmarkRunner::BenchmarkRunner(const BenchmarkConfig& config,
                                 const TestSuite& suite,
                                 std::optional<GpuDevice> gpu,
                                 ErrorLog& error_log,
                                 TrialExecutor& executor,
                                 SourceAnalyzer analyzer)
    : config_(config)
    , suite_(suite)
    , gpu_(std::move(gpu))
    , error_log_(error_log)
    , executor_(executor)
    , analyzer_(std::move(analyzer)) {
}

std::vector<std::string> BenchmarkRunner::selectDeviceTypes(bool disable_cpu,
                                                            const std::optional<GpuDevice>& gpu) {
    std::vector<std::string> types;
    if (!disable_cpu) {
        types.push_back(kCpuType);
    }
    if (gpu) {
        std::string type = gpu->getDeviceType();
        if (!type.empty()) {
            types.push_back(type);
        }
    }
    return types;
}

int BenchmarkRunner::countCommands() const {
    return suite_.countCommands(selectDeviceTypes(config_.disable_cpu, gpu_));
}

std::optional<Command> BenchmarkRunner::buildCommand(const TestArgument& argument,
                                                     const std::string& video_path,
                                                     std::string& error_message) const {
    std::string args = substitutePlaceholder(argument.args, "video_file", video_path);
    if (gpu_) {
        args = substitutePlaceholder(args, "gpu", gpu_->formatArgument());
    }

    auto words = splitArguments(args, error_message);
    if (!words) {
        return std::nullopt;
    }

    Command command;
    command.argv.reserve(words->size() + 1);
    command.argv.push_back(config_.ffmpeg_path);
    for (auto& word : *words) {
        command.argv.push_back(std::move(word));
    }
    return command;
}

void BenchmarkRunner::probeDriverLimit(SessionResult& session, const RunnerCallbacks& callbacks) {
    driver_probed_ = true;

    DriverLimitProbe probe(makeProbeOptions(config_), &error_log_);
    DriverLimit limit = probe.run(*gpu_);
    session.driver_limit = limit;

    if (callbacks.on_driver_limit) {
        callbacks.on_driver_limit(limit);
    }

    switch (limit.status) {
        case DriverLimitStatus::Unlimited:
            break;

        case DriverLimitStatus::Limited: {
            gpu_ceiling_ = limit.getCeiling();
            std::string question = gpu_->product + " allows only " +
                                   std::to_string(limit.observed_streams) +
                                   " encode sessions. Continue GPU tests with this limit?";
            if (callbacks.confirm && !callbacks.confirm(question)) {
                gpu_disabled_reason_ = FailureReason::limited("GPU tests disabled by user");
                Logger::info("GPU tests disabled after session limit probe");
                break;
            }
            Logger::info("GPU session ceiling set to " + std::to_string(*gpu_ceiling_));
            break;
        }

        case DriverLimitStatus::Incapable: {
            std::string message = "no hardware encode session could be opened";
            if (limit.failure) {
                message += " (" + limit.failure->message + ")";
            }
            gpu_disabled_reason_ = FailureReason::limited(message);
            Logger::error(gpu_->product + ": " + message);
            break;
        }
    }
}

SessionResult BenchmarkRunner::run(const RunnerCallbacks& callbacks) {
    SessionResult session;

    const auto device_types = selectDeviceTypes(config_.disable_cpu, gpu_);
    if (device_types.empty()) {
        session.error_message = "All hardware disabled";
        return session;
    }

    for (const auto& file : suite_.files) {
        error_log_.setTestHeader(file.name);

        const std::string video_path =
            (std::filesystem::path(config_.video_dir) / file.getFileName()).string();

        std::string video_error;
        std::optional<VideoInfo> video;
        if (!std::filesystem::exists(video_path)) {
            video_error = "Source file not found: " + video_path;
        } else {
            video = analyzer_(video_path, video_error);
        }

        if (video) {
            Logger::info("Source " + file.name + ": " + video->getDescription());
        } else {
            Logger::error(video_error);
        }

        if (callbacks.on_file_start) {
            callbacks.on_file_start(file, video);
        }

        for (const auto& test : file.tests) {
            for (const auto& argument : test.arguments) {
                if (std::find(device_types.begin(), device_types.end(), argument.type) ==
                    device_types.end()) {
                    continue;
                }

                const bool is_gpu = argument.type != kCpuType;

                TestRecord record;
                record.id = test.id;
                record.type = argument.type;
                if (is_gpu) {
                    record.selected_gpu = gpu_->index;
                } else {
                    record.selected_cpu = 0;
                }

                auto finish = [&](TestRecord& done) {
                    if (callbacks.on_command_done) {
                        callbacks.on_command_done(done);
                    }
                    session.records.push_back(std::move(done));
                };

                auto fail_without_running = [&](FailureReason reason) {
                    record.result.outcome = SearchOutcome::Errored;
                    record.result.failure_reasons.push_back(std::move(reason));
                    finish(record);
                };

                if (!video) {
                    fail_without_running(FailureReason::processError(video_error));
                    continue;
                }

                if (is_gpu && !gpu_disabled_reason_ && !driver_probed_ && gpu_->hasSessionLimit()) {
                    probeDriverLimit(session, callbacks);
                }

                if (is_gpu && gpu_disabled_reason_) {
                    fail_without_running(*gpu_disabled_reason_);
                    continue;
                }

                std::string command_error;
                auto command = buildCommand(argument, video_path, command_error);
                if (!command) {
                    fail_without_running(FailureReason::processError(
                        "invalid command template: " + command_error));
                    continue;
                }

                if (callbacks.on_command_start) {
                    callbacks.on_command_start(test, argument.type);
                }

                error_log_.setTestArgs(command->toString());
                Logger::info("Benchmarking test " + test.getIdString() + " on " + argument.type +
                             ": " + command->toString());

                SearchOptions options;
                options.ceiling = is_gpu ? gpu_ceiling_ : std::nullopt;
                options.max_trials = config_.max_trials;

                ConcurrencySearch search(options, executor_);
                record.result = search.run(*command, callbacks.on_trial);

                Logger::info("Test " + test.getIdString() + " on " + argument.type + ": " +
                             searchOutcomeName(record.result.outcome) + ", max streams " +
                             std::to_string(record.result.max_streams));
                finish(record);
            }
        }
    }

    session.success = true;
    return session;
}

} // namespace transcode_bench
