#include "benchmark/benchmark_runner.hpp"
#include "utils/error_log.hpp"
#include "test_helpers.hpp"
#include <gtest/gtest.h>
#include <algorithm>
#include <filesystem>
#include <memory>
#include <sstream>
#include <vector>

using namespace transcode_bench;

namespace {

class CountingExecutor : public TrialExecutor {
public:
    TrialOutcome runTrial(int, const Command&) override {
        calls++;
        return {};
    }

    int calls = 0;
};

TestSuite missingMediaSuite() {
    std::string error;
    auto suite = TestSuite::parse(R"({
        "token": "t",
        "tests": [{
            "name": "Missing Clip",
            "source_url": "https://example.org/media/missing_clip.mkv",
            "data": [{
                "id": "missing-720p",
                "arguments": [
                    {"type": "cpu", "args": "-i {video_file} -f null -"},
                    {"type": "nvidia", "args": "-hwaccel_device {gpu} -i {video_file} -f null -"},
                    {"type": "amd", "args": "-i {video_file} -f null -"}
                ]
            }]
        }]
    })", error);
    if (!suite) {
        ADD_FAILURE() << error;
        return {};
    }
    return *suite;
}

// Records the worker count of every trial; every trial runs at the given speed
class RecordingExecutor : public TrialExecutor {
public:
    explicit RecordingExecutor(double speed) : speed_(speed) {}

    TrialOutcome runTrial(int worker_count, const Command&) override {
        calls.push_back(worker_count);
        TrialOutcome outcome;
        outcome.success = true;
        RunAggregate agg;
        agg.workers = worker_count;
        agg.frame = 1500;
        agg.speed = speed_;
        agg.time_s = 20.0;
        agg.rss_kb = 90000.0;
        agg.avg_fps = 30.0 * speed_;
        outcome.aggregate = agg;
        return outcome;
    }

    std::vector<int> calls;

private:
    double speed_;
};

// Two nvidia-only tests sharing one source clip
TestSuite nvidiaSuite() {
    std::string error;
    auto suite = TestSuite::parse(R"({
        "token": "t",
        "tests": [{
            "name": "Clip",
            "source_url": "https://example.org/media/clip.mkv",
            "data": [
                {"id": "clip-1080p",
                 "arguments": [{"type": "nvidia", "args": "-hwaccel_device {gpu} -i {video_file} -f null -"}]},
                {"id": "clip-720p",
                 "arguments": [{"type": "nvidia", "args": "-hwaccel_device {gpu} -i {video_file} -s 1280x720 -f null -"}]}
            ]
        }]
    })", error);
    if (!suite) {
        ADD_FAILURE() << error;
        return {};
    }
    return *suite;
}

std::optional<VideoInfo> readableSource(const std::string& file_path, std::string&) {
    VideoInfo info;
    info.file_path = file_path;
    info.codec_name = "h264";
    return info;
}

// Stub encoder that opens `streams` outputs and logs each invocation to calls_file
std::string stubEncoder(const std::filesystem::path& dir, int streams,
                        const std::filesystem::path& calls_file) {
    std::ostringstream body;
    body << "echo run >> '" << calls_file.string() << "'\n";
    for (int i = 0; i < streams; i++) {
        body << "echo \"Output #" << i << ", null, to 'pipe:':\"\n";
    }
    return test::writeScript(dir, "ffmpeg", body.str());
}

int countLines(const std::filesystem::path& path) {
    const std::string text = test::readFile(path);
    return static_cast<int>(std::count(text.begin(), text.end(), '\n'));
}

GpuDevice nvidiaGpu() {
    GpuDevice gpu;
    gpu.vendor = "NVIDIA Corporation";
    gpu.product = "RTX 4070";
    gpu.driver_version = "550.54.14";
    return gpu;
}

} // namespace

TEST(BenchmarkRunnerTest, SelectsDeviceTypes) {
    EXPECT_EQ(BenchmarkRunner::selectDeviceTypes(false, std::nullopt),
              (std::vector<std::string>{"cpu"}));
    EXPECT_EQ(BenchmarkRunner::selectDeviceTypes(false, nvidiaGpu()),
              (std::vector<std::string>{"cpu", "nvidia"}));
    EXPECT_EQ(BenchmarkRunner::selectDeviceTypes(true, nvidiaGpu()),
              (std::vector<std::string>{"nvidia"}));
    EXPECT_TRUE(BenchmarkRunner::selectDeviceTypes(true, std::nullopt).empty());

    GpuDevice unknown;
    unknown.vendor = "Matrox";
    EXPECT_TRUE(BenchmarkRunner::selectDeviceTypes(true, unknown).empty());
}

TEST(BenchmarkRunnerTest, FailsWhenEveryDeviceIsDisabled) {
    test::TempDir dir;
    std::string error;
    auto error_log = ErrorLog::open((dir.path() / "err.txt").string(), error);
    ASSERT_TRUE(error_log) << error;

    TestSuite suite = missingMediaSuite();
    BenchmarkConfig config;
    config.disable_cpu = true;
    CountingExecutor executor;

    BenchmarkRunner runner(config, suite, std::nullopt, *error_log, executor);
    SessionResult session = runner.run();

    EXPECT_FALSE(session.success);
    EXPECT_EQ(session.error_message, "All hardware disabled");
    EXPECT_TRUE(session.records.empty());
    EXPECT_EQ(executor.calls, 0);
}

TEST(BenchmarkRunnerTest, MissingSourceYieldsRecordPerCommand) {
    test::TempDir dir;
    std::string error;
    const auto error_log_path = dir.path() / "err.txt";
    auto error_log = ErrorLog::open(error_log_path.string(), error);
    ASSERT_TRUE(error_log) << error;

    TestSuite suite = missingMediaSuite();
    BenchmarkConfig config;
    config.video_dir = (dir.path() / "videos").string();
    CountingExecutor executor;

    BenchmarkRunner runner(config, suite, nvidiaGpu(), *error_log, executor);
    EXPECT_EQ(runner.countCommands(), 2);

    int files_started = 0;
    int commands_done = 0;
    bool video_readable = true;
    RunnerCallbacks callbacks;
    callbacks.on_file_start = [&](const TestFile&, const std::optional<VideoInfo>& video) {
        files_started++;
        video_readable = video.has_value();
    };
    callbacks.on_command_done = [&](const TestRecord&) { commands_done++; };

    SessionResult session = runner.run(callbacks);

    ASSERT_TRUE(session.success) << session.error_message;
    EXPECT_EQ(executor.calls, 0);
    EXPECT_EQ(files_started, 1);
    EXPECT_FALSE(video_readable);
    EXPECT_EQ(commands_done, 2);
    EXPECT_FALSE(session.driver_limit.has_value());

    ASSERT_EQ(session.records.size(), 2u);
    EXPECT_EQ(session.records[0].type, "cpu");
    EXPECT_EQ(session.records[0].selected_cpu, 0);
    EXPECT_EQ(session.records[1].type, "nvidia");
    EXPECT_EQ(session.records[1].selected_gpu, 0);

    for (const auto& record : session.records) {
        EXPECT_EQ(record.getIdString(), "missing-720p");
        EXPECT_EQ(record.result.outcome, SearchOutcome::Errored);
        EXPECT_EQ(record.result.max_streams, 0);
        EXPECT_TRUE(record.result.trial_history.empty());
        ASSERT_EQ(record.result.failure_reasons.size(), 1u);
        EXPECT_EQ(record.result.failure_reasons[0].kind, FailureKind::ProcessError);
        EXPECT_NE(record.result.failure_reasons[0].message.find("missing_clip.mkv"),
                  std::string::npos);
    }

    EXPECT_NE(test::readFile(error_log_path).find("Missing Clip\n"), std::string::npos);
}

class BenchmarkRunnerSessionCapTest : public ::testing::Test {
protected:
    void SetUp() override {
        std::string error;
        error_log_ = ErrorLog::open((dir_.path() / "err.txt").string(), error);
        ASSERT_TRUE(error_log_) << error;

        std::filesystem::create_directories(dir_.path() / "videos");
        test::writeFile(dir_.path() / "videos" / "clip.mkv", "not really a video");

        config_.video_dir = (dir_.path() / "videos").string();
        config_.disable_cpu = true;
        config_.process_timeout = 20.0;
        suite_ = nvidiaSuite();
    }

    std::filesystem::path callsFile() const { return dir_.path() / "encoder_calls.txt"; }

    test::TempDir dir_;
    std::unique_ptr<ErrorLog> error_log_;
    BenchmarkConfig config_;
    TestSuite suite_;
};

TEST_F(BenchmarkRunnerSessionCapTest, ConfirmedLimitBecomesSearchCeiling) {
    // Driver 550 requests 9 sessions; the stub opens 5
    config_.ffmpeg_path = stubEncoder(dir_.path(), 5, callsFile());
    RecordingExecutor executor(2.5);

    BenchmarkRunner runner(config_, suite_, nvidiaGpu(), *error_log_, executor, readableSource);

    std::vector<std::string> questions;
    RunnerCallbacks callbacks;
    callbacks.confirm = [&](const std::string& question) {
        questions.push_back(question);
        return true;
    };

    SessionResult session = runner.run(callbacks);

    ASSERT_TRUE(session.success) << session.error_message;
    ASSERT_TRUE(session.driver_limit.has_value());
    EXPECT_EQ(session.driver_limit->status, DriverLimitStatus::Limited);
    EXPECT_EQ(session.driver_limit->observed_streams, 5);
    EXPECT_EQ(countLines(callsFile()), 1);

    ASSERT_EQ(questions.size(), 1u);
    EXPECT_NE(questions[0].find("only 5 encode sessions"), std::string::npos);

    ASSERT_FALSE(executor.calls.empty());
    EXPECT_EQ(*std::max_element(executor.calls.begin(), executor.calls.end()), 5);

    ASSERT_EQ(session.records.size(), 2u);
    for (const auto& record : session.records) {
        EXPECT_EQ(record.type, "nvidia");
        EXPECT_EQ(record.result.outcome, SearchOutcome::Limited);
        EXPECT_EQ(record.result.max_streams, 5);
        ASSERT_TRUE(record.result.best.has_value());
        EXPECT_EQ(record.result.best->workers, 5);
    }
}

TEST_F(BenchmarkRunnerSessionCapTest, DeclinedLimitSkipsEveryGpuCommand) {
    config_.ffmpeg_path = stubEncoder(dir_.path(), 5, callsFile());
    RecordingExecutor executor(2.5);

    BenchmarkRunner runner(config_, suite_, nvidiaGpu(), *error_log_, executor, readableSource);

    int questions = 0;
    RunnerCallbacks callbacks;
    callbacks.confirm = [&](const std::string&) {
        questions++;
        return false;
    };

    SessionResult session = runner.run(callbacks);

    ASSERT_TRUE(session.success) << session.error_message;
    EXPECT_EQ(questions, 1);
    EXPECT_TRUE(executor.calls.empty());
    EXPECT_EQ(countLines(callsFile()), 1);

    ASSERT_EQ(session.records.size(), 2u);
    EXPECT_EQ(session.records[0].getIdString(), "clip-1080p");
    EXPECT_EQ(session.records[1].getIdString(), "clip-720p");
    for (const auto& record : session.records) {
        EXPECT_EQ(record.result.max_streams, 0);
        EXPECT_TRUE(record.result.trial_history.empty());
        ASSERT_EQ(record.result.failure_reasons.size(), 1u);
        EXPECT_EQ(record.result.failure_reasons[0].kind, FailureKind::ExternalLimit);
        EXPECT_EQ(record.result.failure_reasons[0].message, "GPU tests disabled by user");
    }
}

TEST_F(BenchmarkRunnerSessionCapTest, IncapableGpuIsCheckedOnceAndSkipped) {
    config_.ffmpeg_path = stubEncoder(dir_.path(), 0, callsFile());
    RecordingExecutor executor(2.5);

    BenchmarkRunner runner(config_, suite_, nvidiaGpu(), *error_log_, executor, readableSource);

    int questions = 0;
    int limits_reported = 0;
    RunnerCallbacks callbacks;
    callbacks.confirm = [&](const std::string&) {
        questions++;
        return true;
    };
    callbacks.on_driver_limit = [&](const DriverLimit&) { limits_reported++; };

    SessionResult session = runner.run(callbacks);

    ASSERT_TRUE(session.success) << session.error_message;
    ASSERT_TRUE(session.driver_limit.has_value());
    EXPECT_EQ(session.driver_limit->status, DriverLimitStatus::Incapable);
    EXPECT_EQ(limits_reported, 1);
    EXPECT_EQ(questions, 0);
    EXPECT_EQ(countLines(callsFile()), 1);
    EXPECT_TRUE(executor.calls.empty());

    ASSERT_EQ(session.records.size(), 2u);
    for (const auto& record : session.records) {
        ASSERT_EQ(record.result.failure_reasons.size(), 1u);
        EXPECT_EQ(record.result.failure_reasons[0].kind, FailureKind::ExternalLimit);
        EXPECT_NE(record.result.failure_reasons[0].message.find("no hardware encode session"),
                  std::string::npos);
    }
}
