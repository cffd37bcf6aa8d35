#include "process/process_runner.hpp"
#include "process/failure_classifier.hpp"
#include "utils/error_log.hpp"
#include "test_helpers.hpp"
#include <gtest/gtest.h>

using namespace transcode_bench;
using namespace std::chrono_literals;

namespace {

Command shell(const std::string& script) {
    Command command;
    command.argv = {"/bin/sh", "-c", script};
    return command;
}

} // namespace

TEST(ProcessRunnerTest, CapturesMergedOutputOnSuccess) {
    ProcessRunner runner(shell("echo to-stdout; echo to-stderr 1>&2"));
    ProcessRunResult result = runner.run();

    EXPECT_TRUE(result.success);
    EXPECT_EQ(result.exit_code, 0);
    EXPECT_FALSE(result.failure.has_value());
    EXPECT_NE(result.output.find("to-stdout"), std::string::npos);
    EXPECT_NE(result.output.find("to-stderr"), std::string::npos);
}

TEST(ProcessRunnerTest, StdinIsNullDevice) {
    ProcessRunner runner(shell("if read line; then echo got-input; else echo no-input; fi"), 5000ms);
    ProcessRunResult result = runner.run();

    ASSERT_TRUE(result.success);
    EXPECT_NE(result.output.find("no-input"), std::string::npos);
}

TEST(ProcessRunnerTest, ClassifiesErrorExitStatus) {
    ProcessRunner runner(shell(
        "echo '[h264_nvenc @ 0x1] OpenEncodeSessionEx failed: License issue (21)'; exit 21"));
    ProcessRunResult result = runner.run();

    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.exit_code, 21);
    ASSERT_TRUE(result.failure.has_value());
    EXPECT_EQ(result.failure->kind, FailureKind::ProcessError);
    EXPECT_EQ(result.failure->message, "License issue");
}

TEST(ProcessRunnerTest, UnclassifiedFailureKeepsOutput) {
    ProcessRunner runner(shell("echo 'mystery output'; exit 3"));
    ProcessRunResult result = runner.run();

    ASSERT_TRUE(result.failure.has_value());
    EXPECT_EQ(result.failure->message, FailureClassifier::kUnclassifiedMessage);
    EXPECT_NE(result.failure->detail.find("mystery output"), std::string::npos);
}

TEST(ProcessRunnerTest, ExitStatus255IsHandedToParser) {
    ProcessRunner runner(shell("echo 'bench: maxrss=1kB'; exit 255"));
    ProcessRunResult result = runner.run();

    EXPECT_TRUE(result.success);
    EXPECT_EQ(result.exit_code, 255);
    EXPECT_FALSE(result.failure.has_value());
}

TEST(ProcessRunnerTest, TimeoutKillsProcessGroup) {
    const auto start = std::chrono::steady_clock::now();
    ProcessRunner runner(shell("sleep 30 & sleep 30; wait"), 300ms);
    ProcessRunResult result = runner.run();
    const auto elapsed = std::chrono::steady_clock::now() - start;

    EXPECT_FALSE(result.success);
    ASSERT_TRUE(result.failure.has_value());
    EXPECT_EQ(result.failure->kind, FailureKind::Timeout);
    EXPECT_EQ(result.failure->message, "failed_timeout");
    EXPECT_LT(elapsed, 10s);
}

TEST(ProcessRunnerTest, CancellationIsNotAFailureOfTheProcess) {
    std::atomic<bool> cancel{true};
    ProcessRunner runner(shell("sleep 30"), 60000ms);
    ProcessRunResult result = runner.run(&cancel);

    EXPECT_FALSE(result.success);
    EXPECT_TRUE(result.cancelled);
}

TEST(ProcessRunnerTest, ReportsSignalDeath) {
    ProcessRunner runner(shell("kill -9 $$"));
    ProcessRunResult result = runner.run();

    ASSERT_TRUE(result.failure.has_value());
    EXPECT_EQ(result.failure->message, "terminated by signal 9");
}

TEST(ProcessRunnerTest, MissingBinaryFails) {
    Command command;
    command.argv = {"/nonexistent/transcode-bench-encoder", "-version"};
    ProcessRunner runner(command);
    ProcessRunResult result = runner.run();

    EXPECT_FALSE(result.success);
    EXPECT_TRUE(result.failure.has_value());
}

TEST(ProcessRunnerTest, EmptyCommandFails) {
    ProcessRunner runner(Command{});
    ProcessRunResult result = runner.run();

    ASSERT_TRUE(result.failure.has_value());
    EXPECT_EQ(result.failure->message, "empty command");
}

TEST(ProcessRunnerTest, FailuresAreFramedInErrorLog) {
    test::TempDir dir;
    const auto log_path = dir.path() / "logs" / "ffmpeg_err_log.txt";

    std::string error;
    auto error_log = ErrorLog::open(log_path.string(), error);
    ASSERT_TRUE(error_log) << error;

    error_log->setTestHeader("Big Buck Bunny");
    Command command = shell("echo first; echo second; exit 4");
    ProcessRunner(command, 5000ms, error_log.get()).run();

    std::atomic<bool> cancel{true};
    ProcessRunner(shell("sleep 30"), 5000ms, error_log.get()).run(&cancel);

    const std::string contents = test::readFile(log_path);
    EXPECT_NE(contents.find("encoder error log from"), std::string::npos);
    EXPECT_NE(contents.find("Big Buck Bunny\n"), std::string::npos);
    EXPECT_NE(contents.find("    -> " + command.toString() + "\n"), std::string::npos);
    EXPECT_NE(contents.find("        -| first\n        -| second\n"), std::string::npos);
    EXPECT_NE(contents.find("        ----"), std::string::npos);
    EXPECT_EQ(contents.find("sleep 30"), std::string::npos);
}
