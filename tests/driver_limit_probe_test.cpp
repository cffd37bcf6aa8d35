#include "benchmark/driver_limit_probe.hpp"
#include "test_helpers.hpp"
#include <gtest/gtest.h>
#include <algorithm>

using namespace transcode_bench;
using namespace std::chrono_literals;

namespace {

GpuDevice nvidiaGpu(const std::string& driver_version) {
    GpuDevice gpu;
    gpu.index = 0;
    gpu.vendor = "NVIDIA Corporation";
    gpu.product = "GA104 [GeForce RTX 3070]";
    gpu.bus_info = "pci@0000:01:00.0";
    gpu.driver_version = driver_version;
    return gpu;
}

ProbeOptions probeWith(const std::string& ffmpeg_path) {
    ProbeOptions options;
    options.ffmpeg_path = ffmpeg_path;
    options.timeout = 20000ms;
    return options;
}

} // namespace

TEST(DriverLimitProbeTest, CeilingFollowsDriverBands) {
    EXPECT_EQ(DriverLimitProbe::ceilingForDriverVersion("550.54.14"), 8);
    EXPECT_EQ(DriverLimitProbe::ceilingForDriverVersion("560.35.03"), 8);
    EXPECT_EQ(DriverLimitProbe::ceilingForDriverVersion("535.104.05"), 5);
    EXPECT_EQ(DriverLimitProbe::ceilingForDriverVersion("530.30.02"), 5);
    EXPECT_EQ(DriverLimitProbe::ceilingForDriverVersion("525.147.05"), 3);
    EXPECT_EQ(DriverLimitProbe::ceilingForDriverVersion("470.256.02"), 3);
}

TEST(DriverLimitProbeTest, UnreadableVersionIsPermissive) {
    EXPECT_EQ(DriverLimitProbe::ceilingForDriverVersion(""), DriverLimitProbe::kPermissiveCeiling);
    EXPECT_EQ(DriverLimitProbe::ceilingForDriverVersion("unknown"), DriverLimitProbe::kPermissiveCeiling);
    EXPECT_EQ(DriverLimitProbe::ceilingForDriverVersion("550.x"), DriverLimitProbe::kPermissiveCeiling);
}

TEST(DriverLimitProbeTest, WindowsVersionMapsToMarketingVersion) {
    EXPECT_EQ(DriverLimitProbe::parseDriverMajor("31.0.15.5222"), 552);
    EXPECT_EQ(DriverLimitProbe::parseDriverMajor("31.0.15.3713"), 537);
    EXPECT_EQ(DriverLimitProbe::ceilingForDriverVersion("31.0.15.3713"), 5);
    EXPECT_EQ(DriverLimitProbe::parseDriverMajor("550.54.14"), 550);
}

TEST(DriverLimitProbeTest, CountsStreamOpenMarkers) {
    const std::string output =
        "Output #0, null, to 'pipe:':\n"
        "  Stream #0:0: Video: h264\n"
        "Output #1, null, to 'pipe:':\n"
        "Output #2, matroska, to 'out.mkv':\n"
        "Output #12, null, to 'pipe:':\n";
    EXPECT_EQ(DriverLimitProbe::countOpenedStreams(output), 3);
    EXPECT_EQ(DriverLimitProbe::countOpenedStreams(""), 0);
}

TEST(DriverLimitProbeTest, EvaluateClassifiesObservedStreams) {
    DriverLimit unlimited = DriverLimitProbe::evaluate(8, 9);
    EXPECT_EQ(unlimited.status, DriverLimitStatus::Unlimited);
    EXPECT_FALSE(unlimited.limiting);
    EXPECT_FALSE(unlimited.getCeiling().has_value());

    DriverLimit limited = DriverLimitProbe::evaluate(8, 5);
    EXPECT_EQ(limited.status, DriverLimitStatus::Limited);
    EXPECT_EQ(limited.requested_streams, 9);
    EXPECT_TRUE(limited.limiting);
    EXPECT_EQ(limited.getCeiling(), 5);

    DriverLimit incapable = DriverLimitProbe::evaluate(3, 0);
    EXPECT_EQ(incapable.status, DriverLimitStatus::Incapable);
    EXPECT_FALSE(incapable.getCeiling().has_value());
}

TEST(DriverLimitProbeTest, SessionLimitReasons) {
    EXPECT_TRUE(DriverLimitProbe::isSessionLimitReason("incompatible client key"));
    EXPECT_TRUE(DriverLimitProbe::isSessionLimitReason("out of memory"));
    EXPECT_FALSE(DriverLimitProbe::isSessionLimitReason("License issue"));
}

TEST(DriverLimitProbeTest, CommandRepeatsOutputPerStream) {
    DriverLimitProbe probe(probeWith("/opt/ffmpeg/bin/ffmpeg"), nullptr);
    Command command = probe.buildCommand(nvidiaGpu("550.54.14"), 3);

    ASSERT_FALSE(command.empty());
    EXPECT_EQ(command.argv.front(), "/opt/ffmpeg/bin/ffmpeg");
    EXPECT_EQ(std::count(command.argv.begin(), command.argv.end(), "h264_nvenc"), 3);
    EXPECT_EQ(std::count(command.argv.begin(), command.argv.end(), "5M"), 3);
    EXPECT_EQ(std::count(command.argv.begin(), command.argv.end(), "testsrc"), 1);
#if defined(__linux__)
    EXPECT_NE(std::find(command.argv.begin(), command.argv.end(), "pci-0000:01:00.0"),
              command.argv.end());
#endif
}

TEST(DriverLimitProbeTest, ProbeReportsDriverCap) {
    test::TempDir dir;
    const std::string ffmpeg = test::writeScript(
        dir.path(), "ffmpeg",
        "for i in 0 1 2 3 4; do echo \"Output #$i, null, to 'pipe:':\"; done\n");

    DriverLimitProbe probe(probeWith(ffmpeg), nullptr);
    DriverLimit limit = probe.run(nvidiaGpu("550.54.14"));

    EXPECT_EQ(limit.configured_ceiling, 8);
    EXPECT_EQ(limit.requested_streams, 9);
    EXPECT_EQ(limit.observed_streams, 5);
    EXPECT_EQ(limit.status, DriverLimitStatus::Limited);
    EXPECT_TRUE(limit.limiting);
    EXPECT_EQ(limit.getCeiling(), 5);
}

TEST(DriverLimitProbeTest, SessionLimitFailureStillCountsMarkers) {
    test::TempDir dir;
    const std::string ffmpeg = test::writeScript(
        dir.path(), "ffmpeg",
        "echo \"Output #0, null, to 'pipe:':\"\n"
        "echo \"Output #1, null, to 'pipe:':\"\n"
        "echo '[h264_nvenc @ 0x1] OpenEncodeSessionEx failed: out of memory (10)'\n"
        "exit 1\n");

    DriverLimitProbe probe(probeWith(ffmpeg), nullptr);
    DriverLimit limit = probe.run(nvidiaGpu("535.104.05"));

    EXPECT_EQ(limit.requested_streams, 6);
    EXPECT_EQ(limit.observed_streams, 2);
    EXPECT_EQ(limit.status, DriverLimitStatus::Limited);
    ASSERT_TRUE(limit.failure.has_value());
    EXPECT_EQ(limit.failure->message, "out of memory");
}

TEST(DriverLimitProbeTest, OtherFailureMeansIncapable) {
    test::TempDir dir;
    const std::string ffmpeg = test::writeScript(
        dir.path(), "ffmpeg",
        "echo \"Output #0, null, to 'pipe:':\"\n"
        "echo '[h264_nvenc @ 0x1] OpenEncodeSessionEx failed: License issue (21)'\n"
        "exit 1\n");

    DriverLimitProbe probe(probeWith(ffmpeg), nullptr);
    DriverLimit limit = probe.run(nvidiaGpu("550.54.14"));

    EXPECT_EQ(limit.observed_streams, 0);
    EXPECT_EQ(limit.status, DriverLimitStatus::Incapable);
    ASSERT_TRUE(limit.failure.has_value());
    EXPECT_EQ(limit.failure->message, "License issue");
}
