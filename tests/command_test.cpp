#include "process/command.hpp"
#include <gtest/gtest.h>

using namespace transcode_bench;

TEST(CommandTest, SplitsOnWhitespace) {
    std::string error;
    auto words = splitArguments("  -i  in.mp4 -c:v libx264\t-f null - ", error);
    ASSERT_TRUE(words.has_value()) << error;
    EXPECT_EQ(*words, (std::vector<std::string>{"-i", "in.mp4", "-c:v", "libx264", "-f", "null", "-"}));
}

TEST(CommandTest, HonorsQuotesAndEscapes) {
    std::string error;
    auto words = splitArguments(R"(-vf "scale=w=1280:h=720" -metadata 'title=a b' my\ file.mkv "x\"y")", error);
    ASSERT_TRUE(words.has_value()) << error;
    EXPECT_EQ(*words, (std::vector<std::string>{
                          "-vf", "scale=w=1280:h=720", "-metadata", "title=a b", "my file.mkv", "x\"y"}));
}

TEST(CommandTest, EmptyQuotesProduceEmptyWord) {
    std::string error;
    auto words = splitArguments("a '' b", error);
    ASSERT_TRUE(words.has_value()) << error;
    EXPECT_EQ(*words, (std::vector<std::string>{"a", "", "b"}));
}

TEST(CommandTest, RejectsUnbalancedQuotes) {
    std::string error;
    EXPECT_FALSE(splitArguments("-vf 'scale=1280:720", error).has_value());
    EXPECT_EQ(error, "Unbalanced quotes in command");
}

TEST(CommandTest, RejectsTrailingEscape) {
    std::string error;
    EXPECT_FALSE(splitArguments("-i in.mp4 \\", error).has_value());
    EXPECT_EQ(error, "Trailing escape character in command");
}

TEST(CommandTest, ParseRejectsEmptyLine) {
    std::string error;
    EXPECT_FALSE(Command::parse("   ", error).has_value());
    EXPECT_EQ(error, "Empty command");
}

TEST(CommandTest, ToStringJoinsArguments) {
    std::string error;
    auto command = Command::parse("ffmpeg -i in.mp4", error);
    ASSERT_TRUE(command.has_value()) << error;
    EXPECT_EQ(command->toString(), "ffmpeg -i in.mp4");
}

TEST(CommandTest, SubstitutesEveryPlaceholder) {
    EXPECT_EQ(substitutePlaceholder("-i {video_file} -map 0 {video_file}.log", "video_file", "/v/a.mkv"),
              "-i /v/a.mkv -map 0 /v/a.mkv.log");
    EXPECT_EQ(substitutePlaceholder("-hwaccel_device {gpu}", "video_file", "x"),
              "-hwaccel_device {gpu}");
    EXPECT_EQ(substitutePlaceholder("{gpu}", "gpu", "{gpu}{gpu}"), "{gpu}{gpu}");
}
