#ifndef VIDEO_INFO_HPP
#define VIDEO_INFO_HPP

#include <cstdint>
#include <optional>
#include <string>

extern "C" {
#include <libavcodec/avcodec.h>
}

namespace transcode_bench {

// Properties of a test source file
struct VideoInfo {
    std::string file_path;
    std::string codec_name;
    int width = 0;
    int height = 0;
    double fps = 0.0;
    double duration_seconds = 0.0;
    int64_t total_frames = 0;

    // Format resolution as string (e.g., "1080p", "4K")
    std::string getResolutionString() const;

    // e.g. "1080p H.264, 29.97fps, 60.0s, 1798 frames"
    std::string getDescription() const;
};

// Probes source files before they are handed to the encoder, so that a
// missing or corrupt file is reported once instead of failing every trial
class VideoAnalyzer {
public:
    // Analyze video file and return info, or nullopt on error
    static std::optional<VideoInfo> analyze(const std::string& file_path,
                                            std::string& error_message);

private:
    static std::string codecIdToName(AVCodecID codec_id);
};

} // namespace transcode_bench

#endif // VIDEO_INFO_HPP
