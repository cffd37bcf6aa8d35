#include "video/video_info.hpp"
#include <cmath>
#include <iomanip>
#include <memory>
#include <sstream>

extern "C" {
#include <libavformat/avformat.h>
#include <libavutil/error.h>
}

namespace transcode_bench {
namespace {

struct InputCloser {
    void operator()(AVFormatContext* ctx) const {
        avformat_close_input(&ctx);
    }
};

using InputPtr = std::unique_ptr<AVFormatContext, InputCloser>;

std::string avErrorText(int errnum) {
    char buf[AV_ERROR_MAX_STRING_SIZE] = {};
    av_strerror(errnum, buf, sizeof(buf));
    return buf;
}

} // namespace

std::string VideoInfo::getResolutionString() const {
    if (height >= 2160) {
        return "4K";
    } else if (height >= 1440) {
        return "1440p";
    } else if (height >= 1080) {
        return "1080p";
    } else if (height >= 720) {
        return "720p";
    } else if (height >= 480) {
        return "480p";
    } else {
        return std::to_string(height) + "p";
    }
}

std::string VideoInfo::getDescription() const {
    std::ostringstream oss;
    oss << getResolutionString() << " " << codec_name
        << ", " << std::fixed << std::setprecision(2) << fps << "fps"
        << ", " << std::setprecision(1) << duration_seconds << "s";
    if (total_frames > 0) {
        oss << ", " << total_frames << " frames";
    }
    return oss.str();
}

std::string VideoAnalyzer::codecIdToName(AVCodecID codec_id) {
    switch (codec_id) {
        case AV_CODEC_ID_H264:
            return "H.264";
        case AV_CODEC_ID_HEVC:
            return "H.265";
        case AV_CODEC_ID_VP9:
            return "VP9";
        case AV_CODEC_ID_AV1:
            return "AV1";
        case AV_CODEC_ID_MPEG2VIDEO:
            return "MPEG-2";
        default: {
            const char* name = avcodec_get_name(codec_id);
            return name ? name : "Unknown";
        }
    }
}

std::optional<VideoInfo> VideoAnalyzer::analyze(const std::string& file_path,
                                                 std::string& error_message) {
    AVFormatContext* raw_ctx = nullptr;

    int ret = avformat_open_input(&raw_ctx, file_path.c_str(), nullptr, nullptr);
    if (ret < 0) {
        error_message = "Failed to open " + file_path + ": " + avErrorText(ret);
        return std::nullopt;
    }
    InputPtr format_ctx(raw_ctx);

    ret = avformat_find_stream_info(format_ctx.get(), nullptr);
    if (ret < 0) {
        error_message = "Failed to find stream info in " + file_path + ": " + avErrorText(ret);
        return std::nullopt;
    }

    int video_stream_index = av_find_best_stream(format_ctx.get(), AVMEDIA_TYPE_VIDEO,
                                                 -1, -1, nullptr, 0);
    if (video_stream_index < 0) {
        error_message = "No video stream found in " + file_path;
        return std::nullopt;
    }

    AVStream* video_stream = format_ctx->streams[video_stream_index];
    AVCodecParameters* codec_params = video_stream->codecpar;

    double fps = 0.0;
    if (video_stream->avg_frame_rate.den != 0) {
        fps = av_q2d(video_stream->avg_frame_rate);
    } else if (video_stream->r_frame_rate.den != 0) {
        fps = av_q2d(video_stream->r_frame_rate);
    }

    double duration = 0.0;
    if (format_ctx->duration != AV_NOPTS_VALUE) {
        duration = static_cast<double>(format_ctx->duration) / AV_TIME_BASE;
    } else if (video_stream->duration != AV_NOPTS_VALUE) {
        duration = static_cast<double>(video_stream->duration) *
                   av_q2d(video_stream->time_base);
    }

    int64_t total_frames = video_stream->nb_frames;
    if (total_frames <= 0 && duration > 0 && fps > 0) {
        total_frames = static_cast<int64_t>(std::round(duration * fps));
    }

    VideoInfo info;
    info.file_path = file_path;
    info.codec_name = codecIdToName(codec_params->codec_id);
    info.width = codec_params->width;
    info.height = codec_params->height;
    info.fps = fps;
    info.duration_seconds = duration;
    info.total_frames = total_frames;

    return info;
}

} // namespace transcode_bench
