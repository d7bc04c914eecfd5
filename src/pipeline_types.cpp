#include "pipeline_types.h"
#include "utils.h"

VideoCodec parse_video_codec(const std::string &codecName)
{
    const std::string name = lowercase_copy(trim_copy(codecName));
    if (name == "h264")
        return VideoCodec::H264;
    if (name == "hevc" || name == "h265")
        return VideoCodec::Hevc;
    if (name == "av1")
        return VideoCodec::Av1;
    return VideoCodec::Other;
}

const char *video_codec_name(VideoCodec codec)
{
    switch (codec)
    {
    case VideoCodec::H264:
        return "h264";
    case VideoCodec::Hevc:
        return "hevc";
    case VideoCodec::Av1:
        return "av1";
    default:
        return "other";
    }
}

bool parse_accel_mode(const std::string &text, AccelMode &mode)
{
    const std::string name = lowercase_copy(trim_copy(text));
    if (name == "amd" || name == "vaapi" || name == "hardware-a")
        mode = AccelMode::Vaapi;
    else if (name == "rockchip" || name == "rkmpp" || name == "hardware-b")
        mode = AccelMode::Rkmpp;
    else if (name == "software" || name == "cpu" || name == "none")
        mode = AccelMode::Software;
    else
        return false;
    return true;
}

const char *accel_mode_name(AccelMode mode)
{
    switch (mode)
    {
    case AccelMode::Vaapi:
        return "vaapi";
    case AccelMode::Rkmpp:
        return "rkmpp";
    default:
        return "software";
    }
}

const StreamInfo *MediaProbe::primaryVideo() const
{
    for (const auto &stream : streams)
    {
        if (stream.codecType == "video")
            return &stream;
    }
    return nullptr;
}

std::vector<StreamInfo> MediaProbe::subtitleStreams() const
{
    std::vector<StreamInfo> result;
    for (const auto &stream : streams)
    {
        if (stream.codecType == "subtitle")
            result.push_back(stream);
    }
    return result;
}

const OutputTarget *TranscodeJob::defaultTarget() const
{
    for (const auto &target : targets)
    {
        if (target.kind == TargetKind::Default)
            return &target;
    }
    return nullptr;
}

const OutputTarget *TranscodeJob::scaledTarget() const
{
    for (const auto &target : targets)
    {
        if (target.kind == TargetKind::Scaled)
            return &target;
    }
    return nullptr;
}

size_t TranscodeJob::convertibleSubtitleCount() const
{
    size_t count = 0;
    for (const auto &action : subtitlePlan)
    {
        if (action.mode == SubtitleMode::ExtractConvert)
            ++count;
    }
    return count;
}
