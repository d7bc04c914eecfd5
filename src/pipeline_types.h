#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

// Source video codec as far as encoder selection is concerned
enum class VideoCodec
{
    H264,
    Hevc,
    Av1,
    Other
};

// Map an FFmpeg codec name ("h264", "hevc", "av1", ...) to VideoCodec
VideoCodec parse_video_codec(const std::string &codecName);
const char *video_codec_name(VideoCodec codec);

// Configured acceleration backend, selected once at startup
enum class AccelMode
{
    Vaapi,    // hardware-A: AMD/Intel VAAPI
    Rkmpp,    // hardware-B: Rockchip MPP, no AV1 encoder
    Software
};

bool parse_accel_mode(const std::string &text, AccelMode &mode);
const char *accel_mode_name(AccelMode mode);

enum class EncoderFamilyKind
{
    Hardware,
    Software
};

enum class RateControl
{
    ConstantQuality,
    BitrateCapped
};

// How the planner derives rate control for h264/hevc
enum class QualityMode
{
    Bitrate,
    Quality
};

struct Resolution
{
    int width = 0;
    int height = 0;

    bool operator==(const Resolution &other) const { return width == other.width && height == other.height; }
    bool operator!=(const Resolution &other) const { return !(*this == other); }
};

// One stream as reported by the media inspector
struct StreamInfo
{
    int index = -1;        // container stream index
    std::string codecType; // "video", "audio", "subtitle", "data", "attachment"
    std::string codecName; // FFmpeg codec name, lowercase
    int width = 0;
    int height = 0;
    std::string language;
    std::string title;
};

// Everything the pipeline needs to know about a source file
struct MediaProbe
{
    std::vector<StreamInfo> streams;
    double durationSec = 0.0;
    double frameRate = 0.0; // 0 when unknown
    int64_t bitrate = 0;    // overall container bitrate, 0 when unknown
    int64_t frameCount = 0; // frames of the primary video stream

    // First video stream, or nullptr
    const StreamInfo *primaryVideo() const;
    std::vector<StreamInfo> subtitleStreams() const;
};

enum class SubtitleMode
{
    CopyAsIs,
    ExtractConvert
};

struct SubtitleAction
{
    int index = 0; // position among the source's subtitle streams (0:s:<index>)
    std::string codec;
    SubtitleMode mode = SubtitleMode::CopyAsIs;
    std::string language;
    std::string title;
};

enum class TargetKind
{
    Default,
    Scaled
};

struct OutputTarget
{
    TargetKind kind = TargetKind::Default;
    std::string path;
    std::optional<Resolution> scaleTo; // unset: keep source resolution
    int64_t bitrate = 0;
};

struct TranscodeJob
{
    std::string sourcePath;
    std::string sourceCodecName;
    VideoCodec sourceCodec = VideoCodec::Other;
    int width = 0;
    int height = 0;
    double frameRate = 0.0;
    int64_t sourceBitrate = 0; // 0 when the inspector could not report it
    int64_t bitrateCeiling = 0;
    int64_t workingBitrate = 0;
    bool is4K = false;

    std::vector<OutputTarget> targets; // default first, then optional scaled
    std::vector<SubtitleAction> subtitlePlan;
    std::vector<std::string> convertedSubtitleFiles; // one per ExtractConvert action, in order

    const OutputTarget *defaultTarget() const;
    const OutputTarget *scaledTarget() const;
    size_t convertibleSubtitleCount() const;
};

// One -map directive for the subtitle part of an encode
struct SubtitleMap
{
    enum class Kind
    {
        CopyAll,       // -map 0:s -c:s copy
        CopyStream,    // -map 0:s:<streamIndex> -c:s:<streamIndex> copy
        ConvertedInput // -map <inputIndex> -c:s:<streamIndex> srt (+ metadata)
    };

    Kind kind = Kind::CopyAll;
    int streamIndex = 0;
    int inputIndex = 0; // 1-based index of the extra -i input
    std::string language;
    std::string title;
};

// Fully resolved parameters for one transcoder invocation
struct EncodePlan
{
    EncoderFamilyKind encoderFamily = EncoderFamilyKind::Software;
    AccelMode accelMode = AccelMode::Software;
    std::string codecName; // concrete encoder, e.g. "hevc_vaapi"
    RateControl rateControl = RateControl::BitrateCapped;
    std::vector<std::string> qualityParams; // encoder arguments after -c:v <codecName>
    std::vector<std::string> inputParams;   // decoder/device arguments placed before -i
    std::string videoFilter;                // -vf chain, empty for none
    std::optional<Resolution> scaleTo;
    int64_t bitrateCap = 0;
    std::vector<SubtitleMap> subtitleMaps;
    std::vector<std::string> subtitleInputs; // extra -i inputs, referenced by SubtitleMap::inputIndex
    std::string hardwareDevice;               // VAAPI render node
    bool softwareFallback = false;            // software chosen because the family cannot encode this codec
};
