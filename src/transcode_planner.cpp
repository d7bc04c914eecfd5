#include "transcode_planner.h"
#include "errors.h"
#include "logger.h"
#include "utils.h"

#include <algorithm>

namespace
{
    constexpr double kHighFrameRate = 35.0;
}

bool is_4k(int width, int height)
{
    return width >= 3840 || height >= 2160;
}

Resolution calculate_scaled_resolution(int width, int height, int targetWidth)
{
    Resolution r;
    r.width = targetWidth;
    const int64_t num = static_cast<int64_t>(targetWidth) * height;
    r.height = static_cast<int>((num + width - 1) / width);
    return r;
}

int64_t select_bitrate_ceiling(const BitrateCeilings &ceilings, double frameRate, bool fourK)
{
    const bool highFps = frameRate <= 0.0 || frameRate >= kHighFrameRate;
    if (highFps)
        return fourK ? ceilings.highFps4k : ceilings.highFps1080p;
    return fourK ? ceilings.standard4k : ceilings.standard1080p;
}

int64_t scale_bitrate(int64_t bitrate, const Resolution &from, const Resolution &to)
{
    const int64_t fromArea = static_cast<int64_t>(from.width) * from.height;
    if (fromArea <= 0)
        return bitrate;
    const int64_t toArea = static_cast<int64_t>(to.width) * to.height;
    // long double keeps bitrate * area exact enough for 8K sources
    const long double scaled = static_cast<long double>(bitrate) * toArea / fromArea;
    int64_t result = static_cast<int64_t>(scaled);
    if (static_cast<long double>(result) < scaled)
        ++result;
    return result;
}

std::vector<SubtitleAction> plan_subtitles(const std::vector<StreamInfo> &subtitleStreams)
{
    std::vector<SubtitleAction> actions;
    int index = 0;
    for (const auto &stream : subtitleStreams)
    {
        SubtitleAction action;
        action.index = index++;
        action.codec = stream.codecName;
        action.language = stream.language;
        action.title = stream.title;
        action.mode = (stream.codecName == "ass" || stream.codecName == "ssa") ? SubtitleMode::ExtractConvert
                                                                                 : SubtitleMode::CopyAsIs;
        actions.push_back(action);
    }
    return actions;
}

std::vector<SubtitleMap> build_subtitle_maps(const std::vector<SubtitleAction> &subtitlePlan)
{
    std::vector<SubtitleMap> maps;
    if (subtitlePlan.empty())
        return maps;

    const bool anyConverted = std::any_of(subtitlePlan.begin(), subtitlePlan.end(), [](const SubtitleAction &a)
                                          { return a.mode == SubtitleMode::ExtractConvert; });
    if (!anyConverted)
    {
        maps.push_back(SubtitleMap{});
        return maps;
    }

    int inputIndex = 0;
    for (const auto &action : subtitlePlan)
    {
        SubtitleMap map;
        map.streamIndex = action.index;
        if (action.mode == SubtitleMode::ExtractConvert)
        {
            map.kind = SubtitleMap::Kind::ConvertedInput;
            map.inputIndex = ++inputIndex;
            map.language = action.language;
            map.title = action.title;
        }
        else
        {
            map.kind = SubtitleMap::Kind::CopyStream;
        }
        maps.push_back(map);
    }
    return maps;
}

bool rename_only_eligible(const TranscodeJob &job, bool enabled)
{
    if (!enabled)
        return false;
    if (job.sourceCodec == VideoCodec::Other)
        return false;
    const OutputTarget *target = job.defaultTarget();
    if (!target || target->scaleTo)
        return false;
    if (job.convertibleSubtitleCount() > 0)
        return false;
    return job.sourceBitrate > 0 && job.sourceBitrate <= job.bitrateCeiling;
}

TranscodePlanner::TranscodePlanner(AccelMode accelMode, const QualitySettings &quality, const BitrateCeilings &ceilings,
                                   const std::string &hardwareDevice, bool renameOnly)
    : m_family(create_encoder_family(accelMode, quality, hardwareDevice)),
      m_software(create_encoder_family(AccelMode::Software, quality, hardwareDevice)),
      m_ceilings(ceilings),
      m_hardwareDevice(hardwareDevice),
      m_renameOnly(renameOnly)
{
}

TranscodeJob TranscodePlanner::buildJob(const std::string &sourcePath, const MediaProbe &probe,
                                        const OutputPaths &paths) const
{
    const StreamInfo *video = probe.primaryVideo();
    if (!video)
        throw UnclassifiableMediaError("no video stream in " + sourcePath);
    if (video->width <= 0 || video->height <= 0)
        throw UnclassifiableMediaError("unable to determine resolution of " + sourcePath);

    TranscodeJob job;
    job.sourcePath = sourcePath;
    job.sourceCodecName = video->codecName;
    job.sourceCodec = parse_video_codec(video->codecName);
    job.width = video->width;
    job.height = video->height;
    job.frameRate = probe.frameRate;
    job.sourceBitrate = probe.bitrate;
    job.is4K = is_4k(job.width, job.height);
    job.bitrateCeiling = select_bitrate_ceiling(m_ceilings, job.frameRate, job.is4K);
    job.workingBitrate = job.sourceBitrate > 0 ? std::min(job.sourceBitrate, job.bitrateCeiling) : job.bitrateCeiling;

    OutputTarget def;
    def.kind = TargetKind::Default;
    def.path = job.is4K ? paths.path4k : paths.path1080p;
    def.bitrate = job.workingBitrate;
    job.targets.push_back(def);

    if (job.is4K)
    {
        const Resolution source{job.width, job.height};
        OutputTarget scaled;
        scaled.kind = TargetKind::Scaled;
        scaled.path = paths.path1080p;
        scaled.scaleTo = calculate_scaled_resolution(job.width, job.height);
        scaled.bitrate = scale_bitrate(job.workingBitrate, source, *scaled.scaleTo);
        job.targets.push_back(scaled);
    }

    job.subtitlePlan = plan_subtitles(probe.subtitleStreams());

    LOG_VERBOSE("%s: %s %dx%d @ %.3f fps, source %s, ceiling %s, target %s", sourcePath.c_str(),
                job.sourceCodecName.c_str(), job.width, job.height, job.frameRate,
                job.sourceBitrate > 0 ? format_bitrate(job.sourceBitrate).c_str() : "unknown",
                format_bitrate(job.bitrateCeiling).c_str(), format_bitrate(job.workingBitrate).c_str());
    return job;
}

EncodePlan TranscodePlanner::plan(const TranscodeJob &job, const OutputTarget &target, bool forceSoftware) const
{
    const IEncoderFamily *family = forceSoftware ? m_software.get() : m_family.get();

    EncodePlan plan;
    if (!family->supports(job.sourceCodec))
    {
        LOG_WARN("%s has no %s encoder, falling back to software for %s", accel_mode_name(family->mode()),
                 video_codec_name(job.sourceCodec), job.sourcePath.c_str());
        family = m_software.get();
        plan.softwareFallback = true;
    }

    const EncoderChoice choice = family->select(job.sourceCodec, target.bitrate);
    plan.encoderFamily = family->kind();
    plan.accelMode = family->mode();
    plan.codecName = choice.encoder;
    plan.rateControl = choice.rateControl;
    plan.qualityParams = choice.qualityArgs;
    plan.inputParams = family->inputArgs();
    plan.videoFilter = family->videoFilter(target.scaleTo);
    plan.scaleTo = target.scaleTo;
    plan.bitrateCap = target.bitrate;
    plan.subtitleMaps = build_subtitle_maps(job.subtitlePlan);
    plan.subtitleInputs = job.convertedSubtitleFiles;
    if (family->mode() == AccelMode::Vaapi)
        plan.hardwareDevice = m_hardwareDevice;
    return plan;
}
