#include "media_inspector.h"
#include "errors.h"
#include "ffmpeg_utils.h"
#include "logger.h"
#include "utils.h"

#include <filesystem>
#include <memory>
#include <system_error>

namespace fs = std::filesystem;

namespace
{
    const char *codec_type_name(const AVStream *st)
    {
        if (st->disposition & AV_DISPOSITION_ATTACHED_PIC)
            return "attachment";

        switch (st->codecpar->codec_type)
        {
        case AVMEDIA_TYPE_VIDEO:
            return "video";
        case AVMEDIA_TYPE_AUDIO:
            return "audio";
        case AVMEDIA_TYPE_SUBTITLE:
            return "subtitle";
        case AVMEDIA_TYPE_DATA:
            return "data";
        case AVMEDIA_TYPE_ATTACHMENT:
            return "attachment";
        default:
            return "unknown";
        }
    }

    std::string stream_tag(const AVStream *st, const char *key)
    {
        const AVDictionaryEntry *entry = av_dict_get(st->metadata, key, nullptr, 0);
        return (entry && entry->value) ? entry->value : "";
    }

    struct FormatContextCloser
    {
        void operator()(AVFormatContext *fmt) const
        {
            if (fmt)
                avformat_close_input(&fmt);
        }
    };
}

std::optional<MediaProbe> FFmpegMediaInspector::probe(const std::string &path)
{
    std::error_code ec;
    if (!fs::exists(path, ec))
        throw TransientFileError("file vanished before inspection: " + path);

    AVFormatContext *raw = nullptr;
    int err = avformat_open_input(&raw, path.c_str(), nullptr, nullptr);
    if (err < 0)
    {
        LOG_DEBUG("Not readable as media: %s (%s)", path.c_str(), ff_error_string(err).c_str());
        return std::nullopt;
    }
    std::unique_ptr<AVFormatContext, FormatContextCloser> fmt(raw);

    err = avformat_find_stream_info(fmt.get(), nullptr);
    if (err < 0)
    {
        LOG_DEBUG("No stream info for %s (%s)", path.c_str(), ff_error_string(err).c_str());
        return std::nullopt;
    }

    MediaProbe result;
    for (unsigned i = 0; i < fmt->nb_streams; ++i)
    {
        const AVStream *st = fmt->streams[i];
        StreamInfo info;
        info.index = static_cast<int>(i);
        info.codecType = codec_type_name(st);
        info.codecName = lowercase_copy(avcodec_get_name(st->codecpar->codec_id));
        if (st->codecpar->codec_type == AVMEDIA_TYPE_VIDEO)
        {
            info.width = st->codecpar->width;
            info.height = st->codecpar->height;
        }
        info.language = stream_tag(st, "language");
        info.title = stream_tag(st, "title");
        result.streams.push_back(info);
    }

    if (fmt->duration != AV_NOPTS_VALUE && fmt->duration > 0)
        result.durationSec = static_cast<double>(fmt->duration) / AV_TIME_BASE;
    result.bitrate = fmt->bit_rate > 0 ? fmt->bit_rate : 0;

    const StreamInfo *video = result.primaryVideo();
    if (video)
    {
        AVStream *vst = fmt->streams[video->index];
        AVRational fr = nominal_frame_rate(fmt.get(), vst);
        result.frameRate = fr.num > 0 ? av_q2d(fr) : 0.0;
        result.frameCount = estimate_frame_count(fmt.get(), vst, fr);
    }

    LOG_DEBUG("Probed %s: %zu streams, %.3f fps, %s, %lld frames", path.c_str(), result.streams.size(),
              result.frameRate, format_bitrate(result.bitrate).c_str(),
              static_cast<long long>(result.frameCount));
    return result;
}
