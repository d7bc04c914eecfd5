#include "ffmpeg_utils.h"

AVRational nominal_frame_rate(AVFormatContext *fmt, AVStream *st)
{
    AVRational fr = av_guess_frame_rate(fmt, st, nullptr);
    if (fr.num == 0 || fr.den == 0)
        fr = st->r_frame_rate;
    if (fr.num == 0 || fr.den == 0)
        fr = st->avg_frame_rate;
    if (fr.num <= 0 || fr.den <= 0)
        return AVRational{0, 1};
    return fr;
}

int64_t estimate_frame_count(const AVFormatContext *fmt, const AVStream *st, AVRational fr)
{
    if (st->nb_frames > 0)
        return st->nb_frames;

    double duration_sec = 0.0;
    if (st->duration > 0 && st->duration != AV_NOPTS_VALUE)
    {
        duration_sec = st->duration * av_q2d(st->time_base);
    }
    else if (fmt->duration != AV_NOPTS_VALUE && fmt->duration > 0)
    {
        duration_sec = static_cast<double>(fmt->duration) / AV_TIME_BASE;
    }

    if (duration_sec > 0.0 && fr.num > 0 && fr.den > 0)
        return static_cast<int64_t>(duration_sec * av_q2d(fr) + 0.5);
    return 0;
}

void apply_ffmpeg_log_level(LogLevel level)
{
    if (level >= LogLevel::Debug)
    {
        av_log_set_level(AV_LOG_VERBOSE);
    }
    else if (level >= LogLevel::Verbose)
    {
        av_log_set_level(AV_LOG_INFO);
    }
    else
    {
        // Probing partially written files is routine; keep libav quiet below errors
        av_log_set_level(AV_LOG_ERROR);
    }
}
