#pragma once

extern "C"
{
#include <libavformat/avformat.h>
#include <libavcodec/avcodec.h>
#include <libavutil/avutil.h>
}

#include <string>

#include "logger.h"

inline std::string ff_error_string(int err)
{
    char buf[AV_ERROR_MAX_STRING_SIZE];
    av_strerror(err, buf, sizeof(buf));
    return buf;
}

// Nominal frame rate of a stream (FFmpeg-like priority): guess -> r_frame_rate -> avg_frame_rate.
// Returns {0, 1} when nothing usable is recorded.
AVRational nominal_frame_rate(AVFormatContext *fmt, AVStream *st);

// Frame count of a video stream: nb_frames when the container records it, else duration * fps rounded
int64_t estimate_frame_count(const AVFormatContext *fmt, const AVStream *st, AVRational fr);

// Keep libav* console output in line with the application log level
void apply_ffmpeg_log_level(LogLevel level);
