#pragma once

#include <atomic>
#include <string>
#include <vector>

#include "pipeline_types.h"

enum class TranscodeStatus
{
    Success,
    Failure,
    Aborted
};

struct TranscodeResult
{
    TranscodeStatus status = TranscodeStatus::Failure;
    int exitCode = 0;
    std::string diagnostic;

    bool ok() const { return status == TranscodeStatus::Success; }
};

// The external encoder, treated as opaque
class ITranscoder
{
public:
    virtual ~ITranscoder() = default;

    virtual TranscodeResult encode(const std::string &inputPath, const std::string &outputPath,
                                   const EncodePlan &plan) = 0;

    // Extract subtitle stream 0:s:<subtitleIndex> of inputPath as SubRip
    virtual TranscodeResult convertSubtitle(const std::string &inputPath, int subtitleIndex,
                                            const std::string &outputPath) = 0;
};

// Command line for one encode: video re-encoded per plan, audio and subtitles copied, metadata kept
std::vector<std::string> build_encode_arguments(const std::string &ffmpeg, const std::string &inputPath,
                                                const std::string &outputPath, const EncodePlan &plan);

std::vector<std::string> build_subtitle_arguments(const std::string &ffmpeg, const std::string &inputPath,
                                                  int subtitleIndex, const std::string &outputPath);

// Runs the ffmpeg executable; abort is shared with the service's shutdown flag
class FFmpegTranscoder : public ITranscoder
{
public:
    FFmpegTranscoder(std::string binary, const std::atomic<bool> &abort);

    TranscodeResult encode(const std::string &inputPath, const std::string &outputPath,
                           const EncodePlan &plan) override;
    TranscodeResult convertSubtitle(const std::string &inputPath, int subtitleIndex,
                                    const std::string &outputPath) override;

private:
    TranscodeResult run(const std::vector<std::string> &argv);

    std::string m_binary;
    const std::atomic<bool> &m_abort;
};
