#include "transcoder.h"
#include "logger.h"
#include "process_runner.h"
#include "utils.h"

#include <filesystem>
#include <initializer_list>
#include <stdexcept>
#include <utility>

namespace
{
    bool is_isobmff_output(const std::string &path)
    {
        const std::string ext = lowercase_copy(std::filesystem::path(path).extension().string());
        return ext == ".mp4" || ext == ".m4v" || ext == ".mov";
    }

    void append(std::vector<std::string> &argv, std::initializer_list<std::string> args)
    {
        argv.insert(argv.end(), args.begin(), args.end());
    }
}

std::vector<std::string> build_encode_arguments(const std::string &ffmpeg, const std::string &inputPath,
                                                const std::string &outputPath, const EncodePlan &plan)
{
    std::vector<std::string> argv;
    append(argv, {ffmpeg, "-hide_banner", "-nostdin", "-y", "-fix_sub_duration"});
    argv.insert(argv.end(), plan.inputParams.begin(), plan.inputParams.end());
    append(argv, {"-i", inputPath});
    for (const auto &sub : plan.subtitleInputs)
        append(argv, {"-i", sub});

    if (!plan.videoFilter.empty())
        append(argv, {"-vf", plan.videoFilter});
    append(argv, {"-map_metadata", "0"});

    append(argv, {"-map", "0:v:0", "-c:v", plan.codecName});
    argv.insert(argv.end(), plan.qualityParams.begin(), plan.qualityParams.end());

    append(argv, {"-map", "0:a?", "-c:a", "copy"});

    for (const auto &map : plan.subtitleMaps)
    {
        const std::string idx = std::to_string(map.streamIndex);
        switch (map.kind)
        {
        case SubtitleMap::Kind::CopyAll:
            append(argv, {"-map", "0:s", "-c:s", "copy"});
            break;
        case SubtitleMap::Kind::CopyStream:
            append(argv, {"-map", "0:s:" + idx, "-c:s:" + idx, "copy"});
            break;
        case SubtitleMap::Kind::ConvertedInput:
            append(argv, {"-map", std::to_string(map.inputIndex), "-c:s:" + idx, "srt"});
            if (!map.language.empty())
                append(argv, {"-metadata:s:s:" + idx, "language=" + map.language});
            if (!map.title.empty())
                append(argv, {"-metadata:s:s:" + idx, "title=" + map.title});
            break;
        }
    }

    if (is_isobmff_output(outputPath))
        append(argv, {"-movflags", "+faststart"});
    argv.push_back(outputPath);
    return argv;
}

std::vector<std::string> build_subtitle_arguments(const std::string &ffmpeg, const std::string &inputPath,
                                                  int subtitleIndex, const std::string &outputPath)
{
    return {ffmpeg, "-hide_banner", "-nostdin", "-y",
            "-i", inputPath,
            "-map", "0:s:" + std::to_string(subtitleIndex),
            "-c:s", "srt",
            outputPath};
}

FFmpegTranscoder::FFmpegTranscoder(std::string binary, const std::atomic<bool> &abort)
    : m_binary(std::move(binary)), m_abort(abort)
{
}

TranscodeResult FFmpegTranscoder::encode(const std::string &inputPath, const std::string &outputPath,
                                         const EncodePlan &plan)
{
    return run(build_encode_arguments(m_binary, inputPath, outputPath, plan));
}

TranscodeResult FFmpegTranscoder::convertSubtitle(const std::string &inputPath, int subtitleIndex,
                                                  const std::string &outputPath)
{
    return run(build_subtitle_arguments(m_binary, inputPath, subtitleIndex, outputPath));
}

TranscodeResult FFmpegTranscoder::run(const std::vector<std::string> &argv)
{
    LOG_INFO("[CMD] %s", join_command_line(argv).c_str());

    TranscodeResult result;
    try
    {
        ProcessResult proc = run_process(argv, m_abort);
        result.exitCode = proc.exitCode;
        result.diagnostic = std::move(proc.diagnostic);
        if (proc.aborted)
            result.status = TranscodeStatus::Aborted;
        else
            result.status = proc.exitCode == 0 ? TranscodeStatus::Success : TranscodeStatus::Failure;
    }
    catch (const std::runtime_error &e)
    {
        result.status = TranscodeStatus::Failure;
        result.exitCode = -1;
        result.diagnostic = e.what();
    }
    return result;
}
