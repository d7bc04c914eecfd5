#pragma once

#include <string>

#include "output_manager.h"
#include "temp_files.h"
#include "transcode_planner.h"
#include "transcoder.h"

enum class ExecutionStatus
{
    Published,
    Aborted
};

// Produces one output target: encode into a temp file, then publish it.
// Hardware failures get one software retry; a software plan gets a single attempt.
class TranscodeExecutor
{
public:
    TranscodeExecutor(const TranscodePlanner &planner, ITranscoder &transcoder, TempFileRegistry &temps,
                      const OutputManager &outputs);

    // Throws EncodeError when every attempt failed, FilesystemError when publishing failed
    ExecutionStatus execute(const TranscodeJob &job, const OutputTarget &target, const std::string &inputPath);

private:
    TranscodeResult attempt(const std::string &inputPath, const OutputTarget &target, const EncodePlan &plan);

    const TranscodePlanner &m_planner;
    ITranscoder &m_transcoder;
    TempFileRegistry &m_temps;
    const OutputManager &m_outputs;
};
