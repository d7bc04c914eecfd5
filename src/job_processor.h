#pragma once

#include <string>

#include "media_inspector.h"
#include "output_manager.h"
#include "temp_files.h"
#include "transcode_executor.h"
#include "transcode_planner.h"
#include "transcoder.h"

enum class JobOutcome
{
    Completed,
    Skipped,  // not a video
    Failed,
    Vanished, // the file disappeared mid-check
    Aborted,  // shutdown interrupted the encode
    Deferred  // another job is writing one of its outputs
};

const char *job_outcome_name(JobOutcome outcome);

struct JobPolicy
{
    bool deleteOriginal = true;
};

// Runs one stable file through classification, planning, encoding and cleanup
class JobProcessor
{
public:
    JobProcessor(IMediaInspector &inspector, const TranscodePlanner &planner, ITranscoder &transcoder,
                 TempFileRegistry &temps, OutputManager &outputs, JobPolicy policy);

    // Never throws; every failure is logged and reported as an outcome
    JobOutcome process(const std::string &path);

private:
    JobOutcome run(const std::string &path);
    bool convertSubtitles(TranscodeJob &job);

    IMediaInspector &m_inspector;
    const TranscodePlanner &m_planner;
    ITranscoder &m_transcoder;
    TempFileRegistry &m_temps;
    OutputManager &m_outputs;
    TranscodeExecutor m_executor;
    JobPolicy m_policy;
};
