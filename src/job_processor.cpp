#include "job_processor.h"
#include "errors.h"
#include "logger.h"

#include <filesystem>
#include <system_error>

namespace fs = std::filesystem;

namespace
{
    bool path_exists(const std::string &path)
    {
        std::error_code ec;
        return fs::exists(path, ec);
    }

    // Converted subtitle files live only for the duration of one job
    struct SubtitleFilesGuard
    {
        const TempFileRegistry &temps;
        const TranscodeJob &job;

        ~SubtitleFilesGuard()
        {
            for (const auto &file : job.convertedSubtitleFiles)
                temps.discard(file);
        }
    };
}

const char *job_outcome_name(JobOutcome outcome)
{
    switch (outcome)
    {
    case JobOutcome::Completed:
        return "completed";
    case JobOutcome::Skipped:
        return "skipped";
    case JobOutcome::Failed:
        return "failed";
    case JobOutcome::Vanished:
        return "vanished";
    case JobOutcome::Deferred:
        return "deferred";
    default:
        return "aborted";
    }
}

JobProcessor::JobProcessor(IMediaInspector &inspector, const TranscodePlanner &planner, ITranscoder &transcoder,
                           TempFileRegistry &temps, OutputManager &outputs, JobPolicy policy)
    : m_inspector(inspector),
      m_planner(planner),
      m_transcoder(transcoder),
      m_temps(temps),
      m_outputs(outputs),
      m_executor(planner, transcoder, temps, outputs),
      m_policy(policy)
{
}

JobOutcome JobProcessor::process(const std::string &path)
{
    try
    {
        return run(path);
    }
    catch (const TransientFileError &e)
    {
        LOG_WARN("%s", e.what());
        return JobOutcome::Vanished;
    }
    catch (const UnclassifiableMediaError &e)
    {
        LOG_ERROR("Skipping %s: %s", path.c_str(), e.what());
        return JobOutcome::Failed;
    }
    catch (const EncodeError &e)
    {
        LOG_ERROR("%s (exit %d)", e.what(), e.exitCode());
        return JobOutcome::Failed;
    }
    catch (const FilesystemError &e)
    {
        LOG_ERROR("Filesystem error while processing %s: %s", path.c_str(), e.what());
        return JobOutcome::Failed;
    }
    catch (const std::exception &e)
    {
        LOG_ERROR("Unexpected error while processing %s: %s", path.c_str(), e.what());
        return JobOutcome::Failed;
    }
}

bool JobProcessor::convertSubtitles(TranscodeJob &job)
{
    for (const auto &action : job.subtitlePlan)
    {
        if (action.mode != SubtitleMode::ExtractConvert)
            continue;

        const std::string srtPath = m_temps.create(".srt");
        LOG_VERBOSE("Converting %s subtitle stream %d to SubRip", action.codec.c_str(), action.index);
        TranscodeResult result = m_transcoder.convertSubtitle(job.sourcePath, action.index, srtPath);
        if (result.status == TranscodeStatus::Aborted)
        {
            m_temps.discard(srtPath);
            return false;
        }
        if (!result.ok())
        {
            m_temps.discard(srtPath);
            throw EncodeError("subtitle stream " + std::to_string(action.index) + " of " + job.sourcePath +
                                  " could not be converted",
                              result.exitCode);
        }
        job.convertedSubtitleFiles.push_back(srtPath);
    }
    return true;
}

JobOutcome JobProcessor::run(const std::string &path)
{
    LOG_INFO("Processing %s", path.c_str());

    std::optional<MediaProbe> probe = m_inspector.probe(path);
    if (!probe || probe->frameCount <= 0)
    {
        LOG_INFO("Skipping %s: not a video", path.c_str());
        return JobOutcome::Skipped;
    }

    const OutputPaths paths = m_outputs.deriveOutputPaths(path);
    TranscodeJob job = m_planner.buildJob(path, *probe, paths);

    const OutputTarget *def = job.defaultTarget();
    const OutputTarget *scaled = job.scaledTarget();

    // Differently tagged sources can share an output name; only one job may write it
    OutputClaims claims(m_outputs);
    if (!claims.add(def->path) || (scaled && !claims.add(scaled->path)))
    {
        LOG_INFO("Deferring %s: its output is being written by another job", path.c_str());
        return JobOutcome::Deferred;
    }

    const bool doDefault = !path_exists(def->path);
    const bool doScaled = scaled && !path_exists(scaled->path);
    if (!doDefault && !doScaled)
    {
        LOG_INFO("Skipping %s: already processed", path.c_str());
        return JobOutcome::Completed;
    }

    m_outputs.ensureDirectory(paths.outputDir);

    const bool renameOnly = doDefault && m_planner.renameOnly(job);
    SubtitleFilesGuard guard{m_temps, job};
    if ((doDefault && !renameOnly) || doScaled)
    {
        if (job.convertibleSubtitleCount() > 0 && !convertSubtitles(job))
            return JobOutcome::Aborted;
    }

    std::string input = path;
    if (doDefault)
    {
        if (renameOnly)
        {
            LOG_INFO("Transcoding %s without rescale is excessive, moving it", path.c_str());
            if (input != def->path)
            {
                m_outputs.moveSource(input, def->path);
                input = def->path;
            }
        }
        else if (m_executor.execute(job, *def, input) == ExecutionStatus::Aborted)
        {
            return JobOutcome::Aborted;
        }
        m_outputs.normalizePermissions(def->path);
    }

    if (doScaled)
    {
        if (m_executor.execute(job, *scaled, input) == ExecutionStatus::Aborted)
            return JobOutcome::Aborted;
        m_outputs.normalizePermissions(scaled->path);
    }

    if (m_policy.deleteOriginal && input != def->path)
        m_outputs.removeSourceAndPrune(path);

    LOG_INFO("Finished %s", path.c_str());
    return JobOutcome::Completed;
}
