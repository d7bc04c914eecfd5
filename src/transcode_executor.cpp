#include "transcode_executor.h"
#include "errors.h"
#include "logger.h"
#include "utils.h"

#include <filesystem>

TranscodeExecutor::TranscodeExecutor(const TranscodePlanner &planner, ITranscoder &transcoder,
                                     TempFileRegistry &temps, const OutputManager &outputs)
    : m_planner(planner), m_transcoder(transcoder), m_temps(temps), m_outputs(outputs)
{
}

TranscodeResult TranscodeExecutor::attempt(const std::string &inputPath, const OutputTarget &target,
                                           const EncodePlan &plan)
{
    const std::string tempPath = m_temps.create(std::filesystem::path(target.path).extension().string());

    std::string detail = plan.rateControl == RateControl::ConstantQuality ? "constant quality"
                                                                          : format_bitrate(plan.bitrateCap);
    if (plan.scaleTo)
        detail += ", " + std::to_string(plan.scaleTo->width) + "x" + std::to_string(plan.scaleTo->height);
    LOG_INFO("Encoding %s with %s (%s)", target.path.c_str(), plan.codecName.c_str(), detail.c_str());

    TranscodeResult result = m_transcoder.encode(inputPath, tempPath, plan);
    if (!result.ok())
    {
        m_temps.discard(tempPath);
        return result;
    }

    try
    {
        m_outputs.publish(tempPath, target.path);
    }
    catch (const FilesystemError &)
    {
        m_temps.discard(tempPath);
        throw;
    }
    return result;
}

ExecutionStatus TranscodeExecutor::execute(const TranscodeJob &job, const OutputTarget &target,
                                           const std::string &inputPath)
{
    EncodePlan plan = m_planner.plan(job, target, false);
    TranscodeResult result = attempt(inputPath, target, plan);
    if (result.ok())
        return ExecutionStatus::Published;
    if (result.status == TranscodeStatus::Aborted)
        return ExecutionStatus::Aborted;

    LOG_ERROR("Encode of %s with %s failed (exit %d): %s", target.path.c_str(), plan.codecName.c_str(),
              result.exitCode, trim_copy(result.diagnostic).c_str());

    if (plan.encoderFamily == EncoderFamilyKind::Hardware)
    {
        LOG_WARN("Retrying %s with the software encoder", target.path.c_str());
        plan = m_planner.plan(job, target, true);
        result = attempt(inputPath, target, plan);
        if (result.ok())
            return ExecutionStatus::Published;
        if (result.status == TranscodeStatus::Aborted)
            return ExecutionStatus::Aborted;

        LOG_ERROR("Software encode of %s failed (exit %d): %s", target.path.c_str(), result.exitCode,
                  trim_copy(result.diagnostic).c_str());
    }

    throw EncodeError("transcoding " + job.sourcePath + " to " + target.path + " failed", result.exitCode);
}
