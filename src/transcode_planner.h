#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "config_parser.h"
#include "encoder_family.h"
#include "pipeline_types.h"

// Final artifact locations for one source file
struct OutputPaths
{
    std::string outputDir;
    std::string path4k;    // "<base> - 4k<ext>"
    std::string path1080p; // "<base> - 1080p<ext>"
};

bool is_4k(int width, int height);

// Aspect-preserving resolution at targetWidth; height rounded up
Resolution calculate_scaled_resolution(int width, int height, int targetWidth = 1920);

// Frame rate >= 35 (or unknown) selects the high-frame-rate tier
int64_t select_bitrate_ceiling(const BitrateCeilings &ceilings, double frameRate, bool fourK);

// Bitrate for the scaled output, proportional to the pixel area, rounded up
int64_t scale_bitrate(int64_t bitrate, const Resolution &from, const Resolution &to);

// ass/ssa streams are converted to SubRip, everything else is copied
std::vector<SubtitleAction> plan_subtitles(const std::vector<StreamInfo> &subtitleStreams);

// -map directives for a subtitle plan; converted streams refer to extra inputs 1..N in order
std::vector<SubtitleMap> build_subtitle_maps(const std::vector<SubtitleAction> &subtitlePlan);

// True when the default target can be produced by moving the source unchanged
bool rename_only_eligible(const TranscodeJob &job, bool enabled);

class TranscodePlanner
{
public:
    TranscodePlanner(AccelMode accelMode, const QualitySettings &quality, const BitrateCeilings &ceilings,
                     const std::string &hardwareDevice, bool renameOnly);

    // Classify a probed source into a job with its targets and subtitle plan.
    // Throws UnclassifiableMediaError when there is no video stream or resolution.
    TranscodeJob buildJob(const std::string &sourcePath, const MediaProbe &probe, const OutputPaths &paths) const;

    // Encoder parameters for one target. forceSoftware selects the software family.
    EncodePlan plan(const TranscodeJob &job, const OutputTarget &target, bool forceSoftware) const;

    bool renameOnly(const TranscodeJob &job) const { return rename_only_eligible(job, m_renameOnly); }

    AccelMode accelMode() const { return m_family->mode(); }

private:
    std::unique_ptr<IEncoderFamily> m_family;
    std::unique_ptr<IEncoderFamily> m_software;
    BitrateCeilings m_ceilings;
    std::string m_hardwareDevice;
    bool m_renameOnly;
};
