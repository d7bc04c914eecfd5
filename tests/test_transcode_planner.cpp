#include <gtest/gtest.h>

#include "errors.h"
#include "test_support.h"
#include "transcode_planner.h"

using namespace testing_support;

namespace
{
    OutputPaths sample_paths()
    {
        OutputPaths paths;
        paths.outputDir = "/out/Movies";
        paths.path4k = "/out/Movies/Film - 4k.mkv";
        paths.path1080p = "/out/Movies/Film - 1080p.mkv";
        return paths;
    }

    TranscodePlanner make_planner(AccelMode mode, bool renameOnly = false,
                                  QualitySettings quality = QualitySettings{})
    {
        return TranscodePlanner(mode, quality, BitrateCeilings{}, "/dev/dri/renderD128", renameOnly);
    }
}

TEST(TranscodePlanner, scaledResolution)
{
    EXPECT_EQ(calculate_scaled_resolution(3840, 2160), (Resolution{1920, 1080}));
    EXPECT_EQ(calculate_scaled_resolution(4096, 2160), (Resolution{1920, 1013}));
    EXPECT_EQ(calculate_scaled_resolution(3840, 1600), (Resolution{1920, 800}));
    EXPECT_EQ(calculate_scaled_resolution(1920, 1080), (Resolution{1920, 1080}));
}

TEST(TranscodePlanner, fourKDetection)
{
    EXPECT_TRUE(is_4k(3840, 2160));
    EXPECT_TRUE(is_4k(3840, 1600));
    EXPECT_TRUE(is_4k(2880, 2160));
    EXPECT_FALSE(is_4k(1920, 1080));
    EXPECT_FALSE(is_4k(3839, 2159));
}

TEST(TranscodePlanner, bitrateCeilings)
{
    const BitrateCeilings ceilings;
    EXPECT_EQ(select_bitrate_ceiling(ceilings, 30.0, true), 49000000);
    EXPECT_EQ(select_bitrate_ceiling(ceilings, 24.0, false), 12000000);
    EXPECT_EQ(select_bitrate_ceiling(ceilings, 60.0, false), 18000000);
    EXPECT_EQ(select_bitrate_ceiling(ceilings, 59.94, true), 75000000);
    EXPECT_EQ(select_bitrate_ceiling(ceilings, 35.0, false), 18000000);
    EXPECT_EQ(select_bitrate_ceiling(ceilings, 34.9, false), 12000000);
    // unknown frame rate counts as 60 fps
    EXPECT_EQ(select_bitrate_ceiling(ceilings, 0.0, true), 75000000);
}

TEST(TranscodePlanner, workingBitrateIsCapped)
{
    const TranscodePlanner planner = make_planner(AccelMode::Software);

    const TranscodeJob fourK = planner.buildJob("/watch/Movies/Film.mkv",
                                                video_probe("hevc", 3840, 2160, 30.0, 80000000), sample_paths());
    EXPECT_EQ(fourK.workingBitrate, 49000000);

    const TranscodeJob hd = planner.buildJob("/watch/Movies/Film.mkv",
                                             video_probe("h264", 1920, 1080, 60.0, 10000000), sample_paths());
    EXPECT_EQ(hd.bitrateCeiling, 18000000);
    EXPECT_EQ(hd.workingBitrate, 10000000);

    const TranscodeJob unknown = planner.buildJob("/watch/Movies/Film.mkv",
                                                  video_probe("h264", 1920, 1080, 24.0, 0), sample_paths());
    EXPECT_EQ(unknown.workingBitrate, 12000000);
}

TEST(TranscodePlanner, fourKJobHasDefaultAndScaledTargets)
{
    const TranscodePlanner planner = make_planner(AccelMode::Software);
    const TranscodeJob job = planner.buildJob("/watch/Movies/Film.mkv",
                                              video_probe("hevc", 3840, 2160, 24.0, 80000000), sample_paths());

    ASSERT_EQ(job.targets.size(), 2u);
    ASSERT_NE(job.defaultTarget(), nullptr);
    ASSERT_NE(job.scaledTarget(), nullptr);
    EXPECT_TRUE(job.is4K);
    EXPECT_EQ(job.defaultTarget()->path, "/out/Movies/Film - 4k.mkv");
    EXPECT_FALSE(job.defaultTarget()->scaleTo.has_value());
    EXPECT_EQ(job.defaultTarget()->bitrate, 49000000);

    EXPECT_EQ(job.scaledTarget()->path, "/out/Movies/Film - 1080p.mkv");
    ASSERT_TRUE(job.scaledTarget()->scaleTo.has_value());
    EXPECT_EQ(*job.scaledTarget()->scaleTo, (Resolution{1920, 1080}));
    EXPECT_EQ(job.scaledTarget()->bitrate, 12250000);
}

TEST(TranscodePlanner, hdJobHasOnlyDefaultTarget)
{
    const TranscodePlanner planner = make_planner(AccelMode::Software);
    const TranscodeJob job = planner.buildJob("/watch/Movies/Film.mkv",
                                              video_probe("h264", 1920, 1080), sample_paths());

    ASSERT_EQ(job.targets.size(), 1u);
    EXPECT_FALSE(job.is4K);
    EXPECT_EQ(job.defaultTarget()->path, "/out/Movies/Film - 1080p.mkv");
    EXPECT_EQ(job.scaledTarget(), nullptr);
}

TEST(TranscodePlanner, scaledBitrateRoundsUp)
{
    EXPECT_EQ(scale_bitrate(49000000, Resolution{3840, 2160}, Resolution{1920, 1080}), 12250000);
    EXPECT_EQ(scale_bitrate(49000001, Resolution{3840, 2160}, Resolution{1920, 1080}), 12250001);
    EXPECT_EQ(scale_bitrate(10000000, Resolution{4096, 2160}, Resolution{1920, 1013}), 2198351);
}

TEST(TranscodePlanner, unclassifiableMedia)
{
    const TranscodePlanner planner = make_planner(AccelMode::Software);

    MediaProbe audioOnly;
    StreamInfo audio;
    audio.codecType = "audio";
    audio.codecName = "flac";
    audioOnly.streams.push_back(audio);
    audioOnly.frameCount = 10;
    EXPECT_THROW(planner.buildJob("/watch/a.flac", audioOnly, sample_paths()), UnclassifiableMediaError);

    EXPECT_THROW(planner.buildJob("/watch/a.mkv", video_probe("h264", 0, 0), sample_paths()),
                 UnclassifiableMediaError);
}

TEST(TranscodePlanner, av1OnRockchipFallsBackToSoftware)
{
    const TranscodePlanner planner = make_planner(AccelMode::Rkmpp);
    const TranscodeJob job = planner.buildJob("/watch/Movies/Film.mkv",
                                              video_probe("av1", 3840, 2160), sample_paths());

    for (const auto &target : job.targets)
    {
        const EncodePlan plan = planner.plan(job, target, false);
        EXPECT_EQ(plan.encoderFamily, EncoderFamilyKind::Software);
        EXPECT_EQ(plan.accelMode, AccelMode::Software);
        EXPECT_EQ(plan.codecName, "libaom-av1");
        EXPECT_EQ(plan.rateControl, RateControl::ConstantQuality);
        EXPECT_TRUE(plan.softwareFallback);
        EXPECT_TRUE(plan.inputParams.empty());
    }
}

TEST(TranscodePlanner, vaapiPlan)
{
    const TranscodePlanner planner = make_planner(AccelMode::Vaapi);
    const TranscodeJob job = planner.buildJob("/watch/Movies/Film.mkv",
                                              video_probe("hevc", 3840, 2160, 24.0, 30000000), sample_paths());

    const EncodePlan def = planner.plan(job, *job.defaultTarget(), false);
    EXPECT_EQ(def.encoderFamily, EncoderFamilyKind::Hardware);
    EXPECT_EQ(def.codecName, "hevc_vaapi");
    EXPECT_EQ(def.rateControl, RateControl::BitrateCapped);
    EXPECT_EQ(def.qualityParams, (std::vector<std::string>{"-b:v:0", "30000000"}));
    EXPECT_EQ(def.videoFilter, "format=nv12,hwupload");
    EXPECT_EQ(def.hardwareDevice, "/dev/dri/renderD128");
    EXPECT_FALSE(def.softwareFallback);

    const EncodePlan scaled = planner.plan(job, *job.scaledTarget(), false);
    EXPECT_EQ(scaled.videoFilter, "format=nv12,hwupload,scale_vaapi=w=1920:h=1080");
    EXPECT_EQ(scaled.bitrateCap, 7500000);

    const EncodePlan forced = planner.plan(job, *job.defaultTarget(), true);
    EXPECT_EQ(forced.encoderFamily, EncoderFamilyKind::Software);
    EXPECT_EQ(forced.codecName, "libx265");
    EXPECT_TRUE(forced.hardwareDevice.empty());
    EXPECT_FALSE(forced.softwareFallback);
}

TEST(TranscodePlanner, otherCodecsEncodeToHevc)
{
    const TranscodePlanner planner = make_planner(AccelMode::Rkmpp);
    const TranscodeJob job = planner.buildJob("/watch/Movies/Film.avi",
                                              video_probe("mpeg4", 1280, 720), sample_paths());
    EXPECT_EQ(planner.plan(job, *job.defaultTarget(), false).codecName, "hevc_rkmpp");
}

TEST(TranscodePlanner, subtitlePlanning)
{
    const std::vector<SubtitleAction> none = plan_subtitles({});
    EXPECT_TRUE(none.empty());
    EXPECT_TRUE(build_subtitle_maps(none).empty());

    const std::vector<SubtitleAction> copyOnly =
        plan_subtitles({subtitle_stream(2, "subrip"), subtitle_stream(3, "hdmv_pgs_subtitle")});
    ASSERT_EQ(copyOnly.size(), 2u);
    EXPECT_EQ(copyOnly[0].mode, SubtitleMode::CopyAsIs);
    const std::vector<SubtitleMap> copyAll = build_subtitle_maps(copyOnly);
    ASSERT_EQ(copyAll.size(), 1u);
    EXPECT_EQ(copyAll[0].kind, SubtitleMap::Kind::CopyAll);

    const std::vector<SubtitleAction> mixed = plan_subtitles(
        {subtitle_stream(2, "subrip", "eng"), subtitle_stream(3, "ass", "jpn", "Signs"), subtitle_stream(4, "ssa", "fre")});
    ASSERT_EQ(mixed.size(), 3u);
    EXPECT_EQ(mixed[0].index, 0);
    EXPECT_EQ(mixed[1].index, 1);
    EXPECT_EQ(mixed[1].mode, SubtitleMode::ExtractConvert);
    EXPECT_EQ(mixed[2].mode, SubtitleMode::ExtractConvert);

    const std::vector<SubtitleMap> maps = build_subtitle_maps(mixed);
    ASSERT_EQ(maps.size(), 3u);
    EXPECT_EQ(maps[0].kind, SubtitleMap::Kind::CopyStream);
    EXPECT_EQ(maps[0].streamIndex, 0);
    EXPECT_EQ(maps[1].kind, SubtitleMap::Kind::ConvertedInput);
    EXPECT_EQ(maps[1].inputIndex, 1);
    EXPECT_EQ(maps[1].language, "jpn");
    EXPECT_EQ(maps[1].title, "Signs");
    EXPECT_EQ(maps[2].inputIndex, 2);
    EXPECT_EQ(maps[2].streamIndex, 2);
}

TEST(TranscodePlanner, renameOnlyPredicate)
{
    const TranscodePlanner planner = make_planner(AccelMode::Software, true);
    const OutputPaths paths = sample_paths();

    // h264 1080p under the ceiling: nothing would change
    TranscodeJob job = planner.buildJob("/watch/a.mkv", video_probe("h264", 1920, 1080, 24.0, 8000000), paths);
    EXPECT_TRUE(planner.renameOnly(job));
    EXPECT_FALSE(rename_only_eligible(job, false));

    // over the ceiling
    job = planner.buildJob("/watch/a.mkv", video_probe("h264", 1920, 1080, 24.0, 20000000), paths);
    EXPECT_FALSE(planner.renameOnly(job));

    // unknown bitrate
    job = planner.buildJob("/watch/a.mkv", video_probe("h264", 1920, 1080, 24.0, 0), paths);
    EXPECT_FALSE(planner.renameOnly(job));

    // codec outside h264/hevc/av1
    job = planner.buildJob("/watch/a.mkv", video_probe("vp9", 1920, 1080, 24.0, 8000000), paths);
    EXPECT_FALSE(planner.renameOnly(job));

    // subtitles needing conversion
    MediaProbe withAss = video_probe("hevc", 1920, 1080, 24.0, 8000000);
    withAss.streams.push_back(subtitle_stream(2, "ass"));
    job = planner.buildJob("/watch/a.mkv", withAss, paths);
    EXPECT_FALSE(planner.renameOnly(job));

    // 4K default target is not rescaled and qualifies on its own
    job = planner.buildJob("/watch/a.mkv", video_probe("av1", 3840, 2160, 24.0, 30000000), paths);
    EXPECT_TRUE(planner.renameOnly(job));
}
