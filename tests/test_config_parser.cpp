#include <gtest/gtest.h>

#include <cstdlib>
#include <string>
#include <vector>

#include "config_parser.h"

namespace
{
    const char *const kScalerVariables[] = {
        "SCALER_WATCH_DIR", "SCALER_OUTPUT_DIR", "SCALER_TEMP_DIR", "SCALER_SCAN_INTERVAL",
        "SCALER_STABILITY_INTERVAL", "SCALER_STABILITY_ROUNDS", "SCALER_GPU_ACCEL", "SCALER_AMD_DEVICE",
        "SCALER_QUALITY_MODE", "SCALER_QUALITY_H264", "SCALER_QUALITY_HEVC", "SCALER_QUALITY_AV1",
        "SCALER_SOFTWARE_PRESET", "SCALER_DELETE_ORIGINAL", "SCALER_RENAME_ONLY",
        "SCALER_MAX_BITRATE_30FPS_1080P", "SCALER_MAX_BITRATE_30FPS_4K", "SCALER_MAX_BITRATE_60FPS_1080P",
        "SCALER_MAX_BITRATE_60FPS_4K", "SCALER_WORKERS", "SCALER_QUEUE_SIZE", "SCALER_STATUS_FILE",
        "SCALER_HEARTBEAT_INTERVAL", "SCALER_OUTPUT_UID", "SCALER_OUTPUT_GID", "SCALER_FFMPEG",
        "SCALER_LOG_LEVEL"};

    class ConfigParserTest : public ::testing::Test
    {
    protected:
        void SetUp() override
        {
            for (const char *name : kScalerVariables)
                unsetenv(name);
        }

        void TearDown() override { SetUp(); }

        bool parse(std::vector<std::string> args, ScalerConfig &cfg)
        {
            args.insert(args.begin(), "video_scaler");
            std::vector<char *> argv;
            for (auto &arg : args)
                argv.push_back(&arg[0]);
            argv.push_back(nullptr);
            return parse_arguments(static_cast<int>(args.size()), argv.data(), &cfg);
        }
    };
}

TEST_F(ConfigParserTest, defaults)
{
    ScalerConfig cfg;
    load_environment(&cfg);

    EXPECT_EQ(cfg.watchDir, "/watch_dir");
    EXPECT_EQ(cfg.outputDir, "/output_dir");
    EXPECT_EQ(cfg.scanIntervalSec, 60);
    EXPECT_EQ(cfg.stabilityIntervalSec, 5);
    EXPECT_EQ(cfg.stabilityRounds, 4);
    EXPECT_EQ(cfg.accelMode, AccelMode::Software);
    EXPECT_EQ(cfg.quality.mode, QualityMode::Bitrate);
    EXPECT_EQ(cfg.ceilings.standard1080p, 12000000);
    EXPECT_EQ(cfg.ceilings.standard4k, 49000000);
    EXPECT_EQ(cfg.ceilings.highFps1080p, 18000000);
    EXPECT_EQ(cfg.ceilings.highFps4k, 75000000);
    EXPECT_TRUE(cfg.deleteOriginal);
    EXPECT_FALSE(cfg.renameOnly);
    EXPECT_EQ(cfg.workers, 1);
    EXPECT_EQ(cfg.heartbeatIntervalSec, 20);
    EXPECT_EQ(cfg.outputUid, 1000);
    EXPECT_EQ(cfg.outputGid, 1000);
    EXPECT_EQ(cfg.logLevel, LogLevel::Info);
}

TEST_F(ConfigParserTest, environmentOverrides)
{
    setenv("SCALER_WATCH_DIR", "/in", 1);
    setenv("SCALER_GPU_ACCEL", "rockchip", 1);
    setenv("SCALER_QUALITY_MODE", "Quality", 1);
    setenv("SCALER_QUALITY_HEVC", "28", 1);
    setenv("SCALER_DELETE_ORIGINAL", "no", 1);
    setenv("SCALER_RENAME_ONLY", "yes", 1);
    setenv("SCALER_MAX_BITRATE_30FPS_4K", "40000000", 1);
    setenv("SCALER_OUTPUT_UID", "-1", 1);
    setenv("SCALER_LOG_LEVEL", "debug", 1);

    ScalerConfig cfg;
    load_environment(&cfg);

    EXPECT_EQ(cfg.watchDir, "/in");
    EXPECT_EQ(cfg.accelMode, AccelMode::Rkmpp);
    EXPECT_EQ(cfg.quality.mode, QualityMode::Quality);
    EXPECT_EQ(cfg.quality.hevc, 28);
    EXPECT_FALSE(cfg.deleteOriginal);
    EXPECT_TRUE(cfg.renameOnly);
    EXPECT_EQ(cfg.ceilings.standard4k, 40000000);
    EXPECT_EQ(cfg.outputUid, -1);
    EXPECT_EQ(cfg.logLevel, LogLevel::Debug);
}

TEST_F(ConfigParserTest, invalidEnvironmentKeepsDefaults)
{
    setenv("SCALER_SCAN_INTERVAL", "soon", 1);
    setenv("SCALER_STABILITY_ROUNDS", "-3", 1);
    setenv("SCALER_DELETE_ORIGINAL", "maybe", 1);
    setenv("SCALER_GPU_ACCEL", "nvidia", 1);
    setenv("SCALER_QUALITY_MODE", "best", 1);

    ScalerConfig cfg;
    load_environment(&cfg);

    EXPECT_EQ(cfg.scanIntervalSec, 60);
    EXPECT_EQ(cfg.stabilityRounds, 4);
    EXPECT_TRUE(cfg.deleteOriginal);
    EXPECT_EQ(cfg.accelMode, AccelMode::Software);
    EXPECT_EQ(cfg.quality.mode, QualityMode::Bitrate);
}

TEST_F(ConfigParserTest, nonPositiveBitrateCeilingsKeepDefaults)
{
    setenv("SCALER_MAX_BITRATE_30FPS_1080P", "0", 1);
    setenv("SCALER_MAX_BITRATE_60FPS_4K", "-5000000", 1);
    setenv("SCALER_MAX_BITRATE_60FPS_1080P", "20000000", 1);

    ScalerConfig cfg;
    load_environment(&cfg);

    EXPECT_EQ(cfg.ceilings.standard1080p, 12000000);
    EXPECT_EQ(cfg.ceilings.highFps4k, 75000000);
    EXPECT_EQ(cfg.ceilings.highFps1080p, 20000000);
}

TEST_F(ConfigParserTest, flagsOverrideEnvironment)
{
    setenv("SCALER_WATCH_DIR", "/from-env", 1);

    ScalerConfig cfg;
    load_environment(&cfg);
    ASSERT_TRUE(parse({"--watch-dir", "/from-flag", "--output-dir", "/out", "--accel", "amd", "--device",
                       "/dev/dri/renderD129", "--workers", "2", "--once", "-v"},
                      cfg));

    EXPECT_EQ(cfg.watchDir, "/from-flag");
    EXPECT_EQ(cfg.outputDir, "/out");
    EXPECT_EQ(cfg.accelMode, AccelMode::Vaapi);
    EXPECT_EQ(cfg.hardwareDevice, "/dev/dri/renderD129");
    EXPECT_EQ(cfg.workers, 2);
    EXPECT_TRUE(cfg.once);
    EXPECT_EQ(cfg.logLevel, LogLevel::Verbose);
}

TEST_F(ConfigParserTest, debugFlagWins)
{
    ScalerConfig cfg;
    ASSERT_TRUE(parse({"-v", "-d"}, cfg));
    EXPECT_EQ(cfg.logLevel, LogLevel::Debug);
}

TEST_F(ConfigParserTest, healthcheckFlag)
{
    ScalerConfig cfg;
    ASSERT_TRUE(parse({"--healthcheck"}, cfg));
    EXPECT_TRUE(cfg.healthcheck);
}

TEST_F(ConfigParserTest, rejectsBadArguments)
{
    {
        ScalerConfig cfg;
        EXPECT_FALSE(parse({"--watch-dir"}, cfg));
    }
    {
        ScalerConfig cfg;
        EXPECT_FALSE(parse({"--accel", "nvenc"}, cfg));
    }
    {
        ScalerConfig cfg;
        EXPECT_FALSE(parse({"--workers", "0"}, cfg));
    }
    {
        ScalerConfig cfg;
        EXPECT_FALSE(parse({"--frobnicate"}, cfg));
    }
    {
        ScalerConfig cfg;
        EXPECT_FALSE(parse({"--help"}, cfg));
    }
}
