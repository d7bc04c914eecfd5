#pragma once

#include "logger.h"
#include "pipeline_types.h"
#include <cstdint>
#include <string>

// Bitrate ceilings, indexed by frame-rate tier and resolution tier
struct BitrateCeilings
{
    int64_t standard1080p = 12000000;
    int64_t standard4k = 49000000;
    int64_t highFps1080p = 18000000;
    int64_t highFps4k = 75000000;
};

// Per-codec quality parameters (QP for hardware encoders, CRF for software)
struct QualitySettings
{
    QualityMode mode = QualityMode::Bitrate;
    int h264 = 22;
    int hevc = 23;
    int av1 = 25;
    std::string softwarePreset = "medium";
};

// Configuration for the whole daemon
struct ScalerConfig
{
    bool verbose = false;
    bool debug = false;
    LogLevel logLevel = LogLevel::Info;

    std::string watchDir = "/watch_dir";
    std::string outputDir = "/output_dir";
    std::string tempDir; // empty: system temp directory

    int scanIntervalSec = 60;
    int stabilityIntervalSec = 5;
    int stabilityRounds = 4;

    AccelMode accelMode = AccelMode::Software;
    std::string hardwareDevice = "/dev/dri/renderD128";
    QualitySettings quality;
    BitrateCeilings ceilings;

    bool deleteOriginal = true;
    bool renameOnly = false;

    int workers = 1;
    int queueSize = 16;

    std::string statusFile = "/tmp/video_scaler_status";
    int heartbeatIntervalSec = 20;

    int outputUid = 1000; // negative: leave ownership alone
    int outputGid = 1000;

    std::string ffmpegBinary = "ffmpeg";

    bool healthcheck = false; // --healthcheck: probe the status file and exit
    bool once = false;        // --once: process the current tree and exit
};

// Print usage/help information
void print_help(const char *argv0);

// Fill cfg from SCALER_* environment variables (defaults for anything unset)
void load_environment(ScalerConfig *cfg);

// Parse command-line arguments on top of the environment defaults.
// Returns false if help was shown or an argument was invalid.
bool parse_arguments(int argc, char **argv, ScalerConfig *cfg);
