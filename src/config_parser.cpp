#include "config_parser.h"
#include "logger.h"
#include "utils.h"

#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <string>

#ifndef BUILD_VERSION
#define BUILD_VERSION "dev"
#endif

// Helper function: get environment variable as string
static const char *get_env_var(const char *name)
{
    const char *value = std::getenv(name);
    if (value && *value == '\0')
        return nullptr;
    return value;
}

static std::string get_env_string(const char *name, const std::string &default_value)
{
    const char *value = get_env_var(name);
    return value ? std::string(value) : default_value;
}

// Helper function: get environment variable as integer with default
static int64_t get_env_int(const char *name, int64_t default_value)
{
    const char *value = get_env_var(name);
    if (!value)
        return default_value;
    try
    {
        size_t consumed = 0;
        long long parsed = std::stoll(value, &consumed);
        if (consumed != std::strlen(value))
            throw std::invalid_argument(value);
        return parsed;
    }
    catch (const std::exception &)
    {
        LOG_WARN("Invalid integer value for %s: %s (using default: %lld)", name, value,
                 static_cast<long long>(default_value));
        return default_value;
    }
}

// Helper function: get environment variable as positive integer with default
static int get_env_positive(const char *name, int default_value)
{
    int64_t value = get_env_int(name, default_value);
    if (value <= 0 || value > 1000000)
    {
        LOG_WARN("Value for %s must be positive: %lld (using default: %d)", name,
                 static_cast<long long>(value), default_value);
        return default_value;
    }
    return static_cast<int>(value);
}

// Helper function: get environment variable as a bitrate in bits per second, which must be positive
static int64_t get_env_bitrate(const char *name, int64_t default_value)
{
    int64_t value = get_env_int(name, default_value);
    if (value <= 0)
    {
        LOG_WARN("Bitrate for %s must be positive: %lld (using default: %lld)", name,
                 static_cast<long long>(value), static_cast<long long>(default_value));
        return default_value;
    }
    return value;
}

// Helper function: get environment variable as boolean (1/true/yes = true, 0/false/no = false)
static bool get_env_bool(const char *name, bool default_value)
{
    const char *value = get_env_var(name);
    if (!value)
        return default_value;
    std::string lower = lowercase_copy(trim_copy(value));
    if (lower == "1" || lower == "true" || lower == "yes")
        return true;
    if (lower == "0" || lower == "false" || lower == "no")
        return false;
    LOG_WARN("Invalid boolean value for %s: %s (using default: %s)",
             name, value, default_value ? "true" : "false");
    return default_value;
}

void print_help(const char *argv0)
{
    fprintf(stderr, "video_scaler build %s\n", BUILD_VERSION);
    fprintf(stderr, "Usage: %s [options]\n", argv0);
    fprintf(stderr, "\nWatches a directory tree, waits for each video file to stop changing and transcodes it\n");
    fprintf(stderr, "into the output tree (4K sources also get a 1080p copy).\n");
    fprintf(stderr, "\nOptions:\n");
    fprintf(stderr, "  -h, --help          Show this help\n");
    fprintf(stderr, "  -v, --verbose       Enable verbose logging\n");
    fprintf(stderr, "  -d, --debug         Enable debug logging\n");
    fprintf(stderr, "  --watch-dir <dir>   Watch root (env: SCALER_WATCH_DIR, default /watch_dir)\n");
    fprintf(stderr, "  --output-dir <dir>  Output root (env: SCALER_OUTPUT_DIR, default /output_dir)\n");
    fprintf(stderr, "  --temp-dir <dir>    Temporary files (env: SCALER_TEMP_DIR, default system temp)\n");
    fprintf(stderr, "  --accel <mode>      amd|vaapi, rockchip|rkmpp or software (env: SCALER_GPU_ACCEL)\n");
    fprintf(stderr, "  --device <path>     VAAPI render node (env: SCALER_AMD_DEVICE)\n");
    fprintf(stderr, "  --workers <n>       Concurrent encodes, default 1 (env: SCALER_WORKERS)\n");
    fprintf(stderr, "  --once              Process the current tree, then exit\n");
    fprintf(stderr, "  --healthcheck       Exit 0 if the heartbeat file is fresh, 1 otherwise\n");
    fprintf(stderr, "\nEnvironment:\n");
    fprintf(stderr, "  SCALER_SCAN_INTERVAL        Full rescan period in seconds (default 60)\n");
    fprintf(stderr, "  SCALER_STABILITY_INTERVAL   Stability check period in seconds (default 5)\n");
    fprintf(stderr, "  SCALER_STABILITY_ROUNDS     Consecutive unchanged checks required (default 4)\n");
    fprintf(stderr, "  SCALER_QUALITY_MODE         bitrate or quality (default bitrate)\n");
    fprintf(stderr, "  SCALER_QUALITY_H264         QP/CRF for h264 in quality mode (default 22)\n");
    fprintf(stderr, "  SCALER_QUALITY_HEVC         QP/CRF for hevc in quality mode (default 23)\n");
    fprintf(stderr, "  SCALER_QUALITY_AV1          CRF for av1 (default 25)\n");
    fprintf(stderr, "  SCALER_SOFTWARE_PRESET      x264/x265 preset (default medium)\n");
    fprintf(stderr, "  SCALER_DELETE_ORIGINAL      Remove the source after success (default yes)\n");
    fprintf(stderr, "  SCALER_RENAME_ONLY          Move instead of re-encode when nothing changes (default no)\n");
    fprintf(stderr, "  SCALER_MAX_BITRATE_30FPS_1080P / _30FPS_4K / _60FPS_1080P / _60FPS_4K\n");
    fprintf(stderr, "                              Bitrate ceilings (12M / 49M / 18M / 75M)\n");
    fprintf(stderr, "  SCALER_QUEUE_SIZE           Job queue capacity (default 16)\n");
    fprintf(stderr, "  SCALER_STATUS_FILE          Heartbeat file (default /tmp/video_scaler_status)\n");
    fprintf(stderr, "  SCALER_HEARTBEAT_INTERVAL   Heartbeat period in seconds (default 20)\n");
    fprintf(stderr, "  SCALER_OUTPUT_UID / SCALER_OUTPUT_GID  Owner of produced files, -1 to keep (default 1000)\n");
    fprintf(stderr, "  SCALER_FFMPEG               Transcoder binary (default ffmpeg)\n");
    fprintf(stderr, "  SCALER_LOG_LEVEL            error, warn, info, verbose or debug (default info)\n");
    fprintf(stderr, "\nCommand-line flags override environment variables.\n");
}

void load_environment(ScalerConfig *cfg)
{
    const char *env_level = get_env_var("SCALER_LOG_LEVEL");
    if (env_level && !parse_log_level(env_level, cfg->logLevel))
        LOG_WARN("Invalid value for SCALER_LOG_LEVEL: %s (using default: info)", env_level);

    cfg->watchDir = get_env_string("SCALER_WATCH_DIR", cfg->watchDir);
    cfg->outputDir = get_env_string("SCALER_OUTPUT_DIR", cfg->outputDir);
    cfg->tempDir = get_env_string("SCALER_TEMP_DIR", cfg->tempDir);

    cfg->scanIntervalSec = get_env_positive("SCALER_SCAN_INTERVAL", cfg->scanIntervalSec);
    cfg->stabilityIntervalSec = get_env_positive("SCALER_STABILITY_INTERVAL", cfg->stabilityIntervalSec);
    cfg->stabilityRounds = get_env_positive("SCALER_STABILITY_ROUNDS", cfg->stabilityRounds);

    const char *env_accel = get_env_var("SCALER_GPU_ACCEL");
    if (env_accel && !parse_accel_mode(env_accel, cfg->accelMode))
    {
        LOG_WARN("Unknown SCALER_GPU_ACCEL=%s. Falling back to software.", env_accel);
        cfg->accelMode = AccelMode::Software;
    }
    cfg->hardwareDevice = get_env_string("SCALER_AMD_DEVICE", cfg->hardwareDevice);

    const char *env_quality_mode = get_env_var("SCALER_QUALITY_MODE");
    if (env_quality_mode)
    {
        std::string mode = lowercase_copy(trim_copy(env_quality_mode));
        if (mode == "quality")
            cfg->quality.mode = QualityMode::Quality;
        else if (mode == "bitrate")
            cfg->quality.mode = QualityMode::Bitrate;
        else
            LOG_WARN("Invalid value for SCALER_QUALITY_MODE: %s (using default: bitrate)", env_quality_mode);
    }
    cfg->quality.h264 = get_env_positive("SCALER_QUALITY_H264", cfg->quality.h264);
    cfg->quality.hevc = get_env_positive("SCALER_QUALITY_HEVC", cfg->quality.hevc);
    cfg->quality.av1 = get_env_positive("SCALER_QUALITY_AV1", cfg->quality.av1);
    cfg->quality.softwarePreset = get_env_string("SCALER_SOFTWARE_PRESET", cfg->quality.softwarePreset);

    cfg->deleteOriginal = get_env_bool("SCALER_DELETE_ORIGINAL", cfg->deleteOriginal);
    cfg->renameOnly = get_env_bool("SCALER_RENAME_ONLY", cfg->renameOnly);

    cfg->ceilings.standard1080p = get_env_bitrate("SCALER_MAX_BITRATE_30FPS_1080P", cfg->ceilings.standard1080p);
    cfg->ceilings.standard4k = get_env_bitrate("SCALER_MAX_BITRATE_30FPS_4K", cfg->ceilings.standard4k);
    cfg->ceilings.highFps1080p = get_env_bitrate("SCALER_MAX_BITRATE_60FPS_1080P", cfg->ceilings.highFps1080p);
    cfg->ceilings.highFps4k = get_env_bitrate("SCALER_MAX_BITRATE_60FPS_4K", cfg->ceilings.highFps4k);

    cfg->workers = get_env_positive("SCALER_WORKERS", cfg->workers);
    cfg->queueSize = get_env_positive("SCALER_QUEUE_SIZE", cfg->queueSize);

    cfg->statusFile = get_env_string("SCALER_STATUS_FILE", cfg->statusFile);
    cfg->heartbeatIntervalSec = get_env_positive("SCALER_HEARTBEAT_INTERVAL", cfg->heartbeatIntervalSec);

    cfg->outputUid = static_cast<int>(get_env_int("SCALER_OUTPUT_UID", cfg->outputUid));
    cfg->outputGid = static_cast<int>(get_env_int("SCALER_OUTPUT_GID", cfg->outputGid));

    cfg->ffmpegBinary = get_env_string("SCALER_FFMPEG", cfg->ffmpegBinary);
}

// Fetch the value following a flag, or report it missing
static const char *flag_value(int argc, char **argv, int &i, const std::string &flag)
{
    if (i + 1 >= argc)
    {
        fprintf(stderr, "Missing argument for %s\n", flag.c_str());
        return nullptr;
    }
    return argv[++i];
}

bool parse_arguments(int argc, char **argv, ScalerConfig *cfg)
{
    for (int i = 1; i < argc; ++i)
    {
        std::string arg = argv[i];

        if (arg == "-h" || arg == "--help")
        {
            print_help(argv[0]);
            return false;
        }
        else if (arg == "-v" || arg == "--verbose")
        {
            cfg->verbose = true;
        }
        else if (arg == "-d" || arg == "--debug")
        {
            cfg->debug = true;
        }
        else if (arg == "--once")
        {
            cfg->once = true;
        }
        else if (arg == "--healthcheck")
        {
            cfg->healthcheck = true;
        }
        else if (arg == "--watch-dir" || arg == "--output-dir" || arg == "--temp-dir" || arg == "--device")
        {
            const char *value = flag_value(argc, argv, i, arg);
            if (!value)
            {
                print_help(argv[0]);
                return false;
            }
            if (arg == "--watch-dir")
                cfg->watchDir = value;
            else if (arg == "--output-dir")
                cfg->outputDir = value;
            else if (arg == "--temp-dir")
                cfg->tempDir = value;
            else
                cfg->hardwareDevice = value;
        }
        else if (arg == "--accel")
        {
            const char *value = flag_value(argc, argv, i, arg);
            if (!value)
            {
                print_help(argv[0]);
                return false;
            }
            if (!parse_accel_mode(value, cfg->accelMode))
            {
                fprintf(stderr, "Invalid value for --accel: %s\n", value);
                return false;
            }
        }
        else if (arg == "--workers")
        {
            const char *value = flag_value(argc, argv, i, arg);
            if (!value)
            {
                print_help(argv[0]);
                return false;
            }
            try
            {
                cfg->workers = std::stoi(value);
            }
            catch (const std::exception &)
            {
                fprintf(stderr, "Invalid value for --workers: %s\n", value);
                return false;
            }
            if (cfg->workers <= 0)
            {
                fprintf(stderr, "--workers must be positive: %s\n", value);
                return false;
            }
        }
        else
        {
            fprintf(stderr, "Unknown argument: %s\n", arg.c_str());
            print_help(argv[0]);
            return false;
        }
    }

    if (cfg->debug)
        cfg->logLevel = LogLevel::Debug;
    else if (cfg->verbose && cfg->logLevel < LogLevel::Verbose)
        cfg->logLevel = LogLevel::Verbose;

    return true;
}
