#include <atomic>
#include <csignal>
#include <cstdio>
#include <cstring>

#include "config_parser.h"
#include "ffmpeg_utils.h"
#include "logger.h"
#include "scaler_service.h"

#ifndef BUILD_VERSION
#define BUILD_VERSION "dev"
#endif

static std::atomic<bool> g_stop{false};

extern "C" void handle_stop_signal(int)
{
    g_stop = true;
}

// SIGTERM, SIGHUP and SIGINT all mean "shut down"
static void install_signal_handlers()
{
    struct sigaction sa;
    std::memset(&sa, 0, sizeof(sa));
    sa.sa_handler = handle_stop_signal;
    sigemptyset(&sa.sa_mask);
    sigaction(SIGTERM, &sa, nullptr);
    sigaction(SIGHUP, &sa, nullptr);
    sigaction(SIGINT, &sa, nullptr);

    // Pipes to a dying ffmpeg must not take the daemon down
    signal(SIGPIPE, SIG_IGN);
}

int main(int argc, char **argv)
{
    ScalerConfig cfg;
    load_environment(&cfg);
    if (!parse_arguments(argc, argv, &cfg))
        return 1;

    if (cfg.healthcheck)
        return heartbeat_fresh(cfg.statusFile, heartbeat_max_age(cfg.heartbeatIntervalSec)) ? 0 : 1;

    Logger::instance().setLevel(cfg.logLevel);
    apply_ffmpeg_log_level(cfg.logLevel);

    LOG_INFO("video_scaler build %s starting", BUILD_VERSION);
    LOG_VERBOSE("Encoder: %s, quality mode: %s, delete originals: %s, rename only: %s",
                accel_mode_name(cfg.accelMode), cfg.quality.mode == QualityMode::Quality ? "quality" : "bitrate",
                cfg.deleteOriginal ? "yes" : "no", cfg.renameOnly ? "yes" : "no");

    install_signal_handlers();

    try
    {
        ScalerService service(cfg, g_stop, default_collaborators(cfg, g_stop));
        return service.run();
    }
    catch (const std::exception &e)
    {
        LOG_ERROR("Fatal: %s", e.what());
        return 1;
    }
}
