#pragma once

#include <atomic>
#include <chrono>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "catalog.h"
#include "channel.h"
#include "config_parser.h"
#include "directory_watcher.h"
#include "job_processor.h"
#include "media_inspector.h"
#include "open_handles.h"
#include "output_manager.h"
#include "stability_tracker.h"
#include "temp_files.h"
#include "transcode_planner.h"
#include "transcoder.h"

// External collaborators; the defaults talk to libav*, /proc and the ffmpeg executable
struct ServiceCollaborators
{
    std::unique_ptr<IMediaInspector> inspector;
    std::unique_ptr<ITranscoder> transcoder;
    std::unique_ptr<IOpenHandleChecker> openHandles;
};

ServiceCollaborators default_collaborators(const ScalerConfig &cfg, const std::atomic<bool> &stop);

// How old the heartbeat marker may get before the daemon counts as unhealthy:
// 30 s, or longer when the configured write interval needs it
int heartbeat_max_age(int heartbeatIntervalSec);

// True when the heartbeat marker exists and was written less than maxAgeSec ago
bool heartbeat_fresh(const std::string &statusFile, int maxAgeSec);

/**
 * The daemon: one scheduler thread (the caller of run()) drives the stability
 * tick, periodic rescan, heartbeat and watch events; encode workers take
 * stable paths from a bounded job channel.
 */
class ScalerService
{
public:
    ScalerService(const ScalerConfig &cfg, std::atomic<bool> &stop, ServiceCollaborators collaborators);
    ~ScalerService();

    ScalerService(const ScalerService &) = delete;
    ScalerService &operator=(const ScalerService &) = delete;

    // Blocks until stop is raised (or, in once mode, until the tree is processed). Returns the exit code.
    int run();

    const Catalog &catalog() const { return m_catalog; }

private:
    void startWorkers();
    void workerLoop(JobProcessor &processor);
    void rescan();
    void stabilityTick();
    bool writeHeartbeat();
    void drainEvents(std::chrono::milliseconds wait);
    void shutdown();

    ScalerConfig m_cfg;
    std::atomic<bool> &m_stop;
    ServiceCollaborators m_collab;

    Catalog m_catalog;
    StabilityTracker m_tracker;
    TempFileRegistry m_temps;
    OutputManager m_outputs;
    TranscodePlanner m_planner;

    Channel<std::string> m_events;
    Channel<std::string> m_jobs;
    DirectoryWatcher m_watcher;

    std::vector<std::unique_ptr<JobProcessor>> m_processors;
    std::vector<std::thread> m_workers;
    bool m_heartbeatFailed = false;
};
