#include "scaler_service.h"
#include "directory_scanner.h"
#include "errors.h"
#include "logger.h"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <system_error>
#include <utility>

namespace fs = std::filesystem;

namespace
{
    constexpr size_t kEventChannelCapacity = 1024;
    constexpr std::chrono::milliseconds kMaxIdleWait(250);
    constexpr int kMinHeartbeatAgeSec = 30;
    constexpr int kHeartbeatSlackSec = 10;

    std::chrono::seconds seconds_of(int value)
    {
        return std::chrono::seconds(std::max(1, value));
    }
}

ServiceCollaborators default_collaborators(const ScalerConfig &cfg, const std::atomic<bool> &stop)
{
    ServiceCollaborators collab;
    collab.inspector = std::make_unique<FFmpegMediaInspector>();
    collab.transcoder = std::make_unique<FFmpegTranscoder>(cfg.ffmpegBinary, stop);
    collab.openHandles = std::make_unique<ProcOpenHandleChecker>();
    return collab;
}

int heartbeat_max_age(int heartbeatIntervalSec)
{
    return std::max(kMinHeartbeatAgeSec, heartbeatIntervalSec + kHeartbeatSlackSec);
}

bool heartbeat_fresh(const std::string &statusFile, int maxAgeSec)
{
    std::error_code ec;
    const fs::file_time_type written = fs::last_write_time(statusFile, ec);
    if (ec)
        return false;
    const auto age = fs::file_time_type::clock::now() - written;
    return age < std::chrono::seconds(maxAgeSec);
}

ScalerService::ScalerService(const ScalerConfig &cfg, std::atomic<bool> &stop, ServiceCollaborators collaborators)
    : m_cfg(cfg),
      m_stop(stop),
      m_collab(std::move(collaborators)),
      m_tracker(m_catalog, *m_collab.openHandles, cfg.stabilityRounds),
      m_temps(cfg.tempDir),
      m_outputs(cfg.watchDir, cfg.outputDir, OwnershipPolicy{cfg.outputUid, cfg.outputGid}, m_temps),
      m_planner(cfg.accelMode, cfg.quality, cfg.ceilings, cfg.hardwareDevice, cfg.renameOnly),
      m_events(kEventChannelCapacity),
      m_jobs(static_cast<size_t>(std::max(1, cfg.queueSize))),
      m_watcher(cfg.watchDir, m_events)
{
}

ScalerService::~ScalerService()
{
    shutdown();
}

void ScalerService::startWorkers()
{
    const int count = std::max(1, m_cfg.workers);
    JobPolicy policy;
    policy.deleteOriginal = m_cfg.deleteOriginal;
    for (int i = 0; i < count; ++i)
    {
        m_processors.push_back(std::make_unique<JobProcessor>(*m_collab.inspector, m_planner, *m_collab.transcoder,
                                                              m_temps, m_outputs, policy));
        JobProcessor &processor = *m_processors.back();
        m_workers.emplace_back([this, &processor]()
                               { this->workerLoop(processor); });
    }
    LOG_VERBOSE("Started %d encode worker(s)", count);
}

void ScalerService::workerLoop(JobProcessor &processor)
{
    while (std::optional<std::string> path = m_jobs.pop())
    {
        if (m_stop)
        {
            m_catalog.release(*path);
            continue;
        }

        JobOutcome outcome = JobOutcome::Failed;
        try
        {
            outcome = processor.process(*path);
        }
        catch (const std::exception &e)
        {
            LOG_ERROR("Worker caught unexpected error for %s: %s", path->c_str(), e.what());
        }

        LOG_VERBOSE("%s: %s", path->c_str(), job_outcome_name(outcome));
        switch (outcome)
        {
        case JobOutcome::Completed:
            m_catalog.markCompleted(*path);
            break;
        case JobOutcome::Skipped:
            m_catalog.markSkipped(*path);
            break;
        case JobOutcome::Vanished:
            m_catalog.markVanished(*path);
            break;
        case JobOutcome::Aborted:
            m_catalog.release(*path);
            break;
        case JobOutcome::Deferred:
            // Back to pending; a later tick retries once the other job is done
            m_catalog.release(*path);
            m_tracker.observe(*path);
            break;
        default:
            m_catalog.markFailed(*path);
            break;
        }
    }
}

void ScalerService::rescan()
{
    size_t added = 0;
    for (const auto &path : scan_directory(m_cfg.watchDir))
    {
        if (m_tracker.observe(path))
            ++added;
    }
    if (added > 0)
        LOG_INFO("Scan of %s found %zu new file(s)", m_cfg.watchDir.c_str(), added);
}

void ScalerService::stabilityTick()
{
    for (auto &path : m_tracker.tick(m_jobs.freeSlots()))
    {
        if (!m_jobs.push(path))
            m_catalog.release(path);
    }
}

bool ScalerService::writeHeartbeat()
{
    std::ofstream out(m_cfg.statusFile, std::ios::out | std::ios::trunc);
    if (out)
        out << "running\n";
    if (!out)
    {
        LOG_ERROR("Cannot write heartbeat file %s", m_cfg.statusFile.c_str());
        return false;
    }
    LOG_DEBUG("Heartbeat written to %s", m_cfg.statusFile.c_str());
    return true;
}

void ScalerService::drainEvents(std::chrono::milliseconds wait)
{
    std::optional<std::string> path = m_events.popFor(wait);
    while (path)
    {
        m_tracker.observe(*path);
        path = m_events.popFor(std::chrono::milliseconds(0));
    }
}

int ScalerService::run()
{
    std::error_code ec;
    if (!fs::is_directory(m_cfg.watchDir, ec))
    {
        LOG_ERROR("Watch directory %s does not exist", m_cfg.watchDir.c_str());
        return 1;
    }
    try
    {
        m_outputs.ensureDirectory(m_cfg.outputDir);
    }
    catch (const FilesystemError &e)
    {
        LOG_ERROR("%s", e.what());
        return 1;
    }

    size_t stale = TempFileRegistry::sweepStale(m_temps.directory());
    if (stale > 0)
        LOG_INFO("Removed %zu stale temporary file(s) from %s", stale, m_temps.directory().c_str());
    stale = TempFileRegistry::sweepStale(m_cfg.outputDir, true);
    if (stale > 0)
        LOG_INFO("Removed %zu interrupted copy(ies) from %s", stale, m_cfg.outputDir.c_str());

    LOG_INFO("Watching %s -> %s (%s, %d worker(s))", m_cfg.watchDir.c_str(), m_cfg.outputDir.c_str(),
             accel_mode_name(m_planner.accelMode()), std::max(1, m_cfg.workers));

    startWorkers();
    if (!m_cfg.once && !m_watcher.start())
        LOG_WARN("File watch unavailable, relying on periodic rescans");

    using clock = std::chrono::steady_clock;
    const auto tickInterval = seconds_of(m_cfg.stabilityIntervalSec);
    const auto rescanInterval = seconds_of(m_cfg.scanIntervalSec);
    const auto heartbeatInterval = seconds_of(m_cfg.heartbeatIntervalSec);

    rescan();
    auto now = clock::now();
    auto nextTick = now;
    auto nextRescan = now + rescanInterval;
    auto nextHeartbeat = now;

    while (!m_stop)
    {
        now = clock::now();
        if (now >= nextHeartbeat)
        {
            if (!writeHeartbeat())
            {
                m_heartbeatFailed = true;
                m_stop = true;
                break;
            }
            nextHeartbeat = now + heartbeatInterval;
        }
        if (now >= nextTick)
        {
            stabilityTick();
            nextTick = now + tickInterval;
        }
        if (now >= nextRescan)
        {
            rescan();
            nextRescan = now + rescanInterval;
        }

        if (m_cfg.once && m_catalog.idle() && m_events.size() == 0)
        {
            LOG_INFO("All files processed");
            break;
        }

        const auto nextDeadline = std::min({nextTick, nextRescan, nextHeartbeat});
        auto wait = std::chrono::duration_cast<std::chrono::milliseconds>(nextDeadline - clock::now());
        wait = std::max(std::chrono::milliseconds(0), std::min(wait, kMaxIdleWait));
        drainEvents(wait);
    }

    if (m_stop)
        LOG_INFO("Shutting down");
    shutdown();

    const CatalogCounts counts = m_catalog.counts();
    LOG_INFO("Completed %zu, skipped %zu, failed %zu", counts.completed, counts.skipped, counts.failed);
    return m_heartbeatFailed ? 1 : 0;
}

void ScalerService::shutdown()
{
    m_watcher.stop();
    m_events.close();
    m_jobs.close();
    for (auto &worker : m_workers)
    {
        if (worker.joinable())
            worker.join();
    }
    m_workers.clear();

    std::error_code ec;
    if (!m_cfg.statusFile.empty() && fs::remove(m_cfg.statusFile, ec))
        LOG_DEBUG("Removed heartbeat file %s", m_cfg.statusFile.c_str());
    m_temps.removeAll();
}
