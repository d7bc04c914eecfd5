#include "stability_tracker.h"
#include "logger.h"

#include <map>

StabilityTracker::StabilityTracker(Catalog &catalog, IOpenHandleChecker &openHandles, int requiredRounds)
    : m_catalog(catalog), m_openHandles(openHandles), m_requiredRounds(requiredRounds)
{
}

bool StabilityTracker::observe(const std::string &path)
{
    return m_catalog.ingest(path);
}

PendingVerdict StabilityTracker::advance(FileRecord &record, const Observation &observation, int requiredRounds)
{
    if (!observation.exists)
        return PendingVerdict::Vanished;

    if (observation.openElsewhere)
    {
        record.stableRounds = 0;
        return PendingVerdict::Waiting;
    }

    if (!record.observed || observation.fingerprint != record.last)
        record.stableRounds = 0;
    else
        ++record.stableRounds;

    record.observed = true;
    record.last = observation.fingerprint;
    record.sizeHistory.push_back(observation.fingerprint.size);
    while (record.sizeHistory.size() > kSizeHistoryLength)
        record.sizeHistory.pop_front();

    return record.stableRounds >= requiredRounds ? PendingVerdict::Stable : PendingVerdict::Waiting;
}

std::vector<std::string> StabilityTracker::tick(size_t capacity)
{
    // Filesystem and /proc work happens before the catalog lock is taken
    std::map<std::string, Observation> observations;
    for (const auto &path : m_catalog.pendingPaths())
    {
        Observation obs;
        obs.exists = read_fingerprint(path, obs.fingerprint);
        if (obs.exists)
            obs.openElsewhere = m_openHandles.isOpenElsewhere(path);
        observations.emplace(path, obs);
    }

    const int required = m_requiredRounds;
    std::vector<std::string> promoted = m_catalog.evaluatePending(
        [&observations, required](FileRecord &record)
        {
            auto it = observations.find(record.path);
            if (it == observations.end())
                return PendingVerdict::Waiting; // ingested after the snapshot
            const PendingVerdict verdict = advance(record, it->second, required);
            if (verdict == PendingVerdict::Waiting)
                LOG_DEBUG("%s: %s, %d/%d stable rounds", record.path.c_str(),
                          it->second.openElsewhere ? "in use" : "waiting", record.stableRounds, required);
            return verdict;
        },
        capacity);

    for (const auto &path : promoted)
        LOG_INFO("%s is stable, queued for processing", path.c_str());
    return promoted;
}
