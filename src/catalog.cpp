#include "catalog.h"
#include "logger.h"

#include <system_error>

namespace fs = std::filesystem;

bool read_fingerprint(const std::string &path, FileFingerprint &fingerprint)
{
    std::error_code ec;
    const fs::file_status status = fs::status(path, ec);
    if (ec || !fs::is_regular_file(status))
        return false;
    const uintmax_t size = fs::file_size(path, ec);
    if (ec)
        return false;
    const fs::file_time_type modTime = fs::last_write_time(path, ec);
    if (ec)
        return false;
    fingerprint.size = size;
    fingerprint.modTime = modTime;
    return true;
}

const char *lifecycle_name(Lifecycle state)
{
    switch (state)
    {
    case Lifecycle::Pending:
        return "pending";
    case Lifecycle::InFlight:
        return "in-flight";
    case Lifecycle::Completed:
        return "completed";
    case Lifecycle::Skipped:
        return "skipped";
    case Lifecycle::Failed:
        return "failed";
    default:
        return "unknown";
    }
}

bool Catalog::shouldIngestLocked(const std::string &path, const FileFingerprint &current)
{
    if (m_pending.count(path) || m_inFlight.count(path))
        return false;

    auto it = m_settled.find(path);
    if (it == m_settled.end())
        return true;
    if (it->second.fingerprint == current)
        return false;

    LOG_VERBOSE("%s changed since it was %s, re-ingesting", path.c_str(), lifecycle_name(it->second.state));
    m_settled.erase(it);
    return true;
}

bool Catalog::shouldIngest(const std::string &path)
{
    FileFingerprint current;
    const bool exists = read_fingerprint(path, current);

    std::lock_guard<std::mutex> lock(m_mutex);
    if (!exists)
    {
        m_settled.erase(path);
        return false;
    }
    return shouldIngestLocked(path, current);
}

bool Catalog::ingest(const std::string &path)
{
    FileFingerprint current;
    const bool exists = read_fingerprint(path, current);

    std::lock_guard<std::mutex> lock(m_mutex);
    if (!exists)
    {
        m_settled.erase(path);
        return false;
    }
    if (!shouldIngestLocked(path, current))
        return false;

    FileRecord record;
    record.path = path;
    m_pending.emplace(path, std::move(record));
    LOG_DEBUG("Tracking %s", path.c_str());
    return true;
}

std::vector<std::string> Catalog::pendingPaths() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    std::vector<std::string> paths;
    paths.reserve(m_pending.size());
    for (const auto &entry : m_pending)
        paths.push_back(entry.first);
    return paths;
}

std::vector<std::string> Catalog::evaluatePending(const std::function<PendingVerdict(FileRecord &)> &evaluate,
                                                  size_t maxPromotions)
{
    std::vector<std::string> promoted;
    std::lock_guard<std::mutex> lock(m_mutex);
    for (auto it = m_pending.begin(); it != m_pending.end();)
    {
        const PendingVerdict verdict = evaluate(it->second);
        if (verdict == PendingVerdict::Vanished)
        {
            LOG_VERBOSE("%s vanished, no longer tracked", it->first.c_str());
            it = m_pending.erase(it);
        }
        else if (verdict == PendingVerdict::Stable && promoted.size() < maxPromotions)
        {
            promoted.push_back(it->first);
            m_inFlight.insert(it->first);
            it = m_pending.erase(it);
        }
        else
        {
            ++it;
        }
    }
    return promoted;
}

void Catalog::settle(const std::string &path, Lifecycle state)
{
    FileFingerprint current;
    const bool exists = read_fingerprint(path, current);

    std::lock_guard<std::mutex> lock(m_mutex);
    m_inFlight.erase(path);
    m_pending.erase(path);
    if (!exists)
    {
        m_settled.erase(path);
        return;
    }
    m_settled[path] = Settled{state, current};
}

void Catalog::markCompleted(const std::string &path)
{
    settle(path, Lifecycle::Completed);
}

void Catalog::markSkipped(const std::string &path)
{
    settle(path, Lifecycle::Skipped);
}

void Catalog::markFailed(const std::string &path)
{
    settle(path, Lifecycle::Failed);
}

void Catalog::markVanished(const std::string &path)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_pending.erase(path);
    m_inFlight.erase(path);
    m_settled.erase(path);
}

void Catalog::release(const std::string &path)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_inFlight.erase(path);
}

Lifecycle Catalog::stateOf(const std::string &path) const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_pending.count(path))
        return Lifecycle::Pending;
    if (m_inFlight.count(path))
        return Lifecycle::InFlight;
    auto it = m_settled.find(path);
    if (it != m_settled.end())
        return it->second.state;
    return Lifecycle::Unknown;
}

CatalogCounts Catalog::counts() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    CatalogCounts counts;
    counts.pending = m_pending.size();
    counts.inFlight = m_inFlight.size();
    for (const auto &entry : m_settled)
    {
        switch (entry.second.state)
        {
        case Lifecycle::Completed:
            ++counts.completed;
            break;
        case Lifecycle::Skipped:
            ++counts.skipped;
            break;
        default:
            ++counts.failed;
            break;
        }
    }
    return counts;
}

bool Catalog::idle() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_pending.empty() && m_inFlight.empty();
}
