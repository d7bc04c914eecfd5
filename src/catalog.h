#pragma once

#include <cstdint>
#include <deque>
#include <filesystem>
#include <functional>
#include <map>
#include <mutex>
#include <set>
#include <string>
#include <vector>

// Size and modification time observed for a path
struct FileFingerprint
{
    uintmax_t size = 0;
    std::filesystem::file_time_type modTime{};

    bool operator==(const FileFingerprint &other) const { return size == other.size && modTime == other.modTime; }
    bool operator!=(const FileFingerprint &other) const { return !(*this == other); }
};

// False when path does not exist or is not a regular file
bool read_fingerprint(const std::string &path, FileFingerprint &fingerprint);

enum class Lifecycle
{
    Unknown,
    Pending,
    InFlight,
    Completed,
    Skipped,
    Failed
};

const char *lifecycle_name(Lifecycle state);

constexpr size_t kSizeHistoryLength = 5;

// Stability bookkeeping for one pending path
struct FileRecord
{
    std::string path;
    std::deque<uintmax_t> sizeHistory; // most recent last
    FileFingerprint last;
    bool observed = false; // false until the first tick saw the file
    int stableRounds = 0;
};

enum class PendingVerdict
{
    Waiting,
    Stable,
    Vanished
};

struct CatalogCounts
{
    size_t pending = 0;
    size_t inFlight = 0;
    size_t completed = 0;
    size_t skipped = 0;
    size_t failed = 0;
};

// Authoritative record of every known path. A path belongs to at most one of
// pending, in-flight or settled (completed / skipped / failed) at any time.
class Catalog
{
public:
    // True if the path exists and is not pending, in flight, or settled with a matching fingerprint.
    // Settled paths whose file changed or vanished lose their membership here.
    bool shouldIngest(const std::string &path);

    // shouldIngest plus insertion into the pending set, atomically
    bool ingest(const std::string &path);

    std::vector<std::string> pendingPaths() const;

    // Run evaluate over every pending record under one lock. Stable records move to in-flight,
    // at most maxPromotions of them; the rest stay pending untouched. Vanished records are dropped.
    std::vector<std::string> evaluatePending(const std::function<PendingVerdict(FileRecord &)> &evaluate,
                                             size_t maxPromotions);

    void markCompleted(const std::string &path);
    void markSkipped(const std::string &path);
    void markFailed(const std::string &path);
    void markVanished(const std::string &path);

    // Forget an in-flight path without classifying it
    void release(const std::string &path);

    Lifecycle stateOf(const std::string &path) const;
    CatalogCounts counts() const;

    // Nothing pending and nothing in flight
    bool idle() const;

private:
    struct Settled
    {
        Lifecycle state = Lifecycle::Completed;
        FileFingerprint fingerprint;
    };

    bool shouldIngestLocked(const std::string &path, const FileFingerprint &current);
    void settle(const std::string &path, Lifecycle state);

    mutable std::mutex m_mutex;
    std::map<std::string, FileRecord> m_pending;
    std::set<std::string> m_inFlight;
    std::map<std::string, Settled> m_settled;
};
