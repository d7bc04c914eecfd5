#pragma once

#include <string>
#include <vector>

#include "catalog.h"
#include "open_handles.h"

// What one tick saw for a path
struct Observation
{
    bool exists = false;
    bool openElsewhere = false;
    FileFingerprint fingerprint;
};

// Decides when a pending file has stopped changing and is no longer held open
class StabilityTracker
{
public:
    StabilityTracker(Catalog &catalog, IOpenHandleChecker &openHandles, int requiredRounds);

    // Register interest in a path; false if the catalog already knows it
    bool observe(const std::string &path);

    // Evaluate every pending path and return those promoted to in-flight, at most capacity of them
    std::vector<std::string> tick(size_t capacity);

    // Apply one observation to a record
    static PendingVerdict advance(FileRecord &record, const Observation &observation, int requiredRounds);

private:
    Catalog &m_catalog;
    IOpenHandleChecker &m_openHandles;
    int m_requiredRounds;
};
