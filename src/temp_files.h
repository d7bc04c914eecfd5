#pragma once

#include <mutex>
#include <string>
#include <vector>

// Every temporary file the process creates carries this prefix
constexpr const char *kTempFilePrefix = "vscaler_";

// Thread-safe record of temporary files, swept at shutdown
class TempFileRegistry
{
public:
    explicit TempFileRegistry(std::string directory);

    // Reserve and register a fresh temp path with the given extension (".mkv", ".srt", ...)
    std::string create(const std::string &extension);

    // Same, but placed in another directory (staging beside a final output)
    std::string createIn(const std::string &directory, const std::string &extension);

    void registerFile(const std::string &path);

    // Delete a temp file now; it stays registered
    void discard(const std::string &path) const;

    // Delete every registered file that still exists. Returns the number removed.
    size_t removeAll();

    // Delete leftovers carrying the temp prefix from an earlier run, descending into
    // subdirectories when recursive is set. Returns the number removed.
    static size_t sweepStale(const std::string &directory, bool recursive = false);

    const std::string &directory() const { return m_directory; }
    std::vector<std::string> files() const;

private:
    std::string m_directory;
    mutable std::mutex m_mutex;
    std::vector<std::string> m_files;
    unsigned long m_counter = 0;
};
