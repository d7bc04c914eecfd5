#pragma once

#include <mutex>
#include <set>
#include <string>
#include <vector>

#include "temp_files.h"
#include "transcode_planner.h"

struct OwnershipPolicy
{
    int uid = 1000; // negative: leave ownership alone
    int gid = 1000;
};

// Output paths, publishing and source cleanup
class OutputManager
{
public:
    OutputManager(std::string watchRoot, std::string outputRoot, OwnershipPolicy ownership, TempFileRegistry &temps);

    // Mirror the source's directory under the output root and name the 4k/1080p artifacts.
    // Throws FilesystemError when sourcePath is not under the watch root.
    OutputPaths deriveOutputPaths(const std::string &sourcePath) const;

    // Create dir and any missing parents, normalising each newly created one.
    // Throws FilesystemError.
    void ensureDirectory(const std::string &dir) const;

    // Reserve an output path for the calling job. False while another job holds it.
    bool claim(const std::string &finalPath);
    void releaseClaim(const std::string &finalPath);

    // Move a finished temp file to its final path without replacing anything already there:
    // hard link + unlink, or copy through a registered staging file across filesystems.
    // Throws FilesystemError, also when finalPath already exists.
    void publish(const std::string &tempPath, const std::string &finalPath) const;

    // Move the source itself into place (rename-only). Throws FilesystemError.
    void moveSource(const std::string &sourcePath, const std::string &finalPath) const;

    // Remove the original and prune empty parents up to, not including, the watch root
    void removeSourceAndPrune(const std::string &sourcePath) const;

    // 0644 for files, 0755 for directories, then chown per policy. Failures are logged only.
    void normalizePermissions(const std::string &path) const;

private:
    void copyAcross(const std::string &tempPath, const std::string &finalPath) const;

    std::string m_watchRoot;
    std::string m_outputRoot;
    OwnershipPolicy m_ownership;
    TempFileRegistry &m_temps;

    std::mutex m_claimMutex;
    std::set<std::string> m_claimed;
};

// Output paths reserved for one job, released when it goes out of scope
class OutputClaims
{
public:
    explicit OutputClaims(OutputManager &outputs) : m_outputs(outputs) {}
    ~OutputClaims();

    OutputClaims(const OutputClaims &) = delete;
    OutputClaims &operator=(const OutputClaims &) = delete;

    // False if another job already holds path
    bool add(const std::string &path);

private:
    OutputManager &m_outputs;
    std::vector<std::string> m_paths;
};
