#include "output_manager.h"
#include "errors.h"
#include "logger.h"
#include "utils.h"

#include <cerrno>
#include <cstring>
#include <filesystem>
#include <system_error>
#include <utility>
#include <vector>

#include <sys/stat.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace
{
    // Lexically normal form without a trailing separator
    fs::path normalized(const std::string &path)
    {
        fs::path p = fs::path(path).lexically_normal();
        if (!p.has_filename() && p.has_relative_path())
            p = p.parent_path();
        return p;
    }

    // Relative path of child under root, or empty when child lies outside root
    fs::path relative_under(const fs::path &root, const fs::path &child)
    {
        fs::path rel = child.lexically_relative(root);
        if (rel.empty() || *rel.begin() == "..")
            return {};
        return rel;
    }

    // Make `to` name the file at `from` unless `to` already exists. The caller removes `from`.
    // Returns 0 or an errno value (EEXIST, EXDEV, ...).
    int place_no_replace(const std::string &from, const std::string &to)
    {
        if (link(from.c_str(), to.c_str()) == 0)
            return 0;
        const int err = errno;
        if (err != EPERM && err != EOPNOTSUPP)
            return err;

        // No hard links on this filesystem
        std::error_code ec;
        if (fs::exists(to, ec))
            return EEXIST;
        fs::rename(from, to, ec);
        return ec ? ec.value() : 0;
    }
}

OutputManager::OutputManager(std::string watchRoot, std::string outputRoot, OwnershipPolicy ownership,
                             TempFileRegistry &temps)
    : m_watchRoot(normalized(watchRoot).string()),
      m_outputRoot(normalized(outputRoot).string()),
      m_ownership(ownership),
      m_temps(temps)
{
}

bool OutputManager::claim(const std::string &finalPath)
{
    std::lock_guard<std::mutex> lock(m_claimMutex);
    return m_claimed.insert(normalized(finalPath).string()).second;
}

void OutputManager::releaseClaim(const std::string &finalPath)
{
    std::lock_guard<std::mutex> lock(m_claimMutex);
    m_claimed.erase(normalized(finalPath).string());
}

OutputClaims::~OutputClaims()
{
    for (const auto &path : m_paths)
        m_outputs.releaseClaim(path);
}

bool OutputClaims::add(const std::string &path)
{
    if (!m_outputs.claim(path))
        return false;
    m_paths.push_back(path);
    return true;
}

OutputPaths OutputManager::deriveOutputPaths(const std::string &sourcePath) const
{
    const fs::path source = normalized(sourcePath);
    const fs::path rel = relative_under(fs::path(m_watchRoot), source);
    if (rel.empty() || rel == ".")
        throw FilesystemError(sourcePath + " is not inside the watch directory " + m_watchRoot);

    fs::path outDir = fs::path(m_outputRoot);
    if (!rel.parent_path().empty())
        outDir /= rel.parent_path();

    const std::string base = strip_name_tag(source.stem().string());
    const std::string ext = source.extension().string();

    OutputPaths paths;
    paths.outputDir = outDir.string();
    paths.path4k = (outDir / (base + " - 4k" + ext)).string();
    paths.path1080p = (outDir / (base + " - 1080p" + ext)).string();
    return paths;
}

void OutputManager::ensureDirectory(const std::string &dir) const
{
    std::vector<fs::path> created;
    fs::path current = normalized(dir);
    std::error_code ec;
    while (!current.empty() && !fs::exists(current, ec))
    {
        created.push_back(current);
        if (current == current.parent_path())
            break;
        current = current.parent_path();
    }

    if (!fs::create_directories(normalized(dir), ec) && ec)
        throw FilesystemError("cannot create directory " + dir + ": " + ec.message());

    for (auto it = created.rbegin(); it != created.rend(); ++it)
        normalizePermissions(it->string());
}

void OutputManager::publish(const std::string &tempPath, const std::string &finalPath) const
{
    const int err = place_no_replace(tempPath, finalPath);
    if (err == EXDEV)
    {
        copyAcross(tempPath, finalPath);
        return;
    }
    if (err == EEXIST)
        throw FilesystemError("cannot publish " + tempPath + ": " + finalPath + " already exists");
    if (err != 0)
        throw FilesystemError("cannot move " + tempPath + " to " + finalPath + ": " + std::strerror(err));

    std::error_code ec;
    if (!fs::remove(tempPath, ec) && ec)
        LOG_WARN("Published %s but could not remove %s: %s", finalPath.c_str(), tempPath.c_str(),
                 ec.message().c_str());
    LOG_VERBOSE("[MOVE] %s -> %s", tempPath.c_str(), finalPath.c_str());
}

void OutputManager::copyAcross(const std::string &tempPath, const std::string &finalPath) const
{
    // Stage beside the destination under the temp prefix, so a crash mid-copy
    // leaves something the startup sweep of the output tree removes
    const std::string staging = m_temps.createIn(fs::path(finalPath).parent_path().string(), ".partial");
    std::error_code ec;
    fs::copy_file(tempPath, staging, fs::copy_options::overwrite_existing, ec);
    if (ec)
    {
        m_temps.discard(staging);
        throw FilesystemError("cannot copy " + tempPath + " to " + staging + ": " + ec.message());
    }

    const int err = place_no_replace(staging, finalPath);
    m_temps.discard(staging);
    if (err == EEXIST)
        throw FilesystemError("cannot publish " + tempPath + ": " + finalPath + " already exists");
    if (err != 0)
        throw FilesystemError("cannot move " + staging + " to " + finalPath + ": " + std::strerror(err));

    if (!fs::remove(tempPath, ec) && ec)
        LOG_WARN("Published %s but could not remove %s: %s", finalPath.c_str(), tempPath.c_str(),
                 ec.message().c_str());
    LOG_VERBOSE("[COPY] %s -> %s", tempPath.c_str(), finalPath.c_str());
}

void OutputManager::moveSource(const std::string &sourcePath, const std::string &finalPath) const
{
    LOG_INFO("[MOVE] %s -> %s", sourcePath.c_str(), finalPath.c_str());
    publish(sourcePath, finalPath);
}

void OutputManager::removeSourceAndPrune(const std::string &sourcePath) const
{
    std::error_code ec;
    if (!fs::remove(sourcePath, ec) && ec)
    {
        LOG_ERROR("Failed to remove original %s: %s", sourcePath.c_str(), ec.message().c_str());
        return;
    }
    LOG_INFO("Cleaned up original file: %s", sourcePath.c_str());

    const fs::path root = fs::path(m_watchRoot);
    fs::path parent = normalized(sourcePath).parent_path();
    while (!relative_under(root, parent).empty() && parent != root)
    {
        if (!fs::is_directory(parent, ec) || !fs::is_empty(parent, ec))
            break;
        if (!fs::remove(parent, ec))
        {
            LOG_DEBUG("Error removing directory '%s': %s", parent.c_str(), ec.message().c_str());
            break;
        }
        LOG_VERBOSE("Removed empty directory %s", parent.c_str());
        parent = parent.parent_path();
    }
}

void OutputManager::normalizePermissions(const std::string &path) const
{
    std::error_code ec;
    const bool isDir = fs::is_directory(path, ec);
    const mode_t mode = isDir ? 0755 : 0644;
    if (chmod(path.c_str(), mode) != 0)
        LOG_WARN("chmod %o %s failed: %s", static_cast<unsigned>(mode), path.c_str(), std::strerror(errno));

    if (m_ownership.uid < 0 && m_ownership.gid < 0)
        return;
    const uid_t uid = m_ownership.uid < 0 ? static_cast<uid_t>(-1) : static_cast<uid_t>(m_ownership.uid);
    const gid_t gid = m_ownership.gid < 0 ? static_cast<gid_t>(-1) : static_cast<gid_t>(m_ownership.gid);
    if (chown(path.c_str(), uid, gid) != 0)
        LOG_WARN("chown %d:%d %s failed: %s", m_ownership.uid, m_ownership.gid, path.c_str(), std::strerror(errno));
}
