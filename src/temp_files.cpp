#include "temp_files.h"
#include "logger.h"
#include "utils.h"

#include <filesystem>
#include <system_error>
#include <utility>
#include <vector>

#include <unistd.h>

namespace fs = std::filesystem;

namespace
{
    template <typename Iterator>
    size_t remove_stale(Iterator it)
    {
        // Collect first, removing while iterating would invalidate the iterator
        std::vector<fs::path> stale;
        std::error_code ec;
        for (const Iterator end{}; it != end; it.increment(ec))
        {
            if (ec)
                break;
            std::error_code type_ec;
            if (!it->is_regular_file(type_ec))
                continue;
            if (startsWith(it->path().filename().string(), kTempFilePrefix))
                stale.push_back(it->path());
        }

        size_t removed = 0;
        for (const auto &path : stale)
        {
            if (fs::remove(path, ec))
            {
                LOG_VERBOSE("Removed stale temp file %s", path.c_str());
                ++removed;
            }
            else if (ec)
            {
                LOG_WARN("Failed to remove stale temp file %s: %s", path.c_str(), ec.message().c_str());
            }
        }
        return removed;
    }
}

TempFileRegistry::TempFileRegistry(std::string directory)
    : m_directory(std::move(directory))
{
    if (m_directory.empty())
    {
        std::error_code ec;
        m_directory = fs::temp_directory_path(ec).string();
        if (ec)
            m_directory = "/tmp";
    }
}

std::string TempFileRegistry::create(const std::string &extension)
{
    return createIn(m_directory, extension);
}

std::string TempFileRegistry::createIn(const std::string &directory, const std::string &extension)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    std::string name = std::string(kTempFilePrefix) + std::to_string(static_cast<long>(getpid())) + "_" +
                       std::to_string(++m_counter) + extension;
    std::string path = (fs::path(directory) / name).string();
    m_files.push_back(path);
    return path;
}

void TempFileRegistry::registerFile(const std::string &path)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_files.push_back(path);
}

void TempFileRegistry::discard(const std::string &path) const
{
    std::error_code ec;
    if (fs::remove(path, ec))
        LOG_DEBUG("Removed temp file %s", path.c_str());
    else if (ec)
        LOG_WARN("Failed to remove temp file %s: %s", path.c_str(), ec.message().c_str());
}

size_t TempFileRegistry::removeAll()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    size_t removed = 0;
    for (const auto &path : m_files)
    {
        std::error_code ec;
        if (fs::remove(path, ec))
            ++removed;
        else if (ec)
            LOG_WARN("Failed to remove temp file %s: %s", path.c_str(), ec.message().c_str());
    }
    if (removed > 0)
        LOG_INFO("Removed %zu temporary file(s)", removed);
    return removed;
}

size_t TempFileRegistry::sweepStale(const std::string &directory, bool recursive)
{
    std::error_code ec;
    if (recursive)
    {
        fs::recursive_directory_iterator it(directory, fs::directory_options::skip_permission_denied, ec);
        if (ec)
        {
            LOG_WARN("Cannot sweep %s: %s", directory.c_str(), ec.message().c_str());
            return 0;
        }
        return remove_stale(it);
    }

    fs::directory_iterator it(directory, ec);
    if (ec)
    {
        LOG_WARN("Cannot sweep temp directory %s: %s", directory.c_str(), ec.message().c_str());
        return 0;
    }
    return remove_stale(it);
}

std::vector<std::string> TempFileRegistry::files() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_files;
}
