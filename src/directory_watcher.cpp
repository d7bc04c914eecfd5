#include "directory_watcher.h"
#include "directory_scanner.h"
#include "logger.h"
#include "temp_files.h"
#include "utils.h"

#include <cerrno>
#include <cstring>
#include <filesystem>
#include <set>
#include <system_error>
#include <utility>
#include <vector>

#include <poll.h>
#include <sys/inotify.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace
{
    constexpr uint32_t kWatchMask = IN_CREATE | IN_MODIFY | IN_MOVED_TO | IN_CLOSE_WRITE;
    constexpr int kPollTimeoutMs = 500;
}

DirectoryWatcher::DirectoryWatcher(std::string root, Channel<std::string> &events)
    : m_root(std::move(root)), m_events(events)
{
}

DirectoryWatcher::~DirectoryWatcher()
{
    stop();
}

bool DirectoryWatcher::start()
{
    if (m_running.exchange(true))
    {
        LOG_WARN("DirectoryWatcher already running");
        return false;
    }

    m_fd = inotify_init1(IN_NONBLOCK | IN_CLOEXEC);
    if (m_fd < 0)
    {
        LOG_ERROR("inotify_init1 failed: %s", std::strerror(errno));
        m_running = false;
        return false;
    }

    addWatchRecursive(m_root);
    m_thread = std::thread([this]()
                           { this->watchLoop(); });

    LOG_VERBOSE("Watching %s (%zu directories)", m_root.c_str(), m_watches.size());
    return true;
}

void DirectoryWatcher::stop()
{
    // The thread may already have cleared m_running itself
    m_running = false;
    if (m_thread.joinable())
        m_thread.join();

    if (m_fd >= 0)
    {
        close(m_fd);
        m_fd = -1;
    }
    m_watches.clear();
    LOG_DEBUG("DirectoryWatcher stopped");
}

void DirectoryWatcher::addWatch(const std::string &dir)
{
    int wd = inotify_add_watch(m_fd, dir.c_str(), kWatchMask);
    if (wd < 0)
    {
        LOG_WARN("Cannot watch %s: %s", dir.c_str(), std::strerror(errno));
        return;
    }
    m_watches[wd] = dir;
}

void DirectoryWatcher::addWatchRecursive(const std::string &dir)
{
    addWatch(dir);

    std::error_code ec;
    fs::recursive_directory_iterator it(dir, fs::directory_options::skip_permission_denied, ec);
    if (ec)
        return;
    for (const fs::recursive_directory_iterator end{}; it != end; it.increment(ec))
    {
        if (ec)
            break;
        std::error_code type_ec;
        if (it->is_directory(type_ec))
            addWatch(it->path().string());
    }
}

void DirectoryWatcher::watchLoop()
{
    LOG_DEBUG("DirectoryWatcher thread started");

    alignas(inotify_event) char buf[16 * 1024];
    while (m_running)
    {
        pollfd pfd{m_fd, POLLIN, 0};
        int ready = poll(&pfd, 1, kPollTimeoutMs);
        if (ready < 0)
        {
            if (errno == EINTR)
                continue;
            LOG_ERROR("poll on inotify failed: %s", std::strerror(errno));
            break;
        }
        if (ready == 0)
            continue;

        ssize_t len = read(m_fd, buf, sizeof(buf));
        if (len <= 0)
        {
            if (len < 0 && errno != EAGAIN && errno != EINTR)
            {
                LOG_ERROR("read on inotify failed: %s", std::strerror(errno));
                break;
            }
            continue;
        }

        // One batch can carry many events for the same file
        std::set<std::string> files;
        std::vector<std::string> newDirs;
        for (char *ptr = buf; ptr < buf + len;)
        {
            const inotify_event *event = reinterpret_cast<const inotify_event *>(ptr);
            ptr += sizeof(inotify_event) + event->len;

            if (event->mask & IN_Q_OVERFLOW)
            {
                LOG_WARN("inotify queue overflow, relying on the periodic rescan");
                continue;
            }
            if (event->mask & IN_IGNORED)
            {
                m_watches.erase(event->wd);
                continue;
            }

            auto dir = m_watches.find(event->wd);
            if (dir == m_watches.end() || event->len == 0)
                continue;

            const std::string name = event->name;
            if (startsWith(name, kTempFilePrefix))
                continue;
            const std::string path = (fs::path(dir->second) / name).string();

            if (event->mask & IN_ISDIR)
            {
                if (event->mask & (IN_CREATE | IN_MOVED_TO))
                    newDirs.push_back(path);
                continue;
            }
            files.insert(path);
        }

        for (const auto &dir : newDirs)
        {
            LOG_VERBOSE("New directory %s", dir.c_str());
            addWatchRecursive(dir);
            for (const auto &file : scan_directory(dir))
                files.insert(file);
        }

        for (const auto &file : files)
        {
            LOG_DEBUG("Change event: %s", file.c_str());
            if (!m_events.push(file))
            {
                LOG_DEBUG("Event channel closed, watcher exiting");
                m_running = false;
                break;
            }
        }
    }

    LOG_DEBUG("DirectoryWatcher thread exiting");
}
