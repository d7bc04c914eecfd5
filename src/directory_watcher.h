#pragma once

#include <atomic>
#include <map>
#include <string>
#include <thread>

#include "channel.h"

/**
 * inotify watch over a directory tree
 *
 * A background thread turns create/modify/move-in/close-write events into
 * file paths on the event channel. Directories appearing later are watched
 * and scanned as they arrive.
 */
class DirectoryWatcher
{
public:
    DirectoryWatcher(std::string root, Channel<std::string> &events);
    ~DirectoryWatcher();

    DirectoryWatcher(const DirectoryWatcher &) = delete;
    DirectoryWatcher &operator=(const DirectoryWatcher &) = delete;

    // Set up the watches and start the thread. Returns false if inotify is unavailable.
    bool start();
    void stop();

private:
    void watchLoop();
    void addWatchRecursive(const std::string &dir);
    void addWatch(const std::string &dir);

    std::string m_root;
    Channel<std::string> &m_events;
    int m_fd = -1;
    std::map<int, std::string> m_watches; // watch descriptor -> directory, watcher thread only after start
    std::atomic<bool> m_running{false};
    std::thread m_thread;
};
