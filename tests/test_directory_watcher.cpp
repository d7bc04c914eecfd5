#include <gtest/gtest.h>

#include <chrono>
#include <set>
#include <string>

#include "channel.h"
#include "directory_watcher.h"
#include "temp_files.h"
#include "test_support.h"

using namespace testing_support;

namespace
{
    // Pop events until every expected path was seen or the deadline passes
    std::set<std::string> collect(Channel<std::string> &events, const std::set<std::string> &expected)
    {
        std::set<std::string> seen;
        const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
        while (std::chrono::steady_clock::now() < deadline)
        {
            std::optional<std::string> path = events.popFor(std::chrono::milliseconds(100));
            if (path)
                seen.insert(*path);

            bool all = true;
            for (const auto &p : expected)
                all = all && seen.count(p);
            if (all)
                break;
        }
        return seen;
    }
}

TEST(DirectoryWatcher, reportsNewFiles)
{
    TempDir dir;
    Channel<std::string> events(64);
    DirectoryWatcher watcher(dir.str(), events);
    ASSERT_TRUE(watcher.start());

    const std::string temp = dir / (std::string(kTempFilePrefix) + "1_1.mkv");
    const std::string film = dir / "Film.mkv";
    write_file(temp, "scratch");
    write_file(film, "video");

    const std::set<std::string> seen = collect(events, {film});
    watcher.stop();

    EXPECT_EQ(seen.count(film), 1u);
    EXPECT_EQ(seen.count(temp), 0u);
}

TEST(DirectoryWatcher, watchesDirectoriesCreatedLater)
{
    TempDir dir;
    Channel<std::string> events(64);
    DirectoryWatcher watcher(dir.str(), events);
    ASSERT_TRUE(watcher.start());

    // the file may land before the new directory is watched; the directory scan catches it
    const std::string early = dir / "Show/Season 1/ep1.mkv";
    write_file(early, "video");
    const std::set<std::string> first = collect(events, {early});
    EXPECT_EQ(first.count(early), 1u);

    // once watched, later files in the nested directory arrive as events
    const std::string later = dir / "Show/Season 1/ep2.mkv";
    write_file(later, "video");
    const std::set<std::string> second = collect(events, {later});
    watcher.stop();

    EXPECT_EQ(second.count(later), 1u);
}

TEST(DirectoryWatcher, existingSubdirectoriesAreWatched)
{
    TempDir dir;
    fs::create_directories(dir / "Movies/Film");
    Channel<std::string> events(64);
    DirectoryWatcher watcher(dir.str(), events);
    ASSERT_TRUE(watcher.start());

    const std::string film = dir / "Movies/Film/Film.mkv";
    write_file(film, "video");
    const std::set<std::string> seen = collect(events, {film});
    watcher.stop();

    EXPECT_EQ(seen.count(film), 1u);
}
