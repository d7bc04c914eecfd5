#include <gtest/gtest.h>

#include <sys/stat.h>

#include "errors.h"
#include "output_manager.h"
#include "test_support.h"

using namespace testing_support;

namespace
{
    OwnershipPolicy keep_owner()
    {
        return OwnershipPolicy{-1, -1};
    }

    unsigned mode_of(const std::string &path)
    {
        struct stat st;
        if (stat(path.c_str(), &st) != 0)
            return 0;
        return st.st_mode & 0777;
    }
}

TEST(OutputManager, derivesMirroredPaths)
{
    TempFileRegistry temps("/tmp");
    const OutputManager outputs("/watch_dir", "/output_dir", keep_owner(), temps);

    const OutputPaths nested = outputs.deriveOutputPaths("/watch_dir/Movies/Film (2020)/Film (2020) - 4k.mkv");
    EXPECT_EQ(nested.outputDir, "/output_dir/Movies/Film (2020)");
    EXPECT_EQ(nested.path4k, "/output_dir/Movies/Film (2020)/Film (2020) - 4k.mkv");
    EXPECT_EQ(nested.path1080p, "/output_dir/Movies/Film (2020)/Film (2020) - 1080p.mkv");

    const OutputPaths top = outputs.deriveOutputPaths("/watch_dir/clip.mp4");
    EXPECT_EQ(top.outputDir, "/output_dir");
    EXPECT_EQ(top.path1080p, "/output_dir/clip - 1080p.mp4");
}

TEST(OutputManager, trailingSeparatorsOnRoots)
{
    TempFileRegistry temps("/tmp");
    const OutputManager outputs("/watch_dir/", "/output_dir/", keep_owner(), temps);
    EXPECT_EQ(outputs.deriveOutputPaths("/watch_dir/a/b.mkv").path4k, "/output_dir/a/b - 4k.mkv");
}

TEST(OutputManager, rejectsPathsOutsideWatchRoot)
{
    TempFileRegistry temps("/tmp");
    const OutputManager outputs("/watch_dir", "/output_dir", keep_owner(), temps);
    EXPECT_THROW(outputs.deriveOutputPaths("/elsewhere/a.mkv"), FilesystemError);
    EXPECT_THROW(outputs.deriveOutputPaths("/watch_dir/../a.mkv"), FilesystemError);
    EXPECT_THROW(outputs.deriveOutputPaths("/watch_dir"), FilesystemError);
}

TEST(OutputManager, ensureDirectoryNormalisesNewDirectories)
{
    TempDir dir;
    TempFileRegistry temps(dir / "tmp");
    const OutputManager outputs(dir / "watch", dir / "out", keep_owner(), temps);
    const std::string nested = dir / "out/a/b";

    outputs.ensureDirectory(nested);
    EXPECT_TRUE(fs::is_directory(nested));
    EXPECT_EQ(mode_of(nested), 0755u);
    EXPECT_EQ(mode_of(dir / "out/a"), 0755u);

    // existing directories are fine
    EXPECT_NO_THROW(outputs.ensureDirectory(nested));
}

TEST(OutputManager, publishMovesTempFile)
{
    TempDir dir;
    TempFileRegistry temps(dir / "tmp");
    const OutputManager outputs(dir / "watch", dir / "out", keep_owner(), temps);
    const std::string temp = dir / "tmp/vscaler_1_1.mkv";
    const std::string finalPath = dir / "out/a - 1080p.mkv";
    write_file(temp, "encoded");
    fs::create_directories(dir / "out");

    outputs.publish(temp, finalPath);
    EXPECT_FALSE(fs::exists(temp));
    EXPECT_EQ(read_file(finalPath), "encoded");
}

TEST(OutputManager, publishFailureIsReported)
{
    TempDir dir;
    TempFileRegistry temps(dir / "tmp");
    const OutputManager outputs(dir / "watch", dir / "out", keep_owner(), temps);
    EXPECT_THROW(outputs.publish(dir / "missing.mkv", dir / "out/a.mkv"), FilesystemError);
}

TEST(OutputManager, normalizePermissions)
{
    TempDir dir;
    TempFileRegistry temps(dir / "tmp");
    const OutputManager outputs(dir / "watch", dir / "out", keep_owner(), temps);
    const std::string file = dir / "f.mkv";
    write_file(file, "x");
    chmod(file.c_str(), 0600);

    outputs.normalizePermissions(file);
    EXPECT_EQ(mode_of(file), 0644u);
}

TEST(OutputManager, removeSourcePrunesEmptyParents)
{
    TempDir dir;
    const std::string watch = dir / "watch";
    TempFileRegistry temps(dir / "tmp");
    const OutputManager outputs(watch, dir / "out", keep_owner(), temps);

    const std::string source = dir / "watch/Show/Season 1/ep1.mkv";
    const std::string sibling = dir / "watch/Show/extras.txt";
    write_file(source, "x");
    write_file(sibling, "x");

    outputs.removeSourceAndPrune(source);
    EXPECT_FALSE(fs::exists(source));
    EXPECT_FALSE(fs::exists(dir / "watch/Show/Season 1"));
    // stops at the first non-empty directory
    EXPECT_TRUE(fs::exists(dir / "watch/Show"));

    fs::remove(sibling);
    const std::string lone = dir / "watch/Other/ep.mkv";
    write_file(lone, "x");
    outputs.removeSourceAndPrune(lone);
    EXPECT_FALSE(fs::exists(dir / "watch/Other"));
    // the watch root itself is never removed
    EXPECT_TRUE(fs::is_directory(watch));
}

TEST(OutputManager, publishNeverReplacesExistingOutput)
{
    TempDir dir;
    TempFileRegistry temps(dir / "tmp");
    const OutputManager outputs(dir / "watch", dir / "out", keep_owner(), temps);
    const std::string temp = dir / "tmp/vscaler_1_1.mkv";
    const std::string finalPath = dir / "out/a - 1080p.mkv";
    write_file(temp, "second");
    write_file(finalPath, "first");

    EXPECT_THROW(outputs.publish(temp, finalPath), FilesystemError);
    EXPECT_EQ(read_file(finalPath), "first");
    EXPECT_TRUE(fs::exists(temp));
}

TEST(OutputManager, claimsAreExclusiveUntilReleased)
{
    TempDir dir;
    TempFileRegistry temps(dir / "tmp");
    OutputManager outputs(dir / "watch", dir / "out", keep_owner(), temps);
    const std::string target = dir / "out/Film - 1080p.mkv";

    {
        OutputClaims first(outputs);
        ASSERT_TRUE(first.add(target));

        OutputClaims second(outputs);
        EXPECT_FALSE(second.add(target));
        EXPECT_FALSE(second.add(dir / "out/./Film - 1080p.mkv"));
        EXPECT_TRUE(second.add(dir / "out/Film - 4k.mkv"));
    }

    OutputClaims later(outputs);
    EXPECT_TRUE(later.add(target));
}
