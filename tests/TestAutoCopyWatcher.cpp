#include <gtest/gtest.h>

#include "AutoCopyWatcher.hpp"
#include "TestHelpers.hpp"

using namespace TestSupport;

namespace
{
    class AutoCopyWatcherTest : public ::testing::Test
    {
    protected:
        TestEnvironment Env;
        FS::path Media = Env.Dir / "media";
        FS::path Nas = Env.Dir / "nas";

        void SetUp() override
        {
            FS::create_directories(Media);
            Env.Config.AutoCopy.Enabled = true;
            Env.Config.AutoCopy.WatchPaths = { Media.string() };
            Env.Config.AutoCopy.TargetPath = Nas.string();
        }
    };
}

TEST_F(AutoCopyWatcherTest, DiscoversVisibleMountDirectories)
{
    FS::create_directories(Media / "SD_CARD");
    FS::create_directories(Media / "GOPRO");
    FS::create_directories(Media / ".Trashes");
    WriteFile(Media / "stray.txt", "x");
    Env.Config.AutoCopy.WatchPaths.push_back((Env.Dir / "not-there").string());

    AutoCopyWatcher Watcher(Env.Context());
    auto Sources = Watcher.DiscoverSources();

    ASSERT_EQ(Sources.size(), 2u);
    EXPECT_EQ(Sources[0].filename(), "GOPRO");
    EXPECT_EQ(Sources[1].filename(), "SD_CARD");
}

TEST_F(AutoCopyWatcherTest, DeviceCopiedOnlyOnce)
{
    WriteFile(Media / "SD_CARD" / "clip.mp4", "video");
    SetMTime(Media / "SD_CARD" / "clip.mp4", 2024, 3, 1);
    WriteFile(Media / "SD_CARD" / "notes.txt", "text");

    AutoCopyWatcher Watcher(Env.Context());
    ASSERT_TRUE(Watcher.PollOnce());
    EXPECT_TRUE(FS::is_directory(Nas));
    EXPECT_EQ(RegularFilesUnder(Nas).size(), 2u);
    EXPECT_EQ(Watcher.Processed().Size(), 2u);
    EXPECT_TRUE(FS::exists(Env.Config.BaseDir / AutoCopyWatcher::ProcessedFileName));

    ASSERT_TRUE(Watcher.PollOnce());
    EXPECT_EQ(RegularFilesUnder(Nas).size(), 2u);
}

TEST_F(AutoCopyWatcherTest, DisabledWatcherExitsCleanly)
{
    Env.Config.AutoCopy.Enabled = false;
    AutoCopyWatcher Watcher(Env.Context());
    EXPECT_EQ(Watcher.Run(), 0);
}

TEST_F(AutoCopyWatcherTest, MissingTargetIsFatal)
{
    Env.Config.AutoCopy.TargetPath = "  ";
    AutoCopyWatcher Watcher(Env.Context());
    EXPECT_FALSE(Watcher.PollOnce());
    EXPECT_EQ(Watcher.Run(), 1);
}
