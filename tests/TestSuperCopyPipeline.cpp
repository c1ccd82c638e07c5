#include <gtest/gtest.h>

#include <stdexcept>
#include <utility>
#include <vector>

#include "StringUtils.hpp"
#include "SuperCopyPipeline.hpp"
#include "TestHelpers.hpp"

using namespace TestSupport;

namespace
{
    struct ProgressEvent
    {
        ProgressPhase Phase;
        std::string Message;
        size_t Current;
        size_t Total;
    };

    class RecordingObserver : public ProgressObserver
    {
    public:
        std::vector<ProgressEvent> Events;

        void OnProgress(ProgressPhase Phase, const std::string& Message, size_t Current, size_t Total) override
        {
            Events.push_back({ Phase, Message, Current, Total });
        }

        size_t CountOf(ProgressPhase Phase) const
        {
            size_t Count = 0;
            for (const auto& Event : Events)
            {
                Count += Event.Phase == Phase ? 1 : 0;
            }
            return Count;
        }
    };

    // Corrupts the destination between the copy and its verification.
    class TamperingObserver : public ProgressObserver
    {
    public:
        explicit TamperingObserver(FS::path Destination) : Destination(std::move(Destination)) {}

        void OnProgress(ProgressPhase Phase, const std::string&, size_t, size_t) override
        {
            if (Phase == ProgressPhase::HashDestination && FS::exists(Destination))
            {
                std::ofstream File(Destination, std::ios::binary | std::ios::app);
                File << "tampered";
            }
            if (Phase == ProgressPhase::VerifyFail)
            {
                ++Failures;
            }
        }

        FS::path Destination;
        int Failures = 0;
    };

    // Removes a source file just before it is hashed.
    class VanishingSourceObserver : public ProgressObserver
    {
    public:
        explicit VanishingSourceObserver(FS::path Victim) : Victim(std::move(Victim)) {}

        void OnProgress(ProgressPhase Phase, const std::string& Message, size_t, size_t) override
        {
            if (Phase == ProgressPhase::HashSource && Message == PathToUtf8(Victim.filename()))
            {
                FS::remove(Victim);
            }
        }

    private:
        FS::path Victim;
    };

    // Puts a directory where the named file is about to be written.
    class BlockedDestinationObserver : public ProgressObserver
    {
    public:
        BlockedDestinationObserver(std::string Name, FS::path Destination) : Name(std::move(Name)), Destination(std::move(Destination)) {}

        void OnProgress(ProgressPhase Phase, const std::string& Message, size_t, size_t) override
        {
            if (Phase == ProgressPhase::Copy && Message == Name)
            {
                FS::create_directories(Destination);
            }
        }

    private:
        std::string Name;
        FS::path Destination;
    };

    class ThrowingObserver : public ProgressObserver
    {
    public:
        void OnProgress(ProgressPhase, const std::string&, size_t, size_t) override
        {
            throw std::runtime_error("display went away");
        }
    };

    class SuperCopyPipelineTest : public ::testing::Test
    {
    protected:
        TestEnvironment Env;
        FS::path Source = Env.Dir / "card";
        FS::path Target = Env.Dir / "nas";

        void SetUp() override
        {
            FS::create_directories(Source);
        }

        void AddFile(const std::string& Name, const std::string& Content = "data")
        {
            WriteFile(Source / Utf8Path(Name), Content);
            SetMTime(Source / Utf8Path(Name), 2024, 3, 1);
        }

        FS::path VideoDestination() const
        {
            return Target / "2024-03-01" / Utf8Path("视频") / Utf8Path("未知设备") / Utf8Path("未知设备_2024-03-01.mp4");
        }
    };
}

TEST_F(SuperCopyPipelineTest, MediaVerifiedAndOtherFilesOverflow)
{
    AddFile("clip.mp4", "video payload");
    AddFile("notes.txt", "hello");

    SuperCopyPipeline Pipeline(Env.Context());
    CopyStats Stats = Pipeline.SuperCopy(Source, Target, false);

    EXPECT_TRUE(Stats.SourceValid);
    EXPECT_EQ(Stats.Ok, 2u);
    EXPECT_EQ(Stats.Fail, 0u);
    EXPECT_EQ(Stats.Skip, 0u);
    ASSERT_EQ(Stats.Report.MediaOk.size(), 1u);
    ASSERT_EQ(Stats.Report.OtherOk.size(), 1u);
    EXPECT_EQ(Stats.Report.OtherOk[0], "notes.txt");

    EXPECT_EQ(ReadFile(VideoDestination()), "video payload");
    EXPECT_EQ(ReadFile(Target / Utf8Path("其他文件") / "notes.txt"), "hello");
    EXPECT_EQ(ReadFile(Source / "clip.mp4"), "video payload");
    EXPECT_EQ(ReadFile(Source / "notes.txt"), "hello");

    auto Json = Stats.ToJson();
    EXPECT_EQ(Json["ok"], 2);
    EXPECT_EQ(Json["report"]["other_ok"][0], "notes.txt");
}

TEST_F(SuperCopyPipelineTest, CopyKeepsModificationTime)
{
    AddFile("clip.mp4");

    SuperCopyPipeline Pipeline(Env.Context());
    Pipeline.SuperCopy(Source, Target, false);

    EXPECT_EQ(ToTimeT(FS::last_write_time(VideoDestination())), ToTimeT(FS::last_write_time(Source / "clip.mp4")));
}

TEST_F(SuperCopyPipelineTest, RelatedFilesCopiedWithUnifiedName)
{
    AddFile("clip.mp4", "video");
    AddFile("clip.srt", "subtitles");

    SuperCopyPipeline Pipeline(Env.Context());
    CopyStats Stats = Pipeline.SuperCopy(Source, Target, false);

    EXPECT_EQ(Stats.Ok, 2u);
    EXPECT_EQ(Stats.Report.MediaOk.size(), 2u);
    EXPECT_TRUE(Stats.Report.OtherOk.empty());
    EXPECT_EQ(ReadFile(VideoDestination().replace_extension(".srt")), "subtitles");
}

TEST_F(SuperCopyPipelineTest, ProgressIsMonotonicAndPhased)
{
    AddFile("clip.mp4");
    AddFile("clip.srt");
    AddFile("notes.txt");

    RecordingObserver Observer;
    SuperCopyPipeline Pipeline(Env.Context());
    Pipeline.SuperCopy(Source, Target, false, &Observer);

    ASSERT_FALSE(Observer.Events.empty());
    EXPECT_EQ(Observer.Events.front().Phase, ProgressPhase::Progress);
    EXPECT_EQ(Observer.Events.front().Current, 0u);
    EXPECT_EQ(Observer.Events.front().Total, 2u);

    size_t LastCurrent = 0;
    size_t LastTotal = 0;
    for (const auto& Event : Observer.Events)
    {
        EXPECT_GE(Event.Current, LastCurrent);
        EXPECT_GE(Event.Total, LastTotal);
        EXPECT_LE(Event.Current, Event.Total);
        LastCurrent = Event.Current;
        LastTotal = Event.Total;
    }
    EXPECT_EQ(LastCurrent, 3u);
    EXPECT_EQ(LastTotal, 3u);

    EXPECT_EQ(Observer.CountOf(ProgressPhase::HashSource), 2u);
    EXPECT_EQ(Observer.CountOf(ProgressPhase::Copy), 2u);
    EXPECT_EQ(Observer.CountOf(ProgressPhase::HashDestination), 2u);
    EXPECT_EQ(Observer.CountOf(ProgressPhase::VerifyOk), 2u);
    EXPECT_EQ(Observer.CountOf(ProgressPhase::VerifyFail), 0u);

    std::vector<ProgressPhase> FirstCopy;
    for (const auto& Event : Observer.Events)
    {
        if (Event.Phase != ProgressPhase::Progress)
        {
            FirstCopy.push_back(Event.Phase);
        }
        if (Event.Phase == ProgressPhase::VerifyOk)
        {
            break;
        }
    }
    EXPECT_EQ(FirstCopy, (std::vector<ProgressPhase>{ ProgressPhase::HashSource, ProgressPhase::Copy, ProgressPhase::HashDestination, ProgressPhase::VerifyOk }));
}

TEST_F(SuperCopyPipelineTest, MismatchRemovesDestination)
{
    AddFile("clip.mp4", "video payload");

    TamperingObserver Observer(VideoDestination());
    SuperCopyPipeline Pipeline(Env.Context());
    CopyStats Stats = Pipeline.SuperCopy(Source, Target, false, &Observer);

    EXPECT_EQ(Stats.Fail, 1u);
    ASSERT_EQ(Stats.Report.MediaFail.size(), 1u);
    EXPECT_NE(Stats.Report.MediaFail[0].second.find("hash mismatch"), std::string::npos);
    EXPECT_EQ(Observer.Failures, 1);
    EXPECT_FALSE(FS::exists(VideoDestination()));
    EXPECT_EQ(ReadFile(Source / "clip.mp4"), "video payload");
}

TEST_F(SuperCopyPipelineTest, UnreadableSourceFailsAndRunContinues)
{
    AddFile("a.mp4", "first");
    AddFile("b.mp4", "second");

    VanishingSourceObserver Observer(Source / "a.mp4");
    SuperCopyPipeline Pipeline(Env.Context());
    CopyStats Stats = Pipeline.SuperCopy(Source, Target, false, &Observer);

    EXPECT_EQ(Stats.Fail, 1u);
    ASSERT_EQ(Stats.Report.MediaFail.size(), 1u);
    EXPECT_EQ(FS::path(Stats.Report.MediaFail[0].first).filename().string(), "a.mp4");
    EXPECT_EQ(Stats.Report.MediaFail[0].second.rfind("source hash failed", 0), 0u);
    ASSERT_EQ(Stats.Report.MediaOk.size(), 1u);
    EXPECT_EQ(FS::path(Stats.Report.MediaOk[0].first).filename().string(), "b.mp4");
    EXPECT_EQ(RegularFilesUnder(Target / "2024-03-01").size(), 1u);
    EXPECT_EQ(ReadFile(VideoDestination()), "second");
}

TEST_F(SuperCopyPipelineTest, UnwritableDestinationFailsAndRunContinues)
{
    AddFile("a.mp4", "first");
    AddFile("b.mp4", "second");

    BlockedDestinationObserver Observer("a.mp4", VideoDestination());
    SuperCopyPipeline Pipeline(Env.Context());
    CopyStats Stats = Pipeline.SuperCopy(Source, Target, false, &Observer);

    EXPECT_EQ(Stats.Fail, 1u);
    ASSERT_EQ(Stats.Report.MediaFail.size(), 1u);
    EXPECT_EQ(FS::path(Stats.Report.MediaFail[0].first).filename().string(), "a.mp4");
    EXPECT_EQ(Stats.Report.MediaFail[0].second.rfind("copy failed", 0), 0u);
    ASSERT_EQ(Stats.Report.MediaOk.size(), 1u);
    EXPECT_EQ(FS::path(Stats.Report.MediaOk[0].first).filename().string(), "b.mp4");
    EXPECT_EQ(RegularFilesUnder(Target / "2024-03-01").size(), 1u);
    EXPECT_TRUE(FS::is_regular_file(VideoDestination()));
    EXPECT_EQ(ReadFile(VideoDestination()), "second");
}

TEST_F(SuperCopyPipelineTest, UncreatableTargetIsReported)
{
    AddFile("clip.mp4");
    WriteFile(Env.Dir / "blocker", "regular file");

    SuperCopyPipeline Pipeline(Env.Context());
    CopyStats Stats = Pipeline.SuperCopy(Source, Env.Dir / "blocker" / "nas", false);

    EXPECT_TRUE(Stats.SourceValid);
    EXPECT_FALSE(Stats.TargetValid);
    EXPECT_EQ(Stats.Ok + Stats.Fail + Stats.Skip, 0u);
}

TEST_F(SuperCopyPipelineTest, ObserverExceptionsDoNotAbortCopy)
{
    AddFile("clip.mp4");

    ThrowingObserver Observer;
    SuperCopyPipeline Pipeline(Env.Context());
    CopyStats Stats = Pipeline.SuperCopy(Source, Target, false, &Observer);

    EXPECT_EQ(Stats.Ok, 1u);
    EXPECT_TRUE(FS::exists(VideoDestination()));
}

TEST_F(SuperCopyPipelineTest, DryRunWritesNothing)
{
    AddFile("clip.mp4");
    AddFile("notes.txt");

    SuperCopyPipeline Pipeline(Env.Context());
    CopyStats Stats = Pipeline.SuperCopy(Source, Target, true);

    EXPECT_EQ(Stats.Ok, 2u);
    EXPECT_EQ(Stats.Report.MediaOk.size(), 1u);
    EXPECT_EQ(Stats.Report.OtherOk.size(), 1u);
    EXPECT_FALSE(FS::exists(Target));
}

TEST_F(SuperCopyPipelineTest, TargetInsideSourceIsNotTraversed)
{
    Target = Source / "backup";
    AddFile("clip.mp4");
    AddFile("notes.txt");

    SuperCopyPipeline Pipeline(Env.Context());
    CopyStats First = Pipeline.SuperCopy(Source, Target, false);
    CopyStats Second = Pipeline.SuperCopy(Source, Target, false);

    EXPECT_EQ(First.Ok, 2u);
    EXPECT_EQ(Second.Ok, 2u);
    EXPECT_FALSE(FS::exists(Target / Utf8Path("其他文件") / "backup"));
}

TEST_F(SuperCopyPipelineTest, ProcessedSetSkipsEarlierCopies)
{
    AddFile("clip.mp4");
    AddFile("notes.txt");

    ProcessedSet Processed(Env.Config.BaseDir / "auto_copy_processed.json", Env.Log);
    SuperCopyPipeline Pipeline(Env.Context());
    CopyStats First = Pipeline.SuperCopy(Source, Target, false, nullptr, &Processed);
    EXPECT_EQ(First.Ok, 2u);
    EXPECT_TRUE(FS::exists(Processed.GetFilePath()));

    ProcessedSet Reloaded(Env.Config.BaseDir / "auto_copy_processed.json", Env.Log);
    ASSERT_TRUE(Reloaded.Load());
    CopyStats Second = Pipeline.SuperCopy(Source, Target, false, nullptr, &Reloaded);
    EXPECT_EQ(Second.Ok, 0u);
    EXPECT_EQ(Second.Skip, 1u);
    EXPECT_EQ(RegularFilesUnder(Target).size(), 2u);
}

TEST_F(SuperCopyPipelineTest, NoMediaStillCopiesOverflow)
{
    AddFile("docs/readme.txt", "text");
    AddFile("project.op", "stays");

    SuperCopyPipeline Pipeline(Env.Context());
    CopyStats Stats = Pipeline.SuperCopy(Source, Target, false);

    EXPECT_EQ(Stats.Ok, 1u);
    EXPECT_TRUE(FS::exists(Target / Utf8Path("其他文件") / "docs" / "readme.txt"));
    EXPECT_FALSE(FS::exists(Target / Utf8Path("其他文件") / "project.op"));
}

TEST_F(SuperCopyPipelineTest, InvalidSourceReported)
{
    SuperCopyPipeline Pipeline(Env.Context());
    CopyStats Stats = Pipeline.SuperCopy(Env.Dir / "missing", Target, false);

    EXPECT_FALSE(Stats.SourceValid);
    EXPECT_EQ(Stats.Ok + Stats.Fail + Stats.Skip, 0u);
    EXPECT_FALSE(FS::exists(Target));
}
