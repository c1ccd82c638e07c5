#include <gtest/gtest.h>

#include "PlacementResolver.hpp"
#include "StringUtils.hpp"
#include "TestHelpers.hpp"

using namespace TestSupport;

namespace
{
    std::tm Day(int Year, int Month, int DayOfMonth)
    {
        std::tm Value{};
        Value.tm_year = Year - 1900;
        Value.tm_mon = Month - 1;
        Value.tm_mday = DayOfMonth;
        Value.tm_hour = 12;
        Value.tm_isdst = -1;
        return Value;
    }

    MediaRecord Record(MediaKind Kind, const std::string& Device, const std::string& Date)
    {
        MediaRecord Result;
        Result.Kind = Kind;
        Result.Device = Device;
        Result.DateString = Date;
        return Result;
    }
}

TEST(PlacementResolver, TargetDirectoryLayout)
{
    TestEnvironment Env;
    PlacementResolver Resolver(Env.Context());
    const auto Out = Env.Dir / "out";

    EXPECT_EQ(Resolver.TargetDirectory(Record(MediaKind::Image, "Canon EOS R5", "2024-03-01"), Out),
        Out / "2024-03-01" / Utf8Path("图片") / "Canon EOS R5");
    EXPECT_EQ(Resolver.TargetDirectory(Record(MediaKind::PanoramicVideo, "Insta360", "2024-03-01"), Out),
        Out / "2024-03-01" / Utf8Path("全景视频") / "Insta360");
    EXPECT_EQ(Resolver.TargetDirectory(Record(MediaKind::Audio, "Zoom", "2024-03-01"), Out),
        Out / "2024-03-01" / Utf8Path("音频"));

    Env.Config.Folders.DeviceSubfolder = false;
    EXPECT_EQ(Resolver.TargetDirectory(Record(MediaKind::Video, "GoPro", "2024-03-01"), Out),
        Out / "2024-03-01" / Utf8Path("视频"));
}

TEST(PlacementResolver, DateDirectoryUsesFormatOrSentinel)
{
    TestEnvironment Env;
    PlacementResolver Resolver(Env.Context());

    EXPECT_EQ(Resolver.DateDirectory(Day(2024, 3, 1)), "2024-03-01");
    EXPECT_EQ(Resolver.DateDirectory(std::nullopt), "无日期");

    Env.Config.Folders.DateFormat = "%Y/%m";
    EXPECT_EQ(Resolver.DateDirectory(Day(2023, 12, 31)), "2023/12");
}

TEST(PlacementResolver, SanitizeFolderName)
{
    EXPECT_EQ(PlacementResolver::SanitizeFolderName("  a<b>:c|d  ", "X"), "a_b__c_d");
    EXPECT_EQ(PlacementResolver::SanitizeFolderName("   ", "X"), "X");
    EXPECT_EQ(PlacementResolver::SanitizeFolderName("", "未知设备"), "未知设备");

    std::string Long;
    for (int i = 0; i < 100; ++i)
    {
        Long += "相";
    }
    std::string Truncated = PlacementResolver::SanitizeFolderName(Long, "X");
    EXPECT_EQ(Truncated.size(), PlacementResolver::MaxFolderNameLength * 3);
}

TEST(PlacementResolver, UnifiedBaseName)
{
    TestEnvironment Env;
    PlacementResolver Resolver(Env.Context());

    EXPECT_EQ(Resolver.UnifiedBaseName("DJI Mini  3", "2024-03-01", "3840x2160", "30fps"), "DJI_Mini_3_2024-03-01_3840x2160_30fps");
    EXPECT_EQ(Resolver.UnifiedBaseName("", "", "", ""), "未知设备_无日期");
    EXPECT_EQ(Resolver.UnifiedBaseName("Sony", "2024-03-01", "", "25fps"), "Sony_2024-03-01_25fps");
    EXPECT_EQ(Resolver.UnifiedBaseName("<Cam>", "2024/03/01", "", ""), "Cam__2024_03_01");
}

TEST(PlacementResolver, CollisionsGetNumericSuffix)
{
    TestEnvironment Env;
    PlacementResolver Resolver(Env.Context());
    const auto Target = Env.Dir / "target";
    const auto Source = Env.Dir / "in" / "X.jpg";
    WriteFile(Source, "new");

    EXPECT_EQ(Resolver.ResolveDestination(Target, Source, std::nullopt), Target / "X.jpg");

    WriteFile(Target / "X.jpg", "old");
    EXPECT_EQ(Resolver.ResolveDestination(Target, Source, std::nullopt), Target / "X_1.jpg");

    WriteFile(Target / "X_1.jpg", "old");
    EXPECT_EQ(Resolver.ResolveDestination(Target, Source, std::nullopt), Target / "X_2.jpg");

    EXPECT_EQ(Resolver.ResolveDestination(Target, Source, std::string("Cam_2024-03-01")), Target / "Cam_2024-03-01.jpg");
}

TEST(PlacementResolver, SkipStrategyStillRenames)
{
    TestEnvironment Env;
    Env.Config.Duplicates = DuplicateStrategy::Skip;
    PlacementResolver Resolver(Env.Context());
    const auto Target = Env.Dir / "target";
    WriteFile(Target / "X.jpg", "old");

    EXPECT_EQ(Resolver.ResolveDestination(Target, Env.Dir / "X.jpg", std::nullopt), Target / "X_1.jpg");
}

TEST(PlacementResolver, OverwriteKeepsName)
{
    TestEnvironment Env;
    Env.Config.Duplicates = DuplicateStrategy::Overwrite;
    PlacementResolver Resolver(Env.Context());
    const auto Target = Env.Dir / "target";
    WriteFile(Target / "X.jpg", "old");

    EXPECT_EQ(Resolver.ResolveDestination(Target, Env.Dir / "X.jpg", std::nullopt), Target / "X.jpg");
}

TEST(PlacementResolver, SourceAlreadyAtCandidate)
{
    TestEnvironment Env;
    PlacementResolver Resolver(Env.Context());
    const auto Target = Env.Dir / "target";
    WriteFile(Target / "X.jpg", "same");

    EXPECT_EQ(Resolver.ResolveDestination(Target, Target / "X.jpg", std::nullopt), Target / "X.jpg");
    EXPECT_TRUE(PlacementResolver::IsSameFile(Target / "X.jpg", Target / "." / "X.jpg"));
    EXPECT_FALSE(PlacementResolver::IsSameFile(Target / "X.jpg", Target / "missing.jpg"));
}

TEST(StringUtils, TruncateUtf8KeepsWholeCodePoints)
{
    EXPECT_EQ(TruncateUtf8("abcdef", 3), "abc");
    EXPECT_EQ(TruncateUtf8("大疆无人机", 2), "大疆");
    EXPECT_EQ(TruncateUtf8("ab", 10), "ab");
}
