#include <gtest/gtest.h>

#include <sstream>

#include "ControlFlow.hpp"
#include "ConfigParser.hpp"
#include "TestHelpers.hpp"

using namespace TestSupport;

namespace
{
    // argv storage for ControlFlow::Run.
    class Arguments
    {
    public:
        Arguments(std::initializer_list<std::string> Values) : Storage(Values)
        {
            for (auto& Value : Storage)
            {
                Pointers.push_back(Value.data());
            }
            Pointers.push_back(nullptr);
        }

        int Count() const { return static_cast<int>(Storage.size()); }
        char** Values() { return Pointers.data(); }

    private:
        std::vector<std::string> Storage;
        std::vector<char*> Pointers;
    };

    void WriteQuietConfig(const FS::path& File)
    {
        AppConfig Config = AppConfig::Defaults();
        Config.UseExifTool = false;
        Config.Folders.ImageSubfolder = "image";
        std::string Error;
        ASSERT_TRUE(ConfigParser::Save(File.string(), Config, Error)) << Error;
    }
}

TEST(ControlFlow, ParsesOptions)
{
    Arguments Args{ "MediaFiler", "--config", "c.json", "-s", "/in", "--output", "/out", "--super-copy", "--dry-run", "--json" };
    CommandLine Parsed;
    std::string Error;

    ASSERT_TRUE(ControlFlow::ParseArguments(Args.Count(), Args.Values(), Parsed, Error)) << Error;
    EXPECT_EQ(Parsed.ConfigFile, "c.json");
    EXPECT_EQ(Parsed.Source, "/in");
    EXPECT_EQ(Parsed.Output, "/out");
    EXPECT_TRUE(Parsed.SuperCopy);
    EXPECT_TRUE(Parsed.DryRun);
    EXPECT_TRUE(Parsed.Json);
    EXPECT_FALSE(Parsed.ScanOnly);
    EXPECT_FALSE(Parsed.Watch);
}

TEST(ControlFlow, RejectsBadOptions)
{
    CommandLine Parsed;
    std::string Error;

    Arguments Unknown{ "MediaFiler", "--frobnicate" };
    EXPECT_FALSE(ControlFlow::ParseArguments(Unknown.Count(), Unknown.Values(), Parsed, Error));
    EXPECT_NE(Error.find("--frobnicate"), std::string::npos);

    Arguments MissingValue{ "MediaFiler", "--source" };
    EXPECT_FALSE(ControlFlow::ParseArguments(MissingValue.Count(), MissingValue.Values(), Parsed, Error));
}

TEST(ControlFlow, ExplicitConfigFileWins)
{
    CommandLine Args;
    Args.ConfigFile = "/etc/mediafiler/config.json";
    EXPECT_EQ(ControlFlow::ResolveConfigFile(Args, FS::path()), FS::path("/etc/mediafiler/config.json"));
}

TEST(ControlFlow, ConsoleProgressLine)
{
    std::ostringstream Out;
    ConsoleProgress Progress(Out);
    Progress.OnProgress(ProgressPhase::HashSource, "clip.mp4", 3, 10);
    Progress.OnProgress(ProgressPhase::Progress, "", 4, 10);
    EXPECT_EQ(Out.str(), "[3/10] hash_src clip.mp4\n[4/10] progress\n");
}

TEST(ControlFlow, HelpExitsZero)
{
    ControlFlow App;
    Arguments Args{ "MediaFiler", "--help" };
    EXPECT_EQ(App.Run(Args.Count(), Args.Values()), 0);
}

TEST(ControlFlow, MissingSourceExitsOne)
{
    TempDir Dir;
    WriteQuietConfig(Dir / "config.json");

    ControlFlow App;
    Arguments Args{ "MediaFiler", "--config", (Dir / "config.json").string(), "--source", (Dir / "nowhere").string() };
    EXPECT_EQ(App.Run(Args.Count(), Args.Values()), 1);
}

TEST(ControlFlow, UnsetSuperCopyPathsExitOne)
{
    TempDir Dir;
    WriteQuietConfig(Dir / "config.json");

    ControlFlow App;
    Arguments Args{ "MediaFiler", "--config", (Dir / "config.json").string(), "--super-copy" };
    EXPECT_EQ(App.Run(Args.Count(), Args.Values()), 1);
}

TEST(ControlFlow, InvalidConfigExitsOne)
{
    TempDir Dir;
    WriteFile(Dir / "config.json", R"({ "duplicate_strategy": "merge" })");

    ControlFlow App;
    Arguments Args{ "MediaFiler", "--config", (Dir / "config.json").string(), "--source", Dir.Path().string() };
    EXPECT_EQ(App.Run(Args.Count(), Args.Values()), 1);
}

TEST(ControlFlow, OrganizeRunSavesGivenPaths)
{
    TempDir Dir;
    const auto ConfigFile = Dir / "config.json";
    WriteQuietConfig(ConfigFile);
    WriteFile(Dir / "in" / "photo.jpg", "jpeg");
    SetMTime(Dir / "in" / "photo.jpg", 2024, 3, 1);

    ControlFlow App;
    Arguments Args{ "MediaFiler", "--config", ConfigFile.string(), "-s", (Dir / "in").string(), "-o", (Dir / "out").string() };
    EXPECT_EQ(App.Run(Args.Count(), Args.Values()), 0);

    EXPECT_TRUE(FS::exists(Dir / "out" / "2024-03-01" / "image" / Utf8Path("未知设备") / Utf8Path("未知设备_2024-03-01.jpg")));

    ConfigParser Parser;
    ASSERT_TRUE(Parser.Parse(ConfigFile.string()));
    EXPECT_EQ(Parser.GetConfig().SourcePath, (Dir / "in").string());
    EXPECT_EQ(Parser.GetConfig().OutputPath, (Dir / "out").string());
    EXPECT_TRUE(FS::is_directory(Dir / "logs"));
}
