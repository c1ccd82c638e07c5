#pragma once

#include <atomic>
#include <chrono>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>
#include <vector>

#include "AppConfig.hpp"
#include "Logger.hpp"
#include "RunContext.hpp"
#include "TimeUtils.hpp"

namespace TestSupport
{
    namespace FS = std::filesystem;

    // Scratch directory removed on destruction.
    class TempDir
    {
    public:
        TempDir()
        {
            static std::atomic<unsigned> Counter{ 0 };
            const auto Stamp = std::chrono::steady_clock::now().time_since_epoch().count();
            Root = FS::temp_directory_path() / ("mediafiler_test_" + std::to_string(Stamp) + "_" + std::to_string(Counter++));
            FS::create_directories(Root);
        }

        ~TempDir()
        {
            std::error_code ec;
            FS::remove_all(Root, ec);
        }

        TempDir(const TempDir&) = delete;
        TempDir& operator=(const TempDir&) = delete;

        const FS::path& Path() const { return Root; }
        FS::path operator/(const std::string& Child) const { return Root / FS::path(std::u8string(Child.begin(), Child.end())); }

    private:
        FS::path Root;
    };

    inline FS::path Utf8Path(const std::string& Value)
    {
        return FS::path(std::u8string(Value.begin(), Value.end()));
    }

    inline void WriteFile(const FS::path& Path, const std::string& Content)
    {
        FS::create_directories(Path.parent_path());
        std::ofstream File(Path, std::ios::binary | std::ios::trunc);
        File << Content;
    }

    inline std::string ReadFile(const FS::path& Path)
    {
        std::ifstream File(Path, std::ios::binary);
        return std::string(std::istreambuf_iterator<char>(File), std::istreambuf_iterator<char>());
    }

    // Local noon of the given day.
    inline void SetMTime(const FS::path& Path, int Year, int Month, int Day)
    {
        std::tm Local{};
        Local.tm_year = Year - 1900;
        Local.tm_mon = Month - 1;
        Local.tm_mday = Day;
        Local.tm_hour = 12;
        Local.tm_isdst = -1;
        FS::last_write_time(Path, FromTimeT(std::mktime(&Local)));
    }

    inline std::vector<FS::path> RegularFilesUnder(const FS::path& Root)
    {
        std::vector<FS::path> Files;
        std::error_code ec;
        if (!FS::exists(Root, ec))
        {
            return Files;
        }
        for (const auto& Entry : FS::recursive_directory_iterator(Root))
        {
            if (Entry.is_regular_file())
            {
                Files.push_back(Entry.path());
            }
        }
        return Files;
    }

    // No exiftool, state files under StateDir, nothing logged.
    inline AppConfig MakeConfig(const FS::path& StateDir)
    {
        AppConfig Config = AppConfig::Defaults();
        Config.UseExifTool = false;
        Config.BaseDir = StateDir;
        return Config;
    }

    // Owns the config and a never-initialised logger for one test.
    struct TestEnvironment
    {
        TempDir Dir;
        AppConfig Config;
        Logger Log;

        TestEnvironment() : Config(MakeConfig(Dir / "state"))
        {
            FS::create_directories(Config.BaseDir);
        }

        RunContext Context() { return RunContext{ Config, Log }; }
    };
}
