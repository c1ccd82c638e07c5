#pragma once

#include <string>
#include <vector>
#include <filesystem>

enum class DateFallback
{
    MTime,
    None
};

enum class DuplicateStrategy
{
    Skip,
    Rename,
    Overwrite
};

struct FolderStructure
{
    std::string DateFormat = "%Y-%m-%d";
    std::string ImageSubfolder = "图片";
    std::string VideoSubfolder = "视频";
    std::string AudioSubfolder = "音频";
    std::string PanoramicSubfolder = "全景视频";
    bool DeviceSubfolder = true;
};

struct AutoCopySettings
{
    bool Enabled = false;
    std::vector<std::string> WatchPaths{ "/media" };
    std::string TargetPath;
    unsigned int PollIntervalSec = 60;
};

struct AppConfig
{
    std::string SourcePath;
    std::string OutputPath;
    std::string SuperCopySource;
    std::string SuperCopyTarget;

    std::vector<std::string> ImageExtensions;
    std::vector<std::string> VideoExtensions;
    std::vector<std::string> AudioExtensions;
    std::vector<std::string> LeaveInPlaceExtensions;

    bool RelatedSameStem = true;
    DateFallback DateFallbackMode = DateFallback::MTime;
    std::string DeviceUnknownName = "未知设备";
    std::string NoDateName = "无日期";
    std::string OverflowSubfolder = "其他文件";
    FolderStructure Folders;

    bool MoveFiles = true;
    DuplicateStrategy Duplicates = DuplicateStrategy::Rename;
    bool DeleteEmptyFolders = false;
    bool UseExifTool = true;
    bool UnifiedNaming = true;

    std::string ExifToolPath = "exiftool";
    unsigned int ExifToolTimeoutSec = 10;

    std::string DevicePatternsFile = "device_suffixes.json";
    std::string ProcessedFile = "processed_files.json";

    std::string LogDir = "logs";
    unsigned short int MaxLogFiles = 10;
    std::string LogLevelName = "info";

    AutoCopySettings AutoCopy;

    // Directory of the config file; relative data paths resolve against it.
    std::filesystem::path BaseDir;

    static AppConfig Defaults();

    std::filesystem::path ResolveDataPath(const std::string& PathStr) const;
};

const std::vector<std::string>& DefaultImageExtensions();
const std::vector<std::string>& DefaultVideoExtensions();
const std::vector<std::string>& DefaultAudioExtensions();
const std::vector<std::string>& DefaultLeaveInPlaceExtensions();
const std::vector<std::string>& PanoramicExtensions();

std::string ToString(DuplicateStrategy Strategy);
std::string ToString(DateFallback Fallback);
