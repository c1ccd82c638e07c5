#include "AppConfig.hpp"

const std::vector<std::string>& DefaultImageExtensions()
{
    static const std::vector<std::string> Extensions = {
        ".jpg", ".jpeg", ".png", ".heic", ".heif", ".gif", ".bmp", ".webp",
        ".raw", ".cr2", ".nef", ".arw", ".dng"
    };
    return Extensions;
}

const std::vector<std::string>& DefaultVideoExtensions()
{
    static const std::vector<std::string> Extensions = {
        ".mp4", ".mov", ".mkv", ".avi", ".wmv", ".webm", ".m4v", ".3gp",
        ".mpg", ".mpeg", ".mts", ".360", ".insv", ".lrf", ".osv"
    };
    return Extensions;
}

const std::vector<std::string>& DefaultAudioExtensions()
{
    static const std::vector<std::string> Extensions = {
        ".mp3", ".m4a", ".wav", ".aac", ".flac", ".ogg", ".wma"
    };
    return Extensions;
}

const std::vector<std::string>& DefaultLeaveInPlaceExtensions()
{
    static const std::vector<std::string> Extensions = { ".op", ".ed", ".lrprev", ".lock" };
    return Extensions;
}

const std::vector<std::string>& PanoramicExtensions()
{
    static const std::vector<std::string> Extensions = { ".360", ".insv", ".osv" };
    return Extensions;
}

AppConfig AppConfig::Defaults()
{
    AppConfig Config;
    Config.ImageExtensions = DefaultImageExtensions();
    Config.VideoExtensions = DefaultVideoExtensions();
    Config.AudioExtensions = DefaultAudioExtensions();
    Config.LeaveInPlaceExtensions = DefaultLeaveInPlaceExtensions();
    return Config;
}

std::filesystem::path AppConfig::ResolveDataPath(const std::string& PathStr) const
{
    std::filesystem::path Path(PathStr);
    if (Path.is_absolute() || BaseDir.empty())
    {
        return Path;
    }
    return BaseDir / Path;
}

std::string ToString(DuplicateStrategy Strategy)
{
    switch (Strategy)
    {
    case DuplicateStrategy::Skip:      return "skip";
    case DuplicateStrategy::Rename:    return "rename";
    case DuplicateStrategy::Overwrite: return "overwrite";
    default:                           return "rename";
    }
}

std::string ToString(DateFallback Fallback)
{
    return Fallback == DateFallback::MTime ? "mtime" : "none";
}
