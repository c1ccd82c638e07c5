#include "PlacementResolver.hpp"
#include "StringUtils.hpp"
#include "TimeUtils.hpp"

#include <cstring>

namespace FS = std::filesystem;

namespace
{
    bool IsReservedChar(char Ch)
    {
        return Ch != '\0' && std::strchr("<>:\"/\\|?*", Ch) != nullptr;
    }

    bool IsBlank(char Ch)
    {
        return Ch == ' ' || Ch == '\t' || Ch == '\r' || Ch == '\n' || Ch == '\f' || Ch == '\v';
    }

    // Collapses every run of reserved or blank characters into a single '_'.
    std::string CollapseUnsafe(const std::string& Value)
    {
        std::string Result;
        Result.reserve(Value.size());
        bool InRun = false;
        for (char Ch : Value)
        {
            if (IsReservedChar(Ch) || IsBlank(Ch))
            {
                if (!InRun)
                {
                    Result.push_back('_');
                    InRun = true;
                }
                continue;
            }
            InRun = false;
            Result.push_back(Ch);
        }
        return Result;
    }

    bool Exists(const FS::path& Path)
    {
        std::error_code ec;
        return FS::exists(Path, ec);
    }
}

PlacementResolver::PlacementResolver(const RunContext& Context) : Config(Context.Config)
{
}

std::string PlacementResolver::SanitizeFolderName(const std::string& Name, const std::string& Fallback)
{
    std::string Result = Trim(Name);
    if (Result.empty())
    {
        return Fallback;
    }
    for (char& Ch : Result)
    {
        if (IsReservedChar(Ch))
        {
            Ch = '_';
        }
    }
    return TruncateUtf8(Result, MaxFolderNameLength);
}

std::string PlacementResolver::UnknownDeviceFolder() const
{
    return SanitizeFolderName(Config.DeviceUnknownName, Config.DeviceUnknownName);
}

std::string PlacementResolver::KindSubfolder(MediaKind Kind) const
{
    switch (Kind)
    {
    case MediaKind::Image:          return Config.Folders.ImageSubfolder;
    case MediaKind::PanoramicVideo: return Config.Folders.PanoramicSubfolder;
    case MediaKind::Video:          return Config.Folders.VideoSubfolder;
    case MediaKind::Audio:          return Config.Folders.AudioSubfolder;
    }
    return Config.Folders.AudioSubfolder;
}

std::string PlacementResolver::DateDirectory(const std::optional<std::tm>& CaptureTime) const
{
    if (!CaptureTime)
    {
        return Config.NoDateName;
    }
    std::string Formatted = FormatDate(*CaptureTime, Config.Folders.DateFormat);
    return Formatted.empty() ? Config.NoDateName : Formatted;
}

FS::path PlacementResolver::TargetDirectory(const MediaRecord& Record, const FS::path& OutputRoot) const
{
    FS::path Target = OutputRoot / PathFromUtf8(Record.DateString) / PathFromUtf8(KindSubfolder(Record.Kind));
    if (Config.Folders.DeviceSubfolder && CarriesDevice(Record.Kind))
    {
        Target /= PathFromUtf8(SanitizeFolderName(Record.Device, Config.DeviceUnknownName));
    }
    return Target;
}

std::string PlacementResolver::UnifiedBaseName(const std::string& Device, const std::string& Date, const std::string& Resolution, const std::string& FrameRate) const
{
    std::string DevicePart = CollapseUnsafe(Trim(Device));
    if (DevicePart.empty())
    {
        DevicePart = Config.DeviceUnknownName;
    }
    std::string DatePart = CollapseUnsafe(Trim(Date));
    if (DatePart.empty())
    {
        DatePart = Config.NoDateName;
    }

    std::string Joined = DevicePart + "_" + DatePart;
    std::string ResolutionPart = Trim(Resolution);
    if (!ResolutionPart.empty())
    {
        Joined += "_" + CollapseUnsafe(ResolutionPart);
    }
    std::string FrameRatePart = Trim(FrameRate);
    if (!FrameRatePart.empty())
    {
        Joined += "_" + CollapseUnsafe(FrameRatePart);
    }

    auto First = Joined.find_first_not_of('_');
    if (First == std::string::npos)
    {
        return "";
    }
    auto Last = Joined.find_last_not_of('_');
    return TruncateUtf8(Joined.substr(First, Last - First + 1), MaxUnifiedNameLength);
}

bool PlacementResolver::IsSameFile(const FS::path& A, const FS::path& B)
{
    std::error_code ec;
    bool Same = FS::equivalent(A, B, ec);
    return !ec && Same;
}

FS::path PlacementResolver::ResolveDestination(const FS::path& TargetDir, const FS::path& Source, const std::optional<std::string>& UnifiedBase) const
{
    const std::string Stem = UnifiedBase ? *UnifiedBase : PathToUtf8(Source.stem());
    const std::string Extension = PathToUtf8(Source.extension());

    FS::path Candidate = TargetDir / PathFromUtf8(Stem + Extension);
    if (!Exists(Candidate))
    {
        return Candidate;
    }
    if (IsSameFile(Candidate, Source))
    {
        return Candidate;
    }
    if (Config.Duplicates == DuplicateStrategy::Overwrite)
    {
        return Candidate;
    }

    // skip and rename both pick a fresh name so the file still gets routed.
    for (int i = 1; i <= MaxCollisionSuffix; ++i)
    {
        Candidate = TargetDir / PathFromUtf8(Stem + "_" + std::to_string(i) + Extension);
        if (!Exists(Candidate))
        {
            return Candidate;
        }
    }
    return Candidate;
}
