#include "MetadataProbe.hpp"
#include "PlacementResolver.hpp"
#include "StringUtils.hpp"
#include "TimeUtils.hpp"

#include <algorithm>
#include <cctype>
#include <initializer_list>
#include <regex>
#include <stdexcept>
#include <vector>

namespace FS = std::filesystem;

namespace
{
    // Union of every tag any probe question needs, so each file costs one exiftool run.
    const std::vector<std::string>& ProbeTags()
    {
        static const std::vector<std::string> Tags = {
            "ImageWidth", "ImageHeight", "VideoFrameWidth", "VideoFrameHeight",
            "VideoFrameRate", "FrameRate",
            "DateTimeOriginal", "CreateDate", "MediaCreateDate",
            "Make", "Model", "ProjectionType", "StitchingSoftware"
        };
        return Tags;
    }

    bool IsDigits(const std::string& Value)
    {
        return !Value.empty() && Value.size() <= 9 && std::all_of(Value.begin(), Value.end(), [](unsigned char Ch) { return std::isdigit(Ch) != 0; });
    }

    std::string FpsFromText(std::string Value)
    {
        std::replace(Value.begin(), Value.end(), ',', '.');
        static const std::regex Plain(R"(^\d+(\.\d+)?$)");
        static const std::regex WithUnit(R"((\d+(?:\.\d+)?)\s*fps?)", std::regex::icase);

        std::smatch Match;
        std::string Number;
        if (std::regex_match(Value, Plain))
        {
            Number = Value;
        }
        else if (std::regex_search(Value, Match, WithUnit))
        {
            Number = Match[1].str();
        }
        if (Number.empty())
        {
            return "";
        }
        try
        {
            double Rate = std::stod(Number);
            if (Rate <= 0.0 || Rate > 100000.0)
            {
                return "";
            }
            return std::to_string(static_cast<long long>(Rate)) + "fps";
        }
        catch (const std::out_of_range&)
        {
            return "";
        }
    }

    std::string JoinMakeModel(const std::string& Make, const std::string& Model)
    {
        return Trim(Trim(Make) + " " + Trim(Model));
    }
}

MetadataProbe::MetadataProbe(const RunContext& Context)
    : Config(Context.Config),
      Log(Context.Log),
      Tool(Context.Config.ExifToolPath, Context.Config.ExifToolTimeoutSec, Context.Log),
      Embedded(Context.Log),
      Container(Context.Log),
      PatternDb(Context.Config.ResolveDataPath(Context.Config.DevicePatternsFile), Context.Log)
{
}

DevicePatternDatabase& MetadataProbe::Patterns()
{
    return PatternDb;
}

std::string MetadataProbe::TagValue(const std::map<std::string, std::string>& Tags, const std::string& Key)
{
    auto it = Tags.find(Key);
    return it != Tags.end() ? Trim(it->second) : std::string();
}

const std::map<std::string, std::string>& MetadataProbe::ToolTags(const FS::path& FilePath)
{
    if (HasToolCache && ToolCachePath == FilePath)
    {
        return ToolCache;
    }
    HasToolCache = true;
    ToolCachePath = FilePath;
    ToolCache.clear();

    std::error_code ec;
    if (Config.UseExifTool && FS::exists(FilePath, ec))
    {
        ToolCache = Tool.Query(FilePath, ProbeTags());
    }
    return ToolCache;
}

std::optional<std::pair<int, int>> MetadataProbe::Resolution(const FS::path& FilePath, MediaKind Kind)
{
    if (Kind == MediaKind::Image)
    {
        const EmbeddedInfo& Info = Embedded.Read(FilePath);
        if (Info.Width > 0 && Info.Height > 0)
        {
            return std::make_pair(Info.Width, Info.Height);
        }
    }

    if (Config.UseExifTool)
    {
        const auto& Tags = ToolTags(FilePath);
        const std::pair<const char*, const char*> Keys[] = {
            { "ImageWidth", "ImageHeight" },
            { "VideoFrameWidth", "VideoFrameHeight" }
        };
        for (const auto& [WidthKey, HeightKey] : Keys)
        {
            std::string Width = TagValue(Tags, WidthKey);
            std::string Height = TagValue(Tags, HeightKey);
            if (IsDigits(Width) && IsDigits(Height))
            {
                return std::make_pair(std::stoi(Width), std::stoi(Height));
            }
        }
    }

    if (IsVideoKind(Kind))
    {
        const ContainerInfo& Info = Container.Read(FilePath);
        if (Info.Width > 0 && Info.Height > 0)
        {
            return std::make_pair(Info.Width, Info.Height);
        }
    }
    return std::nullopt;
}

std::string MetadataProbe::FrameRate(const FS::path& FilePath, MediaKind Kind)
{
    if (!IsVideoKind(Kind))
    {
        return "";
    }

    if (Config.UseExifTool)
    {
        const auto& Tags = ToolTags(FilePath);
        for (const char* Key : { "VideoFrameRate", "FrameRate" })
        {
            std::string Value = TagValue(Tags, Key);
            if (Value.empty())
            {
                continue;
            }
            std::string Fps = FpsFromText(Value);
            if (!Fps.empty())
            {
                return Fps;
            }
        }
    }

    const ContainerInfo& Info = Container.Read(FilePath);
    if (Info.FrameRate > 0.0)
    {
        return std::to_string(static_cast<long long>(Info.FrameRate)) + "fps";
    }
    return "";
}

std::optional<std::tm> MetadataProbe::CaptureTime(const FS::path& FilePath, MediaKind Kind)
{
    if (Kind == MediaKind::Image)
    {
        const EmbeddedInfo& Info = Embedded.Read(FilePath);
        for (const std::string* Value : { &Info.DateTimeOriginal, &Info.DateTimeDigitized, &Info.DateTime })
        {
            if (auto Parsed = ParseExifDateTime(*Value))
            {
                return Parsed;
            }
        }
        if (Config.UseExifTool)
        {
            const auto& Tags = ToolTags(FilePath);
            for (const char* Key : { "DateTimeOriginal", "CreateDate" })
            {
                if (auto Parsed = ParseExifDateTime(TagValue(Tags, Key)))
                {
                    return Parsed;
                }
            }
        }
    }
    else
    {
        if (Config.UseExifTool)
        {
            const auto& Tags = ToolTags(FilePath);
            for (const char* Key : { "CreateDate", "DateTimeOriginal", "MediaCreateDate" })
            {
                if (auto Parsed = ParseExifDateTime(TagValue(Tags, Key)))
                {
                    return Parsed;
                }
            }
        }
        const ContainerInfo& Info = Container.Read(FilePath);
        if (auto Utc = ParseIsoUtc(Info.CreationTime))
        {
            return ToLocalTm(*Utc);
        }
    }

    if (Config.DateFallbackMode == DateFallback::MTime)
    {
        std::error_code ec;
        auto WriteTime = FS::last_write_time(FilePath, ec);
        if (!ec)
        {
            return ToLocalTm(static_cast<std::time_t>(ToTimeT(WriteTime)));
        }
        Log.Debug("No modification time for " + FilePath.string() + ": " + ec.message());
    }
    return std::nullopt;
}

std::string MetadataProbe::Device(const FS::path& FilePath, MediaKind Kind)
{
    if (!CarriesDevice(Kind))
    {
        return "";
    }

    const std::string Stem = PathToUtf8(FilePath.stem());
    if (Contains(ToUpperAscii(Stem), "DJI") || Contains(Stem, "大疆"))
    {
        return "大疆";
    }
    if (IsVideoKind(Kind) && ToLowerAscii(PathToUtf8(FilePath.extension())) == ".lrf")
    {
        return "大疆";
    }

    std::string Found;
    if (Kind == MediaKind::Image)
    {
        const EmbeddedInfo& Info = Embedded.Read(FilePath);
        Found = JoinMakeModel(Info.Make, Info.Model);
    }
    if (Found.empty() && Config.UseExifTool)
    {
        const auto& Tags = ToolTags(FilePath);
        Found = JoinMakeModel(TagValue(Tags, "Make"), TagValue(Tags, "Model"));
    }
    if (Found.empty() && IsVideoKind(Kind))
    {
        const ContainerInfo& Info = Container.Read(FilePath);
        Found = JoinMakeModel(Info.Make, Info.Model);
    }
    if (Found.empty())
    {
        if (auto Pattern = PatternDb.Match(FilePath))
        {
            Found = *Pattern;
        }
    }

    if (Found.empty())
    {
        return "";
    }
    return PlacementResolver::SanitizeFolderName(Found, Config.DeviceUnknownName);
}

bool MetadataProbe::IsPanoramicByMetadata(const FS::path& FilePath)
{
    if (!Config.UseExifTool)
    {
        return false;
    }
    const auto& Tags = ToolTags(FilePath);
    if (Tags.empty())
    {
        return false;
    }

    const std::string Projection = ToLowerAscii(TagValue(Tags, "ProjectionType"));
    const std::string Make = TagValue(Tags, "Make");
    const std::string Model = TagValue(Tags, "Model");
    const std::string MakeLower = ToLowerAscii(Make);

    if (Projection == "equirectangular")
    {
        return true;
    }
    if (Contains(Make, "360") || Contains(Model, "360"))
    {
        return true;
    }
    return Contains(MakeLower, "theta") || Contains(MakeLower, "insta360");
}
