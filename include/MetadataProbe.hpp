#pragma once

#include <ctime>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <utility>

#include "RunContext.hpp"
#include "MediaKind.hpp"
#include "ExifToolRunner.hpp"
#include "EmbeddedMetadata.hpp"
#include "ContainerMetadata.hpp"
#include "DevicePatternDatabase.hpp"

// Answers resolution, frame rate, capture time, device and panoramic questions about one file.
// Every source is optional; absence of data is the only failure signal and nothing throws.
class MetadataProbe
{
public:
    explicit MetadataProbe(const RunContext& Context);

    std::optional<std::pair<int, int>> Resolution(const std::filesystem::path& FilePath, MediaKind Kind);
    std::string FrameRate(const std::filesystem::path& FilePath, MediaKind Kind);
    std::optional<std::tm> CaptureTime(const std::filesystem::path& FilePath, MediaKind Kind);
    std::string Device(const std::filesystem::path& FilePath, MediaKind Kind);
    bool IsPanoramicByMetadata(const std::filesystem::path& FilePath);

    DevicePatternDatabase& Patterns();

private:
    const std::map<std::string, std::string>& ToolTags(const std::filesystem::path& FilePath);
    static std::string TagValue(const std::map<std::string, std::string>& Tags, const std::string& Key);

    const AppConfig& Config;
    Logger& Log;

    ExifToolRunner Tool;
    EmbeddedMetadata Embedded;
    ContainerMetadata Container;
    DevicePatternDatabase PatternDb;

    std::filesystem::path ToolCachePath;
    std::map<std::string, std::string> ToolCache;
    bool HasToolCache = false;
};
