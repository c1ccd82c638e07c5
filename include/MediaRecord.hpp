#pragma once

#include <ctime>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "MediaKind.hpp"

// Everything inferred about one media file before it is routed.
struct MediaRecord
{
    std::filesystem::path Path;
    MediaKind Kind = MediaKind::Image;
    std::optional<std::tm> CaptureTime;
    std::string Device;
    std::string DateString;
};

struct PlacementPlan
{
    MediaRecord Record;
    std::filesystem::path TargetDirectory;
    std::optional<std::string> UnifiedBaseName;
    std::filesystem::path PrimaryDestination;
    std::vector<std::filesystem::path> RelatedFiles;
};
