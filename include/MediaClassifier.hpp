#pragma once

#include <filesystem>
#include <optional>
#include <set>
#include <string>

#include "RunContext.hpp"
#include "MediaKind.hpp"
#include "MetadataProbe.hpp"

class MediaClassifier
{
public:
    MediaClassifier(const RunContext& Context, MetadataProbe& Probe);

    // Image, then audio, then video extensions. nullopt for anything else.
    std::optional<MediaKind> Classify(const std::filesystem::path& FilePath);

    bool ShouldLeaveInPlace(const std::filesystem::path& FilePath) const;
    bool IsPanoramicByPath(const std::filesystem::path& FilePath) const;

private:
    const AppConfig& Config;
    MetadataProbe& Probe;

    std::set<std::string> ImageExtensions;
    std::set<std::string> VideoExtensions;
    std::set<std::string> AudioExtensions;
    std::set<std::string> LeaveInPlaceExtensions;
    std::set<std::string> PanoramicExtensionSet;
};
