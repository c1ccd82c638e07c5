#pragma once

#include <filesystem>
#include <vector>

#include "RunContext.hpp"
#include "MediaClassifier.hpp"

// Finds companion files (sidecars, proxies, thumbnails) next to a primary media file.
class RelationFinder
{
public:
    RelationFinder(const RunContext& Context, const MediaClassifier& Classifier);

    // Same directory only, sorted by file name. Empty when related_same_stem is off.
    std::vector<std::filesystem::path> RelatedFiles(const std::filesystem::path& Primary) const;

    static bool StemsRelated(const std::string& PrimaryStem, const std::string& OtherStem);

private:
    const AppConfig& Config;
    Logger& Log;
    const MediaClassifier& Classifier;
};
