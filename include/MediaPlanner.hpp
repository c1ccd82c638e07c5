#pragma once

#include <filesystem>
#include <vector>

#include "RunContext.hpp"
#include "FileScanner.hpp"
#include "MediaRecord.hpp"
#include "MetadataProbe.hpp"
#include "MediaClassifier.hpp"
#include "PlacementResolver.hpp"
#include "RelationFinder.hpp"

struct MediaCandidate
{
    std::filesystem::path Path;
    MediaKind Kind = MediaKind::Image;
};

// Turns scanned files into routed plans. Shared by the organize and copy pipelines.
class MediaPlanner
{
public:
    explicit MediaPlanner(const RunContext& Context);

    MediaPlanner(const MediaPlanner&) = delete;
    MediaPlanner& operator=(const MediaPlanner&) = delete;

    // Drops leave-in-place and unclassifiable files. TotalMedia receives the count before de-duplication.
    std::vector<MediaCandidate> CollectCandidates(const std::vector<ScannedFileInfo>& Files, size_t& TotalMedia);

    // Sorts by (parent, name) and keeps the first file per (parent, stem).
    static std::vector<MediaCandidate> DeduplicateByStem(std::vector<MediaCandidate> Candidates);

    MediaRecord Describe(const std::filesystem::path& FilePath, MediaKind Kind);
    PlacementPlan Plan(const std::filesystem::path& FilePath, MediaKind Kind, const std::filesystem::path& OutputRoot);

    // Resolved at transfer time so earlier transfers of the same plan count as collisions.
    std::filesystem::path RelatedDestination(const PlacementPlan& Plan, const std::filesystem::path& RelatedFile) const;

    MediaClassifier& Classifier();
    const PlacementResolver& Resolver() const;
    const RelationFinder& Relations() const;

private:
    Logger& Log;
    const AppConfig& Config;
    MetadataProbe ProbeImpl;
    MediaClassifier ClassifierImpl;
    PlacementResolver ResolverImpl;
    RelationFinder RelationsImpl;
};
