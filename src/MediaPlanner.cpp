#include "MediaPlanner.hpp"
#include "StringUtils.hpp"

#include <algorithm>
#include <set>
#include <utility>

namespace FS = std::filesystem;

MediaPlanner::MediaPlanner(const RunContext& Context)
    : Log(Context.Log),
      Config(Context.Config),
      ProbeImpl(Context),
      ClassifierImpl(Context, ProbeImpl),
      ResolverImpl(Context),
      RelationsImpl(Context, ClassifierImpl)
{
}

MediaClassifier& MediaPlanner::Classifier()
{
    return ClassifierImpl;
}

const PlacementResolver& MediaPlanner::Resolver() const
{
    return ResolverImpl;
}

const RelationFinder& MediaPlanner::Relations() const
{
    return RelationsImpl;
}

std::vector<MediaCandidate> MediaPlanner::CollectCandidates(const std::vector<ScannedFileInfo>& Files, size_t& TotalMedia)
{
    std::vector<MediaCandidate> Collected;
    for (const auto& File : Files)
    {
        if (ClassifierImpl.ShouldLeaveInPlace(File.Path))
        {
            continue;
        }
        if (auto Kind = ClassifierImpl.Classify(File.Path))
        {
            Collected.push_back(MediaCandidate{ File.Path, *Kind });
        }
    }
    TotalMedia = Collected.size();
    return DeduplicateByStem(std::move(Collected));
}

std::vector<MediaCandidate> MediaPlanner::DeduplicateByStem(std::vector<MediaCandidate> Candidates)
{
    std::sort(Candidates.begin(), Candidates.end(), [](const MediaCandidate& A, const MediaCandidate& B) {
        if (A.Path.parent_path() != B.Path.parent_path())
        {
            return A.Path.parent_path() < B.Path.parent_path();
        }
        return A.Path.filename() < B.Path.filename();
    });

    std::set<std::pair<FS::path, FS::path>> Seen;
    std::vector<MediaCandidate> Unique;
    for (auto& Candidate : Candidates)
    {
        if (Seen.insert({ Candidate.Path.parent_path(), Candidate.Path.stem() }).second)
        {
            Unique.push_back(std::move(Candidate));
        }
    }
    return Unique;
}

MediaRecord MediaPlanner::Describe(const FS::path& FilePath, MediaKind Kind)
{
    MediaRecord Record;
    Record.Path = FilePath;
    Record.Kind = Kind;
    Record.CaptureTime = ProbeImpl.CaptureTime(FilePath, Kind);
    Record.DateString = ResolverImpl.DateDirectory(Record.CaptureTime);

    std::string Device = ProbeImpl.Device(FilePath, Kind);
    Record.Device = Device.empty() ? Config.DeviceUnknownName : Device;
    return Record;
}

PlacementPlan MediaPlanner::Plan(const FS::path& FilePath, MediaKind Kind, const FS::path& OutputRoot)
{
    PlacementPlan Result;
    Result.Record = Describe(FilePath, Kind);
    Result.TargetDirectory = ResolverImpl.TargetDirectory(Result.Record, OutputRoot);

    if (Config.UnifiedNaming)
    {
        std::string ResolutionText;
        if (auto Size = ProbeImpl.Resolution(FilePath, Kind))
        {
            ResolutionText = std::to_string(Size->first) + "x" + std::to_string(Size->second);
        }
        std::string FrameRateText = ProbeImpl.FrameRate(FilePath, Kind);
        Result.UnifiedBaseName = ResolverImpl.UnifiedBaseName(Result.Record.Device, Result.Record.DateString, ResolutionText, FrameRateText);
    }

    Result.PrimaryDestination = ResolverImpl.ResolveDestination(Result.TargetDirectory, FilePath, Result.UnifiedBaseName);
    Result.RelatedFiles = RelationsImpl.RelatedFiles(FilePath);

    Log.Debug("Planned " + KindName(Kind) + " " + FilePath.string() + " -> " + Result.PrimaryDestination.string());
    return Result;
}

FS::path MediaPlanner::RelatedDestination(const PlacementPlan& Plan, const FS::path& RelatedFile) const
{
    return ResolverImpl.ResolveDestination(Plan.TargetDirectory, RelatedFile, Plan.UnifiedBaseName);
}
