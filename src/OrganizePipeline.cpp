#include "OrganizePipeline.hpp"
#include "FileCopier.hpp"
#include "FileScanner.hpp"
#include "StringUtils.hpp"

#include <regex>
#include <vector>

namespace FS = std::filesystem;

namespace
{
    FS::path NormalizedAbsolute(const FS::path& Path)
    {
        std::error_code ec;
        FS::path Abs = FS::absolute(Path, ec);
        return (ec ? Path : Abs).lexically_normal();
    }

    bool StillExists(const FS::path& Path)
    {
        std::error_code ec;
        return FS::exists(Path, ec);
    }
}

OrganizePipeline::OrganizePipeline(const RunContext& Context)
    : Config(Context.Config),
      Log(Context.Log),
      PlannerImpl(Context),
      ProcessedImpl(Context.Config.ResolveDataPath(Context.Config.ProcessedFile), Context.Log)
{
}

void OrganizePipeline::RequestStop()
{
    StopRequested = true;
}

bool OrganizePipeline::IsOrganizedLocation(const FS::path& FilePath, const FS::path& OutputRoot) const
{
    FS::path Relative = NormalizedAbsolute(FilePath).lexically_relative(OutputRoot);
    std::vector<std::string> Parts;
    for (const auto& Part : Relative)
    {
        Parts.push_back(PathToUtf8(Part));
    }
    if (Parts.size() < 3 || Parts[0] == ".." || Parts[0] == ".")
    {
        return false;
    }

    static const std::regex DateFolder(R"(^\d{4}-\d{2}-\d{2}$)");
    if (!std::regex_match(Parts[0], DateFolder))
    {
        return false;
    }
    return Parts[2] != PlannerImpl.Resolver().UnknownDeviceFolder();
}

bool OrganizePipeline::Transfer(const FS::path& Source, const FS::path& Destination, std::string& Error) const
{
    if (Config.MoveFiles)
    {
        return FileCopier::Move(Source, Destination, Error);
    }
    return FileCopier::CopyPreservingMetadata(Source, Destination, Error);
}

OrganizeReport OrganizePipeline::ScanAndOrganize(const FS::path& Source, const FS::path& Output, bool DryRun, bool ScanOnly)
{
    OrganizeReport Report;
    Report.Mode = ScanOnly ? "scan_only" : "organize";
    Report.Source = PathToUtf8(Source);
    Report.Output = PathToUtf8(Output.empty() ? Source : Output);

    std::error_code ec;
    if (Source.empty() || !FS::is_directory(Source, ec))
    {
        Log.Error("Source path does not exist or is not a directory: " + Source.string());
        Report.SourceValid = false;
        return Report;
    }

    StopRequested = false;
    const FS::path SourceRoot = NormalizedAbsolute(Source);
    FS::path OutputRoot = Output.empty() ? SourceRoot : NormalizedAbsolute(Output);
    if (PlacementResolver::IsSameFile(SourceRoot, OutputRoot))
    {
        OutputRoot = SourceRoot;
    }

    FileScanner Scanner(Log);
    if (!Scanner.Scan(SourceRoot))
    {
        Report.SourceValid = false;
        return Report;
    }

    if (!ScanOnly)
    {
        ProcessedImpl.Load();
    }

    std::vector<MediaCandidate> Candidates = PlannerImpl.CollectCandidates(Scanner.GetFiles(), Report.TotalMedia);
    Report.ToProcess = Candidates.size();
    Log.Info("Organize: found " + std::to_string(Report.TotalMedia) + " media files under " + SourceRoot.string() + ", " + std::to_string(Report.ToProcess) + " to process");

    for (const auto& Candidate : Candidates)
    {
        if (StopRequested)
        {
            Log.Warn("Organize: stop requested, remaining files left untouched");
            break;
        }
        if (ScanOnly)
        {
            PlanOnly(Candidate, OutputRoot, Report);
        }
        else
        {
            ProcessFile(Candidate, OutputRoot, DryRun, Report);
        }
    }

    if (ScanOnly)
    {
        return Report;
    }

    if (!DryRun)
    {
        ProcessedImpl.Save(true);
        if (Config.DeleteEmptyFolders)
        {
            size_t Removed = FileCopier::RemoveEmptyDirectories(OutputRoot, Log);
            if (Removed > 0)
            {
                Log.Info("Organize: removed " + std::to_string(Removed) + " empty folders");
            }
        }
    }

    Log.Info("Organize complete: moved=" + std::to_string(Report.Count(ReportAction::Move)) +
        " related=" + std::to_string(Report.Count(ReportAction::Related)) +
        " skipped=" + std::to_string(Report.Count(ReportAction::Skip) + Report.Count(ReportAction::AlreadyProcessed)) +
        " failed=" + std::to_string(Report.Count(ReportAction::Fail) + Report.Count(ReportAction::FailRelated)));
    return Report;
}

void OrganizePipeline::PlanOnly(const MediaCandidate& Candidate, const FS::path& OutputRoot, OrganizeReport& Report)
{
    PlacementPlan Plan = PlannerImpl.Plan(Candidate.Path, Candidate.Kind, OutputRoot);
    if (PlacementResolver::IsSameFile(Plan.PrimaryDestination, Candidate.Path))
    {
        Report.Entries.push_back({ ReportAction::Skip, PathToUtf8(Candidate.Path), "already in place" });
        return;
    }
    Report.Entries.push_back({ ReportAction::Move, PathToUtf8(Candidate.Path), PathToUtf8(Plan.PrimaryDestination) });
    for (const auto& Related : Plan.RelatedFiles)
    {
        Report.Entries.push_back({ ReportAction::Related, PathToUtf8(Related), PathToUtf8(PlannerImpl.RelatedDestination(Plan, Related)) });
    }
}

void OrganizePipeline::ProcessFile(const MediaCandidate& Candidate, const FS::path& OutputRoot, bool DryRun, OrganizeReport& Report)
{
    const FS::path& FilePath = Candidate.Path;
    const std::string SourceText = PathToUtf8(FilePath);

    // Moved earlier as the companion of another primary.
    if (!StillExists(FilePath))
    {
        Log.Debug("No longer present, skipped: " + FilePath.string());
        return;
    }

    if (ProcessedImpl.IsProcessed(FilePath))
    {
        if (IsOrganizedLocation(FilePath, OutputRoot))
        {
            Log.Info("Already organised (skipped): " + FilePath.filename().string());
            Report.Entries.push_back({ ReportAction::AlreadyProcessed, SourceText, "previously organised" });
            return;
        }
        Log.Info("Re-classifying previously recorded file: " + FilePath.filename().string());
    }

    PlacementPlan Plan = PlannerImpl.Plan(FilePath, Candidate.Kind, OutputRoot);
    const FS::path& Destination = Plan.PrimaryDestination;

    if (PlacementResolver::IsSameFile(Destination, FilePath))
    {
        Log.Info("Already in place: " + FilePath.string());
        Report.Entries.push_back({ ReportAction::Skip, SourceText, "already in place" });
        ProcessedImpl.MarkProcessed(FilePath);
        return;
    }

    if (DryRun)
    {
        Log.Info("[Dry Run] Would move: " + FilePath.string() + " -> " + Destination.string());
    }
    else
    {
        std::string Error;
        if (!Transfer(FilePath, Destination, Error))
        {
            Log.Error("Move failed " + FilePath.string() + ": " + Error);
            Report.Entries.push_back({ ReportAction::Fail, SourceText, Error });
            return;
        }
        Log.Info("Moved: " + FilePath.string() + " -> " + Destination.string());
    }
    Report.Entries.push_back({ ReportAction::Move, SourceText, PathToUtf8(Destination) });

    for (const auto& Related : Plan.RelatedFiles)
    {
        if (!StillExists(Related) || ProcessedImpl.IsProcessed(Related))
        {
            continue;
        }

        FS::path RelatedDest = PlannerImpl.RelatedDestination(Plan, Related);
        if (PlacementResolver::IsSameFile(RelatedDest, Related))
        {
            ProcessedImpl.MarkProcessed(Related);
            continue;
        }

        if (DryRun)
        {
            Log.Info("[Dry Run] Would move related: " + Related.string() + " -> " + RelatedDest.string());
        }
        else
        {
            std::string Error;
            if (!Transfer(Related, RelatedDest, Error))
            {
                Log.Warn("Related move failed " + Related.string() + ": " + Error);
                Report.Entries.push_back({ ReportAction::FailRelated, PathToUtf8(Related), Error });
                continue;
            }
            Log.Info("Moved related: " + Related.string() + " -> " + RelatedDest.string());
        }
        Report.Entries.push_back({ ReportAction::Related, PathToUtf8(Related), PathToUtf8(RelatedDest) });
        ProcessedImpl.MarkProcessed(Related);
        ProcessedImpl.MarkProcessed(RelatedDest);
    }

    ProcessedImpl.MarkProcessed(FilePath);
    ProcessedImpl.MarkProcessed(Destination);
}
