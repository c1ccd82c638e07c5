#include "SuperCopyPipeline.hpp"
#include "FileCopier.hpp"
#include "FileHasher.hpp"
#include "FileScanner.hpp"
#include "StringUtils.hpp"

#include <algorithm>
#include <exception>

namespace FS = std::filesystem;

namespace
{
    FS::path NormalizedAbsolute(const FS::path& Path)
    {
        std::error_code ec;
        FS::path Abs = FS::absolute(Path, ec);
        return (ec ? Path : Abs).lexically_normal();
    }

    bool IsInside(const FS::path& Child, const FS::path& Parent)
    {
        FS::path Relative = Child.lexically_relative(Parent);
        return !Relative.empty() && *Relative.begin() != "..";
    }
}

SuperCopyPipeline::SuperCopyPipeline(const RunContext& Context)
    : Config(Context.Config),
      Log(Context.Log),
      PlannerImpl(Context)
{
}

void SuperCopyPipeline::RequestStop()
{
    StopRequested = true;
}

void SuperCopyPipeline::Notify(ProgressObserver* Observer, ProgressPhase Phase, const std::string& Message, size_t Current, size_t Total)
{
    if (!Observer)
    {
        return;
    }
    try
    {
        Observer->OnProgress(Phase, Message, Current, Total);
    }
    catch (const std::exception& e)
    {
        Log.Warn("Progress observer failed (" + ToString(Phase) + "): " + e.what());
    }
}

bool SuperCopyPipeline::CopyWithVerify(const FS::path& Source, const FS::path& Destination, std::string& Reason,
    ProgressObserver* Observer, size_t Current, size_t Total)
{
    const std::string Name = PathToUtf8(Source.filename());

    Notify(Observer, ProgressPhase::HashSource, Name, Current, Total);
    std::string HashError;
    auto SourceHash = FileHasher::HashFile(Source, &HashError);
    if (!SourceHash)
    {
        Reason = "source hash failed: " + HashError;
        Notify(Observer, ProgressPhase::VerifyFail, Reason, Current, Total);
        return false;
    }

    Notify(Observer, ProgressPhase::Copy, Name, Current, Total);
    std::string CopyError;
    if (!FileCopier::CopyPreservingMetadata(Source, Destination, CopyError))
    {
        Reason = "copy failed: " + CopyError;
        FileCopier::RemoveQuietly(Destination);
        Notify(Observer, ProgressPhase::VerifyFail, Reason, Current, Total);
        return false;
    }

    Notify(Observer, ProgressPhase::HashDestination, Name, Current, Total);
    auto DestinationHash = FileHasher::HashFile(Destination, &HashError);
    if (!DestinationHash)
    {
        Reason = "destination hash failed: " + HashError;
        FileCopier::RemoveQuietly(Destination);
        Notify(Observer, ProgressPhase::VerifyFail, Reason, Current, Total);
        return false;
    }

    if (*SourceHash != *DestinationHash)
    {
        Reason = "hash mismatch: " + *SourceHash + " != " + *DestinationHash;
        FileCopier::RemoveQuietly(Destination);
        Notify(Observer, ProgressPhase::VerifyFail, Reason, Current, Total);
        return false;
    }

    Log.Debug("Verified " + Name + " blake3=" + *SourceHash);
    Notify(Observer, ProgressPhase::VerifyOk, Name, Current, Total);
    return true;
}

bool SuperCopyPipeline::CopyOrPretend(const FS::path& Source, const FS::path& Destination, std::string& Reason, RunState& State)
{
    if (State.DryRun)
    {
        Log.Info("[Dry Run] Would copy: " + Source.string() + " -> " + Destination.string());
        return true;
    }
    return CopyWithVerify(Source, Destination, Reason, State.Observer, State.Current, State.Total);
}

void SuperCopyPipeline::Remember(const FS::path& Source, RunState& State)
{
    State.Copied.insert(ProcessedSet::KeyFor(Source));
    if (State.Processed && !State.DryRun)
    {
        State.Processed->MarkProcessed(Source);
        State.Processed->Save(true);
    }
}

bool SuperCopyPipeline::AlreadyHandled(const FS::path& Source, const RunState& State) const
{
    return State.Copied.count(ProcessedSet::KeyFor(Source)) > 0;
}

CopyStats SuperCopyPipeline::SuperCopy(const FS::path& Source, const FS::path& Target, bool DryRun,
    ProgressObserver* Observer, ProcessedSet* Processed)
{
    RunState State;
    State.DryRun = DryRun;
    State.Observer = Observer;
    State.Processed = Processed;

    std::error_code ec;
    if (Source.empty() || !FS::is_directory(Source, ec))
    {
        Log.Error("Super copy source does not exist or is not a directory: " + Source.string());
        State.Stats.SourceValid = false;
        return State.Stats;
    }
    if (Target.empty())
    {
        Log.Error("Super copy target is not set");
        State.Stats.TargetValid = false;
        return State.Stats;
    }

    StopRequested = false;
    const FS::path SourceRoot = NormalizedAbsolute(Source);
    const FS::path TargetRoot = NormalizedAbsolute(Target);

    if (!DryRun)
    {
        FS::create_directories(TargetRoot, ec);
        if (ec)
        {
            Log.Error("Cannot create super copy target " + TargetRoot.string() + ": " + ec.message());
            State.Stats.TargetValid = false;
            return State.Stats;
        }
    }

    FileScanner Scanner(Log);
    if (IsInside(TargetRoot, SourceRoot))
    {
        Scanner.SetExcludes({ TargetRoot });
    }
    if (!Scanner.Scan(SourceRoot))
    {
        State.Stats.SourceValid = false;
        return State.Stats;
    }

    size_t TotalMedia = 0;
    std::vector<MediaCandidate> Candidates = PlannerImpl.CollectCandidates(Scanner.GetFiles(), TotalMedia);
    if (Candidates.empty())
    {
        Log.Warn("Super copy: no media files found under " + SourceRoot.string());
    }

    for (const auto& Candidate : Candidates)
    {
        State.Total += 1 + PlannerImpl.Relations().RelatedFiles(Candidate.Path).size();
    }
    State.Total = std::max<size_t>(1, State.Total);
    Log.Info("Super copy: " + std::to_string(Candidates.size()) + " media files, " + std::to_string(State.Total) + " operations");
    Notify(Observer, ProgressPhase::Progress, "", 0, State.Total);

    for (const auto& Candidate : Candidates)
    {
        if (StopRequested)
        {
            Log.Warn("Super copy: stop requested");
            break;
        }
        CopyCandidate(Candidate, TargetRoot, State);
    }

    if (!StopRequested)
    {
        CopyOverflow(Scanner.GetFiles(), SourceRoot, TargetRoot, State);
    }

    if (!DryRun && Config.DeleteEmptyFolders)
    {
        size_t Removed = FileCopier::RemoveEmptyDirectories(TargetRoot, Log);
        if (Removed > 0)
        {
            Log.Info("Super copy: removed " + std::to_string(Removed) + " empty folders");
        }
    }

    Log.Info("Super copy complete: ok=" + std::to_string(State.Stats.Ok) + " fail=" + std::to_string(State.Stats.Fail) +
        " skip=" + std::to_string(State.Stats.Skip));
    return State.Stats;
}

void SuperCopyPipeline::CopyCandidate(const MediaCandidate& Candidate, const FS::path& TargetRoot, RunState& State)
{
    const FS::path& FilePath = Candidate.Path;
    CopyReport& Report = State.Stats.Report;

    if (AlreadyHandled(FilePath, State))
    {
        ++State.Stats.Skip;
        Report.MediaSkip.push_back({ PathToUtf8(FilePath), "already copied" });
        State.Current += 1 + PlannerImpl.Relations().RelatedFiles(FilePath).size();
        Notify(State.Observer, ProgressPhase::Progress, "", std::min(State.Current, State.Total), State.Total);
        return;
    }
    if (State.Processed && State.Processed->IsProcessed(FilePath))
    {
        ++State.Stats.Skip;
        Report.MediaSkip.push_back({ PathToUtf8(FilePath), "previously copied" });
        State.Copied.insert(ProcessedSet::KeyFor(FilePath));
        for (const auto& Related : PlannerImpl.Relations().RelatedFiles(FilePath))
        {
            if (State.Processed->IsProcessed(Related))
            {
                State.Copied.insert(ProcessedSet::KeyFor(Related));
            }
        }
        State.Current += 1 + PlannerImpl.Relations().RelatedFiles(FilePath).size();
        Notify(State.Observer, ProgressPhase::Progress, "", std::min(State.Current, State.Total), State.Total);
        return;
    }

    PlacementPlan Plan = PlannerImpl.Plan(FilePath, Candidate.Kind, TargetRoot);

    ++State.Current;
    std::string Reason;
    bool Copied = CopyOrPretend(FilePath, Plan.PrimaryDestination, Reason, State);
    Notify(State.Observer, ProgressPhase::Progress, "", State.Current, State.Total);
    if (!Copied)
    {
        ++State.Stats.Fail;
        Report.MediaFail.push_back({ PathToUtf8(FilePath), Reason });
        Log.Error("Super copy failed " + FilePath.string() + ": " + Reason);
        State.Current += Plan.RelatedFiles.size();
        return;
    }

    ++State.Stats.Ok;
    Report.MediaOk.push_back({ PathToUtf8(FilePath), PathToUtf8(Plan.PrimaryDestination) });
    Log.Info("Super copy verified: " + FilePath.string() + " -> " + Plan.PrimaryDestination.string());
    Remember(FilePath, State);

    for (const auto& Related : Plan.RelatedFiles)
    {
        ++State.Current;
        if (AlreadyHandled(Related, State))
        {
            continue;
        }
        if (State.Processed && State.Processed->IsProcessed(Related))
        {
            State.Copied.insert(ProcessedSet::KeyFor(Related));
            continue;
        }

        FS::path RelatedDest = PlannerImpl.RelatedDestination(Plan, Related);
        std::string RelatedReason;
        bool RelatedCopied = CopyOrPretend(Related, RelatedDest, RelatedReason, State);
        Notify(State.Observer, ProgressPhase::Progress, "", State.Current, State.Total);
        if (!RelatedCopied)
        {
            Report.MediaFail.push_back({ PathToUtf8(Related), RelatedReason });
            Log.Warn("Super copy related failed " + Related.string() + ": " + RelatedReason);
            continue;
        }

        ++State.Stats.Ok;
        Report.MediaOk.push_back({ PathToUtf8(Related), PathToUtf8(RelatedDest) });
        Log.Info("Super copy verified related: " + Related.string() + " -> " + RelatedDest.string());
        Remember(Related, State);
    }
}

void SuperCopyPipeline::CopyOverflow(const std::vector<ScannedFileInfo>& Files, const FS::path& SourceRoot, const FS::path& TargetRoot, RunState& State)
{
    const FS::path OverflowRoot = TargetRoot / PathFromUtf8(Config.OverflowSubfolder);
    const MediaClassifier& Classifier = PlannerImpl.Classifier();

    std::vector<FS::path> Pending;
    for (const auto& File : Files)
    {
        if (AlreadyHandled(File.Path, State) || Classifier.ShouldLeaveInPlace(File.Path))
        {
            continue;
        }
        if (State.Processed && State.Processed->IsProcessed(File.Path))
        {
            continue;
        }
        Pending.push_back(File.Path);
    }
    if (Pending.empty())
    {
        return;
    }

    // Total only grows here, so Current stays within it.
    State.Total = std::max(State.Total, State.Current) + Pending.size();
    Notify(State.Observer, ProgressPhase::Progress, "overflow files", State.Current, State.Total);

    for (const auto& FilePath : Pending)
    {
        if (StopRequested)
        {
            Log.Warn("Super copy: stop requested during overflow copy");
            return;
        }

        const FS::path Relative = FilePath.lexically_relative(SourceRoot);
        const std::string RelativeText = PathToUtf8(Relative);
        const FS::path Destination = OverflowRoot / Relative;

        ++State.Current;
        Notify(State.Observer, ProgressPhase::Progress, RelativeText, State.Current, State.Total);

        if (State.DryRun)
        {
            Log.Info("[Dry Run] Would copy other file: " + FilePath.string() + " -> " + Destination.string());
            ++State.Stats.Ok;
            State.Stats.Report.OtherOk.push_back(RelativeText);
            continue;
        }

        std::string Error;
        if (!FileCopier::CopyPreservingMetadata(FilePath, Destination, Error))
        {
            Log.Warn("Super copy other file failed " + RelativeText + ": " + Error);
            State.Stats.Report.OtherFail.push_back({ RelativeText, Error });
            continue;
        }
        ++State.Stats.Ok;
        State.Stats.Report.OtherOk.push_back(RelativeText);
        Log.Info("Super copy other file: " + RelativeText);
        Remember(FilePath, State);
    }
}
