#pragma once

#include <atomic>
#include <filesystem>
#include <set>
#include <string>

#include "RunContext.hpp"
#include "MediaPlanner.hpp"
#include "ProcessedSet.hpp"
#include "ProgressObserver.hpp"
#include "Reports.hpp"

// Classified copy into target/date/kind/device with BLAKE3 verification of every media copy.
// Everything else in the source tree lands under target/<overflow_subfolder>/<relative path>.
class SuperCopyPipeline
{
public:
    explicit SuperCopyPipeline(const RunContext& Context);

    // Processed, when given, is consulted and persisted after every handled file.
    CopyStats SuperCopy(const std::filesystem::path& Source, const std::filesystem::path& Target, bool DryRun,
        ProgressObserver* Observer = nullptr, ProcessedSet* Processed = nullptr);

    void RequestStop();

    // Source digest, copy, destination digest, compare. The destination is removed unless verified.
    bool CopyWithVerify(const std::filesystem::path& Source, const std::filesystem::path& Destination, std::string& Reason,
        ProgressObserver* Observer, size_t Current, size_t Total);

private:
    struct RunState
    {
        CopyStats Stats;
        std::set<std::string> Copied;
        size_t Current = 0;
        size_t Total = 0;
        bool DryRun = false;
        ProgressObserver* Observer = nullptr;
        ProcessedSet* Processed = nullptr;
    };

    void CopyCandidate(const MediaCandidate& Candidate, const std::filesystem::path& TargetRoot, RunState& State);
    void CopyOverflow(const std::vector<ScannedFileInfo>& Files, const std::filesystem::path& SourceRoot, const std::filesystem::path& TargetRoot, RunState& State);
    bool CopyOrPretend(const std::filesystem::path& Source, const std::filesystem::path& Destination, std::string& Reason, RunState& State);
    void Remember(const std::filesystem::path& Source, RunState& State);
    bool AlreadyHandled(const std::filesystem::path& Source, const RunState& State) const;

    void Notify(ProgressObserver* Observer, ProgressPhase Phase, const std::string& Message, size_t Current, size_t Total);

    const AppConfig& Config;
    Logger& Log;
    MediaPlanner PlannerImpl;
    std::atomic<bool> StopRequested{ false };
};
