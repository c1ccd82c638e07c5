#pragma once

#include <atomic>
#include <filesystem>

#include "RunContext.hpp"
#include "MediaPlanner.hpp"
#include "ProcessedSet.hpp"
#include "Reports.hpp"

// Scan + classify + move into output/date/kind/device.
class OrganizePipeline
{
public:
    explicit OrganizePipeline(const RunContext& Context);

    // An empty Output organises in place under Source.
    OrganizeReport ScanAndOrganize(const std::filesystem::path& Source, const std::filesystem::path& Output, bool DryRun, bool ScanOnly);

    // Checked before each file.
    void RequestStop();

private:
    void ProcessFile(const MediaCandidate& Candidate, const std::filesystem::path& OutputRoot, bool DryRun, OrganizeReport& Report);
    void PlanOnly(const MediaCandidate& Candidate, const std::filesystem::path& OutputRoot, OrganizeReport& Report);
    bool IsOrganizedLocation(const std::filesystem::path& FilePath, const std::filesystem::path& OutputRoot) const;
    bool Transfer(const std::filesystem::path& Source, const std::filesystem::path& Destination, std::string& Error) const;

    const AppConfig& Config;
    Logger& Log;
    MediaPlanner PlannerImpl;
    ProcessedSet ProcessedImpl;
    std::atomic<bool> StopRequested{ false };
};
