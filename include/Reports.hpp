#pragma once

#include <cstddef>
#include <string>
#include <utility>
#include <vector>
#include <nlohmann/json.hpp>

enum class ReportAction
{
    Move,
    Related,
    Skip,
    AlreadyProcessed,
    Fail,
    FailRelated
};

std::string ToString(ReportAction Action);

struct ReportEntry
{
    ReportAction Action = ReportAction::Move;
    std::string Source;
    std::string DestinationOrReason;
};

struct OrganizeReport
{
    std::string Mode = "organize";
    std::string Source;
    std::string Output;
    size_t TotalMedia = 0;
    size_t ToProcess = 0;
    std::vector<ReportEntry> Entries;
    bool SourceValid = true;

    size_t Count(ReportAction Action) const;
    nlohmann::ordered_json ToJson() const;
};

// (source, destination) for successes, (source, reason) for skips and failures.
using PathPair = std::pair<std::string, std::string>;

struct CopyReport
{
    std::vector<PathPair> MediaOk;
    std::vector<PathPair> MediaSkip;
    std::vector<PathPair> MediaFail;
    std::vector<std::string> OtherOk;
    std::vector<PathPair> OtherFail;
};

struct CopyStats
{
    size_t Ok = 0;
    size_t Fail = 0;
    size_t Skip = 0;
    CopyReport Report;
    bool SourceValid = true;
    bool TargetValid = true;

    nlohmann::ordered_json ToJson() const;
};
