#include "Reports.hpp"

#include <algorithm>

std::string ToString(ReportAction Action)
{
    switch (Action)
    {
    case ReportAction::Move:             return "move";
    case ReportAction::Related:          return "related";
    case ReportAction::Skip:             return "skip";
    case ReportAction::AlreadyProcessed: return "already_processed";
    case ReportAction::Fail:             return "fail";
    case ReportAction::FailRelated:      return "fail_related";
    }
    return "fail";
}

size_t OrganizeReport::Count(ReportAction Action) const
{
    return static_cast<size_t>(std::count_if(Entries.begin(), Entries.end(), [Action](const ReportEntry& Entry) {
        return Entry.Action == Action;
    }));
}

nlohmann::ordered_json OrganizeReport::ToJson() const
{
    nlohmann::ordered_json Document;
    Document["mode"] = Mode;
    Document["source"] = Source;
    Document["output"] = Output;
    Document["total_media"] = TotalMedia;
    Document["to_process"] = ToProcess;
    Document["entries"] = nlohmann::ordered_json::array();
    for (const auto& Entry : Entries)
    {
        Document["entries"].push_back(nlohmann::ordered_json::array({ ToString(Entry.Action), Entry.Source, Entry.DestinationOrReason }));
    }
    return Document;
}

namespace
{
    nlohmann::ordered_json PairList(const std::vector<PathPair>& Pairs)
    {
        nlohmann::ordered_json List = nlohmann::ordered_json::array();
        for (const auto& [First, Second] : Pairs)
        {
            List.push_back(nlohmann::ordered_json::array({ First, Second }));
        }
        return List;
    }
}

nlohmann::ordered_json CopyStats::ToJson() const
{
    nlohmann::ordered_json Document;
    Document["ok"] = Ok;
    Document["fail"] = Fail;
    Document["skip"] = Skip;

    nlohmann::ordered_json ReportDoc;
    ReportDoc["media_ok"] = PairList(Report.MediaOk);
    ReportDoc["media_skip"] = PairList(Report.MediaSkip);
    ReportDoc["media_fail"] = PairList(Report.MediaFail);
    ReportDoc["other_ok"] = Report.OtherOk;
    ReportDoc["other_fail"] = PairList(Report.OtherFail);
    Document["report"] = ReportDoc;
    return Document;
}
