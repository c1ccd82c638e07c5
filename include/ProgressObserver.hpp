#pragma once

#include <cstddef>
#include <string>

enum class ProgressPhase
{
    Progress,
    HashSource,
    Copy,
    HashDestination,
    VerifyOk,
    VerifyFail
};

inline std::string ToString(ProgressPhase Phase)
{
    switch (Phase)
    {
    case ProgressPhase::Progress:        return "progress";
    case ProgressPhase::HashSource:      return "hash_src";
    case ProgressPhase::Copy:            return "copy";
    case ProgressPhase::HashDestination: return "hash_dest";
    case ProgressPhase::VerifyOk:        return "verify_ok";
    case ProgressPhase::VerifyFail:      return "verify_fail";
    }
    return "progress";
}

// Receives copy progress. Current never decreases within one run; Total is fixed
// up front and only grows once, when the overflow files are counted.
class ProgressObserver
{
public:
    virtual ~ProgressObserver() = default;

    virtual void OnProgress(ProgressPhase Phase, const std::string& Message, size_t Current, size_t Total) = 0;
};
