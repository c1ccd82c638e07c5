#pragma once

#include <atomic>
#include <filesystem>
#include <vector>

#include "RunContext.hpp"
#include "ProcessedSet.hpp"
#include "ProgressObserver.hpp"
#include "SuperCopyPipeline.hpp"

// Polls the watch paths for mounted devices and super-copies each one into the target.
class AutoCopyWatcher
{
public:
    static constexpr unsigned int MinPollIntervalSec = 15;
    static constexpr const char* ProcessedFileName = "auto_copy_processed.json";

    explicit AutoCopyWatcher(const RunContext& Context);

    // Returns the process exit code. Loops until RequestStop().
    int Run(ProgressObserver* Observer = nullptr);

    // One pass over every discovered device. False when the target is unusable.
    bool PollOnce(ProgressObserver* Observer = nullptr);

    // First-level, non-hidden subdirectories of every watch path.
    std::vector<std::filesystem::path> DiscoverSources() const;

    void RequestStop();

    ProcessedSet& Processed();

private:
    bool PrepareTarget();
    void SleepInterval();

    const AppConfig& Config;
    Logger& Log;
    SuperCopyPipeline Pipeline;
    ProcessedSet ProcessedImpl;
    std::filesystem::path Target;
    std::atomic<bool> StopRequested{ false };
};
