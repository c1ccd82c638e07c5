#include "AutoCopyWatcher.hpp"
#include "StringUtils.hpp"

#include <algorithm>
#include <chrono>
#include <thread>

namespace FS = std::filesystem;

AutoCopyWatcher::AutoCopyWatcher(const RunContext& Context)
    : Config(Context.Config),
      Log(Context.Log),
      Pipeline(Context),
      ProcessedImpl(Context.Config.ResolveDataPath(ProcessedFileName), Context.Log),
      Target(PathFromUtf8(Trim(Context.Config.AutoCopy.TargetPath)))
{
}

void AutoCopyWatcher::RequestStop()
{
    StopRequested = true;
    Pipeline.RequestStop();
}

ProcessedSet& AutoCopyWatcher::Processed()
{
    return ProcessedImpl;
}

std::vector<FS::path> AutoCopyWatcher::DiscoverSources() const
{
    std::vector<FS::path> Sources;
    for (const auto& WatchStr : Config.AutoCopy.WatchPaths)
    {
        const FS::path WatchPath = PathFromUtf8(WatchStr);
        std::error_code ec;
        if (!FS::is_directory(WatchPath, ec))
        {
            continue;
        }

        std::vector<FS::path> Found;
        for (FS::directory_iterator It(WatchPath, FS::directory_options::skip_permission_denied, ec), End; !ec && It != End; It.increment(ec))
        {
            const std::string Name = PathToUtf8(It->path().filename());
            if (Name.empty() || Name.front() == '.')
            {
                continue;
            }
            std::error_code StatusEc;
            if (It->is_directory(StatusEc) && !StatusEc)
            {
                Found.push_back(It->path());
            }
        }
        if (ec)
        {
            Log.Debug("Listing " + WatchPath.string() + " failed: " + ec.message());
        }

        std::sort(Found.begin(), Found.end());
        Sources.insert(Sources.end(), Found.begin(), Found.end());
    }
    return Sources;
}

bool AutoCopyWatcher::PrepareTarget()
{
    if (Target.empty())
    {
        Log.Error("auto_copy.target_path is not set");
        return false;
    }

    std::error_code ec;
    if (FS::is_directory(Target, ec))
    {
        return true;
    }
    FS::create_directories(Target, ec);
    if (ec)
    {
        Log.Error("Cannot create auto copy target " + Target.string() + ": " + ec.message());
        return false;
    }
    Log.Info("Created auto copy target: " + Target.string());
    return true;
}

bool AutoCopyWatcher::PollOnce(ProgressObserver* Observer)
{
    if (!PrepareTarget())
    {
        return false;
    }

    for (const auto& Source : DiscoverSources())
    {
        if (StopRequested)
        {
            break;
        }
        Log.Info("Device detected at " + Source.string() + ", starting super copy");
        CopyStats Stats = Pipeline.SuperCopy(Source, Target, false, Observer, &ProcessedImpl);
        Log.Info("Super copy of " + Source.string() + " done: ok=" + std::to_string(Stats.Ok) +
            " fail=" + std::to_string(Stats.Fail) + " skip=" + std::to_string(Stats.Skip));
    }
    return true;
}

void AutoCopyWatcher::SleepInterval()
{
    const unsigned int Interval = std::max(MinPollIntervalSec, Config.AutoCopy.PollIntervalSec);
    const auto Deadline = std::chrono::steady_clock::now() + std::chrono::seconds(Interval);
    while (!StopRequested && std::chrono::steady_clock::now() < Deadline)
    {
        std::this_thread::sleep_for(std::chrono::milliseconds(250));
    }
}

int AutoCopyWatcher::Run(ProgressObserver* Observer)
{
    if (!Config.AutoCopy.Enabled)
    {
        Log.Info("Auto copy is disabled (set auto_copy.enabled to true in the config)");
        return 0;
    }
    if (!PrepareTarget())
    {
        return 1;
    }

    ProcessedImpl.Load();
    StopRequested = false;

    std::string WatchList;
    for (const auto& WatchStr : Config.AutoCopy.WatchPaths)
    {
        WatchList += (WatchList.empty() ? "" : ", ") + WatchStr;
    }
    Log.Info("Auto copy watching [" + WatchList + "] into " + Target.string() + " every " +
        std::to_string(std::max(MinPollIntervalSec, Config.AutoCopy.PollIntervalSec)) + "s");

    while (!StopRequested)
    {
        if (!PollOnce(Observer))
        {
            return 1;
        }
        SleepInterval();
    }

    ProcessedImpl.Save(false);
    Log.Info("Auto copy stopped");
    return 0;
}
