#include <atomic>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <string>
#include <vector>

#include "ControlFlow.hpp"
#include "AutoCopyWatcher.hpp"
#include "OrganizePipeline.hpp"
#include "SuperCopyPipeline.hpp"
#include "StringUtils.hpp"

namespace FS = std::filesystem;

namespace
{
    // Routes SIGINT/SIGTERM to RequestStop() of the pipeline that is running.
    template <typename T>
    class StopOnSignal
    {
    public:
        explicit StopOnSignal(T& Target)
        {
            Active = &Target;
            std::signal(SIGINT, &StopOnSignal::Handle);
            std::signal(SIGTERM, &StopOnSignal::Handle);
        }

        ~StopOnSignal()
        {
            std::signal(SIGINT, SIG_DFL);
            std::signal(SIGTERM, SIG_DFL);
            Active = nullptr;
        }

        StopOnSignal(const StopOnSignal&) = delete;
        StopOnSignal& operator=(const StopOnSignal&) = delete;

    private:
        static inline std::atomic<T*> Active{ nullptr };

        static void Handle(int)
        {
            if (T* Target = Active.load())
            {
                Target->RequestStop();
            }
        }
    };

    FS::path ExecutableDirectory(const char* Argv0)
    {
        std::error_code ec;
#ifndef _WIN32
        FS::path Self = FS::read_symlink("/proc/self/exe", ec);
        if (!ec && !Self.empty())
        {
            return Self.parent_path();
        }
        ec.clear();
#endif
        if (!Argv0)
        {
            return FS::current_path(ec);
        }
        FS::path Abs = FS::absolute(FS::path(Argv0), ec);
        return ec ? FS::path() : Abs.parent_path();
    }

    void PrintJson(const nlohmann::ordered_json& Document)
    {
        std::cout << Document.dump(2, ' ', false, nlohmann::ordered_json::error_handler_t::replace) << "\n";
    }
}

ConsoleProgress::ConsoleProgress(std::ostream& Out)
    : Out(Out)
{
}

void ConsoleProgress::OnProgress(ProgressPhase Phase, const std::string& Message, size_t Current, size_t Total)
{
    Out << "[" << Current << "/" << Total << "] " << ToString(Phase);
    if (!Message.empty())
    {
        Out << " " << Message;
    }
    Out << "\n";
}

void ControlFlow::PrintUsage(std::ostream& Out)
{
    Out << "Usage: MediaFiler [options]\n"
        << "  --config FILE       config file (default $CONFIG_DIR/config.json or ./config.json)\n"
        << "  -s, --source DIR    source directory\n"
        << "  -o, --output DIR    output directory (organize) or target directory (super copy)\n"
        << "  --super-copy        hash-verified copy instead of move\n"
        << "  --scan-only         plan only, touch nothing\n"
        << "  --dry-run           report what would happen without moving or copying\n"
        << "  --json              print the structured report\n"
        << "  --watch             watch auto_copy.watch_paths and copy new devices\n"
        << "  --help              show this help\n";
}

bool ControlFlow::ParseArguments(int argc, char* argv[], CommandLine& Args, std::string& Error)
{
    for (int i = 1; i < argc; ++i)
    {
        const std::string Arg = argv[i];

        auto NextValue = [&](std::string& Target) -> bool
        {
            if (i + 1 >= argc)
            {
                Error = "Missing value for " + Arg;
                return false;
            }
            Target = argv[++i];
            return true;
        };

        if (Arg == "--config")
        {
            if (!NextValue(Args.ConfigFile)) return false;
        }
        else if (Arg == "-s" || Arg == "--source")
        {
            if (!NextValue(Args.Source)) return false;
        }
        else if (Arg == "-o" || Arg == "--output")
        {
            if (!NextValue(Args.Output)) return false;
        }
        else if (Arg == "--super-copy")
        {
            Args.SuperCopy = true;
        }
        else if (Arg == "--scan-only")
        {
            Args.ScanOnly = true;
        }
        else if (Arg == "--dry-run")
        {
            Args.DryRun = true;
        }
        else if (Arg == "--json")
        {
            Args.Json = true;
        }
        else if (Arg == "--watch")
        {
            Args.Watch = true;
        }
        else if (Arg == "-h" || Arg == "--help")
        {
            Args.Help = true;
        }
        else
        {
            Error = "Unknown option: " + Arg;
            return false;
        }
    }
    return true;
}

FS::path ControlFlow::ResolveConfigFile(const CommandLine& Args, const FS::path& ExecutableDir)
{
    if (!Args.ConfigFile.empty())
    {
        return PathFromUtf8(Args.ConfigFile);
    }

    const char* ConfigDir = std::getenv("CONFIG_DIR");
    if (ConfigDir && !Trim(ConfigDir).empty())
    {
        const FS::path Dir = PathFromUtf8(Trim(ConfigDir));
        std::error_code ec;
        FS::create_directories(Dir, ec);

        // Seed the pattern database shipped next to the executable.
        const FS::path Patterns = Dir / "device_suffixes.json";
        const FS::path Shipped = ExecutableDir / "device_suffixes.json";
        if (!FS::exists(Patterns, ec) && !ExecutableDir.empty() && FS::exists(Shipped, ec))
        {
            FS::copy_file(Shipped, Patterns, ec);
            if (ec)
            {
                std::cerr << "Could not seed " << Patterns.string() << ": " << ec.message() << "\n";
            }
        }
        return Dir / "config.json";
    }
    return FS::path("config.json");
}

bool ControlFlow::LoadConfig(const CommandLine& Args, const FS::path& ExecutableDir)
{
    ConfigFile = ResolveConfigFile(Args, ExecutableDir);
    const bool Parsed = Parser.Parse(ConfigFile.string());
    const AppConfig& Config = Parser.GetConfig();

    if (!Log.Init(Config.ResolveDataPath(Config.LogDir).string(), Config.MaxLogFiles, ToLogLevel(Config.LogLevelName)))
    {
        std::cerr << "Logging to file is unavailable, continuing without a log file.\n";
    }
    Log.CleanupOldLogs();

    if (Parser.CreatedDefaultFile())
    {
        std::cout << "Created default config at " << ConfigFile.string() << "\n";
        Log.Info("Created default config at " + ConfigFile.string());
    }

    if (!Parsed)
    {
        for (const auto& Error : Parser.GetErrors())
        {
            std::cerr << "Config Error: " << Error << "\n";
            Log.Error(Error);
        }
        std::cerr << "Check Errors and Fix Them, Exiting\n";
        Log.Error("Config invalid, exiting");
        return false;
    }

    for (const auto& Info : Parser.GetInfos())
    {
        Log.Info(Info);
    }
    Log.Info("Config Parsed Successfully: " + ConfigFile.string());
    return true;
}

void ControlFlow::SaveGivenPaths()
{
    std::string Error;
    if (!ConfigParser::Save(ConfigFile.string(), Parser.GetConfig(), Error))
    {
        Log.Warn("Could not save paths to config: " + Error);
        std::cerr << "Could not save paths to config: " << Error << "\n";
    }
}

int ControlFlow::Run(int argc, char* argv[])
{
    CommandLine Args;
    std::string ArgError;
    if (!ParseArguments(argc, argv, Args, ArgError))
    {
        std::cerr << ArgError << "\n";
        PrintUsage(std::cerr);
        return 1;
    }
    if (Args.Help)
    {
        PrintUsage(std::cout);
        return 0;
    }

    if (!LoadConfig(Args, ExecutableDirectory(argc > 0 ? argv[0] : nullptr)))
    {
        return 1;
    }

    int Result = 0;
    if (Args.Watch)
    {
        Result = RunWatch();
    }
    else if (Args.SuperCopy)
    {
        Result = RunSuperCopy(Args);
    }
    else
    {
        Result = RunOrganize(Args);
    }

    if (!Args.Json && !Log.CurrentLogFilePath.empty())
    {
        std::cout << "Logs Saved to : " << Log.CurrentLogFilePath << "\n";
    }
    return Result;
}

int ControlFlow::RunOrganize(const CommandLine& Args)
{
    AppConfig& Mutable = Parser.GetMutableConfig();
    if (!Args.Source.empty() || !Args.Output.empty())
    {
        if (!Args.Source.empty())
        {
            Mutable.SourcePath = Args.Source;
        }
        if (!Args.Output.empty())
        {
            Mutable.OutputPath = Args.Output;
        }
        SaveGivenPaths();
    }

    const AppConfig& Config = Parser.GetConfig();
    if (Trim(Config.SourcePath).empty())
    {
        std::cerr << "No source directory: pass --source or set source_path in " << ConfigFile.string() << "\n";
        Log.Error("Source path is not set");
        return 1;
    }

    const FS::path Source = PathFromUtf8(Trim(Config.SourcePath));
    const FS::path Output = PathFromUtf8(Trim(Config.OutputPath));

    RunContext Context{ Config, Log };
    OrganizePipeline Pipeline(Context);
    StopOnSignal<OrganizePipeline> StopGuard(Pipeline);

    if (!Args.Json)
    {
        std::cout << (Args.ScanOnly ? "Scanning " : "Organizing ") << Source.string() << "\n";
    }
    OrganizeReport Report = Pipeline.ScanAndOrganize(Source, Output, Args.DryRun, Args.ScanOnly);
    if (!Report.SourceValid)
    {
        std::cerr << "Source does not exist or is not a directory: " << Source.string() << "\n";
        return 1;
    }

    if (Args.Json)
    {
        PrintJson(Report.ToJson());
        return 0;
    }

    std::cout << "Media found: " << Report.TotalMedia << ", to process: " << Report.ToProcess << "\n";
    if (Args.ScanOnly)
    {
        for (const auto& Entry : Report.Entries)
        {
            std::cout << "  " << ToString(Entry.Action) << ": " << Entry.Source << " -> " << Entry.DestinationOrReason << "\n";
        }
    }
    std::cout << (Args.DryRun ? "[Dry Run] " : "")
              << "moved=" << Report.Count(ReportAction::Move)
              << " related=" << Report.Count(ReportAction::Related)
              << " skipped=" << Report.Count(ReportAction::Skip) + Report.Count(ReportAction::AlreadyProcessed)
              << " failed=" << Report.Count(ReportAction::Fail) + Report.Count(ReportAction::FailRelated) << "\n";
    return 0;
}

int ControlFlow::RunSuperCopy(const CommandLine& Args)
{
    AppConfig& Mutable = Parser.GetMutableConfig();
    if (!Args.Source.empty() || !Args.Output.empty())
    {
        if (!Args.Source.empty())
        {
            Mutable.SuperCopySource = Args.Source;
        }
        if (!Args.Output.empty())
        {
            Mutable.SuperCopyTarget = Args.Output;
        }
        SaveGivenPaths();
    }

    const AppConfig& Config = Parser.GetConfig();
    if (Trim(Config.SuperCopySource).empty() || Trim(Config.SuperCopyTarget).empty())
    {
        std::cerr << "Super copy needs both super_copy_source and super_copy_target (or --source and --output)\n";
        Log.Error("Super copy source or target is not set");
        return 1;
    }

    const FS::path Source = PathFromUtf8(Trim(Config.SuperCopySource));
    const FS::path Target = PathFromUtf8(Trim(Config.SuperCopyTarget));

    RunContext Context{ Config, Log };
    SuperCopyPipeline Pipeline(Context);
    StopOnSignal<SuperCopyPipeline> StopGuard(Pipeline);

    ConsoleProgress Progress(Args.Json ? std::cerr : std::cout);
    CopyStats Stats = Pipeline.SuperCopy(Source, Target, Args.DryRun, &Progress);
    if (!Stats.SourceValid)
    {
        std::cerr << "Super copy source does not exist or is not a directory: " << Source.string() << "\n";
        return 1;
    }
    if (!Stats.TargetValid)
    {
        std::cerr << "Super copy target cannot be created: " << Target.string() << "\n";
        return 1;
    }

    if (Args.Json)
    {
        PrintJson(Stats.ToJson());
        return 0;
    }

    std::cout << (Args.DryRun ? "[Dry Run] " : "") << "Super copy complete: ok=" << Stats.Ok
              << " fail=" << Stats.Fail << " skip=" << Stats.Skip << "\n";
    for (const auto& [File, Reason] : Stats.Report.MediaFail)
    {
        std::cout << "  failed: " << File << " (" << Reason << ")\n";
    }
    for (const auto& [File, Reason] : Stats.Report.OtherFail)
    {
        std::cout << "  failed: " << File << " (" << Reason << ")\n";
    }
    return 0;
}

int ControlFlow::RunWatch()
{
    RunContext Context{ Parser.GetConfig(), Log };
    AutoCopyWatcher Watcher(Context);
    StopOnSignal<AutoCopyWatcher> StopGuard(Watcher);

    std::cout << "Watching for devices, Ctrl+C to stop\n";
    return Watcher.Run();
}
