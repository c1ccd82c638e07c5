#pragma once

#include <filesystem>
#include <iosfwd>
#include <string>

#include "ConfigParser.hpp"
#include "Logger.hpp"
#include "ProgressObserver.hpp"

struct CommandLine
{
    std::string ConfigFile;
    std::string Source;
    std::string Output;
    bool SuperCopy = false;
    bool ScanOnly = false;
    bool DryRun = false;
    bool Json = false;
    bool Watch = false;
    bool Help = false;
};

// Prints one line per copy phase.
class ConsoleProgress : public ProgressObserver
{
public:
    explicit ConsoleProgress(std::ostream& Out);

    void OnProgress(ProgressPhase Phase, const std::string& Message, size_t Current, size_t Total) override;

private:
    std::ostream& Out;
};

class ControlFlow
{
public:
    ControlFlow() = default;

    int Run(int argc, char* argv[]);

    // False on an unknown option or a missing option value; Error names it.
    static bool ParseArguments(int argc, char* argv[], CommandLine& Args, std::string& Error);

    // --config, else $CONFIG_DIR/config.json, else ./config.json.
    static std::filesystem::path ResolveConfigFile(const CommandLine& Args, const std::filesystem::path& ExecutableDir);

    static void PrintUsage(std::ostream& Out);

private:
    ConfigParser Parser;
    Logger Log;
    std::filesystem::path ConfigFile;

    bool LoadConfig(const CommandLine& Args, const std::filesystem::path& ExecutableDir);
    void SaveGivenPaths();

    int RunOrganize(const CommandLine& Args);
    int RunSuperCopy(const CommandLine& Args);
    int RunWatch();
};
