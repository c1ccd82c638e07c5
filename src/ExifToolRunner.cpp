#include "ExifToolRunner.hpp"

#include <chrono>
#include <utility>
#include <nlohmann/json.hpp>

#ifndef _WIN32
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>
#endif

ExifToolRunner::ExifToolRunner(std::string ExecutablePath, unsigned int TimeoutSec, Logger& Log)
    : ExecutablePath(std::move(ExecutablePath)), TimeoutSec(TimeoutSec), Log(Log)
{
}

std::map<std::string, std::string> ExifToolRunner::Query(const std::filesystem::path& FilePath, const std::vector<std::string>& Tags)
{
    std::map<std::string, std::string> Result;
    if (Missing || Tags.empty())
    {
        return Result;
    }

    std::vector<std::string> Args{ ExecutablePath, "-s", "-json" };
    for (const auto& Tag : Tags)
    {
        Args.push_back("-" + Tag);
    }
    Args.push_back(FilePath.string());

    std::string Output;
    std::string Error;
    if (!RunCapture(Args, Output, Error))
    {
        Log.Debug("exiftool read failed for " + FilePath.filename().string() + ": " + Error);
        return Result;
    }

    try
    {
        nlohmann::json Document = nlohmann::json::parse(Output);
        if (!Document.is_array() || Document.empty() || !Document[0].is_object())
        {
            return Result;
        }
        for (auto it = Document[0].begin(); it != Document[0].end(); ++it)
        {
            if (it.key() == "SourceFile" || it->is_null())
            {
                continue;
            }
            std::string Value = it->is_string() ? it->get<std::string>() : it->dump();
            Value.erase(0, Value.find_first_not_of(" \t\r\n"));
            Value.erase(Value.find_last_not_of(" \t\r\n") + 1);
            if (!Value.empty())
            {
                Result[it.key()] = Value;
            }
        }
    }
    catch (const nlohmann::json::exception& e)
    {
        Log.Debug("exiftool returned malformed JSON for " + FilePath.filename().string() + ": " + e.what());
        Result.clear();
    }
    return Result;
}

#ifdef _WIN32

bool ExifToolRunner::RunCapture(const std::vector<std::string>& Args, std::string& Output, std::string& Error)
{
    (void)Args;
    (void)Output;
    Missing = true;
    Error = "subprocess metadata probing is not supported on this platform";
    return false;
}

#else

bool ExifToolRunner::RunCapture(const std::vector<std::string>& Args, std::string& Output, std::string& Error)
{
    int Pipe[2];
    if (pipe(Pipe) != 0)
    {
        Error = std::string("pipe failed: ") + strerror(errno);
        return false;
    }

    pid_t Pid = fork();
    if (Pid < 0)
    {
        Error = std::string("fork failed: ") + strerror(errno);
        close(Pipe[0]);
        close(Pipe[1]);
        return false;
    }

    if (Pid == 0)
    {
        dup2(Pipe[1], STDOUT_FILENO);
        int DevNull = open("/dev/null", O_WRONLY);
        if (DevNull >= 0)
        {
            dup2(DevNull, STDERR_FILENO);
            close(DevNull);
        }
        close(Pipe[0]);
        close(Pipe[1]);

        std::vector<char*> Argv;
        Argv.reserve(Args.size() + 1);
        for (const auto& Arg : Args)
        {
            Argv.push_back(const_cast<char*>(Arg.c_str()));
        }
        Argv.push_back(nullptr);

        execvp(Argv[0], Argv.data());
        _exit(127);
    }

    close(Pipe[1]);

    using namespace std::chrono;
    const auto Deadline = steady_clock::now() + seconds(TimeoutSec);
    bool TimedOut = false;
    char Buffer[4096];

    while (true)
    {
        auto Remaining = duration_cast<milliseconds>(Deadline - steady_clock::now()).count();
        if (Remaining <= 0)
        {
            TimedOut = true;
            break;
        }

        struct pollfd Pfd{ Pipe[0], POLLIN, 0 };
        int Ready = poll(&Pfd, 1, static_cast<int>(Remaining));
        if (Ready < 0)
        {
            if (errno == EINTR) continue;
            Error = std::string("poll failed: ") + strerror(errno);
            break;
        }
        if (Ready == 0)
        {
            TimedOut = true;
            break;
        }

        ssize_t Count = read(Pipe[0], Buffer, sizeof(Buffer));
        if (Count < 0)
        {
            if (errno == EINTR) continue;
            Error = std::string("read failed: ") + strerror(errno);
            break;
        }
        if (Count == 0)
        {
            break;
        }
        Output.append(Buffer, static_cast<size_t>(Count));
    }
    close(Pipe[0]);

    if (TimedOut)
    {
        kill(Pid, SIGKILL);
    }

    int Status = 0;
    while (waitpid(Pid, &Status, 0) < 0 && errno == EINTR)
    {
    }

    if (TimedOut)
    {
        Error = "timed out after " + std::to_string(TimeoutSec) + "s";
        return false;
    }
    if (!Error.empty())
    {
        return false;
    }
    if (!WIFEXITED(Status))
    {
        Error = "terminated abnormally";
        return false;
    }

    int ExitCode = WEXITSTATUS(Status);
    if (ExitCode == 127)
    {
        Missing = true;
        Log.Info("exiftool not found at '" + ExecutablePath + "', metadata probing falls back to built-in readers.");
        Error = "executable not found";
        return false;
    }
    if (ExitCode != 0 || Output.empty())
    {
        Error = "exit code " + std::to_string(ExitCode);
        return false;
    }
    return true;
}

#endif
