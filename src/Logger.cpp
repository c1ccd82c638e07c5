#include "Logger.hpp"
#include <chrono>
#include <iomanip>
#include <sstream>
#include <filesystem>
#include <iostream>
#include <vector>
#include <algorithm>
#include <unordered_map>

namespace FS = std::filesystem;

static const char* LogFilePrefix = "MediaFiler_Log";

LogLevel ToLogLevel(const std::string& LevelStr)
{
    static const std::unordered_map<std::string, LogLevel> LevelMap = {
        { "debug", LogLevel::DEBUG },
        { "info",  LogLevel::INFO },
        { "warn",  LogLevel::WARN },
        { "error", LogLevel::ERROR }
    };

    auto it = LevelMap.find(LevelStr);
    return (it != LevelMap.end()) ? it->second : LogLevel::INFO; // fallback
}

bool Logger::Init(const std::string& LogDir, unsigned short int MaxLogFiles, LogLevel MinLevel)
{
    LogDirectory = LogDir;
    MaxFiles = MaxLogFiles;
    MinimumLevel = MinLevel;

    std::error_code ec;
    if (!FS::exists(LogDirectory, ec))
    {
        FS::create_directories(LogDirectory, ec);
        if (ec)
        {
            std::cerr << "Logger: Failed to create log directory: " << LogDirectory << " - " << ec.message() << "\n";
            return false;
        }
    }

    CurrentLogFilePath = (FS::path(LogDirectory) / (std::string(LogFilePrefix) + GetTimestampForFilename() + ".txt")).string();

    OpenLogFile(CurrentLogFilePath);
    if (!LogFile.is_open())
    {
        return false;
    }

    Info("Run Started at " + GetTimestamp());
    return true;
}

Logger::~Logger()
{
    if (LogFile.is_open())
    {
        Info("Run Complete at " + GetTimestamp());
        LogFile.close();
    }
}

void Logger::OpenLogFile(const std::string& FilePath)
{
    LogFile.open(FilePath, std::ios::out);

    if (!LogFile.is_open())
    {
        std::cerr << "Logger: Failed to open log file: " << FilePath << "\n";
    }
}

void Logger::CleanupOldLogs()
{
    if (LogDirectory.empty())
    {
        return;
    }

    std::vector<FS::directory_entry> Logs;
    std::error_code ec;

    for (const auto& Entry : FS::directory_iterator(LogDirectory, ec))
    {
        if (Entry.is_regular_file() && Entry.path().filename().string().find(LogFilePrefix) == 0)
        {
            Logs.push_back(Entry);
        }
    }

    if (Logs.size() <= MaxFiles)
    {
        return;
    }

    std::sort(Logs.begin(), Logs.end(), [](const FS::directory_entry& A, const FS::directory_entry& B)
    {
            return A.path().filename().string() < B.path().filename().string();
    });

    while (Logs.size() > MaxFiles)
    {
        std::error_code RemoveError;
        if (!FS::remove(Logs.front(), RemoveError) && RemoveError)
        {
            std::cerr << "Logger: Failed to remove old log " << Logs.front().path().string() << ": " << RemoveError.message() << "\n";
        }
        Logs.erase(Logs.begin());
    }
}

void Logger::Log(LogLevel Level, const std::string& Message)
{
    std::lock_guard<std::mutex> Lock(LogWriteMutex);

    if (!LogFile.is_open() || Level < MinimumLevel)
    {
        return;
    }

    LogFile << "[" << GetTimestamp() << "]" << " [" << LevelToString(Level) << "] " << Message << "\n";
    LogFile.flush();
}

void Logger::Debug(const std::string& Message)
{
    Log(LogLevel::DEBUG, Message);
}

void Logger::Info(const std::string& Message)
{
    Log(LogLevel::INFO, Message);
}

void Logger::Warn(const std::string& Message)
{
    Log(LogLevel::WARN, Message);
}

void Logger::Error(const std::string& Message)
{
    Log(LogLevel::ERROR, Message);
}

std::string Logger::GetTimestampForFilename()
{
    auto Now = std::chrono::system_clock::now();
    std::time_t Time = std::chrono::system_clock::to_time_t(Now);
    std::tm Local{};

#ifdef _WIN32
    localtime_s(&Local, &Time);
#else
    localtime_r(&Time, &Local);
#endif

    std::ostringstream Stream;
    Stream << std::put_time(&Local, "%Y%m%d_%H%M%S");
    return Stream.str();
}

std::string Logger::GetTimestamp() const
{
    auto Now = std::chrono::system_clock::now();
    std::time_t Time = std::chrono::system_clock::to_time_t(Now);
    std::tm Local{};

#ifdef _WIN32
    localtime_s(&Local, &Time);
#else
    localtime_r(&Time, &Local);
#endif

    std::ostringstream Stream;
    Stream << std::put_time(&Local, "%Y-%m-%d %H:%M:%S"); // human-readable timestamp for logs
    return Stream.str();
}

std::string Logger::LevelToString(LogLevel Level) const
{
    switch (Level)
    {
    case LogLevel::DEBUG: return "DEBUG";
    case LogLevel::INFO:  return "INFO";
    case LogLevel::WARN:  return "WARN";
    case LogLevel::ERROR: return "ERROR";
    default:              return "UNKNOWN";
    }
}
