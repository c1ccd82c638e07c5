#pragma once

#include <string>
#include <fstream>
#include <mutex>

enum class LogLevel
{
    DEBUG,
    INFO,
    WARN,
    ERROR
};

LogLevel ToLogLevel(const std::string& LevelStr);

class Logger
{
public:
    Logger() = default;
    ~Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    bool Init(const std::string& LogDir, unsigned short int MaxLogFiles, LogLevel MinLevel = LogLevel::INFO);

    void Log(LogLevel Level, const std::string& Message);
    void Debug(const std::string& Message);
    void Info(const std::string& Message);
    void Warn(const std::string& Message);
    void Error(const std::string& Message);
    void CleanupOldLogs();

    static std::string GetTimestampForFilename();

    std::string CurrentLogFilePath;

private:
    std::ofstream LogFile;
    std::mutex LogWriteMutex;
    std::string LogDirectory;
    unsigned short int MaxFiles = 10;
    LogLevel MinimumLevel = LogLevel::INFO;

    std::string GetTimestamp() const;
    std::string LevelToString(LogLevel Level) const;

    void OpenLogFile(const std::string& FilePath);
};
