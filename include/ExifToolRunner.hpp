#pragma once

#include <filesystem>
#include <map>
#include <string>
#include <vector>

#include "Logger.hpp"

// Runs `exiftool -s -json -Tag... <file>` with a hard timeout.
// Every failure (missing binary, non-zero exit, timeout, bad JSON) yields an empty map.
class ExifToolRunner
{
public:
    ExifToolRunner(std::string ExecutablePath, unsigned int TimeoutSec, Logger& Log);

    std::map<std::string, std::string> Query(const std::filesystem::path& FilePath, const std::vector<std::string>& Tags);

    // False once the executable was found missing; later queries return immediately.

private:
    bool RunCapture(const std::vector<std::string>& Args, std::string& Output, std::string& Error);

    std::string ExecutablePath;
    unsigned int TimeoutSec = 10;
    Logger& Log;
    bool Missing = false;
};
