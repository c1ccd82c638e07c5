#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

#include "Logger.hpp"

struct DevicePattern
{
    std::string DeviceName;
    std::vector<std::string> Extensions;
    std::vector<std::string> FilenamePrefixes;
    std::vector<std::string> FilenameContains;
};

// Filename based device lookup, read lazily from a JSON pattern file.
// Devices are tried in document order; the first match wins.
class DevicePatternDatabase
{
public:
    DevicePatternDatabase(std::filesystem::path FilePath, Logger& Log);

    std::optional<std::string> Match(const std::filesystem::path& MediaPath);

    // Replaces the loaded patterns. Returns false for a document of the wrong shape.
    bool LoadDocument(const nlohmann::ordered_json& Document);

    size_t Size();

private:
    void EnsureLoaded();

    std::filesystem::path FilePath;
    Logger& Log;
    bool Loaded = false;
    std::vector<DevicePattern> Patterns;
};
