#pragma once

#include <filesystem>
#include <set>
#include <string>

#include "Logger.hpp"

// Persisted record of handled file paths: { "paths": [ ... ] }.
class ProcessedSet
{
public:
    ProcessedSet(std::filesystem::path FilePath, Logger& Log);

    // Missing file is a fresh start; a corrupt one is logged and treated the same.
    bool Load();

    // Full overwrite through a temporary sibling. Save(false) skips an empty set.
    bool Save(bool Force);

    bool IsProcessed(const std::filesystem::path& Path) const;
    void MarkProcessed(const std::filesystem::path& Path);
    size_t Size() const;

    const std::filesystem::path& GetFilePath() const;

    static std::string KeyFor(const std::filesystem::path& Path);

private:
    std::filesystem::path FilePath;
    Logger& Log;
    std::set<std::string> Paths;
};
