#pragma once

#include <string>
#include <vector>
#include <filesystem>

#include "Logger.hpp"

struct ScannedFileInfo
{
    std::filesystem::path Path;
};

// Collects the path of every regular file below a root. Symlinks are never followed.
// Traversal only: no classification happens here.
class FileScanner
{
public:
    explicit FileScanner(Logger& Log);

    bool Scan(const std::filesystem::path& RootPath);
    void SetExcludes(const std::vector<std::filesystem::path>& ExcludePaths);

    const std::vector<ScannedFileInfo>& GetFiles() const;

private:
    Logger& Log;
    std::vector<ScannedFileInfo> Files;
    std::vector<std::filesystem::path> Excludes;

    void ScanDirectoryIterative(const std::filesystem::path& Root);

    bool IsExcluded(const std::filesystem::path& Path) const;
};
