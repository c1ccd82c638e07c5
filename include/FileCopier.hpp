#pragma once

#include <cstddef>
#include <filesystem>
#include <string>

#include "Logger.hpp"

class FileCopier
{
public:

#ifndef _WIN32
    static bool CopyFileRangeSupported;
    static void CheckCopyFileRangeSupport();
#endif

    // Copies content, permissions and timestamps. Parent directories are created.
    // A partially written destination is removed on failure.
    static bool CopyPreservingMetadata(const std::filesystem::path& Source, const std::filesystem::path& Destination, std::string& Error);

    // Rename, or copy + remove when source and destination live on different filesystems.
    static bool Move(const std::filesystem::path& Source, const std::filesystem::path& Destination, std::string& Error);

    static bool RemoveQuietly(const std::filesystem::path& Path);

    // Removes empty directories below Root, deepest first. Root itself is kept.
    static size_t RemoveEmptyDirectories(const std::filesystem::path& Root, Logger& Log);
};
