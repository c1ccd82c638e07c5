#pragma once

#include <filesystem>
#include <string>

#include "Logger.hpp"

struct ContainerInfo
{
    int Width = 0;
    int Height = 0;
    double FrameRate = 0.0;
    std::string CreationTime;
    std::string Make;
    std::string Model;
};

// Audio/video container reader backed by libavformat. Keeps the result of the last file read.
class ContainerMetadata
{
public:
    explicit ContainerMetadata(Logger& Log);

    const ContainerInfo& Read(const std::filesystem::path& FilePath);

private:
    Logger& Log;
    std::filesystem::path CachedPath;
    ContainerInfo Cached;
    bool HasCache = false;
};
