#pragma once

#include <filesystem>
#include <string>

#include "Logger.hpp"

struct EmbeddedInfo
{
    int Width = 0;
    int Height = 0;
    std::string Make;
    std::string Model;
    std::string DateTimeOriginal;
    std::string DateTimeDigitized;
    std::string DateTime;
};

// EXIF reader for still images backed by Exiv2. Keeps the result of the last file read.
class EmbeddedMetadata
{
public:
    explicit EmbeddedMetadata(Logger& Log);

    const EmbeddedInfo& Read(const std::filesystem::path& FilePath);

private:
    Logger& Log;
    std::filesystem::path CachedPath;
    EmbeddedInfo Cached;
    bool HasCache = false;
};
