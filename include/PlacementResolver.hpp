#pragma once

#include <ctime>
#include <filesystem>
#include <optional>
#include <string>

#include "RunContext.hpp"
#include "MediaRecord.hpp"

// Maps a classified file to its destination directory and a collision-free file name.
class PlacementResolver
{
public:
    static constexpr size_t MaxFolderNameLength = 80;
    static constexpr size_t MaxUnifiedNameLength = 120;
    static constexpr int MaxCollisionSuffix = 9998;

    explicit PlacementResolver(const RunContext& Context);

    // output / date / kind [/ device]
    std::filesystem::path TargetDirectory(const MediaRecord& Record, const std::filesystem::path& OutputRoot) const;

    std::string KindSubfolder(MediaKind Kind) const;
    std::string DateDirectory(const std::optional<std::tm>& CaptureTime) const;
    std::string UnknownDeviceFolder() const;

    std::string UnifiedBaseName(const std::string& Device, const std::string& Date, const std::string& Resolution, const std::string& FrameRate) const;

    std::filesystem::path ResolveDestination(const std::filesystem::path& TargetDir, const std::filesystem::path& Source, const std::optional<std::string>& UnifiedBase) const;

    static std::string SanitizeFolderName(const std::string& Name, const std::string& Fallback);
    static bool IsSameFile(const std::filesystem::path& A, const std::filesystem::path& B);

private:
    const AppConfig& Config;
};
