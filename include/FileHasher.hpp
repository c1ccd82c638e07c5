#pragma once

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>

// Streaming BLAKE3 content digest.
class FileHasher
{
public:
    static constexpr size_t ChunkSize = 64 * 1024;

    // Lowercase hex digest of the whole file, or nullopt when the file cannot be read.
    static std::optional<std::string> HashFile(const std::filesystem::path& FilePath, std::string* Error = nullptr);
};
