#include "FileHasher.hpp"
#include "blake3.h"
#include <fstream>
#include <vector>
#include <string>
#include <cstdint>

std::optional<std::string> FileHasher::HashFile(const std::filesystem::path& FilePath, std::string* Error)
{
    std::ifstream File(FilePath, std::ios::binary);
    if (!File.is_open())
    {
        if (Error != nullptr)
        {
            *Error = "cannot open for hashing: " + FilePath.string();
        }
        return std::nullopt;
    }

    blake3_hasher Hasher;
    blake3_hasher_init(&Hasher);

    std::vector<char> Buffer(ChunkSize);
    while (File)
    {
        File.read(Buffer.data(), static_cast<std::streamsize>(Buffer.size()));
        std::streamsize Read = File.gcount();
        if (Read > 0)
        {
            blake3_hasher_update(&Hasher, Buffer.data(), static_cast<size_t>(Read));
        }
    }
    if (File.bad())
    {
        if (Error != nullptr)
        {
            *Error = "read error while hashing: " + FilePath.string();
        }
        return std::nullopt;
    }

    uint8_t OutHash[BLAKE3_OUT_LEN] = { 0 };
    blake3_hasher_finalize(&Hasher, OutHash, sizeof(OutHash));

    static const char* HexDigits = "0123456789abcdef";
    std::string Hex;
    Hex.reserve(sizeof(OutHash) * 2);
    for (uint8_t Byte : OutHash)
    {
        Hex.push_back(HexDigits[Byte >> 4]);
        Hex.push_back(HexDigits[Byte & 0x0F]);
    }
    return Hex;
}
