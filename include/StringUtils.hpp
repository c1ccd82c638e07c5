#pragma once

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <string>

// ASCII-only case mapping: UTF-8 continuation bytes pass through unchanged.
inline std::string ToLowerAscii(std::string Value)
{
    std::transform(Value.begin(), Value.end(), Value.begin(), [](unsigned char Ch) {
        return static_cast<char>(Ch < 0x80 ? std::tolower(Ch) : Ch);
    });
    return Value;
}

inline std::string ToUpperAscii(std::string Value)
{
    std::transform(Value.begin(), Value.end(), Value.begin(), [](unsigned char Ch) {
        return static_cast<char>(Ch < 0x80 ? std::toupper(Ch) : Ch);
    });
    return Value;
}

inline std::string Trim(const std::string& Value)
{
    const char* Blank = " \t\r\n\f\v";
    auto First = Value.find_first_not_of(Blank);
    if (First == std::string::npos)
    {
        return "";
    }
    auto Last = Value.find_last_not_of(Blank);
    return Value.substr(First, Last - First + 1);
}

inline bool Contains(const std::string& Haystack, const std::string& Needle)
{
    return Haystack.find(Needle) != std::string::npos;
}

inline bool EndsWith(const std::string& Value, const std::string& Suffix)
{
    return Value.size() >= Suffix.size() && Value.compare(Value.size() - Suffix.size(), Suffix.size(), Suffix) == 0;
}

// Keeps at most MaxCodePoints UTF-8 code points, never cutting a multi-byte sequence.
inline std::string TruncateUtf8(const std::string& Value, size_t MaxCodePoints)
{
    size_t CodePoints = 0;
    for (size_t i = 0; i < Value.size(); ++i)
    {
        unsigned char Ch = static_cast<unsigned char>(Value[i]);
        if ((Ch & 0xC0) != 0x80)
        {
            if (CodePoints == MaxCodePoints)
            {
                return Value.substr(0, i);
            }
            ++CodePoints;
        }
    }
    return Value;
}

// Well-formed UTF-8: no stray continuation bytes, overlong forms, surrogates or values past U+10FFFF.
inline bool IsValidUtf8(const std::string& Value)
{
    size_t i = 0;
    while (i < Value.size())
    {
        unsigned char Lead = static_cast<unsigned char>(Value[i]);
        size_t Length = 0;
        unsigned int CodePoint = 0;
        if (Lead < 0x80)
        {
            ++i;
            continue;
        }
        else if (Lead >= 0xC2 && Lead <= 0xDF)
        {
            Length = 2;
            CodePoint = Lead & 0x1F;
        }
        else if (Lead >= 0xE0 && Lead <= 0xEF)
        {
            Length = 3;
            CodePoint = Lead & 0x0F;
        }
        else if (Lead >= 0xF0 && Lead <= 0xF4)
        {
            Length = 4;
            CodePoint = Lead & 0x07;
        }
        else
        {
            return false;
        }

        if (i + Length > Value.size())
        {
            return false;
        }
        for (size_t k = 1; k < Length; ++k)
        {
            unsigned char Next = static_cast<unsigned char>(Value[i + k]);
            if ((Next & 0xC0) != 0x80)
            {
                return false;
            }
            CodePoint = (CodePoint << 6) | (Next & 0x3F);
        }

        if ((Length == 3 && (CodePoint < 0x800 || (CodePoint >= 0xD800 && CodePoint <= 0xDFFF))) ||
            (Length == 4 && (CodePoint < 0x10000 || CodePoint > 0x10FFFF)))
        {
            return false;
        }
        i += Length;
    }
    return true;
}

// UTF-8 bridges for paths, independent of the platform's narrow encoding.
inline std::string PathToUtf8(const std::filesystem::path& Path)
{
    auto Temp = Path.u8string();
    return std::string(Temp.begin(), Temp.end());
}

inline std::filesystem::path PathFromUtf8(const std::string& Value)
{
    return std::filesystem::path(std::u8string(Value.begin(), Value.end()));
}
