#pragma once

#include <filesystem>
#include <chrono>
#include <ctime>
#include <cstdint>
#include <optional>
#include <string>
#include <sstream>
#include <iomanip>
#include <algorithm>

//UNIX Time since Epoch, in seconds
inline int64_t ToTimeT(std::filesystem::file_time_type FTime)
{
    using namespace std::chrono;
    auto SysTime = time_point_cast<system_clock::duration>(file_clock::to_sys(FTime));
    return static_cast<int64_t>(system_clock::to_time_t(SysTime));
}

inline std::filesystem::file_time_type FromTimeT(std::time_t Time)
{
    using namespace std::chrono;
    return time_point_cast<file_clock::duration>(file_clock::from_sys(system_clock::from_time_t(Time)));
}

inline std::tm ToLocalTm(std::time_t Time)
{
    std::tm Result{};
#ifdef _WIN32
    localtime_s(&Result, &Time);
#else
    localtime_r(&Time, &Result);
#endif
    return Result;
}

inline std::time_t FromUtcTm(std::tm Utc)
{
#ifdef _WIN32
    return _mkgmtime(&Utc);
#else
    return timegm(&Utc);
#endif
}

// Formats a naive local time; mktime fills the weekday/yearday fields for formats that need them.
inline std::string FormatDate(const std::tm& Time, const std::string& Format)
{
    std::tm Normalized = Time;
    Normalized.tm_isdst = -1;
    std::mktime(&Normalized);

    std::ostringstream Out;
    Out << std::put_time(&Normalized, Format.c_str());
    return Out.str();
}

// Accepts "YYYY:MM:DD HH:MM:SS", "YYYY-MM-DD HH:MM:SS" and the 'T' separated form.
// Only the first 19 characters are considered, so fractions and zone suffixes are ignored.
inline std::optional<std::tm> ParseExifDateTime(const std::string& Value)
{
    std::string Text = Value;
    Text.erase(0, Text.find_first_not_of(" \t\r\n"));
    if (Text.size() < 19)
    {
        return std::nullopt;
    }
    Text = Text.substr(0, 19);
    std::replace(Text.begin(), Text.end(), '-', ':');
    if (Text[10] == 'T')
    {
        Text[10] = ' ';
    }

    std::tm Result{};
    std::istringstream In(Text);
    In >> std::get_time(&Result, "%Y:%m:%d %H:%M:%S");
    if (In.fail())
    {
        return std::nullopt;
    }
    if (Result.tm_year + 1900 < 1 || Result.tm_mon < 0 || Result.tm_mday < 1)
    {
        return std::nullopt;
    }
    Result.tm_isdst = -1;
    return Result;
}

// ISO-8601 UTC stamp as written by container muxers ("2024-03-01T10:00:00.000000Z").
inline std::optional<std::time_t> ParseIsoUtc(const std::string& Value)
{
    auto Parsed = ParseExifDateTime(Value);
    if (!Parsed)
    {
        return std::nullopt;
    }
    std::time_t Result = FromUtcTm(*Parsed);
    if (Result == static_cast<std::time_t>(-1))
    {
        return std::nullopt;
    }
    return Result;
}
