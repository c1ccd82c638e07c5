#include "DevicePatternDatabase.hpp"
#include "StringUtils.hpp"

#include <algorithm>
#include <fstream>
#include <utility>

namespace FS = std::filesystem;

namespace
{
    std::vector<std::string> StringList(const nlohmann::ordered_json& Object, const char* Key)
    {
        std::vector<std::string> Values;
        auto it = Object.find(Key);
        if (it == Object.end() || !it->is_array())
        {
            return Values;
        }
        for (const auto& Item : *it)
        {
            if (Item.is_string())
            {
                Values.push_back(Item.get<std::string>());
            }
        }
        return Values;
    }
}

DevicePatternDatabase::DevicePatternDatabase(FS::path FilePath, Logger& Log)
    : FilePath(std::move(FilePath)), Log(Log)
{
}

void DevicePatternDatabase::EnsureLoaded()
{
    if (Loaded)
    {
        return;
    }
    Loaded = true;

    std::error_code ec;
    if (FilePath.empty() || !FS::exists(FilePath, ec))
    {
        Log.Debug("No device pattern file at " + FilePath.string());
        return;
    }

    std::ifstream File(FilePath);
    if (!File.is_open())
    {
        Log.Warn("Failed to open device pattern file: " + FilePath.string());
        return;
    }

    try
    {
        nlohmann::ordered_json Document = nlohmann::ordered_json::parse(File);
        if (!LoadDocument(Document))
        {
            Log.Warn("Device pattern file has an unexpected layout: " + FilePath.string());
            return;
        }
        Log.Info("Loaded " + std::to_string(Patterns.size()) + " device patterns from " + FilePath.string());
    }
    catch (const nlohmann::json::exception& e)
    {
        Log.Warn("Failed to load device pattern file " + FilePath.string() + ": " + e.what());
        Patterns.clear();
    }
}

bool DevicePatternDatabase::LoadDocument(const nlohmann::ordered_json& Document)
{
    Loaded = true;
    Patterns.clear();

    if (!Document.is_object())
    {
        return false;
    }
    auto DevicesIt = Document.find("device_patterns");
    if (DevicesIt == Document.end())
    {
        return true;
    }
    if (!DevicesIt->is_object())
    {
        return false;
    }

    for (auto it = DevicesIt->begin(); it != DevicesIt->end(); ++it)
    {
        if (!it->is_object())
        {
            continue;
        }
        DevicePattern Pattern;
        Pattern.DeviceName = it.key();
        for (const auto& Extension : StringList(*it, "extensions"))
        {
            Pattern.Extensions.push_back(ToLowerAscii(Extension));
        }
        for (const auto& Prefix : StringList(*it, "filename_prefixes"))
        {
            Pattern.FilenamePrefixes.push_back(ToUpperAscii(Prefix));
        }
        for (const auto& Sub : StringList(*it, "filename_contains"))
        {
            Pattern.FilenameContains.push_back(ToUpperAscii(Sub));
        }
        Patterns.push_back(std::move(Pattern));
    }
    return true;
}

size_t DevicePatternDatabase::Size()
{
    EnsureLoaded();
    return Patterns.size();
}

std::optional<std::string> DevicePatternDatabase::Match(const FS::path& MediaPath)
{
    EnsureLoaded();
    if (Patterns.empty())
    {
        return std::nullopt;
    }

    const std::string Stem = ToUpperAscii(MediaPath.stem().string());
    const std::string Extension = ToLowerAscii(MediaPath.extension().string());

    for (const auto& Pattern : Patterns)
    {
        bool ExtensionOk = Pattern.Extensions.empty() ||
            std::find(Pattern.Extensions.begin(), Pattern.Extensions.end(), Extension) != Pattern.Extensions.end();
        if (!ExtensionOk)
        {
            continue;
        }
        for (const auto& Prefix : Pattern.FilenamePrefixes)
        {
            if (Stem.starts_with(Prefix))
            {
                return Pattern.DeviceName;
            }
        }
        for (const auto& Sub : Pattern.FilenameContains)
        {
            if (Contains(Stem, Sub))
            {
                return Pattern.DeviceName;
            }
        }
    }
    return std::nullopt;
}
