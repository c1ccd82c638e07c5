#include "ProcessedSet.hpp"
#include "StringUtils.hpp"

#include <fstream>
#include <utility>
#include <nlohmann/json.hpp>

namespace FS = std::filesystem;

ProcessedSet::ProcessedSet(FS::path FilePath, Logger& Log) : FilePath(std::move(FilePath)), Log(Log)
{
}

const FS::path& ProcessedSet::GetFilePath() const
{
    return FilePath;
}

std::string ProcessedSet::KeyFor(const FS::path& Path)
{
    std::error_code ec;
    FS::path Abs = FS::absolute(Path, ec);
    if (ec)
    {
        Abs = Path;
    }
    return PathToUtf8(Abs.lexically_normal());
}

bool ProcessedSet::Load()
{
    Paths.clear();

    std::error_code ec;
    if (!FS::exists(FilePath, ec))
    {
        Log.Info("[ProcessedSet::Load] Starting Fresh. No record found at: " + FilePath.string());
        return true;
    }

    std::ifstream File(FilePath);
    if (!File.is_open())
    {
        Log.Warn("[ProcessedSet::Load] Failed to open: " + FilePath.string());
        return false;
    }

    try
    {
        nlohmann::json Document = nlohmann::json::parse(File);
        auto it = Document.find("paths");
        if (it != Document.end() && it->is_array())
        {
            for (const auto& Entry : *it)
            {
                if (Entry.is_string())
                {
                    Paths.insert(Entry.get<std::string>());
                }
            }
        }
    }
    catch (const nlohmann::json::exception& e)
    {
        Log.Warn(std::string("[ProcessedSet::Load] Corrupt record ignored: ") + e.what());
        Paths.clear();
        return false;
    }

    Log.Info("[ProcessedSet::Load] Finished Loading " + std::to_string(Paths.size()) + " entries.");
    return true;
}

bool ProcessedSet::Save(bool Force)
{
    if (!Force && Paths.empty())
    {
        return true;
    }

    std::error_code ec;
    if (FilePath.has_parent_path())
    {
        FS::create_directories(FilePath.parent_path(), ec);
    }

    nlohmann::json Document;
    Document["paths"] = nlohmann::json::array();
    size_t Skipped = 0;
    for (const auto& Path : Paths)
    {
        // JSON strings must be UTF-8; raw byte names stay in memory only.
        if (!IsValidUtf8(Path))
        {
            ++Skipped;
            continue;
        }
        Document["paths"].push_back(Path);
    }
    if (Skipped != 0)
    {
        Log.Warn("[ProcessedSet::Save] Not persisting " + std::to_string(Skipped) + " path(s) that are not valid UTF-8.");
    }

    std::string Serialised;
    try
    {
        Serialised = Document.dump(2);
    }
    catch (const nlohmann::json::exception& e)
    {
        Log.Warn(std::string("[ProcessedSet::Save] Serialisation failed: ") + e.what());
        return false;
    }

    FS::path TempPath = FilePath;
    TempPath += ".tmp";
    {
        std::ofstream File(TempPath, std::ios::out | std::ios::trunc);
        if (!File)
        {
            Log.Warn("[ProcessedSet::Save] Failed to open for writing: " + TempPath.string());
            return false;
        }
        File << Serialised << "\n";
        if (!File)
        {
            Log.Warn("[ProcessedSet::Save] Write failed: " + TempPath.string());
            File.close();
            FS::remove(TempPath, ec);
            return false;
        }
    }

    FS::rename(TempPath, FilePath, ec);
    if (ec)
    {
        Log.Warn("[ProcessedSet::Save] Failed to replace " + FilePath.string() + ": " + ec.message());
        FS::remove(TempPath, ec);
        return false;
    }
    Log.Debug("[ProcessedSet::Save] Saved " + std::to_string(Paths.size()) + " entries to " + FilePath.string());
    return true;
}

bool ProcessedSet::IsProcessed(const FS::path& Path) const
{
    return Paths.count(KeyFor(Path)) != 0;
}

void ProcessedSet::MarkProcessed(const FS::path& Path)
{
    Paths.insert(KeyFor(Path));
}

size_t ProcessedSet::Size() const
{
    return Paths.size();
}
