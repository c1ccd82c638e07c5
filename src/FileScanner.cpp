#include <iostream>
#include <filesystem>
#include <stack>

#include "FileScanner.hpp"

namespace FS = std::filesystem;

namespace
{
    FS::path NormalizedAbsolute(const FS::path& Path)
    {
        std::error_code ec;
        FS::path Abs = FS::absolute(Path, ec);
        if (ec)
        {
            Abs = Path;
        }
        return Abs.lexically_normal();
    }
}

FileScanner::FileScanner(Logger& Log) : Log(Log)
{
}

const std::vector<ScannedFileInfo>& FileScanner::GetFiles() const
{
    return Files;
}

void FileScanner::SetExcludes(const std::vector<FS::path>& ExcludePaths)
{
    Excludes.clear();
    for (const auto& Exclude : ExcludePaths)
    {
        Excludes.push_back(NormalizedAbsolute(Exclude));
    }
}

bool FileScanner::IsExcluded(const FS::path& Path) const
{
    const FS::path Abs = NormalizedAbsolute(Path);
    for (const auto& Exclude : Excludes)
    {
        if (Abs == Exclude)
        {
            return true;
        }
    }
    return false;
}

bool FileScanner::Scan(const FS::path& RootPath)
{
    FS::path Root = NormalizedAbsolute(RootPath);
    try
    {
        if (!FS::exists(Root))
        {
            Log.Error("Scan: Path does not exist: " + Root.string());
            return false;
        }
        if (IsExcluded(Root))
        {
            Log.Warn("Scan: Skipping excluded root path: " + Root.string());
            return true;
        }
        if (!FS::is_directory(Root))
        {
            Log.Error("Scan: Path is not a directory: " + Root.string());
            return false;
        }
        ScanDirectoryIterative(Root);
        return true;
    }
    catch (const FS::filesystem_error& e)
    {
        std::cerr << "Filesystem error during scan: " << e.what() << "\n";
        Log.Error(std::string("Filesystem error during scan: ") + e.what() + " Path: " + e.path1().string());
        return false;
    }
}

void FileScanner::ScanDirectoryIterative(const FS::path& Root)
{
    std::stack<FS::path> DirStack;
    DirStack.push(Root);
    while (!DirStack.empty())
    {
        FS::path Current = DirStack.top();
        DirStack.pop();

        std::error_code ec;
        FS::directory_iterator It(Current, ec);
        if (ec)
        {
            Log.Error("Failed to iterate directory: " + Current.string() + " - " + ec.message());
            continue;
        }

        for (; It != FS::directory_iterator(); It.increment(ec))
        {
            const FS::directory_entry& Entry = *It;
            try
            {
                const FS::path& EntryPath = Entry.path();
                if (FS::is_symlink(Entry.symlink_status()))
                {
                    Log.Debug("Skipping SymLink: " + EntryPath.string());
                    continue;
                }
                if (IsExcluded(EntryPath))
                {
                    Log.Info("Skipping Excluded Path: " + EntryPath.string());
                    continue;
                }
                if (Entry.is_directory())
                {
                    DirStack.push(EntryPath);
                }
                else if (Entry.is_regular_file())
                {
                    ScannedFileInfo Info;
                    Info.Path = EntryPath;
                    Files.push_back(std::move(Info));
                }
            }
            catch (const FS::filesystem_error& e)
            {
                Log.Error(std::string("Filesystem error accessing entry: ") + e.what() + " Path: " + Entry.path().string());
            }
        }
        if (ec)
        {
            Log.Error("Directory iteration stopped early: " + Current.string() + " - " + ec.message());
        }
    }
}
