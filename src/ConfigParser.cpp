#include <iostream>
#include <fstream>
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <string>

#include "ConfigParser.hpp"

namespace FS = std::filesystem;
using OrderedJson = nlohmann::ordered_json;

namespace
{
    template<typename T>
    bool ReadValue(const OrderedJson& Document, const std::string& Key, T& Target, std::vector<std::string>& Errors)
    {
        auto it = Document.find(Key);
        if (it == Document.end() || it->is_null())
        {
            return false;
        }
        try
        {
            Target = it->template get<T>();
            return true;
        }
        catch (const nlohmann::json::exception& e)
        {
            Errors.push_back("Invalid value for '" + Key + "': " + e.what());
            return false;
        }
    }
}

const AppConfig& ConfigParser::GetConfig() const
{
    return Config;
}

AppConfig& ConfigParser::GetMutableConfig()
{
    return Config;
}

const std::vector<std::string>& ConfigParser::GetErrors() const
{
    return Errors;
}

const std::vector<std::string>& ConfigParser::GetInfos() const
{
    return Infos;
}

bool ConfigParser::CreatedDefaultFile() const
{
    return DefaultFileCreated;
}

void ConfigParser::Reset()
{
    Config = AppConfig::Defaults();
    DefaultFileCreated = false;
    Errors.clear();
    Infos.clear();
}

void ConfigParser::AddError(const std::string& Message)
{
    Errors.push_back(Message);
}

void ConfigParser::AddInfo(const std::string& Message)
{
    Infos.push_back(Message);
}

std::string ConfigParser::NormalizeExtension(const std::string& Extension)
{
    std::string Result = Extension;
    Result.erase(Result.begin(), std::find_if(Result.begin(), Result.end(), [](char Ch) { return !std::isspace(static_cast<unsigned char>(Ch)); }));
    Result.erase(std::find_if(Result.rbegin(), Result.rend(), [](char Ch) { return !std::isspace(static_cast<unsigned char>(Ch)); }).base(), Result.end());
    std::transform(Result.begin(), Result.end(), Result.begin(), [](unsigned char Ch) { return static_cast<char>(std::tolower(Ch)); });
    if (!Result.empty() && Result[0] != '.')
    {
        Result.insert(Result.begin(), '.');
    }
    return Result;
}

void ConfigParser::DeepMerge(OrderedJson& Base, const OrderedJson& Override, std::vector<std::string>* IgnoredKeys, const std::string& KeyPrefix)
{
    for (auto it = Override.begin(); it != Override.end(); ++it)
    {
        auto BaseIt = Base.find(it.key());
        if (BaseIt == Base.end())
        {
            if (IgnoredKeys != nullptr)
            {
                IgnoredKeys->push_back(KeyPrefix + it.key());
            }
            continue;
        }
        if (BaseIt->is_object() && it->is_object())
        {
            DeepMerge(*BaseIt, *it, IgnoredKeys, KeyPrefix + it.key() + ".");
        }
        else
        {
            *BaseIt = *it;
        }
    }
}

OrderedJson ConfigParser::ToDocument(const AppConfig& Config)
{
    OrderedJson Document;
    Document["source_path"] = Config.SourcePath;
    Document["output_path"] = Config.OutputPath;
    Document["super_copy_source"] = Config.SuperCopySource;
    Document["super_copy_target"] = Config.SuperCopyTarget;
    Document["image_extensions"] = Config.ImageExtensions;
    Document["video_extensions"] = Config.VideoExtensions;
    Document["audio_extensions"] = Config.AudioExtensions;
    Document["leave_in_place_extensions"] = Config.LeaveInPlaceExtensions;
    Document["related_same_stem"] = Config.RelatedSameStem;
    Document["date_fallback"] = ToString(Config.DateFallbackMode);
    Document["device_unknown_name"] = Config.DeviceUnknownName;
    Document["no_date_name"] = Config.NoDateName;
    Document["overflow_subfolder"] = Config.OverflowSubfolder;

    OrderedJson Folders;
    Folders["date_format"] = Config.Folders.DateFormat;
    Folders["image_subfolder"] = Config.Folders.ImageSubfolder;
    Folders["video_subfolder"] = Config.Folders.VideoSubfolder;
    Folders["audio_subfolder"] = Config.Folders.AudioSubfolder;
    Folders["panoramic_subfolder"] = Config.Folders.PanoramicSubfolder;
    Folders["device_subfolder"] = Config.Folders.DeviceSubfolder;
    Document["folder_structure"] = Folders;

    Document["move_files"] = Config.MoveFiles;
    Document["duplicate_strategy"] = ToString(Config.Duplicates);
    Document["delete_empty_folders"] = Config.DeleteEmptyFolders;
    Document["use_exiftool"] = Config.UseExifTool;
    Document["unified_naming"] = Config.UnifiedNaming;
    Document["exiftool_path"] = Config.ExifToolPath;
    Document["exiftool_timeout_sec"] = Config.ExifToolTimeoutSec;
    Document["device_patterns_file"] = Config.DevicePatternsFile;
    Document["processed_file"] = Config.ProcessedFile;
    Document["log_dir"] = Config.LogDir;
    Document["max_log_files"] = Config.MaxLogFiles;
    Document["log_level"] = Config.LogLevelName;

    OrderedJson AutoCopy;
    AutoCopy["enabled"] = Config.AutoCopy.Enabled;
    AutoCopy["watch_paths"] = Config.AutoCopy.WatchPaths;
    AutoCopy["target_path"] = Config.AutoCopy.TargetPath;
    AutoCopy["poll_interval_sec"] = Config.AutoCopy.PollIntervalSec;
    Document["auto_copy"] = AutoCopy;

    return Document;
}

bool ConfigParser::Parse(const std::string& FilePath)
{
    Reset();

    std::error_code ec;
    Config.BaseDir = FS::absolute(FilePath, ec).parent_path();

    if (!FS::exists(FilePath, ec))
    {
        AddInfo("Config file does not exist, using defaults: " + FilePath);
        std::string SaveError;
        if (Save(FilePath, Config, SaveError))
        {
            DefaultFileCreated = true;
            AddInfo("Default config written to: " + FilePath);
        }
        else
        {
            AddInfo("Could not write default config: " + SaveError);
        }
        return true;
    }

    std::ifstream File(FilePath);
    if (!File.is_open())
    {
        AddError("Failed to open config file: " + FilePath);
        return false;
    }

    OrderedJson UserDocument;
    try
    {
        UserDocument = OrderedJson::parse(File);
    }
    catch (const nlohmann::json::parse_error& e)
    {
        AddError("Failed to parse config file " + FilePath + ": " + e.what());
        return false;
    }

    return ParseDocument(UserDocument);
}

bool ConfigParser::ParseDocument(const OrderedJson& UserDocument)
{
    if (!UserDocument.is_object())
    {
        AddError("Config root must be a JSON object.");
        return false;
    }

    OrderedJson Document = ToDocument(AppConfig::Defaults());
    std::vector<std::string> IgnoredKeys;
    DeepMerge(Document, UserDocument, &IgnoredKeys);

    for (const auto& Key : IgnoredKeys)
    {
        AddInfo("Unknown key '" + Key + "' ignored.");
    }

    ApplyDocument(Document);
    return Errors.empty();  // Return false only if fatal errors present
}

void ConfigParser::ReadExtensionList(const OrderedJson& Document, const std::string& Key, std::vector<std::string>& Target)
{
    std::vector<std::string> Raw;
    if (!ReadValue(Document, Key, Raw, Errors))
    {
        return;
    }

    Target.clear();
    for (const auto& Extension : Raw)
    {
        std::string Normalized = NormalizeExtension(Extension);
        if (Normalized.empty())
        {
            continue;
        }
        if (std::find(Target.begin(), Target.end(), Normalized) == Target.end())
        {
            Target.push_back(Normalized);
        }
    }
}

void ConfigParser::ApplyDocument(const OrderedJson& Document)
{
    ReadValue(Document, "source_path", Config.SourcePath, Errors);
    ReadValue(Document, "output_path", Config.OutputPath, Errors);
    ReadValue(Document, "super_copy_source", Config.SuperCopySource, Errors);
    ReadValue(Document, "super_copy_target", Config.SuperCopyTarget, Errors);

    ReadExtensionList(Document, "image_extensions", Config.ImageExtensions);
    ReadExtensionList(Document, "video_extensions", Config.VideoExtensions);
    ReadExtensionList(Document, "audio_extensions", Config.AudioExtensions);
    ReadExtensionList(Document, "leave_in_place_extensions", Config.LeaveInPlaceExtensions);

    ReadValue(Document, "related_same_stem", Config.RelatedSameStem, Errors);

    std::string Fallback;
    if (ReadValue(Document, "date_fallback", Fallback, Errors))
    {
        if (Fallback == "mtime")
        {
            Config.DateFallbackMode = DateFallback::MTime;
        }
        else if (Fallback == "none")
        {
            Config.DateFallbackMode = DateFallback::None;
        }
        else
        {
            AddError("Invalid date_fallback '" + Fallback + "'. Use 'mtime' or 'none'.");
        }
    }

    ReadValue(Document, "device_unknown_name", Config.DeviceUnknownName, Errors);
    if (Config.DeviceUnknownName.empty())
    {
        AddError("device_unknown_name must not be empty.");
    }
    ReadValue(Document, "no_date_name", Config.NoDateName, Errors);
    ReadValue(Document, "overflow_subfolder", Config.OverflowSubfolder, Errors);
    if (Config.OverflowSubfolder.empty())
    {
        AddError("overflow_subfolder must not be empty.");
    }

    auto FoldersIt = Document.find("folder_structure");
    if (FoldersIt != Document.end() && FoldersIt->is_object())
    {
        const OrderedJson& Folders = *FoldersIt;
        ReadValue(Folders, "date_format", Config.Folders.DateFormat, Errors);
        ReadValue(Folders, "image_subfolder", Config.Folders.ImageSubfolder, Errors);
        ReadValue(Folders, "video_subfolder", Config.Folders.VideoSubfolder, Errors);
        ReadValue(Folders, "audio_subfolder", Config.Folders.AudioSubfolder, Errors);
        ReadValue(Folders, "panoramic_subfolder", Config.Folders.PanoramicSubfolder, Errors);
        ReadValue(Folders, "device_subfolder", Config.Folders.DeviceSubfolder, Errors);
        if (Config.Folders.DateFormat.empty())
        {
            AddError("folder_structure.date_format must not be empty.");
        }
    }
    else if (FoldersIt != Document.end())
    {
        AddError("folder_structure must be an object.");
    }

    ReadValue(Document, "move_files", Config.MoveFiles, Errors);

    std::string Strategy;
    if (ReadValue(Document, "duplicate_strategy", Strategy, Errors))
    {
        if (Strategy == "skip")
        {
            Config.Duplicates = DuplicateStrategy::Skip;
        }
        else if (Strategy == "rename")
        {
            Config.Duplicates = DuplicateStrategy::Rename;
        }
        else if (Strategy == "overwrite")
        {
            Config.Duplicates = DuplicateStrategy::Overwrite;
            AddInfo("IMPORTANT - ! duplicate_strategy 'overwrite' replaces existing files at the destination !");
        }
        else
        {
            AddError("Invalid duplicate_strategy '" + Strategy + "'. Use 'skip', 'rename' or 'overwrite'.");
        }
    }

    ReadValue(Document, "delete_empty_folders", Config.DeleteEmptyFolders, Errors);
    ReadValue(Document, "use_exiftool", Config.UseExifTool, Errors);
    ReadValue(Document, "unified_naming", Config.UnifiedNaming, Errors);
    ReadValue(Document, "exiftool_path", Config.ExifToolPath, Errors);

    int TimeoutSec = static_cast<int>(Config.ExifToolTimeoutSec);
    if (ReadValue(Document, "exiftool_timeout_sec", TimeoutSec, Errors))
    {
        if (TimeoutSec <= 0)
        {
            AddError("exiftool_timeout_sec must be greater than zero.");
        }
        else
        {
            Config.ExifToolTimeoutSec = static_cast<unsigned int>(TimeoutSec);
        }
    }

    ReadValue(Document, "device_patterns_file", Config.DevicePatternsFile, Errors);
    ReadValue(Document, "processed_file", Config.ProcessedFile, Errors);
    ReadValue(Document, "log_dir", Config.LogDir, Errors);

    int MaxLogFiles = Config.MaxLogFiles;
    if (ReadValue(Document, "max_log_files", MaxLogFiles, Errors))
    {
        if (MaxLogFiles <= 0 || MaxLogFiles > 65535)
        {
            AddError("Invalid number for max_log_files. Select between 1 and 65,535");
        }
        else
        {
            Config.MaxLogFiles = static_cast<unsigned short int>(MaxLogFiles);
        }
    }

    std::string Level;
    if (ReadValue(Document, "log_level", Level, Errors))
    {
        if (Level == "debug" || Level == "info" || Level == "warn" || Level == "error")
        {
            Config.LogLevelName = Level;
        }
        else
        {
            AddError("Invalid log_level '" + Level + "'. Use 'debug', 'info', 'warn' or 'error'.");
        }
    }

    auto AutoCopyIt = Document.find("auto_copy");
    if (AutoCopyIt != Document.end() && AutoCopyIt->is_object())
    {
        const OrderedJson& AutoCopy = *AutoCopyIt;
        ReadValue(AutoCopy, "enabled", Config.AutoCopy.Enabled, Errors);
        ReadValue(AutoCopy, "watch_paths", Config.AutoCopy.WatchPaths, Errors);
        ReadValue(AutoCopy, "target_path", Config.AutoCopy.TargetPath, Errors);

        int PollInterval = static_cast<int>(Config.AutoCopy.PollIntervalSec);
        if (ReadValue(AutoCopy, "poll_interval_sec", PollInterval, Errors))
        {
            if (PollInterval < 15)
            {
                AddInfo("auto_copy.poll_interval_sec raised to the minimum of 15 seconds.");
                PollInterval = 15;
            }
            Config.AutoCopy.PollIntervalSec = static_cast<unsigned int>(PollInterval);
        }
        if (Config.AutoCopy.WatchPaths.empty())
        {
            Config.AutoCopy.WatchPaths.push_back("/media");
        }
    }
    else if (AutoCopyIt != Document.end())
    {
        AddError("auto_copy must be an object.");
    }
}

bool ConfigParser::Save(const std::string& FilePath, const AppConfig& Config, std::string& Error)
{
    try
    {
        FS::path Path(FilePath);
        if (Path.has_parent_path())
        {
            FS::create_directories(Path.parent_path());
        }

        std::ofstream File(Path, std::ios::out | std::ios::trunc);
        if (!File.is_open())
        {
            Error = "Failed to open config file for writing: " + FilePath;
            return false;
        }
        File << ToDocument(Config).dump(2) << "\n";
        return static_cast<bool>(File);
    }
    catch (const std::exception& e)
    {
        Error = std::string("Failed to save config: ") + e.what();
        return false;
    }
}
