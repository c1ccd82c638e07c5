#pragma once

#include <string>
#include <vector>
#include <nlohmann/json.hpp>

#include "AppConfig.hpp"

class ConfigParser
{
public:
    ConfigParser() = default;

    bool Parse(const std::string& FilePath);
    bool ParseDocument(const nlohmann::ordered_json& UserDocument);

    static bool Save(const std::string& FilePath, const AppConfig& Config, std::string& Error);
    static nlohmann::ordered_json ToDocument(const AppConfig& Config);
    static void DeepMerge(nlohmann::ordered_json& Base, const nlohmann::ordered_json& Override, std::vector<std::string>* IgnoredKeys = nullptr, const std::string& KeyPrefix = "");

    const AppConfig& GetConfig() const;
    AppConfig& GetMutableConfig();
    const std::vector<std::string>& GetErrors() const;
    const std::vector<std::string>& GetInfos() const;
    bool CreatedDefaultFile() const;
    void Reset();

private:
    void AddError(const std::string& Message);
    void AddInfo(const std::string& Message);

    void ApplyDocument(const nlohmann::ordered_json& Document);
    void ReadExtensionList(const nlohmann::ordered_json& Document, const std::string& Key, std::vector<std::string>& Target);

    static std::string NormalizeExtension(const std::string& Extension);

    AppConfig Config = AppConfig::Defaults();
    bool DefaultFileCreated = false;
    std::vector<std::string> Errors;
    std::vector<std::string> Infos;
};
