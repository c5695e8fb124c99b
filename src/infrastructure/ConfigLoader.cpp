/**
 * @file ConfigLoader.cpp
 * @brief Implementation of ConfigLoader.
 */

#include "infrastructure/ConfigLoader.hpp"
#include "infrastructure/PathUtils.hpp"
#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>
#include <iostream>

namespace linkwalker::infrastructure {

AppConfig ConfigLoader::Load(const std::string& configPath) {
    AppConfig config;
    if (!std::filesystem::exists(configPath)) {
        return config;
    }

    try {
        std::ifstream f(configPath);
        nlohmann::json j;
        f >> j;

        config.hubDomain = j.value("hub_domain", config.hubDomain);
        config.orgKeyword = j.value("org_keyword", config.orgKeyword);
        config.documentExtension = j.value("document_extension", config.documentExtension);
        config.lockPrefix = j.value("lock_prefix", config.lockPrefix);
        config.backupFolderName = j.value("backup_folder_name", config.backupFolderName);
    } catch (const std::exception& e) {
        std::cerr << "[ConfigLoader] Error reading " << configPath << ": " << e.what() << std::endl;
        return AppConfig{};
    }

    return config;
}

AppConfig ConfigLoader::LoadOrDefault(const std::optional<std::string>& configPath) {
    if (configPath) {
        return Load(*configPath);
    }
    return Load(PathUtils::GetDefaultSettingsPath().string());
}

} // namespace linkwalker::infrastructure
