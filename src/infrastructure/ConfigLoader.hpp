/**
 * @file ConfigLoader.hpp
 * @brief Static utility for loading application configuration (settings.json).
 *
 * Keeps JSON parsing of the settings file in one place so services only
 * see a plain AppConfig value.
 */

#pragma once

#include <string>
#include <optional>

namespace linkwalker::infrastructure {

/**
 * @struct AppConfig
 * @brief Tunables for classification, discovery and backups.
 */
struct AppConfig {
    std::string hubDomain = "skfgroup.sharepoint.com"; ///< Collaboration hub domain token.
    std::string orgKeyword = "skf";                   ///< Organization keyword marking internal links.
    std::string documentExtension = ".docx";
    std::string lockPrefix = "~$";                    ///< Office lock/temporary file prefix.
    std::string backupFolderName = "bulk_found";
};

class ConfigLoader {
public:
    /**
     * @brief Reads settings from a JSON file.
     * @param configPath Path to settings.json.
     * @return Defaults overlaid with the keys present in the file. A missing or
     *         malformed file yields the defaults.
     */
    static AppConfig Load(const std::string& configPath);

    /**
     * @brief Reads settings from an explicit path, or from the default location.
     */
    static AppConfig LoadOrDefault(const std::optional<std::string>& configPath);
};

} // namespace linkwalker::infrastructure
