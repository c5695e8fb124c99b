// PathUtils Header
#pragma once
#include <string>
#include <filesystem>

namespace linkwalker::infrastructure {

class PathUtils {
public:
    static std::filesystem::path GetHomeDir();
    static std::filesystem::path GetDesktopDir();
    static std::filesystem::path GetConfigHome();
    static std::filesystem::path GetDefaultSettingsPath();
};

} // namespace linkwalker::infrastructure
