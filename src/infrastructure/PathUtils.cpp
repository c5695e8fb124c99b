#include "infrastructure/PathUtils.hpp"
#include <cstdlib>
#include <filesystem>

namespace linkwalker::infrastructure {

namespace fs = std::filesystem;

fs::path PathUtils::GetHomeDir() {
    const char* home = std::getenv("HOME");
    if (home && *home) {
        return fs::path(home);
    }
    const char* userProfile = std::getenv("USERPROFILE");
    if (userProfile && *userProfile) {
        return fs::path(userProfile);
    }
    return fs::current_path(); // Fallback
}

fs::path PathUtils::GetDesktopDir() {
    const char* xdgDesktop = std::getenv("XDG_DESKTOP_DIR");
    if (xdgDesktop && *xdgDesktop) {
        return fs::path(xdgDesktop);
    }
    return GetHomeDir() / "Desktop";
}

fs::path PathUtils::GetConfigHome() {
    const char* xdgConfigHome = std::getenv("XDG_CONFIG_HOME");
    if (xdgConfigHome && *xdgConfigHome) {
        return fs::path(xdgConfigHome);
    }
    return GetHomeDir() / ".config";
}

fs::path PathUtils::GetDefaultSettingsPath() {
    return GetConfigHome() / "linkwalker" / "settings.json";
}

} // namespace linkwalker::infrastructure
