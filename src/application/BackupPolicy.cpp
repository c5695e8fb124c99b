#include "application/BackupPolicy.hpp"
#include "domain/LexicalPath.hpp"
#include <filesystem>
#include <iostream>

namespace fs = std::filesystem;

namespace linkwalker::application {

std::optional<std::string> BackupPolicy::CaptureOriginal(const std::string& sourcePath, const std::string& backupPath) {
    try {
        fs::path target(backupPath);
        if (target.has_parent_path()) {
            fs::create_directories(target.parent_path());
        }
        fs::copy_file(sourcePath, target, fs::copy_options::overwrite_existing);
        fs::last_write_time(target, fs::last_write_time(sourcePath));
        return backupPath;
    } catch (const fs::filesystem_error& e) {
        // Backup failures never block the find/replace itself.
        std::cerr << "[BackupPolicy] No backup for " << sourcePath << ": " << e.what() << std::endl;
    }
    return std::nullopt;
}

std::string BackupPolicy::ComputeBackupPath(const std::string& filePath, const std::string& baseDir, const std::string& backupRoot) {
    std::optional<std::string> rel;
    try {
        rel = domain::lexical::Relative(filePath, baseDir);
    } catch (const fs::filesystem_error&) {
        rel.reset();
    }
    if (!rel) {
        rel = fs::path(filePath).filename().string();
    }
    return domain::lexical::Join(backupRoot, *rel);
}

bool BackupPolicy::IsUnder(const std::string& path, const std::string& root) {
    const std::string absPath = domain::lexical::MakeAbsolute(path);
    const std::string absRoot = domain::lexical::MakeAbsolute(root);
    if (absPath == absRoot) return true;
    const std::string prefix = absRoot.back() == '/' ? absRoot : absRoot + "/";
    return absPath.rfind(prefix, 0) == 0;
}

} // namespace linkwalker::application
