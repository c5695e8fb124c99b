/**
 * @file BackupPolicy.hpp
 * @brief Pre-mutation copies of documents, shared by the find/replace engines.
 */

#pragma once
#include <string>
#include <optional>

namespace linkwalker::application {

/**
 * @class BackupPolicy
 * @brief Copies a document to a mirrored location before it is overwritten.
 *
 * The engines call CaptureOriginal at most once per file per invocation, only
 * after a match was found and before the document is saved in place.
 */
class BackupPolicy {
public:
    /**
     * @brief Copies @p sourcePath to @p backupPath, creating parent folders.
     * @return The backup path, or std::nullopt if no backup was produced.
     */
    static std::optional<std::string> CaptureOriginal(const std::string& sourcePath, const std::string& backupPath);

    /**
     * @brief backupRoot joined with the file's path relative to baseDir
     *        (the file name when no relative form exists).
     */
    static std::string ComputeBackupPath(const std::string& filePath, const std::string& baseDir, const std::string& backupRoot);

    /** @brief True when @p path is @p root or lies below it. */
    static bool IsUnder(const std::string& path, const std::string& root);
};

} // namespace linkwalker::application
