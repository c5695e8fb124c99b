#include "application/BulkFindReplaceService.hpp"
#include "application/BackupPolicy.hpp"
#include "domain/LexicalPath.hpp"
#include <filesystem>
#include <iostream>

namespace fs = std::filesystem;

namespace linkwalker::application {

BulkFindReplaceService::BulkFindReplaceService(std::shared_ptr<TextFindReplaceService> textService,
                                               std::shared_ptr<LinkFindReplaceService> linkService)
    : m_textService(std::move(textService)), m_linkService(std::move(linkService)) {}

std::string BulkFindReplaceService::ResolveBackupRoot(const std::string& scanRoot,
                                                      const std::string& desktopDir,
                                                      const std::string& folderName) {
    std::error_code ec;
    if (!desktopDir.empty() && fs::is_directory(desktopDir, ec)) {
        return domain::lexical::Join(desktopDir, folderName);
    }
    return domain::lexical::Join(scanRoot, folderName);
}

std::vector<std::string> BulkFindReplaceService::ExcludeBackupFiles(const std::vector<std::string>& files,
                                                                    const std::string& scanRoot,
                                                                    const std::string& backupRoot) {
    if (!BackupPolicy::IsUnder(backupRoot, scanRoot)) {
        return files;
    }
    std::vector<std::string> kept;
    kept.reserve(files.size());
    for (const auto& file : files) {
        if (BackupPolicy::IsUnder(file, backupRoot)) {
            std::cerr << "[BulkFindReplace] Skipping backup copy " << file << std::endl;
            continue;
        }
        kept.push_back(file);
    }
    return kept;
}

std::optional<std::string> BulkFindReplaceService::backupPathFor(const std::string& file, const BulkOptions& options) {
    if (!options.backupRoot) return std::nullopt;
    return BackupPolicy::ComputeBackupPath(file, options.baseDir, *options.backupRoot);
}

domain::FindReplaceResult BulkFindReplaceService::errorResult(const std::string& file, const std::string& message) {
    domain::FindReplaceResult result;
    result.path = file;
    result.matches = 0;
    result.status = domain::status::kError;
    result.error = message;
    return result;
}

domain::BulkResult BulkFindReplaceService::runText(const std::vector<std::string>& files,
                                                   const std::string& findText,
                                                   const std::optional<std::string>& replaceText,
                                                   const BulkOptions& options) {
    domain::BulkResult bulk;
    bulk.mode = replaceText ? "replace" : "find";
    bulk.saveRoot = options.backupRoot;

    const auto targets = options.backupRoot ? ExcludeBackupFiles(files, options.baseDir, *options.backupRoot) : files;
    std::cerr << "[BulkFindReplace] Text " << bulk.mode << " over " << targets.size() << " file(s)" << std::endl;

    for (const auto& file : targets) {
        try {
            auto result = m_textService->process(file, findText, replaceText, backupPathFor(file, options));
            bulk.totalMatches += result.matches;
            bulk.files.push_back(std::move(result));
        } catch (const std::exception& e) {
            std::cerr << "[BulkFindReplace] " << file << ": " << e.what() << std::endl;
            bulk.files.push_back(errorResult(file, e.what()));
        }
    }
    return bulk;
}

domain::BulkResult BulkFindReplaceService::runLinks(const std::vector<std::string>& files,
                                                    const std::string& findText,
                                                    const std::optional<std::string>& replaceText,
                                                    domain::LinkScope scope,
                                                    const BulkOptions& options) {
    domain::BulkResult bulk;
    bulk.mode = replaceText ? "replace" : "find";
    bulk.saveRoot = options.backupRoot;
    bulk.target = scope;

    const auto targets = options.backupRoot ? ExcludeBackupFiles(files, options.baseDir, *options.backupRoot) : files;
    std::cerr << "[BulkFindReplace] Link " << bulk.mode << " (" << domain::LinkScopeToString(scope)
              << ") over " << targets.size() << " file(s)" << std::endl;

    for (const auto& file : targets) {
        // Saved copies may sit outside the scan root; never process them.
        if (options.backupRoot && BackupPolicy::IsUnder(file, *options.backupRoot)) {
            continue;
        }
        try {
            auto detection = m_linkService->process(file, findText, std::nullopt, scope, std::nullopt);
            if (detection.matches > 0 && replaceText) {
                detection = m_linkService->process(file, findText, replaceText, scope, backupPathFor(file, options));
            }
            bulk.totalMatches += detection.matches;
            bulk.files.push_back(std::move(detection));
        } catch (const std::exception& e) {
            std::cerr << "[BulkFindReplace] " << file << ": " << e.what() << std::endl;
            bulk.files.push_back(errorResult(file, e.what()));
        }
    }
    return bulk;
}

} // namespace linkwalker::application
