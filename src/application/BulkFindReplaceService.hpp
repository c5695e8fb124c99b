/**
 * @file BulkFindReplaceService.hpp
 * @brief Runs the text and link engines over a file list.
 */

#pragma once
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "application/LinkFindReplaceService.hpp"
#include "application/TextFindReplaceService.hpp"
#include "domain/FindReplaceResult.hpp"

namespace linkwalker::application {

/**
 * @brief Per-call backup configuration.
 */
struct BulkOptions {
    std::optional<std::string> backupRoot; ///< No backups when empty.
    std::string baseDir;                   ///< Scan root; backups mirror paths relative to it.
};

/**
 * @class BulkFindReplaceService
 * @brief Aggregates per-file results. A failing file is reported with status "error"
 *        and never aborts the batch.
 */
class BulkFindReplaceService {
public:
    BulkFindReplaceService(std::shared_ptr<TextFindReplaceService> textService,
                           std::shared_ptr<LinkFindReplaceService> linkService);

    domain::BulkResult runText(const std::vector<std::string>& files,
                               const std::string& findText,
                               const std::optional<std::string>& replaceText,
                               const BulkOptions& options);

    /**
     * @brief Link-mode run. Each file gets a find-only pass first; the mutating pass
     *        (with backup) only follows when a replacement was given and matches exist.
     */
    domain::BulkResult runLinks(const std::vector<std::string>& files,
                                const std::string& findText,
                                const std::optional<std::string>& replaceText,
                                domain::LinkScope scope,
                                const BulkOptions& options);

    /**
     * @brief <desktopDir>/<folderName> when the desktop directory exists,
     *        otherwise <scanRoot>/<folderName>.
     */
    static std::string ResolveBackupRoot(const std::string& scanRoot,
                                         const std::string& desktopDir,
                                         const std::string& folderName = "bulk_found");

    /**
     * @brief Drops files stored under @p backupRoot when that root is nested inside @p scanRoot.
     */
    static std::vector<std::string> ExcludeBackupFiles(const std::vector<std::string>& files,
                                                       const std::string& scanRoot,
                                                       const std::string& backupRoot);

private:
    static std::optional<std::string> backupPathFor(const std::string& file, const BulkOptions& options);
    static domain::FindReplaceResult errorResult(const std::string& file, const std::string& message);

    std::shared_ptr<TextFindReplaceService> m_textService;
    std::shared_ptr<LinkFindReplaceService> m_linkService;
};

} // namespace linkwalker::application
