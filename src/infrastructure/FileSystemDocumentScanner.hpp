/**
 * @file FileSystemDocumentScanner.hpp
 * @brief Recursive discovery of documents under a scan root.
 */

#pragma once
#include <vector>
#include <string>
#include "domain/FolderNode.hpp"

namespace linkwalker::infrastructure {

/**
 * @class FileSystemDocumentScanner
 * @brief Infrastructure adapter that walks a directory tree for eligible documents.
 *
 * A file is eligible when its name ends with the document extension and does
 * not start with the lock-file prefix. Unreadable subdirectories are skipped.
 * Entries are visited in name order; symlinked directories are not followed.
 */
class FileSystemDocumentScanner {
public:
    explicit FileSystemDocumentScanner(std::string extension = ".docx", std::string lockPrefix = "~$");

    /**
     * @brief Builds the folder tree below @p rootPath.
     * @return Root folder node; folders without documents are kept.
     */
    domain::FolderNode scanTree(const std::string& rootPath) const;

    /**
     * @brief Lists every eligible document below @p rootPath.
     * @return Paths in traversal order.
     */
    std::vector<std::string> listDocuments(const std::string& rootPath) const;

    bool isEligibleName(const std::string& filename) const;

private:
    std::string m_extension;
    std::string m_lockPrefix;

    void collect(const std::string& dirPath, std::vector<std::string>& out) const;
};

} // namespace linkwalker::infrastructure
