/**
 * @file FileSystemDocumentScanner.cpp
 * @brief Implementation of the FileSystemDocumentScanner.
 */

#include "infrastructure/FileSystemDocumentScanner.hpp"
#include <algorithm>
#include <filesystem>
#include <iostream>
#include <system_error>

namespace fs = std::filesystem;

namespace linkwalker::infrastructure {

namespace {
    // Directory entries sorted by name. An unreadable directory yields nothing.
    std::vector<fs::directory_entry> ReadDirectory(const std::string& dirPath) {
        std::vector<fs::directory_entry> entries;
        std::error_code ec;
        fs::directory_iterator it(dirPath, fs::directory_options::skip_permission_denied, ec);
        if (ec) {
            std::cerr << "[FileSystemDocumentScanner] Skipping " << dirPath << ": " << ec.message() << std::endl;
            return entries;
        }
        for (; it != fs::directory_iterator(); it.increment(ec)) {
            if (ec) break;
            entries.push_back(*it);
        }
        std::sort(entries.begin(), entries.end(), [](const fs::directory_entry& a, const fs::directory_entry& b) {
            return a.path().filename() < b.path().filename();
        });
        return entries;
    }

    bool IsTraversableDirectory(const fs::directory_entry& entry) {
        std::error_code ec;
        return entry.is_directory(ec) && !entry.is_symlink(ec);
    }

    bool IsRegularFile(const fs::directory_entry& entry) {
        std::error_code ec;
        return entry.is_regular_file(ec);
    }

    std::string FolderName(const std::string& path) {
        fs::path p(path);
        if (p.filename().empty()) p = p.parent_path();
        return p.filename().string();
    }
}

FileSystemDocumentScanner::FileSystemDocumentScanner(std::string extension, std::string lockPrefix)
    : m_extension(std::move(extension)), m_lockPrefix(std::move(lockPrefix)) {}

bool FileSystemDocumentScanner::isEligibleName(const std::string& filename) const {
    if (filename.size() < m_extension.size()) return false;
    if (filename.compare(filename.size() - m_extension.size(), m_extension.size(), m_extension) != 0) return false;
    return m_lockPrefix.empty() || filename.rfind(m_lockPrefix, 0) != 0;
}

domain::FolderNode FileSystemDocumentScanner::scanTree(const std::string& rootPath) const {
    domain::FolderNode tree;
    tree.name = FolderName(rootPath);
    tree.type = "folder";
    tree.path = rootPath;

    for (const auto& entry : ReadDirectory(rootPath)) {
        if (IsTraversableDirectory(entry)) {
            tree.children.push_back(scanTree(entry.path().string()));
        } else if (IsRegularFile(entry) && isEligibleName(entry.path().filename().string())) {
            domain::FolderNode file;
            file.name = entry.path().filename().string();
            file.type = "file";
            file.path = entry.path().string();
            tree.children.push_back(file);
        }
    }
    return tree;
}

std::vector<std::string> FileSystemDocumentScanner::listDocuments(const std::string& rootPath) const {
    std::vector<std::string> documents;
    collect(rootPath, documents);
    return documents;
}

void FileSystemDocumentScanner::collect(const std::string& dirPath, std::vector<std::string>& out) const {
    for (const auto& entry : ReadDirectory(dirPath)) {
        if (IsTraversableDirectory(entry)) {
            collect(entry.path().string(), out);
        } else if (IsRegularFile(entry) && isEligibleName(entry.path().filename().string())) {
            out.push_back(entry.path().string());
        }
    }
}

} // namespace linkwalker::infrastructure
