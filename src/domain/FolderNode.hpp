/**
 * @file FolderNode.hpp
 * @brief Directory tree of eligible documents.
 */

#pragma once
#include <string>
#include <vector>

namespace linkwalker::domain {

/**
 * @struct FolderNode
 * @brief A folder or a document file in the scanned tree.
 */
struct FolderNode {
    std::string name;
    std::string type; ///< "folder" or "file".
    std::string path;
    std::vector<FolderNode> children;
};

} // namespace linkwalker::domain
