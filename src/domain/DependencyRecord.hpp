/**
 * @file DependencyRecord.hpp
 * @brief Per-file entries of the document dependency graph.
 */

#pragma once
#include <string>
#include <vector>

namespace linkwalker::domain {

/**
 * @struct FileRecord
 * @brief Identity of a document in the graph. absolutePath is unique per file set.
 */
struct FileRecord {
    std::string absolutePath;
    std::string relativePath;  ///< Relative to the scan root, '/' separated.
    std::string baseNameLower; ///< File name without extension, lower-cased.
};

struct OutgoingDetail {
    std::string text;
    std::string href;
    std::string targetRelativePath;
};

struct IncomingDetail {
    std::string fromRelativePath;
    std::string text;
    std::string href;
};

/**
 * @struct DependencyRecord
 * @brief Edges of one file. Counts are distinct files; details keep every link.
 */
struct DependencyRecord {
    std::string path;
    std::string relativePath;
    size_t outgoingCount = 0;
    size_t incomingCount = 0;
    std::vector<OutgoingDetail> outgoingDetails;
    std::vector<IncomingDetail> incomingDetails;
};

} // namespace linkwalker::domain
