/**
 * @file DependencyGraphService.hpp
 * @brief Builds the document dependency graph implied by internal links.
 */

#pragma once

#include <optional>
#include <set>
#include <string>
#include <vector>
#include "domain/DependencyRecord.hpp"
#include "domain/Link.hpp"

namespace linkwalker::application {

class DependencyGraphService {
public:
    /**
     * @brief Builds one dependency record per file, in file-list order.
     * @param rootPath Scan root; relative paths are expressed against it.
     * @param files Every document under the root (unique paths).
     * @param linkData Links extracted from those documents.
     */
    static std::vector<domain::DependencyRecord> Build(const std::string& rootPath,
                                                      const std::vector<std::string>& files,
                                                      const std::vector<domain::DocumentLinks>& linkData);

    /**
     * @brief Re-expresses a normalized target relative to the root when it lies inside it;
     *        otherwise returns the target unchanged (separators unified).
     */
    static std::optional<std::string> ToRootRelative(const std::string& normalized, const std::string& rootPath);

    static domain::FileRecord MakeFileRecord(const std::string& path, const std::string& rootPath);

private:
    static std::set<size_t> MatchTargets(const domain::Link& link,
                                         const std::string& rootPath,
                                         const std::vector<domain::FileRecord>& records);
};

} // namespace linkwalker::application
