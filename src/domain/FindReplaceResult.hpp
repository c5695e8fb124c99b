/**
 * @file FindReplaceResult.hpp
 * @brief Outcomes of single-file and bulk find/replace runs.
 */

#pragma once
#include <string>
#include <vector>
#include <optional>

namespace linkwalker::domain {

namespace status {
    inline const char* const kFound = "Found";
    inline const char* const kReplacedAndSaved = "Replaced & Saved";
    inline const char* const kNoFindText = "No find_text provided";
    inline const char* const kError = "error";
}

/**
 * @enum LinkScope
 * @brief Which part of a hyperlink the link engine looks at.
 */
enum class LinkScope {
    Name, ///< Display text only.
    Url,  ///< Target only.
    Both
};

inline std::string LinkScopeToString(LinkScope scope) {
    switch (scope) {
        case LinkScope::Name: return "name";
        case LinkScope::Url: return "url";
        case LinkScope::Both: return "both";
    }
    return "both";
}

/** @return std::nullopt for anything other than "name", "url" or "both". */
inline std::optional<LinkScope> ParseLinkScope(const std::string& text) {
    if (text == "name") return LinkScope::Name;
    if (text == "url") return LinkScope::Url;
    if (text == "both") return LinkScope::Both;
    return std::nullopt;
}

/**
 * @struct FindReplaceResult
 * @brief Result for one file in one invocation.
 */
struct FindReplaceResult {
    std::string path;
    size_t matches = 0;
    std::string status = status::kFound;
    std::vector<std::string> snippets;
    std::optional<std::string> copyPath;           ///< Backup written for this run.
    std::optional<std::vector<std::string>> foundUrls;  ///< Link engine only.
    std::optional<std::vector<std::string>> foundTexts; ///< Link engine only.
    std::optional<bool> didReplace;                ///< Link engine only.
    std::optional<std::string> error;
};

/**
 * @struct BulkResult
 * @brief Aggregate over a file set.
 */
struct BulkResult {
    size_t totalMatches = 0;
    std::vector<FindReplaceResult> files;
    std::string mode;                   ///< "find" or "replace".
    std::optional<std::string> saveRoot;
    std::optional<LinkScope> target;    ///< Set for link-mode runs.
};

} // namespace linkwalker::domain
