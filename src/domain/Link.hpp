/**
 * @file Link.hpp
 * @brief Domain value object for a hyperlink extracted from a document.
 */

#pragma once
#include <string>
#include <vector>
#include <optional>

namespace linkwalker::domain {

/**
 * @enum LinkType
 * @brief Classification assigned by the LinkNormalizer.
 */
enum class LinkType {
    Email,
    Internal,
    Document,
    External,
    Unknown
};

inline std::string LinkTypeToString(LinkType type) {
    switch (type) {
        case LinkType::Email: return "email";
        case LinkType::Internal: return "internal";
        case LinkType::Document: return "document";
        case LinkType::External: return "external";
        case LinkType::Unknown: return "unknown";
    }
    return "unknown";
}

/**
 * @struct Link
 * @brief An extracted hyperlink. Produced fresh on every scan.
 */
struct Link {
    std::string text;             ///< Visible link text.
    std::string rawHref;          ///< Target exactly as stored in the document.
    std::string normalizedTarget; ///< Root-relative path for internal links, otherwise the href.
    LinkType type = LinkType::Unknown;
};

/**
 * @struct DocumentLinks
 * @brief Links found in one file, or the reason they could not be read.
 */
struct DocumentLinks {
    std::string path;
    std::vector<Link> links;
    std::optional<std::string> error;
};

/**
 * @struct FileAnalysis
 * @brief Single-file inspection: track-changes flag plus links.
 */
struct FileAnalysis {
    std::string path;
    bool trackedChanges = false;
    std::vector<Link> links;
};

} // namespace linkwalker::domain
