/**
 * @file LinkNormalizer.hpp
 * @brief Classifies hyperlink targets and rewrites file references relative to a scan root.
 */

#pragma once
#include <string>
#include <optional>
#include <utility>
#include "domain/Link.hpp"

namespace linkwalker::domain {

/**
 * @class LinkNormalizer
 * @brief Turns a raw href into a (LinkType, normalized target) pair.
 *
 * Rules are evaluated in a fixed order and the first one that applies wins.
 * Keyword checks run before scheme checks, so an https URL on the
 * organization's hub is internal, and any external URL that merely contains
 * the organization keyword is internal too.
 */
class LinkNormalizer {
public:
    LinkNormalizer(std::string hubDomain, std::string orgKeyword);

    /**
     * @brief Classifies and normalizes a link target.
     * @param href Raw target string (surrounding whitespace is ignored).
     * @param docPath Path of the document containing the link, if known.
     * @param baseDir Directory that relative results are expressed against.
     * @return The link type and its normalized representation.
     */
    std::pair<LinkType, std::string> normalize(const std::string& href,
                                               const std::optional<std::string>& docPath = std::nullopt,
                                               const std::optional<std::string>& baseDir = std::nullopt) const;

    /** @brief Returns the lower-cased URL scheme, or an empty string when there is none. */
    static std::string ParseScheme(const std::string& href);

    /** @brief Decodes %XX escapes; malformed escapes are kept literally. */
    static std::string PercentDecode(const std::string& text);

    /** @brief True for `X:\...` and `X:/...`. */
    static bool IsDrivePath(const std::string& text);

private:
    std::string m_hubDomain;  ///< Lower-cased collaboration hub domain token.
    std::string m_orgKeyword; ///< Lower-cased organization keyword.

    std::string relativizeOrKeep(const std::string& path, const std::optional<std::string>& baseDir) const;
};

} // namespace linkwalker::domain
