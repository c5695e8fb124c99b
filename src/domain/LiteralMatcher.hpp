/**
 * @file LiteralMatcher.hpp
 * @brief Case-insensitive literal search and replace.
 */

#pragma once
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace linkwalker::domain {

/**
 * @class LiteralMatcher
 * @brief Matches a literal search term without regard to case.
 *
 * Both sides are compared after Unicode case folding, and a match always
 * covers whole code points of the searched text. Matches are non-overlapping
 * and scanned left to right.
 */
class LiteralMatcher {
public:
    /** @throws InputError if @p literal is empty. */
    explicit LiteralMatcher(const std::string& literal);

    size_t count(const std::string& text) const;
    bool contains(const std::string& text) const;

    /** @brief Byte offset of the first match. */
    std::optional<size_t> firstMatch(const std::string& text) const;

    /** @brief Replaces every match with @p replacement, inserted verbatim. */
    std::string replaceAll(const std::string& text, const std::string& replacement) const;

    const std::string& literal() const { return m_literal; }

private:
    /** @brief Source byte ranges of up to @p limit matches (0 means all). */
    std::vector<std::pair<size_t, size_t>> findMatches(const std::string& text, size_t limit = 0) const;

    std::string m_literal;
    std::string m_folded;
};

} // namespace linkwalker::domain
