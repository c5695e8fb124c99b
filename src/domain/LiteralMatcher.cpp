#include "domain/LiteralMatcher.hpp"
#include "domain/Errors.hpp"
#include "domain/TextUtils.hpp"
#include <algorithm>

namespace linkwalker::domain {

LiteralMatcher::LiteralMatcher(const std::string& literal)
    : m_literal(literal) {
    if (m_literal.empty()) {
        throw InputError("No find_text provided");
    }
    m_folded = text::FoldCodePoints(m_literal).folded;
}

std::vector<std::pair<size_t, size_t>> LiteralMatcher::findMatches(const std::string& text, size_t limit) const {
    std::vector<std::pair<size_t, size_t>> ranges;
    const text::FoldedText folded = text::FoldCodePoints(text);
    const auto& starts = folded.foldedOffsets;

    size_t from = 0;
    while (from < folded.folded.size()) {
        const size_t pos = folded.folded.find(m_folded, from);
        if (pos == std::string::npos) break;

        // Only accept hits that begin and end on a source code point boundary.
        const size_t end = pos + m_folded.size();
        auto first = std::lower_bound(starts.begin(), starts.end(), pos);
        auto last = std::lower_bound(first, starts.end(), end);
        if (first == starts.end() || *first != pos || last == starts.end() || *last != end) {
            from = pos + 1;
            continue;
        }

        ranges.emplace_back(folded.sourceOffsets[first - starts.begin()], folded.sourceOffsets[last - starts.begin()]);
        if (limit != 0 && ranges.size() == limit) break;
        from = end;
    }
    return ranges;
}

size_t LiteralMatcher::count(const std::string& text) const {
    return findMatches(text).size();
}

bool LiteralMatcher::contains(const std::string& text) const {
    return !findMatches(text, 1).empty();
}

std::optional<size_t> LiteralMatcher::firstMatch(const std::string& text) const {
    auto ranges = findMatches(text, 1);
    if (ranges.empty()) return std::nullopt;
    return ranges.front().first;
}

std::string LiteralMatcher::replaceAll(const std::string& text, const std::string& replacement) const {
    std::string result;
    result.reserve(text.size());
    size_t cursor = 0;
    for (const auto& [begin, end] : findMatches(text)) {
        result.append(text, cursor, begin - cursor);
        result += replacement;
        cursor = end;
    }
    result.append(text, cursor, std::string::npos);
    return result;
}

} // namespace linkwalker::domain
