/**
 * @file TextUtils.hpp
 * @brief Small string helpers (trimming, Unicode case mapping, UTF-8 offsets).
 */

#pragma once
#include <string>
#include <vector>

namespace linkwalker::domain::text {

std::string Trim(const std::string& s);

/** @brief Unicode lower-casing of a UTF-8 string. */
std::string ToLower(const std::string& s);

/** @brief Unicode case folding of a UTF-8 string. */
std::string FoldCase(const std::string& s);

/**
 * @brief Byte offset of every UTF-8 code point in @p s, followed by s.size().
 */
std::vector<size_t> CodePointOffsets(const std::string& s);

/**
 * @struct FoldedText
 * @brief Case-folded text with a code point map back to the source.
 *
 * Code point k of the source occupies [sourceOffsets[k], sourceOffsets[k+1])
 * and folds to [foldedOffsets[k], foldedOffsets[k+1]). Both vectors end with
 * the total length.
 */
struct FoldedText {
    std::string folded;
    std::vector<size_t> sourceOffsets;
    std::vector<size_t> foldedOffsets;
};

/**
 * @brief Folds @p s one code point at a time. Bytes that do not decode are kept as is.
 */
FoldedText FoldCodePoints(const std::string& s);

} // namespace linkwalker::domain::text
