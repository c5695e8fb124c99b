/**
 * @file HyperlinkField.hpp
 * @brief Parsing of legacy HYPERLINK field instructions.
 */

#pragma once
#include <optional>
#include <string>

namespace linkwalker::domain {

/** @brief True when the instruction text carries the HYPERLINK directive (case-sensitive). */
bool IsHyperlinkField(const std::string& instruction);

/**
 * @brief URL of a HYPERLINK instruction: double-quoted first, then single-quoted,
 *        then the first bare token after the directive.
 */
std::optional<std::string> ExtractFieldUrl(const std::string& instruction);

} // namespace linkwalker::domain
