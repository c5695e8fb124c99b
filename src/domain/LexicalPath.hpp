/**
 * @file LexicalPath.hpp
 * @brief Purely lexical path helpers shared by link normalization, bulk runs and the graph.
 *
 * Paths are handled as text with '/' separators. Backslashes are treated as
 * separators and drive-letter paths (`C:/...`) count as absolute on every
 * platform, because documents written on Windows carry such targets.
 */

#pragma once
#include <string>
#include <optional>

namespace linkwalker::domain::lexical {

/** @brief Converts separators to '/', collapses '.' and '..', drops trailing separators. */
std::string Normalize(const std::string& path);

/** @brief True for POSIX absolute paths and drive-letter paths. */
bool IsAbsolute(const std::string& path);

/** @brief Joins a relative path onto the current directory; absolute paths are returned normalized. */
std::string MakeAbsolute(const std::string& path);

/** @brief Joins two path fragments with a single '/'. An absolute tail replaces the head. */
std::string Join(const std::string& head, const std::string& tail);

/** @brief Parent directory of a path ("" when there is none). */
std::string DirName(const std::string& path);

/**
 * @brief Expresses @p path relative to @p base.
 * @return std::nullopt when no relative form exists (e.g. different drives).
 */
std::optional<std::string> Relative(const std::string& path, const std::string& base);

/** @brief True when a relative path climbs out of its base ("..", "../x"). */
bool EscapesBase(const std::string& relativePath);

/** @brief Case- and separator-insensitive comparison key. */
std::string ComparisonKey(const std::string& path);

} // namespace linkwalker::domain::lexical
