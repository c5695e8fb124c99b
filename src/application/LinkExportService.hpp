/**
 * @file LinkExportService.hpp
 * @brief Tabular export of extracted links.
 */

#pragma once

#include <ostream>
#include <string>
#include <vector>
#include "domain/Link.hpp"

namespace linkwalker::application {

using ExportRow = std::vector<std::string>;

class LinkExportService {
public:
    /** @brief Column titles: File, Text, URL, Type, Error. */
    static const ExportRow& Header();

    /**
     * @brief One row per link, plus one error row for each file that failed to load.
     */
    static std::vector<ExportRow> BuildRows(const std::vector<domain::DocumentLinks>& documents);

    /**
     * @brief Writes the header and rows as CSV; short rows are padded with empty cells.
     */
    static void WriteCsv(std::ostream& out, const std::vector<ExportRow>& rows);

    /**
     * @brief Writes the CSV export to a file.
     * @return False when the file could not be written.
     */
    static bool ExportToFile(const std::string& path, const std::vector<ExportRow>& rows);

    static std::string EscapeCell(const std::string& cell);
};

} // namespace linkwalker::application
