#include "application/LinkExportService.hpp"
#include <fstream>
#include <iostream>

namespace linkwalker::application {

const ExportRow& LinkExportService::Header() {
    static const ExportRow kHeader = {"File", "Text", "URL", "Type", "Error"};
    return kHeader;
}

std::vector<ExportRow> LinkExportService::BuildRows(const std::vector<domain::DocumentLinks>& documents) {
    std::vector<ExportRow> rows;
    for (const auto& doc : documents) {
        for (const auto& link : doc.links) {
            rows.push_back({doc.path, link.text, link.normalizedTarget, domain::LinkTypeToString(link.type), ""});
        }
        if (doc.error) {
            rows.push_back({doc.path, "", "", "", *doc.error});
        }
    }
    return rows;
}

std::string LinkExportService::EscapeCell(const std::string& cell) {
    if (cell.find_first_of(",\"\r\n") == std::string::npos) {
        return cell;
    }
    std::string quoted = "\"";
    for (char c : cell) {
        if (c == '"') quoted += '"';
        quoted += c;
    }
    quoted += '"';
    return quoted;
}

void LinkExportService::WriteCsv(std::ostream& out, const std::vector<ExportRow>& rows) {
    const auto& header = Header();
    auto writeRow = [&](const ExportRow& row) {
        for (size_t i = 0; i < header.size(); ++i) {
            if (i > 0) out << ',';
            if (i < row.size()) out << EscapeCell(row[i]);
        }
        out << "\r\n";
    };

    writeRow(header);
    for (const auto& row : rows) {
        writeRow(row);
    }
}

bool LinkExportService::ExportToFile(const std::string& path, const std::vector<ExportRow>& rows) {
    std::ofstream file(path, std::ios::binary);
    if (!file.is_open()) {
        std::cerr << "[LinkExport] Cannot open " << path << " for writing" << std::endl;
        return false;
    }
    WriteCsv(file, rows);
    return static_cast<bool>(file);
}

} // namespace linkwalker::application
