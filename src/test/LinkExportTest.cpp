#undef NDEBUG
#include <cassert>
#include <filesystem>
#include <iostream>
#include <sstream>

#include "DocxFixture.hpp"
#include "application/LinkExportService.hpp"

using namespace linkwalker;
using application::LinkExportService;
namespace fs = std::filesystem;

int main() {
    std::cout << "[Test] Starting LinkExport Test..." << std::endl;

    domain::Link link;
    link.text = "Quarterly, \"final\"";
    link.rawHref = "report.docx";
    link.normalizedTarget = "team/report.docx";
    link.type = domain::LinkType::Internal;

    std::vector<domain::DocumentLinks> documents(2);
    documents[0].path = "/docs/a.docx";
    documents[0].links = {link};
    documents[1].path = "/docs/broken.docx";
    documents[1].error = "Cannot open /docs/broken.docx";

    const auto rows = LinkExportService::BuildRows(documents);
    assert(rows.size() == 2);
    assert(rows[0][3] == "internal");
    assert(rows[0][4].empty());
    assert(rows[1][0] == "/docs/broken.docx");
    assert(rows[1][1].empty() && rows[1][2].empty() && rows[1][3].empty());
    assert(rows[1][4] == "Cannot open /docs/broken.docx");
    std::cout << "[PASS] Row building." << std::endl;

    assert(LinkExportService::EscapeCell("plain") == "plain");
    assert(LinkExportService::EscapeCell("a,b") == "\"a,b\"");
    assert(LinkExportService::EscapeCell("say \"hi\"") == "\"say \"\"hi\"\"\"");
    assert(LinkExportService::EscapeCell("two\nlines") == "\"two\nlines\"");

    std::ostringstream out;
    LinkExportService::WriteCsv(out, {{"only"}, rows[0]});
    assert(out.str() ==
           "File,Text,URL,Type,Error\r\n"
           "only,,,,\r\n"
           "/docs/a.docx,\"Quarterly, \"\"final\"\"\",team/report.docx,internal,\r\n");
    std::cout << "[PASS] CSV encoding." << std::endl;

    auto root = test::MakeScratchDir("linkwalker_export");
    const std::string csvPath = (root / "links.csv").string();
    assert(LinkExportService::ExportToFile(csvPath, rows));
    assert(test::ReadBytes(csvPath).rfind("File,Text,URL,Type,Error\r\n", 0) == 0);
    assert(!LinkExportService::ExportToFile((root / "missing" / "dir" / "links.csv").string(), rows));

    fs::remove_all(root);
    std::cout << "[PASS] LinkExport Test." << std::endl;
    return 0;
}
