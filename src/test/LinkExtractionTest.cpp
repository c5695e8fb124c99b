#undef NDEBUG
#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>

#include "DocxFixture.hpp"
#include "application/LinkExtractionService.hpp"
#include "domain/Errors.hpp"
#include "infrastructure/DocxDocument.hpp"

using namespace linkwalker;
namespace fs = std::filesystem;

int main() {
    std::cout << "[Test] Starting LinkExtraction Test..." << std::endl;

    auto root = test::MakeScratchDir("linkwalker_link_extraction");
    const std::string docPath = (root / "team" / "a.docx").string();

    const std::string body =
        test::HyperlinkPara("rId1", {"Sibling ", "doc"}) +
        test::HyperlinkPara("rId2", {}) +
        test::HyperlinkPara("rId9", {"dangling"}) +
        test::FieldHyperlinkPara(" HYPERLINK \"https://skfgroup.sharepoint.com/Documents/plan.docx\" ", "Hub plan") +
        test::Table({test::HyperlinkPara("rId3", {"Mail us"})});
    test::WriteDocx(docPath, body,
                    {{"rId1", "b.docx", false},
                     {"rId2", "https://example.com/image", true},
                     {"rId3", "mailto:team@example.com", true}},
                    true);

    auto loader = std::make_shared<infrastructure::DocxDocumentLoader>();
    application::LinkExtractionService service(loader, domain::LinkNormalizer("skfgroup.sharepoint.com", "skf"));

    // Links relative to the scan root.
    const auto collected = service.collectLinks({docPath}, root.string());
    assert(collected.size() == 1);
    assert(!collected[0].error);
    const auto& links = collected[0].links;
    assert(links.size() == 4 && "relationships that do not resolve are skipped");

    assert(links[0].text == "Sibling doc");
    assert(links[0].rawHref == "b.docx");
    assert(links[0].type == domain::LinkType::Internal);
    assert(links[0].normalizedTarget == "team/b.docx");

    assert(links[1].text == "[Image/Object]");
    assert(links[1].type == domain::LinkType::External);

    assert(links[2].text == "Hub plan");
    assert(links[2].type == domain::LinkType::Document);

    assert(links[3].text == "Mail us");
    assert(links[3].type == domain::LinkType::Email);
    assert(application::LinkExtractionService::CountLinks(collected) == 4);
    std::cout << "[PASS] collectLinks." << std::endl;

    // Without a base directory each file's folder is used.
    auto ownFolder = service.collectLinks({docPath});
    assert(ownFolder[0].links[0].normalizedTarget == "b.docx");

    // Analysis uses the file's folder and reports track changes.
    auto analysis = service.analyze(docPath);
    assert(analysis.trackedChanges);
    assert(analysis.path == docPath);
    assert(analysis.links.size() == 4);
    assert(analysis.links[0].normalizedTarget == "b.docx");

    const std::string untracked = (root / "untracked.docx").string();
    test::WriteDocx(untracked, test::Para("no links"));
    auto plain = service.analyze(untracked);
    assert(!plain.trackedChanges);
    assert(plain.links.empty());
    std::cout << "[PASS] analyze." << std::endl;

    // Unreadable files are reported per file.
    const std::string broken = (root / "broken.docx").string();
    {
        std::ofstream out(broken);
        out << "not a document";
    }
    auto mixed = service.collectLinks({broken, untracked}, root.string());
    assert(mixed.size() == 2);
    assert(mixed[0].error && mixed[0].links.empty());
    assert(!mixed[1].error);

    bool threw = false;
    try {
        service.analyze(broken);
    } catch (const domain::DocumentOpenError&) {
        threw = true;
    }
    assert(threw);

    fs::remove_all(root);
    std::cout << "[PASS] LinkExtraction Test." << std::endl;
    return 0;
}
