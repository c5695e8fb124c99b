#undef NDEBUG
#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>

#include "DocxFixture.hpp"
#include "domain/Errors.hpp"
#include "infrastructure/DocxDocument.hpp"

using namespace linkwalker;
using infrastructure::DocxDocument;
namespace fs = std::filesystem;

int main() {
    std::cout << "[Test] Starting DocxDocument Test..." << std::endl;

    auto root = test::MakeScratchDir("linkwalker_docx");

    // Open failures.
    bool threw = false;
    try {
        DocxDocument::Open((root / "absent.docx").string());
    } catch (const domain::DocumentOpenError&) {
        threw = true;
    }
    assert(threw && "missing file");

    const std::string junk = (root / "junk.docx").string();
    {
        std::ofstream out(junk);
        out << "PK but not really";
    }
    threw = false;
    try {
        DocxDocument::Open(junk);
    } catch (const domain::LinkWalkerError&) {
        threw = true;
    }
    assert(threw && "not a zip package");
    std::cout << "[PASS] Open errors." << std::endl;

    // Structure and relationships.
    const std::string path = (root / "doc.docx").string();
    test::WriteDocx(path,
                    test::Para("first") + test::HyperlinkPara("rId1", {"Link ", "text"}) +
                    test::Table({test::Para("cell") + test::Table({test::Para("inner")})}),
                    {{"rId1", "https://example.com", true}, {"rId2", "local.docx", false}},
                    true);

    auto doc = DocxDocument::Open(path);
    assert(doc->getPath() == path);
    auto paragraphs = doc->getParagraphs();
    assert(paragraphs.size() == 2 && "table paragraphs are not body paragraphs");
    assert(paragraphs[0]->getText() == "first");
    assert(paragraphs[1]->getText() == "Link text");
    assert(paragraphs[1]->getHyperlinks().size() == 1);
    assert(paragraphs[1]->getHyperlinks()[0]->getRuns().size() == 2);

    auto tables = doc->getTables();
    assert(tables.size() == 1);
    auto rows = tables[0]->getRows();
    assert(rows.size() == 1 && rows[0].size() == 1);
    assert(rows[0][0]->getParagraphs()[0]->getText() == "cell");
    auto nested = rows[0][0]->getTables();
    assert(nested.size() == 1);
    assert(nested[0]->getRows()[0][0]->getParagraphs()[0]->getText() == "inner");

    auto rels = doc->getHyperlinkRelationships();
    assert(rels.size() == 2);
    assert(rels[0].isExternal && !rels[1].isExternal);
    assert(doc->findRelationship("rId2")->target == "local.docx");
    assert(!doc->findRelationship("rId7"));
    assert(doc->hasSetting("trackRevisions"));
    assert(!doc->hasSetting("documentProtection"));
    std::cout << "[PASS] Structure and relationships." << std::endl;

    // Relationship creation reuses matching entries and otherwise allocates a free id.
    assert(doc->createHyperlinkRelationship("https://example.com", true) == "rId1");
    const std::string internalId = doc->createHyperlinkRelationship("https://example.com", false);
    assert(internalId == "rId3");
    assert(doc->getHyperlinkRelationships().size() == 3);
    assert(!doc->findRelationship(internalId)->isExternal);

    // Save and reopen.
    paragraphs[0]->setText("rewritten & <escaped>");
    paragraphs[1]->getHyperlinks()[0]->setRelationshipId(internalId);
    const std::string copy = (root / "out" / "copy.docx").string();
    fs::create_directories(fs::path(copy).parent_path());
    doc->save(copy);

    auto reopened = DocxDocument::Open(copy);
    auto reParagraphs = reopened->getParagraphs();
    assert(reParagraphs[0]->getText() == "rewritten & <escaped>");
    assert(reParagraphs[1]->getHyperlinks()[0]->getRelationshipId() == "rId3");
    assert(reopened->findRelationship("rId3")->target == "https://example.com");
    assert(reopened->hasSetting("trackRevisions"));
    assert(DocxDocument::Open(path)->getParagraphs()[0]->getText() == "first" && "source untouched");
    std::cout << "[PASS] Save round trip." << std::endl;

    fs::remove_all(root);
    std::cout << "[PASS] DocxDocument Test." << std::endl;
    return 0;
}
