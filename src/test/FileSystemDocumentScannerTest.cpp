#undef NDEBUG
#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>

#include "DocxFixture.hpp"
#include "infrastructure/FileSystemDocumentScanner.hpp"

using namespace linkwalker;
namespace fs = std::filesystem;

namespace {

void Touch(const fs::path& path) {
    fs::create_directories(path.parent_path());
    std::ofstream out(path);
    out << "x";
}

} // namespace

int main() {
    std::cout << "[Test] Starting FileSystemDocumentScanner Test..." << std::endl;

    infrastructure::FileSystemDocumentScanner scanner;
    assert(scanner.isEligibleName("report.docx"));
    assert(!scanner.isEligibleName("~$report.docx"));
    assert(!scanner.isEligibleName("report.doc"));
    assert(!scanner.isEligibleName("report.DOCX"));
    assert(!scanner.isEligibleName(".docx~"));
    std::cout << "[PASS] Name eligibility." << std::endl;

    auto root = test::MakeScratchDir("linkwalker_scanner");
    Touch(root / "b.docx");
    Touch(root / "a.docx");
    Touch(root / "~$a.docx");
    Touch(root / "notes.txt");
    Touch(root / "zeta" / "z.docx");
    Touch(root / "alpha" / "deep" / "d.docx");
    fs::create_directories(root / "empty");

    const auto files = scanner.listDocuments(root.string());
    assert(files.size() == 4);
    assert(fs::path(files[0]) == root / "a.docx");
    assert(fs::path(files[1]) == root / "alpha" / "deep" / "d.docx");
    assert(fs::path(files[2]) == root / "b.docx");
    assert(fs::path(files[3]) == root / "zeta" / "z.docx");
    std::cout << "[PASS] Sorted recursive listing." << std::endl;

    const auto tree = scanner.scanTree(root.string());
    assert(tree.type == "folder");
    assert(tree.name == "linkwalker_scanner");
    // a.docx, alpha/, b.docx, empty/, zeta/
    assert(tree.children.size() == 5);
    assert(tree.children[0].name == "a.docx" && tree.children[0].type == "file");
    assert(tree.children[1].name == "alpha" && tree.children[1].type == "folder");
    assert(tree.children[1].children.size() == 1);
    assert(tree.children[1].children[0].children[0].name == "d.docx");
    assert(tree.children[3].name == "empty" && tree.children[3].children.empty());
    std::cout << "[PASS] Folder tree." << std::endl;

    assert(scanner.listDocuments((root / "does-not-exist").string()).empty());

    infrastructure::FileSystemDocumentScanner custom(".txt", "");
    const auto texts = custom.listDocuments(root.string());
    assert(texts.size() == 1 && fs::path(texts[0]).filename() == "notes.txt");

    fs::remove_all(root);
    std::cout << "[PASS] FileSystemDocumentScanner Test." << std::endl;
    return 0;
}
