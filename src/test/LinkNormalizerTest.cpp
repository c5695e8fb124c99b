#undef NDEBUG
#include <cassert>
#include <iostream>

#include "domain/LexicalPath.hpp"
#include "domain/LinkNormalizer.hpp"

using namespace linkwalker::domain;

int main() {
    std::cout << "[Test] Starting LinkNormalizer Test..." << std::endl;

    LinkNormalizer normalizer("skfgroup.sharepoint.com", "skf");

    // Email
    auto email = normalizer.normalize("  mailto:Someone@Example.com ");
    assert(email.first == LinkType::Email);
    assert(email.second == "mailto:Someone@Example.com");
    assert(normalizer.normalize("MAILTO:x@y.org").first == LinkType::Email);

    // Hub domain
    auto hubDoc = normalizer.normalize("https://SKFGroup.sharepoint.com/sites/eng/Shared%20Documents/plan.docx");
    assert(hubDoc.first == LinkType::Document);
    assert(hubDoc.second == "https://SKFGroup.sharepoint.com/sites/eng/Shared%20Documents/plan.docx");
    assert(normalizer.normalize("https://skfgroup.sharepoint.com/sites/eng").first == LinkType::Internal);

    // Organization keyword
    assert(normalizer.normalize("https://intranet.skf.com/page").first == LinkType::Internal);

    // Keyword checks run before scheme checks: an unrelated site that merely
    // contains the keyword is classified as internal.
    auto incidental = normalizer.normalize("https://example.com/askfor-help");
    assert(incidental.first == LinkType::Internal && "keyword-before-scheme limitation");

    // External
    assert(normalizer.normalize("https://example.com/a").first == LinkType::External);
    assert(normalizer.normalize("http://example.com").first == LinkType::External);
    assert(normalizer.normalize("ftp://files.example.com/x.zip").first == LinkType::External);
    assert(normalizer.normalize("//cdn.example.com/lib.js").first == LinkType::External);
    std::cout << "[PASS] Scheme and keyword rules." << std::endl;

    // file: URLs
    auto fileUrl = normalizer.normalize("file:///C:/Docs/Team/b.docx", std::nullopt, std::string("C:/Docs"));
    assert(fileUrl.first == LinkType::Internal);
    assert(fileUrl.second == "Team/b.docx");

    auto posixFile = normalizer.normalize("file:///srv/share/My%20Docs/a.docx", std::nullopt, std::string("/srv/share"));
    assert(posixFile.first == LinkType::Internal);
    assert(posixFile.second == "My Docs/a.docx");

    auto noBase = normalizer.normalize("file:///srv/share/x.docx");
    assert(noBase.first == LinkType::Internal);
    assert(noBase.second == "/srv/share/x.docx");

    // Drive paths
    auto drive = normalizer.normalize("C:\\Docs\\Team\\b.docx", std::nullopt, std::string("C:\\Docs"));
    assert(drive.first == LinkType::Internal);
    assert(drive.second == "Team/b.docx");

    auto otherDrive = normalizer.normalize("D:\\Other\\x.docx", std::nullopt, std::string("C:/Docs"));
    assert(otherDrive.first == LinkType::Internal);
    assert(otherDrive.second == "D:/Other/x.docx");
    std::cout << "[PASS] file: URLs and drive paths." << std::endl;

    // Relative to the containing document
    const std::string base = "/data/docs";
    const std::string docPath = "/data/docs/team/a.docx";
    auto relative = normalizer.normalize("../shared/c.docx", docPath, base);
    assert(relative.first == LinkType::Internal);
    assert(relative.second == "shared/c.docx");

    // Re-joining the relative target with the base reproduces the resolved path.
    const std::string rejoined = lexical::Normalize(lexical::Join(base, relative.second));
    assert(lexical::ComparisonKey(rejoined) == lexical::ComparisonKey("/data/docs/shared/c.docx"));

    auto sibling = normalizer.normalize("b.docx", docPath, base);
    assert(sibling.first == LinkType::Internal);
    assert(sibling.second == "team/b.docx");

    auto unresolved = normalizer.normalize("notes.docx");
    assert(unresolved.first == LinkType::Unknown);
    assert(unresolved.second == "notes.docx");
    std::cout << "[PASS] Relative references." << std::endl;

    // Helpers
    assert(LinkNormalizer::ParseScheme("HTTPS://x") == "https");
    assert(LinkNormalizer::ParseScheme("C:\\x").size() == 1);
    assert(LinkNormalizer::ParseScheme("no scheme here").empty());
    assert(LinkNormalizer::PercentDecode("a%20b%2") == "a b%2");
    assert(LinkNormalizer::IsDrivePath("c:/x"));
    assert(!LinkNormalizer::IsDrivePath("c:x"));

    std::cout << "[PASS] LinkNormalizer Test." << std::endl;
    return 0;
}
