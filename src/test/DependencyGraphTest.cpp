#undef NDEBUG
#include <cassert>
#include <iostream>

#include "application/DependencyGraphService.hpp"

using namespace linkwalker;
using application::DependencyGraphService;

namespace {

domain::Link MakeLink(const std::string& text, const std::string& normalized, domain::LinkType type,
                      const std::string& raw = "") {
    domain::Link link;
    link.text = text;
    link.normalizedTarget = normalized;
    link.rawHref = raw.empty() ? normalized : raw;
    link.type = type;
    return link;
}

} // namespace

int main() {
    std::cout << "[Test] Starting DependencyGraph Test..." << std::endl;

    const std::string root = "/proj";
    const std::vector<std::string> files = {"/proj/a.docx", "/proj/b.docx", "/proj/sub/c.docx", "/proj/sub/C.DOCX.docx"};

    std::vector<domain::DocumentLinks> linkData(3);
    linkData[0].path = "/proj/a.docx";
    linkData[0].links = {
        MakeLink("see b", "b.docx", domain::LinkType::Internal, "..\\b.docx"),
        MakeLink("myself", "a.docx", domain::LinkType::Internal),
        MakeLink("c", "https://example.com/c", domain::LinkType::External),
        MakeLink("  C  ", "https://skfgroup.sharepoint.com/sites/x", domain::LinkType::Internal),
    };
    linkData[1].path = "/proj/b.docx";
    linkData[1].links = {
        MakeLink("Spec", "sub/c.docx", domain::LinkType::Document),
        MakeLink("again", "sub/c.docx", domain::LinkType::Internal),
        MakeLink("mail", "mailto:b.docx", domain::LinkType::Email),
    };
    linkData[2].path = "/proj/sub/c.docx";
    linkData[2].links = {
        MakeLink("ref", "/proj/b.docx", domain::LinkType::Internal),
        MakeLink("outside", "/elsewhere/b.docx", domain::LinkType::Internal),
    };

    const auto graph = DependencyGraphService::Build(root, files, linkData);
    assert(graph.size() == files.size());
    assert(graph[0].relativePath == "a.docx");
    assert(graph[2].relativePath == "sub/c.docx");

    // a -> b (path), a -> c (display text); the self link is dropped.
    const auto& a = graph[0];
    assert(a.outgoingCount == 2);
    assert(a.incomingCount == 0);
    assert(a.outgoingDetails.size() == 2);
    assert(a.outgoingDetails[0].targetRelativePath == "b.docx");
    assert(a.outgoingDetails[0].href == "..\\b.docx" && "details carry the raw href");
    assert(a.outgoingDetails[1].targetRelativePath == "sub/c.docx");
    assert(a.outgoingDetails[1].text == "  C  ");

    // b: two links to c count once but keep both details.
    const auto& b = graph[1];
    assert(b.outgoingCount == 1);
    assert(b.outgoingDetails.size() == 2);
    assert(b.incomingCount == 2);
    assert(b.incomingDetails.size() == 2);
    assert(b.incomingDetails[0].fromRelativePath == "a.docx");
    assert(b.incomingDetails[1].fromRelativePath == "sub/c.docx");

    const auto& c = graph[2];
    assert(c.incomingCount == 2);
    assert(c.incomingDetails.size() == 3);
    assert(c.outgoingCount == 1 && "targets outside the root never match");

    assert(graph[3].incomingCount == 0 && graph[3].outgoingCount == 0);
    std::cout << "[PASS] Edges, de-duplication and self links." << std::endl;

    // Display text matches base names regardless of case, accents included.
    std::vector<domain::DocumentLinks> accented(1);
    accented[0].path = "/r/index.docx";
    accented[0].links = {MakeLink("ÖVERSIKT", "https://intranet.skf.com/x", domain::LinkType::Internal)};
    const auto overview = DependencyGraphService::Build("/r", {"/r/index.docx", "/r/översikt.docx"}, accented);
    assert(overview[1].baseNameLower == "översikt");
    assert(overview[1].incomingCount == 1);
    assert(overview[0].outgoingCount == 1);

    // Root-relative re-expression.
    assert(*DependencyGraphService::ToRootRelative("/proj/sub/c.docx", root) == "sub/c.docx");
    assert(*DependencyGraphService::ToRootRelative("sub\\c.docx", root) == "sub/c.docx");
    assert(*DependencyGraphService::ToRootRelative("/elsewhere/x.docx", root) == "/elsewhere/x.docx");
    assert(*DependencyGraphService::ToRootRelative("../up.docx", root) == "../up.docx");
    assert(!DependencyGraphService::ToRootRelative("", root));

    auto record = DependencyGraphService::MakeFileRecord("/proj/Sub/Report.DOCX", root);
    assert(record.relativePath == "Sub/Report.DOCX");
    assert(record.baseNameLower == "report");

    std::cout << "[PASS] DependencyGraph Test." << std::endl;
    return 0;
}
