#include "application/LinkExtractionService.hpp"
#include "domain/HyperlinkField.hpp"
#include "domain/LexicalPath.hpp"
#include <iostream>

namespace linkwalker::application {

namespace {
    const char* const kPlaceholderText = "[Image/Object]";
    const char* const kTrackRevisions = "trackRevisions";
}

LinkExtractionService::LinkExtractionService(std::shared_ptr<domain::DocumentLoader> loader, domain::LinkNormalizer normalizer)
    : m_loader(std::move(loader)), m_normalizer(std::move(normalizer)) {}

domain::Link LinkExtractionService::makeLink(std::string text, const std::string& href,
                                             const std::string& docPath, const std::optional<std::string>& baseDir) const {
    domain::Link link;
    link.text = text.empty() ? kPlaceholderText : std::move(text);
    link.rawHref = href;
    auto [type, normalized] = m_normalizer.normalize(href, docPath, baseDir);
    link.type = type;
    link.normalizedTarget = std::move(normalized);
    return link;
}

void LinkExtractionService::collectFromParagraph(domain::WordDocument& document, domain::Paragraph& paragraph,
                                                 const std::string& docPath, const std::optional<std::string>& baseDir,
                                                 std::vector<domain::Link>& out) const {
    for (auto& instruction : paragraph.getFieldInstructions()) {
        const std::string instrText = instruction->getText();
        if (!domain::IsHyperlinkField(instrText)) continue;
        auto url = domain::ExtractFieldUrl(instrText);
        if (url) {
            out.push_back(makeLink(paragraph.getText(), *url, docPath, baseDir));
        }
    }

    for (auto& hyperlink : paragraph.getHyperlinks()) {
        const std::string rId = hyperlink->getRelationshipId();
        if (rId.empty()) continue;
        auto rel = document.findRelationship(rId);
        if (!rel || rel->target.empty()) continue;

        std::string text;
        for (const auto& run : hyperlink->getRuns()) {
            text += run->getText();
        }
        out.push_back(makeLink(std::move(text), rel->target, docPath, baseDir));
    }
}

void LinkExtractionService::collectFromTable(domain::WordDocument& document, domain::Table& table,
                                             const std::string& docPath, const std::optional<std::string>& baseDir,
                                             std::vector<domain::Link>& out) const {
    for (auto& row : table.getRows()) {
        for (auto& cell : row) {
            for (auto& paragraph : cell->getParagraphs()) {
                collectFromParagraph(document, *paragraph, docPath, baseDir, out);
            }
            for (auto& nested : cell->getTables()) {
                collectFromTable(document, *nested, docPath, baseDir, out);
            }
        }
    }
}

std::vector<domain::Link> LinkExtractionService::getLinks(domain::WordDocument& document,
                                                          const std::string& docPath,
                                                          const std::optional<std::string>& baseDir) const {
    std::vector<domain::Link> links;
    for (auto& paragraph : document.getParagraphs()) {
        collectFromParagraph(document, *paragraph, docPath, baseDir, links);
    }
    for (auto& table : document.getTables()) {
        collectFromTable(document, *table, docPath, baseDir, links);
    }
    return links;
}

std::vector<domain::DocumentLinks> LinkExtractionService::collectLinks(const std::vector<std::string>& files,
                                                                       const std::optional<std::string>& baseDir) const {
    std::vector<domain::DocumentLinks> results;
    results.reserve(files.size());
    for (const auto& path : files) {
        domain::DocumentLinks entry;
        entry.path = path;
        try {
            auto document = m_loader->open(path);
            const std::string base = (baseDir && !baseDir->empty()) ? *baseDir : domain::lexical::DirName(path);
            entry.links = getLinks(*document, path, base);
        } catch (const std::exception& e) {
            std::cerr << "[LinkExtraction] " << path << ": " << e.what() << std::endl;
            entry.error = e.what();
        }
        results.push_back(std::move(entry));
    }
    return results;
}

domain::FileAnalysis LinkExtractionService::analyze(const std::string& filePath) const {
    auto document = m_loader->open(filePath);
    domain::FileAnalysis analysis;
    analysis.path = filePath;
    analysis.trackedChanges = document->hasSetting(kTrackRevisions);
    analysis.links = getLinks(*document, filePath, domain::lexical::DirName(filePath));
    return analysis;
}

size_t LinkExtractionService::CountLinks(const std::vector<domain::DocumentLinks>& documents) {
    size_t total = 0;
    for (const auto& doc : documents) {
        total += doc.links.size();
    }
    return total;
}

} // namespace linkwalker::application
