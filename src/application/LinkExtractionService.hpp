/**
 * @file LinkExtractionService.hpp
 * @brief Read-only hyperlink extraction and classification.
 */

#pragma once
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "domain/Link.hpp"
#include "domain/LinkNormalizer.hpp"
#include "domain/WordDocument.hpp"

namespace linkwalker::application {

class LinkExtractionService {
public:
    LinkExtractionService(std::shared_ptr<domain::DocumentLoader> loader, domain::LinkNormalizer normalizer);

    /**
     * @brief Every hyperlink of an open document, body and tables, in document order.
     * @param docPath Path of the document; relative targets resolve against its folder.
     * @param baseDir Directory internal targets are expressed relative to.
     */
    std::vector<domain::Link> getLinks(domain::WordDocument& document,
                                       const std::string& docPath,
                                       const std::optional<std::string>& baseDir) const;

    /**
     * @brief Extracts links from every file. A file that cannot be read gets an
     *        error entry and the rest continue.
     * @param baseDir Common base directory; each file's own folder when empty.
     */
    std::vector<domain::DocumentLinks> collectLinks(const std::vector<std::string>& files,
                                                    const std::optional<std::string>& baseDir = std::nullopt) const;

    /**
     * @brief Track-changes flag and links of one file, relative to its own folder.
     * @throws domain::DocumentOpenError, domain::DocumentParseError
     */
    domain::FileAnalysis analyze(const std::string& filePath) const;

    static size_t CountLinks(const std::vector<domain::DocumentLinks>& documents);

private:
    void collectFromParagraph(domain::WordDocument& document, domain::Paragraph& paragraph,
                              const std::string& docPath, const std::optional<std::string>& baseDir,
                              std::vector<domain::Link>& out) const;
    void collectFromTable(domain::WordDocument& document, domain::Table& table,
                          const std::string& docPath, const std::optional<std::string>& baseDir,
                          std::vector<domain::Link>& out) const;
    domain::Link makeLink(std::string text, const std::string& href,
                          const std::string& docPath, const std::optional<std::string>& baseDir) const;

    std::shared_ptr<domain::DocumentLoader> m_loader;
    domain::LinkNormalizer m_normalizer;
};

} // namespace linkwalker::application
