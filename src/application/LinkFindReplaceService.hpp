/**
 * @file LinkFindReplaceService.hpp
 * @brief Find/replace restricted to hyperlink display text and targets.
 */

#pragma once
#include <memory>
#include <optional>
#include <string>
#include "domain/FindReplaceResult.hpp"
#include "domain/LiteralMatcher.hpp"
#include "domain/OrderedSet.hpp"
#include "domain/WordDocument.hpp"

namespace linkwalker::application {

/**
 * @class LinkFindReplaceService
 * @brief Handles relationship hyperlinks (w:hyperlink) and field-code hyperlinks
 *        (HYPERLINK instructions) in body paragraphs and table cells.
 *
 * A matching URL is replaced as a whole by the replacement text. Display text is
 * rewritten run by run so formatting boundaries survive.
 */
class LinkFindReplaceService {
public:
    explicit LinkFindReplaceService(std::shared_ptr<domain::DocumentLoader> loader);

    /**
     * @brief Finds, and optionally replaces, a term in one document's hyperlinks.
     * @param scope Which part of a hyperlink is searched.
     * @throws domain::DocumentOpenError, domain::DocumentParseError, domain::DocumentSaveError
     */
    domain::FindReplaceResult process(const std::string& filePath,
                                      const std::string& findText,
                                      const std::optional<std::string>& replaceText = std::nullopt,
                                      domain::LinkScope scope = domain::LinkScope::Both,
                                      const std::optional<std::string>& backupPath = std::nullopt);

private:
    struct ScanState {
        domain::WordDocument& document;
        const domain::LiteralMatcher& matcher;
        const std::optional<std::string>& replaceText;
        domain::LinkScope scope;
        size_t matches = 0;
        std::vector<std::string> snippets;
        domain::OrderedSet<std::string> foundUrls;
        domain::OrderedSet<std::string> foundTexts;

        bool matchesNames() const { return scope != domain::LinkScope::Url; }
        bool matchesUrls() const { return scope != domain::LinkScope::Name; }
    };

    void processParagraph(domain::Paragraph& paragraph, ScanState& state);
    void processFieldHyperlinks(domain::Paragraph& paragraph, ScanState& state);
    void processHyperlink(domain::HyperlinkReference& hyperlink, ScanState& state);
    void processTable(domain::Table& table, ScanState& state);

    std::shared_ptr<domain::DocumentLoader> m_loader;
};

} // namespace linkwalker::application
