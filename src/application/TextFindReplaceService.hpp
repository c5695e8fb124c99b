/**
 * @file TextFindReplaceService.hpp
 * @brief Literal find/replace over document body text.
 */

#pragma once
#include <memory>
#include <optional>
#include <string>
#include "domain/FindReplaceResult.hpp"
#include "domain/LiteralMatcher.hpp"
#include "domain/WordDocument.hpp"

namespace linkwalker::application {

/**
 * @class TextFindReplaceService
 * @brief Scans body paragraphs and table cells (nested tables included) for a term.
 */
class TextFindReplaceService {
public:
    explicit TextFindReplaceService(std::shared_ptr<domain::DocumentLoader> loader);

    /**
     * @brief Finds, and optionally replaces, a term in one document.
     * @param filePath Document to process.
     * @param findText Literal search term, matched without regard to case.
     * @param replaceText Replacement; when set and a match exists the document is saved in place.
     * @param backupPath Where to copy the original when a match exists.
     * @return Match count, status, context snippets and the backup path if one was written.
     * @throws domain::DocumentOpenError, domain::DocumentParseError, domain::DocumentSaveError
     */
    domain::FindReplaceResult process(const std::string& filePath,
                                      const std::string& findText,
                                      const std::optional<std::string>& replaceText = std::nullopt,
                                      const std::optional<std::string>& backupPath = std::nullopt);

    /**
     * @brief Context for a matching paragraph: the trimmed text, or a window of
     *        40 characters around the first match when it exceeds 100 characters.
     */
    static std::string BuildSnippet(const std::string& text, const domain::LiteralMatcher& matcher);

private:
    struct ScanState {
        const domain::LiteralMatcher& matcher;
        const std::optional<std::string>& replaceText;
        size_t matches = 0;
        std::vector<std::string> snippets;
    };

    void processParagraph(domain::Paragraph& paragraph, ScanState& state);
    void processTable(domain::Table& table, ScanState& state);

    std::shared_ptr<domain::DocumentLoader> m_loader;
};

} // namespace linkwalker::application
