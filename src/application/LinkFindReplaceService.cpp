#include "application/LinkFindReplaceService.hpp"
#include "application/BackupPolicy.hpp"
#include "domain/HyperlinkField.hpp"
#include <iostream>

namespace linkwalker::application {

namespace {
    std::string ReplaceOccurrences(std::string text, const std::string& from, const std::string& to) {
        if (from.empty()) return text;
        size_t pos = 0;
        while ((pos = text.find(from, pos)) != std::string::npos) {
            text.replace(pos, from.size(), to);
            pos += to.size();
        }
        return text;
    }
}

LinkFindReplaceService::LinkFindReplaceService(std::shared_ptr<domain::DocumentLoader> loader)
    : m_loader(std::move(loader)) {}

void LinkFindReplaceService::processHyperlink(domain::HyperlinkReference& hyperlink, ScanState& state) {
    const std::string rId = hyperlink.getRelationshipId();
    std::optional<domain::Relationship> rel;
    if (!rId.empty()) {
        rel = state.document.findRelationship(rId);
    }

    auto runs = hyperlink.getRuns();
    std::string linkText;
    for (const auto& run : runs) {
        linkText += run->getText();
    }

    if (state.matchesNames() && !linkText.empty()) {
        const size_t count = state.matcher.count(linkText);
        if (count > 0) {
            state.matches += count;
            state.snippets.push_back("text: " + linkText);
            state.foundTexts.insert(linkText);
            if (state.replaceText) {
                for (auto& run : runs) {
                    const std::string runText = run->getText();
                    if (!runText.empty() && state.matcher.contains(runText)) {
                        run->setText(state.matcher.replaceAll(runText, *state.replaceText));
                    }
                }
            }
        }
    }

    if (!state.matchesUrls() || !rel || rel->target.empty()) return;

    const size_t count = state.matcher.count(rel->target);
    if (count == 0) return;

    state.matches += count;
    state.snippets.push_back("url: " + rel->target);
    state.foundUrls.insert(rel->target);
    if (!state.replaceText) return;

    try {
        const std::string newId = state.document.createHyperlinkRelationship(*state.replaceText, rel->isExternal);
        hyperlink.setRelationshipId(newId);
        state.snippets.push_back("replaced-url: " + rel->target + " -> " + *state.replaceText + " (rId=" + newId + ")");
    } catch (const std::exception& e) {
        std::cerr << "[LinkFindReplace] URL rewrite failed for " << rel->target << ": " << e.what() << std::endl;
        state.snippets.push_back(std::string("replace-url-failed: ") + e.what());
    }
}

void LinkFindReplaceService::processFieldHyperlinks(domain::Paragraph& paragraph, ScanState& state) {
    for (auto& instruction : paragraph.getFieldInstructions()) {
        const std::string instrText = instruction->getText();
        if (!domain::IsHyperlinkField(instrText)) continue;

        const auto url = domain::ExtractFieldUrl(instrText);
        const std::string displayText = paragraph.getText();

        if (state.matchesUrls() && url) {
            const size_t count = state.matcher.count(*url);
            if (count > 0) {
                state.matches += count;
                state.snippets.push_back("field-url: " + *url);
                state.foundUrls.insert(*url);
                if (state.replaceText) {
                    try {
                        instruction->setText(ReplaceOccurrences(instrText, *url, *state.replaceText));
                        state.snippets.push_back("replaced-field-url: " + *url + " -> " + *state.replaceText);
                    } catch (const std::exception& e) {
                        state.snippets.push_back(std::string("replace-field-url-failed: ") + e.what());
                    }
                }
            }
        }

        if (state.matchesNames() && !displayText.empty()) {
            const size_t count = state.matcher.count(displayText);
            if (count > 0) {
                state.matches += count;
                state.snippets.push_back("field-text: " + displayText);
                state.foundTexts.insert(displayText);
                if (state.replaceText) {
                    for (auto& run : paragraph.getRuns()) {
                        const std::string runText = run->getText();
                        if (!runText.empty()) {
                            run->setText(state.matcher.replaceAll(runText, *state.replaceText));
                        }
                    }
                }
            }
        }
    }
}

void LinkFindReplaceService::processParagraph(domain::Paragraph& paragraph, ScanState& state) {
    processFieldHyperlinks(paragraph, state);
    for (auto& hyperlink : paragraph.getHyperlinks()) {
        processHyperlink(*hyperlink, state);
    }
}

void LinkFindReplaceService::processTable(domain::Table& table, ScanState& state) {
    for (auto& row : table.getRows()) {
        for (auto& cell : row) {
            for (auto& paragraph : cell->getParagraphs()) {
                processParagraph(*paragraph, state);
            }
            for (auto& nested : cell->getTables()) {
                processTable(*nested, state);
            }
        }
    }
}

domain::FindReplaceResult LinkFindReplaceService::process(const std::string& filePath,
                                                          const std::string& findText,
                                                          const std::optional<std::string>& replaceText,
                                                          domain::LinkScope scope,
                                                          const std::optional<std::string>& backupPath) {
    domain::FindReplaceResult result;
    result.path = filePath;
    if (findText.empty()) {
        result.status = domain::status::kNoFindText;
        return result;
    }

    domain::LiteralMatcher matcher(findText);
    auto document = m_loader->open(filePath);

    ScanState state{*document, matcher, replaceText, scope};
    for (auto& paragraph : document->getParagraphs()) {
        processParagraph(*paragraph, state);
    }
    for (auto& table : document->getTables()) {
        processTable(*table, state);
    }

    result.matches = state.matches;
    result.snippets = std::move(state.snippets);
    if (!state.foundUrls.empty()) result.foundUrls = state.foundUrls.items();
    if (!state.foundTexts.empty()) result.foundTexts = state.foundTexts.items();

    if (result.matches > 0 && backupPath) {
        result.copyPath = BackupPolicy::CaptureOriginal(filePath, *backupPath);
    }

    const bool replacing = replaceText && result.matches > 0;
    if (replacing) {
        document->save(filePath);
        result.status = domain::status::kReplacedAndSaved;
        std::cerr << "[LinkFindReplace] Saved " << filePath << " (" << result.matches << " hyperlink match(es))" << std::endl;
    }
    result.didReplace = replacing;
    return result;
}

} // namespace linkwalker::application
