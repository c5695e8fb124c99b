#include "application/TextFindReplaceService.hpp"
#include "application/BackupPolicy.hpp"
#include "domain/TextUtils.hpp"
#include <algorithm>
#include <iostream>

namespace linkwalker::application {

namespace {
    constexpr size_t kSnippetLimit = 100;
    constexpr size_t kSnippetRadius = 40;
}

TextFindReplaceService::TextFindReplaceService(std::shared_ptr<domain::DocumentLoader> loader)
    : m_loader(std::move(loader)) {}

std::string TextFindReplaceService::BuildSnippet(const std::string& text, const domain::LiteralMatcher& matcher) {
    const std::string trimmed = domain::text::Trim(text);
    const auto offsets = domain::text::CodePointOffsets(trimmed);
    const size_t length = offsets.size() - 1;
    if (length <= kSnippetLimit) {
        return trimmed;
    }

    auto first = matcher.firstMatch(trimmed);
    if (!first) {
        return trimmed;
    }
    const size_t matchIndex = static_cast<size_t>(
        std::lower_bound(offsets.begin(), offsets.end(), *first) - offsets.begin());
    const size_t literalLength = domain::text::CodePointOffsets(matcher.literal()).size() - 1;

    const size_t start = matchIndex > kSnippetRadius ? matchIndex - kSnippetRadius : 0;
    const size_t end = std::min(length, matchIndex + literalLength + kSnippetRadius);
    return "..." + trimmed.substr(offsets[start], offsets[end] - offsets[start]) + "...";
}

void TextFindReplaceService::processParagraph(domain::Paragraph& paragraph, ScanState& state) {
    const std::string text = paragraph.getText();
    const size_t count = state.matcher.count(text);
    if (count == 0) return;

    state.matches += count;
    state.snippets.push_back(BuildSnippet(text, state.matcher));
    if (state.replaceText) {
        paragraph.setText(state.matcher.replaceAll(text, *state.replaceText));
    }
}

void TextFindReplaceService::processTable(domain::Table& table, ScanState& state) {
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

domain::FindReplaceResult TextFindReplaceService::process(const std::string& filePath,
                                                          const std::string& findText,
                                                          const std::optional<std::string>& replaceText,
                                                          const std::optional<std::string>& backupPath) {
    domain::FindReplaceResult result;
    result.path = filePath;
    if (findText.empty()) {
        result.status = domain::status::kNoFindText;
        return result;
    }

    domain::LiteralMatcher matcher(findText);
    auto document = m_loader->open(filePath);

    ScanState state{matcher, replaceText};
    for (auto& paragraph : document->getParagraphs()) {
        processParagraph(*paragraph, state);
    }
    for (auto& table : document->getTables()) {
        processTable(*table, state);
    }

    result.matches = state.matches;
    result.snippets = std::move(state.snippets);

    if (result.matches > 0 && backupPath) {
        result.copyPath = BackupPolicy::CaptureOriginal(filePath, *backupPath);
    }
    if (replaceText && result.matches > 0) {
        document->save(filePath);
        result.status = domain::status::kReplacedAndSaved;
        std::cerr << "[TextFindReplace] " << result.matches << " replacement(s) saved to " << filePath << std::endl;
    }
    return result;
}

} // namespace linkwalker::application
