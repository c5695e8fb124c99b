#include "domain/HyperlinkField.hpp"
#include <regex>

namespace linkwalker::domain {

bool IsHyperlinkField(const std::string& instruction) {
    return instruction.find("HYPERLINK") != std::string::npos;
}

std::optional<std::string> ExtractFieldUrl(const std::string& instruction) {
    static const std::regex kDoubleQuoted(R"(HYPERLINK\s+"([^"]+)\")");
    static const std::regex kSingleQuoted(R"(HYPERLINK\s+'([^']+)')");
    static const std::regex kBare(R"(HYPERLINK\s+([^\s]+))");

    std::smatch m;
    for (const auto* pattern : {&kDoubleQuoted, &kSingleQuoted, &kBare}) {
        if (std::regex_search(instruction, m, *pattern)) {
            return m[1].str();
        }
    }
    return std::nullopt;
}

} // namespace linkwalker::domain
