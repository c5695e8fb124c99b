#include "domain/TextUtils.hpp"
#include <boost/locale.hpp>
#include <cctype>
#include <locale>

namespace linkwalker::domain::text {

namespace {
    const std::locale& Utf8Locale() {
        static const std::locale kLocale = boost::locale::generator()("en_US.UTF-8");
        return kLocale;
    }
}

std::string Trim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t\n\r\f\v");
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t\n\r\f\v");
    return s.substr(start, end - start + 1);
}

std::string ToLower(const std::string& s) {
    return boost::locale::to_lower(s, Utf8Locale());
}

std::string FoldCase(const std::string& s) {
    return boost::locale::fold_case(s, Utf8Locale());
}

std::vector<size_t> CodePointOffsets(const std::string& s) {
    std::vector<size_t> offsets;
    offsets.reserve(s.size() + 1);
    for (size_t i = 0; i < s.size(); ++i) {
        // Continuation bytes look like 10xxxxxx.
        if (i == 0 || (static_cast<unsigned char>(s[i]) & 0xC0) != 0x80) offsets.push_back(i);
    }
    offsets.push_back(s.size());
    return offsets;
}

FoldedText FoldCodePoints(const std::string& s) {
    FoldedText out;
    out.folded.reserve(s.size());
    const auto offsets = CodePointOffsets(s);
    for (size_t k = 0; k + 1 < offsets.size(); ++k) {
        out.sourceOffsets.push_back(offsets[k]);
        out.foldedOffsets.push_back(out.folded.size());

        const size_t length = offsets[k + 1] - offsets[k];
        const unsigned char lead = static_cast<unsigned char>(s[offsets[k]]);
        if (length == 1 && lead < 0x80) {
            out.folded.push_back(static_cast<char>(std::tolower(lead)));
            continue;
        }
        const std::string codePoint = s.substr(offsets[k], length);
        const std::string folded = FoldCase(codePoint);
        out.folded += folded.empty() ? codePoint : folded;
    }
    out.sourceOffsets.push_back(s.size());
    out.foldedOffsets.push_back(out.folded.size());
    return out;
}

} // namespace linkwalker::domain::text
