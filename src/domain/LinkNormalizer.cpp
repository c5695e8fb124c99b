/**
 * @file LinkNormalizer.cpp
 * @brief Implementation of LinkNormalizer.
 */

#include "domain/LinkNormalizer.hpp"
#include "domain/LexicalPath.hpp"
#include "domain/TextUtils.hpp"
#include <cctype>
#include <exception>

namespace linkwalker::domain {

using text::ToLower;
using text::Trim;

namespace {
    int HexValue(char c) {
        if (c >= '0' && c <= '9') return c - '0';
        if (c >= 'a' && c <= 'f') return c - 'a' + 10;
        if (c >= 'A' && c <= 'F') return c - 'A' + 10;
        return -1;
    }

    // Path component of a file: URL, without authority, query or fragment.
    std::string FileUrlPath(const std::string& href) {
        std::string rest = href.substr(href.find(':') + 1);
        if (rest.rfind("//", 0) == 0) {
            size_t pathStart = rest.find_first_of("/?#", 2);
            rest = (pathStart == std::string::npos) ? "" : rest.substr(pathStart);
        }
        size_t cut = rest.find_first_of("?#");
        if (cut != std::string::npos) rest = rest.substr(0, cut);
        return rest;
    }
}

LinkNormalizer::LinkNormalizer(std::string hubDomain, std::string orgKeyword)
    : m_hubDomain(ToLower(std::move(hubDomain))), m_orgKeyword(ToLower(std::move(orgKeyword))) {}

std::string LinkNormalizer::ParseScheme(const std::string& href) {
    size_t colon = href.find(':');
    if (colon == std::string::npos || colon == 0) return "";
    if (!std::isalpha(static_cast<unsigned char>(href[0]))) return "";
    for (size_t i = 0; i < colon; ++i) {
        unsigned char c = static_cast<unsigned char>(href[i]);
        if (!std::isalnum(c) && c != '+' && c != '-' && c != '.') return "";
    }
    return ToLower(href.substr(0, colon));
}

std::string LinkNormalizer::PercentDecode(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    for (size_t i = 0; i < text.size(); ++i) {
        if (text[i] == '%' && i + 2 < text.size()) {
            int hi = HexValue(text[i + 1]);
            int lo = HexValue(text[i + 2]);
            if (hi >= 0 && lo >= 0) {
                out.push_back(static_cast<char>(hi * 16 + lo));
                i += 2;
                continue;
            }
        }
        out.push_back(text[i]);
    }
    return out;
}

bool LinkNormalizer::IsDrivePath(const std::string& text) {
    return text.size() > 2 && std::isalpha(static_cast<unsigned char>(text[0])) && text[1] == ':' &&
           (text[2] == '\\' || text[2] == '/');
}

std::string LinkNormalizer::relativizeOrKeep(const std::string& path, const std::optional<std::string>& baseDir) const {
    std::string norm = lexical::Normalize(path);
    if (!baseDir || baseDir->empty()) return norm;
    try {
        auto rel = lexical::Relative(norm, *baseDir);
        if (rel) return *rel;
    } catch (const std::exception&) {
        // current directory unavailable; keep the absolute form
    }
    return norm;
}

std::pair<LinkType, std::string> LinkNormalizer::normalize(const std::string& rawHref,
                                                           const std::optional<std::string>& docPath,
                                                           const std::optional<std::string>& baseDir) const {
    const std::string href = Trim(rawHref);
    const std::string low = ToLower(href);
    const std::string scheme = ParseScheme(href);

    if (scheme == "mailto" || low.find("mailto:") != std::string::npos) {
        return {LinkType::Email, href};
    }
    if (!m_hubDomain.empty() && low.find(m_hubDomain) != std::string::npos) {
        if (low.find("document") != std::string::npos) {
            return {LinkType::Document, href};
        }
        return {LinkType::Internal, href};
    }
    if (!m_orgKeyword.empty() && low.find(m_orgKeyword) != std::string::npos) {
        return {LinkType::Internal, href};
    }
    if (scheme == "http" || scheme == "https" || scheme == "ftp" || href.rfind("//", 0) == 0) {
        return {LinkType::External, href};
    }
    if (scheme == "file") {
        std::string path = PercentDecode(FileUrlPath(href));
        if (path.size() > 2 && path[0] == '/' && path[2] == ':') {
            path.erase(0, path.find_first_not_of('/'));
        }
        return {LinkType::Internal, relativizeOrKeep(path, baseDir)};
    }
    if (IsDrivePath(href)) {
        return {LinkType::Internal, relativizeOrKeep(href, baseDir)};
    }
    if (docPath && !docPath->empty()) {
        try {
            std::string candidate = lexical::Normalize(lexical::Join(lexical::DirName(*docPath), href));
            if (!baseDir || baseDir->empty()) {
                return {LinkType::Internal, candidate};
            }
            auto rel = lexical::Relative(candidate, *baseDir);
            if (rel) {
                return {LinkType::Internal, *rel};
            }
        } catch (const std::exception&) {
            // unresolvable relative reference; reported as unknown below
        }
    }
    return {LinkType::Unknown, href};
}

} // namespace linkwalker::domain
