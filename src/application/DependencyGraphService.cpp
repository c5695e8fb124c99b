#include "application/DependencyGraphService.hpp"
#include "domain/LexicalPath.hpp"
#include "domain/TextUtils.hpp"
#include <algorithm>
#include <filesystem>
#include <unordered_map>

namespace fs = std::filesystem;

namespace linkwalker::application {

namespace {
    bool IsGraphEdge(domain::LinkType type) {
        return type == domain::LinkType::Internal || type == domain::LinkType::Document;
    }

    std::optional<std::string> RelativeInside(const std::string& path, const std::string& rootPath) {
        auto rel = domain::lexical::Relative(path, rootPath);
        if (rel && !domain::lexical::EscapesBase(*rel)) return rel;
        return std::nullopt;
    }
}

domain::FileRecord DependencyGraphService::MakeFileRecord(const std::string& path, const std::string& rootPath) {
    domain::FileRecord record;
    record.absolutePath = path;
    auto rel = domain::lexical::Relative(path, rootPath);
    record.relativePath = rel ? *rel : fs::path(path).filename().generic_string();
    record.baseNameLower = domain::text::ToLower(fs::path(record.relativePath).stem().string());
    return record;
}

std::optional<std::string> DependencyGraphService::ToRootRelative(const std::string& normalized, const std::string& rootPath) {
    if (normalized.empty()) return std::nullopt;

    std::string value = normalized;
    std::replace(value.begin(), value.end(), '\\', '/');

    if (domain::lexical::IsAbsolute(value)) {
        if (auto rel = RelativeInside(value, rootPath)) return rel;
    }
    const std::string candidate = domain::lexical::Normalize(domain::lexical::Join(rootPath, value));
    if (auto rel = RelativeInside(candidate, rootPath)) return rel;
    return value;
}

std::set<size_t> DependencyGraphService::MatchTargets(const domain::Link& link,
                                                      const std::string& rootPath,
                                                      const std::vector<domain::FileRecord>& records) {
    std::set<size_t> matches;
    const std::string& target = link.normalizedTarget.empty() ? link.rawHref : link.normalizedTarget;
    if (auto rel = ToRootRelative(target, rootPath)) {
        for (size_t i = 0; i < records.size(); ++i) {
            if (records[i].relativePath == *rel) matches.insert(i);
        }
    }

    const std::string text = domain::text::ToLower(domain::text::Trim(link.text));
    if (!text.empty()) {
        for (size_t i = 0; i < records.size(); ++i) {
            if (records[i].baseNameLower == text) matches.insert(i);
        }
    }
    return matches;
}

std::vector<domain::DependencyRecord> DependencyGraphService::Build(const std::string& rootPath,
                                                                    const std::vector<std::string>& files,
                                                                    const std::vector<domain::DocumentLinks>& linkData) {
    std::vector<domain::FileRecord> records;
    std::unordered_map<std::string, size_t> indexByPath;
    records.reserve(files.size());
    for (const auto& path : files) {
        indexByPath.emplace(path, records.size());
        records.push_back(MakeFileRecord(path, rootPath));
    }

    std::vector<domain::DependencyRecord> graph(records.size());
    std::vector<std::set<size_t>> outgoing(records.size());
    std::vector<std::set<size_t>> incoming(records.size());

    for (const auto& item : linkData) {
        auto source = indexByPath.find(item.path);
        if (source == indexByPath.end()) continue;
        const size_t src = source->second;

        for (const auto& link : item.links) {
            if (!IsGraphEdge(link.type)) continue;
            const std::string& href = link.rawHref.empty() ? link.normalizedTarget : link.rawHref;

            for (size_t tgt : MatchTargets(link, rootPath, records)) {
                if (tgt == src) continue;
                outgoing[src].insert(tgt);
                graph[src].outgoingDetails.push_back({link.text, href, records[tgt].relativePath});
                incoming[tgt].insert(src);
                graph[tgt].incomingDetails.push_back({records[src].relativePath, link.text, href});
            }
        }
    }

    for (size_t i = 0; i < records.size(); ++i) {
        graph[i].path = records[i].absolutePath;
        graph[i].relativePath = records[i].relativePath;
        graph[i].outgoingCount = outgoing[i].size();
        graph[i].incomingCount = incoming[i].size();
    }
    return graph;
}

} // namespace linkwalker::application
