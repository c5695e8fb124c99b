#include "infrastructure/JsonMapper.hpp"

namespace linkwalker::domain {

using json = nlohmann::json;

void to_json(json& j, const Link& link) {
    j = json{
        {"text", link.text},
        {"url", link.normalizedTarget},
        {"normalized", link.normalizedTarget},
        {"raw", link.rawHref},
        {"type", LinkTypeToString(link.type)}
    };
}

void to_json(json& j, const DocumentLinks& item) {
    j = json{{"path", item.path}, {"links", item.links}};
    if (item.error) j["error"] = *item.error;
}

void to_json(json& j, const FileAnalysis& analysis) {
    j = json{
        {"tracked_changes", analysis.trackedChanges},
        {"links", analysis.links},
        {"path", analysis.path}
    };
}

void to_json(json& j, const FindReplaceResult& result) {
    j = json{
        {"matches", result.matches},
        {"status", result.status},
        {"snippets", result.snippets}
    };
    if (!result.path.empty()) j["path"] = result.path;
    if (result.copyPath) j["copy_path"] = *result.copyPath;
    if (result.foundUrls) j["found_urls"] = *result.foundUrls;
    if (result.foundTexts) j["found_texts"] = *result.foundTexts;
    if (result.didReplace) j["did_replace"] = *result.didReplace;
    if (result.error) j["error"] = *result.error;
}

void to_json(json& j, const BulkResult& result) {
    j = json{
        {"total_matches", result.totalMatches},
        {"files", result.files},
        {"mode", result.mode}
    };
    if (result.saveRoot) j["save_root"] = *result.saveRoot;
    if (result.target) j["target"] = LinkScopeToString(*result.target);
}

void to_json(json& j, const OutgoingDetail& detail) {
    j = json{{"text", detail.text}, {"href", detail.href}, {"target", detail.targetRelativePath}};
}

void to_json(json& j, const IncomingDetail& detail) {
    j = json{{"from", detail.fromRelativePath}, {"text", detail.text}, {"href", detail.href}};
}

void to_json(json& j, const DependencyRecord& record) {
    j = json{
        {"path", record.path},
        {"rel_path", record.relativePath},
        {"outgoing_files", record.outgoingCount},
        {"incoming_files", record.incomingCount},
        {"outgoing_details", record.outgoingDetails},
        {"incoming_details", record.incomingDetails}
    };
}

void to_json(json& j, const FolderNode& node) {
    j = json{{"name", node.name}, {"type", node.type}, {"path", node.path}};
    if (node.type == "folder") j["children"] = node.children;
}

} // namespace linkwalker::domain
