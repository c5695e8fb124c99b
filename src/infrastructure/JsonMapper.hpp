/**
 * @file JsonMapper.hpp
 * @brief nlohmann::json conversions for LinkWalker results.
 *
 * Declared in the domain namespace so nlohmann finds them through ADL.
 */

#pragma once
#include <nlohmann/json.hpp>
#include "domain/Link.hpp"
#include "domain/FindReplaceResult.hpp"
#include "domain/DependencyRecord.hpp"
#include "domain/FolderNode.hpp"

namespace linkwalker::domain {

void to_json(nlohmann::json& j, const Link& link);
void to_json(nlohmann::json& j, const DocumentLinks& item);
void to_json(nlohmann::json& j, const FileAnalysis& analysis);
void to_json(nlohmann::json& j, const FindReplaceResult& result);
void to_json(nlohmann::json& j, const BulkResult& result);
void to_json(nlohmann::json& j, const OutgoingDetail& detail);
void to_json(nlohmann::json& j, const IncomingDetail& detail);
void to_json(nlohmann::json& j, const DependencyRecord& record);
void to_json(nlohmann::json& j, const FolderNode& node);

} // namespace linkwalker::domain
