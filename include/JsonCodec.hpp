#pragma once

#include "types.hpp"
#include <nlohmann/json.hpp>

namespace ingest {

// Wire names match what observers and the CLI print: snake_case keys,
// lower-case category tags.
void to_json(nlohmann::json &j, const FileRecommendation &rec);
void to_json(nlohmann::json &j, const ScanSummary &summary);
void to_json(nlohmann::json &j, const ScanResult &result);
void to_json(nlohmann::json &j, const WatchEvent &event);
void to_json(nlohmann::json &j, const UploadResult &result);
void to_json(nlohmann::json &j, const FileProgress &progress);
void to_json(nlohmann::json &j, const ActivityEntry &entry);
void to_json(nlohmann::json &j, const SyncStatus &status);

} // namespace ingest
