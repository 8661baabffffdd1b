#include "JsonCodec.hpp"

using json = nlohmann::json;

namespace ingest {

namespace {

template <typename T> json optionalValue(const std::optional<T> &value) {
  return value ? json(*value) : json(nullptr);
}

} // namespace

void to_json(json &j, const FileRecommendation &rec) {
  j = json{{"path", rec.path},
           {"absolute_path", rec.absolutePath.string()},
           {"should_ingest", rec.shouldIngest},
           {"category", toString(rec.category)},
           {"reason", rec.reason}};
}

void to_json(json &j, const ScanSummary &s) {
  j = json{{"personal_data_count", s.personalData},
           {"media_count", s.media},
           {"config_count", s.config},
           {"website_scaffolding_count", s.websiteScaffolding},
           {"work_count", s.work},
           {"unknown_count", s.unknown}};
}

void to_json(json &j, const ScanResult &result) {
  j = json{{"total_files", result.totalFiles},
           {"recommended_files", result.recommended},
           {"skipped_files", result.skipped},
           {"summary", result.summary}};
}

void to_json(json &j, const WatchEvent &event) {
  j = json{{"kind", toString(event.kind)}, {"path", event.path.string()}};
}

void to_json(json &j, const UploadResult &result) {
  j = json{{"filename", result.filename},
           {"s3_key", result.remoteKey},
           {"progress_id", optionalValue(result.progressId)},
           {"status", toString(result.status)},
           {"error", optionalValue(result.error)}};
}

void to_json(json &j, const FileProgress &progress) {
  j = json{{"filename", progress.filename},
           {"progress_id", optionalValue(progress.progressId)},
           {"status", progress.status},
           {"percent", progress.percent},
           {"message", optionalValue(progress.message)}};
}

void to_json(json &j, const ActivityEntry &entry) {
  j = json{{"filename", entry.filename},
           {"status", toString(entry.status)},
           {"error", optionalValue(entry.error)},
           {"timestamp", std::to_string(entry.timestamp)},
           {"category", entry.category ? json(toString(*entry.category))
                                       : json(nullptr)}};
}

void to_json(json &j, const SyncStatus &status) {
  j = json{{"watching", status.watching},
           {"folder", optionalValue(status.folder)},
           {"file_count", status.fileCount},
           {"recent_activity", status.recentActivity}};
}

} // namespace ingest
