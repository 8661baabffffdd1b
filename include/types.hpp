#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace ingest {

enum class FileCategory {
  PersonalData,
  Media,
  Config,
  WebsiteScaffolding,
  Work,
  Unknown
};

struct FileRecommendation {
  std::string path; // Relative to the scanned root (e.g. "photos/a.jpg")
  std::filesystem::path absolutePath;
  bool shouldIngest = false;
  FileCategory category = FileCategory::Unknown;
  std::string reason;
};

struct ScanSummary {
  std::size_t personalData = 0;
  std::size_t media = 0;
  std::size_t config = 0;
  std::size_t websiteScaffolding = 0;
  std::size_t work = 0;
  std::size_t unknown = 0;
};

struct ScanResult {
  std::size_t totalFiles = 0;
  std::vector<FileRecommendation> recommended;
  std::vector<FileRecommendation> skipped;
  ScanSummary summary;
};

enum class WatchEventKind { Created, Modified };

struct WatchEvent {
  WatchEventKind kind;
  std::filesystem::path path;
};

enum class UploadStatus { Uploading, Uploaded, Ingesting, Done, Error };

struct UploadResult {
  std::string filename;
  std::string remoteKey;
  std::optional<std::string> progressId;
  UploadStatus status = UploadStatus::Uploading;
  std::optional<std::string> error;
  std::string checksum; // SHA-256 of the transferred bytes, hex
};

struct FileProgress {
  std::string filename;
  std::optional<std::string> progressId;
  std::string status;
  double percent = 0.0;
  std::optional<std::string> message;
};

struct ActivityEntry {
  std::string filename;
  UploadStatus status = UploadStatus::Uploading;
  std::optional<std::string> error;
  std::int64_t timestamp = 0; // UTC seconds
  std::optional<FileCategory> category;
};

struct SyncStatus {
  bool watching = false;
  std::optional<std::string> folder;
  std::size_t fileCount = 0;
  std::vector<ActivityEntry> recentActivity;
};

std::string toString(FileCategory category);
std::string toString(UploadStatus status);
std::string toString(WatchEventKind kind);

} // namespace ingest
