#pragma once

#include <filesystem>
#include <optional>
#include <string>

namespace ingest {

struct AppConfig {
  std::string apiBaseUrl;
  std::string apiKey;
  std::optional<std::filesystem::path> watchedFolder;
  bool autoIngest = true;
  bool autoApproveWatched = true;
  std::optional<std::string> userHash;
  // Used when the upload slot response does not name a bucket.
  std::string defaultBucket = "exemem-user-data";

  bool isConfigured() const;

  // Base URL without a trailing slash.
  std::string apiUrl() const;
};

// Missing file -> defaults. Unreadable file -> IoError. Bad JSON -> ConfigError.
AppConfig loadConfig(const std::filesystem::path &path);
AppConfig parseConfig(const std::string &text);

// INGEST_API_URL, INGEST_API_KEY, INGEST_WATCHED_FOLDER, INGEST_USER_HASH
void applyEnvironment(AppConfig &config);

} // namespace ingest
