#include "AppConfig.hpp"
#include "Errors.hpp"
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <nlohmann/json.hpp>
#include <sstream>

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace ingest {

bool AppConfig::isConfigured() const {
  return !apiBaseUrl.empty() && !apiKey.empty() && watchedFolder.has_value();
}

std::string AppConfig::apiUrl() const {
  std::string url = apiBaseUrl;
  while (!url.empty() && url.back() == '/')
    url.pop_back();
  return url;
}

AppConfig parseConfig(const std::string &text) {
  AppConfig config;
  try {
    auto data = json::parse(text);
    if (!data.is_object())
      throw ConfigError("Config root must be a JSON object");

    config.apiBaseUrl = data.value("api_base_url", config.apiBaseUrl);
    config.apiKey = data.value("api_key", config.apiKey);
    config.autoIngest = data.value("auto_ingest", config.autoIngest);
    config.autoApproveWatched =
        data.value("auto_approve_watched", config.autoApproveWatched);
    config.defaultBucket = data.value("default_bucket", config.defaultBucket);

    if (data.contains("watched_folder") && !data["watched_folder"].is_null())
      config.watchedFolder =
          fs::path(data["watched_folder"].get<std::string>());
    if (data.contains("user_hash") && !data["user_hash"].is_null())
      config.userHash = data["user_hash"].get<std::string>();
  } catch (const json::exception &e) {
    throw ConfigError(std::string("Failed to parse config: ") + e.what());
  }
  return config;
}

AppConfig loadConfig(const fs::path &path) {
  std::error_code ec;
  if (!fs::exists(path, ec)) {
    std::cout << "[Config] No config at " << path << ", using defaults"
              << std::endl;
    return AppConfig{};
  }

  std::ifstream ifs(path);
  if (!ifs)
    throw IoError("Failed to read config: " + path.string());
  std::stringstream buffer;
  buffer << ifs.rdbuf();
  return parseConfig(buffer.str());
}

void applyEnvironment(AppConfig &config) {
  if (const char *url = std::getenv("INGEST_API_URL"))
    config.apiBaseUrl = url;
  if (const char *key = std::getenv("INGEST_API_KEY"))
    config.apiKey = key;
  if (const char *folder = std::getenv("INGEST_WATCHED_FOLDER"))
    config.watchedFolder = fs::path(folder);
  if (const char *hash = std::getenv("INGEST_USER_HASH"))
    config.userHash = std::string(hash);
}

} // namespace ingest
