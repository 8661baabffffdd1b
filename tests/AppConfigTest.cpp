#include "AppConfig.hpp"
#include "Errors.hpp"
#include "TestSupport.hpp"

#include <gtest/gtest.h>

#include <cstdlib>
#include <optional>
#include <string>

namespace {

class ScopedEnvVar {
public:
  explicit ScopedEnvVar(std::string key) : m_key(std::move(key)) {
    if (const char *value = std::getenv(m_key.c_str()))
      m_original = std::string(value);
  }
  ~ScopedEnvVar() {
    if (m_original)
      ::setenv(m_key.c_str(), m_original->c_str(), 1);
    else
      ::unsetenv(m_key.c_str());
  }

  void set(const std::string &value) { ::setenv(m_key.c_str(), value.c_str(), 1); }
  void clear() { ::unsetenv(m_key.c_str()); }

private:
  std::string m_key;
  std::optional<std::string> m_original;
};

} // namespace

TEST(AppConfigTest, ParsesEveryField) {
  auto config = ingest::parseConfig(R"({
    "api_base_url": "https://api.example.com/",
    "api_key": "secret",
    "watched_folder": "/home/me/Sync",
    "auto_ingest": false,
    "auto_approve_watched": false,
    "user_hash": "abc123",
    "default_bucket": "my-bucket"
  })");

  EXPECT_EQ(config.apiBaseUrl, "https://api.example.com/");
  EXPECT_EQ(config.apiUrl(), "https://api.example.com");
  EXPECT_EQ(config.apiKey, "secret");
  ASSERT_TRUE(config.watchedFolder.has_value());
  EXPECT_EQ(*config.watchedFolder, std::filesystem::path("/home/me/Sync"));
  EXPECT_FALSE(config.autoIngest);
  EXPECT_FALSE(config.autoApproveWatched);
  EXPECT_EQ(config.userHash, std::optional<std::string>("abc123"));
  EXPECT_EQ(config.defaultBucket, "my-bucket");
  EXPECT_TRUE(config.isConfigured());
}

TEST(AppConfigTest, MissingKeysKeepDefaults) {
  auto config = ingest::parseConfig(R"({"api_key": "k", "watched_folder": null})");

  EXPECT_EQ(config.apiKey, "k");
  EXPECT_TRUE(config.apiBaseUrl.empty());
  EXPECT_FALSE(config.watchedFolder.has_value());
  EXPECT_TRUE(config.autoIngest);
  EXPECT_TRUE(config.autoApproveWatched);
  EXPECT_EQ(config.defaultBucket, "exemem-user-data");
  EXPECT_FALSE(config.isConfigured());
}

TEST(AppConfigTest, MalformedJsonIsConfigError) {
  EXPECT_THROW(ingest::parseConfig("{not json"), ingest::ConfigError);
  EXPECT_THROW(ingest::parseConfig("[1, 2]"), ingest::ConfigError);
  EXPECT_THROW(ingest::parseConfig(R"({"auto_ingest": "yes"})"),
               ingest::ConfigError);
}

TEST(AppConfigTest, LoadConfigReadsFileOrFallsBackToDefaults) {
  ingest::testing::TempDir dir;
  auto path = dir.write("config.json", R"({"api_key": "from-file"})");

  EXPECT_EQ(ingest::loadConfig(path).apiKey, "from-file");

  auto defaults = ingest::loadConfig(dir.path() / "absent.json");
  EXPECT_TRUE(defaults.apiKey.empty());
  EXPECT_TRUE(defaults.autoIngest);
}

TEST(AppConfigTest, EnvironmentOverridesFileValues) {
  ScopedEnvVar url("INGEST_API_URL");
  ScopedEnvVar key("INGEST_API_KEY");
  ScopedEnvVar folder("INGEST_WATCHED_FOLDER");
  ScopedEnvVar hash("INGEST_USER_HASH");
  url.set("http://localhost:9000");
  key.set("env-key");
  folder.set("/data/watch");
  hash.clear();

  auto config = ingest::parseConfig(R"({"api_key": "file-key", "user_hash": "u1"})");
  ingest::applyEnvironment(config);

  EXPECT_EQ(config.apiBaseUrl, "http://localhost:9000");
  EXPECT_EQ(config.apiKey, "env-key");
  EXPECT_EQ(config.watchedFolder, std::optional<std::filesystem::path>("/data/watch"));
  EXPECT_EQ(config.userHash, std::optional<std::string>("u1"));
}
