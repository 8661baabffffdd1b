#pragma once

#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace ingest {

/**
 * Remembers the SHA-256 of the last successfully transferred content for
 * each absolute path, so a watcher event that did not change the bytes
 * can be skipped.
 */
class ContentLedger {
public:
  // Hex SHA-256 of the file, or nullopt if it cannot be opened.
  static std::optional<std::string> hashFile(const std::filesystem::path &path);

  bool isUnchanged(const std::filesystem::path &path,
                   const std::string &checksum) const;
  void remember(const std::filesystem::path &path, const std::string &checksum);

private:
  std::unordered_map<std::string, std::string> m_checksums;
  mutable std::mutex m_mutex;
};

} // namespace ingest
