#pragma once

#include "types.hpp"
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace ingest {

// Live FileProgress entries, one per filename, in first-seen order.
class ProgressBoard {
public:
  // Drops every entry and seeds one "pending" entry per filename.
  void reset(const std::vector<std::string> &filenames);

  // Inserts or overwrites the entry for progress.filename.
  void upsert(const FileProgress &progress);

  std::optional<FileProgress> find(const std::string &filename) const;
  std::vector<FileProgress> snapshot() const;

private:
  std::vector<FileProgress> m_entries;
  mutable std::mutex m_mutex;
};

} // namespace ingest
