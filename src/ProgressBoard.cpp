#include "ProgressBoard.hpp"
#include <algorithm>

namespace ingest {

void ProgressBoard::reset(const std::vector<std::string> &filenames) {
  std::lock_guard<std::mutex> lock(m_mutex);
  m_entries.clear();
  for (const auto &name : filenames) {
    auto exists = std::any_of(
        m_entries.begin(), m_entries.end(),
        [&name](const FileProgress &p) { return p.filename == name; });
    if (!exists)
      m_entries.push_back(FileProgress{name, std::nullopt, "pending", 0.0,
                                       std::nullopt});
  }
}

void ProgressBoard::upsert(const FileProgress &progress) {
  std::lock_guard<std::mutex> lock(m_mutex);
  auto it = std::find_if(
      m_entries.begin(), m_entries.end(),
      [&progress](const FileProgress &p) { return p.filename == progress.filename; });
  if (it != m_entries.end())
    *it = progress;
  else
    m_entries.push_back(progress);
}

std::optional<FileProgress>
ProgressBoard::find(const std::string &filename) const {
  std::lock_guard<std::mutex> lock(m_mutex);
  auto it = std::find_if(
      m_entries.begin(), m_entries.end(),
      [&filename](const FileProgress &p) { return p.filename == filename; });
  if (it == m_entries.end())
    return std::nullopt;
  return *it;
}

std::vector<FileProgress> ProgressBoard::snapshot() const {
  std::lock_guard<std::mutex> lock(m_mutex);
  return m_entries;
}

} // namespace ingest
