#include "ActivityLog.hpp"
#include <algorithm>
#include <chrono>

namespace ingest {

std::int64_t unixNow() {
  return std::chrono::duration_cast<std::chrono::seconds>(
             std::chrono::system_clock::now().time_since_epoch())
      .count();
}

ActivityLog::ActivityLog(std::size_t capacity)
    : m_capacity(std::max<std::size_t>(capacity, 1)) {}

void ActivityLog::record(ActivityEntry entry) {
  std::lock_guard<std::mutex> lock(m_mutex);
  m_entries.push_front(std::move(entry));
  while (m_entries.size() > m_capacity)
    m_entries.pop_back();
}

ActivityEntry ActivityLog::record(const UploadResult &result,
                                  std::optional<FileCategory> category) {
  ActivityEntry entry{result.filename, result.status, result.error, unixNow(),
                      category};
  record(entry);
  return entry;
}

std::vector<ActivityEntry> ActivityLog::snapshot() const {
  std::lock_guard<std::mutex> lock(m_mutex);
  return {m_entries.begin(), m_entries.end()};
}

std::size_t ActivityLog::size() const {
  std::lock_guard<std::mutex> lock(m_mutex);
  return m_entries.size();
}

} // namespace ingest
