#pragma once

#include "types.hpp"
#include <cstddef>
#include <deque>
#include <mutex>
#include <vector>

namespace ingest {

/**
 * Bounded, newest-first record of transfer outcomes. Entries past capacity
 * are dropped from the old end without notice.
 */
class ActivityLog {
public:
  explicit ActivityLog(std::size_t capacity = 50);

  void record(ActivityEntry entry);
  ActivityEntry record(const UploadResult &result,
                       std::optional<FileCategory> category = std::nullopt);

  std::vector<ActivityEntry> snapshot() const;
  std::size_t size() const;
  std::size_t capacity() const { return m_capacity; }

private:
  const std::size_t m_capacity;
  std::deque<ActivityEntry> m_entries;
  mutable std::mutex m_mutex;
};

std::int64_t unixNow();

} // namespace ingest
