#pragma once

#include "types.hpp"
#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <unordered_map>

namespace ingest {

// Raw notification as delivered by the OS backend, before any filtering.
enum class RawAction { Add, Modified, Delete, Moved };

struct RawFsEvent {
  RawAction action;
  std::filesystem::path path;
};

bool isSupportedExtension(const std::filesystem::path &path);

/**
 * EventDebouncer turns a burst of raw notifications into at most one
 * WatchEvent per path per window. Filtering order: unsupported extension,
 * directory, debounce window, then kind mapping (Delete/Moved are dropped
 * after refreshing the path's last-seen time).
 */
class EventDebouncer {
public:
  using Clock = std::chrono::steady_clock;

  explicit EventDebouncer(
      std::chrono::milliseconds window = std::chrono::milliseconds(500));

  std::optional<WatchEvent> accept(const RawFsEvent &raw, Clock::time_point now);

  // Forget paths whose last emission is older than the window.
  void prune(Clock::time_point now);

  std::size_t trackedPaths() const { return m_lastSeen.size(); }
  std::chrono::milliseconds window() const { return m_window; }

private:
  std::chrono::milliseconds m_window;
  std::unordered_map<std::string, Clock::time_point> m_lastSeen;
};

} // namespace ingest
