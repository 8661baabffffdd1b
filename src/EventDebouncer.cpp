#include "EventDebouncer.hpp"
#include <algorithm>
#include <array>
#include <cctype>
#include <system_error>

namespace fs = std::filesystem;

namespace ingest {

namespace {

const std::array<const char *, 27> kSupportedExtensions = {
    "json", "csv",  "txt", "md",  "js",   "ts",  "jsx", "tsx",  "pdf",
    "png",  "jpg",  "jpeg", "gif", "svg", "html", "xml", "yaml", "yml",
    "toml", "log",  "doc", "docx", "xls", "xlsx", "ppt", "pptx", "rtf"};

} // namespace

bool isSupportedExtension(const fs::path &path) {
  auto ext = path.extension().string();
  if (ext.size() < 2)
    return false;
  ext.erase(0, 1);
  std::transform(ext.begin(), ext.end(), ext.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return std::find_if(kSupportedExtensions.begin(), kSupportedExtensions.end(),
                      [&ext](const char *candidate) {
                        return ext == candidate;
                      }) != kSupportedExtensions.end();
}

EventDebouncer::EventDebouncer(std::chrono::milliseconds window)
    : m_window(window) {}

std::optional<WatchEvent> EventDebouncer::accept(const RawFsEvent &raw,
                                                 Clock::time_point now) {
  if (!isSupportedExtension(raw.path))
    return std::nullopt;

  std::error_code ec;
  if (fs::is_directory(raw.path, ec))
    return std::nullopt;

  const auto key = raw.path.generic_string();
  auto last = m_lastSeen.find(key);
  if (last != m_lastSeen.end() && now - last->second < m_window)
    return std::nullopt;
  m_lastSeen[key] = now;

  switch (raw.action) {
  case RawAction::Add:
    return WatchEvent{WatchEventKind::Created, raw.path};
  case RawAction::Modified:
    return WatchEvent{WatchEventKind::Modified, raw.path};
  case RawAction::Delete:
  case RawAction::Moved:
    break;
  }
  return std::nullopt;
}

void EventDebouncer::prune(Clock::time_point now) {
  for (auto it = m_lastSeen.begin(); it != m_lastSeen.end();) {
    if (now - it->second >= m_window)
      it = m_lastSeen.erase(it);
    else
      ++it;
  }
}

} // namespace ingest
