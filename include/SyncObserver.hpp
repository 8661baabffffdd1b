#pragma once

#include "types.hpp"
#include <vector>

namespace ingest {

/**
 * Receives pipeline notifications. Hooks may be called concurrently from
 * the watch loop and from transfer threads; implementations synchronize
 * themselves.
 */
class SyncObserver {
public:
  virtual ~SyncObserver() = default;

  virtual void onFileDetected(const WatchEvent &, const FileRecommendation &) {}
  virtual void onUploadResult(const UploadResult &) {}
  virtual void onProgress(const std::vector<FileProgress> &) {}
  virtual void onActivity(const ActivityEntry &) {}
  virtual void onWatchingChanged(bool) {}
  virtual void onBatchComplete(std::size_t) {}
};

} // namespace ingest
