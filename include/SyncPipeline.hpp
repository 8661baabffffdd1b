#pragma once
#include "ActivityLog.hpp"
#include "AppConfig.hpp"
#include "Channel.hpp"
#include "Classifier.hpp"
#include "ContentLedger.hpp"
#include "FileSystemScanner.hpp"
#include "FilesystemWatcher.hpp"
#include "IngestionApi.hpp"
#include "ProgressBoard.hpp"
#include "ProgressPoller.hpp"
#include "SyncObserver.hpp"
#include "Uploader.hpp"
#include "WorkerPool.hpp"
#include "types.hpp"
#include <atomic>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>
#ifndef SYNC_PIPELINE_HPP
#define SYNC_PIPELINE_HPP

namespace ingest {

struct PipelineOptions {
  std::size_t activityCapacity = 50;
  std::size_t eventQueueCapacity = 256;
  // Transfer threads. A transfer keeps its thread while polling, so this
  // stays above uploader.maxConcurrentUploads.
  std::size_t transferWorkers = 5;
  UploaderOptions uploader;
  PollPolicy poll;
  ScanLimits scan;
  WatcherOptions watcher;
};

/**
 * SyncPipeline wires watcher -> classifier -> uploader -> poller and owns
 * everything observers can read: the activity log, live progress, the last
 * scan and the files waiting for approval.
 *
 * Transfers run on a fixed WorkerPool. stopWatching() ends event
 * intake only; transfers already started finish and are still logged.
 * The destructor waits for them.
 */
class SyncPipeline {
public:
  SyncPipeline(IngestionApi &api, AppConfig config,
               PipelineOptions options = {}, SyncObserver *observer = nullptr);
  ~SyncPipeline();

  AppConfig config() const;
  void updateConfig(AppConfig config);

  // Scans the watched folder (or root) and makes the result current.
  ScanResult scanFolder();
  ScanResult scanFolder(const std::filesystem::path &root);
  std::optional<ScanResult> currentScan() const;

  FileRecommendation classifyFile(const std::filesystem::path &absolutePath) const;

  // Uploads every approved path and blocks until all of them finish.
  // Relative paths are looked up in the current scan, then under the watched
  // folder. Returns the number of files dispatched.
  std::size_t approveAndIngest(const std::vector<std::string> &approvedPaths);

  // Throws ConfigError for an incomplete config or a missing folder, and
  // WatchSetupError if the OS watch fails. Replaces any running session.
  void startWatching();
  void stopWatching();
  bool isWatching() const { return m_watching.load(); }

  SyncStatus syncStatus() const;
  std::vector<ActivityEntry> recentActivity() const;
  std::vector<FileProgress> progress() const;
  std::vector<FileRecommendation> pendingApprovals() const;

  // Blocks until every background transfer has finished.
  void waitForIdle();

  const Uploader &uploader() const { return m_uploader; }

private:
  struct Session {
    std::shared_ptr<Channel<WatchEvent>> events;
    std::unique_ptr<FilesystemWatcher> watcher;
    std::thread loop;
  };

  void processLoop(std::shared_ptr<Channel<WatchEvent>> events,
                   std::filesystem::path root);
  void handleEvent(const WatchEvent &event, const std::filesystem::path &root);
  void runTransfer(const std::filesystem::path &path,
                   std::optional<FileCategory> category, const AppConfig &config,
                   bool skipUnchanged);
  void finishTransfer(const UploadResult &result,
                      std::optional<FileCategory> category);
  void setProgress(const FileProgress &progress);
  void teardownSession();

  std::optional<FileRecommendation>
  resolveApproved(const std::string &path, const AppConfig &config) const;

  PipelineOptions m_options;
  SyncObserver *m_observer;

  mutable std::mutex m_configMutex;
  AppConfig m_config;

  Classifier m_classifier;
  FileSystemScanner m_scanner;
  Uploader m_uploader;
  ProgressPoller m_poller;
  ActivityLog m_activity;
  ProgressBoard m_progress;
  ContentLedger m_ledger;

  mutable std::mutex m_scanMutex;
  std::optional<ScanResult> m_currentScan;

  mutable std::mutex m_pendingMutex;
  std::vector<FileRecommendation> m_pending;

  std::mutex m_sessionMutex;
  std::unique_ptr<Session> m_session;
  std::atomic<bool> m_watching{false};

  // Declared last so running transfers are joined before anything they use
  // is destroyed.
  WorkerPool m_background;
};

} // namespace ingest
#endif
