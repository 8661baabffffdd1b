#include "SyncPipeline.hpp"
#include "Errors.hpp"
#include <algorithm>
#include <exception>
#include <iostream>
#include <set>
#include <system_error>

namespace fs = std::filesystem;

namespace ingest {

SyncPipeline::SyncPipeline(IngestionApi &api, AppConfig config,
                           PipelineOptions options, SyncObserver *observer)
    : m_options(options), m_observer(observer), m_config(std::move(config)),
      m_scanner(options.scan, m_classifier),
      m_uploader(api, options.uploader), m_poller(api, options.poll),
      m_activity(options.activityCapacity),
      m_background("Transfer", options.transferWorkers) {}

SyncPipeline::~SyncPipeline() {
  stopWatching();
  m_background.wait();
}

AppConfig SyncPipeline::config() const {
  std::lock_guard<std::mutex> lock(m_configMutex);
  return m_config;
}

void SyncPipeline::updateConfig(AppConfig config) {
  std::lock_guard<std::mutex> lock(m_configMutex);
  m_config = std::move(config);
}

ScanResult SyncPipeline::scanFolder() {
  auto folder = config().watchedFolder;
  if (!folder)
    throw ConfigError("No watched folder configured");
  return scanFolder(*folder);
}

ScanResult SyncPipeline::scanFolder(const fs::path &root) {
  auto result = m_scanner.scanAndClassify(root);
  std::lock_guard<std::mutex> lock(m_scanMutex);
  m_currentScan = result;
  return result;
}

std::optional<ScanResult> SyncPipeline::currentScan() const {
  std::lock_guard<std::mutex> lock(m_scanMutex);
  return m_currentScan;
}

FileRecommendation SyncPipeline::classifyFile(const fs::path &absolutePath) const {
  auto folder = config().watchedFolder;
  return m_classifier.classifySingle(folder.value_or(fs::path()), absolutePath);
}

std::optional<FileRecommendation>
SyncPipeline::resolveApproved(const std::string &path,
                              const AppConfig &config) const {
  fs::path candidate(path);
  if (candidate.is_absolute()) {
    if (config.watchedFolder)
      return m_classifier.classifySingle(*config.watchedFolder, candidate);
    auto rec = m_classifier.classify(candidate.filename().string());
    rec.absolutePath = candidate;
    return rec;
  }

  {
    std::lock_guard<std::mutex> lock(m_scanMutex);
    if (m_currentScan) {
      for (const auto *list : {&m_currentScan->recommended, &m_currentScan->skipped}) {
        auto it = std::find_if(list->begin(), list->end(),
                               [&path](const FileRecommendation &rec) {
                                 return rec.path == path;
                               });
        if (it != list->end())
          return *it;
      }
    }
  }

  if (config.watchedFolder)
    return m_classifier.classify(candidate.generic_string(), *config.watchedFolder);
  return std::nullopt;
}

std::size_t
SyncPipeline::approveAndIngest(const std::vector<std::string> &approvedPaths) {
  auto config = this->config();
  if (config.apiBaseUrl.empty() || config.apiKey.empty())
    throw ConfigError("App not configured. Set API URL and API key.");

  std::vector<FileRecommendation> batch;
  std::set<std::string> seen;
  for (const auto &path : approvedPaths) {
    auto rec = resolveApproved(path, config);
    if (!rec) {
      std::cerr << "[Pipeline] Cannot resolve approved path: " << path
                << std::endl;
      continue;
    }
    if (seen.insert(rec->absolutePath.lexically_normal().string()).second)
      batch.push_back(*rec);
  }

  std::vector<std::string> filenames;
  for (const auto &rec : batch)
    filenames.push_back(rec.absolutePath.filename().string());
  m_progress.reset(filenames);
  if (m_observer)
    m_observer->onProgress(m_progress.snapshot());

  {
    std::lock_guard<std::mutex> lock(m_pendingMutex);
    m_pending.erase(std::remove_if(m_pending.begin(), m_pending.end(),
                                   [&seen](const FileRecommendation &rec) {
                                     return seen.count(
                                                rec.absolutePath.lexically_normal()
                                                    .string()) > 0;
                                   }),
                    m_pending.end());
  }

  std::cout << "[Pipeline] Ingesting " << batch.size() << " approved files"
            << std::endl;
  {
    WorkerPool tasks("Batch",
                     std::min(m_options.transferWorkers, batch.size()));
    for (const auto &rec : batch) {
      tasks.submit([this, rec, config] {
        runTransfer(rec.absolutePath, rec.category, config, false);
      });
    }
    tasks.wait();
  }

  std::cout << "[Pipeline] Batch complete (" << batch.size() << " files)"
            << std::endl;
  if (m_observer)
    m_observer->onBatchComplete(batch.size());
  return batch.size();
}

void SyncPipeline::startWatching() {
  auto config = this->config();
  if (!config.isConfigured())
    throw ConfigError(
        "App not configured. Set API URL, API key, and watched folder.");

  fs::path folder = *config.watchedFolder;
  std::error_code ec;
  if (!fs::is_directory(folder, ec))
    throw ConfigError("Watched folder does not exist: " + folder.string());

  {
    std::lock_guard<std::mutex> lock(m_sessionMutex);
    teardownSession();

    auto session = std::make_unique<Session>();
    session->events =
        std::make_shared<Channel<WatchEvent>>(m_options.eventQueueCapacity);
    session->watcher = std::make_unique<FilesystemWatcher>(
        folder, session->events, m_options.watcher);
    session->watcher->start();

    m_watching = true;
    session->loop =
        std::thread(&SyncPipeline::processLoop, this, session->events, folder);
    m_session = std::move(session);
  }

  if (m_observer)
    m_observer->onWatchingChanged(true);
}

void SyncPipeline::stopWatching() {
  bool wasWatching;
  {
    std::lock_guard<std::mutex> lock(m_sessionMutex);
    wasWatching = m_session != nullptr;
    teardownSession();
  }
  if (wasWatching) {
    std::cout << "[Pipeline] Watcher stopped" << std::endl;
    if (m_observer)
      m_observer->onWatchingChanged(false);
  }
}

// Caller holds m_sessionMutex.
void SyncPipeline::teardownSession() {
  m_watching = false;
  if (!m_session)
    return;

  m_session->events->close();
  if (m_session->loop.joinable())
    m_session->loop.join();
  m_session->watcher.reset();
  m_session.reset();
}

void SyncPipeline::processLoop(std::shared_ptr<Channel<WatchEvent>> events,
                               fs::path root) {
  while (auto event = events->pop()) {
    // Events still queued when the session was stopped are discarded.
    if (events->isClosed())
      break;
    try {
      handleEvent(*event, root);
    } catch (const std::exception &e) {
      std::cerr << "[Pipeline] Failed to handle " << event->path << ": "
                << e.what() << std::endl;
    }
  }
  std::cout << "[Pipeline] Event loop finished for " << root << std::endl;
}

void SyncPipeline::handleEvent(const WatchEvent &event, const fs::path &root) {
  auto rec = m_classifier.classifySingle(root, event.path);
  std::cout << "[Pipeline] " << toString(event.kind) << ": " << rec.path << " ("
            << toString(rec.category) << ")" << std::endl;
  if (m_observer)
    m_observer->onFileDetected(event, rec);

  if (!rec.shouldIngest)
    return;

  auto config = this->config();
  if (!config.autoApproveWatched) {
    std::lock_guard<std::mutex> lock(m_pendingMutex);
    auto exists = std::any_of(m_pending.begin(), m_pending.end(),
                              [&rec](const FileRecommendation &p) {
                                return p.absolutePath == rec.absolutePath;
                              });
    if (!exists)
      m_pending.push_back(rec);
    return;
  }

  auto path = event.path;
  auto category = rec.category;
  m_background.submit([this, path, category, config] {
    runTransfer(path, category, config, true);
  });
}

void SyncPipeline::runTransfer(const fs::path &path,
                               std::optional<FileCategory> category,
                               const AppConfig &config, bool skipUnchanged) {
  const std::string filename = path.filename().string();

  if (skipUnchanged) {
    auto checksum = ContentLedger::hashFile(path);
    if (checksum && m_ledger.isUnchanged(path, *checksum)) {
      std::cout << "[Pipeline] " << filename
                << " unchanged since last upload, skipping" << std::endl;
      return;
    }
  }

  setProgress({filename, std::nullopt, "uploading", 0.0, std::nullopt});
  auto result = m_uploader.uploadAndIngest(path, config);
  if (m_observer)
    m_observer->onUploadResult(result);

  if (result.status == UploadStatus::Error) {
    setProgress({filename, std::nullopt, "error", 0.0, result.error});
    finishTransfer(result, category);
    return;
  }

  if (result.status == UploadStatus::Uploaded || !result.progressId) {
    m_ledger.remember(path, result.checksum);
    setProgress({filename, std::nullopt, "uploaded", 100.0, std::nullopt});
    finishTransfer(result, category);
    return;
  }

  const std::string progressId = *result.progressId;
  setProgress({filename, progressId, "ingesting", 0.0, std::nullopt});
  auto poll = m_poller.pollUntilTerminal(
      config, progressId, [this, &filename, &progressId](const PollUpdate &u) {
        setProgress({filename, progressId, u.status, u.percent, u.message});
      });

  switch (poll.outcome) {
  case PollOutcome::Completed:
    // Only a finished ingestion makes identical content skippable.
    m_ledger.remember(path, result.checksum);
    result.status = UploadStatus::Done;
    finishTransfer(result, category);
    break;
  case PollOutcome::Failed:
    result.status = UploadStatus::Error;
    result.error = poll.last.message.value_or("Ingestion " + poll.last.status);
    finishTransfer(result, category);
    break;
  case PollOutcome::TimedOut:
    // Left in its last known state; nothing is added to the activity log.
    break;
  }
}

void SyncPipeline::finishTransfer(const UploadResult &result,
                                  std::optional<FileCategory> category) {
  auto entry = m_activity.record(result, category);
  if (m_observer)
    m_observer->onActivity(entry);
}

void SyncPipeline::setProgress(const FileProgress &progress) {
  m_progress.upsert(progress);
  if (m_observer)
    m_observer->onProgress(m_progress.snapshot());
}

SyncStatus SyncPipeline::syncStatus() const {
  auto config = this->config();
  SyncStatus status;
  status.watching = isWatching();
  if (config.watchedFolder) {
    status.folder = config.watchedFolder->string();
    status.fileCount = FileSystemScanner::countFiles(*config.watchedFolder);
  }
  status.recentActivity = m_activity.snapshot();
  return status;
}

std::vector<ActivityEntry> SyncPipeline::recentActivity() const {
  return m_activity.snapshot();
}

std::vector<FileProgress> SyncPipeline::progress() const {
  return m_progress.snapshot();
}

std::vector<FileRecommendation> SyncPipeline::pendingApprovals() const {
  std::lock_guard<std::mutex> lock(m_pendingMutex);
  return m_pending;
}

void SyncPipeline::waitForIdle() { m_background.wait(); }

} // namespace ingest
