#include "Errors.hpp"
#include "SyncPipeline.hpp"
#include "TestSupport.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <functional>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <vector>

namespace {

using namespace std::chrono_literals;
using ingest::FileCategory;
using ingest::PipelineOptions;
using ingest::ProgressReport;
using ingest::SyncPipeline;
using ingest::UploadStatus;
using ingest::testing::FakeIngestionApi;
using ingest::testing::TempDir;
using ingest::testing::makeConfig;

PipelineOptions fastOptions() {
  PipelineOptions options;
  options.uploader.retry.initialDelay = 1ms;
  options.poll.interval = 5ms;
  options.poll.maxPolls = 50;
  options.watcher.debounce = 100ms;
  return options;
}

bool waitUntil(const std::function<bool()> &done,
               std::chrono::milliseconds timeout = 10s) {
  auto deadline = std::chrono::steady_clock::now() + timeout;
  while (std::chrono::steady_clock::now() < deadline) {
    if (done())
      return true;
    std::this_thread::sleep_for(20ms);
  }
  return done();
}

class RecordingObserver : public ingest::SyncObserver {
public:
  void onActivity(const ingest::ActivityEntry &entry) override {
    std::lock_guard<std::mutex> lock(m_mutex);
    activities.push_back(entry);
  }
  void onWatchingChanged(bool watching) override {
    std::lock_guard<std::mutex> lock(m_mutex);
    watchingChanges.push_back(watching);
  }
  void onBatchComplete(std::size_t count) override {
    std::lock_guard<std::mutex> lock(m_mutex);
    batches.push_back(count);
  }
  void onFileDetected(const ingest::WatchEvent &,
                      const ingest::FileRecommendation &rec) override {
    std::lock_guard<std::mutex> lock(m_mutex);
    detected.push_back(rec.path);
  }

  std::vector<ingest::ActivityEntry> activities;
  std::vector<bool> watchingChanges;
  std::vector<std::size_t> batches;
  std::vector<std::string> detected;

private:
  std::mutex m_mutex;
};

} // namespace

TEST(SyncPipelineTest, ApprovedFileIsUploadedIngestedAndLogged) {
  TempDir dir;
  auto file = dir.write("report.pdf", "%PDF-1.7");
  FakeIngestionApi api;
  api.progressScript = {ProgressReport{"", "processing", 40.0, std::nullopt},
                        ProgressReport{"", "completed", 100.0, std::nullopt}};
  RecordingObserver observer;
  SyncPipeline pipeline(api, makeConfig(dir.path()), fastOptions(), &observer);

  auto dispatched = pipeline.approveAndIngest({file.string()});

  EXPECT_EQ(dispatched, 1u);
  auto activity = pipeline.recentActivity();
  ASSERT_EQ(activity.size(), 1u);
  EXPECT_EQ(activity[0].filename, "report.pdf");
  EXPECT_EQ(activity[0].status, UploadStatus::Done);
  EXPECT_FALSE(activity[0].error.has_value());
  EXPECT_EQ(activity[0].category, std::optional<FileCategory>(FileCategory::PersonalData));

  auto progress = pipeline.progress();
  ASSERT_EQ(progress.size(), 1u);
  EXPECT_EQ(progress[0].status, "done");
  EXPECT_DOUBLE_EQ(progress[0].percent, 100.0);

  EXPECT_EQ(api.triggerCalls(), 1);
  EXPECT_EQ(observer.batches, std::vector<std::size_t>{1});
  EXPECT_EQ(observer.activities.size(), 1u);
}

TEST(SyncPipelineTest, SlotFailureEndsAsLoggedError) {
  TempDir dir;
  auto file = dir.write("report.pdf");
  FakeIngestionApi api;
  api.slotFailures = 100;
  SyncPipeline pipeline(api, makeConfig(dir.path()), fastOptions());

  pipeline.approveAndIngest({file.string()});

  auto activity = pipeline.recentActivity();
  ASSERT_EQ(activity.size(), 1u);
  EXPECT_EQ(activity[0].status, UploadStatus::Error);
  ASSERT_TRUE(activity[0].error.has_value());
  EXPECT_NE(activity[0].error->find("Failed after 3 attempts"), std::string::npos);
  EXPECT_EQ(api.slotCalls(), 3);
  EXPECT_EQ(api.uploadCalls(), 0);

  auto progress = pipeline.progress();
  ASSERT_EQ(progress.size(), 1u);
  EXPECT_EQ(progress[0].status, "error");
}

TEST(SyncPipelineTest, RemoteIngestFailureUsesRemoteMessage) {
  TempDir dir;
  auto file = dir.write("notes.txt");
  FakeIngestionApi api;
  api.progressScript = {ProgressReport{"", "failed", 0.0, std::string("parse error")}};
  SyncPipeline pipeline(api, makeConfig(dir.path()), fastOptions());

  pipeline.approveAndIngest({file.string()});

  auto activity = pipeline.recentActivity();
  ASSERT_EQ(activity.size(), 1u);
  EXPECT_EQ(activity[0].status, UploadStatus::Error);
  EXPECT_EQ(activity[0].error, std::optional<std::string>("parse error"));
}

TEST(SyncPipelineTest, AutoIngestOffLogsUploaded) {
  TempDir dir;
  auto file = dir.write("a.csv");
  FakeIngestionApi api;
  auto config = makeConfig(dir.path());
  config.autoIngest = false;
  SyncPipeline pipeline(api, config, fastOptions());

  pipeline.approveAndIngest({file.string()});

  auto activity = pipeline.recentActivity();
  ASSERT_EQ(activity.size(), 1u);
  EXPECT_EQ(activity[0].status, UploadStatus::Uploaded);
  EXPECT_EQ(api.triggerCalls(), 0);
  EXPECT_EQ(api.progressCalls(), 0);
}

TEST(SyncPipelineTest, RelativePathsResolveAgainstCurrentScan) {
  TempDir dir;
  dir.write("docs/r.pdf");
  dir.write("photos/a.jpg");
  FakeIngestionApi api;
  api.progressScript = {ProgressReport{"", "done", 100.0, std::nullopt}};
  SyncPipeline pipeline(api, makeConfig(dir.path()), fastOptions());

  auto scan = pipeline.scanFolder();
  ASSERT_EQ(scan.recommended.size(), 2u);
  ASSERT_TRUE(pipeline.currentScan().has_value());

  auto dispatched =
      pipeline.approveAndIngest({"docs/r.pdf", "photos/a.jpg", "docs/r.pdf"});

  EXPECT_EQ(dispatched, 2u);
  EXPECT_EQ(api.uploadCalls(), 2);
  auto activity = pipeline.recentActivity();
  ASSERT_EQ(activity.size(), 2u);
  for (const auto &entry : activity)
    EXPECT_EQ(entry.status, UploadStatus::Done);
}

TEST(SyncPipelineTest, BatchStartReplacesProgressBoard) {
  TempDir dir;
  auto a = dir.write("a.txt");
  auto b = dir.write("b.txt");
  FakeIngestionApi api;
  api.progressScript = {ProgressReport{"", "done", 100.0, std::nullopt}};
  SyncPipeline pipeline(api, makeConfig(dir.path()), fastOptions());

  pipeline.approveAndIngest({a.string()});
  pipeline.approveAndIngest({b.string()});

  auto progress = pipeline.progress();
  ASSERT_EQ(progress.size(), 1u);
  EXPECT_EQ(progress[0].filename, "b.txt");
  EXPECT_EQ(pipeline.recentActivity().size(), 2u);
}

TEST(SyncPipelineTest, ApproveRequiresCredentials) {
  FakeIngestionApi api;
  SyncPipeline pipeline(api, ingest::AppConfig{}, fastOptions());
  EXPECT_THROW(pipeline.approveAndIngest({"/tmp/a.txt"}), ingest::ConfigError);
}

TEST(SyncPipelineTest, StartWatchingValidatesConfig) {
  FakeIngestionApi api;
  SyncPipeline unconfigured(api, ingest::AppConfig{}, fastOptions());
  EXPECT_THROW(unconfigured.startWatching(), ingest::ConfigError);
  EXPECT_FALSE(unconfigured.isWatching());

  TempDir dir;
  SyncPipeline missing(api, makeConfig(dir.path() / "nope"), fastOptions());
  EXPECT_THROW(missing.startWatching(), ingest::ConfigError);
  EXPECT_FALSE(missing.isWatching());
}

TEST(SyncPipelineTest, SyncStatusReportsFolderAndFileCount) {
  TempDir dir;
  dir.write("a.txt");
  dir.write("sub/b.pdf");
  FakeIngestionApi api;
  SyncPipeline pipeline(api, makeConfig(dir.path()), fastOptions());

  auto status = pipeline.syncStatus();
  EXPECT_FALSE(status.watching);
  EXPECT_EQ(status.folder, std::optional<std::string>(dir.path().string()));
  EXPECT_EQ(status.fileCount, 2u);
  EXPECT_TRUE(status.recentActivity.empty());
}

TEST(SyncPipelineTest, WatchedFileIsIngestedAutomatically) {
  TempDir dir;
  FakeIngestionApi api;
  api.progressScript = {ProgressReport{"", "processing", 50.0, std::nullopt},
                        ProgressReport{"", "completed", 100.0, std::nullopt}};
  RecordingObserver observer;
  SyncPipeline pipeline(api, makeConfig(dir.path()), fastOptions(), &observer);

  pipeline.startWatching();
  EXPECT_TRUE(pipeline.isWatching());
  std::this_thread::sleep_for(200ms);
  dir.write("report.pdf", "%PDF");

  ASSERT_TRUE(waitUntil([&] { return !pipeline.recentActivity().empty(); }));
  pipeline.waitForIdle();
  auto activity = pipeline.recentActivity();
  EXPECT_EQ(activity[0].filename, "report.pdf");
  EXPECT_EQ(activity[0].status, UploadStatus::Done);

  pipeline.stopWatching();
  EXPECT_FALSE(pipeline.isWatching());
  EXPECT_EQ(observer.watchingChanges, (std::vector<bool>{true, false}));
}

TEST(SyncPipelineTest, WatchIgnoresFilesThatShouldNotBeIngested) {
  TempDir dir;
  FakeIngestionApi api;
  RecordingObserver observer;
  SyncPipeline pipeline(api, makeConfig(dir.path()), fastOptions(), &observer);

  pipeline.startWatching();
  std::this_thread::sleep_for(200ms);
  dir.write("settings.yaml", "a: 1");

  std::this_thread::sleep_for(1s);
  pipeline.stopWatching();
  pipeline.waitForIdle();
  EXPECT_EQ(api.slotCalls(), 0);
  EXPECT_TRUE(pipeline.recentActivity().empty());
}

TEST(SyncPipelineTest, ManualApprovalQueuesWatchedFiles) {
  TempDir dir;
  FakeIngestionApi api;
  api.progressScript = {ProgressReport{"", "done", 100.0, std::nullopt}};
  auto config = makeConfig(dir.path());
  config.autoApproveWatched = false;
  SyncPipeline pipeline(api, config, fastOptions());

  pipeline.startWatching();
  std::this_thread::sleep_for(200ms);
  auto file = dir.write("notes.md", "hello");

  ASSERT_TRUE(waitUntil([&] { return !pipeline.pendingApprovals().empty(); }));
  EXPECT_EQ(api.slotCalls(), 0);
  auto pending = pipeline.pendingApprovals();
  EXPECT_EQ(pending[0].path, "notes.md");

  pipeline.approveAndIngest({file.string()});
  EXPECT_TRUE(pipeline.pendingApprovals().empty());
  EXPECT_EQ(api.uploadCalls(), 1);
  pipeline.stopWatching();
}

TEST(SyncPipelineTest, UnchangedContentIsNotUploadedTwice) {
  TempDir dir;
  FakeIngestionApi api;
  api.progressScript = {ProgressReport{"", "done", 100.0, std::nullopt}};
  SyncPipeline pipeline(api, makeConfig(dir.path()), fastOptions());

  pipeline.startWatching();
  std::this_thread::sleep_for(200ms);
  dir.write("log.txt", "first");
  ASSERT_TRUE(waitUntil([&] { return pipeline.recentActivity().size() == 1; }));
  pipeline.waitForIdle();

  std::this_thread::sleep_for(300ms);
  dir.write("log.txt", "first");
  std::this_thread::sleep_for(800ms);
  pipeline.waitForIdle();
  EXPECT_EQ(pipeline.recentActivity().size(), 1u);

  dir.write("log.txt", "second");
  ASSERT_TRUE(waitUntil([&] { return pipeline.recentActivity().size() == 2; }));
  pipeline.stopWatching();
}

TEST(SyncPipelineTest, FailedIngestionIsRetriedOnIdenticalRewrite) {
  TempDir dir;
  FakeIngestionApi api;
  api.progressScript = {ProgressReport{"", "failed", 0.0, std::string("parse error")}};
  SyncPipeline pipeline(api, makeConfig(dir.path()), fastOptions());

  pipeline.startWatching();
  std::this_thread::sleep_for(200ms);
  dir.write("log.txt", "first");
  ASSERT_TRUE(waitUntil([&] { return pipeline.recentActivity().size() == 1; }));
  pipeline.waitForIdle();
  EXPECT_EQ(pipeline.recentActivity()[0].status, UploadStatus::Error);

  std::this_thread::sleep_for(300ms);
  dir.write("log.txt", "first");
  ASSERT_TRUE(waitUntil([&] { return pipeline.recentActivity().size() == 2; }));
  pipeline.stopWatching();
  pipeline.waitForIdle();
  auto uploaded = api.uploadedBytes();
  ASSERT_GE(uploaded.size(), 2u);
  EXPECT_EQ(uploaded[0], "first");
  EXPECT_EQ(uploaded[1], "first");
}

TEST(SyncPipelineTest, UnexpectedUploaderFailureIsStillLogged) {
  class CrashingSlotApi : public FakeIngestionApi {
  public:
    ingest::UploadSlot requestUploadSlot(const ingest::AppConfig &,
                                         const std::string &,
                                         const std::string &) override {
      throw std::runtime_error("slot table corrupted");
    }
  };

  TempDir dir;
  auto file = dir.write("report.pdf");
  CrashingSlotApi api;
  SyncPipeline pipeline(api, makeConfig(dir.path()), fastOptions());

  pipeline.approveAndIngest({file.string()});

  auto activity = pipeline.recentActivity();
  ASSERT_EQ(activity.size(), 1u);
  EXPECT_EQ(activity[0].status, UploadStatus::Error);
  EXPECT_EQ(activity[0].error, std::optional<std::string>("slot table corrupted"));
  auto progress = pipeline.progress();
  ASSERT_EQ(progress.size(), 1u);
  EXPECT_EQ(progress[0].status, "error");
}

TEST(SyncPipelineTest, LargeBatchRunsOnBoundedWorkers) {
  TempDir dir;
  FakeIngestionApi api;
  api.uploadDelay = 2ms;
  api.progressScript = {ProgressReport{"", "done", 100.0, std::nullopt}};
  auto options = fastOptions();
  options.poll.interval = 1ms;
  SyncPipeline pipeline(api, makeConfig(dir.path()), options);

  std::vector<std::string> paths;
  for (int i = 0; i < 200; ++i)
    paths.push_back(dir.write("doc" + std::to_string(i) + ".txt").string());

  EXPECT_EQ(pipeline.approveAndIngest(paths), 200u);
  EXPECT_EQ(api.uploadCalls(), 200);
  EXPECT_LE(api.peakConcurrentUploads(), 3);
  EXPECT_EQ(pipeline.recentActivity().size(), 50u);
}

TEST(SyncPipelineTest, StopWatchingLetsInFlightTransfersFinish) {
  TempDir dir;
  FakeIngestionApi api;
  api.uploadDelay = 300ms;
  api.progressScript = {ProgressReport{"", "done", 100.0, std::nullopt}};
  SyncPipeline pipeline(api, makeConfig(dir.path()), fastOptions());

  pipeline.startWatching();
  std::this_thread::sleep_for(200ms);
  dir.write("report.pdf", "%PDF");
  ASSERT_TRUE(waitUntil([&] { return api.uploadCalls() > 0; }));

  pipeline.stopWatching();
  pipeline.waitForIdle();
  auto activity = pipeline.recentActivity();
  ASSERT_EQ(activity.size(), 1u);
  EXPECT_EQ(activity[0].status, UploadStatus::Done);
}
