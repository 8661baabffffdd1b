#include "ApiClient.hpp"
#include "AppConfig.hpp"
#include "JsonCodec.hpp"
#include "SyncPipeline.hpp"
#include <atomic>
#include <condition_variable>
#include <csignal>
#include <iostream>
#include <mutex>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

std::atomic<bool> running{true};
std::mutex cv_m;
std::condition_variable cv;

static void signalHandler(int sig) {
  std::cout << "[Main] Shutdown signal received (" << sig << ")" << std::endl;
  running.store(false);
  cv.notify_all();
}

namespace {

using json = nlohmann::json;

// Prints every pipeline notification as one JSON object per line.
class ConsoleObserver : public ingest::SyncObserver {
public:
  void onFileDetected(const ingest::WatchEvent &event,
                      const ingest::FileRecommendation &rec) override {
    emit("file_detected", json{{"event", event}, {"recommendation", rec}});
  }
  void onUploadResult(const ingest::UploadResult &result) override {
    emit("upload_result", result);
  }
  void onProgress(const std::vector<ingest::FileProgress> &files) override {
    emit("progress", files);
  }
  void onActivity(const ingest::ActivityEntry &entry) override {
    emit("activity", entry);
  }
  void onWatchingChanged(bool watching) override {
    emit("watching", watching);
  }
  void onBatchComplete(std::size_t count) override {
    emit("batch_complete", count);
  }

private:
  void emit(const char *type, const json &payload) {
    std::lock_guard<std::mutex> lock(m_mutex);
    std::cout << json{{"type", type}, {"payload", payload}}.dump() << std::endl;
  }

  std::mutex m_mutex;
};

void printUsage(const char *argv0) {
  std::cerr << "Usage: " << argv0 << " <config.json> [scan|watch|ingest]"
            << std::endl;
}

} // namespace

int main(int argc, char **argv) {
  if (argc < 2) {
    printUsage(argv[0]);
    return 2;
  }
  const std::string configPath = argv[1];
  const std::string command = argc > 2 ? argv[2] : "watch";
  if (command != "scan" && command != "watch" && command != "ingest") {
    printUsage(argv[0]);
    return 2;
  }

  std::signal(SIGINT, signalHandler);
  std::signal(SIGTERM, signalHandler);

  try {
    auto config = ingest::loadConfig(configPath);
    ingest::applyEnvironment(config);

    ingest::ApiClient apiClient;
    ConsoleObserver observer;
    ingest::SyncPipeline pipeline(apiClient, config, {}, &observer);
    std::cout << "[Main] Pipeline initialized." << std::endl;

    if (command == "scan") {
      auto result = pipeline.scanFolder();
      std::cout << json(result).dump(2) << std::endl;
      return 0;
    }

    if (command == "ingest") {
      // Scan, then ingest everything the classifier recommends.
      auto result = pipeline.scanFolder();
      std::vector<std::string> approved;
      for (const auto &rec : result.recommended)
        approved.push_back(rec.path);
      pipeline.approveAndIngest(approved);
      std::cout << json(pipeline.syncStatus()).dump(2) << std::endl;
      return 0;
    }

    pipeline.startWatching();
    std::cout << "[Main] Running. Monitoring: "
              << config.watchedFolder->string() << std::endl;
    std::cout << "[Main] Press Ctrl+C to exit gracefully." << std::endl;

    {
      std::unique_lock<std::mutex> lock(cv_m);
      cv.wait(lock, [] { return !running.load(); });
    }

    pipeline.stopWatching();
    std::cout << "[Main] Waiting for in-flight transfers..." << std::endl;
    pipeline.waitForIdle();
    std::cout << json(pipeline.syncStatus()).dump() << std::endl;
    std::cout << "[Main] Finished." << std::endl;

  } catch (const std::exception &e) {
    std::cerr << "[Main] Error: " << e.what() << std::endl;
    return 1;
  }

  return 0;
}
