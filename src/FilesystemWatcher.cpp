#include "FilesystemWatcher.hpp"
#include "Errors.hpp"
#include "EventDebouncer.hpp"
#include <efsw/efsw.hpp>
#include <iostream>
#include <thread>

namespace fs = std::filesystem;

namespace ingest {

struct FilesystemWatcher::Impl : public efsw::FileWatchListener {
  efsw::FileWatcher watcher;
  efsw::WatchID watchId = 0;
  bool running = false;

  Channel<RawFsEvent> rawEvents;
  FilesystemWatcher::Sink sink;
  EventDebouncer debouncer;
  std::thread workerThread;

  Impl(FilesystemWatcher::Sink s, const WatcherOptions &options)
      : sink(std::move(s)), debouncer(options.debounce) {}

  void debounceLoop() {
    auto lastPrune = std::chrono::steady_clock::now();
    while (true) {
      auto raw = rawEvents.popFor(std::chrono::milliseconds(100));
      auto now = std::chrono::steady_clock::now();
      if (!raw) {
        if (rawEvents.isClosed()) {
          std::cout << "[Watcher] Raw event stream closed" << std::endl;
          return;
        }
        if (now - lastPrune > std::chrono::seconds(30)) {
          debouncer.prune(now);
          lastPrune = now;
        }
        continue;
      }

      auto event = debouncer.accept(*raw, now);
      if (!event)
        continue;

      if (!sink->push(std::move(*event))) {
        std::cerr << "[Watcher] Watch event channel closed" << std::endl;
        return;
      }
    }
  }

  void handleFileAction(efsw::WatchID, const std::string &dir,
                        const std::string &filename, efsw::Action action,
                        std::string) override {
    std::string fullPath = dir + filename;
    if (!dir.empty() && dir.back() != '/' && dir.back() != '\\')
      fullPath = dir + "/" + filename;
    fs::path path = fs::path(fullPath).lexically_normal();

    RawAction kind;
    switch (action) {
    case efsw::Actions::Add:
      kind = RawAction::Add;
      break;
    case efsw::Actions::Modified:
      kind = RawAction::Modified;
      break;
    case efsw::Actions::Delete:
      kind = RawAction::Delete;
      break;
    case efsw::Actions::Moved:
      kind = RawAction::Moved;
      break;
    default:
      return;
    }
    if (!rawEvents.push(RawFsEvent{kind, path})) {
      // stop() already closed the stream; late notifications are dropped
      return;
    }
  }
};

FilesystemWatcher::FilesystemWatcher(fs::path folder, Sink sink,
                                     WatcherOptions options)
    : m_impl(std::make_unique<Impl>(std::move(sink), options)),
      m_folder(std::move(folder)) {}

FilesystemWatcher::~FilesystemWatcher() { stop(); }

void FilesystemWatcher::start() {
  if (m_impl->running)
    return;

  m_impl->watchId =
      m_impl->watcher.addWatch(m_folder.string(), m_impl.get(), true);
  if (m_impl->watchId < 0) {
    throw WatchSetupError("Failed to watch folder " + m_folder.string() +
                          ": " + efsw::Errors::Log::getLastErrorLog());
  }

  m_impl->workerThread = std::thread(&Impl::debounceLoop, m_impl.get());
  m_impl->watcher.watch();
  m_impl->running = true;
  std::cout << "[Watcher] Started monitoring (with debouncing): " << m_folder
            << std::endl;
}

void FilesystemWatcher::stop() {
  if (!m_impl->running)
    return;

  m_impl->watcher.removeWatch(m_impl->watchId);
  m_impl->rawEvents.close();
  if (m_impl->workerThread.joinable()) {
    m_impl->workerThread.join();
  }

  m_impl->running = false;
  std::cout << "[Watcher] Stopped monitoring: " << m_folder << std::endl;
}

bool FilesystemWatcher::isRunning() const { return m_impl->running; }

} // namespace ingest
