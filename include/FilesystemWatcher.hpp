#pragma once
#include "Channel.hpp"
#include "types.hpp"
#include <chrono>
#include <filesystem>
#include <memory>

namespace ingest {

struct WatcherOptions {
  std::chrono::milliseconds debounce{500};
};

/**
 * FilesystemWatcher monitors a directory tree and hands debounced
 * Created/Modified events to a sink channel. Destroying it stops monitoring.
 *
 * The owner must close the sink before destruction if the sink can be full;
 * the debounce stage blocks on a full sink and exits once it is closed.
 */
class FilesystemWatcher {
public:
  using Sink = std::shared_ptr<Channel<WatchEvent>>;

  FilesystemWatcher(std::filesystem::path folder, Sink sink,
                    WatcherOptions options = {});
  ~FilesystemWatcher();

  // Throws WatchSetupError if the OS watch cannot be installed.
  void start();
  void stop();

  bool isRunning() const;
  const std::filesystem::path &folder() const { return m_folder; }

private:
  struct Impl;
  std::unique_ptr<Impl> m_impl;
  std::filesystem::path m_folder;
};

} // namespace ingest
