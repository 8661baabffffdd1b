#pragma once

#include <condition_variable>
#include <cstddef>
#include <functional>
#include <mutex>
#include <queue>
#include <string>
#include <thread>
#include <vector>

namespace ingest {

/**
 * A fixed set of worker threads draining a shared job queue. Submitting a job
 * never starts a thread; jobs wait in the queue until a worker is free.
 *
 * wait() blocks until the queue is empty and no job is running. The
 * destructor lets the workers finish everything already queued, then joins
 * them. A job that throws is logged and does not stop its worker.
 */
class WorkerPool {
public:
  WorkerPool(std::string name, std::size_t workerCount);
  ~WorkerPool();

  WorkerPool(const WorkerPool &) = delete;
  WorkerPool &operator=(const WorkerPool &) = delete;

  void submit(std::function<void()> job);
  void wait();

  // Jobs queued or running.
  std::size_t pending() const;
  std::size_t workerCount() const { return m_workers.size(); }

private:
  void workerThread();
  void shutdown();

  std::string m_name;
  std::vector<std::thread> m_workers;
  std::queue<std::function<void()>> m_jobs;
  std::size_t m_pending = 0;
  bool m_stop = false;

  mutable std::mutex m_mutex;
  std::condition_variable m_jobReady;
  std::condition_variable m_idle;
};

} // namespace ingest
