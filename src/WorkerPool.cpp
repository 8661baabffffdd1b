#include "WorkerPool.hpp"
#include <algorithm>
#include <exception>
#include <iostream>
#include <system_error>

namespace ingest {

WorkerPool::WorkerPool(std::string name, std::size_t workerCount)
    : m_name(std::move(name)) {
  workerCount = std::max<std::size_t>(workerCount, 1);
  m_workers.reserve(workerCount);
  try {
    for (std::size_t i = 0; i < workerCount; ++i)
      m_workers.emplace_back(&WorkerPool::workerThread, this);
  } catch (const std::system_error &e) {
    std::cerr << "[" << m_name << "] Failed to start worker: " << e.what()
              << std::endl;
    shutdown();
    throw;
  }
}

WorkerPool::~WorkerPool() { shutdown(); }

void WorkerPool::shutdown() {
  {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_stop = true;
  }
  m_jobReady.notify_all();
  for (auto &worker : m_workers) {
    if (worker.joinable())
      worker.join();
  }
}

void WorkerPool::submit(std::function<void()> job) {
  {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_jobs.push(std::move(job));
    ++m_pending;
  }
  m_jobReady.notify_one();
}

void WorkerPool::wait() {
  std::unique_lock<std::mutex> lock(m_mutex);
  m_idle.wait(lock, [this] { return m_pending == 0; });
}

std::size_t WorkerPool::pending() const {
  std::lock_guard<std::mutex> lock(m_mutex);
  return m_pending;
}

void WorkerPool::workerThread() {
  while (true) {
    std::function<void()> job;
    {
      std::unique_lock<std::mutex> lock(m_mutex);
      m_jobReady.wait(lock, [this] { return m_stop || !m_jobs.empty(); });
      if (m_stop && m_jobs.empty())
        return;
      job = std::move(m_jobs.front());
      m_jobs.pop();
    }

    try {
      job();
    } catch (const std::exception &e) {
      std::cerr << "[" << m_name << "] Job failed: " << e.what() << std::endl;
    }

    {
      std::lock_guard<std::mutex> lock(m_mutex);
      --m_pending;
    }
    m_idle.notify_all();
  }
}

} // namespace ingest
