#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>

namespace ingest {

/**
 * Multi-producer blocking queue with close semantics.
 *
 * push() blocks while the channel is full and fails once it is closed.
 * pop() blocks until an item arrives or the channel is closed and drained.
 * A capacity of 0 means unbounded.
 */
template <typename T> class Channel {
public:
  explicit Channel(std::size_t capacity = 0) : m_capacity(capacity) {}

  Channel(const Channel &) = delete;
  Channel &operator=(const Channel &) = delete;

  bool push(T value) {
    std::unique_lock<std::mutex> lock(m_mutex);
    m_notFull.wait(lock, [this] {
      return m_closed || m_capacity == 0 || m_items.size() < m_capacity;
    });
    if (m_closed)
      return false;
    m_items.push_back(std::move(value));
    m_notEmpty.notify_one();
    return true;
  }

  std::optional<T> pop() {
    std::unique_lock<std::mutex> lock(m_mutex);
    m_notEmpty.wait(lock, [this] { return m_closed || !m_items.empty(); });
    return takeFront();
  }

  // Returns nullopt on timeout as well as on closed-and-drained; check
  // isClosed() to tell the two apart.
  template <typename Rep, typename Period>
  std::optional<T> popFor(const std::chrono::duration<Rep, Period> &timeout) {
    std::unique_lock<std::mutex> lock(m_mutex);
    m_notEmpty.wait_for(lock, timeout,
                        [this] { return m_closed || !m_items.empty(); });
    return takeFront();
  }

  void close() {
    {
      std::lock_guard<std::mutex> lock(m_mutex);
      m_closed = true;
    }
    m_notEmpty.notify_all();
    m_notFull.notify_all();
  }

  bool isClosed() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_closed;
  }

  std::size_t size() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_items.size();
  }

private:
  std::optional<T> takeFront() {
    if (m_items.empty())
      return std::nullopt;
    T value = std::move(m_items.front());
    m_items.pop_front();
    m_notFull.notify_one();
    return value;
  }

  std::size_t m_capacity;
  std::deque<T> m_items;
  bool m_closed = false;
  mutable std::mutex m_mutex;
  std::condition_variable m_notEmpty;
  std::condition_variable m_notFull;
};

} // namespace ingest
