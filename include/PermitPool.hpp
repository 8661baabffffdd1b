#pragma once

#include <condition_variable>
#include <cstddef>
#include <mutex>

namespace ingest {

/**
 * Counting concurrency limiter. acquire() blocks until a slot is free and
 * returns a Permit that gives the slot back when it goes out of scope.
 */
class PermitPool {
public:
  class Permit {
  public:
    Permit() = default;
    explicit Permit(PermitPool *pool) : m_pool(pool) {}
    Permit(Permit &&other) noexcept : m_pool(other.m_pool) {
      other.m_pool = nullptr;
    }
    Permit &operator=(Permit &&other) noexcept;
    Permit(const Permit &) = delete;
    Permit &operator=(const Permit &) = delete;
    ~Permit() { release(); }

    void release();
    bool held() const { return m_pool != nullptr; }

  private:
    PermitPool *m_pool = nullptr;
  };

  explicit PermitPool(std::size_t capacity);

  Permit acquire();

  std::size_t capacity() const { return m_capacity; }
  std::size_t inUse() const;
  // Highest number of simultaneously held permits since construction.
  std::size_t peakInUse() const;

private:
  void giveBack();

  const std::size_t m_capacity;
  std::size_t m_inUse = 0;
  std::size_t m_peak = 0;
  mutable std::mutex m_mutex;
  std::condition_variable m_cv;
};

} // namespace ingest
