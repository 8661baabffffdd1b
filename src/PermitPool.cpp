#include "PermitPool.hpp"
#include <algorithm>

namespace ingest {

PermitPool::Permit &PermitPool::Permit::operator=(Permit &&other) noexcept {
  if (this != &other) {
    release();
    m_pool = other.m_pool;
    other.m_pool = nullptr;
  }
  return *this;
}

void PermitPool::Permit::release() {
  if (m_pool) {
    m_pool->giveBack();
    m_pool = nullptr;
  }
}

PermitPool::PermitPool(std::size_t capacity)
    : m_capacity(std::max<std::size_t>(capacity, 1)) {}

PermitPool::Permit PermitPool::acquire() {
  std::unique_lock<std::mutex> lock(m_mutex);
  m_cv.wait(lock, [this] { return m_inUse < m_capacity; });
  ++m_inUse;
  m_peak = std::max(m_peak, m_inUse);
  return Permit(this);
}

void PermitPool::giveBack() {
  {
    std::lock_guard<std::mutex> lock(m_mutex);
    --m_inUse;
  }
  m_cv.notify_one();
}

std::size_t PermitPool::inUse() const {
  std::lock_guard<std::mutex> lock(m_mutex);
  return m_inUse;
}

std::size_t PermitPool::peakInUse() const {
  std::lock_guard<std::mutex> lock(m_mutex);
  return m_peak;
}

} // namespace ingest
