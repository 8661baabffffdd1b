#pragma once

#include "Errors.hpp"
#include <algorithm>
#include <chrono>
#include <iostream>
#include <string>
#include <thread>

namespace ingest {

struct RetryPolicy {
  int maxAttempts = 3;
  std::chrono::milliseconds initialDelay{500};

  // Delay after the given failed attempt (0-based): initial, 2x, 4x, ...
  std::chrono::milliseconds delayAfter(int attempt) const {
    return initialDelay * (1 << attempt);
  }
};

/**
 * Runs fn until it returns or maxAttempts TransferErrors have been thrown.
 * Every TransferError is retried regardless of status code. Only the last
 * error is reported, wrapped in a TransferError naming the attempt count.
 */
template <typename Fn>
auto withRetry(const RetryPolicy &policy, const std::string &what, Fn &&fn)
    -> decltype(fn()) {
  const int attempts = std::max(policy.maxAttempts, 1);
  std::string lastError;

  for (int attempt = 0; attempt < attempts; ++attempt) {
    try {
      return fn();
    } catch (const TransferError &e) {
      lastError = e.what();
      if (attempt < attempts - 1) {
        auto delay = policy.delayAfter(attempt);
        std::cerr << "[Uploader] " << what << ": attempt " << attempt + 1
                  << " failed, retrying in " << delay.count()
                  << "ms: " << lastError << std::endl;
        std::this_thread::sleep_for(delay);
      }
    }
  }

  throw TransferError("Failed after " + std::to_string(attempts) +
                      " attempts: " + lastError);
}

} // namespace ingest
