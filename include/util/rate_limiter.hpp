// Copyright (c) 2025 The SignalHub developers
// Distributed under the MIT software license
// Fixed-window request limiter keyed by client address (or log callsite)

#pragma once

#include <chrono>
#include <cstdint>
#include <mutex>
#include <string>
#include <unordered_map>

namespace signalhub {
namespace util {

/**
 * RateLimiter - coarse fixed-window counter per key
 *
 * Each key may pass Allow() at most max_requests times per window. When the
 * window ends, every counter is dropped at once (Reset()), rather than sliding
 * per key. Memory is one integer per key seen in the current window.
 *
 * A burst of up to max_requests immediately after a reset is accepted
 * behaviour.
 *
 * The window is reset in two ways:
 * - explicitly, by the owner's periodic timer calling Reset();
 * - lazily, when Allow() observes that the window has already elapsed, so a
 *   lagging timer never stretches a window.
 *
 * Thread-safety: all methods take mutex_, which only covers map updates.
 */
class RateLimiter {
public:
  RateLimiter(uint32_t max_requests, std::chrono::seconds window);

  RateLimiter(const RateLimiter&) = delete;
  RateLimiter& operator=(const RateLimiter&) = delete;

  // Count one request for key. Returns false once key has used up its quota
  // for the current window.
  bool Allow(const std::string& key);

  // Drop all counters and start a new window now.
  void Reset();

  // Requests counted for key in the current window.
  uint32_t GetCount(const std::string& key) const;

  // Number of keys tracked in the current window.
  size_t GetTrackedKeys() const;

  uint32_t max_requests() const { return max_requests_; }
  std::chrono::seconds window() const { return window_; }

  // Shared limiter for log callsites: 200 lines per hour each. Backs the
  // LOG_*_RL macros so a misbehaving client cannot flood the log.
  static RateLimiter& ForLogging();

private:
  void ResetLocked(std::chrono::steady_clock::time_point now);

  const uint32_t max_requests_;
  const std::chrono::seconds window_;

  mutable std::mutex mutex_;
  std::unordered_map<std::string, uint32_t> counts_;
  std::chrono::steady_clock::time_point window_started_at_;
};

}  // namespace util
}  // namespace signalhub
