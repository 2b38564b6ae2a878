// Copyright (c) 2025 The SignalHub developers
// Distributed under the MIT software license
// Rate limiter implementation

#include "util/rate_limiter.hpp"

#include "util/time.hpp"

namespace signalhub {
namespace util {

RateLimiter::RateLimiter(uint32_t max_requests, std::chrono::seconds window)
    : max_requests_(max_requests), window_(window), window_started_at_(GetSteadyTime()) {}

bool RateLimiter::Allow(const std::string& key) {
  std::lock_guard<std::mutex> lock(mutex_);

  auto now = GetSteadyTime();
  if (window_.count() > 0 && now - window_started_at_ >= window_) {
    ResetLocked(now);
  }

  auto& count = counts_[key];
  if (count >= max_requests_) {
    return false;
  }
  ++count;
  return true;
}

void RateLimiter::Reset() {
  std::lock_guard<std::mutex> lock(mutex_);
  ResetLocked(GetSteadyTime());
}

void RateLimiter::ResetLocked(std::chrono::steady_clock::time_point now) {
  counts_.clear();
  window_started_at_ = now;
}

uint32_t RateLimiter::GetCount(const std::string& key) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = counts_.find(key);
  return it == counts_.end() ? 0 : it->second;
}

size_t RateLimiter::GetTrackedKeys() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return counts_.size();
}

RateLimiter& RateLimiter::ForLogging() {
  static RateLimiter instance(200, std::chrono::hours(1));
  return instance;
}

}  // namespace util
}  // namespace signalhub
