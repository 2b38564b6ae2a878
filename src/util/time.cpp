// Copyright (c) 2025 The SignalHub developers
// Distributed under the MIT software license

#include "util/time.hpp"

#include <atomic>
#include <mutex>

namespace signalhub {
namespace util {

namespace {

std::atomic<int64_t> g_mock_millis{0};

// Anchor pairing a real steady_clock instant with the mock value that was
// current when mocking began. Guarded by g_anchor_mutex.
std::mutex g_anchor_mutex;
std::chrono::steady_clock::time_point g_steady_anchor;
int64_t g_mock_anchor{0};
bool g_anchored{false};

}  // namespace

std::chrono::steady_clock::time_point GetSteadyTime() {
  int64_t mock = g_mock_millis.load(std::memory_order_relaxed);
  if (mock == 0) {
    return std::chrono::steady_clock::now();
  }

  std::lock_guard<std::mutex> lock(g_anchor_mutex);
  if (!g_anchored) {
    g_steady_anchor = std::chrono::steady_clock::now();
    g_mock_anchor = mock;
    g_anchored = true;
  }
  return g_steady_anchor + std::chrono::milliseconds(mock - g_mock_anchor);
}

void SetMockTime(int64_t unix_millis) {
  g_mock_millis.store(unix_millis, std::memory_order_relaxed);

  // Keep the anchor while the mock moves so steady time advances with it;
  // drop it only when mocking is switched off.
  if (unix_millis == 0) {
    std::lock_guard<std::mutex> lock(g_anchor_mutex);
    g_anchored = false;
  }
}

int64_t GetMockTime() {
  return g_mock_millis.load(std::memory_order_relaxed);
}

}  // namespace util
}  // namespace signalhub
