// Copyright (c) 2025 The SignalHub developers
// Distributed under the MIT software license

#pragma once

#include <chrono>
#include <cstdint>

namespace signalhub {
namespace util {

/**
 * Process-wide time source
 *
 * Every component that stamps or compares times (peer registry, liveness
 * sweeper, rate limiter windows) reads the clock through these functions so
 * tests can freeze and advance time deterministically with SetMockTime().
 *
 * Mock time is expressed in milliseconds since the Unix epoch. A value of 0
 * disables mocking. While mocking is active, GetSteadyTime() is derived from
 * the mock value and still advances monotonically as the mock is moved forward.
 */

// Monotonic clock (mock-aware).
std::chrono::steady_clock::time_point GetSteadyTime();

// Set mock time in milliseconds since the epoch (0 = use the real clock).
void SetMockTime(int64_t unix_millis);

// Current mock value in milliseconds (0 if not mocking).
int64_t GetMockTime();

// RAII guard for tests: sets mock time on construction and restores the
// previous value on destruction.
class MockTimeScope {
public:
  explicit MockTimeScope(int64_t unix_millis) : previous_(GetMockTime()) { SetMockTime(unix_millis); }
  ~MockTimeScope() { SetMockTime(previous_); }

  MockTimeScope(const MockTimeScope&) = delete;
  MockTimeScope& operator=(const MockTimeScope&) = delete;

  // Move the mocked clock forward.
  void Advance(std::chrono::milliseconds delta) { SetMockTime(GetMockTime() + delta.count()); }

private:
  int64_t previous_;
};

}  // namespace util
}  // namespace signalhub
