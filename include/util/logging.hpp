// Copyright (c) 2025 The SignalHub developers
// Distributed under the MIT software license

#pragma once

#include <memory>
#include <string>

#include <spdlog/spdlog.h>

namespace signalhub {
namespace util {

/**
 * Logging utility wrapper around spdlog
 *
 * One logger per component ("default", "network", "relay", "http"), all
 * sharing the same sinks: colored stdout and, optionally, a log file.
 *
 * Thread-safety: Initialize() runs its body exactly once (std::call_once).
 * Logger lookup and level changes are guarded by a mutex.
 */
class LogManager {
public:
  // Initialize logging with the given minimum level. Only the first call
  // has any effect.
  static void Initialize(const std::string& log_level = "info", bool log_to_file = false,
                         const std::string& log_file_path = "signalhub.log");

  // Flush and drop all loggers. Later logging calls re-initialize.
  static void Shutdown();

  // Logger for a component. Unknown names get the default logger.
  static std::shared_ptr<spdlog::logger> GetLogger(const std::string& name = "default");

  // Set level for every component.
  static void SetLogLevel(const std::string& level);

  // Set level for one component.
  static void SetComponentLevel(const std::string& component, const std::string& level);
};

}  // namespace util
}  // namespace signalhub

#define LOG_TRACE(...) signalhub::util::LogManager::GetLogger()->trace(__VA_ARGS__)
#define LOG_DEBUG(...) signalhub::util::LogManager::GetLogger()->debug(__VA_ARGS__)
#define LOG_INFO(...) signalhub::util::LogManager::GetLogger()->info(__VA_ARGS__)
#define LOG_WARN(...) signalhub::util::LogManager::GetLogger()->warn(__VA_ARGS__)
#define LOG_ERROR(...) signalhub::util::LogManager::GetLogger()->error(__VA_ARGS__)

#define LOG_NET_TRACE(...) signalhub::util::LogManager::GetLogger("network")->trace(__VA_ARGS__)
#define LOG_NET_DEBUG(...) signalhub::util::LogManager::GetLogger("network")->debug(__VA_ARGS__)
#define LOG_NET_INFO(...) signalhub::util::LogManager::GetLogger("network")->info(__VA_ARGS__)
#define LOG_NET_WARN(...) signalhub::util::LogManager::GetLogger("network")->warn(__VA_ARGS__)
#define LOG_NET_ERROR(...) signalhub::util::LogManager::GetLogger("network")->error(__VA_ARGS__)

#define LOG_RELAY_TRACE(...) signalhub::util::LogManager::GetLogger("relay")->trace(__VA_ARGS__)
#define LOG_RELAY_DEBUG(...) signalhub::util::LogManager::GetLogger("relay")->debug(__VA_ARGS__)
#define LOG_RELAY_INFO(...) signalhub::util::LogManager::GetLogger("relay")->info(__VA_ARGS__)
#define LOG_RELAY_WARN(...) signalhub::util::LogManager::GetLogger("relay")->warn(__VA_ARGS__)

#define LOG_HTTP_TRACE(...) signalhub::util::LogManager::GetLogger("http")->trace(__VA_ARGS__)
#define LOG_HTTP_DEBUG(...) signalhub::util::LogManager::GetLogger("http")->debug(__VA_ARGS__)
#define LOG_HTTP_INFO(...) signalhub::util::LogManager::GetLogger("http")->info(__VA_ARGS__)
#define LOG_HTTP_WARN(...) signalhub::util::LogManager::GetLogger("http")->warn(__VA_ARGS__)

// ============================================================================
// RATE-LIMITED LOGGING MACROS
// ============================================================================
// For messages triggered by client input (malformed frames, throttled
// addresses, read errors). Each callsite may log 200 lines per hour.

#include "util/rate_limiter.hpp"

#define CALLSITE_KEY_ (std::string(__FILE__) + ":" + std::to_string(__LINE__))

#define LOG_WARN_RL(...)                                                                                               \
  do {                                                                                                                 \
    if (signalhub::util::RateLimiter::ForLogging().Allow(CALLSITE_KEY_)) {                                             \
      signalhub::util::LogManager::GetLogger()->warn(__VA_ARGS__);                                                     \
    }                                                                                                                  \
  } while (0)

#define LOG_NET_WARN_RL(...)                                                                                           \
  do {                                                                                                                 \
    if (signalhub::util::RateLimiter::ForLogging().Allow(CALLSITE_KEY_)) {                                             \
      signalhub::util::LogManager::GetLogger("network")->warn(__VA_ARGS__);                                            \
    }                                                                                                                  \
  } while (0)

#define LOG_RELAY_WARN_RL(...)                                                                                         \
  do {                                                                                                                 \
    if (signalhub::util::RateLimiter::ForLogging().Allow(CALLSITE_KEY_)) {                                             \
      signalhub::util::LogManager::GetLogger("relay")->warn(__VA_ARGS__);                                              \
    }                                                                                                                  \
  } while (0)

#define LOG_HTTP_WARN_RL(...)                                                                                          \
  do {                                                                                                                 \
    if (signalhub::util::RateLimiter::ForLogging().Allow(CALLSITE_KEY_)) {                                             \
      signalhub::util::LogManager::GetLogger("http")->warn(__VA_ARGS__);                                               \
    }                                                                                                                  \
  } while (0)
