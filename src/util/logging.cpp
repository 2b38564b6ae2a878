// Copyright (c) 2025 The SignalHub developers
// Distributed under the MIT software license

#include "util/logging.hpp"

#include <array>
#include <mutex>
#include <unordered_map>
#include <vector>

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace signalhub {
namespace util {

namespace {

constexpr std::array<const char*, 4> kComponents = {"default", "network", "relay", "http"};

std::once_flag g_init_flag;
std::mutex g_loggers_mutex;
std::unordered_map<std::string, std::shared_ptr<spdlog::logger>> g_loggers;
bool g_initialized{false};

// Settings of the last Initialize() call, reused when loggers are built lazily
// (first use before Initialize, or after Shutdown).
std::string g_level = "info";
bool g_to_file = false;
std::string g_file_path;

void BuildLoggersLocked() {
  std::vector<spdlog::sink_ptr> sinks;
  sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());

  std::string file_error;
  if (g_to_file && !g_file_path.empty()) {
    try {
      sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(g_file_path, false));
    } catch (const spdlog::spdlog_ex& e) {
      file_error = e.what();
    }
  }

  auto level = spdlog::level::from_str(g_level);
  for (const char* name : kComponents) {
    auto logger = std::make_shared<spdlog::logger>(name, sinks.begin(), sinks.end());
    logger->set_level(level);
    logger->set_pattern("%Y-%m-%d %H:%M:%S.%e [%n] [%^%l%$] %v");
    logger->flush_on(spdlog::level::warn);
    g_loggers[name] = logger;
  }
  g_initialized = true;

  if (!file_error.empty()) {
    g_loggers["default"]->warn("Cannot open log file {}: {} (console only)", g_file_path, file_error);
  }
}

}  // namespace

void LogManager::Initialize(const std::string& log_level, bool log_to_file, const std::string& log_file_path) {
  std::call_once(g_init_flag, [&]() {
    std::lock_guard<std::mutex> lock(g_loggers_mutex);
    g_level = log_level;
    g_to_file = log_to_file;
    g_file_path = log_file_path;
    BuildLoggersLocked();
  });
}

void LogManager::Shutdown() {
  std::lock_guard<std::mutex> lock(g_loggers_mutex);
  for (auto& [name, logger] : g_loggers) {
    logger->flush();
  }
  g_loggers.clear();
  g_initialized = false;
}

std::shared_ptr<spdlog::logger> LogManager::GetLogger(const std::string& name) {
  std::lock_guard<std::mutex> lock(g_loggers_mutex);
  if (!g_initialized) {
    BuildLoggersLocked();
  }
  auto it = g_loggers.find(name);
  if (it != g_loggers.end()) {
    return it->second;
  }
  return g_loggers["default"];
}

void LogManager::SetLogLevel(const std::string& level) {
  std::lock_guard<std::mutex> lock(g_loggers_mutex);
  g_level = level;
  auto lvl = spdlog::level::from_str(level);
  for (auto& [name, logger] : g_loggers) {
    logger->set_level(lvl);
  }
}

void LogManager::SetComponentLevel(const std::string& component, const std::string& level) {
  std::lock_guard<std::mutex> lock(g_loggers_mutex);
  auto it = g_loggers.find(component);
  if (it != g_loggers.end()) {
    it->second->set_level(spdlog::level::from_str(level));
  }
}

}  // namespace util
}  // namespace signalhub
