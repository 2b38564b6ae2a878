// Copyright (c) 2025 The SignalHub developers
// Distributed under the MIT software license

#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace signalhub {
namespace app {

// Runtime configuration for signalhubd. Defaults follow the PeerJS server
// deployment this relay replaces (port 3000, 60s alive timeout, 100 requests
// per hour per address).
struct AppConfig {
  std::string bind_address = "0.0.0.0";
  uint16_t listen_port = 3000;
  size_t io_threads = 1;

  std::chrono::seconds inactivity_timeout{60};
  std::chrono::seconds sweep_interval{30};

  uint32_t rate_limit = 100;
  std::chrono::seconds rate_window{3600};

  size_t max_peers = 5000;
  size_t max_frame_bytes = 64 * 1024;
  size_t max_send_queue_bytes = 1024 * 1024;

  bool allow_discovery = true;
  bool trust_proxy = false;
  std::string peerjs_key = "peerjs";
  std::string peerjs_mount = "/peerjs";

  std::string log_level = "info";
  std::string log_file;  // empty = console only
};

enum class ConfigStatus {
  Ok,
  ShowHelp,
  ShowVersion,
  Error,
};

struct ConfigResult {
  ConfigStatus status{ConfigStatus::Ok};
  AppConfig config;
  std::string error;
};

// Environment lookup; returns nullopt for unset variables.
using EnvLookup = std::function<std::optional<std::string>(const std::string&)>;

// Reads std::getenv. Empty values count as unset.
std::optional<std::string> ProcessEnvironment(const std::string& name);

// Build the configuration from the environment, then apply --name=value
// overrides from args (args excludes the program name).
ConfigResult LoadConfig(const std::vector<std::string>& args, const EnvLookup& env = ProcessEnvironment);

std::string GetUsage(const std::string& program_name);

}  // namespace app
}  // namespace signalhub
