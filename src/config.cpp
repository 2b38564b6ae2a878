// Copyright (c) 2025 The SignalHub developers
// Distributed under the MIT software license

#include "config.hpp"

#include "util/string_parsing.hpp"

#include <array>
#include <cstdlib>
#include <sstream>

namespace signalhub {
namespace app {

namespace {

// Applies one textual value to the config; returns an error message or "".
using Setter = std::string (*)(AppConfig&, const std::string&);

struct OptionSpec {
  const char* env;
  const char* flag;  // without leading "--"
  const char* help;
  Setter apply;
};

std::string SetSeconds(std::chrono::seconds& out, const std::string& value, int64_t min_value, int64_t max_value) {
  auto parsed = util::SafeParseInt(value, min_value, max_value);
  if (!parsed) {
    return "expected a number of seconds in [" + std::to_string(min_value) + ", " + std::to_string(max_value) + "]";
  }
  out = std::chrono::seconds(*parsed);
  return "";
}

template <typename T>
std::string SetInteger(T& out, const std::string& value, int64_t min_value, int64_t max_value) {
  auto parsed = util::SafeParseInt(value, min_value, max_value);
  if (!parsed) {
    return "expected an integer in [" + std::to_string(min_value) + ", " + std::to_string(max_value) + "]";
  }
  out = static_cast<T>(*parsed);
  return "";
}

std::string SetFlag(bool& out, const std::string& value) {
  auto parsed = util::SafeParseBool(value);
  if (!parsed) {
    return "expected true/false";
  }
  out = *parsed;
  return "";
}

const std::array<OptionSpec, 16> kOptions = {{
    {"PORT", "port", "Listen port (default: 3000, 0 = ephemeral)",
     [](AppConfig& c, const std::string& v) { return SetInteger(c.listen_port, v, 0, 65535); }},
    {"SIGNALHUB_BIND", "bind", "Listen address (default: 0.0.0.0)",
     [](AppConfig& c, const std::string& v) -> std::string {
       if (v.empty())
         return "expected an address";
       c.bind_address = v;
       return "";
     }},
    {"SIGNALHUB_IO_THREADS", "threads", "Network threads (default: 1)",
     [](AppConfig& c, const std::string& v) { return SetInteger(c.io_threads, v, 1, 64); }},
    {"SIGNALHUB_INACTIVITY_TIMEOUT", "inactivity-timeout", "Seconds of silence before a peer is evicted (default: 60)",
     [](AppConfig& c, const std::string& v) { return SetSeconds(c.inactivity_timeout, v, 1, 86400); }},
    {"SIGNALHUB_SWEEP_INTERVAL", "sweep-interval", "Seconds between liveness sweeps (default: 30)",
     [](AppConfig& c, const std::string& v) { return SetSeconds(c.sweep_interval, v, 1, 86400); }},
    {"SIGNALHUB_RATE_LIMIT", "rate-limit", "Requests per address per window (default: 100)",
     [](AppConfig& c, const std::string& v) { return SetInteger(c.rate_limit, v, 1, 1000000); }},
    {"SIGNALHUB_RATE_WINDOW", "rate-window", "Rate limit window in seconds (default: 3600)",
     [](AppConfig& c, const std::string& v) { return SetSeconds(c.rate_window, v, 1, 7 * 86400); }},
    {"SIGNALHUB_MAX_PEERS", "max-peers", "Maximum registered peers (default: 5000)",
     [](AppConfig& c, const std::string& v) { return SetInteger(c.max_peers, v, 1, 10000000); }},
    {"SIGNALHUB_MAX_FRAME", "max-frame", "Maximum WebSocket message size in bytes (default: 65536)",
     [](AppConfig& c, const std::string& v) { return SetInteger(c.max_frame_bytes, v, 256, 16 * 1024 * 1024); }},
    {"SIGNALHUB_DISCOVERY", "discovery", "Expose the list of connected peers (default: true)",
     [](AppConfig& c, const std::string& v) { return SetFlag(c.allow_discovery, v); }},
    {"SIGNALHUB_TRUST_PROXY", "trust-proxy", "Take client address from X-Forwarded-For (default: false)",
     [](AppConfig& c, const std::string& v) { return SetFlag(c.trust_proxy, v); }},
    {"SIGNALHUB_PEERJS_KEY", "peerjs-key", "PeerJS API key (default: peerjs)",
     [](AppConfig& c, const std::string& v) -> std::string {
       if (v.empty())
         return "expected a non-empty key";
       c.peerjs_key = v;
       return "";
     }},
    {"SIGNALHUB_PEERJS_MOUNT", "peerjs-mount", "Path prefix for PeerJS routes (default: /peerjs)",
     [](AppConfig& c, const std::string& v) -> std::string {
       if (v.empty() || v.front() != '/')
         return "expected a path starting with '/'";
       c.peerjs_mount = v;
       while (c.peerjs_mount.size() > 1 && c.peerjs_mount.back() == '/') {
         c.peerjs_mount.pop_back();
       }
       return "";
     }},
    {"SIGNALHUB_LOG_LEVEL", "loglevel", "trace, debug, info, warn, error, off (default: info)",
     [](AppConfig& c, const std::string& v) -> std::string {
       static const std::array<const char*, 7> levels = {"trace", "debug", "info", "warn", "error", "critical", "off"};
       for (const char* level : levels) {
         if (v == level) {
           c.log_level = v;
           return "";
         }
       }
       return "unknown log level";
     }},
    {"SIGNALHUB_LOG_FILE", "logfile", "Also write logs to this file",
     [](AppConfig& c, const std::string& v) -> std::string {
       c.log_file = v;
       return "";
     }},
    {"SIGNALHUB_SEND_QUEUE", "send-queue", "Per-connection outbound queue limit in bytes (default: 1048576)",
     [](AppConfig& c, const std::string& v) {
       return SetInteger(c.max_send_queue_bytes, v, 4096, 256 * 1024 * 1024);
     }},
}};

}  // namespace

std::optional<std::string> ProcessEnvironment(const std::string& name) {
  const char* value = std::getenv(name.c_str());
  if (value == nullptr || *value == '\0') {
    return std::nullopt;
  }
  return std::string(value);
}

ConfigResult LoadConfig(const std::vector<std::string>& args, const EnvLookup& env) {
  ConfigResult result;

  for (const auto& option : kOptions) {
    auto value = env(option.env);
    if (!value) {
      continue;
    }
    std::string error = option.apply(result.config, *value);
    if (!error.empty()) {
      result.status = ConfigStatus::Error;
      result.error = std::string("Invalid ") + option.env + "='" + *value + "': " + error;
      return result;
    }
  }

  for (const auto& arg : args) {
    if (arg == "--help" || arg == "-h") {
      result.status = ConfigStatus::ShowHelp;
      return result;
    }
    if (arg == "--version" || arg == "-v") {
      result.status = ConfigStatus::ShowVersion;
      return result;
    }
    if (!arg.starts_with("--")) {
      result.status = ConfigStatus::Error;
      result.error = "Unexpected argument: " + arg;
      return result;
    }

    auto eq = arg.find('=');
    std::string name = arg.substr(2, eq == std::string::npos ? std::string::npos : eq - 2);
    // A bare boolean flag ("--trust-proxy") means true.
    std::string value = eq == std::string::npos ? "true" : arg.substr(eq + 1);

    const OptionSpec* spec = nullptr;
    for (const auto& option : kOptions) {
      if (name == option.flag) {
        spec = &option;
        break;
      }
    }
    if (spec == nullptr) {
      result.status = ConfigStatus::Error;
      result.error = "Unknown option: --" + name;
      return result;
    }

    std::string error = spec->apply(result.config, value);
    if (!error.empty()) {
      result.status = ConfigStatus::Error;
      result.error = "Invalid --" + name + "='" + value + "': " + error;
      return result;
    }
  }

  return result;
}

std::string GetUsage(const std::string& program_name) {
  std::ostringstream out;
  out << "SignalHub - WebRTC signaling relay\n\n"
      << "Usage: " << program_name << " [options]\n\n"
      << "Options (environment variable in brackets):\n";
  for (const auto& option : kOptions) {
    std::string flag = std::string("  --") + option.flag + "=<value>";
    out << flag;
    if (flag.size() < 34) {
      out << std::string(34 - flag.size(), ' ');
    } else {
      out << "\n" << std::string(34, ' ');
    }
    out << option.help << " [" << option.env << "]\n";
  }
  out << "  --version                       Show version information\n"
      << "  --help                          Show this help message\n";
  return out.str();
}

}  // namespace app
}  // namespace signalhub
