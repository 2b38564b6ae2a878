// Copyright (c) 2025 The SignalHub developers
// Distributed under the MIT software license

#pragma once

#include "config.hpp"
#include "network/edge_router.hpp"
#include "network/http_server.hpp"
#include "network/liveness_sweeper.hpp"
#include "network/peer_registry.hpp"
#include "network/signaling_relay.hpp"
#include "util/rate_limiter.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>

namespace signalhub {
namespace app {

// Application - owns every component of signalhubd and drives its lifecycle.
//
//   initialize()        build registry, limiter, relay, router, server, sweeper
//   start()             bind the listener, start io threads and timers
//   wait_for_shutdown() block until SIGINT/SIGTERM or request_shutdown()
//   stop()              idempotent shutdown
//
// start() returning false (bind failure) is the only process-fatal error.
class Application {
public:
  explicit Application(const AppConfig& config);
  ~Application();

  Application(const Application&) = delete;
  Application& operator=(const Application&) = delete;

  bool initialize();
  bool start();
  void stop();
  void wait_for_shutdown();

  void request_shutdown() { shutdown_requested_ = true; }
  bool is_running() const { return running_.load(std::memory_order_acquire); }

  // Actual bound port (useful with listen_port = 0).
  uint16_t listening_port() const;

  const AppConfig& config() const { return config_; }
  network::PeerRegistry& registry() { return *registry_; }
  network::SignalingRelay& relay() { return *relay_; }
  util::RateLimiter& rate_limiter() { return *rate_limiter_; }

  static Application* instance();

  // Upper bound on waiting for peers to answer the close handshake at stop().
  static constexpr std::chrono::milliseconds SHUTDOWN_DRAIN_TIMEOUT{2000};

private:
  void shutdown();
  void setup_signal_handlers();
  static void signal_handler(int signal);

  void schedule_next_rate_reset();

  AppConfig config_;

  // Declared before io_context_ so they outlive handlers the io_context
  // destroys: a dropped connection handler still unregisters its peer.
  std::unique_ptr<network::PeerRegistry> registry_;
  std::unique_ptr<util::RateLimiter> rate_limiter_;
  std::unique_ptr<network::SignalingRelay> relay_;
  std::unique_ptr<network::EdgeRouter> router_;

  boost::asio::io_context io_context_;
  std::unique_ptr<boost::asio::executor_work_guard<boost::asio::io_context::executor_type>> work_guard_;
  std::vector<std::thread> io_threads_;

  std::unique_ptr<network::HttpServer> server_;
  std::unique_ptr<network::LivenessSweeper> sweeper_;
  std::unique_ptr<boost::asio::steady_timer> rate_reset_timer_;

  std::mutex lifecycle_mutex_;
  std::atomic<bool> running_{false};
  std::atomic<bool> shutdown_requested_{false};

  static Application* instance_;
};

}  // namespace app
}  // namespace signalhub
