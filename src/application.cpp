// Copyright (c) 2025 The SignalHub developers
// Distributed under the MIT software license

#include "application.hpp"

#include "util/logging.hpp"
#include "version.hpp"

#include <boost/asio/post.hpp>

#include <algorithm>
#include <chrono>
#include <csignal>
#include <future>
#include <iostream>
#include <unistd.h>  // For write(), STDOUT_FILENO (async-signal-safe)

namespace signalhub {
namespace app {

// Static instance for signal handling
Application* Application::instance_ = nullptr;

Application::Application(const AppConfig& config) : config_(config) {
  instance_ = this;
}

Application::~Application() {
  stop();
  instance_ = nullptr;
}

Application* Application::instance() {
  return instance_;
}

bool Application::initialize() {
  std::cout << GetFullVersionString() << "\n" << std::flush;

  LOG_INFO("Initializing SignalHub...");

  if (config_.io_threads == 0) {
    LOG_ERROR("io_threads must be at least 1");
    return false;
  }

  registry_ = std::make_unique<network::PeerRegistry>(config_.max_peers);
  rate_limiter_ = std::make_unique<util::RateLimiter>(config_.rate_limit, config_.rate_window);

  network::SignalingRelay::Config relay_config;
  relay_config.allow_discovery = config_.allow_discovery;
  relay_config.max_frame_bytes = config_.max_frame_bytes;
  relay_ = std::make_unique<network::SignalingRelay>(*registry_, relay_config);

  network::EdgeRouter::Config router_config;
  router_config.allow_discovery = config_.allow_discovery;
  router_config.trust_proxy = config_.trust_proxy;
  router_config.peerjs_key = config_.peerjs_key;
  router_config.peerjs_mount = config_.peerjs_mount;
  router_ = std::make_unique<network::EdgeRouter>(*registry_, *rate_limiter_, router_config);

  network::WebSocketConnection::Options ws_options;
  ws_options.max_frame_bytes = config_.max_frame_bytes;
  ws_options.max_send_queue_bytes = config_.max_send_queue_bytes;
  server_ = std::make_unique<network::HttpServer>(io_context_, *router_, *relay_, ws_options);

  network::LivenessSweeper::Config sweeper_config;
  sweeper_config.interval = config_.sweep_interval;
  sweeper_config.inactivity_threshold = config_.inactivity_timeout;
  sweeper_ = std::make_unique<network::LivenessSweeper>(io_context_, *registry_, sweeper_config);

  rate_reset_timer_ = std::make_unique<boost::asio::steady_timer>(io_context_);

  LOG_INFO("Initialization complete (max peers {}, rate limit {}/{}s, inactivity timeout {}s)", config_.max_peers,
           config_.rate_limit, config_.rate_window.count(), config_.inactivity_timeout.count());
  return true;
}

bool Application::start() {
  std::lock_guard<std::mutex> lock(lifecycle_mutex_);

  if (running_) {
    LOG_ERROR("Application already running");
    return false;
  }
  if (!server_) {
    LOG_ERROR("Application not initialized");
    return false;
  }

  LOG_INFO("Starting SignalHub...");

  setup_signal_handlers();

  if (!server_->listen(config_.bind_address, config_.listen_port)) {
    LOG_ERROR("Failed to bind {}:{}", config_.bind_address, config_.listen_port);
    return false;
  }

  running_ = true;

  work_guard_ = std::make_unique<boost::asio::executor_work_guard<boost::asio::io_context::executor_type>>(
      boost::asio::make_work_guard(io_context_));
  for (size_t i = 0; i < config_.io_threads; ++i) {
    io_threads_.emplace_back([this]() { io_context_.run(); });
  }

  sweeper_->Start();
  schedule_next_rate_reset();

  LOG_INFO("SignalHub started on {}:{} ({} io threads)", config_.bind_address, server_->listening_port(),
           config_.io_threads);
  LOG_INFO("PeerJS endpoint: {}/peerjs (key '{}')", config_.peerjs_mount, config_.peerjs_key);
  LOG_INFO("Press Ctrl+C to stop");
  return true;
}

void Application::stop() {
  if (!running_) {
    return;
  }
  shutdown();
}

void Application::wait_for_shutdown() {
  while (running_ && !shutdown_requested_) {
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
  }

  if (shutdown_requested_) {
    shutdown();
  }
}

uint16_t Application::listening_port() const {
  return server_ ? server_->listening_port() : 0;
}

void Application::shutdown() {
  std::lock_guard<std::mutex> lock(lifecycle_mutex_);

  if (!running_.exchange(false)) {
    return;
  }

  LOG_INFO("Shutting down SignalHub...");

  // Stop accepting first so no new sessions race the registry drain. The
  // acceptor and timers are only touched from the io threads.
  std::promise<void> stopped;
  auto stopped_future = stopped.get_future();
  boost::asio::post(io_context_, [this, &stopped]() {
    server_->stop_listening();
    sweeper_->Stop();
    rate_reset_timer_->cancel();
    stopped.set_value();
  });
  stopped_future.wait();

  auto records = registry_->Clear();
  LOG_INFO("Closing {} peer connections", records.size());
  for (const auto& record : records) {
    record.connection->close();
  }

  // Close handshakes run on the io threads; wait for them, bounded.
  auto open_count = [&records]() {
    return std::count_if(records.begin(), records.end(),
                         [](const network::PeerRecord& record) { return record.connection->is_open(); });
  };
  const auto drain_deadline = std::chrono::steady_clock::now() + SHUTDOWN_DRAIN_TIMEOUT;
  while (open_count() > 0 && std::chrono::steady_clock::now() < drain_deadline) {
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }
  if (auto remaining = open_count(); remaining > 0) {
    LOG_WARN("{} connections did not finish closing within {}ms, dropping them", remaining,
             SHUTDOWN_DRAIN_TIMEOUT.count());
  }

  work_guard_.reset();
  io_context_.stop();
  for (auto& thread : io_threads_) {
    if (thread.joinable()) {
      thread.join();
    }
  }
  io_threads_.clear();

  auto stats = relay_->GetStats();
  LOG_INFO("Relay stats: {} sessions, {} frames relayed, {} undeliverable, {} rejected registrations",
           stats.sessions_opened, stats.frames_relayed, stats.undeliverable, stats.registrations_rejected);
  LOG_INFO("Shutdown complete");
}

void Application::schedule_next_rate_reset() {
  if (!running_.load(std::memory_order_acquire)) {
    return;
  }

  rate_reset_timer_->expires_after(config_.rate_window);
  rate_reset_timer_->async_wait([this](const boost::system::error_code& ec) {
    if (!ec && running_.load(std::memory_order_acquire)) {
      LOG_HTTP_DEBUG("rate limit window elapsed, clearing {} counters", rate_limiter_->GetTrackedKeys());
      rate_limiter_->Reset();
      schedule_next_rate_reset();
    }
  });
}

void Application::setup_signal_handlers() {
  std::signal(SIGINT, Application::signal_handler);
  std::signal(SIGTERM, Application::signal_handler);
  // Ignore SIGPIPE to prevent crashes on broken network connections
  std::signal(SIGPIPE, SIG_IGN);
}

void Application::signal_handler(int /*signal*/) {
  if (instance_) {
    // write() is async-signal-safe; nothing to do if it fails
    static const char msg[] = "\nReceived signal\n";
    (void)write(STDOUT_FILENO, msg, sizeof(msg) - 1);

    instance_->shutdown_requested_ = true;
  }
}

}  // namespace app
}  // namespace signalhub
