// Copyright (c) 2025 The SignalHub developers
// Distributed under the MIT software license

#pragma once

#include "network/peer_registry.hpp"

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>

#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>

namespace signalhub {
namespace network {

// LivenessSweeper - periodic eviction of silent peers.
//
// Runs on its own steady_timer, independent of connection traffic. Each pass
// snapshots the registry ids and evicts them one key at a time, so the registry
// lock is never held across the whole pass. Evicted connections are closed
// after the record is gone.
class LivenessSweeper {
public:
  struct Config {
    std::chrono::seconds interval{30};
    std::chrono::seconds inactivity_threshold{60};
  };

  LivenessSweeper(boost::asio::io_context& io_context, PeerRegistry& registry, const Config& config);
  ~LivenessSweeper();

  LivenessSweeper(const LivenessSweeper&) = delete;
  LivenessSweeper& operator=(const LivenessSweeper&) = delete;

  void Start();
  void Stop();

  // One eviction pass at the current (mockable) time. Returns evicted count.
  size_t SweepOnce();

  uint64_t GetTotalEvicted() const { return total_evicted_.load(std::memory_order_relaxed); }
  bool IsRunning() const { return running_.load(std::memory_order_acquire); }

private:
  void schedule_next_sweep();

  boost::asio::io_context& io_context_;
  PeerRegistry& registry_;
  const Config config_;

  std::unique_ptr<boost::asio::steady_timer> timer_;
  std::atomic<bool> running_{false};
  std::atomic<uint64_t> total_evicted_{0};
};

}  // namespace network
}  // namespace signalhub
