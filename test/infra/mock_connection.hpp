// Copyright (c) 2025 The SignalHub developers
// Distributed under the MIT software license

#pragma once

#include "network/peer_connection.hpp"

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace signalhub {
namespace test {

// In-memory PeerConnection that records every frame it is asked to send.
class MockConnection : public network::PeerConnection {
public:
  explicit MockConnection(std::string address = "127.0.0.1") : address_(std::move(address)), id_(next_id_++) {}

  bool send(const std::string& frame) override {
    if (!open_) {
      return false;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    if (queued_bytes_ + frame.size() > send_limit_) {
      return false;
    }
    queued_bytes_ += frame.size();
    sent_.push_back(frame);
    return true;
  }

  void close() override {
    if (open_.exchange(false)) {
      close_calls_++;
    }
  }

  bool is_open() const override { return open_; }
  std::string remote_address() const override { return address_; }
  uint64_t id() const override { return id_; }

  // Simulate the socket dropping underneath a live record: send() starts
  // failing but nobody has called close() yet.
  void drop() { open_ = false; }

  std::vector<std::string> sent() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sent_;
  }

  size_t sent_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sent_.size();
  }

  nlohmann::json last_json() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (sent_.empty()) {
      return nullptr;
    }
    return nlohmann::json::parse(sent_.back());
  }

  // Model a peer that stopped reading: once limit bytes are queued, send()
  // refuses further frames. clear() drains the queue.
  void set_send_limit(size_t limit) {
    std::lock_guard<std::mutex> lock(mutex_);
    send_limit_ = limit;
  }

  void clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    sent_.clear();
    queued_bytes_ = 0;
  }

  int close_calls() const { return close_calls_; }

private:
  const std::string address_;
  const uint64_t id_;
  static inline std::atomic<uint64_t> next_id_{1};

  std::atomic<bool> open_{true};
  std::atomic<int> close_calls_{0};

  mutable std::mutex mutex_;
  std::vector<std::string> sent_;
  size_t queued_bytes_{0};
  size_t send_limit_{SIZE_MAX};
};

inline std::shared_ptr<MockConnection> MakeMockConnection(std::string address = "127.0.0.1") {
  return std::make_shared<MockConnection>(std::move(address));
}

}  // namespace test
}  // namespace signalhub
