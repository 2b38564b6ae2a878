// Copyright (c) 2025 The SignalHub developers
// Distributed under the MIT software license

#pragma once

/*
 SignalingRelay - identity-checked delivery between registered peers

 Purpose
 - Create one RelaySession per upgraded connection
 - Resolve a target id through the PeerRegistry on every forward and write the
   frame to whatever connection currently holds that id
 - Keep relay-wide counters for the status endpoints

 Delivery
 - Best effort, no queueing: an unknown target is reported to the sender, a
   target whose connection refuses the write is removed from the registry and
   closed (TransportFailure)
 - Per sender->receiver order follows the transport's per-connection outbox

 Lifetime
 - Owned by Application; must outlive every session it creates (sessions hold a
   reference back to it). Application joins the io threads before destroying it.
*/

#include "network/peer_connection.hpp"
#include "network/peer_registry.hpp"
#include "network/signaling_message.hpp"

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>

namespace signalhub {
namespace network {

class RelaySession;

enum class DeliveryResult {
  Delivered,
  UnknownTarget,  // no record for the target id
  TargetGone,     // record found but its connection was already closed
};

class SignalingRelay {
public:
  struct Config {
    bool allow_discovery{true};
    size_t max_frame_bytes{64 * 1024};
  };

  struct Stats {
    uint64_t sessions_opened{0};
    uint64_t registrations_rejected{0};
    uint64_t frames_relayed{0};
    uint64_t undeliverable{0};
    uint64_t malformed_frames{0};
  };

  SignalingRelay(PeerRegistry& registry, const Config& config);

  SignalingRelay(const SignalingRelay&) = delete;
  SignalingRelay& operator=(const SignalingRelay&) = delete;

  std::shared_ptr<RelaySession> CreateSession(PeerConnectionPtr connection, Dialect dialect);

  // Write frame to the connection currently registered as target.
  DeliveryResult Deliver(const PeerId& target, const std::string& frame);

  PeerRegistry& registry() { return registry_; }
  const Config& config() const { return config_; }

  Stats GetStats() const;

private:
  friend class RelaySession;

  PeerRegistry& registry_;
  const Config config_;

  std::atomic<uint64_t> sessions_opened_{0};
  std::atomic<uint64_t> registrations_rejected_{0};
  std::atomic<uint64_t> frames_relayed_{0};
  std::atomic<uint64_t> undeliverable_{0};
  std::atomic<uint64_t> malformed_frames_{0};
};

}  // namespace network
}  // namespace signalhub
