// Copyright (c) 2025 The SignalHub developers
// Distributed under the MIT software license

#include "network/signaling_relay.hpp"

#include "network/relay_session.hpp"
#include "util/logging.hpp"

namespace signalhub {
namespace network {

SignalingRelay::SignalingRelay(PeerRegistry& registry, const Config& config)
    : registry_(registry), config_(config) {}

std::shared_ptr<RelaySession> SignalingRelay::CreateSession(PeerConnectionPtr connection, Dialect dialect) {
  if (!connection) {
    return nullptr;
  }
  return std::make_shared<RelaySession>(*this, connection, dialect);
}

DeliveryResult SignalingRelay::Deliver(const PeerId& target, const std::string& frame) {
  auto record = registry_.Lookup(target);
  if (!record) {
    undeliverable_.fetch_add(1, std::memory_order_relaxed);
    return DeliveryResult::UnknownTarget;
  }

  // The target may have closed between Lookup and send; drop its record so no
  // further frames are routed to the dead handle.
  if (!record->connection->send(frame)) {
    if (registry_.RemoveIfOwner(target, record->connection.get())) {
      LOG_RELAY_DEBUG("removed peer {} after failed delivery (conn {})", target, record->connection->id());
    }
    record->connection->close();
    undeliverable_.fetch_add(1, std::memory_order_relaxed);
    return DeliveryResult::TargetGone;
  }

  frames_relayed_.fetch_add(1, std::memory_order_relaxed);
  return DeliveryResult::Delivered;
}

SignalingRelay::Stats SignalingRelay::GetStats() const {
  Stats stats;
  stats.sessions_opened = sessions_opened_.load(std::memory_order_relaxed);
  stats.registrations_rejected = registrations_rejected_.load(std::memory_order_relaxed);
  stats.frames_relayed = frames_relayed_.load(std::memory_order_relaxed);
  stats.undeliverable = undeliverable_.load(std::memory_order_relaxed);
  stats.malformed_frames = malformed_frames_.load(std::memory_order_relaxed);
  return stats;
}

}  // namespace network
}  // namespace signalhub
