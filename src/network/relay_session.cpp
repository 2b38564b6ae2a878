// Copyright (c) 2025 The SignalHub developers
// Distributed under the MIT software license

#include "network/relay_session.hpp"

#include "network/signaling_relay.hpp"
#include "util/logging.hpp"

namespace signalhub {
namespace network {

const char* SessionStateToString(SessionState state) {
  switch (state) {
  case SessionState::Connecting:
    return "connecting";
  case SessionState::Registered:
    return "registered";
  case SessionState::Closed:
    return "closed";
  }
  return "unknown";
}

RelaySession::RelaySession(SignalingRelay& relay, const PeerConnectionPtr& connection, Dialect dialect)
    : relay_(relay), connection_(connection), owner_(connection.get()), dialect_(dialect) {
  relay_.sessions_opened_.fetch_add(1, std::memory_order_relaxed);
}

RelaySession::~RelaySession() {
  // Connection torn down without a close event: still release the id.
  if (state_.exchange(SessionState::Closed) == SessionState::Registered) {
    Unregister();
  }
}

bool RelaySession::Open(const std::optional<PeerId>& proposed_id) {
  if (state() != SessionState::Connecting) {
    return false;
  }

  auto connection = connection_.lock();
  if (!connection || !connection->is_open()) {
    state_.store(SessionState::Closed, std::memory_order_release);
    return false;
  }

  PeerId id = (proposed_id && !proposed_id->empty()) ? *proposed_id : PeerRegistry::GenerateId();

  RegisterResult result = relay_.registry().Register(id, connection);
  if (result != RegisterResult::Success) {
    relay_.registrations_rejected_.fetch_add(1, std::memory_order_relaxed);
    LOG_RELAY_DEBUG("conn {} from {} refused id '{}': {}", connection->id(), connection->remote_address(), id,
                    RegisterResultToString(result));
  }

  switch (result) {
  case RegisterResult::Success:
    id_ = id;
    state_.store(SessionState::Registered, std::memory_order_release);
    LOG_RELAY_DEBUG("peer {} registered (conn {}, {})", id_, connection->id(), connection->remote_address());
    Send(frames::Open(dialect_, id_));
    return true;

  case RegisterResult::DuplicateId:
    Fail(SignalError::DuplicateIdentity, "ID is taken");
    return false;

  case RegisterResult::InvalidId:
    Fail(SignalError::InvalidId, "Invalid id");
    return false;

  case RegisterResult::CapacityReached:
    LOG_RELAY_WARN_RL("registry full ({} peers), turning connections away", relay_.registry().max_peers());
    Fail(SignalError::ServerFull, "Server has reached its concurrent user limit");
    return false;
  }

  Fail(SignalError::InvalidId, "Registration failed");
  return false;
}

void RelaySession::HandleFrame(std::string_view text) {
  if (state() != SessionState::Registered) {
    return;
  }

  // Every inbound frame counts as activity. A failed touch means the sweeper
  // already evicted this peer.
  if (!relay_.registry().Touch(id_)) {
    LOG_RELAY_DEBUG("peer {} no longer registered, closing session", id_);
    Close();
    return;
  }

  if (text.size() > relay_.config().max_frame_bytes) {
    relay_.malformed_frames_.fetch_add(1, std::memory_order_relaxed);
    Send(frames::Error(dialect_, SignalError::MalformedFrame, "Frame exceeds size limit"));
    return;
  }

  ParseResult parsed = ParseFrame(text, dialect_);
  if (!parsed) {
    relay_.malformed_frames_.fetch_add(1, std::memory_order_relaxed);
    LOG_RELAY_WARN_RL("malformed frame from peer {}: {}", id_, parsed.error);
    Send(frames::Error(dialect_, SignalError::MalformedFrame, parsed.error));
    return;
  }

  if (parsed.envelope->kind == FrameKind::Signal) {
    HandleSignal(*parsed.envelope);
  } else {
    HandleControl(*parsed.envelope);
  }
}

void RelaySession::HandleSignal(const Envelope& envelope) {
  const PeerId& target = *envelope.target;

  DeliveryResult result = relay_.Deliver(target, frames::Relayed(dialect_, id_, envelope));
  if (result == DeliveryResult::Delivered) {
    LOG_RELAY_TRACE("{} {} -> {}", envelope.type, id_, target);
    return;
  }

  LOG_RELAY_DEBUG("{} from {} undeliverable: {} is {}", envelope.type, id_, target,
                  result == DeliveryResult::UnknownTarget ? "unknown" : "gone");

  // PeerJS clients announce their own departure; nobody to notify.
  if (dialect_ == Dialect::PeerJs && (envelope.type == "LEAVE" || envelope.type == "EXPIRE")) {
    return;
  }
  Send(frames::PeerUnavailable(dialect_, id_, target));
}

void RelaySession::HandleControl(const Envelope& envelope) {
  switch (envelope.action) {
  case ControlAction::Heartbeat:
  case ControlAction::None:
    break;

  case ControlAction::Discover:
    if (!relay_.config().allow_discovery) {
      Send(frames::Error(dialect_, SignalError::DiscoveryDisabled, "Peer discovery is disabled"));
      break;
    }
    Send(frames::PeerList(relay_.registry().ListIds()));
    break;

  case ControlAction::Leave:
    LOG_RELAY_DEBUG("peer {} left", id_);
    Close();
    break;
  }
}

void RelaySession::Close() {
  SessionState previous = state_.exchange(SessionState::Closed, std::memory_order_acq_rel);
  if (previous == SessionState::Closed) {
    return;
  }
  if (previous == SessionState::Registered) {
    Unregister();
  }
  if (auto connection = connection_.lock()) {
    connection->close();
  }
}

void RelaySession::Fail(SignalError error, std::string_view message) {
  if (state() == SessionState::Closed) {
    return;
  }
  Send(frames::Error(dialect_, error, message));
  Close();
}

void RelaySession::Send(const std::string& frame) {
  auto connection = connection_.lock();
  if (!connection || !connection->send(frame)) {
    LOG_RELAY_TRACE("dropping frame for closed session {}", id_);
  }
}

void RelaySession::Unregister() {
  if (relay_.registry().RemoveIfOwner(id_, owner_)) {
    LOG_RELAY_DEBUG("peer {} unregistered", id_);
  }
}

}  // namespace network
}  // namespace signalhub
