// Copyright (c) 2025 The SignalHub developers
// Distributed under the MIT software license

#pragma once

#include "network/peer_connection.hpp"
#include "network/peer_registry.hpp"
#include "network/signaling_message.hpp"

#include <atomic>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace signalhub {
namespace network {

class SignalingRelay;

enum class SessionState {
  Connecting,
  Registered,
  Closed,
};

const char* SessionStateToString(SessionState state);

// RelaySession - per-connection signaling state machine.
//
//   Connecting --Open() ok--> Registered --Close()/leave--> Closed
//        \--Open() rejected / Fail()-------------------------^
//
// Driven by the owning transport: Open() once after the upgrade, HandleFrame()
// per inbound text message, Close() on any transport close or error. The
// transport serializes these calls. Close() and Fail() are idempotent.
//
// The session keeps only a weak reference to its connection; the connection
// owns the session.
class RelaySession {
public:
  RelaySession(SignalingRelay& relay, const PeerConnectionPtr& connection, Dialect dialect);
  ~RelaySession();

  RelaySession(const RelaySession&) = delete;
  RelaySession& operator=(const RelaySession&) = delete;

  // Register proposed_id, or a generated id when none is given. On success the
  // open acknowledgement is sent; on rejection an error frame is sent and the
  // connection closed. Returns true when registered.
  bool Open(const std::optional<PeerId>& proposed_id);

  void HandleFrame(std::string_view text);

  // Unregister (if registered) and close the connection.
  void Close();

  // Report error to the client, then behave like Close().
  void Fail(SignalError error, std::string_view message);

  SessionState state() const { return state_.load(std::memory_order_acquire); }
  Dialect dialect() const { return dialect_; }

  // Empty until Open() succeeds.
  const PeerId& id() const { return id_; }

private:
  void Send(const std::string& frame);
  void HandleSignal(const Envelope& envelope);
  void HandleControl(const Envelope& envelope);
  void Unregister();

  SignalingRelay& relay_;
  std::weak_ptr<PeerConnection> connection_;
  const PeerConnection* owner_;  // identity for RemoveIfOwner, never dereferenced
  const Dialect dialect_;

  std::atomic<SessionState> state_{SessionState::Connecting};
  PeerId id_;
};

}  // namespace network
}  // namespace signalhub
