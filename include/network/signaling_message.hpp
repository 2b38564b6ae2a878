// Copyright (c) 2025 The SignalHub developers
// Distributed under the MIT software license

#pragma once

#include "network/peer_registry.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace signalhub {
namespace network {

// Wire dialect spoken by one session, fixed at upgrade time.
//
// Native:
//   client -> server  {"type":"signal","target":"<id>","payload":<any>}
//                     {"type":"control","payload":{"action":"heartbeat"|"discover"|"leave"}}
//   server -> client  {"type":"signal","source":"<id>","payload":<any>}
//                     {"type":"control","payload":{"event":"open"|"peers"|"peer-unavailable"|"error",...}}
//
// PeerJs (compatible with the PeerJS browser client and peerjs-server):
//   client -> server  {"type":"OFFER"|"ANSWER"|"CANDIDATE"|"LEAVE"|"EXPIRE","dst":"<id>","payload":<any>}
//                     {"type":"HEARTBEAT"}
//   server -> client  the same message with "src" set, {"type":"OPEN"}, {"type":"EXPIRE",...},
//                     {"type":"ID-TAKEN",...}, {"type":"ERROR","payload":{"msg":...}}
enum class Dialect {
  Native,
  PeerJs,
};

enum class FrameKind {
  Signal,
  Control,
};

enum class ControlAction {
  None,
  Heartbeat,
  Discover,
  Leave,
};

// Routing envelope of one inbound frame. Only the routing fields are decoded;
// forwarded bytes are sliced out of the original text and never re-encoded.
//
// raw holds, for a native signal, the text of the "payload" value. For a
// PeerJs signal it holds every top-level member except "src", comma-joined,
// so the outbound message can be rebuilt with the sender's id in front.
struct Envelope {
  FrameKind kind{FrameKind::Signal};
  std::string type;
  std::optional<PeerId> target;
  ControlAction action{ControlAction::None};
  std::string raw;
};

struct ParseResult {
  std::optional<Envelope> envelope;
  std::string error;  // set when envelope is empty

  explicit operator bool() const { return envelope.has_value(); }
};

ParseResult ParseFrame(std::string_view text, Dialect dialect);

// Error taxonomy surfaced to clients.
enum class SignalError {
  DuplicateIdentity,
  InvalidId,
  ServerFull,
  MalformedFrame,
  DiscoveryDisabled,
  InvalidKey,
};

const char* SignalErrorCode(SignalError error);

namespace frames {

// Registration acknowledgement carrying the (possibly server-generated) id.
std::string Open(Dialect dialect, const PeerId& id);

// Frame delivered to the target of a signal.
std::string Relayed(Dialect dialect, const PeerId& source, const Envelope& envelope);

// Notice to a sender whose target is not registered.
std::string PeerUnavailable(Dialect dialect, const PeerId& source, const PeerId& target);

std::string Error(Dialect dialect, SignalError error, std::string_view message);

// Discovery answer (native dialect only; PeerJS clients poll over HTTP).
std::string PeerList(const std::vector<PeerId>& ids);

}  // namespace frames

}  // namespace network
}  // namespace signalhub
