// Copyright (c) 2025 The SignalHub developers
// Distributed under the MIT software license

#pragma once

#include <cstdint>
#include <memory>
#include <string>

namespace signalhub {
namespace network {

// PeerConnection - transport-level channel used to push frames to one peer.
// Implemented by WebSocketConnection in production and by in-memory fakes in tests.
//
// All methods may be called from any thread.
class PeerConnection {
public:
  virtual ~PeerConnection() = default;

  // Queue one text frame for delivery. Returns false only if the connection
  // was already closed at call time; a true return is fire-and-forget (a later
  // write failure closes the connection).
  virtual bool send(const std::string& frame) = 0;

  // Close gracefully after already-queued frames are flushed. Idempotent.
  virtual void close() = 0;

  virtual bool is_open() const = 0;

  // Client address as seen by the edge (socket peer or X-Forwarded-For).
  virtual std::string remote_address() const = 0;

  // Process-unique connection number, for logs.
  virtual uint64_t id() const = 0;
};

using PeerConnectionPtr = std::shared_ptr<PeerConnection>;

}  // namespace network
}  // namespace signalhub
