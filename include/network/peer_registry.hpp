// Copyright (c) 2025 The SignalHub developers
// Distributed under the MIT software license

#pragma once

/*
 PeerRegistry - presence map of currently connected signaling peers

 Purpose
 - Map each live PeerId to the connection that registered it
 - Track registration and last-activity times for liveness sweeping
 - Provide point-in-time id snapshots for discovery and status endpoints

 Invariants
 - At most one record per id at any time (Register fails on duplicates)
 - last_active_at never moves backwards (Touch takes the max)
 - A record exists only while its connection is open and registered; the relay
   removes it on close, the sweeper removes it after inactivity

 Ownership
 - Records own a shared reference to their connection. Sessions never keep a
   handle to another peer's connection; they look it up here on every forward,
   so an evicted peer can never be reached through a stale handle.

 Threading
 - All methods are thread-safe, guarded by a single mutex_
 - The lock covers only map operations: callers close connections and send
   frames after the call returns, never under the lock
*/

#include "network/peer_connection.hpp"

#include <chrono>
#include <cstddef>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace signalhub {
namespace network {

using PeerId = std::string;

struct PeerRecord {
  PeerId id;
  PeerConnectionPtr connection;
  std::chrono::steady_clock::time_point registered_at;
  std::chrono::steady_clock::time_point last_active_at;
};

enum class RegisterResult {
  Success,
  DuplicateId,      // id already held by a live peer
  InvalidId,        // empty, too long, or contains characters outside [A-Za-z0-9_-]
  CapacityReached,  // max_peers records already present
};

const char* RegisterResultToString(RegisterResult result);

class PeerRegistry {
public:
  static constexpr size_t DEFAULT_MAX_PEERS = 5000;
  static constexpr size_t MAX_ID_LENGTH = 64;

  explicit PeerRegistry(size_t max_peers = DEFAULT_MAX_PEERS);

  PeerRegistry(const PeerRegistry&) = delete;
  PeerRegistry& operator=(const PeerRegistry&) = delete;

  // Insert a record stamped with the current time.
  RegisterResult Register(const PeerId& id, PeerConnectionPtr connection);

  // Mark id as active now. Returns false if id is not registered.
  bool Touch(const PeerId& id);

  std::optional<PeerRecord> Lookup(const PeerId& id) const;

  // Remove and return the record. Removing an absent id yields nullopt.
  std::optional<PeerRecord> Remove(const PeerId& id);

  // Remove only if the record still belongs to owner. Used on transport close
  // so a stale session cannot remove a newer registration of the same id.
  std::optional<PeerRecord> RemoveIfOwner(const PeerId& id, const PeerConnection* owner);

  // Remove the record if now - last_active_at > threshold, checked under the
  // same lock as the removal so a concurrent Touch either lands first (and
  // saves the peer) or not at all.
  std::optional<PeerRecord> EvictIfIdle(const PeerId& id, std::chrono::steady_clock::time_point now,
                                        std::chrono::steady_clock::duration threshold);

  // Sorted snapshot of registered ids.
  std::vector<PeerId> ListIds() const;

  size_t Count() const;

  size_t max_peers() const { return max_peers_; }

  // Remove every record and return them (shutdown path).
  std::vector<PeerRecord> Clear();

  static bool IsValidId(std::string_view id);

  // Random UUID v4 string, the id format PeerJS clients expect.
  static PeerId GenerateId();

private:
  const size_t max_peers_;

  mutable std::mutex mutex_;
  std::map<PeerId, PeerRecord> peers_;
};

}  // namespace network
}  // namespace signalhub
