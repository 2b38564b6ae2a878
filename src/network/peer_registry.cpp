// Copyright (c) 2025 The SignalHub developers
// Distributed under the MIT software license

#include "network/peer_registry.hpp"

#include "util/time.hpp"

#include <algorithm>
#include <cstdio>
#include <random>

namespace signalhub {
namespace network {

const char* RegisterResultToString(RegisterResult result) {
  switch (result) {
  case RegisterResult::Success:
    return "success";
  case RegisterResult::DuplicateId:
    return "duplicate-id";
  case RegisterResult::InvalidId:
    return "invalid-id";
  case RegisterResult::CapacityReached:
    return "capacity-reached";
  }
  return "unknown";
}

PeerRegistry::PeerRegistry(size_t max_peers) : max_peers_(max_peers) {}

RegisterResult PeerRegistry::Register(const PeerId& id, PeerConnectionPtr connection) {
  if (!IsValidId(id) || !connection) {
    return RegisterResult::InvalidId;
  }

  auto now = util::GetSteadyTime();

  std::lock_guard<std::mutex> lock(mutex_);
  if (peers_.count(id) != 0) {
    return RegisterResult::DuplicateId;
  }
  if (peers_.size() >= max_peers_) {
    return RegisterResult::CapacityReached;
  }

  peers_.emplace(id, PeerRecord{id, std::move(connection), now, now});
  return RegisterResult::Success;
}

bool PeerRegistry::Touch(const PeerId& id) {
  auto now = util::GetSteadyTime();

  std::lock_guard<std::mutex> lock(mutex_);
  auto it = peers_.find(id);
  if (it == peers_.end()) {
    return false;
  }
  it->second.last_active_at = std::max(it->second.last_active_at, now);
  return true;
}

std::optional<PeerRecord> PeerRegistry::Lookup(const PeerId& id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = peers_.find(id);
  if (it == peers_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::optional<PeerRecord> PeerRegistry::Remove(const PeerId& id) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = peers_.find(id);
  if (it == peers_.end()) {
    return std::nullopt;
  }
  PeerRecord record = std::move(it->second);
  peers_.erase(it);
  return record;
}

std::optional<PeerRecord> PeerRegistry::RemoveIfOwner(const PeerId& id, const PeerConnection* owner) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = peers_.find(id);
  if (it == peers_.end() || it->second.connection.get() != owner) {
    return std::nullopt;
  }
  PeerRecord record = std::move(it->second);
  peers_.erase(it);
  return record;
}

std::optional<PeerRecord> PeerRegistry::EvictIfIdle(const PeerId& id, std::chrono::steady_clock::time_point now,
                                                    std::chrono::steady_clock::duration threshold) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = peers_.find(id);
  if (it == peers_.end()) {
    return std::nullopt;
  }
  if (now - it->second.last_active_at <= threshold) {
    return std::nullopt;
  }
  PeerRecord record = std::move(it->second);
  peers_.erase(it);
  return record;
}

std::vector<PeerId> PeerRegistry::ListIds() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<PeerId> ids;
  ids.reserve(peers_.size());
  for (const auto& [id, record] : peers_) {
    ids.push_back(id);
  }
  return ids;
}

size_t PeerRegistry::Count() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return peers_.size();
}

std::vector<PeerRecord> PeerRegistry::Clear() {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<PeerRecord> records;
  records.reserve(peers_.size());
  for (auto& [id, record] : peers_) {
    records.push_back(std::move(record));
  }
  peers_.clear();
  return records;
}

bool PeerRegistry::IsValidId(std::string_view id) {
  if (id.empty() || id.size() > MAX_ID_LENGTH) {
    return false;
  }
  return std::all_of(id.begin(), id.end(), [](char c) {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') || c == '-' || c == '_';
  });
}

PeerId PeerRegistry::GenerateId() {
  thread_local std::mt19937_64 rng{std::random_device{}()};
  uint64_t hi = rng();
  uint64_t lo = rng();

  // RFC 4122 version 4, variant 1
  hi = (hi & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL;
  lo = (lo & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;

  char buf[37];
  std::snprintf(buf, sizeof(buf), "%08x-%04x-%04x-%04x-%012llx", static_cast<unsigned>(hi >> 32),
                static_cast<unsigned>((hi >> 16) & 0xFFFF), static_cast<unsigned>(hi & 0xFFFF),
                static_cast<unsigned>(lo >> 48), static_cast<unsigned long long>(lo & 0xFFFFFFFFFFFFULL));
  return PeerId(buf);
}

}  // namespace network
}  // namespace signalhub
