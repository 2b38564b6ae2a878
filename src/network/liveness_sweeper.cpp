// Copyright (c) 2025 The SignalHub developers
// Distributed under the MIT software license

#include "network/liveness_sweeper.hpp"

#include "util/logging.hpp"
#include "util/time.hpp"

#include <vector>

namespace signalhub {
namespace network {

LivenessSweeper::LivenessSweeper(boost::asio::io_context& io_context, PeerRegistry& registry, const Config& config)
    : io_context_(io_context), registry_(registry), config_(config) {}

LivenessSweeper::~LivenessSweeper() {
  Stop();
}

void LivenessSweeper::Start() {
  if (running_.exchange(true, std::memory_order_acq_rel)) {
    return;
  }
  timer_ = std::make_unique<boost::asio::steady_timer>(io_context_);
  LOG_NET_DEBUG("liveness sweeper started (interval {}s, threshold {}s)", config_.interval.count(),
                config_.inactivity_threshold.count());
  schedule_next_sweep();
}

void LivenessSweeper::Stop() {
  if (!running_.exchange(false, std::memory_order_acq_rel)) {
    return;
  }
  if (timer_) {
    timer_->cancel();
  }
}

void LivenessSweeper::schedule_next_sweep() {
  if (!running_.load(std::memory_order_acquire)) {
    return;
  }

  timer_->expires_after(config_.interval);
  timer_->async_wait([this](const boost::system::error_code& ec) {
    if (!ec && running_.load(std::memory_order_acquire)) {
      SweepOnce();
      schedule_next_sweep();
    }
  });
}

size_t LivenessSweeper::SweepOnce() {
  const auto now = util::GetSteadyTime();
  const std::vector<PeerId> ids = registry_.ListIds();

  std::vector<PeerRecord> evicted;
  for (const auto& id : ids) {
    // Ids that disappeared since the snapshot come back empty.
    if (auto record = registry_.EvictIfIdle(id, now, config_.inactivity_threshold)) {
      evicted.push_back(std::move(*record));
    }
  }

  for (const auto& record : evicted) {
    auto idle = std::chrono::duration_cast<std::chrono::seconds>(now - record.last_active_at);
    LOG_NET_DEBUG("evicting idle peer {} (idle {}s, conn {})", record.id, idle.count(), record.connection->id());
    if (record.connection->is_open()) {
      record.connection->close();
    }
  }

  if (!evicted.empty()) {
    total_evicted_.fetch_add(evicted.size(), std::memory_order_relaxed);
    LOG_NET_INFO("liveness sweep evicted {} of {} peers", evicted.size(), ids.size());
  }
  return evicted.size();
}

}  // namespace network
}  // namespace signalhub
