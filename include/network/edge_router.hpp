// Copyright (c) 2025 The SignalHub developers
// Distributed under the MIT software license

#pragma once

/*
 EdgeRouter - stateless HTTP routing in front of the relay

 Every request is first counted against the per-address RateLimiter; over
 quota it is answered with 429 before the registry or relay is touched.
 Surviving requests are either answered directly (status, discovery, id
 allocation, CORS preflight) or turned into an UpgradeTarget that tells the
 server to accept the WebSocket and open a relay session in a given dialect.

 The router never mutates the registry. It holds no socket state, so it is
 driven synchronously by HttpServer and directly by unit tests.

 Routes (mount = peerjs_mount, key = peerjs_key):
   GET  /                          plain-text banner
   GET  /health                    {status, peers, uptime_seconds, version}
   GET  /peers                     {count, peers[]}          403 if discovery off
   GET  /id                        generated id (text)
   GET  /signal[?id=X]             WebSocket upgrade, native dialect
   GET  {mount}/{key}/id           generated id (text)
   GET  {mount}/{key}/peers        [ids...]                  401 if discovery off
   GET  {mount}/peerjs?key&id&token WebSocket upgrade, PeerJS dialect
   OPTIONS *                       204 preflight
*/

#include "network/peer_registry.hpp"
#include "network/signaling_message.hpp"
#include "util/rate_limiter.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>

#include <boost/beast/http.hpp>

namespace signalhub {
namespace network {

using HttpRequest = boost::beast::http::request<boost::beast::http::string_body>;
using HttpResponse = boost::beast::http::response<boost::beast::http::string_body>;

// Accept the upgrade and open a session in this dialect. When rejection is
// set, the session must report it over the socket and close; PeerJS clients
// only surface errors that arrive as frames.
struct UpgradeTarget {
  struct Rejection {
    SignalError error;
    std::string message;
  };

  Dialect dialect{Dialect::Native};
  std::optional<PeerId> proposed_id;
  std::optional<Rejection> rejection;
};

// Exactly one of response / upgrade is set.
struct RouteDecision {
  std::optional<HttpResponse> response;
  std::optional<UpgradeTarget> upgrade;
};

class EdgeRouter {
public:
  struct Config {
    bool allow_discovery{true};
    bool trust_proxy{false};
    std::string peerjs_key{"peerjs"};
    std::string peerjs_mount{"/peerjs"};
  };

  static constexpr const char* THROTTLED_MESSAGE = "Too many requests. Please try again later.";

  EdgeRouter(PeerRegistry& registry, util::RateLimiter& limiter, const Config& config);

  EdgeRouter(const EdgeRouter&) = delete;
  EdgeRouter& operator=(const EdgeRouter&) = delete;

  // peer_address is the socket's remote address.
  RouteDecision Route(const HttpRequest& req, const std::string& peer_address);

  // Address the rate limit is keyed on: the first X-Forwarded-For entry when
  // trust_proxy is on and the header is present, otherwise peer_address.
  std::string ClientAddress(const HttpRequest& req, const std::string& peer_address) const;

  // Security and CORS headers added to every response.
  static void ApplyCommonHeaders(HttpResponse& res, const HttpRequest& req);

  uint64_t GetThrottledCount() const { return throttled_.load(std::memory_order_relaxed); }

private:
  using QueryMap = std::map<std::string, std::string>;

  HttpResponse MakeResponse(const HttpRequest& req, boost::beast::http::status status, std::string_view content_type,
                            std::string body) const;
  HttpResponse MakeJsonError(const HttpRequest& req, boost::beast::http::status status,
                             std::string_view message) const;

  RouteDecision RoutePeerJs(const HttpRequest& req, std::string_view rest, const QueryMap& query);
  RouteDecision Upgrade(const HttpRequest& req, UpgradeTarget target) const;

  HttpResponse Health(const HttpRequest& req) const;

  static std::optional<QueryMap> ParseQuery(std::string_view query);

  PeerRegistry& registry_;
  util::RateLimiter& limiter_;
  Config config_;
  const std::chrono::steady_clock::time_point started_at_;

  std::atomic<uint64_t> throttled_{0};
};

}  // namespace network
}  // namespace signalhub
