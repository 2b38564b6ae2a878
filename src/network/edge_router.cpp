// Copyright (c) 2025 The SignalHub developers
// Distributed under the MIT software license

#include "network/edge_router.hpp"

#include "util/logging.hpp"
#include "util/string_parsing.hpp"
#include "util/time.hpp"
#include "version.hpp"

#include <boost/beast/websocket/rfc6455.hpp>
#include <nlohmann/json.hpp>

namespace http = boost::beast::http;
using json = nlohmann::json;

namespace signalhub {
namespace network {

namespace {

constexpr std::string_view kContentJson = "application/json";
constexpr std::string_view kContentText = "text/plain; charset=utf-8";

std::string ToString(boost::beast::string_view s) {
  return std::string(s.data(), s.size());
}

std::string_view Trim(std::string_view s) {
  while (!s.empty() && (s.front() == ' ' || s.front() == '\t')) {
    s.remove_prefix(1);
  }
  while (!s.empty() && (s.back() == ' ' || s.back() == '\t')) {
    s.remove_suffix(1);
  }
  return s;
}

// "/peerjs/" -> "/peerjs", "/" -> "", "peerjs" -> "/peerjs"
std::string NormalizeMount(std::string mount) {
  if (mount.empty() || mount.front() != '/') {
    mount.insert(mount.begin(), '/');
  }
  while (!mount.empty() && mount.back() == '/') {
    mount.pop_back();
  }
  return mount;
}

}  // namespace

EdgeRouter::EdgeRouter(PeerRegistry& registry, util::RateLimiter& limiter, const Config& config)
    : registry_(registry), limiter_(limiter), config_(config), started_at_(util::GetSteadyTime()) {
  config_.peerjs_mount = NormalizeMount(config_.peerjs_mount);
}

std::string EdgeRouter::ClientAddress(const HttpRequest& req, const std::string& peer_address) const {
  if (config_.trust_proxy) {
    auto it = req.find("X-Forwarded-For");
    if (it != req.end()) {
      std::string_view value(it->value().data(), it->value().size());
      auto first = Trim(value.substr(0, value.find(',')));
      if (!first.empty()) {
        return std::string(first);
      }
    }
  }
  return peer_address;
}

void EdgeRouter::ApplyCommonHeaders(HttpResponse& res, const HttpRequest& req) {
  res.set(http::field::server, "signalhub/" + GetVersionString());
  res.set("X-Frame-Options", "DENY");
  res.set("X-Content-Type-Options", "nosniff");
  res.set("Referrer-Policy", "strict-origin-when-cross-origin");

  auto origin = req.find(http::field::origin);
  if (origin != req.end() && !origin->value().empty()) {
    res.set(http::field::access_control_allow_origin, origin->value());
    res.set(http::field::vary, "Origin");
  } else {
    res.set(http::field::access_control_allow_origin, "*");
  }
  res.set(http::field::access_control_allow_methods, "GET, POST, OPTIONS");
  res.set(http::field::access_control_allow_headers, "Content-Type, Accept, Origin, X-Requested-With");
  res.set(http::field::access_control_expose_headers, "Content-Length, Content-Type");
  res.set(http::field::access_control_allow_credentials, "true");
}

HttpResponse EdgeRouter::MakeResponse(const HttpRequest& req, http::status status, std::string_view content_type,
                                      std::string body) const {
  HttpResponse res{status, req.version()};
  ApplyCommonHeaders(res, req);
  if (!content_type.empty()) {
    res.set(http::field::content_type, boost::beast::string_view(content_type.data(), content_type.size()));
  }
  res.keep_alive(req.keep_alive());
  res.body() = std::move(body);
  res.prepare_payload();
  return res;
}

HttpResponse EdgeRouter::MakeJsonError(const HttpRequest& req, http::status status, std::string_view message) const {
  return MakeResponse(req, status, kContentJson, util::JsonError(message));
}

std::optional<EdgeRouter::QueryMap> EdgeRouter::ParseQuery(std::string_view query) {
  QueryMap params;
  while (!query.empty()) {
    auto amp = query.find('&');
    std::string_view pair = query.substr(0, amp);
    query = amp == std::string_view::npos ? std::string_view{} : query.substr(amp + 1);
    if (pair.empty()) {
      continue;
    }

    auto eq = pair.find('=');
    auto name = util::UrlDecode(pair.substr(0, eq));
    auto value = util::UrlDecode(eq == std::string_view::npos ? std::string_view{} : pair.substr(eq + 1));
    if (!name || !value) {
      return std::nullopt;
    }
    // First occurrence wins.
    params.emplace(std::move(*name), std::move(*value));
  }
  return params;
}

RouteDecision EdgeRouter::Route(const HttpRequest& req, const std::string& peer_address) {
  const std::string client = ClientAddress(req, peer_address);

  if (!limiter_.Allow(client)) {
    throttled_.fetch_add(1, std::memory_order_relaxed);
    LOG_HTTP_WARN_RL("rate limit exceeded for {} ({} {})", client, ToString(req.method_string()),
                     ToString(req.target()));
    return RouteDecision{MakeJsonError(req, http::status::too_many_requests, THROTTLED_MESSAGE), std::nullopt};
  }

  std::string_view target(req.target().data(), req.target().size());
  auto qmark = target.find('?');
  std::string_view path = target.substr(0, qmark);
  std::string_view query_string = qmark == std::string_view::npos ? std::string_view{} : target.substr(qmark + 1);
  while (path.size() > 1 && path.back() == '/') {
    path.remove_suffix(1);
  }

  LOG_HTTP_TRACE("{} {} from {}", ToString(req.method_string()), target, client);

  if (req.method() == http::verb::options) {
    return RouteDecision{MakeResponse(req, http::status::no_content, {}, {}), std::nullopt};
  }

  if (req.method() != http::verb::get) {
    return RouteDecision{MakeJsonError(req, http::status::not_found, "Not found"), std::nullopt};
  }

  auto query = ParseQuery(query_string);
  if (!query) {
    return RouteDecision{MakeJsonError(req, http::status::bad_request, "Malformed query string"), std::nullopt};
  }

  if (path == "/") {
    return RouteDecision{MakeResponse(req, http::status::ok, kContentText, "SignalHub signaling relay is running"),
                         std::nullopt};
  }

  if (path == "/health") {
    return RouteDecision{Health(req), std::nullopt};
  }

  if (path == "/peers") {
    if (!config_.allow_discovery) {
      return RouteDecision{MakeJsonError(req, http::status::forbidden, "Peer discovery is disabled"), std::nullopt};
    }
    auto ids = registry_.ListIds();
    json body{{"count", ids.size()}, {"peers", ids}};
    return RouteDecision{MakeResponse(req, http::status::ok, kContentJson, body.dump()), std::nullopt};
  }

  if (path == "/id") {
    return RouteDecision{MakeResponse(req, http::status::ok, kContentText, PeerRegistry::GenerateId()),
                         std::nullopt};
  }

  if (path == "/signal") {
    UpgradeTarget upgrade;
    upgrade.dialect = Dialect::Native;
    auto id = query->find("id");
    if (id != query->end() && !id->second.empty()) {
      upgrade.proposed_id = id->second;
    }
    return Upgrade(req, std::move(upgrade));
  }

  const std::string& mount = config_.peerjs_mount;
  if (path.size() > mount.size() && path.compare(0, mount.size(), mount) == 0 && path[mount.size()] == '/') {
    return RoutePeerJs(req, path.substr(mount.size()), *query);
  }

  return RouteDecision{MakeJsonError(req, http::status::not_found, "Not found"), std::nullopt};
}

RouteDecision EdgeRouter::RoutePeerJs(const HttpRequest& req, std::string_view rest, const QueryMap& query) {
  // rest begins with '/'
  if (rest == "/peerjs") {
    UpgradeTarget upgrade;
    upgrade.dialect = Dialect::PeerJs;

    auto key = query.find("key");
    auto id = query.find("id");
    auto token = query.find("token");
    if (key == query.end() || id == query.end() || token == query.end() || id->second.empty()) {
      upgrade.rejection = UpgradeTarget::Rejection{SignalError::InvalidId,
                                                   "No id, token, or key supplied to websocket server"};
    } else if (key->second != config_.peerjs_key) {
      upgrade.rejection = UpgradeTarget::Rejection{SignalError::InvalidKey, "Invalid key provided"};
    } else {
      upgrade.proposed_id = id->second;
    }
    return Upgrade(req, std::move(upgrade));
  }

  auto slash = rest.find('/', 1);
  if (slash != std::string_view::npos) {
    std::string_view key = rest.substr(1, slash - 1);
    std::string_view action = rest.substr(slash + 1);
    if (action == "id" || action == "peers") {
      if (key != config_.peerjs_key) {
        return RouteDecision{MakeJsonError(req, http::status::unauthorized, "Invalid key provided"), std::nullopt};
      }
      if (action == "id") {
        return RouteDecision{MakeResponse(req, http::status::ok, kContentText, PeerRegistry::GenerateId()),
                             std::nullopt};
      }
      if (!config_.allow_discovery) {
        return RouteDecision{MakeJsonError(req, http::status::unauthorized, "Peer discovery is disabled"),
                             std::nullopt};
      }
      json body = registry_.ListIds();
      return RouteDecision{MakeResponse(req, http::status::ok, kContentJson, body.dump()), std::nullopt};
    }
  }

  return RouteDecision{MakeJsonError(req, http::status::not_found, "Not found"), std::nullopt};
}

RouteDecision EdgeRouter::Upgrade(const HttpRequest& req, UpgradeTarget target) const {
  if (!boost::beast::websocket::is_upgrade(req)) {
    return RouteDecision{MakeJsonError(req, http::status::upgrade_required, "Expected WebSocket upgrade"),
                         std::nullopt};
  }
  return RouteDecision{std::nullopt, std::move(target)};
}

HttpResponse EdgeRouter::Health(const HttpRequest& req) const {
  auto uptime = std::chrono::duration_cast<std::chrono::seconds>(util::GetSteadyTime() - started_at_);
  json body{{"status", "ok"},
            {"peers", registry_.Count()},
            {"uptime_seconds", uptime.count()},
            {"version", GetVersionString()}};
  return MakeResponse(req, http::status::ok, kContentJson, body.dump());
}

}  // namespace network
}  // namespace signalhub
