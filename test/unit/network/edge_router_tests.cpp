// Copyright (c) 2025 The SignalHub developers
// Distributed under the MIT software license
// Unit tests for EdgeRouter request routing

#include <catch2/catch.hpp>

#include "infra/mock_connection.hpp"
#include "network/edge_router.hpp"
#include "network/peer_registry.hpp"
#include "util/rate_limiter.hpp"
#include "util/time.hpp"

#include <nlohmann/json.hpp>

using namespace signalhub::network;
using signalhub::test::MakeMockConnection;
using signalhub::util::RateLimiter;
using json = nlohmann::json;
using namespace std::chrono_literals;
namespace http = boost::beast::http;

namespace {

HttpRequest Get(const std::string& target) {
    HttpRequest req{http::verb::get, target, 11};
    req.set(http::field::host, "localhost");
    return req;
}

HttpRequest UpgradeRequest(const std::string& target) {
    HttpRequest req = Get(target);
    req.set(http::field::upgrade, "websocket");
    req.set(http::field::connection, "Upgrade");
    req.set(http::field::sec_websocket_key, "dGhlIHNhbXBsZSBub25jZQ==");
    req.set(http::field::sec_websocket_version, "13");
    return req;
}

std::string Header(const HttpResponse& res, http::field field) {
    auto value = res[field];
    return std::string(value.data(), value.size());
}

std::string Header(const HttpResponse& res, const char* name) {
    auto value = res[name];
    return std::string(value.data(), value.size());
}

class RouterFixture {
public:
    explicit RouterFixture(EdgeRouter::Config config = {}, uint32_t limit = 100)
        : limiter(limit, 3600s), router(registry, limiter, config) {}

    HttpResponse Respond(const HttpRequest& req, const std::string& addr = "10.0.0.1") {
        auto decision = router.Route(req, addr);
        REQUIRE(decision.response.has_value());
        REQUIRE_FALSE(decision.upgrade.has_value());
        return std::move(*decision.response);
    }

    UpgradeTarget Upgrade(const HttpRequest& req, const std::string& addr = "10.0.0.1") {
        auto decision = router.Route(req, addr);
        REQUIRE_FALSE(decision.response.has_value());
        REQUIRE(decision.upgrade.has_value());
        return std::move(*decision.upgrade);
    }

    PeerRegistry registry;
    RateLimiter limiter;
    EdgeRouter router;
};

}  // namespace

TEST_CASE("EdgeRouter: Rate limiting per address", "[edge_router]") {
    signalhub::util::MockTimeScope mock_time(1'700'000'000'000);
    RouterFixture f;

    for (int i = 0; i < 100; ++i) {
        REQUIRE(f.Respond(Get("/health"), "10.0.0.1").result_int() == 200);
    }

    auto throttled = f.Respond(Get("/health"), "10.0.0.1");
    CHECK(throttled.result_int() == 429);
    CHECK(json::parse(throttled.body())["error"] == EdgeRouter::THROTTLED_MESSAGE);
    CHECK(Header(throttled, http::field::content_type) == "application/json");
    CHECK(f.router.GetThrottledCount() == 1);

    // A different address has its own counter
    CHECK(f.Respond(Get("/health"), "10.0.0.2").result_int() == 200);

    SECTION("Upgrade attempts are throttled too") {
        CHECK(f.Respond(UpgradeRequest("/signal?id=alice"), "10.0.0.1").result_int() == 429);
    }

    SECTION("Counters reset when the window ends") {
        mock_time.Advance(3601s);
        CHECK(f.Respond(Get("/health"), "10.0.0.1").result_int() == 200);
    }
}

TEST_CASE("EdgeRouter: Status routes", "[edge_router]") {
    RouterFixture f;
    f.registry.Register("bob", MakeMockConnection());
    f.registry.Register("alice", MakeMockConnection());

    SECTION("Root banner") {
        auto res = f.Respond(Get("/"));
        CHECK(res.result_int() == 200);
        CHECK(res.body() == "SignalHub signaling relay is running");
        CHECK(Header(res, http::field::content_type) == "text/plain; charset=utf-8");
    }

    SECTION("Health") {
        auto res = f.Respond(Get("/health"));
        REQUIRE(res.result_int() == 200);
        auto body = json::parse(res.body());
        CHECK(body["status"] == "ok");
        CHECK(body["peers"] == 2);
        CHECK(body["uptime_seconds"].is_number_integer());
        CHECK(body["version"].is_string());
    }

    SECTION("Peers") {
        auto res = f.Respond(Get("/peers"));
        REQUIRE(res.result_int() == 200);
        auto body = json::parse(res.body());
        CHECK(body["count"] == 2);
        CHECK(body["peers"] == json::array({"alice", "bob"}));
    }

    SECTION("Trailing slash is ignored") {
        CHECK(f.Respond(Get("/peers/")).result_int() == 200);
    }

    SECTION("Generated id") {
        auto res = f.Respond(Get("/id"));
        REQUIRE(res.result_int() == 200);
        CHECK(res.body().size() == 36);
        CHECK(PeerRegistry::IsValidId(res.body()));
    }

    SECTION("Unknown path") {
        auto res = f.Respond(Get("/register-visit"));
        CHECK(res.result_int() == 404);
        CHECK(json::parse(res.body())["error"] == "Not found");
    }

    SECTION("Non-GET method") {
        HttpRequest post{http::verb::post, "/peers", 11};
        CHECK(f.Respond(post).result_int() == 404);
    }

    SECTION("CORS preflight") {
        HttpRequest options{http::verb::options, "/anything", 11};
        auto res = f.Respond(options);
        CHECK(res.result_int() == 204);
        CHECK(res.body().empty());
    }

    SECTION("Malformed query") {
        CHECK(f.Respond(Get("/signal?id=%zz")).result_int() == 400);
    }
}

TEST_CASE("EdgeRouter: Discovery disabled", "[edge_router]") {
    EdgeRouter::Config config;
    config.allow_discovery = false;
    RouterFixture f(config);

    auto res = f.Respond(Get("/peers"));
    CHECK(res.result_int() == 403);
    CHECK(json::parse(res.body())["error"] == "Peer discovery is disabled");

    CHECK(f.Respond(Get("/peerjs/peerjs/peers")).result_int() == 401);
}

TEST_CASE("EdgeRouter: Common headers", "[edge_router]") {
    RouterFixture f;

    SECTION("Security headers on every response") {
        for (const char* path : {"/", "/health", "/missing"}) {
            auto res = f.Respond(Get(path));
            CHECK(Header(res, "X-Frame-Options") == "DENY");
            CHECK(Header(res, "X-Content-Type-Options") == "nosniff");
            CHECK(Header(res, "Referrer-Policy") == "strict-origin-when-cross-origin");
            CHECK(Header(res, http::field::server).rfind("signalhub/", 0) == 0);
        }
    }

    SECTION("CORS echoes Origin") {
        auto req = Get("/health");
        req.set(http::field::origin, "https://example.org");
        auto res = f.Respond(req);
        CHECK(Header(res, http::field::access_control_allow_origin) == "https://example.org");
        CHECK(Header(res, http::field::vary) == "Origin");
        CHECK(Header(res, http::field::access_control_allow_credentials) == "true");
    }

    SECTION("CORS wildcard without Origin") {
        auto res = f.Respond(Get("/health"));
        CHECK(Header(res, http::field::access_control_allow_origin) == "*");
    }

    SECTION("Throttled responses carry headers too") {
        RouterFixture tight({}, 1);
        tight.Respond(Get("/"));
        auto res = tight.Respond(Get("/"));
        REQUIRE(res.result_int() == 429);
        CHECK(Header(res, "X-Frame-Options") == "DENY");
    }
}

TEST_CASE("EdgeRouter: Client address", "[edge_router]") {
    auto req = Get("/health");
    req.set("X-Forwarded-For", " 203.0.113.7 , 10.0.0.1");

    SECTION("Forwarded header ignored by default") {
        RouterFixture f;
        CHECK(f.router.ClientAddress(req, "10.0.0.1") == "10.0.0.1");
    }

    SECTION("First forwarded entry used behind a trusted proxy") {
        EdgeRouter::Config config;
        config.trust_proxy = true;
        RouterFixture f(config, 1);
        CHECK(f.router.ClientAddress(req, "10.0.0.1") == "203.0.113.7");
        CHECK(f.router.ClientAddress(Get("/"), "10.0.0.1") == "10.0.0.1");

        // Rate limit keyed by the forwarded address
        CHECK(f.Respond(req, "10.0.0.1").result_int() == 200);
        CHECK(f.Respond(req, "10.0.0.99").result_int() == 429);
        CHECK(f.Respond(Get("/health"), "10.0.0.1").result_int() == 200);
    }
}

TEST_CASE("EdgeRouter: Native upgrade", "[edge_router]") {
    RouterFixture f;

    SECTION("Proposed id is passed through") {
        auto upgrade = f.Upgrade(UpgradeRequest("/signal?id=alice"));
        CHECK(upgrade.dialect == Dialect::Native);
        CHECK(upgrade.proposed_id == PeerId("alice"));
        CHECK_FALSE(upgrade.rejection.has_value());
    }

    SECTION("Missing id means server-assigned") {
        auto upgrade = f.Upgrade(UpgradeRequest("/signal"));
        CHECK_FALSE(upgrade.proposed_id.has_value());
    }

    SECTION("Percent-encoded id is decoded") {
        auto upgrade = f.Upgrade(UpgradeRequest("/signal?id=peer%2D1"));
        CHECK(upgrade.proposed_id == PeerId("peer-1"));
    }

    SECTION("Plain GET on the socket path") {
        auto res = f.Respond(Get("/signal?id=alice"));
        CHECK(res.result_int() == 426);
        CHECK(json::parse(res.body())["error"] == "Expected WebSocket upgrade");
    }

    SECTION("Upgrade on a non-socket path is not found") {
        CHECK(f.Respond(UpgradeRequest("/health")).result_int() == 200);
        CHECK(f.Respond(UpgradeRequest("/nowhere")).result_int() == 404);
    }
}

TEST_CASE("EdgeRouter: PeerJS routes", "[edge_router][peerjs]") {
    RouterFixture f;

    SECTION("Upgrade with valid key") {
        auto upgrade = f.Upgrade(UpgradeRequest("/peerjs/peerjs?key=peerjs&id=alice&token=abc"));
        CHECK(upgrade.dialect == Dialect::PeerJs);
        CHECK(upgrade.proposed_id == PeerId("alice"));
        CHECK_FALSE(upgrade.rejection.has_value());
    }

    SECTION("Wrong key upgrades, then fails the session") {
        auto upgrade = f.Upgrade(UpgradeRequest("/peerjs/peerjs?key=nope&id=alice&token=abc"));
        REQUIRE(upgrade.rejection.has_value());
        CHECK(upgrade.rejection->error == SignalError::InvalidKey);
        CHECK(upgrade.rejection->message == "Invalid key provided");
    }

    SECTION("Missing parameters") {
        auto upgrade = f.Upgrade(UpgradeRequest("/peerjs/peerjs?key=peerjs&id=alice"));
        REQUIRE(upgrade.rejection.has_value());
        CHECK(upgrade.rejection->error == SignalError::InvalidId);
        CHECK(upgrade.rejection->message == "No id, token, or key supplied to websocket server");
    }

    SECTION("Id endpoint") {
        auto res = f.Respond(Get("/peerjs/peerjs/id"));
        CHECK(res.result_int() == 200);
        CHECK(PeerRegistry::IsValidId(res.body()));
    }

    SECTION("Peers endpoint returns a bare array") {
        f.registry.Register("alice", MakeMockConnection());
        auto res = f.Respond(Get("/peerjs/peerjs/peers"));
        REQUIRE(res.result_int() == 200);
        CHECK(json::parse(res.body()) == json::array({"alice"}));
    }

    SECTION("Wrong key on REST endpoints") {
        auto res = f.Respond(Get("/peerjs/other/id"));
        CHECK(res.result_int() == 401);
        CHECK(json::parse(res.body())["error"] == "Invalid key provided");
    }

    SECTION("Mount prefix must match a whole segment") {
        CHECK(f.Respond(Get("/peerjsx/peerjs/id")).result_int() == 404);
    }
}

TEST_CASE("EdgeRouter: Custom mount and key", "[edge_router][peerjs]") {
    EdgeRouter::Config config;
    config.peerjs_mount = "/rtc/";
    config.peerjs_key = "s3cret";
    RouterFixture f(config);

    CHECK(f.Respond(Get("/rtc/s3cret/id")).result_int() == 200);
    CHECK(f.Respond(Get("/peerjs/peerjs/id")).result_int() == 404);

    auto upgrade = f.Upgrade(UpgradeRequest("/rtc/peerjs?key=s3cret&id=bob&token=t"));
    CHECK(upgrade.proposed_id == PeerId("bob"));
    CHECK_FALSE(upgrade.rejection.has_value());
}
