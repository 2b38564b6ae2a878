// Copyright (c) 2025 The SignalHub developers
// Distributed under the MIT software license
// Unit tests for PeerRegistry

#include <catch2/catch.hpp>

#include "infra/mock_connection.hpp"
#include "network/peer_registry.hpp"
#include "util/time.hpp"

#include <atomic>
#include <set>
#include <thread>
#include <vector>

using namespace signalhub::network;
using signalhub::test::MakeMockConnection;
using signalhub::util::MockTimeScope;
using namespace std::chrono_literals;

TEST_CASE("PeerRegistry: Register and lookup", "[peer_registry]") {
    PeerRegistry registry;
    auto alice = MakeMockConnection();

    REQUIRE(registry.Register("alice", alice) == RegisterResult::Success);
    REQUIRE(registry.Count() == 1);

    auto record = registry.Lookup("alice");
    REQUIRE(record.has_value());
    CHECK(record->id == "alice");
    CHECK(record->connection.get() == alice.get());
    CHECK(record->registered_at == record->last_active_at);

    CHECK_FALSE(registry.Lookup("bob").has_value());
}

TEST_CASE("PeerRegistry: Duplicate id rejected", "[peer_registry]") {
    PeerRegistry registry;
    auto first = MakeMockConnection();
    auto second = MakeMockConnection();

    REQUIRE(registry.Register("alice", first) == RegisterResult::Success);
    REQUIRE(registry.Register("alice", second) == RegisterResult::DuplicateId);

    // Original holder untouched
    CHECK(registry.Lookup("alice")->connection.get() == first.get());
    CHECK(registry.Count() == 1);
}

TEST_CASE("PeerRegistry: Id validation", "[peer_registry]") {
    PeerRegistry registry;

    CHECK(PeerRegistry::IsValidId("alice"));
    CHECK(PeerRegistry::IsValidId("Peer_01-x"));
    CHECK(PeerRegistry::IsValidId(std::string(PeerRegistry::MAX_ID_LENGTH, 'a')));

    CHECK_FALSE(PeerRegistry::IsValidId(""));
    CHECK_FALSE(PeerRegistry::IsValidId(std::string(PeerRegistry::MAX_ID_LENGTH + 1, 'a')));
    CHECK_FALSE(PeerRegistry::IsValidId("bad id"));
    CHECK_FALSE(PeerRegistry::IsValidId("a/b"));
    CHECK_FALSE(PeerRegistry::IsValidId("caf\xc3\xa9"));

    CHECK(registry.Register("has space", MakeMockConnection()) == RegisterResult::InvalidId);
    CHECK(registry.Register("alice", nullptr) == RegisterResult::InvalidId);
    CHECK(registry.Count() == 0);
}

TEST_CASE("PeerRegistry: Capacity limit", "[peer_registry]") {
    PeerRegistry registry(2);
    REQUIRE(registry.Register("a", MakeMockConnection()) == RegisterResult::Success);
    REQUIRE(registry.Register("b", MakeMockConnection()) == RegisterResult::Success);
    REQUIRE(registry.Register("c", MakeMockConnection()) == RegisterResult::CapacityReached);

    registry.Remove("a");
    CHECK(registry.Register("c", MakeMockConnection()) == RegisterResult::Success);
}

TEST_CASE("PeerRegistry: Remove", "[peer_registry]") {
    PeerRegistry registry;
    registry.Register("alice", MakeMockConnection());

    SECTION("Remove returns the record and lookup fails afterwards") {
        auto removed = registry.Remove("alice");
        REQUIRE(removed.has_value());
        CHECK(removed->id == "alice");
        CHECK_FALSE(registry.Lookup("alice").has_value());
    }

    SECTION("Removing an absent id is a no-op") {
        registry.Remove("alice");
        CHECK_FALSE(registry.Remove("alice").has_value());
        CHECK_FALSE(registry.Remove("never-registered").has_value());
    }

    SECTION("Id can be reused after removal") {
        registry.Remove("alice");
        CHECK(registry.Register("alice", MakeMockConnection()) == RegisterResult::Success);
    }
}

TEST_CASE("PeerRegistry: RemoveIfOwner", "[peer_registry]") {
    PeerRegistry registry;
    auto old_conn = MakeMockConnection();
    auto new_conn = MakeMockConnection();

    registry.Register("alice", old_conn);

    SECTION("Owner removes its own record") {
        CHECK(registry.RemoveIfOwner("alice", old_conn.get()).has_value());
        CHECK_FALSE(registry.Lookup("alice").has_value());
    }

    SECTION("Stale owner cannot remove a newer registration") {
        // Evicted, then the id is taken by a new connection
        registry.Remove("alice");
        registry.Register("alice", new_conn);

        // Late close event from the old connection
        CHECK_FALSE(registry.RemoveIfOwner("alice", old_conn.get()).has_value());
        REQUIRE(registry.Lookup("alice").has_value());
        CHECK(registry.Lookup("alice")->connection.get() == new_conn.get());
    }
}

TEST_CASE("PeerRegistry: Touch", "[peer_registry]") {
    MockTimeScope mock_time(1'700'000'000'000);
    PeerRegistry registry;
    registry.Register("alice", MakeMockConnection());
    auto registered_at = registry.Lookup("alice")->last_active_at;

    SECTION("Touch advances last_active_at") {
        mock_time.Advance(5s);
        REQUIRE(registry.Touch("alice"));
        CHECK(registry.Lookup("alice")->last_active_at - registered_at == 5s);
    }

    SECTION("Repeated touches never move backwards") {
        mock_time.Advance(10s);
        REQUIRE(registry.Touch("alice"));
        auto t1 = registry.Lookup("alice")->last_active_at;

        REQUIRE(registry.Touch("alice"));
        REQUIRE(registry.Touch("alice"));
        CHECK(registry.Lookup("alice")->last_active_at == t1);

        mock_time.Advance(1s);
        REQUIRE(registry.Touch("alice"));
        CHECK(registry.Lookup("alice")->last_active_at > t1);
    }

    SECTION("Touch of unknown id reports not found") {
        CHECK_FALSE(registry.Touch("bob"));
    }
}

TEST_CASE("PeerRegistry: EvictIfIdle", "[peer_registry]") {
    MockTimeScope mock_time(1'700'000'000'000);
    PeerRegistry registry;
    registry.Register("alice", MakeMockConnection());

    SECTION("Not evicted at exactly the threshold") {
        mock_time.Advance(60s);
        CHECK_FALSE(registry.EvictIfIdle("alice", signalhub::util::GetSteadyTime(), 60s).has_value());
        CHECK(registry.Count() == 1);
    }

    SECTION("Evicted past the threshold") {
        mock_time.Advance(61s);
        auto evicted = registry.EvictIfIdle("alice", signalhub::util::GetSteadyTime(), 60s);
        REQUIRE(evicted.has_value());
        CHECK(evicted->id == "alice");
        CHECK(registry.Count() == 0);
    }

    SECTION("A touch before the check saves the peer") {
        mock_time.Advance(61s);
        registry.Touch("alice");
        CHECK_FALSE(registry.EvictIfIdle("alice", signalhub::util::GetSteadyTime(), 60s).has_value());
    }

    SECTION("Absent id is a no-op") {
        CHECK_FALSE(registry.EvictIfIdle("ghost", signalhub::util::GetSteadyTime(), 0s).has_value());
    }
}

TEST_CASE("PeerRegistry: ListIds and Clear", "[peer_registry]") {
    PeerRegistry registry;
    registry.Register("charlie", MakeMockConnection());
    registry.Register("alice", MakeMockConnection());
    registry.Register("bob", MakeMockConnection());

    CHECK(registry.ListIds() == std::vector<PeerId>{"alice", "bob", "charlie"});

    auto records = registry.Clear();
    CHECK(records.size() == 3);
    CHECK(registry.Count() == 0);
    CHECK(registry.ListIds().empty());
}

TEST_CASE("PeerRegistry: GenerateId", "[peer_registry]") {
    std::set<PeerId> ids;
    for (int i = 0; i < 1000; ++i) {
        auto id = PeerRegistry::GenerateId();
        REQUIRE(id.size() == 36);
        REQUIRE(PeerRegistry::IsValidId(id));
        REQUIRE(id[14] == '4');  // version nibble
        ids.insert(id);
    }
    CHECK(ids.size() == 1000);
}

TEST_CASE("PeerRegistry: Concurrent registration of the same id", "[peer_registry][threading]") {
    const int rounds = 50;
    const int num_threads = 8;

    for (int round = 0; round < rounds; ++round) {
        PeerRegistry registry;
        std::atomic<int> successes{0};
        std::vector<std::thread> threads;

        for (int t = 0; t < num_threads; ++t) {
            threads.emplace_back([&registry, &successes]() {
                if (registry.Register("contested", MakeMockConnection()) == RegisterResult::Success) {
                    successes++;
                }
            });
        }
        for (auto& thread : threads) {
            thread.join();
        }

        REQUIRE(successes == 1);
        REQUIRE(registry.Count() == 1);
    }
}

TEST_CASE("PeerRegistry: Concurrent register/touch/remove", "[peer_registry][threading]") {
    PeerRegistry registry;
    const int num_threads = 8;
    const int ops_per_thread = 500;

    std::vector<std::thread> threads;
    for (int t = 0; t < num_threads; ++t) {
        threads.emplace_back([&registry, t]() {
            for (int i = 0; i < ops_per_thread; ++i) {
                PeerId id = "peer-" + std::to_string(t) + "-" + std::to_string(i % 10);
                registry.Register(id, MakeMockConnection());
                registry.Touch(id);
                registry.Lookup(id);
                registry.ListIds();
                registry.Remove(id);
                // A completed remove is never followed by a phantom lookup
                REQUIRE_FALSE(registry.Lookup(id).has_value());
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    CHECK(registry.Count() == 0);
}
