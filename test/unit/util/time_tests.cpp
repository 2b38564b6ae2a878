// Copyright (c) 2025 The SignalHub developers
// Distributed under the MIT software license

#include <catch2/catch.hpp>

#include "util/time.hpp"

using namespace signalhub::util;
using namespace std::chrono_literals;

TEST_CASE("Time: Mock time", "[time]") {
    REQUIRE(GetMockTime() == 0);

    {
        MockTimeScope mock_time(1'700'000'000'500);
        CHECK(GetMockTime() == 1'700'000'000'500);

        SECTION("Steady time advances with the mock") {
            auto before = GetSteadyTime();
            mock_time.Advance(90s);
            auto after = GetSteadyTime();
            CHECK(after - before == std::chrono::milliseconds(90'000));
        }

        SECTION("Frozen mock keeps steady time still") {
            CHECK(GetSteadyTime() == GetSteadyTime());
        }
    }

    // Scope restores the real clock
    CHECK(GetMockTime() == 0);
}

TEST_CASE("Time: Real steady clock when not mocked", "[time]") {
    REQUIRE(GetMockTime() == 0);
    auto before = GetSteadyTime();
    auto after = GetSteadyTime();
    CHECK(after >= before);
}
