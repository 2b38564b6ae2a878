// Copyright (c) 2025 The SignalHub developers
// Distributed under the MIT software license

#include <catch2/catch.hpp>

#include "version.hpp"

using namespace signalhub;

TEST_CASE("Version: strings", "[version]") {
    SECTION("Version follows the compiled constants") {
        CHECK(GetVersionString() == std::to_string(CLIENT_VERSION_MAJOR) + "." +
                                        std::to_string(CLIENT_VERSION_MINOR) + "." +
                                        std::to_string(CLIENT_VERSION_PATCH));
        CHECK(GetFullVersionString() == "SignalHub relay v" + GetVersionString());
    }

    SECTION("Copyright names the project's holder under MIT") {
        CHECK(GetCopyrightString() ==
              "Copyright (c) 2025 The SignalHub developers\nDistributed under the MIT software license");
    }
}
