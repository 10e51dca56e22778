// Copyright (c) 2025 The meshprobe developers
// Distributed under the MIT software license

#include <catch2/catch_test_macros.hpp>
#include "util/time.hpp"

using namespace meshprobe::util;

TEST_CASE("Time: mock time", "[time]") {
    SECTION("MockTimeScope sets and restores") {
        const int64_t before = GetMockTime();
        {
            MockTimeScope scope(1700000000);
            REQUIRE(GetTime() == 1700000000);
            SetMockTime(1700000005);
            REQUIRE(GetTime() == 1700000005);
        }
        REQUIRE(GetMockTime() == before);
    }

    SECTION("Steady time follows mock time") {
        MockTimeScope scope(5000);
        const auto t0 = GetSteadyTime();
        SetMockTime(5030);
        const auto t1 = GetSteadyTime();
        REQUIRE(std::chrono::duration_cast<std::chrono::seconds>(t1 - t0).count() == 30);
    }
}

TEST_CASE("Time: FormatTime", "[time]") {
    REQUIRE(FormatTime(0) == "1970-01-01 00:00:00 UTC");
    REQUIRE(FormatTime(1700000000) == "2023-11-14 22:13:20 UTC");
    REQUIRE(FormatTime(951782400) == "2000-02-29 00:00:00 UTC");
}
