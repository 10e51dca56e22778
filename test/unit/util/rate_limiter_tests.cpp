// Copyright (c) 2025 The meshprobe developers
// Distributed under the MIT software license

#include <catch2/catch_test_macros.hpp>
#include "util/rate_limiter.hpp"
#include "util/time.hpp"

#include <atomic>
#include <thread>
#include <vector>

using namespace meshprobe::util;

namespace {

int CountAllowed(RateLimiter& limiter, const std::string& key, int attempts, int burst, int period) {
    int allowed = 0;
    for (int i = 0; i < attempts; ++i) {
        if (limiter.acquire(key, burst, period)) {
            ++allowed;
        }
    }
    return allowed;
}

}  // namespace

TEST_CASE("RateLimiter: burst then block", "[rate_limiter]") {
    MockTimeScope mock_time(2000000);
    RateLimiter limiter;

    REQUIRE(CountAllowed(limiter, "stream_interface.cpp:248", 1000, 200, 3600) == 200);

    SECTION("Callsites are independent") {
        REQUIRE(limiter.acquire("tcp_interface.cpp:90", 200, 3600).has_value());
    }

    SECTION("Reset forgets callsites") {
        limiter.reset();
        REQUIRE(limiter.acquire("stream_interface.cpp:248", 200, 3600) == uint64_t{0});
    }
}

TEST_CASE("RateLimiter: suppressed count", "[rate_limiter]") {
    MockTimeScope mock_time(2000000);
    RateLimiter limiter;

    SECTION("First message reports nothing suppressed") {
        REQUIRE(limiter.acquire("frame", 3, 30) == uint64_t{0});
    }

    SECTION("Dropped messages are reported with the next allowed one") {
        REQUIRE(CountAllowed(limiter, "frame", 3, 3, 30) == 3);
        for (int i = 0; i < 7; ++i) {
            REQUIRE_FALSE(limiter.acquire("frame", 3, 30).has_value());
        }

        // 3 tokens per 30 s, so 10 s buys one message
        SetMockTime(2000010);
        REQUIRE(limiter.acquire("frame", 3, 30) == uint64_t{7});
        REQUIRE_FALSE(limiter.acquire("frame", 3, 30).has_value());

        SetMockTime(2000020);
        REQUIRE(limiter.acquire("frame", 3, 30) == uint64_t{1});
    }
}

TEST_CASE("RateLimiter: refill", "[rate_limiter]") {
    MockTimeScope mock_time(2000000);
    RateLimiter limiter;

    SECTION("Partial seconds do not refill") {
        REQUIRE(CountAllowed(limiter, "partial", 2, 2, 2) == 2);
        REQUIRE_FALSE(limiter.acquire("partial", 2, 2).has_value());
        SetMockTime(2000001);
        REQUIRE(limiter.acquire("partial", 2, 2).has_value());
    }

    SECTION("Long silence refills only up to the burst") {
        REQUIRE(CountAllowed(limiter, "quiet", 4, 4, 1) == 4);
        SetMockTime(2003600);
        REQUIRE(CountAllowed(limiter, "quiet", 10, 4, 1) == 4);
    }

    SECTION("Clock going backwards is ignored") {
        REQUIRE(CountAllowed(limiter, "backwards", 5, 5, 60) == 5);
        SetMockTime(1999000);
        REQUIRE_FALSE(limiter.acquire("backwards", 5, 60).has_value());
    }
}

TEST_CASE("RateLimiter: disabled limits", "[rate_limiter]") {
    RateLimiter limiter;
    for (int i = 0; i < 50; ++i) {
        REQUIRE(limiter.acquire("no-burst", 0, 3600) == uint64_t{0});
        REQUIRE(limiter.acquire("no-period", 5, 0) == uint64_t{0});
    }
}

TEST_CASE("RateLimiter: concurrent callers share one bucket", "[rate_limiter][threading]") {
    MockTimeScope mock_time(2000000);
    RateLimiter limiter;
    std::atomic<int> allowed{0};

    std::vector<std::thread> threads;
    for (int t = 0; t < 8; ++t) {
        threads.emplace_back([&limiter, &allowed]() {
            for (int i = 0; i < 100; ++i) {
                if (limiter.acquire("shared", 200, 3600)) {
                    ++allowed;
                }
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    REQUIRE(allowed.load() == 200);
}
