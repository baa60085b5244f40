/*
 * File: tests/test_throttle_gate.cpp
 * Project: Home Hub
 * Purpose: Persistence rate limiting
 * Last updated: 2026-10-18
 */

#include <catch2/catch_all.hpp>
#include <atomic>
#include <chrono>
#include <thread>
#include <vector>
#include "hub_throttle.hpp"

using namespace std::chrono_literals;

TEST_CASE("one persist per key per window")
{
    ThrottleGate g;
    auto t0 = Clock::now();
    ReadingKey kitchen{"kitchen", Property::Temperature};

    REQUIRE(g.should_persist(kitchen, t0, 5s));
    REQUIRE_FALSE(g.should_persist(kitchen, t0 + 2s, 5s));
    REQUIRE(g.should_persist(kitchen, t0 + 5s, 5s));
    REQUIRE_FALSE(g.should_persist(kitchen, t0 + 9s, 5s));
}

TEST_CASE("keys are throttled independently")
{
    ThrottleGate g;
    auto t0 = Clock::now();
    REQUIRE(g.should_persist({"kitchen", Property::Temperature}, t0, 5s));
    REQUIRE(g.should_persist({"kitchen", Property::Humidity}, t0, 5s));
    REQUIRE(g.should_persist({"attic", Property::Temperature}, t0, 5s));
}

TEST_CASE("concurrent callers never both win the same window")
{
    ThrottleGate g;
    auto t0 = Clock::now();
    std::atomic<int> winners{0};
    std::vector<std::thread> threads;
    for (int i = 0; i < 8; ++i)
    {
        threads.emplace_back([&]
                             {
            if (g.should_persist({"kitchen", Property::Temperature}, t0, 5s))
                ++winners; });
    }
    for (auto &t : threads)
        t.join();
    REQUIRE(winners.load() == 1);
}
