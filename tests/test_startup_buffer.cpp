/*
 * File: tests/test_startup_buffer.cpp
 * Project: Home Hub
 * Purpose: Bounded pre-scheduler buffer
 * Last updated: 2026-10-18
 */

#include <catch2/catch_all.hpp>
#include "hub_startup_buffer.hpp"

TEST_CASE("drain returns events in arrival order, once")
{
    StartupBuffer<int> b(10);
    for (int i = 0; i < 5; ++i)
        REQUIRE(b.try_push(i));

    auto out = b.drain();
    REQUIRE(out == std::vector<int>{0, 1, 2, 3, 4});
    REQUIRE(b.drain().empty());
    REQUIRE(b.size() == 0);
}

TEST_CASE("a full buffer drops the newest event")
{
    StartupBuffer<int> b(3);
    REQUIRE(b.try_push(1));
    REQUIRE(b.try_push(2));
    REQUIRE(b.try_push(3));
    REQUIRE_FALSE(b.try_push(4));
    REQUIRE(b.dropped() == 1);
    REQUIRE(b.drain() == std::vector<int>{1, 2, 3});
}

TEST_CASE("pushes after the drain are refused")
{
    StartupBuffer<int> b(3);
    b.drain();
    REQUIRE_FALSE(b.try_push(1));
}
