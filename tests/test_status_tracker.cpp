/*
 * File: tests/test_status_tracker.cpp
 * Project: Home Hub
 * Purpose: Online/offline transitions
 * Last updated: 2026-10-18
 */

#include <catch2/catch_all.hpp>
#include <chrono>
#include "hub_status.hpp"

using namespace std::chrono_literals;

TEST_CASE("first sighting reports a transition to online")
{
    StatusTracker t(30s);
    auto t0 = Clock::now();
    REQUIRE(t.record_seen("kitchen", t0));
    REQUIRE_FALSE(t.record_seen("kitchen", t0 + 10s));

    auto s = t.compute_status("kitchen", t0 + 15s);
    REQUIRE(s);
    REQUIRE(s->online);
    REQUIRE(s->seconds_since_seen == Catch::Approx(5.0));
    REQUIRE_FALSE(t.compute_status("garage", t0));
}

TEST_CASE("a silent sensor goes offline exactly once")
{
    StatusTracker t(30s);
    auto t0 = Clock::now();
    t.record_seen("attic", t0);

    REQUIRE(t.sweep(t0 + 29s).empty());

    auto flipped = t.sweep(t0 + 31s);
    REQUIRE(flipped.size() == 1);
    REQUIRE(flipped[0].sensor_id == "attic");
    REQUIRE_FALSE(flipped[0].online);

    REQUIRE(t.sweep(t0 + 36s).empty());
    REQUIRE(t.sweep(t0 + 300s).empty());
    REQUIRE_FALSE(t.compute_status("attic", t0 + 31s)->online);
}

TEST_CASE("an offline sensor comes back online on its next update")
{
    StatusTracker t(30s);
    auto t0 = Clock::now();
    t.record_seen("attic", t0);
    REQUIRE(t.sweep(t0 + 40s).size() == 1);

    REQUIRE(t.record_seen("attic", t0 + 41s));
    REQUIRE(t.compute_status("attic", t0 + 41s)->online);
    REQUIRE(t.sweep(t0 + 45s).empty());

    // A second absence is a new transition.
    REQUIRE(t.sweep(t0 + 72s).size() == 1);
}

TEST_CASE("a lapse that was never swept is not a transition")
{
    StatusTracker t(30s);
    auto t0 = Clock::now();
    t.record_seen("porch", t0);

    // Silent past the timeout, but the sweeper has not run, so viewers still see it online.
    REQUIRE_FALSE(t.compute_status("porch", t0 + 40s)->online);
    REQUIRE_FALSE(t.record_seen("porch", t0 + 40s));
    REQUIRE(t.compute_status("porch", t0 + 40s)->online);
    REQUIRE(t.sweep(t0 + 45s).empty());
}

TEST_CASE("snapshot lists every known sensor")
{
    StatusTracker t(30s);
    auto t0 = Clock::now();
    t.record_seen("a", t0);
    t.record_seen("b", t0 + 20s);

    auto snap = t.snapshot(t0 + 35s);
    REQUIRE(snap.size() == 2);
    REQUIRE_FALSE(snap.at("a").online);
    REQUIRE(snap.at("b").online);
}
