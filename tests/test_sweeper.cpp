/*
 * File: tests/test_sweeper.cpp
 * Project: Home Hub
 * Purpose: Offline sweeps and the dispatcher's reaction to them
 * Last updated: 2026-10-18
 */

#include <catch2/catch_all.hpp>
#include <boost/asio.hpp>
#include <chrono>
#include <memory>
#include <vector>
#include <nlohmann/json.hpp>
#include "hub_dispatch.hpp"
#include "hub_sweeper.hpp"

using namespace std::chrono_literals;

namespace
{
    struct RecordingSink : EventSink
    {
        std::vector<HubEvent> events;
        void on_event(const HubEvent &ev) override { events.push_back(ev); }
    };

    struct CaptureViewer : ViewerConnection
    {
        std::vector<Frame> frames;
        bool send(Frame f) override
        {
            frames.push_back(std::move(f));
            return true;
        }
        void close() override {}
        std::string remote() const override { return "capture"; }
    };
}

TEST_CASE("each sweep reports a sensor going offline once")
{
    boost::asio::io_context ioc;
    StatusTracker status(30s);
    RecordingSink sink;
    TimeoutSweeper sweeper(ioc, status, sink, 5s);

    auto t0 = Clock::now();
    status.record_seen("attic", t0);
    status.record_seen("kitchen", t0 + 25s);

    REQUIRE(sweeper.tick(t0 + 10s) == 0);
    REQUIRE(sweeper.tick(t0 + 31s) == 1);
    REQUIRE(sweeper.tick(t0 + 36s) == 0);
    REQUIRE(sweeper.tick(t0 + 60s) == 1);

    REQUIRE(sink.events.size() == 2);
    auto &first = std::get<StatusChangeEvent>(sink.events[0]);
    REQUIRE(first.sensor_id == "attic");
    REQUIRE_FALSE(first.online);
    REQUIRE(std::get<StatusChangeEvent>(sink.events[1]).sensor_id == "kitchen");
}

TEST_CASE("status changes are broadcast as the full status map")
{
    HubState state(30s);
    BroadcastHub hub;
    HubDispatcher dispatcher(state, hub);
    auto v = std::make_shared<CaptureViewer>();
    hub.connect(v);

    auto now = Clock::now();
    state.status.record_seen("attic", now);
    state.status.record_seen("kitchen", now);
    dispatcher.on_event(StatusChangeEvent{"attic", true});

    REQUIRE(v->frames.size() == 1);
    auto j = nlohmann::json::parse(*v->frames[0]);
    REQUIRE(j["type"] == "sensor_status");
    REQUIRE(j["data"].size() == 2);
    REQUIRE(j["data"]["attic"]["online"] == true);
}

TEST_CASE("telemetry is broadcast as a sensors message")
{
    HubState state(30s);
    BroadcastHub hub;
    HubDispatcher dispatcher(state, hub);
    auto v = std::make_shared<CaptureViewer>();
    hub.connect(v);

    dispatcher.on_event(TelemetryEvent{Reading{"kitchen", Property::Temperature, 21.5, Clock::now()}});

    REQUIRE(v->frames.size() == 1);
    auto j = nlohmann::json::parse(*v->frames[0]);
    REQUIRE(j["type"] == "sensors");
    REQUIRE(j["data"].size() == 1);
    REQUIRE(j["data"][0]["sensor"] == "kitchen");
    REQUIRE(j["data"][0]["prop"] == "temperature");
    REQUIRE(j["data"][0]["temp"] == 21.5);
}

TEST_CASE("a started sweeper stops cleanly")
{
    boost::asio::io_context ioc;
    StatusTracker status(30s);
    RecordingSink sink;
    TimeoutSweeper sweeper(ioc, status, sink, 1ms);

    sweeper.start();
    ioc.run_for(20ms);
    sweeper.stop();
    ioc.restart();
    REQUIRE(ioc.run_for(50ms) <= 1);
    REQUIRE(sink.events.empty());
}
