/*
 * File: src/hub_dispatch.hpp
 * Project: Home Hub
 * Purpose: Scheduler-side handler turning hub events into viewer broadcasts
 * Notes:
 *  - Called only on the scheduler (bridge handoff, sweeper, HTTP feed posts)
 * Last updated: 2026-10-18
 */

#pragma once
#include <variant>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include "hub_broadcast.hpp"
#include "hub_messages.hpp"
#include "hub_state.hpp"

class HubDispatcher : public EventSink
{
    HubState &state_;
    BroadcastHub &hub_;

public:
    HubDispatcher(HubState &state, BroadcastHub &hub) : state_(state), hub_(hub) {}

    void on_event(const HubEvent &ev) override
    {
        std::visit(overloaded{
                       [this](const TelemetryEvent &e)
                       {
                           hub_.broadcast(SensorsMessage{{e.reading}});
                       },
                       [this](const StatusChangeEvent &e)
                       {
                           spdlog::info("sensor {} is {}", e.sensor_id, e.online ? "online" : "offline");
                           hub_.broadcast(SensorStatusMessage{state_.status.snapshot(Clock::now())});
                       }},
                   ev);
    }

    void publish_feed(FeedKind kind, nlohmann::json data)
    {
        state_.feeds.set(kind, data);
        hub_.broadcast(FeedMessage{kind, std::move(data)});
    }

    InitialMessage initial_message() const
    {
        InitialMessage m;
        m.sensors = state_.cache.get_all();
        m.sensor_status = state_.status.snapshot(Clock::now());
        m.feeds = state_.feeds.all();
        m.transport_up = state_.transport_up.load();
        m.store_up = state_.store_up.load();
        return m;
    }
};
