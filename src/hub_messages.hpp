/*
 * File: src/hub_messages.hpp
 * Project: Home Hub
 * Purpose: Internal hub events and viewer-facing message envelopes
 * Notes:
 *  - Envelope is {"type": ..., "data": ...}; initial is flattened, heartbeat has no data
 *  - serialize() is called once per broadcast, never per viewer
 * Last updated: 2026-10-18
 */

#pragma once
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>
#include <nlohmann/json.hpp>
#include "common/reading.hpp"

// -------- events crossing from the transport thread --------

struct TelemetryEvent
{
    Reading reading;
};

struct StatusChangeEvent
{
    std::string sensor_id;
    bool online;
};

using HubEvent = std::variant<TelemetryEvent, StatusChangeEvent>;

// Scheduler-side consumer of hub events.
class EventSink
{
public:
    virtual ~EventSink() = default;
    virtual void on_event(const HubEvent &ev) = 0;
};

// -------- external feeds (pushed by pollers outside the hub) --------

enum class FeedKind
{
    Transport,
    Weather,
    Nameday,
    System,
    Todoist,
    Calendar
};

inline const char *feed_kind_name(FeedKind k)
{
    switch (k)
    {
    case FeedKind::Transport:
        return "transport";
    case FeedKind::Weather:
        return "weather";
    case FeedKind::Nameday:
        return "nameday";
    case FeedKind::System:
        return "system";
    case FeedKind::Todoist:
        return "todoist";
    case FeedKind::Calendar:
        return "calendar";
    }
    return "?";
}

constexpr FeedKind kAllFeeds[] = {FeedKind::Transport, FeedKind::Weather, FeedKind::Nameday,
                                  FeedKind::System, FeedKind::Todoist, FeedKind::Calendar};

inline std::optional<FeedKind> parse_feed_kind(std::string_view s)
{
    for (auto k : kAllFeeds)
    {
        if (s == feed_kind_name(k))
            return k;
    }
    return std::nullopt;
}

// -------- viewer messages --------

struct InitialMessage
{
    std::vector<Reading> sensors;
    StatusMap sensor_status;
    std::map<FeedKind, nlohmann::json> feeds;
    bool transport_up{false};
    bool store_up{false};
};

struct SensorsMessage
{
    std::vector<Reading> sensors;
};

struct SensorStatusMessage
{
    StatusMap statuses;
};

struct FeedMessage
{
    FeedKind kind;
    nlohmann::json data;
};

struct HeartbeatMessage
{
};

using HubMessage = std::variant<InitialMessage, SensorsMessage, SensorStatusMessage, FeedMessage, HeartbeatMessage>;

template <class... Ts>
struct overloaded : Ts...
{
    using Ts::operator()...;
};
template <class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;

inline nlohmann::json readings_to_json(const std::vector<Reading> &rs)
{
    nlohmann::json out = nlohmann::json::array();
    for (const auto &r : rs)
        out.push_back(reading_to_json(r));
    return out;
}

inline nlohmann::json message_to_json(const HubMessage &msg)
{
    using nlohmann::json;
    return std::visit(
        overloaded{
            [](const InitialMessage &m)
            {
                json j{{"type", "initial"},
                       {"sensors", readings_to_json(m.sensors)},
                       {"sensor_status", status_map_to_json(m.sensor_status)},
                       {"health", {{"mqtt", m.transport_up}, {"database", m.store_up}}}};
                for (auto k : kAllFeeds)
                {
                    auto it = m.feeds.find(k);
                    j[feed_kind_name(k)] = (it != m.feeds.end()) ? it->second : json(nullptr);
                }
                return j;
            },
            [](const SensorsMessage &m)
            { return json{{"type", "sensors"}, {"data", readings_to_json(m.sensors)}}; },
            [](const SensorStatusMessage &m)
            { return json{{"type", "sensor_status"}, {"data", status_map_to_json(m.statuses)}}; },
            [](const FeedMessage &m)
            { return json{{"type", feed_kind_name(m.kind)}, {"data", m.data}}; },
            [](const HeartbeatMessage &)
            { return json{{"type", "heartbeat"}}; }},
        msg);
}

inline std::string serialize(const HubMessage &msg)
{
    return message_to_json(msg).dump();
}
