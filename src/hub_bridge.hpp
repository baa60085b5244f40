/*
 * File: src/hub_bridge.hpp
 * Project: Home Hub
 * Purpose: Transport-thread entry point for telemetry
 * Notes:
 *  - on_message runs on the transport thread and never waits on the scheduler or the disk
 *  - Before mark_ready a message's events go to the startup buffer as one batch, afterwards to the strand
 *  - Both buffering and posting happen under one lock, so replay precedes live traffic
 *  - Durable writes run on a separate executor after the handoff
 * Last updated: 2026-10-18
 */

#pragma once
#include <chrono>
#include <exception>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <utility>
#include <variant>
#include <vector>
#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/strand.hpp>
#include <spdlog/spdlog.h>
#include "hub_messages.hpp"
#include "hub_startup_buffer.hpp"
#include "hub_state.hpp"
#include "hub_store.hpp"
#include "hub_validator.hpp"

using SchedulerStrand = boost::asio::strand<boost::asio::io_context::executor_type>;
using EventBatch = std::vector<HubEvent>;

class IngestionBridge
{
    HubState &state_;
    ReadingStore &store_;
    EventSink &sink_;
    boost::asio::any_io_executor disk_;
    Clock::duration save_window_;

    std::mutex m_;
    bool ready_ = false;
    std::optional<SchedulerStrand> strand_;
    StartupBuffer<EventBatch> buffer_;
    // Sensors whose online transition was lost to a full buffer; re-announced after the replay.
    std::set<std::string> lost_online_;

public:
    // disk must run handlers one at a time (a single-threaded pool or a strand) to keep writes ordered.
    IngestionBridge(HubState &state, ReadingStore &store, EventSink &sink, boost::asio::any_io_executor disk,
                    Clock::duration save_window = std::chrono::seconds(5),
                    std::size_t buffer_capacity = 1000)
        : state_(state), store_(store), sink_(sink), disk_(std::move(disk)), save_window_(save_window),
          buffer_(buffer_capacity) {}

    IngestionBridge(const IngestionBridge &) = delete;
    IngestionBridge &operator=(const IngestionBridge &) = delete;

    void on_message(const std::string &topic, const std::string &payload)
    {
        on_message(topic, payload, Clock::now());
    }

    void on_message(const std::string &topic, const std::string &payload, Clock::time_point now)
    {
        auto parts = parse_topic(topic);
        if (!parts)
        {
            spdlog::warn("rejected message on '{}': {}", topic, reject_reason_name(RejectReason::MalformedTopic));
            return;
        }
        auto &[prop, sensor] = *parts;

        auto result = validate(sensor, prop, payload, now);
        if (auto *reason = std::get_if<RejectReason>(&result))
        {
            spdlog::warn("rejected {} [{}] = '{}': {}", sensor, prop, payload, reject_reason_name(*reason));
            return;
        }
        const Reading &reading = std::get<Reading>(result);

        bool came_online = state_.status.record_seen(reading.sensor_id, now);
        state_.cache.put(reading);
        bool persist = state_.throttle.should_persist(key_of(reading), now, save_window_);

        EventBatch events;
        events.emplace_back(TelemetryEvent{reading});
        if (came_online)
            events.emplace_back(StatusChangeEvent{reading.sensor_id, true});
        dispatch(std::move(events));

        if (persist)
            boost::asio::post(disk_, [&store = store_, &state = state_, reading]()
                              { save(store, state, reading); });
    }

    // Called once on the running scheduler; replays the startup buffer in arrival order.
    bool mark_ready(SchedulerStrand strand)
    {
        std::scoped_lock lk(m_);
        if (ready_)
            return false;
        auto backlog = buffer_.drain();
        strand_ = std::move(strand);
        ready_ = true;

        EventBatch replay;
        for (auto &batch : backlog)
        {
            for (auto &ev : batch)
                replay.push_back(std::move(ev));
        }
        for (const auto &id : lost_online_)
            replay.emplace_back(StatusChangeEvent{id, true});
        spdlog::info("scheduler ready, replaying {} buffered messages ({} dropped)", backlog.size(), buffer_.dropped());
        lost_online_.clear();

        boost::asio::post(*strand_, [this, replay = std::move(replay)]()
                          { deliver(replay); });
        return true;
    }

    bool ready()
    {
        std::scoped_lock lk(m_);
        return ready_;
    }

    // Counts raw messages, not events.
    std::size_t buffered() const { return buffer_.size(); }
    std::size_t dropped() const { return buffer_.dropped(); }

private:
    void dispatch(EventBatch events)
    {
        std::scoped_lock lk(m_);
        if (!ready_)
        {
            bool online = events.size() > 1;
            std::string id = std::get<TelemetryEvent>(events.front()).reading.sensor_id;
            if (!buffer_.try_push(std::move(events)))
            {
                spdlog::warn("startup buffer full ({}), dropping message from {}", buffer_.capacity(), id);
                if (online)
                    lost_online_.insert(std::move(id));
            }
            return;
        }
        // One handoff per raw message.
        boost::asio::post(*strand_, [this, events = std::move(events)]()
                          { deliver(events); });
    }

    // Captures only the store and the state, which outlive the disk executor.
    static void save(ReadingStore &store, HubState &state, const Reading &reading)
    {
        try
        {
            store.save_reading(reading);
            state.store_up = true;
            spdlog::debug("saved {} [{}] -> {}", reading.sensor_id, property_name(reading.property), reading.value);
        }
        catch (const std::exception &e)
        {
            state.store_up = false;
            spdlog::error("persist {} [{}] failed: {}", reading.sensor_id, property_name(reading.property), e.what());
        }
    }

    void deliver(const EventBatch &events)
    {
        for (const auto &ev : events)
        {
            try
            {
                sink_.on_event(ev);
            }
            catch (const std::exception &e)
            {
                spdlog::error("event handler failed: {}", e.what());
            }
        }
    }
};
