/*
 * File: src/hub_state.hpp
 * Project: Home Hub
 * Purpose: Authoritative live state shared by the transport thread and the scheduler
 * Notes:
 *  - Every map is owned by an object with its own lock; none is exposed raw
 * Last updated: 2026-10-18
 */

#pragma once
#include <atomic>
#include <chrono>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "common/reading.hpp"
#include "hub_messages.hpp"
#include "hub_status.hpp"
#include "hub_throttle.hpp"

// Latest accepted reading per (sensor, property). No eviction.
class LiveCache
{
    mutable std::mutex m_;
    std::map<ReadingKey, Reading> latest_;

public:
    void put(Reading r)
    {
        std::scoped_lock lk(m_);
        auto key = key_of(r);
        latest_[std::move(key)] = std::move(r);
    }

    std::vector<Reading> get_all() const
    {
        std::scoped_lock lk(m_);
        std::vector<Reading> out;
        out.reserve(latest_.size());
        for (const auto &[key, r] : latest_)
            out.push_back(r);
        return out;
    }

    std::optional<Reading> get(const ReadingKey &key) const
    {
        std::scoped_lock lk(m_);
        auto it = latest_.find(key);
        if (it == latest_.end())
            return std::nullopt;
        return it->second;
    }

    // Startup seed; entries already present (newer live data) are kept.
    void load_initial(const std::vector<Reading> &seed)
    {
        std::scoped_lock lk(m_);
        for (const auto &r : seed)
            latest_.emplace(key_of(r), r);
    }

    std::size_t size() const
    {
        std::scoped_lock lk(m_);
        return latest_.size();
    }
    bool empty() const { return size() == 0; }
};

// Most recent payload per external feed, replayed in the initial message.
class FeedBoard
{
    mutable std::mutex m_;
    std::map<FeedKind, nlohmann::json> latest_;

public:
    void set(FeedKind k, nlohmann::json data)
    {
        std::scoped_lock lk(m_);
        latest_[k] = std::move(data);
    }
    std::map<FeedKind, nlohmann::json> all() const
    {
        std::scoped_lock lk(m_);
        return latest_;
    }
};

struct HubState
{
    StatusTracker status;
    LiveCache cache;
    ThrottleGate throttle;
    FeedBoard feeds;
    std::atomic<bool> transport_up{false};
    std::atomic<bool> store_up{false};
    std::chrono::steady_clock::time_point start = std::chrono::steady_clock::now();

    explicit HubState(Clock::duration offline_timeout = std::chrono::seconds(30))
        : status(offline_timeout) {}
};
