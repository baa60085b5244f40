/*
 * File: src/hub_status.hpp
 * Project: Home Hub
 * Purpose: Sensor online/offline tracking
 * Notes:
 *  - Touched by the transport thread (record_seen) and the scheduler (sweep)
 *  - Lock covers the map mutation only; callers act on transitions afterwards
 * Last updated: 2026-10-18
 */

#pragma once
#include <chrono>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include "common/reading.hpp"

struct StatusTransition
{
    std::string sensor_id;
    bool online;
};

class StatusTracker
{
    struct Entry
    {
        Clock::time_point last_seen;
        bool online;
    };

    mutable std::mutex m_;
    std::map<std::string, Entry> seen_;
    Clock::duration offline_timeout_;

    SensorStatus make_status(const std::string &id, const Entry &e, Clock::time_point now) const
    {
        SensorStatus s;
        s.sensor_id = id;
        s.last_seen = e.last_seen;
        s.seconds_since_seen = std::chrono::duration<double>(now - e.last_seen).count();
        s.online = (now - e.last_seen) < offline_timeout_;
        return s;
    }

public:
    explicit StatusTracker(Clock::duration offline_timeout = std::chrono::seconds(30))
        : offline_timeout_(offline_timeout) {}

    Clock::duration offline_timeout() const { return offline_timeout_; }

    // Returns true when the sensor was absent or offline and is now online.
    bool record_seen(const std::string &sensor_id, Clock::time_point now)
    {
        std::scoped_lock lk(m_);
        auto it = seen_.find(sensor_id);
        if (it == seen_.end())
        {
            seen_.emplace(sensor_id, Entry{now, true});
            return true;
        }
        it->second.last_seen = now;
        // The stored flag is what viewers last saw; a lapse not yet swept was never announced.
        if (it->second.online)
            return false;
        it->second.online = true;
        return true;
    }

    std::optional<SensorStatus> compute_status(const std::string &sensor_id, Clock::time_point now) const
    {
        std::scoped_lock lk(m_);
        auto it = seen_.find(sensor_id);
        if (it == seen_.end())
            return std::nullopt;
        return make_status(sensor_id, it->second, now);
    }

    StatusMap snapshot(Clock::time_point now) const
    {
        std::scoped_lock lk(m_);
        StatusMap out;
        for (const auto &[id, e] : seen_)
            out.emplace(id, make_status(id, e, now));
        return out;
    }

    // online -> offline only; recoveries are reported by record_seen
    std::vector<StatusTransition> sweep(Clock::time_point now)
    {
        std::vector<StatusTransition> flipped;
        std::scoped_lock lk(m_);
        for (auto &[id, e] : seen_)
        {
            if (e.online && (now - e.last_seen) >= offline_timeout_)
            {
                e.online = false;
                flipped.push_back({id, false});
            }
        }
        return flipped;
    }

    std::size_t size() const
    {
        std::scoped_lock lk(m_);
        return seen_.size();
    }
};
