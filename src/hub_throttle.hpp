/*
 * File: src/hub_throttle.hpp
 * Project: Home Hub
 * Purpose: Per-key persistence rate limit
 * Notes:
 *  - Gates durable writes only; cache and broadcast never consult it
 * Last updated: 2026-10-18
 */

#pragma once
#include <chrono>
#include <map>
#include <mutex>
#include "common/reading.hpp"

class ThrottleGate
{
    std::mutex m_;
    std::map<ReadingKey, Clock::time_point> last_persisted_;

public:
    // Check-and-record under one lock: at most one caller wins per key per window.
    bool should_persist(const ReadingKey &key, Clock::time_point now, Clock::duration window)
    {
        std::scoped_lock lk(m_);
        auto it = last_persisted_.find(key);
        if (it != last_persisted_.end() && (now - it->second) < window)
            return false;
        last_persisted_[key] = now;
        return true;
    }
};
