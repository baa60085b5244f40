/*
 * File: src/hub_startup_buffer.hpp
 * Project: Home Hub
 * Purpose: Bounded FIFO for events produced before the scheduler runs
 * Notes:
 *  - Non-blocking push; a full buffer drops the incoming item
 *  - Drained once; later pushes are refused
 * Last updated: 2026-10-18
 */

#pragma once
#include <cstddef>
#include <deque>
#include <mutex>
#include <vector>

template <typename T>
class StartupBuffer
{
    mutable std::mutex m_;
    std::deque<T> items_;
    std::size_t capacity_;
    std::size_t dropped_{0};
    bool drained_{false};

public:
    explicit StartupBuffer(std::size_t capacity = 1000) : capacity_(capacity) {}

    bool try_push(T item)
    {
        std::scoped_lock lk(m_);
        if (drained_ || items_.size() >= capacity_)
        {
            ++dropped_;
            return false;
        }
        items_.push_back(std::move(item));
        return true;
    }

    // Arrival order; empty on every call after the first.
    std::vector<T> drain()
    {
        std::scoped_lock lk(m_);
        std::vector<T> out;
        if (drained_)
            return out;
        drained_ = true;
        out.reserve(items_.size());
        for (auto &item : items_)
            out.push_back(std::move(item));
        items_.clear();
        return out;
    }

    std::size_t size() const
    {
        std::scoped_lock lk(m_);
        return items_.size();
    }
    std::size_t dropped() const
    {
        std::scoped_lock lk(m_);
        return dropped_;
    }
    std::size_t capacity() const { return capacity_; }
};
