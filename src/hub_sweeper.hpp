/*
 * File: src/hub_sweeper.hpp
 * Project: Home Hub
 * Purpose: Periodic offline detection
 * Notes:
 *  - Each online->offline flip is reported once; StatusTracker keeps the flag
 * Last updated: 2026-10-18
 */

#pragma once
#include <chrono>
#include <boost/asio.hpp>
#include <spdlog/spdlog.h>
#include "hub_messages.hpp"
#include "hub_status.hpp"

class TimeoutSweeper
{
    boost::asio::steady_timer timer_;
    StatusTracker &status_;
    EventSink &sink_;
    std::chrono::steady_clock::duration period_;
    bool running_ = false;

public:
    TimeoutSweeper(boost::asio::io_context &ioc, StatusTracker &status, EventSink &sink,
                   std::chrono::steady_clock::duration period = std::chrono::seconds(5))
        : timer_(ioc), status_(status), sink_(sink), period_(period) {}

    void start()
    {
        running_ = true;
        arm();
    }

    void stop()
    {
        running_ = false;
        timer_.cancel();
    }

    // One sweep; returns the number of transitions reported.
    std::size_t tick(Clock::time_point now)
    {
        auto flipped = status_.sweep(now);
        for (const auto &t : flipped)
            sink_.on_event(StatusChangeEvent{t.sensor_id, t.online});
        return flipped.size();
    }

private:
    void arm()
    {
        timer_.expires_after(period_);
        timer_.async_wait([this](const boost::system::error_code &ec)
                          {
            if (ec == boost::asio::error::operation_aborted || !running_)
                return;
            try
            {
                tick(Clock::now());
            }
            catch (const std::exception &e)
            {
                spdlog::error("status sweep failed: {}", e.what());
            }
            arm(); });
    }
};
