/*
 * File: src/hub_broadcast.hpp
 * Project: Home Hub
 * Purpose: Capped viewer set and fan-out of serialized messages
 * Notes:
 *  - Runs on the scheduler only, but several interleaved tasks touch the set
 *  - One serialization per broadcast; frames are shared by all viewers
 * Last updated: 2026-10-18
 */

#pragma once
#include <chrono>
#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_set>
#include <vector>
#include <spdlog/spdlog.h>
#include "hub_messages.hpp"

using Frame = std::shared_ptr<const std::string>;

class ViewerConnection
{
public:
    virtual ~ViewerConnection() = default;

    // Queues a frame; false means the connection can no longer deliver.
    virtual bool send(Frame frame) = 0;
    virtual void close() = 0;
    virtual std::string remote() const = 0;
};

struct ConnectResult
{
    bool accepted;
    std::string reason;
};

inline constexpr const char *kMaxConnectionsReason = "Maximum connections reached";

class BroadcastHub
{
    std::mutex m_;
    std::unordered_set<std::shared_ptr<ViewerConnection>> active_;
    std::size_t max_connections_;

public:
    explicit BroadcastHub(std::size_t max_connections = 10) : max_connections_(max_connections) {}

    std::size_t max_connections() const { return max_connections_; }

    ConnectResult connect(const std::shared_ptr<ViewerConnection> &c)
    {
        std::size_t total = 0;
        {
            std::scoped_lock lk(m_);
            if (active_.size() >= max_connections_)
            {
                spdlog::warn("viewer {} rejected: {} ({}/{})", c->remote(), kMaxConnectionsReason,
                             active_.size(), max_connections_);
                return {false, kMaxConnectionsReason};
            }
            active_.insert(c);
            total = active_.size();
        }
        spdlog::info("viewer connected: {} (total {}/{})", c->remote(), total, max_connections_);
        return {true, {}};
    }

    // Idempotent; safe from error paths.
    void disconnect(const std::shared_ptr<ViewerConnection> &c)
    {
        std::size_t total = 0;
        {
            std::scoped_lock lk(m_);
            if (active_.erase(c) == 0)
                return;
            total = active_.size();
        }
        spdlog::info("viewer disconnected: {} (total {}/{})", c->remote(), total, max_connections_);
    }

    // Returns the number of viewers the frame was queued to.
    std::size_t broadcast(const HubMessage &msg)
    {
        if (active_count() == 0)
            return 0;
        return broadcast_frame(std::make_shared<const std::string>(serialize(msg)));
    }

    std::size_t broadcast_frame(const Frame &frame)
    {
        std::vector<std::shared_ptr<ViewerConnection>> targets;
        {
            std::scoped_lock lk(m_);
            targets.assign(active_.begin(), active_.end());
        }

        std::size_t delivered = 0;
        std::vector<std::shared_ptr<ViewerConnection>> failed;
        for (auto &c : targets)
        {
            if (c->send(frame))
                ++delivered;
            else
                failed.push_back(c);
        }
        for (auto &c : failed)
        {
            spdlog::warn("send to viewer {} failed, dropping it", c->remote());
            disconnect(c);
            c->close();
        }
        return delivered;
    }

    // Shutdown: empties the set, then closes every viewer outside the lock.
    void close_all()
    {
        std::vector<std::shared_ptr<ViewerConnection>> targets;
        {
            std::scoped_lock lk(m_);
            targets.assign(active_.begin(), active_.end());
            active_.clear();
        }
        for (auto &c : targets)
            c->close();
    }

    std::size_t active_count()
    {
        std::scoped_lock lk(m_);
        return active_.size();
    }
};
