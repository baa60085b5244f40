/*
 * File: src/hub_ws.hpp
 * Project: Home Hub
 * Purpose: WebSocket viewer endpoint
 * Notes:
 *  - Admission goes through BroadcastHub; rejected viewers get close code 1008
 *  - One write in flight per session, frames queued behind it
 *  - Idle sessions receive a heartbeat after the configured quiet period
 * Last updated: 2026-10-18
 */

#pragma once
#include <boost/beast/core.hpp>
#include <boost/beast/websocket.hpp>
#include <boost/asio.hpp>
#include <chrono>
#include <deque>
#include <memory>
#include <stdexcept>
#include <string>
#include <spdlog/spdlog.h>
#include "hub_broadcast.hpp"
#include "hub_dispatch.hpp"
#include "hub_messages.hpp"

namespace websocket = boost::beast::websocket;

class WsServer
{
    boost::asio::ip::tcp::acceptor acceptor_;
    boost::asio::ip::tcp::socket socket_;
    BroadcastHub &hub_;
    HubDispatcher &dispatcher_;
    std::chrono::steady_clock::duration heartbeat_idle_;

public:
    WsServer(boost::asio::io_context &ioc, boost::asio::ip::tcp::endpoint ep, BroadcastHub &hub,
             HubDispatcher &dispatcher, std::chrono::steady_clock::duration heartbeat_idle = std::chrono::seconds(30))
        : acceptor_(ioc), socket_(ioc), hub_(hub), dispatcher_(dispatcher), heartbeat_idle_(heartbeat_idle)
    {
        boost::system::error_code ec;
        acceptor_.open(ep.protocol(), ec);
        if (!ec)
            acceptor_.set_option(boost::asio::socket_base::reuse_address(true), ec);
        if (!ec)
            acceptor_.bind(ep, ec);
        if (!ec)
            acceptor_.listen(boost::asio::socket_base::max_listen_connections, ec);
        if (ec)
            throw std::runtime_error("ws listen on " + ep.address().to_string() + ":" +
                                     std::to_string(ep.port()) + " failed: " + ec.message());
        do_accept();
    }

    unsigned short port() const { return acceptor_.local_endpoint().port(); }

    void stop()
    {
        boost::system::error_code ignored;
        acceptor_.close(ignored);
        hub_.close_all();
    }

private:
    void do_accept()
    {
        acceptor_.async_accept(socket_, [this](boost::system::error_code ec)
                               {
            if (ec == boost::asio::error::operation_aborted)
                return;
            if (!ec)
                std::make_shared<Session>(std::move(socket_), hub_, dispatcher_, heartbeat_idle_)->run();
            else
                spdlog::warn("ws accept failed: {}", ec.message());
            do_accept(); });
    }

    class Session : public ViewerConnection, public std::enable_shared_from_this<Session>
    {
        static constexpr std::size_t kMaxPendingFrames = 64;

        websocket::stream<boost::asio::ip::tcp::socket> ws_;
        boost::beast::flat_buffer buffer_;
        BroadcastHub &hub_;
        HubDispatcher &dispatcher_;
        boost::asio::steady_timer heartbeat_;
        std::chrono::steady_clock::duration heartbeat_idle_;
        std::deque<Frame> outbox_;
        std::string remote_;
        bool closed_ = false;
        bool close_pending_ = false;

    public:
        Session(boost::asio::ip::tcp::socket &&s, BroadcastHub &hub, HubDispatcher &dispatcher,
                std::chrono::steady_clock::duration heartbeat_idle)
            : ws_(std::move(s)), hub_(hub), dispatcher_(dispatcher),
              heartbeat_(ws_.get_executor()), heartbeat_idle_(heartbeat_idle)
        {
            boost::system::error_code ec;
            auto ep = ws_.next_layer().remote_endpoint(ec);
            remote_ = ec ? std::string("unknown") : ep.address().to_string() + ":" + std::to_string(ep.port());
        }

        void run()
        {
            ws_.set_option(websocket::stream_base::timeout::suggested(boost::beast::role_type::server));
            auto self = shared_from_this();
            ws_.async_accept([self](boost::system::error_code ec)
                             { self->on_accept(ec); });
        }

        bool send(Frame frame) override
        {
            if (closed_ || outbox_.size() >= kMaxPendingFrames)
                return false;
            outbox_.push_back(std::move(frame));
            if (outbox_.size() == 1)
                do_write();
            return true;
        }

        void close() override
        {
            if (closed_)
                return;
            closed_ = true;
            heartbeat_.cancel();
            hub_.disconnect(shared_from_this());
            // async_close is a write; it must wait for the one in flight.
            if (outbox_.empty())
                do_close();
            else
                close_pending_ = true;
        }

        std::string remote() const override { return remote_; }

    private:
        void on_accept(boost::system::error_code ec)
        {
            if (ec)
            {
                spdlog::warn("ws handshake from {} failed: {}", remote_, ec.message());
                return;
            }
            auto self = shared_from_this();
            auto admission = hub_.connect(self);
            if (!admission.accepted)
            {
                closed_ = true;
                ws_.async_close(websocket::close_reason(websocket::close_code::policy_error, admission.reason),
                                [self](boost::system::error_code) {});
                return;
            }
            send(std::make_shared<const std::string>(serialize(dispatcher_.initial_message())));
            arm_heartbeat();
            do_read();
        }

        void do_read()
        {
            auto self = shared_from_this();
            ws_.async_read(buffer_, [self](boost::system::error_code ec, std::size_t n)
                           { self->on_read(ec, n); });
        }

        void on_read(boost::system::error_code ec, std::size_t n)
        {
            if (ec)
            {
                if (ec != websocket::error::closed && ec != boost::asio::error::operation_aborted)
                    spdlog::debug("ws read from {} ended: {}", remote_, ec.message());
                fail();
                return;
            }
            // Inbound content is not interpreted; it only proves the viewer is alive.
            buffer_.consume(n);
            arm_heartbeat();
            do_read();
        }

        void arm_heartbeat()
        {
            if (closed_)
                return;
            heartbeat_.expires_after(heartbeat_idle_);
            auto self = shared_from_this();
            heartbeat_.async_wait([self](boost::system::error_code ec)
                                  {
                if (ec || self->closed_)
                    return;
                if (!self->send(std::make_shared<const std::string>(serialize(HeartbeatMessage{}))))
                {
                    self->fail();
                    return;
                }
                self->arm_heartbeat(); });
        }

        void do_write()
        {
            auto self = shared_from_this();
            ws_.text(true);
            ws_.async_write(boost::asio::buffer(*outbox_.front()), [self](boost::system::error_code ec, std::size_t)
                            { self->on_write(ec); });
        }

        void on_write(boost::system::error_code ec)
        {
            if (ec)
            {
                if (ec != boost::asio::error::operation_aborted)
                    spdlog::warn("ws send to {} failed: {}", remote_, ec.message());
                fail();
                return;
            }
            outbox_.pop_front();
            if (close_pending_)
            {
                close_pending_ = false;
                outbox_.clear();
                do_close();
                return;
            }
            if (!outbox_.empty() && !closed_)
                do_write();
        }

        void do_close()
        {
            auto self = shared_from_this();
            ws_.async_close(websocket::close_code::normal, [self](boost::system::error_code) {});
        }

        // Hard teardown after a transport error.
        void fail()
        {
            if (closed_ && !close_pending_)
                return;
            closed_ = true;
            close_pending_ = false;
            heartbeat_.cancel();
            hub_.disconnect(shared_from_this());
            boost::system::error_code ignored;
            ws_.next_layer().close(ignored);
        }
    };
};
