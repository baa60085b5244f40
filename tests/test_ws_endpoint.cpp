/*
 * File: tests/test_ws_endpoint.cpp
 * Project: Home Hub
 * Purpose: WebSocket viewer admission over loopback
 * Notes:
 *  - Server runs on a background io_context; clients are synchronous
 * Last updated: 2026-10-18
 */

#include <catch2/catch_all.hpp>
#include <boost/asio.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/websocket.hpp>
#include <chrono>
#include <string>
#include <thread>
#include <nlohmann/json.hpp>
#include "hub_ws.hpp"

using namespace std::chrono_literals;
namespace beast = boost::beast;
using tcp = boost::asio::ip::tcp;

namespace
{
    struct Client
    {
        boost::asio::io_context ioc;
        websocket::stream<tcp::socket> ws{ioc};

        explicit Client(unsigned short port)
        {
            ws.next_layer().connect({boost::asio::ip::make_address("127.0.0.1"), port});
            ws.handshake("127.0.0.1:" + std::to_string(port), "/ws");
        }

        nlohmann::json read()
        {
            beast::flat_buffer buf;
            ws.read(buf);
            return nlohmann::json::parse(beast::buffers_to_string(buf.data()));
        }
    };
}

TEST_CASE("viewers get an initial message and the cap is enforced")
{
    boost::asio::io_context ioc;
    HubState state(30s);
    BroadcastHub hub(1);
    HubDispatcher dispatcher(state, hub);
    state.cache.put({"kitchen", Property::Temperature, 21.5, Clock::now()});

    WsServer server(ioc, {boost::asio::ip::make_address("127.0.0.1"), 0}, hub, dispatcher, 30s);
    auto work = boost::asio::make_work_guard(ioc);
    std::thread runner([&]
                       { ioc.run(); });

    {
        Client first(server.port());
        auto initial = first.read();
        REQUIRE(initial["type"] == "initial");
        REQUIRE(initial["sensors"][0]["sensor"] == "kitchen");

        Client second(server.port());
        beast::flat_buffer buf;
        beast::error_code ec;
        second.ws.read(buf, ec);
        REQUIRE(ec == websocket::error::closed);
        REQUIRE(second.ws.reason().code == websocket::close_code::policy_error);
        const auto &why = second.ws.reason().reason;
        REQUIRE(std::string(why.data(), why.size()) == "Maximum connections reached");

        boost::asio::post(ioc, [&]
                          { dispatcher.publish_feed(FeedKind::Nameday, "Lukas"); });
        auto feed = first.read();
        REQUIRE(feed["type"] == "nameday");
        REQUIRE(feed["data"] == "Lukas");
    }

    boost::asio::post(ioc, [&]
                      { server.stop(); });
    work.reset();
    runner.join();
    REQUIRE(hub.active_count() == 0);
}

TEST_CASE("an idle viewer receives heartbeats")
{
    boost::asio::io_context ioc;
    HubState state(30s);
    BroadcastHub hub(10);
    HubDispatcher dispatcher(state, hub);

    WsServer server(ioc, {boost::asio::ip::make_address("127.0.0.1"), 0}, hub, dispatcher, 50ms);
    auto work = boost::asio::make_work_guard(ioc);
    std::thread runner([&]
                       { ioc.run(); });

    {
        Client viewer(server.port());
        REQUIRE(viewer.read()["type"] == "initial");
        REQUIRE(viewer.read() == nlohmann::json{{"type", "heartbeat"}});
    }

    boost::asio::post(ioc, [&]
                      { server.stop(); });
    work.reset();
    runner.join();
}
