/*
 * File: src/hub_http.hpp
 * Project: Home Hub
 * Purpose: HTTP routing and handlers
 * Notes:
 *  - Runs on the scheduler; handlers read the same state viewers see
 *  - /api/feeds/{kind} is the entry point for external pollers
 * Last updated: 2026-10-18
 */

#pragma once
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/version.hpp>
#include <boost/asio.hpp>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <chrono>
#include <filesystem>
#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>

#include "atomic_write.hpp"
#include "hub_broadcast.hpp"
#include "hub_dispatch.hpp"
#include "hub_state.hpp"

namespace http = boost::beast::http;

struct HttpContext
{
    HubState &state;
    HubDispatcher &dispatcher;
    BroadcastHub &hub;
    std::filesystem::path static_dir;
    nlohmann::json frontend_config;
};

using HttpRequest = http::request<http::string_body>;
using HttpResponse = http::response<http::string_body>;

inline HttpResponse json_response(const HttpRequest &req, http::status st, const nlohmann::json &body)
{
    HttpResponse res{st, req.version()};
    res.set(http::field::content_type, "application/json");
    res.body() = body.dump();
    res.prepare_payload();
    return res;
}

inline HttpResponse route_request(const HttpRequest &req, HttpContext &ctx)
{
    using nlohmann::json;
    const std::string target(req.target());

    // GET /
    if (req.method() == http::verb::get && (target == "/" || target == "/index.html"))
    {
        std::string page;
        HttpResponse res{http::status::ok, req.version()};
        if (read_file_all(ctx.static_dir / "index.html", page))
        {
            res.set(http::field::content_type, "text/html; charset=utf-8");
            res.body() = std::move(page);
        }
        else
        {
            res.result(http::status::not_found);
            res.set(http::field::content_type, "text/plain");
            res.body() = "index.html not found";
        }
        res.prepare_payload();
        return res;
    }

    // GET /health
    if (req.method() == http::verb::get && target == "/health")
    {
        auto up = std::chrono::duration<double>(std::chrono::steady_clock::now() - ctx.state.start).count();
        return json_response(req, http::status::ok,
                             json{{"status", "ok"},
                                  {"uptime_s", up},
                                  {"mqtt", ctx.state.transport_up.load()},
                                  {"database", ctx.state.store_up.load()},
                                  {"viewers", ctx.hub.active_count()}});
    }

    // GET /api/sensors
    if (req.method() == http::verb::get && target == "/api/sensors")
        return json_response(req, http::status::ok, readings_to_json(ctx.state.cache.get_all()));

    // GET /api/sensors/status
    if (req.method() == http::verb::get && target == "/api/sensors/status")
        return json_response(req, http::status::ok, status_map_to_json(ctx.state.status.snapshot(Clock::now())));

    // GET /api/config
    if (req.method() == http::verb::get && target == "/api/config")
        return json_response(req, http::status::ok, ctx.frontend_config);

    // POST /api/feeds/{kind}   body: any JSON value, broadcast as {"type": kind, "data": body}
    constexpr std::string_view feeds_prefix = "/api/feeds/";
    if (req.method() == http::verb::post && target.rfind(feeds_prefix, 0) == 0)
    {
        auto kind = parse_feed_kind(std::string_view(target).substr(feeds_prefix.size()));
        if (!kind)
            return json_response(req, http::status::not_found, json{{"error", "unknown feed"}});

        auto body = json::parse(req.body(), nullptr, false);
        if (body.is_discarded())
            return json_response(req, http::status::bad_request, json{{"error", "bad json"}});

        ctx.dispatcher.publish_feed(*kind, std::move(body));
        return json_response(req, http::status::accepted, json{{"status", "accepted"}, {"feed", feed_kind_name(*kind)}});
    }

    // 404 fallback
    return json_response(req, http::status::not_found, json{{"error", "not found"}});
}

class HttpServer
{
    boost::asio::ip::tcp::acceptor acceptor_;
    boost::asio::ip::tcp::socket socket_;
    HttpContext &ctx_;

public:
    HttpServer(boost::asio::io_context &ioc, boost::asio::ip::tcp::endpoint ep, HttpContext &ctx)
        : acceptor_(ioc), socket_(ioc), ctx_(ctx)
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
            throw std::runtime_error("http listen on " + ep.address().to_string() + ":" +
                                     std::to_string(ep.port()) + " failed: " + ec.message());
        do_accept();
    }

    void stop()
    {
        boost::system::error_code ignored;
        acceptor_.close(ignored);
    }

private:
    void do_accept()
    {
        acceptor_.async_accept(socket_, [this](boost::system::error_code ec)
                               {
            if (ec == boost::asio::error::operation_aborted)
                return;
            if (!ec) std::make_shared<Session>(std::move(socket_), ctx_)->run();
            do_accept(); });
    }

    struct Session : std::enable_shared_from_this<Session>
    {
        boost::asio::ip::tcp::socket socket;
        boost::beast::flat_buffer buffer;
        HttpRequest req;
        HttpContext &ctx;

        Session(boost::asio::ip::tcp::socket &&s, HttpContext &c)
            : socket(std::move(s)), ctx(c) {}

        void run() { do_read(); }

        void do_read()
        {
            auto self = shared_from_this();
            http::async_read(socket, buffer, req, [self](boost::beast::error_code ec, std::size_t)
                             {
                if (!ec) self->handle(); });
        }

        // keep response alive through async_write
        void respond(HttpResponse &&res)
        {
            auto self = shared_from_this();
            auto sp = std::make_shared<HttpResponse>(std::move(res));
            sp->set(http::field::server, "home-hub");

            http::async_write(socket, *sp, [self, sp](boost::beast::error_code, std::size_t)
                              {
                boost::system::error_code ignored;
                self->socket.shutdown(boost::asio::ip::tcp::socket::shutdown_send, ignored); });
        }

        void handle()
        {
            try
            {
                respond(route_request(req, ctx));
            }
            catch (const std::exception &e)
            {
                spdlog::error("http {} {} failed: {}", std::string(req.method_string()), std::string(req.target()), e.what());
                respond(json_response(req, http::status::internal_server_error,
                                      nlohmann::json{{"error", "internal"}, {"what", e.what()}}));
            }
        }
    };
};
