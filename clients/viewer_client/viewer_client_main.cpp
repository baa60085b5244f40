/*
 * File: clients/viewer_client/viewer_client_main.cpp
 * Project: Home Hub
 * Purpose: Example WebSocket viewer; prints every hub message
 * Last updated: 2026-10-18
 */

#include <iostream>
#include <string>
#include <boost/asio.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/websocket.hpp>
#include <nlohmann/json.hpp>

using json = nlohmann::json;
namespace websocket = boost::beast::websocket;

static void parse_ws_url(const std::string &ws_url,
                         std::string &host, std::string &port, std::string &target)
{
    // expect ws://host:port/path
    auto scheme_pos = ws_url.find("://");
    auto rest = (scheme_pos == std::string::npos) ? ws_url : ws_url.substr(scheme_pos + 3);
    auto slash = rest.find('/');
    std::string hp = (slash == std::string::npos) ? rest : rest.substr(0, slash);
    target = (slash == std::string::npos) ? "/" : rest.substr(slash);
    auto colon = hp.find(':');
    if (colon == std::string::npos)
    {
        host = hp;
        port = "80";
    }
    else
    {
        host = hp.substr(0, colon);
        port = hp.substr(colon + 1);
    }
}

int main(int argc, char **argv)
{
    std::string ws_url = "ws://localhost:8001/ws";
    bool pretty = false;
    for (int i = 1; i < argc; ++i)
    {
        std::string a = argv[i];
        if (a == "--ws" && i + 1 < argc)
            ws_url = argv[++i];
        else if (a == "--pretty")
            pretty = true;
    }

    try
    {
        std::string host, port, target;
        parse_ws_url(ws_url, host, port, target);

        boost::asio::io_context ioc;
        boost::asio::ip::tcp::resolver res{ioc};
        auto const results = res.resolve(host, port);
        boost::asio::ip::tcp::socket sock{ioc};
        boost::asio::connect(sock, results.begin(), results.end());
        websocket::stream<boost::asio::ip::tcp::socket> ws{std::move(sock)};
        ws.handshake(host, target);
        std::cerr << "viewer: connected to " << ws_url << "\n";

        boost::beast::flat_buffer buf;
        while (true)
        {
            ws.read(buf);
            auto s = boost::beast::buffers_to_string(buf.data());
            buf.consume(buf.size());
            auto j = json::parse(s, nullptr, false);
            if (!j.is_object())
            {
                std::cout << "viewer: non-JSON frame: " << s << "\n";
                continue;
            }
            std::cout << "[" << j.value("type", std::string("?")) << "] " << (pretty ? j.dump(2) : j.dump()) << std::endl;
        }
    }
    catch (const boost::system::system_error &e)
    {
        if (e.code() == websocket::error::closed)
        {
            std::cerr << "viewer: closed by hub\n";
            return 0;
        }
        std::cerr << "viewer error: " << e.what() << "\n";
        return 1;
    }
    catch (const std::exception &e)
    {
        std::cerr << "viewer error: " << e.what() << "\n";
        return 1;
    }
}
