/*
 * File: src/hub_config.hpp
 * Project: Home Hub
 * Purpose: Process configuration (environment, then command-line overrides)
 * Notes:
 *  - Invalid values throw std::invalid_argument naming the key
 * Last updated: 2026-10-18
 */

#pragma once
#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <stdexcept>
#include <string>
#include <utility>
#include <boost/asio/ip/tcp.hpp>
#include <nlohmann/json.hpp>

struct HubConfig
{
    std::string mqtt_host = "localhost";
    std::uint16_t mqtt_port = 1883;
    std::string mqtt_user;
    std::string mqtt_pass;
    std::string mqtt_client_id = "home-hub";
    std::string topic_filter = "pico/+/+";
    std::chrono::seconds mqtt_keepalive{60};

    std::string http_bind = "0.0.0.0:8000";
    std::string ws_bind = "0.0.0.0:8001";
    std::string data_dir = "./data";
    std::string static_dir = "./static";
    std::string log_level = "info";

    std::chrono::seconds save_throttle{5};
    std::chrono::seconds offline_timeout{30};
    std::chrono::seconds status_check_interval{5};
    std::chrono::seconds heartbeat_idle{30};
    std::size_t startup_buffer_capacity = 1000;
    std::size_t max_viewers = 10;
};

// "host:port" -> (host, port)
inline std::pair<std::string, std::uint16_t> split_host_port(const std::string &s, const char *key)
{
    auto p = s.rfind(':');
    if (p == std::string::npos || p == 0 || p + 1 == s.size())
        throw std::invalid_argument(std::string(key) + ": expected host:port, got '" + s + "'");
    unsigned long port = 0;
    try
    {
        std::size_t used = 0;
        port = std::stoul(s.substr(p + 1), &used);
        if (used != s.size() - p - 1)
            throw std::invalid_argument("trailing characters");
    }
    catch (const std::exception &)
    {
        throw std::invalid_argument(std::string(key) + ": bad port in '" + s + "'");
    }
    if (port == 0 || port > 65535)
        throw std::invalid_argument(std::string(key) + ": port out of range in '" + s + "'");
    return {s.substr(0, p), static_cast<std::uint16_t>(port)};
}

inline boost::asio::ip::tcp::endpoint parse_endpoint(const std::string &s, const char *key)
{
    auto [host, port] = split_host_port(s, key);
    boost::system::error_code ec;
    auto addr = boost::asio::ip::make_address(host, ec);
    if (ec)
        throw std::invalid_argument(std::string(key) + ": bad address '" + host + "'");
    return {addr, port};
}

inline long parse_positive(const std::string &v, const char *key)
{
    std::size_t used = 0;
    long n = 0;
    try
    {
        n = std::stol(v, &used);
    }
    catch (const std::exception &)
    {
        used = 0;
    }
    if (used != v.size() || n <= 0)
        throw std::invalid_argument(std::string(key) + ": expected a positive integer, got '" + v + "'");
    return n;
}

using EnvLookup = const char *(*)(const char *);

// std::getenv returns char *, which EnvLookup does not accept directly.
inline const char *process_env(const char *key) { return std::getenv(key); }

inline HubConfig load_config(int argc, const char *const *argv, EnvLookup env = &process_env)
{
    HubConfig c;

    auto str = [&](const char *key, std::string &dst)
    {
        if (const char *v = env(key); v && *v)
            dst = v;
    };
    auto secs = [&](const char *key, std::chrono::seconds &dst)
    {
        if (const char *v = env(key); v && *v)
            dst = std::chrono::seconds(parse_positive(v, key));
    };
    auto count = [&](const char *key, std::size_t &dst)
    {
        if (const char *v = env(key); v && *v)
            dst = static_cast<std::size_t>(parse_positive(v, key));
    };

    str("MQTT_BROKER", c.mqtt_host);
    if (const char *v = env("MQTT_PORT"); v && *v)
    {
        long port = parse_positive(v, "MQTT_PORT");
        if (port > 65535)
            throw std::invalid_argument("MQTT_PORT: out of range");
        c.mqtt_port = static_cast<std::uint16_t>(port);
    }
    str("MQTT_USER", c.mqtt_user);
    str("MQTT_PASS", c.mqtt_pass);
    str("MQTT_CLIENT_ID", c.mqtt_client_id);
    secs("MQTT_KEEPALIVE", c.mqtt_keepalive);
    secs("MQTT_SAVE_THROTTLE", c.save_throttle);
    secs("SENSOR_OFFLINE_TIMEOUT", c.offline_timeout);
    secs("SENSOR_STATUS_CHECK_INTERVAL", c.status_check_interval);
    secs("WS_HEARTBEAT_IDLE", c.heartbeat_idle);
    count("STARTUP_BUFFER_CAPACITY", c.startup_buffer_capacity);
    count("MAX_VIEWERS", c.max_viewers);
    str("HTTP_BIND", c.http_bind);
    str("WS_BIND", c.ws_bind);
    str("DATA_DIR", c.data_dir);
    str("STATIC_DIR", c.static_dir);
    str("LOG_LEVEL", c.log_level);

    for (int i = 1; i < argc; ++i)
    {
        std::string a = argv[i];
        if (a == "--mqtt" && i + 1 < argc)
        {
            auto [host, port] = split_host_port(argv[++i], "--mqtt");
            c.mqtt_host = host;
            c.mqtt_port = port;
        }
        else if (a == "--http" && i + 1 < argc)
            c.http_bind = argv[++i];
        else if (a == "--ws" && i + 1 < argc)
            c.ws_bind = argv[++i];
        else if (a == "--data" && i + 1 < argc)
            c.data_dir = argv[++i];
        else if (a == "--static" && i + 1 < argc)
            c.static_dir = argv[++i];
        else if (a == "--log-level" && i + 1 < argc)
            c.log_level = argv[++i];
        else
            throw std::invalid_argument("unknown or incomplete option: " + a);
    }

    // Fail on malformed binds now rather than at listen time.
    parse_endpoint(c.http_bind, "http bind");
    parse_endpoint(c.ws_bind, "ws bind");
    return c;
}

// Values the dashboard needs to pace itself.
inline nlohmann::json frontend_config(const HubConfig &c)
{
    return nlohmann::json{
        {"save_throttle_s", c.save_throttle.count()},
        {"offline_timeout_s", c.offline_timeout.count()},
        {"status_check_interval_s", c.status_check_interval.count()},
        {"heartbeat_idle_s", c.heartbeat_idle.count()},
        {"max_viewers", c.max_viewers}};
}
