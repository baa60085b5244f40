/*
 * File: src/mqtt_client.hpp
 * Project: Home Hub
 * Purpose: MQTT subscriber for sensor telemetry (Paho MQTT C++)
 * Notes:
 *  - Message and link callbacks run on Paho's own thread (the transport thread)
 *  - start() blocks until the first CONNACK; later link loss reconnects with backoff
 *  - Clean sessions: the subscription is renewed on every (re)connect
 * Last updated: 2026-10-18
 */

#pragma once
#include <mqtt/async_client.h>
#include <spdlog/spdlog.h>

#include <chrono>
#include <cstdint>
#include <exception>
#include <functional>
#include <stdexcept>
#include <string>
#include <utility>

inline std::string broker_uri(const std::string &host, std::uint16_t port)
{
    return "tcp://" + host + ":" + std::to_string(port);
}

class MqttClient
{
public:
    using MessageHandler = std::function<void(const std::string &topic, const std::string &payload)>;
    using LinkHandler = std::function<void(bool up)>;

    struct Settings
    {
        std::string host = "localhost";
        std::uint16_t port = 1883;
        std::string client_id = "home-hub";
        std::string username;
        std::string password;
        std::chrono::seconds keepalive{60};
        std::string topic_filter = "pico/+/+";
        std::chrono::seconds connect_timeout{10};
        std::chrono::seconds min_backoff{1};
        std::chrono::seconds max_backoff{120};
    };

    MqttClient(Settings settings, MessageHandler on_message, LinkHandler on_link = {})
        : settings_(std::move(settings)), on_message_(std::move(on_message)), on_link_(std::move(on_link)),
          subscribe_listener_(settings_.topic_filter),
          client_(broker_uri(settings_.host, settings_.port), settings_.client_id)
    {
        client_.set_message_callback([this](mqtt::const_message_ptr msg)
                                     { handle_message(*msg); });
        client_.set_connected_handler([this](const std::string &)
                                      { on_connected(); });
        client_.set_connection_lost_handler([this](const std::string &cause)
                                            {
            spdlog::warn("mqtt link lost: {}", cause.empty() ? "unknown cause" : cause);
            if (on_link_)
                on_link_(false); });
    }

    MqttClient(const MqttClient &) = delete;
    MqttClient &operator=(const MqttClient &) = delete;

    ~MqttClient() { stop(); }

    // Throws mqtt::exception (a std::runtime_error) if the broker is unreachable or refuses the session.
    void start()
    {
        auto builder = mqtt::connect_options_builder()
                           .clean_session(true)
                           .keep_alive_interval(settings_.keepalive)
                           .connect_timeout(settings_.connect_timeout)
                           .automatic_reconnect(settings_.min_backoff, settings_.max_backoff);
        if (!settings_.username.empty())
            builder.user_name(settings_.username).password(settings_.password);

        spdlog::info("mqtt connecting to {}", client_.get_server_uri());
        client_.connect(builder.finalize())->wait();
    }

    // Also ends a reconnect loop in progress. Idempotent.
    void stop()
    {
        if (stopped_)
            return;
        stopped_ = true;
        try
        {
            client_.disconnect()->wait();
            spdlog::info("mqtt client stopped");
        }
        catch (const mqtt::exception &e)
        {
            spdlog::debug("mqtt disconnect: {}", e.what());
        }
    }

    bool connected() const { return client_.is_connected(); }

private:
    class SubscribeListener : public mqtt::iaction_listener
    {
        std::string filter_;

    public:
        explicit SubscribeListener(std::string filter) : filter_(std::move(filter)) {}

        void on_success(const mqtt::token &) override
        {
            spdlog::info("mqtt subscribed to '{}'", filter_);
        }
        void on_failure(const mqtt::token &tok) override
        {
            spdlog::error("mqtt subscription to '{}' refused (rc {})", filter_, tok.get_return_code());
        }
    };

    Settings settings_;
    MessageHandler on_message_;
    LinkHandler on_link_;
    SubscribeListener subscribe_listener_;
    mqtt::async_client client_;
    bool stopped_ = false;

    void on_connected()
    {
        spdlog::info("mqtt connected to {}", client_.get_server_uri());
        if (on_link_)
            on_link_(true);
        try
        {
            client_.subscribe(settings_.topic_filter, 0, nullptr, subscribe_listener_);
        }
        catch (const mqtt::exception &e)
        {
            spdlog::error("mqtt subscribe to '{}' failed: {}", settings_.topic_filter, e.what());
        }
    }

    void handle_message(const mqtt::message &msg)
    {
        try
        {
            on_message_(msg.get_topic(), msg.to_string());
        }
        catch (const std::exception &e)
        {
            spdlog::error("mqtt message handler failed on '{}': {}", msg.get_topic(), e.what());
        }
    }
};
