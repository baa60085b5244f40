/*
 * File: src/hub_main.cpp
 * Project: Home Hub
 * Purpose: Main server binary: MQTT ingestion, WS viewers, HTTP API
 * Notes:
 *  - Two execution contexts: the MQTT thread and the scheduler (this thread)
 *  - Durable writes run on a one-thread pool so neither context waits on disk
 *  - Any failure before ioc.run() is fatal
 * Last updated: 2026-10-18
 */

#include <boost/asio.hpp>
#include <spdlog/spdlog.h>

#include <csignal>
#include <exception>
#include <memory>

#include "hub_bridge.hpp"
#include "hub_broadcast.hpp"
#include "hub_config.hpp"
#include "hub_dispatch.hpp"
#include "hub_http.hpp"
#include "hub_log.hpp"
#include "hub_state.hpp"
#include "hub_store.hpp"
#include "hub_sweeper.hpp"
#include "hub_ws.hpp"
#include "mqtt_client.hpp"

int main(int argc, char **argv)
{
    HubConfig config;
    try
    {
        config = load_config(argc, argv);
    }
    catch (const std::exception &e)
    {
        init_logging("info");
        spdlog::critical("configuration error: {}", e.what());
        return 1;
    }
    init_logging(config.log_level);

    try
    {
        HubState state(config.offline_timeout);

        JsonlReadingStore store(config.data_dir);
        auto seed = store.load_current();
        state.cache.load_initial(seed);
        state.store_up = true;
        spdlog::info("loaded {} readings from {}", seed.size(), store.root().string());

        boost::asio::io_context ioc{1};
        BroadcastHub hub(config.max_viewers);
        HubDispatcher dispatcher(state, hub);

        HttpContext http_ctx{state, dispatcher, hub, config.static_dir, frontend_config(config)};
        HttpServer http{ioc, parse_endpoint(config.http_bind, "http bind"), http_ctx};
        WsServer ws{ioc, parse_endpoint(config.ws_bind, "ws bind"), hub, dispatcher, config.heartbeat_idle};

        TimeoutSweeper sweeper(ioc, state.status, dispatcher, config.status_check_interval);

        boost::asio::thread_pool disk{1};
        IngestionBridge bridge(state, store, dispatcher, disk.get_executor(), config.save_throttle,
                               config.startup_buffer_capacity);

        MqttClient::Settings mqtt_settings;
        mqtt_settings.host = config.mqtt_host;
        mqtt_settings.port = config.mqtt_port;
        mqtt_settings.topic_filter = config.topic_filter;
        mqtt_settings.client_id = config.mqtt_client_id;
        mqtt_settings.username = config.mqtt_user;
        mqtt_settings.password = config.mqtt_pass;
        mqtt_settings.keepalive = config.mqtt_keepalive;

        MqttClient mqtt(
            mqtt_settings,
            [&bridge](const std::string &topic, const std::string &payload)
            { bridge.on_message(topic, payload); },
            [&state](bool up)
            { state.transport_up = up; });
        mqtt.start();

        // Messages arriving until this runs are held in the startup buffer.
        auto strand = boost::asio::make_strand(ioc);
        boost::asio::post(ioc, [&bridge, &sweeper, strand]
                          {
            bridge.mark_ready(strand);
            sweeper.start(); });

        boost::asio::signal_set signals(ioc, SIGINT, SIGTERM);
        signals.async_wait([&](const boost::system::error_code &ec, int sig)
                           {
            if (ec)
                return;
            spdlog::info("signal {} received, shutting down", sig);
            sweeper.stop();
            mqtt.stop();
            ws.stop();
            http.stop(); });

        spdlog::info("home hub listening http={} ws={} mqtt={}:{} data={}", config.http_bind, config.ws_bind,
                     config.mqtt_host, config.mqtt_port, config.data_dir);
        ioc.run();
        disk.join();
        spdlog::info("home hub stopped");
        return 0;
    }
    catch (const std::exception &e)
    {
        spdlog::critical("startup failed: {}", e.what());
        return 1;
    }
}
