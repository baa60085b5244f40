/*
 * File: services/sensor_sim/sensor_sim_main.cpp
 * Project: Home Hub
 * Purpose: Publishes synthetic sensor readings to the broker
 * Notes:
 *  - Topic layout matches the sensors: pico/{property}/{sensor}
 *  - Blocking publisher; meant for manual end-to-end runs
 * Last updated: 2026-10-18
 */

#include <mqtt/async_client.h>
#include <spdlog/spdlog.h>

#include <chrono>
#include <cmath>
#include <cstdint>
#include <iomanip>
#include <sstream>
#include <string>
#include <thread>

#include "mqtt_client.hpp"

int main(int argc, char **argv)
{
    try
    {
        std::string host = "localhost";
        std::string port = "1883";
        std::string sensor = "kitchen";
        std::string property = "temperature";
        double base = 21.5;
        double amplitude = 0.5;
        int count = 10;
        int interval_ms = 2000;

        for (int i = 1; i < argc; ++i)
        {
            std::string a = argv[i];
            if (a == "--host" && i + 1 < argc)
                host = argv[++i];
            else if (a == "--port" && i + 1 < argc)
                port = argv[++i];
            else if (a == "--sensor" && i + 1 < argc)
                sensor = argv[++i];
            else if (a == "--property" && i + 1 < argc)
                property = argv[++i];
            else if (a == "--value" && i + 1 < argc)
                base = std::stod(argv[++i]);
            else if (a == "--amplitude" && i + 1 < argc)
                amplitude = std::stod(argv[++i]);
            else if (a == "--count" && i + 1 < argc)
                count = std::stoi(argv[++i]);
            else if (a == "--interval-ms" && i + 1 < argc)
                interval_ms = std::stoi(argv[++i]);
        }

        mqtt::async_client client(broker_uri(host, static_cast<std::uint16_t>(std::stoi(port))),
                                  "sensor-sim-" + sensor);
        auto opts = mqtt::connect_options_builder()
                        .clean_session(true)
                        .connect_timeout(std::chrono::seconds(10))
                        .finalize();
        client.connect(opts)->wait();
        spdlog::info("connected to {}", client.get_server_uri());

        const std::string topic = "pico/" + property + "/" + sensor;
        for (int k = 0; k < count; ++k)
        {
            double v = base + amplitude * std::sin(k * 0.7);
            std::ostringstream payload;
            payload << std::fixed << std::setprecision(2) << v;

            client.publish(mqtt::make_message(topic, payload.str()))->wait();
            spdlog::info("sent {} = {} ({}/{})", topic, payload.str(), k + 1, count);
            std::this_thread::sleep_for(std::chrono::milliseconds(interval_ms));
        }

        client.disconnect()->wait();
        return 0;
    }
    catch (const std::exception &e)
    {
        spdlog::error("sensor_sim error: {}", e.what());
        return 1;
    }
}
