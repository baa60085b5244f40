/*
 * File: include/common/reading.hpp
 * Project: Home Hub
 * Purpose: Telemetry reading and sensor status types
 * Notes:
 *  - Wall-clock time points throughout (dashboard shows last_seen)
 *  - Reading JSON keeps the dashboard field names (sensor/prop/temp/ts)
 * Last updated: 2026-10-18
 */

#pragma once
#include <chrono>
#include <cstdint>
#include <ctime>
#include <iomanip>
#include <map>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <tuple>
#include <nlohmann/json.hpp>

using Clock = std::chrono::system_clock;

enum class Property
{
    Temperature,
    Humidity,
    Pressure
};

inline const char *property_name(Property p)
{
    switch (p)
    {
    case Property::Temperature:
        return "temperature";
    case Property::Humidity:
        return "humidity";
    case Property::Pressure:
        return "pressure";
    }
    return "?";
}

inline std::optional<Property> parse_property(std::string_view s)
{
    if (s == "temperature")
        return Property::Temperature;
    if (s == "humidity")
        return Property::Humidity;
    if (s == "pressure")
        return Property::Pressure;
    return std::nullopt;
}

struct Reading
{
    std::string sensor_id;
    Property property{Property::Temperature};
    double value{0.0};
    Clock::time_point observed_at{};
};

// (sensor, property) identity shared by the cache, the throttle and the store
struct ReadingKey
{
    std::string sensor_id;
    Property property{Property::Temperature};

    bool operator<(const ReadingKey &o) const
    {
        return std::tie(sensor_id, property) < std::tie(o.sensor_id, o.property);
    }
    bool operator==(const ReadingKey &o) const
    {
        return sensor_id == o.sensor_id && property == o.property;
    }
};

inline ReadingKey key_of(const Reading &r) { return ReadingKey{r.sensor_id, r.property}; }

struct SensorStatus
{
    std::string sensor_id;
    bool online{false};
    Clock::time_point last_seen{};
    double seconds_since_seen{0.0};
};

using StatusMap = std::map<std::string, SensorStatus>;

// RFC3339 UTC with milliseconds (e.g., 2026-10-18T14:59:01.234Z)
inline std::string format_iso8601_ms(Clock::time_point t)
{
    using namespace std::chrono;
    auto tp = time_point_cast<milliseconds>(t);
    auto ms = duration_cast<milliseconds>(tp.time_since_epoch()) % 1000;
    std::time_t tt = Clock::to_time_t(tp);
    std::tm tm{};
    gmtime_r(&tt, &tm);

    char base[32];
    std::strftime(base, sizeof(base), "%Y-%m-%dT%H:%M:%S", &tm);

    std::ostringstream oss;
    oss << base << '.' << std::setw(3) << std::setfill('0') << ms.count() << 'Z';
    return oss.str();
}

inline std::int64_t to_epoch_ms(Clock::time_point t)
{
    using namespace std::chrono;
    return duration_cast<milliseconds>(t.time_since_epoch()).count();
}

inline Clock::time_point from_epoch_ms(std::int64_t ms)
{
    return Clock::time_point{std::chrono::duration_cast<Clock::duration>(std::chrono::milliseconds{ms})};
}

// "temp" carries the value for every property; the dashboard reads it from there
inline nlohmann::json reading_to_json(const Reading &r)
{
    return nlohmann::json{
        {"sensor", r.sensor_id},
        {"prop", property_name(r.property)},
        {"temp", r.value},
        {"ts", format_iso8601_ms(r.observed_at)},
        {"t_ms", to_epoch_ms(r.observed_at)}};
}

// Throws nlohmann::json::exception on missing fields, std::invalid_argument on an unknown property.
inline Reading reading_from_json(const nlohmann::json &j)
{
    Reading r;
    r.sensor_id = j.at("sensor").get<std::string>();
    auto prop = j.at("prop").get<std::string>();
    auto p = parse_property(prop);
    if (!p)
        throw std::invalid_argument("unknown property: " + prop);
    r.property = *p;
    r.value = j.at("temp").get<double>();
    r.observed_at = from_epoch_ms(j.at("t_ms").get<std::int64_t>());
    return r;
}

inline nlohmann::json status_to_json(const SensorStatus &s)
{
    using namespace std::chrono;
    return nlohmann::json{
        {"online", s.online},
        {"last_seen", duration<double>(s.last_seen.time_since_epoch()).count()},
        {"seconds_ago", s.seconds_since_seen}};
}

inline nlohmann::json status_map_to_json(const StatusMap &m)
{
    nlohmann::json out = nlohmann::json::object();
    for (const auto &[id, s] : m)
        out[id] = status_to_json(s);
    return out;
}
