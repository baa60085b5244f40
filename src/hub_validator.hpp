/*
 * File: src/hub_validator.hpp
 * Project: Home Hub
 * Purpose: Topic parsing and telemetry validation
 * Notes:
 *  - Pure functions, safe on any thread
 *  - Rejections are values, never exceptions
 * Last updated: 2026-10-18
 */

#pragma once
#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include "common/reading.hpp"

enum class RejectReason
{
    MalformedTopic,
    InvalidSensorId,
    InvalidProperty,
    UnknownProperty,
    NotNumeric,
    NotFinite,
    OutOfRange
};

inline const char *reject_reason_name(RejectReason r)
{
    switch (r)
    {
    case RejectReason::MalformedTopic:
        return "malformed_topic";
    case RejectReason::InvalidSensorId:
        return "invalid_sensor_id";
    case RejectReason::InvalidProperty:
        return "invalid_property";
    case RejectReason::UnknownProperty:
        return "unknown_property";
    case RejectReason::NotNumeric:
        return "not_numeric";
    case RejectReason::NotFinite:
        return "not_finite";
    case RejectReason::OutOfRange:
        return "out_of_range";
    }
    return "?";
}

using ValidationResult = std::variant<Reading, RejectReason>;

constexpr std::size_t kMaxIdentifierLength = 50;

struct ValueBounds
{
    double min;
    double max;
};

inline ValueBounds bounds_for(Property p)
{
    switch (p)
    {
    case Property::Temperature:
        return {-50.0, 100.0};
    case Property::Humidity:
        return {0.0, 100.0};
    case Property::Pressure:
        return {800.0, 1200.0};
    }
    return {0.0, 0.0};
}

// [A-Za-z0-9_-]{1,50}
inline bool is_valid_identifier(std::string_view s)
{
    if (s.empty() || s.size() > kMaxIdentifierLength)
        return false;
    for (unsigned char c : s)
    {
        if (!std::isalnum(c) && c != '_' && c != '-')
            return false;
    }
    return true;
}

// pico/{property}/{sensor_id} -> (property, sensor_id)
inline std::optional<std::pair<std::string, std::string>> parse_topic(std::string_view topic)
{
    constexpr std::string_view prefix = "pico/";
    if (topic.substr(0, prefix.size()) != prefix)
        return std::nullopt;
    auto rest = topic.substr(prefix.size());
    auto slash = rest.find('/');
    if (slash == std::string_view::npos)
        return std::nullopt;
    auto prop = rest.substr(0, slash);
    auto sensor = rest.substr(slash + 1);
    if (prop.empty() || sensor.empty() || sensor.find('/') != std::string_view::npos)
        return std::nullopt;
    return std::pair{std::string(prop), std::string(sensor)};
}

// ASCII decimal with optional surrounding whitespace; nan/inf parse but are flagged by the caller
inline std::optional<double> parse_payload(const std::string &raw)
{
    const char *begin = raw.c_str();
    while (*begin && std::isspace(static_cast<unsigned char>(*begin)))
        ++begin;
    if (!*begin)
        return std::nullopt;

    char *end = nullptr;
    errno = 0;
    double v = std::strtod(begin, &end);
    if (end == begin)
        return std::nullopt;
    while (*end && std::isspace(static_cast<unsigned char>(*end)))
        ++end;
    if (*end)
        return std::nullopt;
    if (errno == ERANGE)
        return std::nullopt;
    return v;
}

inline ValidationResult validate(const std::string &sensor_id, const std::string &property,
                                 const std::string &raw_value, Clock::time_point now = Clock::now())
{
    if (!is_valid_identifier(sensor_id))
        return RejectReason::InvalidSensorId;
    if (!is_valid_identifier(property))
        return RejectReason::InvalidProperty;
    auto prop = parse_property(property);
    if (!prop)
        return RejectReason::UnknownProperty;

    auto value = parse_payload(raw_value);
    if (!value)
        return RejectReason::NotNumeric;
    if (!std::isfinite(*value))
        return RejectReason::NotFinite;

    auto b = bounds_for(*prop);
    if (*value < b.min || *value > b.max)
        return RejectReason::OutOfRange;

    return Reading{sensor_id, *prop, *value, now};
}
