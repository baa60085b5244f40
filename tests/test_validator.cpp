/*
 * File: tests/test_validator.cpp
 * Project: Home Hub
 * Purpose: Topic parsing and telemetry validation
 * Last updated: 2026-10-18
 */

#include <catch2/catch_all.hpp>
#include <string>
#include <variant>
#include "hub_validator.hpp"

static RejectReason reason_of(const ValidationResult &r)
{
    REQUIRE(std::holds_alternative<RejectReason>(r));
    return std::get<RejectReason>(r);
}

TEST_CASE("valid readings are accepted")
{
    auto r = validate("kitchen", "temperature", "21.5");
    REQUIRE(std::holds_alternative<Reading>(r));
    const auto &reading = std::get<Reading>(r);
    REQUIRE(reading.sensor_id == "kitchen");
    REQUIRE(reading.property == Property::Temperature);
    REQUIRE(reading.value == Catch::Approx(21.5));

    REQUIRE(std::holds_alternative<Reading>(validate("living_room-2", "humidity", "0")));
    REQUIRE(std::holds_alternative<Reading>(validate("attic", "pressure", " 1013.25\n")));
    REQUIRE(std::holds_alternative<Reading>(validate("x", "temperature", "-50")));
    REQUIRE(std::holds_alternative<Reading>(validate(std::string(50, 'a'), "humidity", "100")));
}

TEST_CASE("each violated constraint is named")
{
    REQUIRE(reason_of(validate("", "temperature", "20")) == RejectReason::InvalidSensorId);
    REQUIRE(reason_of(validate(std::string(51, 'a'), "temperature", "20")) == RejectReason::InvalidSensorId);
    REQUIRE(reason_of(validate("bad id", "temperature", "20")) == RejectReason::InvalidSensorId);
    REQUIRE(reason_of(validate("kitchen;drop", "temperature", "20")) == RejectReason::InvalidSensorId);

    REQUIRE(reason_of(validate("kitchen", "temp.erature", "20")) == RejectReason::InvalidProperty);
    REQUIRE(reason_of(validate("kitchen", "co2", "400")) == RejectReason::UnknownProperty);

    REQUIRE(reason_of(validate("kitchen", "temperature", "warm")) == RejectReason::NotNumeric);
    REQUIRE(reason_of(validate("kitchen", "temperature", "")) == RejectReason::NotNumeric);
    REQUIRE(reason_of(validate("kitchen", "temperature", "21.5C")) == RejectReason::NotNumeric);

    REQUIRE(reason_of(validate("kitchen", "temperature", "nan")) == RejectReason::NotFinite);
    REQUIRE(reason_of(validate("kitchen", "temperature", "inf")) == RejectReason::NotFinite);

    REQUIRE(reason_of(validate("kitchen", "temperature", "100.5")) == RejectReason::OutOfRange);
    REQUIRE(reason_of(validate("kitchen", "temperature", "-50.1")) == RejectReason::OutOfRange);
    REQUIRE(reason_of(validate("bathroom", "humidity", "150.0")) == RejectReason::OutOfRange);
    REQUIRE(reason_of(validate("hall", "pressure", "799.9")) == RejectReason::OutOfRange);
    REQUIRE(reason_of(validate("hall", "pressure", "1200.1")) == RejectReason::OutOfRange);
}

TEST_CASE("topics split into property and sensor")
{
    auto t = parse_topic("pico/temperature/kitchen");
    REQUIRE(t);
    REQUIRE(t->first == "temperature");
    REQUIRE(t->second == "kitchen");

    REQUIRE_FALSE(parse_topic("pico/temperature"));
    REQUIRE_FALSE(parse_topic("pico//kitchen"));
    REQUIRE_FALSE(parse_topic("pico/temperature/"));
    REQUIRE_FALSE(parse_topic("pico/temperature/kitchen/extra"));
    REQUIRE_FALSE(parse_topic("other/temperature/kitchen"));
}
