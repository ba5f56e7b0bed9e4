#pragma once

#include <array>
#include <tuple>

#include <cstdint>

#include "../core/header.hpp"
#include "../core/record_traits.hpp"
#include "../core/wire_codec.hpp"
#include "../types.hpp"

namespace f1telem {

// Wheel arrays are ordered RL, RR, FL, FR
struct CarTelemetryData {
    uint16_t speed;  // km/h
    float throttle;  // 0.0 to 1.0
    float steer;     // -1.0 (full lock left) to 1.0 (full lock right)
    float brake;     // 0.0 to 1.0
    uint8_t clutch;  // 0 to 100
    int8_t gear;     // 1-8, N = 0, R = -1
    uint16_t engine_rpm;
    uint8_t drs;
    uint8_t rev_lights_percent;
    uint16_t rev_lights_bit_value; // Bit 0 = leftmost LED, bit 14 = rightmost LED
    std::array<uint16_t, wheel_count> brakes_temperature;        // Celsius
    std::array<uint8_t, wheel_count> tyres_surface_temperature;  // Celsius
    std::array<uint8_t, wheel_count> tyres_inner_temperature;    // Celsius
    uint16_t engine_temperature;                                 // Celsius
    std::array<float, wheel_count> tyres_pressure;               // PSI
    std::array<uint8_t, wheel_count> surface_type;

    bool operator==(const CarTelemetryData&) const = default;
};

template <>
struct RecordTraits<CarTelemetryData> {
    static constexpr const char* name = "CarTelemetryData";
    static constexpr auto fields = std::make_tuple(
        field("speed", &CarTelemetryData::speed), field("throttle", &CarTelemetryData::throttle),
        field("steer", &CarTelemetryData::steer), field("brake", &CarTelemetryData::brake),
        field("clutch", &CarTelemetryData::clutch), field("gear", &CarTelemetryData::gear),
        field("engine_rpm", &CarTelemetryData::engine_rpm), field("drs", &CarTelemetryData::drs),
        field("rev_lights_percent", &CarTelemetryData::rev_lights_percent),
        field("rev_lights_bit_value", &CarTelemetryData::rev_lights_bit_value),
        field("brakes_temperature", &CarTelemetryData::brakes_temperature),
        field("tyres_surface_temperature", &CarTelemetryData::tyres_surface_temperature),
        field("tyres_inner_temperature", &CarTelemetryData::tyres_inner_temperature),
        field("engine_temperature", &CarTelemetryData::engine_temperature),
        field("tyres_pressure", &CarTelemetryData::tyres_pressure),
        field("surface_type", &CarTelemetryData::surface_type));
};

static_assert(wire_size<CarTelemetryData>() == 60);

/**
 * @brief Car telemetry packet (id 6)
 */
struct PacketCarTelemetryData {
    static constexpr PacketId id = PacketId::car_telemetry;

    PacketHeader header;
    std::array<CarTelemetryData, max_cars> car_telemetry_data;
    uint8_t mfd_panel_index;                  // 255 = MFD closed
    uint8_t mfd_panel_index_secondary_player; // See above
    int8_t suggested_gear;                    // 1-8, 0 if no gear suggested

    bool operator==(const PacketCarTelemetryData&) const = default;
};

template <>
struct RecordTraits<PacketCarTelemetryData> {
    static constexpr const char* name = "PacketCarTelemetryData";
    static constexpr auto fields = std::make_tuple(
        field("header", &PacketCarTelemetryData::header),
        field("car_telemetry_data", &PacketCarTelemetryData::car_telemetry_data),
        field("mfd_panel_index", &PacketCarTelemetryData::mfd_panel_index),
        field("mfd_panel_index_secondary_player",
              &PacketCarTelemetryData::mfd_panel_index_secondary_player),
        field("suggested_gear", &PacketCarTelemetryData::suggested_gear));
};

static_assert(wire_size<PacketCarTelemetryData>() == 1347);

} // namespace f1telem
