#pragma once

#include <array>
#include <tuple>

#include <cstdint>

#include "../core/header.hpp"
#include "../core/record_traits.hpp"
#include "../core/wire_codec.hpp"
#include "../types.hpp"

namespace f1telem {

struct CarSetupData {
    uint8_t front_wing;
    uint8_t rear_wing;
    uint8_t on_throttle;  // Differential adjustment on throttle (percentage)
    uint8_t off_throttle; // Differential adjustment off throttle (percentage)
    float front_camber;
    float rear_camber;
    float front_toe;
    float rear_toe;
    uint8_t front_suspension;
    uint8_t rear_suspension;
    uint8_t front_anti_roll_bar;
    uint8_t rear_anti_roll_bar;
    uint8_t front_suspension_height;
    uint8_t rear_suspension_height;
    uint8_t brake_pressure; // Percentage
    uint8_t brake_bias;     // Percentage
    float rear_left_tyre_pressure;  // PSI
    float rear_right_tyre_pressure; // PSI
    float front_left_tyre_pressure; // PSI
    float front_right_tyre_pressure; // PSI
    uint8_t ballast;
    float fuel_load;

    bool operator==(const CarSetupData&) const = default;
};

template <>
struct RecordTraits<CarSetupData> {
    static constexpr const char* name = "CarSetupData";
    static constexpr auto fields = std::make_tuple(
        field("front_wing", &CarSetupData::front_wing),
        field("rear_wing", &CarSetupData::rear_wing),
        field("on_throttle", &CarSetupData::on_throttle),
        field("off_throttle", &CarSetupData::off_throttle),
        field("front_camber", &CarSetupData::front_camber),
        field("rear_camber", &CarSetupData::rear_camber),
        field("front_toe", &CarSetupData::front_toe), field("rear_toe", &CarSetupData::rear_toe),
        field("front_suspension", &CarSetupData::front_suspension),
        field("rear_suspension", &CarSetupData::rear_suspension),
        field("front_anti_roll_bar", &CarSetupData::front_anti_roll_bar),
        field("rear_anti_roll_bar", &CarSetupData::rear_anti_roll_bar),
        field("front_suspension_height", &CarSetupData::front_suspension_height),
        field("rear_suspension_height", &CarSetupData::rear_suspension_height),
        field("brake_pressure", &CarSetupData::brake_pressure),
        field("brake_bias", &CarSetupData::brake_bias),
        field("rear_left_tyre_pressure", &CarSetupData::rear_left_tyre_pressure),
        field("rear_right_tyre_pressure", &CarSetupData::rear_right_tyre_pressure),
        field("front_left_tyre_pressure", &CarSetupData::front_left_tyre_pressure),
        field("front_right_tyre_pressure", &CarSetupData::front_right_tyre_pressure),
        field("ballast", &CarSetupData::ballast), field("fuel_load", &CarSetupData::fuel_load));
};

static_assert(wire_size<CarSetupData>() == 49);

// Car setups packet (id 5)
struct PacketCarSetupData {
    static constexpr PacketId id = PacketId::car_setups;

    PacketHeader header;
    std::array<CarSetupData, max_cars> car_setups;

    bool operator==(const PacketCarSetupData&) const = default;
};

template <>
struct RecordTraits<PacketCarSetupData> {
    static constexpr const char* name = "PacketCarSetupData";
    static constexpr auto fields =
        std::make_tuple(field("header", &PacketCarSetupData::header),
                        field("car_setups", &PacketCarSetupData::car_setups));
};

static_assert(wire_size<PacketCarSetupData>() == 1102);

} // namespace f1telem
