#pragma once

#include <array>
#include <tuple>

#include <cstdint>

#include "../core/header.hpp"
#include "../core/record_traits.hpp"
#include "../core/wire_codec.hpp"
#include "../types.hpp"

namespace f1telem {

struct CarStatusData {
    uint8_t traction_control; // 0 = off, 1 = medium, 2 = full
    uint8_t anti_lock_brakes;
    uint8_t fuel_mix;         // 0 = lean, 1 = standard, 2 = rich, 3 = max
    uint8_t front_brake_bias; // Percentage
    uint8_t pit_limiter_status;
    float fuel_in_tank;
    float fuel_capacity;
    float fuel_remaining_laps; // Value shown on the MFD
    uint16_t max_rpm;
    uint16_t idle_rpm;
    uint8_t max_gears;
    uint8_t drs_allowed;
    uint16_t drs_activation_distance; // 0 = not available, otherwise metres until available
    uint8_t actual_tyre_compound;
    uint8_t visual_tyre_compound;
    uint8_t tyres_age_laps;
    int8_t vehicle_fia_flags; // -1 = invalid/unknown, 0 = none, 1 = green, 2 = blue,
                              // 3 = yellow, 4 = red
    float ers_store_energy;   // Joules
    uint8_t ers_deploy_mode;  // 0 = none, 1 = medium, 2 = hotlap, 3 = overtake
    float ers_harvested_this_lap_mguk;
    float ers_harvested_this_lap_mguh;
    float ers_deployed_this_lap;
    uint8_t network_paused;

    bool operator==(const CarStatusData&) const = default;
};

template <>
struct RecordTraits<CarStatusData> {
    static constexpr const char* name = "CarStatusData";
    static constexpr auto fields = std::make_tuple(
        field("traction_control", &CarStatusData::traction_control),
        field("anti_lock_brakes", &CarStatusData::anti_lock_brakes),
        field("fuel_mix", &CarStatusData::fuel_mix),
        field("front_brake_bias", &CarStatusData::front_brake_bias),
        field("pit_limiter_status", &CarStatusData::pit_limiter_status),
        field("fuel_in_tank", &CarStatusData::fuel_in_tank),
        field("fuel_capacity", &CarStatusData::fuel_capacity),
        field("fuel_remaining_laps", &CarStatusData::fuel_remaining_laps),
        field("max_rpm", &CarStatusData::max_rpm), field("idle_rpm", &CarStatusData::idle_rpm),
        field("max_gears", &CarStatusData::max_gears),
        field("drs_allowed", &CarStatusData::drs_allowed),
        field("drs_activation_distance", &CarStatusData::drs_activation_distance),
        field("actual_tyre_compound", &CarStatusData::actual_tyre_compound),
        field("visual_tyre_compound", &CarStatusData::visual_tyre_compound),
        field("tyres_age_laps", &CarStatusData::tyres_age_laps),
        field("vehicle_fia_flags", &CarStatusData::vehicle_fia_flags),
        field("ers_store_energy", &CarStatusData::ers_store_energy),
        field("ers_deploy_mode", &CarStatusData::ers_deploy_mode),
        field("ers_harvested_this_lap_mguk", &CarStatusData::ers_harvested_this_lap_mguk),
        field("ers_harvested_this_lap_mguh", &CarStatusData::ers_harvested_this_lap_mguh),
        field("ers_deployed_this_lap", &CarStatusData::ers_deployed_this_lap),
        field("network_paused", &CarStatusData::network_paused));
};

static_assert(wire_size<CarStatusData>() == 47);

// Car status packet (id 7)
struct PacketCarStatusData {
    static constexpr PacketId id = PacketId::car_status;

    PacketHeader header;
    std::array<CarStatusData, max_cars> car_status_data;

    bool operator==(const PacketCarStatusData&) const = default;
};

template <>
struct RecordTraits<PacketCarStatusData> {
    static constexpr const char* name = "PacketCarStatusData";
    static constexpr auto fields =
        std::make_tuple(field("header", &PacketCarStatusData::header),
                        field("car_status_data", &PacketCarStatusData::car_status_data));
};

static_assert(wire_size<PacketCarStatusData>() == 1058);

} // namespace f1telem
