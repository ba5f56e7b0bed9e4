#pragma once

#include <array>
#include <tuple>

#include <cstdint>

#include "../core/header.hpp"
#include "../core/record_traits.hpp"
#include "../core/wire_codec.hpp"
#include "../types.hpp"

namespace f1telem {

// All values are percentages unless noted
struct CarDamageData {
    std::array<float, wheel_count> tyres_wear;
    std::array<uint8_t, wheel_count> tyres_damage;
    std::array<uint8_t, wheel_count> brakes_damage;
    uint8_t front_left_wing_damage;
    uint8_t front_right_wing_damage;
    uint8_t rear_wing_damage;
    uint8_t floor_damage;
    uint8_t diffuser_damage;
    uint8_t sidepod_damage;
    uint8_t drs_fault; // 0 = OK, 1 = fault
    uint8_t gear_box_damage;
    uint8_t engine_damage;
    uint8_t engine_mguh_wear;
    uint8_t engine_es_wear;
    uint8_t engine_ce_wear;
    uint8_t engine_ice_wear;
    uint8_t engine_mguk_wear;
    uint8_t engine_tc_wear;

    bool operator==(const CarDamageData&) const = default;
};

template <>
struct RecordTraits<CarDamageData> {
    static constexpr const char* name = "CarDamageData";
    static constexpr auto fields = std::make_tuple(
        field("tyres_wear", &CarDamageData::tyres_wear),
        field("tyres_damage", &CarDamageData::tyres_damage),
        field("brakes_damage", &CarDamageData::brakes_damage),
        field("front_left_wing_damage", &CarDamageData::front_left_wing_damage),
        field("front_right_wing_damage", &CarDamageData::front_right_wing_damage),
        field("rear_wing_damage", &CarDamageData::rear_wing_damage),
        field("floor_damage", &CarDamageData::floor_damage),
        field("diffuser_damage", &CarDamageData::diffuser_damage),
        field("sidepod_damage", &CarDamageData::sidepod_damage),
        field("drs_fault", &CarDamageData::drs_fault),
        field("gear_box_damage", &CarDamageData::gear_box_damage),
        field("engine_damage", &CarDamageData::engine_damage),
        field("engine_mguh_wear", &CarDamageData::engine_mguh_wear),
        field("engine_es_wear", &CarDamageData::engine_es_wear),
        field("engine_ce_wear", &CarDamageData::engine_ce_wear),
        field("engine_ice_wear", &CarDamageData::engine_ice_wear),
        field("engine_mguk_wear", &CarDamageData::engine_mguk_wear),
        field("engine_tc_wear", &CarDamageData::engine_tc_wear));
};

static_assert(wire_size<CarDamageData>() == 39);

// Car damage packet (id 10)
struct PacketCarDamageData {
    static constexpr PacketId id = PacketId::car_damage;

    PacketHeader header;
    std::array<CarDamageData, max_cars> car_damage_data;

    bool operator==(const PacketCarDamageData&) const = default;
};

template <>
struct RecordTraits<PacketCarDamageData> {
    static constexpr const char* name = "PacketCarDamageData";
    static constexpr auto fields =
        std::make_tuple(field("header", &PacketCarDamageData::header),
                        field("car_damage_data", &PacketCarDamageData::car_damage_data));
};

static_assert(wire_size<PacketCarDamageData>() == 882);

} // namespace f1telem
