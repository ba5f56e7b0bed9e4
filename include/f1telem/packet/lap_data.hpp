#pragma once

#include <array>
#include <tuple>

#include <cstdint>

#include "../core/header.hpp"
#include "../core/record_traits.hpp"
#include "../core/wire_codec.hpp"
#include "../types.hpp"

namespace f1telem {

// Per-car lap timing
struct LapData {
    uint32_t last_lap_time_in_ms;
    uint32_t current_lap_time_in_ms;
    uint16_t sector1_time_in_ms;
    uint16_t sector2_time_in_ms;
    float lap_distance;   // Metres, negative before the line is crossed
    float total_distance; // Metres, negative before the line is crossed
    float safety_car_delta; // Seconds
    uint8_t car_position;
    uint8_t current_lap_num;
    uint8_t pit_status; // 0 = none, 1 = pitting, 2 = in pit area
    uint8_t num_pit_stops;
    uint8_t sector;     // 0 = sector1, 1 = sector2, 2 = sector3
    uint8_t current_lap_invalid;
    uint8_t penalties;  // Accumulated time penalties in seconds
    uint8_t warnings;
    uint8_t num_unserved_drive_through_pens;
    uint8_t num_unserved_stop_go_pens;
    uint8_t grid_position;
    uint8_t driver_status; // 0 = in garage, 1 = flying lap, 2 = in lap, 3 = out lap, 4 = on track
    uint8_t result_status; // 0 = invalid, 1 = inactive, 2 = active, 3 = finished,
                           // 4 = did not finish, 5 = disqualified, 6 = not classified, 7 = retired
    uint8_t pit_lane_timer_active;
    uint16_t pit_lane_time_in_lane_in_ms;
    uint16_t pit_stop_timer_in_ms;
    uint8_t pit_stop_should_serve_pen;

    bool operator==(const LapData&) const = default;
};

template <>
struct RecordTraits<LapData> {
    static constexpr const char* name = "LapData";
    static constexpr auto fields = std::make_tuple(
        field("last_lap_time_in_ms", &LapData::last_lap_time_in_ms),
        field("current_lap_time_in_ms", &LapData::current_lap_time_in_ms),
        field("sector1_time_in_ms", &LapData::sector1_time_in_ms),
        field("sector2_time_in_ms", &LapData::sector2_time_in_ms),
        field("lap_distance", &LapData::lap_distance),
        field("total_distance", &LapData::total_distance),
        field("safety_car_delta", &LapData::safety_car_delta),
        field("car_position", &LapData::car_position),
        field("current_lap_num", &LapData::current_lap_num),
        field("pit_status", &LapData::pit_status),
        field("num_pit_stops", &LapData::num_pit_stops),
        field("sector", &LapData::sector),
        field("current_lap_invalid", &LapData::current_lap_invalid),
        field("penalties", &LapData::penalties),
        field("warnings", &LapData::warnings),
        field("num_unserved_drive_through_pens", &LapData::num_unserved_drive_through_pens),
        field("num_unserved_stop_go_pens", &LapData::num_unserved_stop_go_pens),
        field("grid_position", &LapData::grid_position),
        field("driver_status", &LapData::driver_status),
        field("result_status", &LapData::result_status),
        field("pit_lane_timer_active", &LapData::pit_lane_timer_active),
        field("pit_lane_time_in_lane_in_ms", &LapData::pit_lane_time_in_lane_in_ms),
        field("pit_stop_timer_in_ms", &LapData::pit_stop_timer_in_ms),
        field("pit_stop_should_serve_pen", &LapData::pit_stop_should_serve_pen));
};

static_assert(wire_size<LapData>() == 43);

// Lap data packet (id 2)
struct PacketLapData {
    static constexpr PacketId id = PacketId::lap_data;

    PacketHeader header;
    std::array<LapData, max_cars> lap_data;

    bool operator==(const PacketLapData&) const = default;
};

template <>
struct RecordTraits<PacketLapData> {
    static constexpr const char* name = "PacketLapData";
    static constexpr auto fields = std::make_tuple(field("header", &PacketLapData::header),
                                                   field("lap_data", &PacketLapData::lap_data));
};

static_assert(wire_size<PacketLapData>() == 970);

} // namespace f1telem
