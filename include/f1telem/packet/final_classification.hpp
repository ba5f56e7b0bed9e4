#pragma once

#include <array>
#include <tuple>

#include <cstdint>

#include "../core/header.hpp"
#include "../core/record_traits.hpp"
#include "../core/wire_codec.hpp"
#include "../types.hpp"

namespace f1telem {

struct FinalClassificationData {
    uint8_t position;
    uint8_t num_laps;
    uint8_t grid_position;
    uint8_t points;
    uint8_t num_pit_stops;
    uint8_t result_status; // Same values as LapData::result_status
    uint32_t best_lap_time_in_ms;
    double total_race_time; // Seconds, without penalties
    uint8_t penalties_time; // Seconds
    uint8_t num_penalties;
    uint8_t num_tyre_stints;
    std::array<uint8_t, max_tyre_stints> tyre_stints_actual;
    std::array<uint8_t, max_tyre_stints> tyre_stints_visual;

    bool operator==(const FinalClassificationData&) const = default;
};

template <>
struct RecordTraits<FinalClassificationData> {
    static constexpr const char* name = "FinalClassificationData";
    static constexpr auto fields = std::make_tuple(
        field("position", &FinalClassificationData::position),
        field("num_laps", &FinalClassificationData::num_laps),
        field("grid_position", &FinalClassificationData::grid_position),
        field("points", &FinalClassificationData::points),
        field("num_pit_stops", &FinalClassificationData::num_pit_stops),
        field("result_status", &FinalClassificationData::result_status),
        field("best_lap_time_in_ms", &FinalClassificationData::best_lap_time_in_ms),
        field("total_race_time", &FinalClassificationData::total_race_time),
        field("penalties_time", &FinalClassificationData::penalties_time),
        field("num_penalties", &FinalClassificationData::num_penalties),
        field("num_tyre_stints", &FinalClassificationData::num_tyre_stints),
        field("tyre_stints_actual", &FinalClassificationData::tyre_stints_actual),
        field("tyre_stints_visual", &FinalClassificationData::tyre_stints_visual));
};

static_assert(wire_size<FinalClassificationData>() == 37);

// Final classification packet (id 8), sent once at the end of a session
struct PacketFinalClassificationData {
    static constexpr PacketId id = PacketId::final_classification;

    PacketHeader header;
    uint8_t num_cars;
    std::array<FinalClassificationData, max_cars> classification_data;

    bool operator==(const PacketFinalClassificationData&) const = default;
};

template <>
struct RecordTraits<PacketFinalClassificationData> {
    static constexpr const char* name = "PacketFinalClassificationData";
    static constexpr auto fields = std::make_tuple(
        field("header", &PacketFinalClassificationData::header),
        field("num_cars", &PacketFinalClassificationData::num_cars),
        field("classification_data", &PacketFinalClassificationData::classification_data));
};

static_assert(wire_size<PacketFinalClassificationData>() == 839);

} // namespace f1telem
