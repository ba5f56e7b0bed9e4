#pragma once

#include <array>
#include <tuple>

#include <cstdint>

#include "../core/header.hpp"
#include "../core/record_traits.hpp"
#include "../core/wire_codec.hpp"
#include "../types.hpp"

namespace f1telem {

// Bits of LapHistoryData::lap_valid_bit_flags
inline constexpr uint8_t lap_valid_flag = 0x01;
inline constexpr uint8_t sector1_valid_flag = 0x02;
inline constexpr uint8_t sector2_valid_flag = 0x04;
inline constexpr uint8_t sector3_valid_flag = 0x08;

struct LapHistoryData {
    uint32_t lap_time_in_ms;
    uint16_t sector1_time_in_ms;
    uint16_t sector2_time_in_ms;
    uint16_t sector3_time_in_ms;
    uint8_t lap_valid_bit_flags;

    bool operator==(const LapHistoryData&) const = default;
};

template <>
struct RecordTraits<LapHistoryData> {
    static constexpr const char* name = "LapHistoryData";
    static constexpr auto fields = std::make_tuple(
        field("lap_time_in_ms", &LapHistoryData::lap_time_in_ms),
        field("sector1_time_in_ms", &LapHistoryData::sector1_time_in_ms),
        field("sector2_time_in_ms", &LapHistoryData::sector2_time_in_ms),
        field("sector3_time_in_ms", &LapHistoryData::sector3_time_in_ms),
        field("lap_valid_bit_flags", &LapHistoryData::lap_valid_bit_flags));
};

struct TyreStintHistoryData {
    uint8_t end_lap; // 255 for the current tyre
    uint8_t tyre_actual_compound;
    uint8_t tyre_visual_compound;

    bool operator==(const TyreStintHistoryData&) const = default;
};

template <>
struct RecordTraits<TyreStintHistoryData> {
    static constexpr const char* name = "TyreStintHistoryData";
    static constexpr auto fields = std::make_tuple(
        field("end_lap", &TyreStintHistoryData::end_lap),
        field("tyre_actual_compound", &TyreStintHistoryData::tyre_actual_compound),
        field("tyre_visual_compound", &TyreStintHistoryData::tyre_visual_compound));
};

static_assert(wire_size<LapHistoryData>() == 11);
static_assert(wire_size<TyreStintHistoryData>() == 3);

/**
 * @brief Session history packet (id 11)
 *
 * Lap and tyre stint history for the single car named by car_idx. num_laps
 * includes the current partial lap.
 */
struct PacketSessionHistoryData {
    static constexpr PacketId id = PacketId::session_history;

    PacketHeader header;
    uint8_t car_idx;
    uint8_t num_laps;
    uint8_t num_tyre_stints;
    uint8_t best_lap_time_lap_num;
    uint8_t best_sector1_lap_num;
    uint8_t best_sector2_lap_num;
    uint8_t best_sector3_lap_num;
    std::array<LapHistoryData, max_lap_history> lap_history_data;
    std::array<TyreStintHistoryData, max_tyre_stints> tyre_stints_history_data;

    bool operator==(const PacketSessionHistoryData&) const = default;
};

template <>
struct RecordTraits<PacketSessionHistoryData> {
    static constexpr const char* name = "PacketSessionHistoryData";
    static constexpr auto fields = std::make_tuple(
        field("header", &PacketSessionHistoryData::header),
        field("car_idx", &PacketSessionHistoryData::car_idx),
        field("num_laps", &PacketSessionHistoryData::num_laps),
        field("num_tyre_stints", &PacketSessionHistoryData::num_tyre_stints),
        field("best_lap_time_lap_num", &PacketSessionHistoryData::best_lap_time_lap_num),
        field("best_sector1_lap_num", &PacketSessionHistoryData::best_sector1_lap_num),
        field("best_sector2_lap_num", &PacketSessionHistoryData::best_sector2_lap_num),
        field("best_sector3_lap_num", &PacketSessionHistoryData::best_sector3_lap_num),
        field("lap_history_data", &PacketSessionHistoryData::lap_history_data),
        field("tyre_stints_history_data", &PacketSessionHistoryData::tyre_stints_history_data));
};

static_assert(wire_size<PacketSessionHistoryData>() == 1155);

} // namespace f1telem
