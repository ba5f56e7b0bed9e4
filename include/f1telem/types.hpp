#pragma once

#include <compare>

#include <cstddef>
#include <cstdint>

namespace f1telem {

// Packet identifiers carried in PacketHeader::packet_id (2021 season format)
enum class PacketId : uint8_t {
    motion = 0,               // Car motion for all cars, plus player-only physics
    session = 1,              // Track, weather and session configuration
    lap_data = 2,             // Lap timing for all cars
    event = 3,                // Notable race events (tagged detail payload)
    participants = 4,         // Driver and team roster
    car_setups = 5,           // Car setup for all cars
    car_telemetry = 6,        // Speed, inputs, temperatures for all cars
    car_status = 7,           // Fuel, ERS, tyre compound for all cars
    final_classification = 8, // Results at the end of a session
    lobby_info = 9,           // Multiplayer lobby roster
    car_damage = 10,          // Wear and damage for all cars
    session_history = 11      // Lap and stint history for one car
};

inline constexpr size_t packet_id_count = 12;

// Wire format identifiers
inline constexpr uint16_t packet_format_2021 = 2021;
inline constexpr uint8_t packet_version_1 = 1;

// Default port the game broadcasts telemetry to
inline constexpr uint16_t default_udp_port = 20777;

// Fixed header prefix present in every packet
inline constexpr size_t header_size = 24;

// Array capacities (fixed regardless of how many slots are active)
inline constexpr size_t max_cars = 22;
inline constexpr size_t max_marshal_zones = 21;
inline constexpr size_t max_weather_forecast_samples = 56;
inline constexpr size_t max_lap_history = 100;
inline constexpr size_t max_tyre_stints = 8;
inline constexpr size_t wheel_count = 4;
inline constexpr size_t event_code_size = 4;
inline constexpr size_t name_size = 48;

// Event detail region, sized to the largest detail shape (Flashback)
inline constexpr size_t event_details_size = 8;

// Sentinel for PacketHeader::secondary_player_car_index
inline constexpr uint8_t no_secondary_player = 255;

/**
 * @brief Key used to select the record codec for an inbound buffer
 *
 * Formed from the header fields (packet_format, packet_version, packet_id).
 */
struct DispatchKey {
    uint16_t packet_format;
    uint8_t packet_version;
    uint8_t packet_id;

    auto operator<=>(const DispatchKey&) const = default;
};

// Convert packet id to the variant name used in mappings and file names
constexpr const char* packet_id_string(PacketId id) noexcept {
    switch (id) {
        case PacketId::motion:
            return "motion";
        case PacketId::session:
            return "session";
        case PacketId::lap_data:
            return "lap_data";
        case PacketId::event:
            return "event";
        case PacketId::participants:
            return "participants";
        case PacketId::car_setups:
            return "car_setups";
        case PacketId::car_telemetry:
            return "car_telemetry";
        case PacketId::car_status:
            return "car_status";
        case PacketId::final_classification:
            return "final_classification";
        case PacketId::lobby_info:
            return "lobby_info";
        case PacketId::car_damage:
            return "car_damage";
        case PacketId::session_history:
            return "session_history";
        default:
            return "unknown";
    }
}

} // namespace f1telem
