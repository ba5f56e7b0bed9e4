#pragma once

#include <algorithm>
#include <concepts>
#include <span>
#include <type_traits>
#include <variant>
#include <vector>

#include <cstddef>
#include <cstdint>

#include "../core/header.hpp"
#include "../core/wire_codec.hpp"
#include "../types.hpp"
#include "car_damage.hpp"
#include "car_setup.hpp"
#include "car_status.hpp"
#include "car_telemetry.hpp"
#include "event.hpp"
#include "final_classification.hpp"
#include "lap_data.hpp"
#include "lobby_info.hpp"
#include "motion.hpp"
#include "participants.hpp"
#include "session.hpp"
#include "session_history.hpp"

namespace f1telem {

/**
 * @brief Type-safe variant holding any decoded top-level packet
 *
 * Alternative index equals the packet id, so
 * `packet.index() == static_cast<size_t>(PacketId::...)`.
 */
using Packet = std::variant<PacketMotionData,              // 0
                            PacketSessionData,             // 1
                            PacketLapData,                 // 2
                            PacketEventData,               // 3
                            PacketParticipantsData,        // 4
                            PacketCarSetupData,            // 5
                            PacketCarTelemetryData,        // 6
                            PacketCarStatusData,           // 7
                            PacketFinalClassificationData, // 8
                            PacketLobbyInfoData,           // 9
                            PacketCarDamageData,           // 10
                            PacketSessionHistoryData       // 11
                            >;

static_assert(std::variant_size_v<Packet> == packet_id_count);

namespace detail {

template <size_t... I>
constexpr bool ids_match_indices(std::index_sequence<I...>) noexcept {
    return ((static_cast<size_t>(std::variant_alternative_t<I, Packet>::id) == I) && ...);
}

template <size_t... I>
constexpr size_t largest_packet(std::index_sequence<I...>) noexcept {
    return std::max({wire_size<std::variant_alternative_t<I, Packet>>()...});
}

} // namespace detail

static_assert(detail::ids_match_indices(std::make_index_sequence<packet_id_count>{}),
              "Packet alternatives must be ordered by packet id");

// Largest registered packet (Motion); sizes the listener receive buffer
inline constexpr size_t max_packet_size =
    detail::largest_packet(std::make_index_sequence<packet_id_count>{});

static_assert(max_packet_size == 1464);

/// Concept: T is one of the top-level packet types
template <typename T>
concept TopLevelPacket = requires {
    { T::id } -> std::convertible_to<PacketId>;
    requires std::is_same_v<std::remove_cv_t<decltype(T::header)>, PacketHeader>;
};

/**
 * @brief Get the packet id of the held packet
 */
inline PacketId packet_id(const Packet& pkt) noexcept {
    return static_cast<PacketId>(pkt.index());
}

/**
 * @brief Get the header of the held packet
 */
inline const PacketHeader& packet_header(const Packet& pkt) noexcept {
    return std::visit([](const auto& p) -> const PacketHeader& { return p.header; }, pkt);
}

/// Variant name of a packet id or held packet ("motion", "session", ...)
inline const char* packet_name(PacketId id) noexcept {
    return packet_id_string(id);
}

inline const char* packet_name(const Packet& pkt) noexcept {
    return packet_id_string(packet_id(pkt));
}

/**
 * @brief Encode any packet to its wire bytes
 */
inline std::vector<uint8_t> encode_packet(const Packet& pkt) {
    return std::visit([](const auto& p) { return encode(p); }, pkt);
}

} // namespace f1telem
