#pragma once

#include <span>
#include <tuple>

#include <cstddef>
#include <cstdint>

#include "../errors.hpp"
#include "../types.hpp"
#include "record_traits.hpp"
#include "wire_codec.hpp"

namespace f1telem {

/**
 * @brief Common header present verbatim at the start of every packet
 *
 * Header layout (24 bytes, little-endian, no padding):
 * -  0: packet_format (u16)        - season identifier, 2021
 * -  2: game_major_version (u8)    - "X.00"
 * -  3: game_minor_version (u8)    - "1.XX"
 * -  4: packet_version (u8)        - version of this packet type, starts at 1
 * -  5: packet_id (u8)             - selects the packet variant
 * -  6: session_uid (u64)          - unique identifier for the session
 * - 14: session_time (f32)         - session timestamp in seconds
 * - 18: frame_identifier (u32)     - frame the data was retrieved on
 * - 22: player_car_index (u8)      - index of the player's car in car arrays
 * - 23: secondary_player_car_index (u8) - splitscreen player, 255 if absent
 */
struct PacketHeader {
    uint16_t packet_format;
    uint8_t game_major_version;
    uint8_t game_minor_version;
    uint8_t packet_version;
    uint8_t packet_id;
    uint64_t session_uid;
    float session_time;
    uint32_t frame_identifier;
    uint8_t player_car_index;
    uint8_t secondary_player_car_index;

    bool operator==(const PacketHeader&) const = default;

    DispatchKey dispatch_key() const noexcept {
        return DispatchKey{packet_format, packet_version, packet_id};
    }
};

template <>
struct RecordTraits<PacketHeader> {
    static constexpr const char* name = "PacketHeader";
    static constexpr auto fields = std::make_tuple(
        field("packet_format", &PacketHeader::packet_format),
        field("game_major_version", &PacketHeader::game_major_version),
        field("game_minor_version", &PacketHeader::game_minor_version),
        field("packet_version", &PacketHeader::packet_version),
        field("packet_id", &PacketHeader::packet_id),
        field("session_uid", &PacketHeader::session_uid),
        field("session_time", &PacketHeader::session_time),
        field("frame_identifier", &PacketHeader::frame_identifier),
        field("player_car_index", &PacketHeader::player_car_index),
        field("secondary_player_car_index", &PacketHeader::secondary_player_car_index));
};

static_assert(wire_size<PacketHeader>() == header_size, "Header must be 24 bytes on the wire");

/**
 * @brief Result of peeking at the header of an inbound buffer
 */
struct DecodedHeader {
    PacketHeader header; ///< All ten header fields
    DispatchKey key;     ///< (packet_format, packet_version, packet_id)
};

/**
 * @brief Decode the common header from the front of a buffer
 *
 * Only the first header_size bytes are read; the rest of the buffer is
 * left for the packet codec selected by the dispatch key.
 *
 * @param bytes Raw datagram bytes
 * @return Header plus dispatch key
 * @throws TruncatedBufferError if bytes.size() < header_size
 */
inline DecodedHeader decode_header(std::span<const uint8_t> bytes) {
    PacketHeader header = decode<PacketHeader>(bytes);
    return DecodedHeader{header, header.dispatch_key()};
}

/**
 * @brief Check if a dispatch key names a packet id in the 2021 table
 *
 * @param key The key to check
 * @return true if format and version are the 2021 values and id is 0-11
 */
constexpr bool is_f1_2021_key(DispatchKey key) noexcept {
    return key.packet_format == packet_format_2021 && key.packet_version == packet_version_1 &&
           key.packet_id < packet_id_count;
}

} // namespace f1telem
