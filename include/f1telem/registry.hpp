#pragma once

#include <algorithm>
#include <map>
#include <stdexcept>
#include <string>
#include <span>
#include <utility>
#include <vector>

#include <cstddef>
#include <cstdint>

#include "core/header.hpp"
#include "core/wire_codec.hpp"
#include "errors.hpp"
#include "packet/packet_variant.hpp"
#include "types.hpp"

namespace f1telem {

/**
 * @brief Codec registered for one dispatch key
 */
struct PacketCodecEntry {
    DispatchKey key;
    const char* name; ///< Variant name, e.g. "car_telemetry"
    size_t size;      ///< Fixed wire size of the packet, header included
    Packet (*decode)(std::span<const uint8_t>);
    std::vector<uint8_t> (*encode)(const Packet&);
};

namespace detail {

template <TopLevelPacket P>
PacketCodecEntry make_entry(uint16_t packet_format, uint8_t packet_version) {
    return PacketCodecEntry{
        DispatchKey{packet_format, packet_version, static_cast<uint8_t>(P::id)},
        packet_id_string(P::id),
        wire_size<P>(),
        [](std::span<const uint8_t> bytes) -> Packet { return f1telem::decode<P>(bytes); },
        [](const Packet& pkt) { return f1telem::encode(std::get<P>(pkt)); },
    };
}

template <size_t... I>
std::vector<PacketCodecEntry> f1_2021_entries(std::index_sequence<I...>) {
    return {make_entry<std::variant_alternative_t<I, Packet>>(packet_format_2021,
                                                              packet_version_1)...};
}

} // namespace detail

/**
 * @brief Dispatch table from header triple to packet codec
 *
 * The registry is immutable once built. A decode never alters it, so one
 * registry can be shared by any number of readers.
 *
 * Example usage:
 * @code
 * auto registry = f1telem::PacketRegistry::f1_2021();
 * f1telem::Packet pkt = registry.decode(bytes);
 * if (auto* telemetry = std::get_if<f1telem::PacketCarTelemetryData>(&pkt)) {
 *     std::cout << telemetry->car_telemetry_data[0].speed << "\n";
 * }
 * @endcode
 */
class PacketRegistry {
public:
    PacketRegistry() = default;

    explicit PacketRegistry(const std::vector<PacketCodecEntry>& entries) {
        for (const auto& entry : entries) {
            entries_.insert_or_assign(entry.key, entry);
        }
    }

    /**
     * @brief The twelve 2021 packets, keyed (2021, 1, 0..11)
     */
    static PacketRegistry f1_2021() {
        return PacketRegistry(
            detail::f1_2021_entries(std::make_index_sequence<packet_id_count>{}));
    }

    /**
     * @brief Codec entry for a key
     * @throws UnknownPacketError if no codec is registered for key
     */
    const PacketCodecEntry& lookup(DispatchKey key) const {
        auto it = entries_.find(key);
        if (it == entries_.end()) {
            throw UnknownPacketError(key);
        }
        return it->second;
    }

    // nullptr if not registered
    const PacketCodecEntry* find(DispatchKey key) const noexcept {
        auto it = entries_.find(key);
        return it == entries_.end() ? nullptr : &it->second;
    }

    bool contains(DispatchKey key) const noexcept { return entries_.contains(key); }

    size_t size() const noexcept { return entries_.size(); }

    const std::map<DispatchKey, PacketCodecEntry>& entries() const noexcept { return entries_; }

    /// Largest wire size among the registered packets (0 when empty)
    size_t max_packet_size() const noexcept {
        size_t largest = 0;
        for (const auto& [key, entry] : entries_) {
            largest = std::max(largest, entry.size);
        }
        return largest;
    }

    /**
     * @brief Decode one datagram
     *
     * Reads the header, selects the codec by (packet_format, packet_version,
     * packet_id), and decodes the full packet from the start of the buffer
     * (the packet record includes the header). Bytes beyond the packet's
     * wire size are ignored.
     *
     * @throws TruncatedBufferError if the buffer is shorter than the header
     *         or the selected packet
     * @throws UnknownPacketError if the triple has no registered codec
     * @throws UnknownEventCodeError for Event packets with an unknown code
     */
    Packet decode(std::span<const uint8_t> bytes) const {
        DecodedHeader decoded = decode_header(bytes);
        return lookup(decoded.key).decode(bytes);
    }

    /**
     * @brief Encode a packet with the codec registered for its header triple
     * @throws UnknownPacketError if the packet's header triple is not registered
     * @throws std::invalid_argument if the header id disagrees with the held type
     */
    std::vector<uint8_t> encode(const Packet& pkt) const {
        const PacketHeader& header = packet_header(pkt);
        if (header.packet_id != static_cast<uint8_t>(packet_id(pkt))) {
            throw std::invalid_argument(std::string("Header packet_id does not match ") +
                                        packet_name(pkt) + " packet");
        }
        return lookup(header.dispatch_key()).encode(pkt);
    }

private:
    std::map<DispatchKey, PacketCodecEntry> entries_;
};

/**
 * @brief Decode one datagram with the given registry
 */
inline Packet decode_packet(const PacketRegistry& registry, std::span<const uint8_t> bytes) {
    return registry.decode(bytes);
}

} // namespace f1telem
