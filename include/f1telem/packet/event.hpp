#pragma once

#include <algorithm>
#include <array>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>
#include <tuple>
#include <type_traits>
#include <variant>

#include <cstddef>
#include <cstdint>

#include "../core/detail/buffer_io.hpp"
#include "../core/fixed_text.hpp"
#include "../core/header.hpp"
#include "../core/record_traits.hpp"
#include "../core/wire_codec.hpp"
#include "../errors.hpp"
#include "../types.hpp"

namespace f1telem {

// ============================================================================
// Event detail shapes
// ============================================================================

struct FastestLap {
    uint8_t vehicle_idx;
    float lap_time; // Seconds

    bool operator==(const FastestLap&) const = default;
};

struct Retirement {
    uint8_t vehicle_idx;

    bool operator==(const Retirement&) const = default;
};

struct TeamMateInPits {
    uint8_t vehicle_idx;

    bool operator==(const TeamMateInPits&) const = default;
};

struct RaceWinner {
    uint8_t vehicle_idx;

    bool operator==(const RaceWinner&) const = default;
};

struct Penalty {
    uint8_t penalty_type;
    uint8_t infringement_type;
    uint8_t vehicle_idx;       // Car the penalty is applied to
    uint8_t other_vehicle_idx; // Other car involved
    uint8_t time;              // Time gained, or time spent doing action, in seconds
    uint8_t lap_num;
    uint8_t places_gained;

    bool operator==(const Penalty&) const = default;
};

struct SpeedTrap {
    uint8_t vehicle_idx;
    float speed; // km/h
    uint8_t overall_fastest_in_session;
    uint8_t driver_fastest_in_session;

    bool operator==(const SpeedTrap&) const = default;
};

struct StartLights {
    uint8_t num_lights;

    bool operator==(const StartLights&) const = default;
};

struct DriveThroughPenaltyServed {
    uint8_t vehicle_idx;

    bool operator==(const DriveThroughPenaltyServed&) const = default;
};

struct StopGoPenaltyServed {
    uint8_t vehicle_idx;

    bool operator==(const StopGoPenaltyServed&) const = default;
};

struct Flashback {
    uint32_t flashback_frame_identifier;
    float flashback_session_time;

    bool operator==(const Flashback&) const = default;
};

struct Buttons {
    uint32_t button_status; // Bit flags of the buttons currently pressed

    bool operator==(const Buttons&) const = default;
};

template <>
struct RecordTraits<FastestLap> {
    static constexpr const char* name = "FastestLap";
    static constexpr auto fields = std::make_tuple(field("vehicle_idx", &FastestLap::vehicle_idx),
                                                   field("lap_time", &FastestLap::lap_time));
};

template <>
struct RecordTraits<Retirement> {
    static constexpr const char* name = "Retirement";
    static constexpr auto fields = std::make_tuple(field("vehicle_idx", &Retirement::vehicle_idx));
};

template <>
struct RecordTraits<TeamMateInPits> {
    static constexpr const char* name = "TeamMateInPits";
    static constexpr auto fields =
        std::make_tuple(field("vehicle_idx", &TeamMateInPits::vehicle_idx));
};

template <>
struct RecordTraits<RaceWinner> {
    static constexpr const char* name = "RaceWinner";
    static constexpr auto fields = std::make_tuple(field("vehicle_idx", &RaceWinner::vehicle_idx));
};

template <>
struct RecordTraits<Penalty> {
    static constexpr const char* name = "Penalty";
    static constexpr auto fields = std::make_tuple(
        field("penalty_type", &Penalty::penalty_type),
        field("infringement_type", &Penalty::infringement_type),
        field("vehicle_idx", &Penalty::vehicle_idx),
        field("other_vehicle_idx", &Penalty::other_vehicle_idx), field("time", &Penalty::time),
        field("lap_num", &Penalty::lap_num), field("places_gained", &Penalty::places_gained));
};

template <>
struct RecordTraits<SpeedTrap> {
    static constexpr const char* name = "SpeedTrap";
    static constexpr auto fields = std::make_tuple(
        field("vehicle_idx", &SpeedTrap::vehicle_idx), field("speed", &SpeedTrap::speed),
        field("overall_fastest_in_session", &SpeedTrap::overall_fastest_in_session),
        field("driver_fastest_in_session", &SpeedTrap::driver_fastest_in_session));
};

template <>
struct RecordTraits<StartLights> {
    static constexpr const char* name = "StartLights";
    static constexpr auto fields = std::make_tuple(field("num_lights", &StartLights::num_lights));
};

template <>
struct RecordTraits<DriveThroughPenaltyServed> {
    static constexpr const char* name = "DriveThroughPenaltyServed";
    static constexpr auto fields =
        std::make_tuple(field("vehicle_idx", &DriveThroughPenaltyServed::vehicle_idx));
};

template <>
struct RecordTraits<StopGoPenaltyServed> {
    static constexpr const char* name = "StopGoPenaltyServed";
    static constexpr auto fields =
        std::make_tuple(field("vehicle_idx", &StopGoPenaltyServed::vehicle_idx));
};

template <>
struct RecordTraits<Flashback> {
    static constexpr const char* name = "Flashback";
    static constexpr auto fields = std::make_tuple(
        field("flashback_frame_identifier", &Flashback::flashback_frame_identifier),
        field("flashback_session_time", &Flashback::flashback_session_time));
};

template <>
struct RecordTraits<Buttons> {
    static constexpr const char* name = "Buttons";
    static constexpr auto fields = std::make_tuple(field("button_status", &Buttons::button_status));
};

// ============================================================================
// Tagged detail union
// ============================================================================

/**
 * @brief Interpretation of the event detail region
 *
 * std::monostate is used for events that carry no details (session start,
 * DRS enabled, ...). Which alternative applies is decided by the event code
 * of the enclosing packet, never by the region bytes.
 */
using EventDetail = std::variant<std::monostate, FastestLap, Retirement, TeamMateInPits,
                                 RaceWinner, Penalty, SpeedTrap, StartLights,
                                 DriveThroughPenaltyServed, StopGoPenaltyServed, Flashback, Buttons>;

using EventCode = FixedText<event_code_size>;

/**
 * @brief Event detail region of an Event packet
 *
 * `raw` holds the region exactly as received, including bytes beyond the
 * selected shape. It is kept for diagnostics only: encoding writes the shape
 * and zero-fills the rest, and equality compares `detail` only.
 */
struct EventDataDetails {
    EventDetail detail;
    std::array<uint8_t, event_details_size> raw{};

    bool operator==(const EventDataDetails& other) const { return detail == other.detail; }
};

namespace detail {

template <typename T, typename Variant>
struct variant_index;

template <typename T, typename... Ts>
struct variant_index<T, std::variant<Ts...>> {
    static constexpr size_t value = [] {
        constexpr bool matches[] = {std::is_same_v<T, Ts>...};
        for (size_t i = 0; i < sizeof...(Ts); ++i) {
            if (matches[i]) {
                return i;
            }
        }
        return sizeof...(Ts);
    }();
};

template <typename Shape>
EventDetail read_shape(ByteReader& reader) {
    Shape shape{};
    WireCodec<Shape>::read(reader, shape);
    return shape;
}

inline EventDetail read_no_details(ByteReader&) {
    return std::monostate{};
}

} // namespace detail

template <typename Shape>
inline constexpr size_t event_detail_index = detail::variant_index<Shape, EventDetail>::value;

/**
 * @brief One row of the event code table
 */
struct EventCodeInfo {
    std::string_view code;    ///< 4-character ASCII code
    const char* description;  ///< Human-readable event name
    size_t detail_index;      ///< EventDetail alternative the code selects
    EventDetail (*read)(detail::ByteReader&);
};

// Event codes of the 2021 wire format and the shape each one selects
inline constexpr std::array<EventCodeInfo, 17> event_codes{{
    {"SSTA", "Session Started", 0, &detail::read_no_details},
    {"SEND", "Session Ended", 0, &detail::read_no_details},
    {"FTLP", "Fastest Lap", event_detail_index<FastestLap>, &detail::read_shape<FastestLap>},
    {"RTMT", "Retirement", event_detail_index<Retirement>, &detail::read_shape<Retirement>},
    {"DRSE", "DRS Enabled", 0, &detail::read_no_details},
    {"DRSD", "DRS Disabled", 0, &detail::read_no_details},
    {"TMPT", "Team Mate In Pits", event_detail_index<TeamMateInPits>,
     &detail::read_shape<TeamMateInPits>},
    {"CHQF", "Chequered Flag", 0, &detail::read_no_details},
    {"RCWN", "Race Winner", event_detail_index<RaceWinner>, &detail::read_shape<RaceWinner>},
    {"PENA", "Penalty Issued", event_detail_index<Penalty>, &detail::read_shape<Penalty>},
    {"SPTP", "Speed Trap Triggered", event_detail_index<SpeedTrap>,
     &detail::read_shape<SpeedTrap>},
    {"STLG", "Start Lights", event_detail_index<StartLights>, &detail::read_shape<StartLights>},
    {"LGOT", "Lights Out", 0, &detail::read_no_details},
    {"DTSV", "Drive Through Served", event_detail_index<DriveThroughPenaltyServed>,
     &detail::read_shape<DriveThroughPenaltyServed>},
    {"SGSV", "Stop Go Served", event_detail_index<StopGoPenaltyServed>,
     &detail::read_shape<StopGoPenaltyServed>},
    {"FLBK", "Flashback", event_detail_index<Flashback>, &detail::read_shape<Flashback>},
    {"BUTN", "Button Status", event_detail_index<Buttons>, &detail::read_shape<Buttons>},
}};

// Every shape must fit the shared region
static_assert(wire_size<FastestLap>() <= event_details_size);
static_assert(wire_size<Penalty>() <= event_details_size);
static_assert(wire_size<SpeedTrap>() <= event_details_size);
static_assert(wire_size<Flashback>() == event_details_size);
static_assert(wire_size<Buttons>() <= event_details_size);

/**
 * @brief Look up an event code in the code table
 * @return Table row, or nullptr if the code is not known
 */
constexpr const EventCodeInfo* find_event_code(std::string_view code) noexcept {
    for (const auto& info : event_codes) {
        if (info.code == code) {
            return &info;
        }
    }
    return nullptr;
}

// All four code bytes, NULs included
inline std::string_view event_code_view(const EventCode& code) noexcept {
    return std::string_view(reinterpret_cast<const char*>(code.bytes.data()), code.bytes.size());
}

inline const char* event_name(const EventCode& code) noexcept {
    const EventCodeInfo* info = find_event_code(event_code_view(code));
    return info ? info->description : "Unknown";
}

/**
 * @brief Code that selects a given detail shape
 *
 * Each of the detail shapes is selected by exactly one code. Payload-free
 * events share std::monostate and have no single code.
 */
template <typename Shape>
constexpr std::string_view event_code_for() noexcept {
    static_assert(!std::is_same_v<Shape, std::monostate>,
                  "Payload-free events have no unique code");
    for (const auto& info : event_codes) {
        if (info.detail_index == event_detail_index<Shape>) {
            return info.code;
        }
    }
    return {};
}

/**
 * @brief Decode the event detail region using the enclosing packet's code
 *
 * Only the selected shape's bytes are interpreted, from the front of the
 * region. The whole region is kept verbatim in EventDataDetails::raw.
 *
 * @param region Detail region (at least event_details_size bytes)
 * @param code Event code from the enclosing packet
 * @throws TruncatedBufferError if the region is shorter than event_details_size
 * @throws UnknownEventCodeError if the code has no table entry
 */
inline EventDataDetails decode_event_details(std::span<const uint8_t> region,
                                             const EventCode& code) {
    if (region.size() < event_details_size) {
        throw TruncatedBufferError(event_details_size, region.size());
    }

    const EventCodeInfo* info = find_event_code(event_code_view(code));
    if (info == nullptr) {
        throw UnknownEventCodeError(event_code_view(code));
    }

    detail::ByteReader reader(region.first(event_details_size));
    EventDataDetails out;
    out.detail = info->read(reader);
    std::copy_n(region.begin(), event_details_size, out.raw.begin());
    return out;
}

/**
 * @brief Encode the event detail region
 *
 * Writes the active shape at the front of the region and fills the
 * remaining bytes with zero.
 */
inline std::array<uint8_t, event_details_size> encode_event_details(const EventDataDetails& details) {
    std::array<uint8_t, event_details_size> region{};
    detail::ByteWriter writer(region);

    std::visit(
        [&](const auto& shape) {
            using T = std::decay_t<decltype(shape)>;
            if constexpr (!std::is_same_v<T, std::monostate>) {
                WireCodec<T>::write(writer, shape);
            }
        },
        details.detail);

    writer.fill(0, writer.remaining());
    return region;
}

// ============================================================================
// Event packet
// ============================================================================

// Event packet (id 3)
struct PacketEventData {
    static constexpr PacketId id = PacketId::event;

    PacketHeader header;
    EventCode event_string_code;
    EventDataDetails event_details; // Interpreted according to event_string_code

    bool operator==(const PacketEventData&) const = default;
};

template <>
struct RecordTraits<PacketEventData> {
    static constexpr const char* name = "PacketEventData";
    static constexpr auto fields =
        std::make_tuple(field("header", &PacketEventData::header),
                        field("event_string_code", &PacketEventData::event_string_code),
                        field("event_details", &PacketEventData::event_details));
};

/**
 * @brief Event packet codec
 *
 * The detail region cannot be decoded on its own: its shape is selected by
 * the sibling event code, so this codec reads the code first and hands the
 * region to decode_event_details().
 */
template <>
struct WireCodec<PacketEventData> {
    static constexpr size_t size =
        WireCodec<PacketHeader>::size + WireCodec<EventCode>::size + event_details_size;

    static void read(detail::ByteReader& reader, PacketEventData& out) {
        WireCodec<PacketHeader>::read(reader, out.header);
        WireCodec<EventCode>::read(reader, out.event_string_code);
        out.event_details =
            decode_event_details(reader.take(event_details_size), out.event_string_code);
    }

    static void write(detail::ByteWriter& writer, const PacketEventData& value) {
        const EventCodeInfo* info = find_event_code(event_code_view(value.event_string_code));
        if (info == nullptr) {
            throw UnknownEventCodeError(event_code_view(value.event_string_code));
        }
        if (info->detail_index != value.event_details.detail.index()) {
            throw std::invalid_argument("Event details do not match event code '" +
                                        std::string(info->code) + "'");
        }

        WireCodec<PacketHeader>::write(writer, value.header);
        WireCodec<EventCode>::write(writer, value.event_string_code);
        auto region = encode_event_details(value.event_details);
        writer.write_bytes(region.data(), region.size());
    }
};

static_assert(wire_size<PacketEventData>() == 36);

/**
 * @brief Build an Event packet whose code matches the given detail shape
 */
template <typename Shape>
    requires(event_detail_index<Shape> > 0 && event_detail_index<Shape> < std::variant_size_v<EventDetail>)
PacketEventData make_event_packet(const PacketHeader& header, const Shape& shape) {
    PacketEventData packet{};
    packet.header = header;
    packet.event_string_code = EventCode::from(event_code_for<Shape>());
    packet.event_details.detail = shape;
    return packet;
}

/**
 * @brief Build a payload-free Event packet (SSTA, SEND, DRSE, ...)
 * @throws UnknownEventCodeError if the code is unknown or carries details
 */
inline PacketEventData make_event_packet(const PacketHeader& header, std::string_view code) {
    const EventCodeInfo* info = find_event_code(code);
    if (info == nullptr || info->detail_index != 0) {
        throw UnknownEventCodeError(code);
    }

    PacketEventData packet{};
    packet.header = header;
    packet.event_string_code = EventCode::from(code);
    return packet;
}

} // namespace f1telem
