#pragma once

#include <array>
#include <tuple>

#include <cstdint>

#include "../core/fixed_text.hpp"
#include "../core/header.hpp"
#include "../core/record_traits.hpp"
#include "../core/wire_codec.hpp"
#include "../types.hpp"

namespace f1telem {

struct ParticipantData {
    uint8_t ai_controlled; // 1 = AI, 0 = human
    uint8_t driver_id;     // 255 if network human
    uint8_t network_id;
    uint8_t team_id;
    uint8_t my_team;
    uint8_t race_number;
    uint8_t nationality;
    FixedText<name_size> name; // UTF-8, NUL terminated
    uint8_t your_telemetry;    // 0 = restricted, 1 = public

    bool operator==(const ParticipantData&) const = default;
};

template <>
struct RecordTraits<ParticipantData> {
    static constexpr const char* name = "ParticipantData";
    static constexpr auto fields = std::make_tuple(
        field("ai_controlled", &ParticipantData::ai_controlled),
        field("driver_id", &ParticipantData::driver_id),
        field("network_id", &ParticipantData::network_id),
        field("team_id", &ParticipantData::team_id), field("my_team", &ParticipantData::my_team),
        field("race_number", &ParticipantData::race_number),
        field("nationality", &ParticipantData::nationality),
        field("name", &ParticipantData::name),
        field("your_telemetry", &ParticipantData::your_telemetry));
};

static_assert(wire_size<ParticipantData>() == 56);

/**
 * @brief Participants packet (id 4)
 *
 * num_active_cars should match the number of cars on the HUD; slots past it
 * are sent but carry no meaning.
 */
struct PacketParticipantsData {
    static constexpr PacketId id = PacketId::participants;

    PacketHeader header;
    uint8_t num_active_cars;
    std::array<ParticipantData, max_cars> participants;

    bool operator==(const PacketParticipantsData&) const = default;
};

template <>
struct RecordTraits<PacketParticipantsData> {
    static constexpr const char* name = "PacketParticipantsData";
    static constexpr auto fields =
        std::make_tuple(field("header", &PacketParticipantsData::header),
                        field("num_active_cars", &PacketParticipantsData::num_active_cars),
                        field("participants", &PacketParticipantsData::participants));
};

static_assert(wire_size<PacketParticipantsData>() == 1257);

} // namespace f1telem
