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

struct LobbyInfoData {
    uint8_t ai_controlled;
    uint8_t team_id; // 255 if no team currently selected
    uint8_t nationality;
    FixedText<name_size> name;
    uint8_t car_number;
    uint8_t ready_status; // 0 = not ready, 1 = ready, 2 = spectating

    bool operator==(const LobbyInfoData&) const = default;
};

template <>
struct RecordTraits<LobbyInfoData> {
    static constexpr const char* name = "LobbyInfoData";
    static constexpr auto fields = std::make_tuple(
        field("ai_controlled", &LobbyInfoData::ai_controlled),
        field("team_id", &LobbyInfoData::team_id),
        field("nationality", &LobbyInfoData::nationality), field("name", &LobbyInfoData::name),
        field("car_number", &LobbyInfoData::car_number),
        field("ready_status", &LobbyInfoData::ready_status));
};

static_assert(wire_size<LobbyInfoData>() == 53);

// Lobby info packet (id 9)
struct PacketLobbyInfoData {
    static constexpr PacketId id = PacketId::lobby_info;

    PacketHeader header;
    uint8_t num_players;
    std::array<LobbyInfoData, max_cars> lobby_players;

    bool operator==(const PacketLobbyInfoData&) const = default;
};

template <>
struct RecordTraits<PacketLobbyInfoData> {
    static constexpr const char* name = "PacketLobbyInfoData";
    static constexpr auto fields =
        std::make_tuple(field("header", &PacketLobbyInfoData::header),
                        field("num_players", &PacketLobbyInfoData::num_players),
                        field("lobby_players", &PacketLobbyInfoData::lobby_players));
};

static_assert(wire_size<PacketLobbyInfoData>() == 1191);

} // namespace f1telem
