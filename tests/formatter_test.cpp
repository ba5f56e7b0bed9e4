#include <set>
#include <string>
#include <vector>

#include <f1telem.hpp>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include "test_utils.hpp"

using namespace f1telem;

TEST(FormatterTest, HeaderMappingInFieldOrder) {
    auto mapping = to_mapping(test_utils::make_header(PacketId::motion));

    ASSERT_TRUE(mapping.is_object());
    ASSERT_EQ(mapping.size(), 10u);
    EXPECT_EQ(mapping.begin().key(), "packet_format");
    EXPECT_EQ(mapping["packet_format"], 2021);
    EXPECT_EQ(mapping["session_uid"], 123456789u);
    EXPECT_EQ(mapping["session_time"], 12.5);
    EXPECT_EQ(mapping["secondary_player_car_index"], 255);
}

TEST(FormatterTest, FloatsRoundedToThreePlaces) {
    CarStatusData status{};
    status.fuel_in_tank = 12.34567f;
    status.ers_store_energy = 3999999.75f;
    status.vehicle_fia_flags = -1;

    auto mapping = to_mapping(status);
    EXPECT_DOUBLE_EQ(mapping["fuel_in_tank"].get<double>(), 12.346);
    EXPECT_DOUBLE_EQ(mapping["ers_store_energy"].get<double>(), 3999999.75);
    EXPECT_EQ(mapping["vehicle_fia_flags"], -1);
}

TEST(FormatterTest, ArraysAndNestedRecords) {
    PacketSessionData session{};
    session.header = test_utils::make_header(PacketId::session);
    session.num_marshal_zones = 2;
    session.marshal_zones[1].zone_start = 0.5f;
    session.marshal_zones[1].zone_flag = 3;

    auto mapping = to_mapping(session);
    ASSERT_TRUE(mapping["marshal_zones"].is_array());
    EXPECT_EQ(mapping["marshal_zones"].size(), 21u);
    EXPECT_EQ(mapping["marshal_zones"][1]["zone_start"], 0.5);
    EXPECT_EQ(mapping["marshal_zones"][1]["zone_flag"], 3);
    EXPECT_EQ(mapping["weather_forecast_samples"].size(), 56u);
    EXPECT_EQ(mapping["header"]["packet_id"], 1);
}

TEST(FormatterTest, WheelArraysStayNumeric) {
    CarTelemetryData telemetry{};
    telemetry.tyres_surface_temperature = {90, 91, 92, 93};
    telemetry.tyres_pressure = {23.1f, 23.2f, 22.5f, 22.55f};

    auto mapping = to_mapping(telemetry);
    EXPECT_EQ(mapping["tyres_surface_temperature"], nlohmann::ordered_json({90, 91, 92, 93}));
    EXPECT_DOUBLE_EQ(mapping["tyres_pressure"][0].get<double>(), 23.1);
    EXPECT_DOUBLE_EQ(mapping["tyres_pressure"][3].get<double>(), 22.55);
}

// A 48-byte name field, cut at the first NUL
TEST(FormatterTest, NameTextStopsAtNul) {
    auto bytes = test_utils::make_datagram<PacketParticipantsData>();
    const std::string name = "Max Verstappen";
    size_t name_offset = 24 + 1 + 7; // header, num_active_cars, seven u8 fields
    for (size_t i = 0; i < name.size(); ++i) {
        bytes[name_offset + i] = static_cast<uint8_t>(name[i]);
    }
    bytes[name_offset + name.size()] = 0;

    auto participants = decode<PacketParticipantsData>(bytes);
    auto mapping = to_mapping(participants);
    EXPECT_EQ(mapping["participants"][0]["name"], "Max Verstappen");

    // The bytes after the NUL are still there for re-encode
    EXPECT_EQ(encode(participants), bytes);
}

TEST(FormatterTest, EventDetailsRenderSelectedShape) {
    FastestLap lap{};
    lap.vehicle_idx = 3;
    lap.lap_time = 88.5f;
    auto event = make_event_packet(test_utils::make_header(PacketId::event), lap);

    auto mapping = to_mapping(event);
    EXPECT_EQ(mapping["event_string_code"], "FTLP");
    ASSERT_EQ(mapping["event_details"].size(), 2u);
    EXPECT_EQ(mapping["event_details"]["vehicle_idx"], 3);
    EXPECT_EQ(mapping["event_details"]["lap_time"], 88.5);
}

struct EventShapeCase {
    const char* code;
    std::set<std::string> keys;
};

// One row per event code that carries details
const std::vector<EventShapeCase> event_shape_cases = {
    {"FTLP", {"vehicle_idx", "lap_time"}},
    {"RTMT", {"vehicle_idx"}},
    {"TMPT", {"vehicle_idx"}},
    {"RCWN", {"vehicle_idx"}},
    {"PENA",
     {"penalty_type", "infringement_type", "vehicle_idx", "other_vehicle_idx", "time", "lap_num",
      "places_gained"}},
    {"SPTP", {"vehicle_idx", "speed", "overall_fastest_in_session", "driver_fastest_in_session"}},
    {"STLG", {"num_lights"}},
    {"DTSV", {"vehicle_idx"}},
    {"SGSV", {"vehicle_idx"}},
    {"FLBK", {"flashback_frame_identifier", "flashback_session_time"}},
    {"BUTN", {"button_status"}},
};

// Only the first detail byte is set; the rest of the region stays zero
TEST(FormatterTest, EachEventCodeRendersOnlyItsShape) {
    auto registry = PacketRegistry::f1_2021();

    for (const auto& row : event_shape_cases) {
        SCOPED_TRACE(row.code);

        auto bytes = encode(test_utils::make_header(PacketId::event));
        bytes.insert(bytes.end(), row.code, row.code + event_code_size);
        bytes.resize(wire_size<PacketEventData>(), 0);
        bytes[header_size + event_code_size] = 5;
        ASSERT_EQ(bytes.size(), 36u);

        Packet pkt = registry.decode(bytes);
        ASSERT_TRUE(std::holds_alternative<PacketEventData>(pkt));
        const auto& event = std::get<PacketEventData>(pkt);
        EXPECT_NE(event.event_details.detail.index(), 0u);
        EXPECT_EQ(encode_packet(pkt), bytes);

        auto mapping = to_mapping(pkt);
        EXPECT_EQ(mapping["event_string_code"], row.code);

        std::set<std::string> keys;
        for (const auto& item : mapping["event_details"].items()) {
            keys.insert(item.key());
        }
        EXPECT_EQ(keys, row.keys);
    }
}

TEST(FormatterTest, PayloadFreeEventIsEmptyObject) {
    auto event = make_event_packet(test_utils::make_header(PacketId::event), "SSTA");

    auto mapping = to_mapping(event);
    EXPECT_EQ(mapping["event_string_code"], "SSTA");
    EXPECT_TRUE(mapping["event_details"].is_object());
    EXPECT_TRUE(mapping["event_details"].empty());
}

TEST(FormatterTest, PacketVariantUsesHeldPacket) {
    auto registry = PacketRegistry::f1_2021();
    auto bytes = test_utils::make_datagram<PacketCarDamageData>();
    Packet pkt = registry.decode(bytes);

    auto from_variant = to_mapping(pkt);
    auto from_packet = to_mapping(std::get<PacketCarDamageData>(pkt));
    EXPECT_EQ(from_variant, from_packet);
    EXPECT_EQ(from_variant["car_damage_data"].size(), 22u);
}

TEST(FormatterTest, TextIsSortedAndIndented) {
    RaceWinner winner{};
    winner.vehicle_idx = 1;
    EXPECT_EQ(to_text(winner), "{\n  \"vehicle_idx\": 1\n}");

    auto text = to_text(test_utils::make_header(PacketId::lap_data));
    EXPECT_LT(text.find("\"frame_identifier\""), text.find("\"game_major_version\""));
    EXPECT_LT(text.find("\"player_car_index\""), text.find("\"session_uid\""));
    EXPECT_NE(text.find("\n  \"packet_id\": 2"), std::string::npos);
}

TEST(FormatterTest, TextKeepsUtf8AndReplacesInvalidBytes) {
    LobbyInfoData lobby{};
    lobby.name = FixedText<name_size>::from("P\xC3\xA9rez"); // "Pérez"
    EXPECT_NE(to_text(lobby).find("P\xC3\xA9rez"), std::string::npos);

    lobby.name = FixedText<name_size>::from("bad\xFF");
    std::string text;
    ASSERT_NO_THROW(text = to_text(lobby));
    EXPECT_NE(text.find("bad\xEF\xBF\xBD"), std::string::npos); // U+FFFD
}

TEST(FormatterTest, TextParsesBackToMapping) {
    auto bytes = test_utils::make_datagram<PacketLapData>();
    auto lap_data = decode<PacketLapData>(bytes);

    auto parsed = nlohmann::json::parse(to_text(lap_data));
    EXPECT_EQ(parsed["lap_data"].size(), 22u);
    EXPECT_EQ(parsed["header"]["frame_identifier"], 500);
}
