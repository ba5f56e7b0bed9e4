#include <f1telem.hpp>
#include <gtest/gtest.h>

using namespace f1telem;

// Published 2021 sizes of every record on the wire
TEST(RecordSizeTest, InnerRecords) {
    EXPECT_EQ(wire_size<PacketHeader>(), 24u);
    EXPECT_EQ(wire_size<CarMotionData>(), 60u);
    EXPECT_EQ(wire_size<MarshalZone>(), 5u);
    EXPECT_EQ(wire_size<WeatherForecastSample>(), 8u);
    EXPECT_EQ(wire_size<LapData>(), 43u);
    EXPECT_EQ(wire_size<ParticipantData>(), 56u);
    EXPECT_EQ(wire_size<CarSetupData>(), 49u);
    EXPECT_EQ(wire_size<CarTelemetryData>(), 60u);
    EXPECT_EQ(wire_size<CarStatusData>(), 47u);
    EXPECT_EQ(wire_size<FinalClassificationData>(), 37u);
    EXPECT_EQ(wire_size<LobbyInfoData>(), 53u);
    EXPECT_EQ(wire_size<CarDamageData>(), 39u);
    EXPECT_EQ(wire_size<LapHistoryData>(), 11u);
    EXPECT_EQ(wire_size<TyreStintHistoryData>(), 3u);
}

TEST(RecordSizeTest, EventShapes) {
    EXPECT_EQ(wire_size<FastestLap>(), 5u);
    EXPECT_EQ(wire_size<Retirement>(), 1u);
    EXPECT_EQ(wire_size<TeamMateInPits>(), 1u);
    EXPECT_EQ(wire_size<RaceWinner>(), 1u);
    EXPECT_EQ(wire_size<Penalty>(), 7u);
    EXPECT_EQ(wire_size<SpeedTrap>(), 7u);
    EXPECT_EQ(wire_size<StartLights>(), 1u);
    EXPECT_EQ(wire_size<DriveThroughPenaltyServed>(), 1u);
    EXPECT_EQ(wire_size<StopGoPenaltyServed>(), 1u);
    EXPECT_EQ(wire_size<Flashback>(), 8u);
    EXPECT_EQ(wire_size<Buttons>(), 4u);
}

TEST(RecordSizeTest, TopLevelPackets) {
    EXPECT_EQ(wire_size<PacketMotionData>(), 1464u);
    EXPECT_EQ(wire_size<PacketSessionData>(), 625u);
    EXPECT_EQ(wire_size<PacketLapData>(), 970u);
    EXPECT_EQ(wire_size<PacketEventData>(), 36u);
    EXPECT_EQ(wire_size<PacketParticipantsData>(), 1257u);
    EXPECT_EQ(wire_size<PacketCarSetupData>(), 1102u);
    EXPECT_EQ(wire_size<PacketCarTelemetryData>(), 1347u);
    EXPECT_EQ(wire_size<PacketCarStatusData>(), 1058u);
    EXPECT_EQ(wire_size<PacketFinalClassificationData>(), 839u);
    EXPECT_EQ(wire_size<PacketLobbyInfoData>(), 1191u);
    EXPECT_EQ(wire_size<PacketCarDamageData>(), 882u);
    EXPECT_EQ(wire_size<PacketSessionHistoryData>(), 1155u);
}

TEST(RecordSizeTest, MaxPacketSizeIsMotion) {
    EXPECT_EQ(max_packet_size, wire_size<PacketMotionData>());
}

// Sizes are compile-time constants
static_assert(wire_size<PacketCarTelemetryData>() ==
              24 + 22 * wire_size<CarTelemetryData>() + 3);
static_assert(wire_size<PacketSessionHistoryData>() ==
              24 + 7 + 100 * wire_size<LapHistoryData>() + 8 * wire_size<TyreStintHistoryData>());

// Packet ids line up with variant alternatives
static_assert(PacketMotionData::id == PacketId::motion);
static_assert(PacketEventData::id == PacketId::event);
static_assert(PacketSessionHistoryData::id == PacketId::session_history);
static_assert(std::is_same_v<std::variant_alternative_t<6, Packet>, PacketCarTelemetryData>);
