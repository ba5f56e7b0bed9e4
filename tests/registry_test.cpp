#include <set>
#include <string>
#include <vector>

#include <f1telem.hpp>
#include <gtest/gtest.h>

#include "test_utils.hpp"

using namespace f1telem;

class RegistryTest : public ::testing::Test {
protected:
    PacketRegistry registry_ = PacketRegistry::f1_2021();
};

TEST_F(RegistryTest, HasTwelveEntries) {
    EXPECT_EQ(registry_.size(), 12u);
    EXPECT_EQ(registry_.entries().size(), 12u);

    for (uint8_t id = 0; id < 12; ++id) {
        EXPECT_TRUE(registry_.contains(DispatchKey{2021, 1, id})) << "packet id " << int(id);
    }
    EXPECT_FALSE(registry_.contains(DispatchKey{2021, 1, 12}));
}

TEST_F(RegistryTest, EntryMetadata) {
    const auto& telemetry = registry_.lookup(DispatchKey{2021, 1, 6});
    EXPECT_STREQ(telemetry.name, "car_telemetry");
    EXPECT_EQ(telemetry.size, 1347u);

    const auto& history = registry_.lookup(DispatchKey{2021, 1, 11});
    EXPECT_STREQ(history.name, "session_history");
    EXPECT_EQ(history.size, 1155u);

    EXPECT_EQ(registry_.max_packet_size(), max_packet_size);
}

TEST_F(RegistryTest, EntryNamesAreUnique) {
    std::set<std::string> names;
    for (const auto& [key, entry] : registry_.entries()) {
        names.insert(entry.name);
        EXPECT_EQ(key, entry.key);
    }
    EXPECT_EQ(names.size(), 12u);
}

TEST_F(RegistryTest, DecodeEveryVariant) {
    for (size_t id = 0; id < packet_id_count; ++id) {
        auto bytes = test_utils::make_datagram_for(static_cast<PacketId>(id));

        Packet pkt = decode_packet(registry_, bytes);
        EXPECT_EQ(pkt.index(), id);
        EXPECT_EQ(packet_id(pkt), static_cast<PacketId>(id));
        EXPECT_EQ(packet_header(pkt).packet_id, id);
        EXPECT_STREQ(packet_name(pkt), packet_id_string(static_cast<PacketId>(id)));

        // Registry decode and encode agree byte for byte
        EXPECT_EQ(encode_packet(pkt), bytes) << packet_name(pkt);
        EXPECT_EQ(registry_.encode(pkt), bytes) << packet_name(pkt);
    }
}

TEST_F(RegistryTest, UnknownPacketId) {
    auto bytes = test_utils::make_datagram<PacketMotionData>();
    bytes[5] = 12;

    try {
        registry_.decode(bytes);
        FAIL() << "Expected UnknownPacketError";
    } catch (const UnknownPacketError& e) {
        EXPECT_EQ(e.key().packet_format, 2021);
        EXPECT_EQ(e.key().packet_version, 1);
        EXPECT_EQ(e.key().packet_id, 12);
    }
}

// Other seasons and versions are not served by the 2021 table
TEST_F(RegistryTest, UnknownFormatOrVersion) {
    auto other_format = test_utils::make_datagram<PacketLapData>();
    other_format[0] = 0xE6; // 2022
    EXPECT_THROW(registry_.decode(other_format), UnknownPacketError);

    auto other_version = test_utils::make_datagram<PacketLapData>();
    other_version[4] = 2;
    EXPECT_THROW(registry_.decode(other_version), UnknownPacketError);

    EXPECT_EQ(registry_.find(DispatchKey{2022, 1, 2}), nullptr);
}

TEST_F(RegistryTest, LookupMissingThrows) {
    EXPECT_THROW(registry_.lookup(DispatchKey{2020, 1, 0}), UnknownPacketError);
    EXPECT_NE(registry_.find(DispatchKey{2021, 1, 0}), nullptr);
}

TEST_F(RegistryTest, EncodeRejectsMismatchedHeaderId) {
    PacketLapData lap{};
    lap.header = test_utils::make_header(PacketId::motion);

    EXPECT_THROW(registry_.encode(Packet{lap}), std::invalid_argument);
}

// A registry built from a subset only knows that subset
TEST(CustomRegistryTest, SubsetOfEntries) {
    auto full = PacketRegistry::f1_2021();
    PacketRegistry telemetry_only({full.lookup(DispatchKey{2021, 1, 6})});

    EXPECT_EQ(telemetry_only.size(), 1u);
    EXPECT_EQ(telemetry_only.max_packet_size(), 1347u);

    auto telemetry = test_utils::make_datagram<PacketCarTelemetryData>();
    EXPECT_NO_THROW(telemetry_only.decode(telemetry));

    auto motion = test_utils::make_datagram<PacketMotionData>();
    EXPECT_THROW(telemetry_only.decode(motion), UnknownPacketError);
}

TEST(CustomRegistryTest, EmptyRegistry) {
    PacketRegistry empty;
    EXPECT_EQ(empty.size(), 0u);
    EXPECT_EQ(empty.max_packet_size(), 0u);

    auto bytes = test_utils::make_datagram<PacketMotionData>();
    EXPECT_THROW(empty.decode(bytes), UnknownPacketError);
}
