#include <chrono>
#include <optional>
#include <thread>
#include <vector>

#include <arpa/inet.h>
#include <cstring>
#include <f1telem_io.hpp>
#include <gtest/gtest.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include "test_utils.hpp"

using namespace f1telem;
using namespace f1telem::utils::netio;

// =============================================================================
// RAII Thread Guard
// =============================================================================

/**
 * @brief RAII guard for std::thread to ensure joining even on test failure
 */
class ThreadGuard {
public:
    explicit ThreadGuard(std::thread&& t) : thread_(std::move(t)) {}

    ~ThreadGuard() {
        if (thread_.joinable()) {
            thread_.join();
        }
    }

    ThreadGuard(const ThreadGuard&) = delete;
    ThreadGuard& operator=(const ThreadGuard&) = delete;

    void join() {
        if (thread_.joinable()) {
            thread_.join();
        }
    }

private:
    std::thread thread_;
};

// =============================================================================
// Test Fixture
// =============================================================================

class TelemetryListenerTest : public ::testing::Test {
protected:
    int sender_socket_ = -1;

    static ListenerConfig loopback() { return ListenerConfig{"127.0.0.1", 0}; }

    void SetUp() override {
        sender_socket_ = socket(AF_INET, SOCK_DGRAM, 0);
        ASSERT_GE(sender_socket_, 0) << "Failed to create sender socket: " << strerror(errno);
    }

    void TearDown() override {
        if (sender_socket_ >= 0) {
            close(sender_socket_);
        }
    }

    /**
     * @brief Send raw bytes via UDP to localhost:port
     */
    void send_datagram(const std::vector<uint8_t>& data, uint16_t port) {
        struct sockaddr_in dest {};
        dest.sin_family = AF_INET;
        dest.sin_port = htons(port);
        dest.sin_addr.s_addr = inet_addr("127.0.0.1");

        ssize_t sent = sendto(sender_socket_, data.data(), data.size(), 0,
                              reinterpret_cast<struct sockaddr*>(&dest), sizeof(dest));

        ASSERT_EQ(sent, static_cast<ssize_t>(data.size()))
            << "Failed to send datagram: " << strerror(errno);
    }
};

// =============================================================================
// Construction
// =============================================================================

TEST(ParsePortTest, AcceptsDecimalPorts) {
    EXPECT_EQ(parse_port("20777"), std::optional<uint16_t>(20777));
    EXPECT_EQ(parse_port("1"), std::optional<uint16_t>(1));
    EXPECT_EQ(parse_port("65535"), std::optional<uint16_t>(65535));
}

TEST(ParsePortTest, RejectsMalformedPorts) {
    EXPECT_FALSE(parse_port("").has_value());
    EXPECT_FALSE(parse_port("0").has_value());
    EXPECT_FALSE(parse_port("65536").has_value());
    EXPECT_FALSE(parse_port("-1").has_value());
    EXPECT_FALSE(parse_port("port").has_value());
    EXPECT_FALSE(parse_port("2077x").has_value());
    EXPECT_FALSE(parse_port(" 20777").has_value());
    EXPECT_FALSE(parse_port("99999999999999999999999").has_value());
}

TEST_F(TelemetryListenerTest, BindEphemeralPort) {
    TelemetryListener listener(loopback());

    EXPECT_TRUE(listener.is_open());
    EXPECT_GE(listener.socket_fd(), 0);
    EXPECT_GT(listener.socket_port(), 0) << "Kernel should assign a non-zero ephemeral port";
}

TEST_F(TelemetryListenerTest, DefaultConfigUsesGamePort) {
    ListenerConfig config;
    EXPECT_EQ(config.port, 20777);
    EXPECT_TRUE(config.host.empty());
}

TEST_F(TelemetryListenerTest, BindConflictThrows) {
    TelemetryListener first(loopback());
    uint16_t port = first.socket_port();
    ASSERT_GT(port, 0);

    try {
        TelemetryListener second(ListenerConfig{"127.0.0.1", port});
        FAIL() << "Expected SocketError";
    } catch (const SocketError& e) {
        EXPECT_EQ(e.errno_value(), EADDRINUSE);
    }
}

TEST_F(TelemetryListenerTest, InvalidHostThrows) {
    EXPECT_THROW(TelemetryListener(ListenerConfig{"not-an-address", 0}), SocketError);
}

TEST_F(TelemetryListenerTest, AdoptExistingSocket) {
    int fd = socket(AF_INET, SOCK_DGRAM, 0);
    ASSERT_GE(fd, 0);

    struct sockaddr_in addr {};
    addr.sin_family = AF_INET;
    addr.sin_port = 0;
    addr.sin_addr.s_addr = inet_addr("127.0.0.1");
    ASSERT_EQ(bind(fd, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)), 0);

    TelemetryListener listener(fd, true);
    EXPECT_EQ(listener.socket_fd(), fd);
    EXPECT_GT(listener.socket_port(), 0);

    EXPECT_THROW(TelemetryListener(-1, false), SocketError);
}

TEST_F(TelemetryListenerTest, MoveTransfersSocket) {
    TelemetryListener original(loopback());
    int fd = original.socket_fd();
    uint16_t port = original.socket_port();

    TelemetryListener moved(std::move(original));
    EXPECT_EQ(moved.socket_fd(), fd);
    EXPECT_EQ(moved.socket_port(), port);
    EXPECT_FALSE(original.is_open());
    EXPECT_THROW(original.receive_one(), SocketError);
}

// =============================================================================
// Receiving
// =============================================================================

TEST_F(TelemetryListenerTest, ReceiveMotionPacket) {
    TelemetryListener listener(loopback());
    listener.try_set_timeout(std::chrono::milliseconds(1000));
    uint16_t port = listener.socket_port();

    auto bytes = test_utils::make_datagram<PacketMotionData>();

    ThreadGuard sender(std::thread([this, bytes, port]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        send_datagram(bytes, port);
    }));

    Packet pkt = listener.receive_one();
    sender.join();

    ASSERT_TRUE(std::holds_alternative<PacketMotionData>(pkt));
    EXPECT_EQ(encode_packet(pkt), bytes);

    const auto& status = listener.transport_status();
    EXPECT_EQ(status.state, UDPTransportStatus::State::packet_ready);
    EXPECT_EQ(status.bytes_received, 1464u);
    EXPECT_EQ(status.actual_size, 1464u);
    ASSERT_TRUE(status.has_key);
    EXPECT_EQ(status.key, (DispatchKey{2021, 1, 0}));
}

TEST_F(TelemetryListenerTest, ReceiveEveryVariantInOrder) {
    TelemetryListener listener(loopback());
    listener.try_set_timeout(std::chrono::milliseconds(1000));
    uint16_t port = listener.socket_port();

    for (size_t id = 0; id < packet_id_count; ++id) {
        send_datagram(test_utils::make_datagram_for(static_cast<PacketId>(id)), port);
    }

    for (size_t id = 0; id < packet_id_count; ++id) {
        Packet pkt = listener.receive_one();
        EXPECT_EQ(pkt.index(), id);
    }
}

TEST_F(TelemetryListenerTest, TimeoutThrowsAndListenerStaysUsable) {
    TelemetryListener listener(loopback());
    ASSERT_TRUE(listener.try_set_timeout(std::chrono::milliseconds(50)));

    EXPECT_THROW(listener.receive_one(), ReceiveTimeoutError);
    EXPECT_EQ(listener.transport_status().state, UDPTransportStatus::State::timeout);
    EXPECT_TRUE(listener.is_open());

    send_datagram(test_utils::make_event_datagram(), listener.socket_port());
    Packet pkt = listener.receive_one();
    EXPECT_EQ(packet_id(pkt), PacketId::event);
}

// Decode failures propagate per datagram; the next datagram still decodes
TEST_F(TelemetryListenerTest, DecodeErrorsDoNotStopListener) {
    TelemetryListener listener(loopback());
    listener.try_set_timeout(std::chrono::milliseconds(1000));
    uint16_t port = listener.socket_port();

    auto unknown = test_utils::make_datagram<PacketLapData>();
    unknown[5] = 42;
    send_datagram(unknown, port);

    std::vector<uint8_t> runt(10, 0);
    send_datagram(runt, port);

    send_datagram(test_utils::make_datagram<PacketLapData>(), port);

    EXPECT_THROW(listener.receive_one(), UnknownPacketError);
    EXPECT_THROW(listener.receive_one(), TruncatedBufferError);
    EXPECT_FALSE(listener.transport_status().has_key);

    Packet pkt = listener.receive_one();
    EXPECT_EQ(packet_id(pkt), PacketId::lap_data);
    EXPECT_TRUE(listener.is_open());
}

// Oversized datagrams are flagged; the prefix still reaches the decoder
TEST_F(TelemetryListenerTest, OversizedDatagramFlaggedTruncated) {
    BasicTelemetryListener<64> listener(loopback());
    listener.try_set_timeout(std::chrono::milliseconds(1000));

    auto bytes = test_utils::make_datagram<PacketCarSetupData>();
    send_datagram(bytes, listener.socket_port());

    try {
        listener.receive_one();
        FAIL() << "Expected TruncatedBufferError";
    } catch (const TruncatedBufferError& e) {
        EXPECT_EQ(e.required(), 1102u);
        EXPECT_EQ(e.available(), 64u);
    }

    const auto& status = listener.transport_status();
    EXPECT_TRUE(status.is_truncated());
    EXPECT_EQ(status.bytes_received, 64u);
    EXPECT_EQ(status.actual_size, 1102u);
    EXPECT_EQ(status.key.packet_id, 5);
}

TEST_F(TelemetryListenerTest, ReceiveRawDatagram) {
    TelemetryListener listener(loopback());
    listener.try_set_timeout(std::chrono::milliseconds(1000));

    std::vector<uint8_t> junk = {1, 2, 3, 4, 5};
    send_datagram(junk, listener.socket_port());

    auto datagram = listener.receive_datagram();
    EXPECT_EQ(std::vector<uint8_t>(datagram.begin(), datagram.end()), junk);
}
