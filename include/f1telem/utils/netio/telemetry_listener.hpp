#pragma once

#include <algorithm>
#include <array>
#include <charconv>
#include <chrono>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>

#include <cerrno>
#include <cstdint>
#include <cstring>
#include <unistd.h>

// Linux/POSIX socket headers
#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <sys/types.h>

#include "../../core/header.hpp"
#include "../../errors.hpp"
#include "../../packet/packet_variant.hpp"
#include "../../registry.hpp"
#include "../../types.hpp"
#include "udp_transport_status.hpp"

namespace f1telem::utils::netio {

/**
 * @brief Where the listener binds
 *
 * An empty host binds all interfaces; otherwise host must be a dotted
 * IPv4 address.
 */
struct ListenerConfig {
    std::string host{};
    uint16_t port{default_udp_port};
};

/**
 * @brief Parse a UDP port given as decimal text
 * @return The port, or std::nullopt unless text is a whole number in 1-65535
 */
inline std::optional<uint16_t> parse_port(std::string_view text) noexcept {
    unsigned long value = 0;
    auto [end, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || end != text.data() + text.size() || value == 0 || value > 65535) {
        return std::nullopt;
    }
    return static_cast<uint16_t>(value);
}

/**
 * @brief Blocking UDP telemetry listener (Linux/POSIX)
 *
 * Owns an IPv4 UDP socket bound at construction and turns each datagram
 * into a decoded Packet using its registry. Each datagram carries exactly
 * one packet.
 *
 * Decode failures are reported per datagram by exception; the listener
 * stays usable and the next receive_one() reads the next datagram.
 *
 * **Datagram Truncation**
 *
 * Datagrams larger than MaxDatagramBytes are detected via MSG_TRUNC and
 * flagged in transport_status(). The received prefix is still handed to
 * the decoder, which reports a TruncatedBufferError if the prefix does not
 * hold a whole packet.
 *
 * @tparam MaxDatagramBytes Receive buffer size in bytes
 *
 * @warning This class is MOVE-ONLY.
 *
 * Example usage:
 * @code
 * f1telem::TelemetryListener listener({"", 20777});
 * while (true) {
 *     f1telem::Packet pkt = listener.receive_one();
 *     std::cout << f1telem::to_text(pkt) << "\n";
 * }
 * @endcode
 */
template <size_t MaxDatagramBytes = max_packet_size>
class BasicTelemetryListener {
    static_assert(MaxDatagramBytes >= header_size,
                  "Receive buffer must hold at least a packet header");

public:
    /**
     * @brief Create a listener bound to config.host:config.port
     *
     * @param config Bind address (port 0 picks an ephemeral port)
     * @param registry Packet table used to decode datagrams
     * @throws SocketError if the host is not an IPv4 address or socket
     *         creation or binding fails
     */
    explicit BasicTelemetryListener(const ListenerConfig& config = {},
                                    PacketRegistry registry = PacketRegistry::f1_2021())
        : socket_(-1),
          owns_socket_(true),
          registry_(std::move(registry)),
          scratch_buffer_{},
          status_{} {
        struct sockaddr_in addr {};
        addr.sin_family = AF_INET;
        addr.sin_port = htons(config.port);
        if (config.host.empty()) {
            addr.sin_addr.s_addr = htonl(INADDR_ANY);
        } else if (inet_pton(AF_INET, config.host.c_str(), &addr.sin_addr) != 1) {
            throw SocketError("Invalid IPv4 address '" + config.host + "'", EINVAL);
        }

        socket_ = socket(AF_INET, SOCK_DGRAM, 0);
        if (socket_ < 0) {
            throw SocketError("Failed to create UDP socket: " + std::string(std::strerror(errno)),
                              errno);
        }

        if (bind(socket_, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)) < 0) {
            int err = errno;
            close(socket_);
            socket_ = -1;
            throw SocketError(std::string(std::strerror(err)) + " (binding " +
                                  (config.host.empty() ? std::string("*") : config.host) + ":" +
                                  std::to_string(config.port) + ")",
                              err);
        }
    }

    /**
     * @brief Create a listener using an existing socket
     *
     * @param socket_fd Bound, blocking UDP socket descriptor
     * @param take_ownership If true, socket will be closed in destructor
     * @param registry Packet table used to decode datagrams
     * @throws SocketError if socket_fd is negative
     */
    BasicTelemetryListener(int socket_fd, bool take_ownership,
                           PacketRegistry registry = PacketRegistry::f1_2021())
        : socket_(socket_fd),
          owns_socket_(take_ownership),
          registry_(std::move(registry)),
          scratch_buffer_{},
          status_{} {
        if (socket_ < 0) {
            throw SocketError("Invalid socket file descriptor", EBADF);
        }
    }

    ~BasicTelemetryListener() noexcept {
        if (owns_socket_ && socket_ >= 0) {
            close(socket_);
        }
    }

    BasicTelemetryListener(const BasicTelemetryListener&) = delete;
    BasicTelemetryListener& operator=(const BasicTelemetryListener&) = delete;

    BasicTelemetryListener(BasicTelemetryListener&& other) noexcept
        : socket_(other.socket_),
          owns_socket_(other.owns_socket_),
          registry_(std::move(other.registry_)),
          scratch_buffer_(other.scratch_buffer_),
          status_(other.status_) {
        other.socket_ = -1;
        other.owns_socket_ = false;
    }

    BasicTelemetryListener& operator=(BasicTelemetryListener&& other) noexcept {
        if (this != &other) {
            if (owns_socket_ && socket_ >= 0) {
                close(socket_);
            }
            socket_ = other.socket_;
            owns_socket_ = other.owns_socket_;
            registry_ = std::move(other.registry_);
            scratch_buffer_ = other.scratch_buffer_;
            status_ = other.status_;
            other.socket_ = -1;
            other.owns_socket_ = false;
        }
        return *this;
    }

    /**
     * @brief Block for the next datagram and decode it
     *
     * @return The decoded packet
     * @throws ReceiveTimeoutError if a timeout was armed and expired
     * @throws SocketError on a fatal receive error
     * @throws DecodeError (any subclass) if the datagram cannot be decoded
     */
    Packet receive_one() {
        auto bytes = receive_datagram();
        return registry_.decode(bytes);
    }

    /**
     * @brief Block for the next datagram and return its raw bytes
     *
     * The returned span references the internal buffer and is valid until
     * the next receive.
     *
     * @throws ReceiveTimeoutError if a timeout was armed and expired
     * @throws SocketError on a fatal receive error
     */
    std::span<const uint8_t> receive_datagram() {
        if (socket_ < 0) {
            throw SocketError("Listener socket is closed", EBADF);
        }

        status_ = UDPTransportStatus{};

        struct iovec iov {};
        iov.iov_base = scratch_buffer_.data();
        iov.iov_len = scratch_buffer_.size();

        struct msghdr msg {};
        msg.msg_iov = &iov;
        msg.msg_iovlen = 1;

        // MSG_TRUNC makes recvmsg return the actual datagram size even if truncated
        ssize_t bytes;
        while (true) {
            bytes = recvmsg(socket_, &msg, MSG_TRUNC);
            if (bytes >= 0) {
                break;
            }

            int err = errno;
            status_.errno_value = err;

            if (err == EINTR) {
                continue;
            }

            if (err == EAGAIN || err == EWOULDBLOCK) {
                status_.state = UDPTransportStatus::State::timeout;
                throw ReceiveTimeoutError("Receive timed out", err);
            }

            status_.state = UDPTransportStatus::State::socket_error;
            throw SocketError("Receive failed: " + std::string(std::strerror(err)), err);
        }

        status_.actual_size = static_cast<size_t>(bytes);
        status_.bytes_received = std::min(scratch_buffer_.size(), static_cast<size_t>(bytes));
        status_.state = (msg.msg_flags & MSG_TRUNC) ? UDPTransportStatus::State::datagram_truncated
                                                    : UDPTransportStatus::State::packet_ready;

        std::span<const uint8_t> datagram(scratch_buffer_.data(), status_.bytes_received);
        if (datagram.size() >= header_size) {
            status_.key = decode_header(datagram).key;
            status_.has_key = true;
        }

        return datagram;
    }

    /**
     * @brief Get transport status from last receive operation
     */
    const UDPTransportStatus& transport_status() const noexcept { return status_; }

    const PacketRegistry& registry() const noexcept { return registry_; }

    /**
     * @brief Set receive timeout for blocking operations
     *
     * Sets SO_RCVTIMEO. Once armed, an expired wait makes receive_one()
     * throw ReceiveTimeoutError.
     *
     * @param timeout Timeout duration (zero = no timeout, infinite blocking)
     * @return true on success, false on failure
     */
    bool try_set_timeout(std::chrono::milliseconds timeout) noexcept {
        struct timeval tv {};
        tv.tv_sec = timeout.count() / 1000;
        tv.tv_usec = (timeout.count() % 1000) * 1000;

        return setsockopt(socket_, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv)) >= 0;
    }

    /**
     * @brief Set socket receive buffer size (SO_RCVBUF)
     *
     * @return true on success, false on failure
     */
    bool try_set_receive_buffer_size(size_t bytes) noexcept {
        int size = static_cast<int>(bytes);
        return setsockopt(socket_, SOL_SOCKET, SO_RCVBUF, &size, sizeof(size)) >= 0;
    }

    bool is_open() const noexcept { return socket_ >= 0 && !status_.is_terminal(); }

    int socket_fd() const noexcept { return socket_; }

    /**
     * @brief Get the port the socket is bound to
     *
     * Useful when binding to port 0 (ephemeral port) to discover the assigned port.
     *
     * @return Port number, or 0 on error
     */
    uint16_t socket_port() const noexcept {
        struct sockaddr_in addr {};
        socklen_t addr_len = sizeof(addr);

        if (getsockname(socket_, reinterpret_cast<struct sockaddr*>(&addr), &addr_len) < 0) {
            return 0;
        }

        return ntohs(addr.sin_port);
    }

private:
    int socket_;       ///< UDP socket file descriptor
    bool owns_socket_; ///< Whether to close socket in destructor
    PacketRegistry registry_;
    std::array<uint8_t, MaxDatagramBytes> scratch_buffer_; ///< Internal datagram buffer
    UDPTransportStatus status_;                            ///< Status of last receive operation
};

} // namespace f1telem::utils::netio

namespace f1telem {

using utils::netio::ListenerConfig;
using utils::netio::parse_port;
using TelemetryListener = utils::netio::BasicTelemetryListener<>;

} // namespace f1telem
