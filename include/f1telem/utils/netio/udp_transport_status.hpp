#pragma once

#include <cstddef>
#include <cstdint>

#include "../../types.hpp"

namespace f1telem::utils::netio {

/**
 * @brief Status information for UDP datagram reception
 *
 * Tracks the state of the last receive operation, including error
 * conditions, the header triple of the datagram and truncation details.
 */
struct UDPTransportStatus {
    /**
     * @brief State of the last UDP receive operation
     */
    enum State {
        /** Datagram received and ready for decoding */
        packet_ready,

        /** Fatal socket error occurred */
        socket_error,

        /** Datagram exceeded the receive buffer; only a prefix was kept */
        datagram_truncated,

        /** Receive timeout (SO_RCVTIMEO expired) - non-terminal */
        timeout
    };

    /** Current state */
    State state{packet_ready};

    /** Number of bytes kept in the receive buffer */
    size_t bytes_received{0};

    /**
     * Actual datagram size
     *
     * Equal to bytes_received unless state == datagram_truncated, in which
     * case it holds the full size of the datagram that was sent.
     */
    size_t actual_size{0};

    /**
     * Header triple of the datagram
     *
     * Only valid if has_key is true (at least header_size bytes received).
     */
    DispatchKey key{};
    bool has_key{false};

    /** Platform errno value for socket_error and timeout states */
    int errno_value{0};

    bool is_terminal() const noexcept { return state == State::socket_error; }

    bool is_truncated() const noexcept { return state == State::datagram_truncated; }
};

} // namespace f1telem::utils::netio
