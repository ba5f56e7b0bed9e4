#pragma once

#include <stdexcept>
#include <string>
#include <string_view>

#include <cstddef>

#include "types.hpp"

namespace f1telem {

/**
 * @brief Base class for per-datagram decode failures
 *
 * A DecodeError aborts the decode of one buffer only. Registry state and
 * subsequent decodes are unaffected; the caller chooses whether to skip
 * the datagram or stop.
 */
class DecodeError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief Buffer ended before the schema being decoded
 */
class TruncatedBufferError : public DecodeError {
public:
    TruncatedBufferError(size_t required, size_t available)
        : DecodeError("Buffer too small: need " + std::to_string(required) + " bytes, have " +
                      std::to_string(available)),
          required_(required),
          available_(available) {}

    size_t required() const noexcept { return required_; }
    size_t available() const noexcept { return available_; }

private:
    size_t required_;
    size_t available_;
};

/**
 * @brief Header triple has no registered codec
 *
 * Usually means the game is sending a newer (or older) protocol version.
 */
class UnknownPacketError : public DecodeError {
public:
    explicit UnknownPacketError(DispatchKey key)
        : DecodeError("Unknown packet (format=" + std::to_string(key.packet_format) +
                      ", version=" + std::to_string(key.packet_version) +
                      ", id=" + std::to_string(key.packet_id) + ")"),
          key_(key) {}

    DispatchKey key() const noexcept { return key_; }

private:
    DispatchKey key_;
};

/**
 * @brief Event packet carries a code with no detail shape mapped to it
 */
class UnknownEventCodeError : public DecodeError {
public:
    explicit UnknownEventCodeError(std::string_view code)
        : DecodeError("Unknown event code '" + printable(code) + "'"),
          code_(code) {}

    const std::string& code() const noexcept { return code_; }

private:
    static std::string printable(std::string_view code) {
        std::string out;
        for (char c : code) {
            out += (c >= 0x20 && c < 0x7F) ? c : '?';
        }
        return out;
    }

    std::string code_;
};

/**
 * @brief Socket setup or receive failure
 *
 * Thrown when the listener cannot create or bind its socket (a startup
 * condition the host is expected to report and exit on) and when a
 * receive fails with a non-recoverable errno.
 */
class SocketError : public std::runtime_error {
public:
    SocketError(const std::string& what, int errno_value)
        : std::runtime_error(what + " (errno=" + std::to_string(errno_value) + ")"),
          errno_value_(errno_value) {}

    int errno_value() const noexcept { return errno_value_; }

private:
    int errno_value_;
};

/**
 * @brief Receive timeout armed with try_set_timeout() expired
 *
 * Non-fatal: the listener remains usable.
 */
class ReceiveTimeoutError : public SocketError {
public:
    using SocketError::SocketError;
};

} // namespace f1telem
