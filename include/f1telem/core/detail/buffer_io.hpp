#pragma once

#include <bit>
#include <span>
#include <type_traits>

#include <cstddef>
#include <cstdint>
#include <cstring>

#include "../../errors.hpp"

namespace f1telem::detail {

/**
 * @brief Endian-safe buffer read/write helpers
 *
 * Single source of truth for moving fixed-width primitives between packet
 * buffers and host values. The wire format is little-endian with 1-byte
 * alignment, so every access goes through std::memcpy.
 */

template <size_t Size>
struct wire_uint;

template <>
struct wire_uint<1> {
    using type = uint8_t;
};

template <>
struct wire_uint<2> {
    using type = uint16_t;
};

template <>
struct wire_uint<4> {
    using type = uint32_t;
};

template <>
struct wire_uint<8> {
    using type = uint64_t;
};

template <size_t Size>
using wire_uint_t = typename wire_uint<Size>::type;

template <typename T>
concept WirePrimitive = std::is_arithmetic_v<T> && !std::is_same_v<T, bool> &&
                        (sizeof(T) == 1 || sizeof(T) == 2 || sizeof(T) == 4 || sizeof(T) == 8);

static_assert(std::endian::native == std::endian::little ||
                  std::endian::native == std::endian::big,
              "Mixed endianness not supported");

// The wire is little-endian; a big-endian host swaps every multi-byte field
inline constexpr bool host_is_wire_order = (std::endian::native == std::endian::little);

template <typename UInt>
    requires std::is_unsigned_v<UInt>
constexpr UInt byteswap(UInt value) noexcept {
    if constexpr (sizeof(UInt) == 1) {
        return value;
    } else if constexpr (sizeof(UInt) == 2) {
        return __builtin_bswap16(value);
    } else if constexpr (sizeof(UInt) == 4) {
        return __builtin_bswap32(value);
    } else {
        static_assert(sizeof(UInt) == 8, "Unsupported integer width");
        return __builtin_bswap64(value);
    }
}

// Swapping is symmetric, so one function serves both directions
template <typename UInt>
    requires std::is_unsigned_v<UInt>
constexpr UInt wire_to_host(UInt value) noexcept {
    if constexpr (host_is_wire_order) {
        return value;
    } else {
        return byteswap(value);
    }
}

template <typename UInt>
    requires std::is_unsigned_v<UInt>
constexpr UInt host_to_wire(UInt value) noexcept {
    return wire_to_host(value);
}

/**
 * Read a little-endian primitive from buffer
 * @param buffer Pointer to buffer
 * @param offset Byte offset into buffer
 * @return Value in host byte order
 */
template <WirePrimitive T>
inline T read_le(const uint8_t* buffer, size_t offset) noexcept {
    wire_uint_t<sizeof(T)> raw;
    std::memcpy(&raw, buffer + offset, sizeof(raw));
    return std::bit_cast<T>(wire_to_host(raw));
}

/**
 * Write a primitive to buffer in little-endian order
 * @param buffer Pointer to buffer
 * @param offset Byte offset into buffer
 * @param value Value in host byte order
 */
template <WirePrimitive T>
inline void write_le(uint8_t* buffer, size_t offset, T value) noexcept {
    auto raw = host_to_wire(std::bit_cast<wire_uint_t<sizeof(T)>>(value));
    std::memcpy(buffer + offset, &raw, sizeof(raw));
}

/**
 * @brief Bounds-checked forward cursor over a const byte buffer
 *
 * Every read verifies the remaining length first and throws
 * TruncatedBufferError instead of reading past the end.
 */
class ByteReader {
public:
    explicit ByteReader(std::span<const uint8_t> bytes) noexcept : bytes_(bytes) {}

    template <WirePrimitive T>
    T read() {
        require(sizeof(T));
        T value = read_le<T>(bytes_.data(), offset_);
        offset_ += sizeof(T);
        return value;
    }

    void read_bytes(uint8_t* out, size_t count) {
        require(count);
        if (count > 0) {
            std::memcpy(out, bytes_.data() + offset_, count);
        }
        offset_ += count;
    }

    // Hand out the next `count` bytes as a sub-span and advance past them
    std::span<const uint8_t> take(size_t count) {
        require(count);
        auto region = bytes_.subspan(offset_, count);
        offset_ += count;
        return region;
    }

    size_t offset() const noexcept { return offset_; }
    size_t remaining() const noexcept { return bytes_.size() - offset_; }

private:
    void require(size_t count) const {
        if (count > remaining()) {
            throw TruncatedBufferError(offset_ + count, bytes_.size());
        }
    }

    std::span<const uint8_t> bytes_;
    size_t offset_{0};
};

/**
 * @brief Bounds-checked forward cursor over a mutable byte buffer
 */
class ByteWriter {
public:
    explicit ByteWriter(std::span<uint8_t> bytes) noexcept : bytes_(bytes) {}

    template <WirePrimitive T>
    void write(T value) {
        require(sizeof(T));
        write_le<T>(bytes_.data(), offset_, value);
        offset_ += sizeof(T);
    }

    void write_bytes(const uint8_t* data, size_t count) {
        require(count);
        if (count > 0) {
            std::memcpy(bytes_.data() + offset_, data, count);
        }
        offset_ += count;
    }

    void fill(uint8_t value, size_t count) {
        require(count);
        std::memset(bytes_.data() + offset_, value, count);
        offset_ += count;
    }

    size_t offset() const noexcept { return offset_; }
    size_t remaining() const noexcept { return bytes_.size() - offset_; }

private:
    void require(size_t count) const {
        if (count > remaining()) {
            throw TruncatedBufferError(offset_ + count, bytes_.size());
        }
    }

    std::span<uint8_t> bytes_;
    size_t offset_{0};
};

} // namespace f1telem::detail
