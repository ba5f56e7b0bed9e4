#pragma once

#include <array>
#include <span>
#include <tuple>
#include <type_traits>
#include <vector>

#include <cstddef>
#include <cstdint>

#include "../errors.hpp"
#include "detail/buffer_io.hpp"
#include "fixed_text.hpp"
#include "record_traits.hpp"

namespace f1telem {

/**
 * @brief Binary codec for one wire type
 *
 * Each specialization provides:
 * - size:  compile-time byte width of the type on the wire
 * - read:  consume exactly `size` bytes from a ByteReader
 * - write: produce exactly `size` bytes into a ByteWriter
 *
 * Specializations exist for primitives, fixed arrays, fixed text and any
 * Record (fields in table order). Types whose layout cannot be described by
 * a field table alone provide an explicit specialization next to their
 * definition.
 */
template <typename T>
struct WireCodec {
    static_assert(always_false<T>, "No wire codec for this type");
};

// Primitive: fixed-width little-endian integer or IEEE float
template <detail::WirePrimitive T>
struct WireCodec<T> {
    static constexpr size_t size = sizeof(T);

    static void read(detail::ByteReader& reader, T& out) { out = reader.read<T>(); }

    static void write(detail::ByteWriter& writer, const T& value) { writer.write<T>(value); }
};

// Fixed-capacity array: N consecutive elements, no count prefix
template <typename E, size_t N>
struct WireCodec<std::array<E, N>> {
    static constexpr size_t size = WireCodec<E>::size * N;

    static void read(detail::ByteReader& reader, std::array<E, N>& out) {
        for (auto& element : out) {
            WireCodec<E>::read(reader, element);
        }
    }

    static void write(detail::ByteWriter& writer, const std::array<E, N>& value) {
        for (const auto& element : value) {
            WireCodec<E>::write(writer, element);
        }
    }
};

// Fixed text: raw bytes, never interpreted here
template <size_t N>
struct WireCodec<FixedText<N>> {
    static constexpr size_t size = N;

    static void read(detail::ByteReader& reader, FixedText<N>& out) {
        reader.read_bytes(out.bytes.data(), N);
    }

    static void write(detail::ByteWriter& writer, const FixedText<N>& value) {
        writer.write_bytes(value.bytes.data(), N);
    }
};

// Record: every field of the table, in order, tightly packed
template <Record T>
struct WireCodec<T> {
    static constexpr size_t size = std::apply(
        [](const auto&... f) {
            return (size_t{0} + ... +
                    WireCodec<typename std::decay_t<decltype(f)>::value_type>::size);
        },
        RecordTraits<T>::fields);

    static void read(detail::ByteReader& reader, T& out) {
        std::apply(
            [&](const auto&... f) {
                (WireCodec<typename std::decay_t<decltype(f)>::value_type>::read(reader,
                                                                                 out.*(f.member)),
                 ...);
            },
            RecordTraits<T>::fields);
    }

    static void write(detail::ByteWriter& writer, const T& value) {
        std::apply(
            [&](const auto&... f) {
                (WireCodec<typename std::decay_t<decltype(f)>::value_type>::write(
                     writer, value.*(f.member)),
                 ...);
            },
            RecordTraits<T>::fields);
    }
};

/// Fixed, value-independent byte length of a wire type
template <typename T>
constexpr size_t wire_size() noexcept {
    return WireCodec<T>::size;
}

/**
 * @brief Decode a value from the front of a buffer
 *
 * The buffer may be longer than the schema; trailing bytes are ignored.
 * Decoding is atomic: the value is only returned once every field has been
 * read, and any failure throws before anything is handed to the caller.
 *
 * @throws TruncatedBufferError if bytes.size() < wire_size<T>()
 * @throws DecodeError subclasses raised by nested codecs
 */
template <typename T>
T decode(std::span<const uint8_t> bytes) {
    if (bytes.size() < WireCodec<T>::size) {
        throw TruncatedBufferError(WireCodec<T>::size, bytes.size());
    }

    detail::ByteReader reader(bytes);
    T value{};
    WireCodec<T>::read(reader, value);
    return value;
}

/**
 * @brief Encode a value into the front of a caller-provided buffer
 *
 * @return Number of bytes written (always wire_size<T>())
 * @throws TruncatedBufferError if out is smaller than wire_size<T>()
 */
template <typename T>
size_t encode_into(const T& value, std::span<uint8_t> out) {
    if (out.size() < WireCodec<T>::size) {
        throw TruncatedBufferError(WireCodec<T>::size, out.size());
    }

    detail::ByteWriter writer(out);
    WireCodec<T>::write(writer, value);
    return writer.offset();
}

/**
 * @brief Encode a value into a new buffer of exactly wire_size<T>() bytes
 */
template <typename T>
std::vector<uint8_t> encode(const T& value) {
    std::vector<uint8_t> bytes(WireCodec<T>::size);
    encode_into(value, std::span<uint8_t>(bytes));
    return bytes;
}

} // namespace f1telem
