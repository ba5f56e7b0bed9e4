#pragma once

#include <array>
#include <string>
#include <type_traits>
#include <variant>

#include <cmath>
#include <cstddef>

#include <nlohmann/json.hpp>

#include "../core/fixed_text.hpp"
#include "../core/record_traits.hpp"
#include "../packet/event.hpp"
#include "../packet/packet_variant.hpp"

namespace f1telem {

namespace detail {

template <typename Json, typename T>
Json format_value(const T& value);

// Floats are presentation-rounded to 3 decimal places
inline double round3(double value) noexcept {
    return std::round(value * 1000.0) / 1000.0;
}

template <typename Json, Record T>
Json format_record(const T& record) {
    Json out = Json::object();
    for_each_field(record, [&](const char* name, const auto& member) {
        out[name] = format_value<Json>(member);
    });
    return out;
}

template <typename Json>
Json format_event_details(const EventDataDetails& details) {
    return std::visit(
        [](const auto& shape) -> Json {
            using S = std::decay_t<decltype(shape)>;
            if constexpr (std::is_same_v<S, std::monostate>) {
                return Json::object();
            } else {
                return format_record<Json>(shape);
            }
        },
        details.detail);
}

template <typename T>
struct is_std_array : std::false_type {};

template <typename E, size_t N>
struct is_std_array<std::array<E, N>> : std::true_type {};

template <typename T>
struct is_fixed_text : std::false_type {};

template <size_t N>
struct is_fixed_text<FixedText<N>> : std::true_type {};

template <typename Json, typename T>
Json format_value(const T& value) {
    if constexpr (std::is_floating_point_v<T>) {
        return round3(static_cast<double>(value));
    } else if constexpr (std::is_integral_v<T>) {
        return value;
    } else if constexpr (is_fixed_text<T>::value) {
        return value.str();
    } else if constexpr (is_std_array<T>::value) {
        Json out = Json::array();
        for (const auto& element : value) {
            out.push_back(format_value<Json>(element));
        }
        return out;
    } else if constexpr (std::is_same_v<T, EventDataDetails>) {
        return format_event_details<Json>(value);
    } else if constexpr (std::is_same_v<T, Packet>) {
        return std::visit([](const auto& pkt) { return format_record<Json>(pkt); }, value);
    } else if constexpr (Record<T>) {
        return format_record<Json>(value);
    } else {
        static_assert(always_false<T>, "No formatter for this type");
    }
}

} // namespace detail

/**
 * @brief Generic mapping view of a decoded value
 *
 * Walks the record's field table (not its byte layout) and produces one
 * key per field, in declared order:
 * - floating-point values are rounded to 3 decimal places
 * - fixed text is cut at the first NUL byte
 * - arrays become JSON arrays with each element formatted recursively
 * - nested records become nested objects
 * - event details render only the shape selected by the event code
 *
 * The mapping is a presentation view. It is lossy and is never used to
 * reconstruct binary data.
 *
 * @tparam T Any record type, Packet, or EventDataDetails
 */
template <typename T>
nlohmann::ordered_json to_mapping(const T& value) {
    return detail::format_value<nlohmann::ordered_json>(value);
}

/**
 * @brief Canonical text rendering: sorted keys, 2-space indent
 *
 * Non-ASCII text is kept as-is. Bytes that are not valid UTF-8 are
 * replaced with U+FFFD.
 */
template <typename T>
std::string to_text(const T& value) {
    nlohmann::json sorted = detail::format_value<nlohmann::json>(value);
    return sorted.dump(2, ' ', false, nlohmann::json::error_handler_t::replace);
}

} // namespace f1telem
