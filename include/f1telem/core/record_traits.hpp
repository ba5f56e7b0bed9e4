#pragma once

#include <concepts>
#include <tuple>
#include <type_traits>
#include <utility>

#include <cstddef>

namespace f1telem {

/**
 * @brief One entry of a record's field table
 *
 * Pairs the field name used by the formatter with the member it binds to.
 * The position of the descriptor in the table is its wire position.
 */
template <typename Class, typename Member>
struct FieldDescriptor {
    using class_type = Class;
    using value_type = Member;

    const char* name;
    Member Class::*member;
};

template <typename Class, typename Member>
constexpr FieldDescriptor<Class, Member> field(const char* name, Member Class::*member) noexcept {
    return {name, member};
}

/// Base RecordTraits template - specialized for every record type
///
/// A specialization provides:
/// - name:   record name (for diagnostics)
/// - fields: std::tuple of FieldDescriptor in wire order
template <typename T>
struct RecordTraits {};

/// Concept: T has a field table
template <typename T>
concept Record = requires {
    { RecordTraits<T>::name } -> std::convertible_to<const char*>;
    RecordTraits<T>::fields;
};

/// Helper for dependent static_assert in template contexts
template <typename>
inline constexpr bool always_false = false;

/**
 * @brief Invoke fn(name, member_ref) for every field of a record, in wire order
 */
template <Record T, typename Fn>
constexpr void for_each_field(T& record, Fn&& fn) {
    std::apply([&](const auto&... f) { (fn(f.name, record.*(f.member)), ...); },
               RecordTraits<T>::fields);
}

template <Record T, typename Fn>
constexpr void for_each_field(const T& record, Fn&& fn) {
    std::apply([&](const auto&... f) { (fn(f.name, record.*(f.member)), ...); },
               RecordTraits<T>::fields);
}

/// Number of fields in a record's table
template <Record T>
inline constexpr size_t field_count = std::tuple_size_v<std::remove_cv_t<decltype(RecordTraits<T>::fields)>>;

} // namespace f1telem
