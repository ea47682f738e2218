#pragma once
/// @file RecordTraits.hpp
/// @brief Compile-time identity contract for record types

#include <cstddef>
#include <functional>
#include <type_traits>
#include <utility>

namespace RowStore {

namespace detail {

template <typename Row, typename = void> struct HasId : std::false_type {};
template <typename Row>
struct HasId<Row, std::void_t<decltype(std::declval<const Row&>().id())>> : std::true_type {};

template <typename Row, typename = void> struct HasActiveFlag : std::false_type {};
template <typename Row>
struct HasActiveFlag<Row, std::void_t<decltype(static_cast<bool>(std::declval<const Row&>().active())),
                                      decltype(std::declval<Row&>().setActive(true))>>
    : std::true_type {};

template <typename Row, typename = void> struct HasBlankFactory : std::false_type {};
template <typename Row>
struct HasBlankFactory<Row, std::void_t<decltype(Row::blank())>>
    : std::is_convertible<decltype(Row::blank()), Row> {};

template <typename T, typename = void> struct IsEqualityComparable : std::false_type {};
template <typename T>
struct IsEqualityComparable<
    T, std::void_t<decltype(static_cast<bool>(std::declval<const T&>() == std::declval<const T&>()))>>
    : std::true_type {};

template <typename T, typename = void> struct IsHashable : std::false_type {};
template <typename T>
struct IsHashable<T, std::void_t<decltype(std::hash<T>{}(std::declval<const T&>()))>>
    : std::is_convertible<decltype(std::hash<T>{}(std::declval<const T&>())), std::size_t> {};

} // namespace detail

/// @brief true if Row exposes `id() const`
template <typename Row> constexpr bool hasId = detail::HasId<Row>::value;

/// @brief true if Row exposes `active() const` and `setActive(bool)`
template <typename Row> constexpr bool hasActiveFlag = detail::HasActiveFlag<Row>::value;

/// @brief true if Row exposes `static Row blank()`
template <typename Row> constexpr bool hasBlankFactory = detail::HasBlankFactory<Row>::value;

/// @brief Identifier type of a record (decayed return type of `id()`)
template <typename Row> using IdOf = std::decay_t<decltype(std::declval<const Row&>().id())>;

/// @brief true if the identifier of Row can key a std::unordered_map
/// @note Optional: stores over non-hashable identifiers fall back to linear search.
template <typename Row> constexpr bool hasHashableId = detail::IsHashable<IdOf<Row>>::value;

/// @brief Identity contract checks for a record type
/// @details Instantiating this struct for a type that cannot serve as a store row
///          fails compilation with a readable diagnostic instead of a template backtrace.
/// @tparam Row Record type (Duck Typing: requires id() const, operator==)
template <typename Row> struct RecordTraits {
    static_assert(hasId<Row>, "Row must expose an identifier accessor: id() const");
    static_assert(std::is_copy_constructible_v<Row>, "Row must be copyable (records are values)");
    static_assert(detail::IsEqualityComparable<Row>::value, "Row must provide operator==");

    using Id = IdOf<Row>;

    static_assert(std::is_copy_constructible_v<Id>, "Identifier must be a copyable value type");
    static_assert(detail::IsEqualityComparable<Id>::value,
                  "Identifier must be equality comparable");

    static constexpr bool activityGuarded = hasActiveFlag<Row>;
    static constexpr bool hashableId = detail::IsHashable<Id>::value;

    static Id idOf(const Row& row) { return row.id(); }
};

/// @brief Activity state of a row
/// @details Rows without an activity flag are always considered active (Editable).
template <typename Row> bool isActive(const Row& row) {
    if constexpr (hasActiveFlag<Row>) {
        return static_cast<bool>(row.active());
    } else {
        (void)row;
        return true;
    }
}

/// @brief Copy of a row with its activity flag replaced
/// @note For rows without an activity flag the copy is returned unchanged.
template <typename Row> Row withActive(const Row& row, bool active) {
    Row copy(row);
    if constexpr (hasActiveFlag<Row>) {
        copy.setActive(active);
    } else {
        (void)active;
    }
    return copy;
}

} // namespace RowStore
