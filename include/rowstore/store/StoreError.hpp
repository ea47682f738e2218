#pragma once
/// @file StoreError.hpp
/// @brief Status values returned by record store operations (std::error_code integration)

#include <string>
#include <system_error>
#include <type_traits>

namespace RowStore {

/// @brief Closed set of store status values
/// @details NoError is 0: store operations assign it on success, so `!ec` holds and
///          `ec == StoreErrc::NoError` compares equal.
enum class StoreErrc {
    NoError = 0,    ///< Operation succeeded
    RecordExists,   ///< add rejected: identifier already present
    RecordNotFound, ///< lookup or update targeted an absent identifier
    ReadOnly,       ///< update rejected: row is locked and change is not a reactivation
    NoDelete        ///< remove rejected: identifier absent
};

/// @brief Error category for StoreErrc ("rowstore")
/// @return Singleton category instance
const std::error_category& storeCategory() noexcept;

/// @brief Builds a std::error_code from a store status
std::error_code make_error_code(StoreErrc e) noexcept;

} // namespace RowStore

namespace std {
template <> struct is_error_code_enum<RowStore::StoreErrc> : true_type {};
} // namespace std
