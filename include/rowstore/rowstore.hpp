#pragma once

/**
 * @file rowstore.hpp
 * @brief Main convenience header for RowStore
 *
 * Include this single header to access all library functionality.
 *
 * @code
 * #include <rowstore/rowstore.hpp>
 * @endcode
 *
 * @example Basic Usage
 * @code
 * struct User {
 *     long userId = 0;
 *     bool enabled = true;
 *     std::string name;
 *
 *     long id() const { return userId; }
 *     bool active() const { return enabled; }
 *     void setActive(bool a) { enabled = a; }
 *     static User blank() { return User{-1, false, ""}; }
 *     bool operator==(const User& o) const {
 *         return userId == o.userId && enabled == o.enabled && name == o.name;
 *     }
 * };
 *
 * int main() {
 *     std::error_code ec;
 *     RowStore::RecordStore<User> users;
 *     users.add(User{1, true, "alice"}, ec);
 *     // ...
 * }
 * @endcode
 */

// =============================================================================
// Record Types
// =============================================================================
#include "record/RecordTraits.hpp"

// =============================================================================
// Store Types
// =============================================================================
#include "store/StoreError.hpp"
#include "store/RecordSequence.hpp"
#include "store/RecordStore.hpp"

/**
 * @namespace RowStore
 * @brief Root namespace for RowStore library
 *
 * Key components:
 * - Identity contract: RecordTraits, hasActiveFlag, hasBlankFactory, IdOf
 * - Store: RecordStore
 * - Status values: StoreErrc, storeCategory
 * - Sequence algorithms: seq::indexOf, seq::nextIndex, seq::previousIndex
 */
namespace RowStore {

// Version information
constexpr int VERSION_MAJOR = 1;
constexpr int VERSION_MINOR = 0;
constexpr int VERSION_PATCH = 0;
constexpr const char* VERSION_STRING = "1.0.0";

} // namespace RowStore
