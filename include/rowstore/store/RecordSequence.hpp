#pragma once
/// @file RecordSequence.hpp
/// @brief Generic algorithms over an ordered sequence of identity-bearing rows

#include "../record/RecordTraits.hpp"

#include <cstddef>
#include <optional>
#include <type_traits>
#include <unordered_set>

namespace RowStore {
namespace seq {

/// @brief Linear search for an identifier
/// @tparam Seq Random access sequence of rows (std::vector, std::deque, ...)
/// @param rows Sequence to search
/// @param id Identifier to find
/// @return Position of the row, or std::nullopt if absent
template <typename Seq, typename Id>
std::optional<std::size_t> indexOf(const Seq& rows, const Id& id) {
    for (std::size_t i = 0; i < rows.size(); ++i) {
        if (rows[i].id() == id)
            return i;
    }
    return std::nullopt;
}

/// @brief Position following pos in a circular sequence
/// @param size Sequence length
/// @param pos Current position; std::nullopt means "before first"
/// @return Next position, or std::nullopt if the sequence is empty
inline std::optional<std::size_t> nextIndex(std::size_t size, std::optional<std::size_t> pos) {
    if (size == 0)
        return std::nullopt;
    if (!pos || *pos + 1 >= size)
        return 0;
    return *pos + 1;
}

/// @brief Position preceding pos in a circular sequence
/// @param size Sequence length
/// @param pos Current position; std::nullopt means "after last"
/// @return Previous position, or std::nullopt if the sequence is empty
inline std::optional<std::size_t> previousIndex(std::size_t size, std::optional<std::size_t> pos) {
    if (size == 0)
        return std::nullopt;
    if (!pos || *pos == 0 || *pos >= size)
        return size - 1;
    return *pos - 1;
}

/// @brief Checks a sequence for repeated identifiers
/// @return true if two rows share an identifier
/// @note O(n) with a hashable identifier, O(n^2) otherwise
template <typename Seq> bool containsDuplicateIds(const Seq& rows) {
    using Row = std::decay_t<decltype(rows[0])>;
    if constexpr (hasHashableId<Row>) {
        std::unordered_set<IdOf<Row>> seen;
        seen.reserve(rows.size());
        for (const auto& r : rows) {
            if (!seen.insert(r.id()).second)
                return true;
        }
    } else {
        for (std::size_t i = 1; i < rows.size(); ++i) {
            for (std::size_t j = 0; j < i; ++j) {
                if (rows[j].id() == rows[i].id())
                    return true;
            }
        }
    }
    return false;
}

} // namespace seq
} // namespace RowStore
