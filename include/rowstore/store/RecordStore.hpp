/**
 * @file rowstore/store/RecordStore.hpp
 * @brief 레코드 저장소 핵심 구현에 대한 한국어 상세 주석 블록.
 * @details
 * - 이 파일은 식별자(id) 기반 레코드 컬렉션의 CRUD 및 순환 탐색(first/last/next/previous) 흐름을 담고 있습니다.
 * - 구현의 기본 원칙은 예외 대신 std::error_code(StoreErrc)로 실패 원인을 호출자에게 전달하는 것입니다.
 * - 순서(삽입 순서)와 id 유일성은 rows_와 index_가 항상 함께 유지해야 하는 불변식입니다. 한쪽만 갱신하지 않도록 주의해야 합니다.
 * - 모든 변경 연산은 검증을 먼저 끝낸 뒤 한 번에 반영합니다. 중간 실패 시 일부만 반영된 상태가 남으면 안 됩니다.
 * - 비활성(active=false) 레코드는 재활성화 외의 수정을 거부하는 업무 규칙이 있으므로 update 경로 변경 시 함께 점검해야 합니다.
 */
#pragma once
/// @file RecordStore.hpp
/// @brief Ordered, identity-unique in-memory record store (Template)

#include "../record/RecordTraits.hpp"
#include "RecordSequence.hpp"
#include "StoreError.hpp"

#include <cstddef>
#include <optional>
#include <system_error>
#include <type_traits>
#include <unordered_map>
#include <utility>
#include <vector>

namespace RowStore {

/// @brief Ordered collection of uniquely identified rows
/// @tparam Row Record type satisfying the identity contract (see RecordTraits)
///
/// Features:
/// - Insertion order is the only navigation order; next/previous wrap around
/// - O(1) lookup via identifier index when the identifier is hashable,
///   linear search (seq::indexOf) otherwise
/// - Activity guard: locked (inactive) rows can only be reactivated
/// - Blank Record returned whenever there is nothing valid to return;
///   the Blank Record's identifier is reserved and never admitted as a row
///
/// @note Not thread-safe. Callers serialize access per store instance.
template <typename Row> class RecordStore {
    using Traits = RecordTraits<Row>;

  public:
    using value_type = Row;
    using Id = typename Traits::Id;

    /// @brief true if lookups go through the hash index
    static constexpr bool indexed = Traits::hashableId;

    /// @brief Constructor
    /// @param blank Blank Record returned on absence (its id is reserved)
    explicit RecordStore(Row blank) : blank_(std::move(blank)) {}

    /// @brief Default constructor, available when Row provides `static Row blank()`
    template <typename R = Row, typename = std::enable_if_t<hasBlankFactory<R>>>
    RecordStore() : blank_(R::blank()) {}

    // =========================================================================
    // Lookup
    // =========================================================================

    /// @brief Check if a row with this identifier exists
    bool exists(const Id& id) const { return index(id).has_value(); }

    /// @brief Position of a row in the sequence
    /// @return Position, or std::nullopt if absent
    std::optional<std::size_t> index(const Id& id) const {
        if constexpr (indexed) {
            auto it = index_.find(id);
            if (it != index_.end())
                return it->second;
            return std::nullopt;
        } else {
            return seq::indexOf(rows_, id);
        }
    }

    /// @brief Find row by identifier
    /// @param id Identifier to search
    /// @param ec StoreErrc::RecordNotFound if absent, NoError otherwise
    /// @return Copy of the row, or the Blank Record if absent
    Row find(const Id& id, std::error_code& ec) const {
        ec = StoreErrc::NoError;
        auto idx = index(id);
        if (!idx) {
            ec = StoreErrc::RecordNotFound;
            return blank_;
        }
        return rows_[*idx];
    }

    /// @brief First row satisfying a predicate, or the Blank Record
    template <typename Pred> Row findIf(Pred pred) const {
        for (const auto& r : rows_) {
            if (pred(r))
                return r;
        }
        return blank_;
    }

    /// @brief Ordered copy of every row
    /// @details The store is fully described by this sequence; assign() restores it.
    std::vector<Row> findAll() const { return rows_; }

    std::size_t count() const noexcept { return rows_.size(); }
    bool empty() const noexcept { return rows_.empty(); }

    /// @brief Blank Record used by this store
    const Row& blank() const noexcept { return blank_; }

    // =========================================================================
    // Navigation
    // =========================================================================

    Row firstRecord() const { return rows_.empty() ? blank_ : rows_.front(); }
    Row lastRecord() const { return rows_.empty() ? blank_ : rows_.back(); }

    /// @brief Row after id, wrapping to the first row
    /// @note Unknown id behaves as "before first". Empty store returns Blank.
    Row nextRecord(const Id& id) const { return at(seq::nextIndex(rows_.size(), index(id))); }

    /// @brief Row before id, wrapping to the last row
    /// @note Unknown id behaves as "after last". Empty store returns Blank.
    Row previousRecord(const Id& id) const {
        return at(seq::previousIndex(rows_.size(), index(id)));
    }

    // =========================================================================
    // Mutation
    // =========================================================================

    /// @brief Append a row
    /// @param record Row to append
    /// @param ec StoreErrc::RecordExists if the identifier is taken or is the Blank Record's
    ///           identifier (row not inserted)
    /// @return true on success
    bool add(const Row& record, std::error_code& ec) {
        ec = StoreErrc::NoError;
        if (isTaken(record.id())) {
            ec = StoreErrc::RecordExists;
            return false;
        }
        appendRows(&record, &record + 1);
        return true;
    }

    /// @brief Append several rows, all or nothing
    /// @param records Rows to append in order
    /// @param ec StoreErrc::RecordExists if any identifier is taken, reserved, or repeated
    ///           in the batch
    /// @return true if every row was appended
    bool addAll(const std::vector<Row>& records, std::error_code& ec) {
        ec = StoreErrc::NoError;
        // 배치 전체를 먼저 검증한 뒤 반영한다. 일부만 추가된 상태를 남기지 않기 위함이다.
        if (seq::containsDuplicateIds(records)) {
            ec = StoreErrc::RecordExists;
            return false;
        }
        for (const auto& r : records) {
            if (isTaken(r.id())) {
                ec = StoreErrc::RecordExists;
                return false;
            }
        }
        appendRows(records.data(), records.data() + records.size());
        return true;
    }

    /// @brief Replace a row, given the caller's pre-edit copy and the edited row
    /// @param oldRecord Caller's pre-edit copy; must carry the same identifier as newRecord
    /// @param newRecord Replacement row; its id selects the stored row
    /// @param activeFlag true if the row is unlocked for editing
    /// @param ec RecordNotFound if the identifiers differ or newRecord's id is absent,
    ///           ReadOnly if a locked row would be edited, NoError on success
    /// @return true on success
    /// @note Only oldRecord's identifier is consulted. The stored row, not oldRecord,
    ///       is the reference for the locked-row guard.
    bool update(const Row& oldRecord, const Row& newRecord, bool activeFlag, std::error_code& ec) {
        Id id = newRecord.id();
        if (!(oldRecord.id() == id)) {
            ec = StoreErrc::RecordNotFound;
            return false;
        }
        return update(id, newRecord, activeFlag, ec);
    }

    /// @brief Replace the row stored under id
    /// @param id Identifier of the stored row
    /// @param newRecord Replacement row (may carry a different, unused identifier)
    /// @param activeFlag true: full replace. false: only a reactivation is accepted.
    /// @param ec RecordNotFound if id is absent, ReadOnly if a locked row would be edited,
    ///           RecordExists if newRecord's id belongs to another row or to the Blank Record
    /// @return true on success
    bool update(const Id& id, const Row& newRecord, bool activeFlag, std::error_code& ec) {
        ec = StoreErrc::NoError;
        auto idx = index(id);
        if (!idx) {
            ec = StoreErrc::RecordNotFound;
            return false;
        }

        if (!activeFlag && !isReactivation(rows_[*idx], newRecord)) {
            ec = StoreErrc::ReadOnly;
            return false;
        }

        Id newId = newRecord.id();
        bool rekey = !(newId == id);
        if (rekey && isTaken(newId)) {
            ec = StoreErrc::RecordExists;
            return false;
        }

        // 값 타입 레코드이므로 복사본을 먼저 만든 뒤 위치(idx)에 move로 기록한다.
        // 복사 도중 예외가 나도 저장된 레코드는 그대로 남는다.
        Row replacement(newRecord);
        if constexpr (indexed) {
            if (rekey) {
                index_.emplace(newId, *idx);
                index_.erase(id);
            }
        }
        rows_[*idx] = std::move(replacement);
        return true;
    }

    /// @brief Remove a row
    /// @param id Identifier to remove
    /// @param ec StoreErrc::NoDelete if absent
    /// @return true on success
    bool remove(const Id& id, std::error_code& ec) {
        ec = StoreErrc::NoError;
        auto idx = index(id);
        if (!idx) {
            ec = StoreErrc::NoDelete;
            return false;
        }
        rows_.erase(rows_.begin() + static_cast<std::ptrdiff_t>(*idx));
        if constexpr (indexed) {
            index_.erase(id);
            // 삭제 지점 이후 레코드는 위치가 하나씩 당겨지므로 해당 구간만 인덱스를 갱신한다.
            for (std::size_t i = *idx; i < rows_.size(); ++i)
                index_.find(rows_[i].id())->second = i;
        }
        return true;
    }

    /// @brief Remove every row
    void removeAll() noexcept {
        rows_.clear();
        if constexpr (indexed)
            index_.clear();
    }

    /// @brief Rebuild the store from an ordered sequence
    /// @param records Rows in navigation order
    /// @param ec StoreErrc::RecordExists if the sequence repeats an identifier or holds the
    ///           Blank Record's identifier (store unchanged)
    /// @return true on success
    bool assign(std::vector<Row> records, std::error_code& ec) {
        ec = StoreErrc::NoError;
        if (seq::containsDuplicateIds(records) || seq::indexOf(records, blank_.id())) {
            ec = StoreErrc::RecordExists;
            return false;
        }
        IndexMap rebuilt;
        if constexpr (indexed) {
            rebuilt.reserve(records.size());
            for (std::size_t i = 0; i < records.size(); ++i)
                rebuilt.emplace(records[i].id(), i);
        }
        rows_ = std::move(records);
        index_ = std::move(rebuilt);
        return true;
    }

  private:
    struct NoIndex {};
    using IndexMap =
        std::conditional_t<Traits::hashableId, std::unordered_map<Id, std::size_t>, NoIndex>;

    /// @brief true if id belongs to a stored row or to the Blank Record
    bool isTaken(const Id& id) const { return id == blank_.id() || exists(id); }

    /// @brief Append [first, last) to rows_ and the index, rolling both back on exception
    void appendRows(const Row* first, const Row* last) {
        const std::size_t oldSize = rows_.size();
        try {
            for (const Row* r = first; r != last; ++r) {
                rows_.push_back(*r);
                if constexpr (indexed)
                    index_.emplace(r->id(), rows_.size() - 1);
            }
        } catch (...) {
            // 예외 시 이번 호출에서 추가한 행과 인덱스 항목만 되돌리고 예외는 그대로 전달한다.
            if constexpr (indexed) {
                for (std::size_t i = oldSize; i < rows_.size(); ++i)
                    index_.erase(rows_[i].id());
            }
            rows_.erase(rows_.begin() + static_cast<std::ptrdiff_t>(oldSize), rows_.end());
            throw;
        }
    }

    /// @brief Locked-row guard
    /// @return true if next differs from current only by being active
    static bool isReactivation(const Row& current, const Row& next) {
        if constexpr (hasActiveFlag<Row>) {
            if (!isActive(next))
                return false;
            return withActive(next, isActive(current)) == current;
        } else {
            (void)current;
            (void)next;
            return false;
        }
    }

    Row at(std::optional<std::size_t> idx) const { return idx ? rows_[*idx] : blank_; }

    Row blank_;
    std::vector<Row> rows_;

    // id -> position (O(1) lookup); empty when the identifier is not hashable
    IndexMap index_;
};

} // namespace RowStore
