/**
 * @file RecordSequenceTest.cpp
 * @brief Unit tests for generic sequence algorithms (indexOf, nextIndex, previousIndex)
 */

#include <gtest/gtest.h>
#include <deque>
#include <vector>

#include "records/Account.hpp"
#include "records/Seat.hpp"
#include "records/Tag.hpp"
#include <rowstore/store/RecordSequence.hpp>

using namespace RowStore;

// =============================================================================
// indexOf Tests
// =============================================================================

TEST(IndexOfTest, FindsPosition) {
    std::vector<Account> rows{Account(10, true, "a"), Account(20, true, "b"),
                              Account(30, true, "c")};
    EXPECT_EQ(seq::indexOf(rows, 10L), 0u);
    EXPECT_EQ(seq::indexOf(rows, 30L), 2u);
}

TEST(IndexOfTest, MissingIdIsNullopt) {
    std::vector<Account> rows{Account(10, true, "a")};
    EXPECT_FALSE(seq::indexOf(rows, 99L).has_value());
}

TEST(IndexOfTest, EmptySequence) {
    std::vector<Tag> rows;
    EXPECT_FALSE(seq::indexOf(rows, std::string("x")).has_value());
}

TEST(IndexOfTest, WorksOnDeque) {
    std::deque<Tag> rows{Tag("a", "red"), Tag("b", "blue")};
    EXPECT_EQ(seq::indexOf(rows, std::string("b")), 1u);
}

// =============================================================================
// Circular Navigation Tests
// =============================================================================

TEST(NextIndexTest, AdvancesAndWraps) {
    EXPECT_EQ(seq::nextIndex(3, 0u), 1u);
    EXPECT_EQ(seq::nextIndex(3, 1u), 2u);
    EXPECT_EQ(seq::nextIndex(3, 2u), 0u);
}

TEST(NextIndexTest, UnknownStartsAtFirst) { EXPECT_EQ(seq::nextIndex(3, std::nullopt), 0u); }

TEST(NextIndexTest, EmptyHasNoPosition) {
    EXPECT_FALSE(seq::nextIndex(0, std::nullopt).has_value());
    EXPECT_FALSE(seq::nextIndex(0, 0u).has_value());
}

TEST(NextIndexTest, SingleElementWrapsToItself) { EXPECT_EQ(seq::nextIndex(1, 0u), 0u); }

TEST(PreviousIndexTest, StepsBackAndWraps) {
    EXPECT_EQ(seq::previousIndex(3, 2u), 1u);
    EXPECT_EQ(seq::previousIndex(3, 1u), 0u);
    EXPECT_EQ(seq::previousIndex(3, 0u), 2u);
}

TEST(PreviousIndexTest, UnknownStartsAtLast) {
    EXPECT_EQ(seq::previousIndex(3, std::nullopt), 2u);
    EXPECT_EQ(seq::previousIndex(3, 7u), 2u);
}

TEST(PreviousIndexTest, EmptyHasNoPosition) {
    EXPECT_FALSE(seq::previousIndex(0, std::nullopt).has_value());
}

// =============================================================================
// Duplicate Detection Tests
// =============================================================================

TEST(DuplicateIdsTest, DetectsRepeatedId) {
    std::vector<Tag> rows{Tag("a", "red"), Tag("b", "blue"), Tag("a", "green")};
    EXPECT_TRUE(seq::containsDuplicateIds(rows));
}

TEST(DuplicateIdsTest, UniqueIds) {
    std::vector<Tag> rows{Tag("a", "red"), Tag("b", "red")};
    EXPECT_FALSE(seq::containsDuplicateIds(rows));
    EXPECT_FALSE(seq::containsDuplicateIds(std::vector<Tag>{}));
}

TEST(DuplicateIdsTest, CompositeIdWithoutHash) {
    std::vector<Seat> unique{Seat('A', 1, true), Seat('A', 2, true), Seat('B', 1, true)};
    EXPECT_FALSE(seq::containsDuplicateIds(unique));

    std::vector<Seat> repeated{Seat('A', 1, true), Seat('B', 1, true), Seat('A', 1, false)};
    EXPECT_TRUE(seq::containsDuplicateIds(repeated));
}

TEST(IndexOfTest, CompositeIdWithoutHash) {
    std::vector<Seat> rows{Seat('A', 1, true), Seat('B', 7, true)};
    EXPECT_EQ(seq::indexOf(rows, SeatKey{'B', 7}), 1u);
    EXPECT_FALSE(seq::indexOf(rows, SeatKey{'B', 8}).has_value());
}
