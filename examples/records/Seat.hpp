#pragma once
/// @file Seat.hpp
/// @brief Record keyed by a composite identifier with no std::hash specialization

#include <string>
#include <tuple>
#include <utility>

/// @brief Seat position (row letter + number)
struct SeatKey {
    char row = 0;
    int number = 0;

    bool operator==(const SeatKey& o) const { return row == o.row && number == o.number; }
    bool operator<(const SeatKey& o) const {
        return std::tie(row, number) < std::tie(o.row, o.number);
    }
};

class Seat {
  public:
    SeatKey key;          ///< 좌석 위치 (레코드 ID)
    bool bookable = true; ///< 예약 가능 여부
    std::string holder;

    Seat() = default;
    Seat(char row, int number, bool bookable, std::string holder = "")
        : key{row, number}, bookable(bookable), holder(std::move(holder)) {}

    SeatKey id() const { return key; }
    bool active() const { return bookable; }
    void setActive(bool a) { bookable = a; }

    /// @brief Blank Record: row 0 is not a valid seat row
    static Seat blank() { return Seat(0, 0, false); }

    bool operator==(const Seat& o) const {
        return key == o.key && bookable == o.bookable && holder == o.holder;
    }
};
