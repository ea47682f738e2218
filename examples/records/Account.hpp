/**
 * @file examples/records/Account.hpp
 * @brief 코드 이해를 위한 한국어 상세 주석 블록.
 * @details
 * - 이 파일은 활성화 플래그(active)를 가진 레코드 모델링 방식을 보여주는 예제 코드입니다.
 * - id()/active()/setActive()/operator== 만 제공하면 별도 상속 없이 RecordStore에 저장할 수 있습니다.
 * - blank()가 반환하는 id(-1)는 유효한 계좌 번호 범위(0 이상) 밖의 값이어야 실제 레코드와 충돌하지 않습니다.
 */
#pragma once
/// @file Account.hpp
/// @brief Record with an activity flag (closed accounts are read-only)

#include <string>
#include <utility>

class Account {
  public:
    long number = 0;      ///< 계좌 번호 (레코드 ID)
    bool open = true;     ///< 활성 여부 (false면 잠금 상태)
    std::string name;     ///< 예금주 이름
    long balance = 0;     ///< 잔액

    Account() = default;
    Account(long number, bool open, std::string name, long balance = 0)
        : number(number), open(open), name(std::move(name)), balance(balance) {}

    long id() const { return number; }
    bool active() const { return open; }
    void setActive(bool a) { open = a; }

    /// @brief Blank Record: number outside the valid (non-negative) range, inactive
    static Account blank() { return Account(-1, false, ""); }

    bool operator==(const Account& o) const {
        return number == o.number && open == o.open && name == o.name && balance == o.balance;
    }
    bool operator!=(const Account& o) const { return !(*this == o); }
};
