#pragma once
/// @file Tag.hpp
/// @brief Record keyed by a string identifier, without an activity flag

#include <string>
#include <utility>

class Tag {
  public:
    std::string key;   ///< 태그 이름 (레코드 ID)
    std::string color;

    Tag() = default;
    Tag(std::string key, std::string color) : key(std::move(key)), color(std::move(color)) {}

    const std::string& id() const { return key; }

    bool operator==(const Tag& o) const { return key == o.key && color == o.color; }
};
