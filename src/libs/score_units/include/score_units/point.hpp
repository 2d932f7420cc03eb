#pragma once

#include <score_units/unit.hpp>

namespace score_units {

struct Point {
    Unit x;
    Unit y;
};

constexpr Point operator+(const Point& a, const Point& b) {
    return {a.x + b.x, a.y + b.y};
}

constexpr Point operator-(const Point& a, const Point& b) {
    return {a.x - b.x, a.y - b.y};
}

constexpr Point operator*(const Point& p, double factor) {
    return {p.x * factor, p.y * factor};
}

constexpr bool operator==(const Point& a, const Point& b) {
    return a.x == b.x && a.y == b.y;
}

constexpr bool operator!=(const Point& a, const Point& b) {
    return !(a == b);
}

inline constexpr Point origin{};

struct Rect {
    Unit x;
    Unit y;
    Unit width;
    Unit height;

    constexpr Unit right() const { return x + width; }
    constexpr Unit bottom() const { return y + height; }
};

} // namespace score_units
