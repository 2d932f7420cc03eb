#pragma once

#include <optional>
#include <ostream>
#include <stdexcept>
#include <string>
#include <string_view>

namespace score_units {

// Raised when a value is neither a number nor a recognizable length.
class TypeConversionError : public std::invalid_argument {
public:
    using std::invalid_argument::invalid_argument;
};

// A length unit: a display name and its size in base units (1 base unit = 1 point).
struct UnitType {
    const char* name = "units";
    double base_per_unit = 1.0;
};

constexpr bool operator==(const UnitType& a, const UnitType& b) {
    return a.base_per_unit == b.base_per_unit;
}

constexpr bool operator!=(const UnitType& a, const UnitType& b) {
    return !(a == b);
}

namespace unit_types {

constexpr UnitType base{"units", 1.0};
constexpr UnitType mm{"mm", 72.0 / 25.4};
constexpr UnitType inch{"inches", 72.0};

} // namespace unit_types

// A length tagged with its unit. Binary operators convert the right operand
// into the left operand's unit; results always carry the left operand's unit.
class Unit {
public:
    constexpr Unit() = default;

    // Stores `value` as-is in `type`, no conversion.
    constexpr explicit Unit(double value, UnitType type = unit_types::base)
        : value_(value), type_(type) {}

    // Converts `other` into `type`.
    constexpr Unit(const Unit& other, UnitType type)
        : value_(type == other.type_ ? other.value_ : other.base_value() / type.base_per_unit),
          type_(type) {}

    constexpr double value() const { return value_; }
    constexpr UnitType type() const { return type_; }
    constexpr double base_value() const { return value_ * type_.base_per_unit; }
    constexpr Unit to(UnitType type) const { return Unit(*this, type); }

    // `other` expressed in this unit.
    constexpr double value_of(const Unit& other) const {
        return other.type_ == type_ ? other.value_ : other.base_value() / type_.base_per_unit;
    }

    std::string to_string() const;

    constexpr Unit& operator+=(const Unit& other) {
        value_ += value_of(other);
        return *this;
    }
    constexpr Unit& operator-=(const Unit& other) {
        value_ -= value_of(other);
        return *this;
    }
    constexpr Unit& operator*=(double factor) {
        value_ *= factor;
        return *this;
    }
    constexpr Unit& operator/=(double divisor) {
        value_ /= divisor;
        return *this;
    }

    constexpr Unit operator-() const { return Unit(-value_, type_); }

    friend constexpr Unit operator+(Unit a, const Unit& b) { return a += b; }
    friend constexpr Unit operator-(Unit a, const Unit& b) { return a -= b; }
    friend constexpr Unit operator*(Unit a, double factor) { return a *= factor; }
    friend constexpr Unit operator/(Unit a, double divisor) { return a /= divisor; }
    friend constexpr double operator/(const Unit& a, const Unit& b) { return a.value_ / a.value_of(b); }

    friend constexpr bool operator==(const Unit& a, const Unit& b) { return a.value_ == a.value_of(b); }
    friend constexpr bool operator!=(const Unit& a, const Unit& b) { return a.value_ != a.value_of(b); }
    friend constexpr bool operator<(const Unit& a, const Unit& b) { return a.value_ < a.value_of(b); }
    friend constexpr bool operator<=(const Unit& a, const Unit& b) { return a.value_ <= a.value_of(b); }
    friend constexpr bool operator>(const Unit& a, const Unit& b) { return a.value_ > a.value_of(b); }
    friend constexpr bool operator>=(const Unit& a, const Unit& b) { return a.value_ >= a.value_of(b); }

private:
    double value_ = 0.0;
    UnitType type_ = unit_types::base;
};

inline constexpr Unit zero{};

constexpr Unit units(double value) { return Unit(value, unit_types::base); }
constexpr Unit mm(double value) { return Unit(value, unit_types::mm); }
constexpr Unit inches(double value) { return Unit(value, unit_types::inch); }

// value * (source ratio / target ratio), typed as `target`.
constexpr Unit convert(const Unit& value, UnitType target) {
    return Unit(value, target);
}

constexpr Unit abs(const Unit& value) {
    return value.value() < 0.0 ? -value : value;
}

// Unit type for a short suffix: "u", "pt", "mm", "in".
std::optional<UnitType> unit_type_from_suffix(std::string_view suffix);

// Parses "12", "12.5mm", "1in", "3u". A bare number is stored in `target`
// without conversion; a suffixed value is converted into `target`.
// Throws TypeConversionError for anything else.
Unit parse_unit(std::string_view text, UnitType target = unit_types::base);

std::ostream& operator<<(std::ostream& os, const Unit& value);

} // namespace score_units
