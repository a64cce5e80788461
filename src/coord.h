#pragma once

#include <cstdint>
#include <optional>
#include <ostream>
#include <string>

namespace kisexpr {

// Fixed-point physical length stored as integer nanometres.
// 1 mm = 1,000,000 units, so every mm value with up to 6 fractional
// digits is exact. Comparisons never go through floating point.
class Coord {
public:
    static constexpr int64_t UNITS_PER_MM = 1000000;

    Coord() = default;

    static Coord zero() { return Coord(); }
    static Coord from_nm(int64_t nm) { Coord c; c.value_ = nm; return c; }
    // Rounds to the nearest nanometre. Non-finite input gives zero.
    static Coord from_mm(double mm);
    // Exact decimal parse of a mm literal ("1.27", "-0.5", "+3", ".25").
    // Digits past the sixth fractional place are rounded half away from zero.
    static std::optional<Coord> parse_mm(const std::string& text);

    static Coord min(Coord a, Coord b) { return a < b ? a : b; }
    static Coord max(Coord a, Coord b) { return a < b ? b : a; }

    double to_mm() const { return static_cast<double>(value_) / UNITS_PER_MM; }
    int64_t to_nm() const { return value_; }

    // Shortest exact mm text: no exponent, no trailing zeros, never "-0"
    std::string to_string() const;

    Coord abs() const { return from_nm(value_ < 0 ? -value_ : value_); }

    Coord operator+(Coord o) const { return from_nm(value_ + o.value_); }
    Coord operator-(Coord o) const { return from_nm(value_ - o.value_); }
    Coord operator-() const { return from_nm(-value_); }
    Coord operator*(int s) const { return from_nm(value_ * s); }
    Coord operator*(int64_t s) const { return from_nm(value_ * s); }
    Coord operator*(double s) const;
    // Division rounds half away from zero; a zero divisor throws
    // std::invalid_argument
    Coord operator/(int s) const { return *this / static_cast<int64_t>(s); }
    Coord operator/(int64_t s) const;
    Coord operator/(double s) const;

    Coord& operator+=(Coord o) { value_ += o.value_; return *this; }
    Coord& operator-=(Coord o) { value_ -= o.value_; return *this; }

    bool operator==(Coord o) const { return value_ == o.value_; }
    bool operator!=(Coord o) const { return value_ != o.value_; }
    bool operator<(Coord o) const { return value_ < o.value_; }
    bool operator<=(Coord o) const { return value_ <= o.value_; }
    bool operator>(Coord o) const { return value_ > o.value_; }
    bool operator>=(Coord o) const { return value_ >= o.value_; }

private:
    int64_t value_ = 0;
};

inline std::ostream& operator<<(std::ostream& os, Coord c) {
    return os << c.to_string() << "mm";
}

} // namespace kisexpr
