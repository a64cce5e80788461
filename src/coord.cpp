#include "coord.h"

#include <cctype>
#include <cmath>
#include <stdexcept>

namespace kisexpr {

// Largest integer mm part that still fits once scaled to nanometres
static const int64_t MAX_WHOLE_MM = 9223372036853LL;

Coord Coord::from_mm(double mm) {
    if (!std::isfinite(mm)) return Coord();
    return from_nm(std::llround(mm * UNITS_PER_MM));
}

std::optional<Coord> Coord::parse_mm(const std::string& text) {
    size_t i = 0;
    bool negative = false;
    if (i < text.size() && (text[i] == '+' || text[i] == '-')) {
        negative = text[i] == '-';
        i++;
    }

    int64_t whole = 0;
    size_t digits = 0;
    while (i < text.size() && std::isdigit((unsigned char)text[i])) {
        whole = whole * 10 + (text[i] - '0');
        if (whole > MAX_WHOLE_MM) return std::nullopt;
        i++;
        digits++;
    }

    int64_t frac = 0;
    int frac_digits = 0;
    bool round_up = false;
    if (i < text.size() && text[i] == '.') {
        i++;
        while (i < text.size() && std::isdigit((unsigned char)text[i])) {
            if (frac_digits < 6) {
                frac = frac * 10 + (text[i] - '0');
            } else if (frac_digits == 6) {
                round_up = text[i] >= '5';
            }
            frac_digits++;
            digits++;
            i++;
        }
    }

    if (i != text.size() || digits == 0) return std::nullopt;

    for (int d = frac_digits; d < 6; d++) frac *= 10;

    int64_t nm = whole * UNITS_PER_MM + frac + (round_up ? 1 : 0);
    return from_nm(negative ? -nm : nm);
}

std::string Coord::to_string() const {
    uint64_t mag = value_ < 0 ? static_cast<uint64_t>(-(value_ + 1)) + 1
                              : static_cast<uint64_t>(value_);
    uint64_t whole = mag / UNITS_PER_MM;
    uint64_t frac = mag % UNITS_PER_MM;

    std::string s;
    if (value_ < 0) s += '-';
    s += std::to_string(whole);

    if (frac != 0) {
        std::string digits = std::to_string(frac);
        digits.insert(0, 6 - digits.size(), '0');
        digits.erase(digits.find_last_not_of('0') + 1);
        s += '.';
        s += digits;
    }
    return s;
}

Coord Coord::operator*(double s) const {
    return from_nm(std::llround(static_cast<double>(value_) * s));
}

Coord Coord::operator/(int64_t s) const {
    if (s == 0) throw std::invalid_argument("Coord division by zero");
    // Round half away from zero
    int64_t q = value_ / s;
    int64_t r = value_ % s;
    int64_t abs_r = r < 0 ? -r : r;
    int64_t abs_s = s < 0 ? -s : s;
    if (abs_r * 2 >= abs_s) {
        q += ((value_ < 0) != (s < 0)) ? -1 : 1;
    }
    return from_nm(q);
}

Coord Coord::operator/(double s) const {
    if (s == 0.0 || !std::isfinite(s)) {
        throw std::invalid_argument("Coord division by zero or non-finite divisor");
    }
    return from_nm(std::llround(static_cast<double>(value_) / s));
}

} // namespace kisexpr
