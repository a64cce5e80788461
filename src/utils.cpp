#include "utils.h"
#include <cctype>
#include <cstdint>
#include <cmath>
#include <cstdio>
#include <sstream>
#include <iomanip>
#include <locale>
#include <random>
#include <chrono>

namespace kisexpr {

std::string format_number(double val) {
    std::ostringstream oss;
    oss.imbue(std::locale::classic());
    oss << std::fixed << std::setprecision(6) << val;
    std::string s = oss.str();
    // Trim trailing zeros after decimal point
    if (s.find('.') != std::string::npos) {
        size_t last_nonzero = s.find_last_not_of('0');
        if (last_nonzero != std::string::npos && s[last_nonzero] == '.') {
            s.erase(last_nonzero); // remove the dot too
        } else {
            s.erase(last_nonzero + 1);
        }
    }
    // Avoid "-0"
    if (s == "-0") s = "0";
    return s;
}

bool is_number_text(const std::string& text) {
    size_t i = 0;
    if (i < text.size() && (text[i] == '+' || text[i] == '-')) i++;

    size_t int_digits = 0;
    while (i < text.size() && std::isdigit((unsigned char)text[i])) {
        i++;
        int_digits++;
    }

    size_t frac_digits = 0;
    if (i < text.size() && text[i] == '.') {
        i++;
        while (i < text.size() && std::isdigit((unsigned char)text[i])) {
            i++;
            frac_digits++;
        }
    }

    return i == text.size() && (int_digits + frac_digits) > 0;
}

std::optional<double> parse_number(const std::string& text) {
    if (!is_number_text(text)) return std::nullopt;

    std::istringstream iss(text);
    iss.imbue(std::locale::classic());
    double val = 0.0;
    iss >> val;
    if (iss.fail() || !std::isfinite(val)) return std::nullopt;
    return val;
}

bool is_safe_symbol(const std::string& s) {
    if (s.empty()) return false;
    for (char c : s) {
        if (c == ' ' || c == '\t' || c == '\r' || c == '\n' ||
            c == '(' || c == ')' || c == '"') {
            return false;
        }
    }
    return true;
}

std::string escape_string(const std::string& s) {
    std::string result;
    result.reserve(s.size());
    for (char c : s) {
        if (c == '"' || c == '\\') result += '\\';
        result += c;
    }
    return result;
}

std::string quote_string(const std::string& s) {
    return "\"" + escape_string(s) + "\"";
}

static std::mt19937_64& get_rng() {
    static std::mt19937_64 rng(
        std::chrono::steady_clock::now().time_since_epoch().count());
    return rng;
}

static std::string format_uuid(uint64_t a, uint64_t b) {
    char buf[40];
    std::snprintf(buf, sizeof(buf),
        "%08x-%04x-%04x-%04x-%012llx",
        (unsigned)(a >> 32),
        (unsigned)((a >> 16) & 0xFFFF),
        ((unsigned)(a & 0x0FFF)) | 0x4000,  // version 4
        (unsigned)((b >> 48) & 0x3FFF) | 0x8000, // variant
        (unsigned long long)(b & 0xFFFFFFFFFFFFULL));
    return std::string(buf);
}

std::string generate_uuid() {
    auto& rng = get_rng();
    return format_uuid(rng(), rng());
}

} // namespace kisexpr
