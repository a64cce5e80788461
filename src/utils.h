#pragma once

#include <optional>
#include <string>

namespace kisexpr {

// Format a double for KiCad output (6 decimal places, trailing zeros trimmed)
std::string format_number(double val);

// Parse a KiCad numeric literal: [+-]digits[.digits] or [+-].digits.
// Returns nullopt for anything else (exponents, inf, nan, hex).
std::optional<double> parse_number(const std::string& text);
bool is_number_text(const std::string& text);

// True if s can be written as a bare symbol (non-empty, no whitespace,
// parentheses or quotes)
bool is_safe_symbol(const std::string& s);

// Escape quotes and backslashes for output inside a quoted string.
// Embedded newlines are left as they are.
std::string escape_string(const std::string& s);

// escape_string wrapped in double quotes
std::string quote_string(const std::string& s);

// Random version 4 UUID
std::string generate_uuid();

} // namespace kisexpr
