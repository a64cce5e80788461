#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace kisexpr {

enum class Severity {
    Info,
    Warning,
    Error
};

struct Location {
    int line = 1;       // 1-based
    int column = 1;     // 1-based, in bytes
    size_t offset = 0;  // byte offset into the input
};

// A problem found while reading a document. Diagnostics are collected,
// never thrown; only Error severity makes a document "has errors".
struct Diagnostic {
    Severity severity = Severity::Info;
    std::string message;
    Location location;

    // "line:col: severity: message"
    std::string to_string() const;
};

const char* severity_name(Severity severity);

bool has_errors(const std::vector<Diagnostic>& diagnostics);

} // namespace kisexpr
