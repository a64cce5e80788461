#include "diagnostic.h"

#include <algorithm>

namespace kisexpr {

const char* severity_name(Severity severity) {
    switch (severity) {
        case Severity::Info:    return "info";
        case Severity::Warning: return "warning";
        case Severity::Error:   return "error";
    }
    return "unknown";
}

std::string Diagnostic::to_string() const {
    return std::to_string(location.line) + ":" + std::to_string(location.column) +
           ": " + severity_name(severity) + ": " + message;
}

bool has_errors(const std::vector<Diagnostic>& diagnostics) {
    return std::any_of(diagnostics.begin(), diagnostics.end(),
                       [](const Diagnostic& d) { return d.severity == Severity::Error; });
}

} // namespace kisexpr
