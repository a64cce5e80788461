#pragma once

#include "diagnostic.h"
#include "sexpr.h"
#include <string>
#include <string_view>
#include <vector>

namespace kisexpr {

struct ParserOptions {
    int max_depth = 1024;   // deeper lists are reported and skipped
};

// Formatting conventions observed in the parsed text
struct SourceStyle {
    std::string indent = "  ";   // one nesting level
    std::string newline = "\n";
    bool indent_detected = false;
};

struct ParseResult {
    Node root;
    std::vector<Diagnostic> diagnostics;
    SourceStyle style;

    bool has_errors() const { return kisexpr::has_errors(diagnostics); }
};

// Builds a tree from S-expression text.
//
// Never throws on malformed input: problems become diagnostics and the
// best-effort tree is returned. Numeric-looking symbols become Number
// atoms; no other semantic checks are made.
class Parser {
public:
    explicit Parser(const ParserOptions& opts = {});

    ParseResult parse(std::string_view text) const;

private:
    ParserOptions opts_;
};

// Parse with default options
ParseResult parse(std::string_view text);

} // namespace kisexpr
