#pragma once

#include "diagnostic.h"
#include "document.h"
#include "sexpr.h"
#include <ostream>
#include <vector>

namespace kisexpr {

// Serialize a tree to JSON:
//   list   {"tag": "pad", "children": [...]}
//   symbol {"symbol": "smd"}
//   string {"string": "x\"y", "raw": "x\\\"y"}   (raw only for parsed strings)
//   number {"number": 1.5, "text": "1.50"}
void write_json(std::ostream& out, const Node& root);

// [{"severity": "error", "message": ..., "line": 1, "column": 2, "offset": 1}, ...]
void write_json_diagnostics(std::ostream& out, const std::vector<Diagnostic>& diagnostics);

// Header summary, diagnostics and the rebuilt tree of a document
void write_json(std::ostream& out, const Document& doc);

} // namespace kisexpr
