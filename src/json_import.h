#pragma once

#include "sexpr.h"
#include <istream>
#include <string>

namespace kisexpr {

// Read a tree in the format written by write_json(std::ostream&, const Node&).
// Returns true on success, false on malformed JSON or an invalid node.
bool read_json(std::istream& in, Node& root);

// Convenience: read from a JSON string.
bool read_json(const std::string& json_text, Node& root);

} // namespace kisexpr
