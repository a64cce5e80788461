#pragma once

#include "parser.h"
#include "sexpr.h"
#include <ostream>
#include <string>

namespace kisexpr {

struct WriterOptions {
    std::string indent = "  ";     // one nesting level
    std::string newline = "\n";
    bool use_layout_hints = true;  // false: canonical layout for every node
    bool verbose = false;

    // Options that reproduce the indentation and line endings of a parsed file
    static WriterOptions for_style(const SourceStyle& style);
};

// Serializes trees to KiCad-formatted text.
//
// Canonical layout puts the tag and leading atoms on the first line, every
// nested list (and anything after the first one) on its own line one level
// deeper, and the closing paren of a broken list on its own line. Parsed
// nodes carry line-break hints that take precedence, so an unmodified
// tree is written back exactly as it was read.
class Writer {
public:
    explicit Writer(const WriterOptions& opts = {});

    // Write the tree to a file. Returns true on success.
    bool write(const std::string& filename, const Node& root);

    // Write the tree to an output stream.
    bool write(std::ostream& out, const Node& root);

    std::string to_string(const Node& root) const;

private:
    WriterOptions opts_;

    void write_tree(std::ostream& out, const Node& root) const;
    void write_atom(std::ostream& out, const Node& atom) const;
    void newline(std::ostream& out, int depth, int blank_lines) const;

    void log(const std::string& msg);
};

// Indent unit from a command-line value: "tab" or 1 to 99 spaces.
// Returns false for anything else.
bool parse_indent(const std::string& arg, std::string& indent);

// Text of a single atom as it appears in a file
std::string format_atom(const Node& atom);

// Write with the given options
std::string write(const Node& root, const WriterOptions& opts = {});

} // namespace kisexpr
