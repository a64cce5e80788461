#pragma once

#include "coord.h"
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace kisexpr {

// Line-break hints recorded while parsing. Unset hints mean the writer
// falls back to its canonical layout.
struct Layout {
    std::optional<bool> break_before;        // newline before this node inside its parent
    std::optional<bool> break_before_close;  // newline before the closing paren (lists only)
    int blank_lines_before = 0;              // empty lines after that newline
    int blank_lines_before_close = 0;

    bool empty() const {
        return !break_before && !break_before_close &&
               blank_lines_before == 0 && blank_lines_before_close == 0;
    }
};

// An S-expression node: a Symbol, String or Number atom, or a List.
//
// A list stores its tag (the leading symbol, e.g. "pad" in (pad ...))
// separately from the remaining elements, which are its children in source
// order. Lists whose first element is not a symbol have an empty tag.
//
// Nodes are immutable once built; copies share their children.
class Node {
public:
    enum class Kind { Symbol, String, Number, List };

    // An empty list with no tag
    Node();

    static Node symbol(std::string name);
    static Node string(std::string value);
    // A parsed string with its source text between the quotes
    static Node string(std::string value, std::string raw);
    // A number written with the canonical format_number() text
    static Node number(double value);
    // A number written with the given text (source text or exact Coord text)
    static Node number(double value, std::string text);
    static Node list(std::string tag, std::vector<Node> children = {});

    // Same node with different layout hints
    Node with_layout(const Layout& layout) const;

    Kind kind() const { return kind_; }
    bool is_atom() const { return kind_ != Kind::List; }
    bool is_list() const { return kind_ == Kind::List; }
    bool is_symbol() const { return kind_ == Kind::Symbol; }
    bool is_string() const { return kind_ == Kind::String; }
    bool is_number() const { return kind_ == Kind::Number; }

    // Symbol name, decoded string value or number text. Empty for lists.
    const std::string& text() const;
    double number_value() const { return number_; }
    // Source text between the quotes of a parsed string
    const std::optional<std::string>& raw() const { return raw_; }

    // Tag of a list (empty for atoms and untagged lists)
    const std::string& tag() const;
    bool has_tag() const { return kind_ == Kind::List && !text_.empty(); }

    const std::vector<Node>& children() const;
    size_t size() const { return children().size(); }
    bool empty() const { return children().empty(); }
    const Node& operator[](size_t index) const { return children()[index]; }

    const Layout& layout() const { return layout_; }

    // --- Navigation helpers for domain mappers ---

    // First list child with the given tag, or nullptr
    const Node* child(const std::string& tag) const;
    // All list children with the given tag
    std::vector<const Node*> find_all(const std::string& tag) const;
    std::vector<const Node*> children(const std::string& tag) const { return find_all(tag); }

    // Atom children are indexed separately from list children:
    // in (at 1 2 (unlocked yes) 90) atom 2 is the number 90.
    size_t atom_count() const;
    const Node* atom(size_t index) const;

    // Text of any atom (string, symbol or number source text)
    std::optional<std::string> get_string(size_t index = 0) const;
    std::optional<double> get_double(size_t index = 0) const;
    std::optional<int> get_int(size_t index = 0) const;
    // yes/no symbols
    std::optional<bool> get_bool(size_t index = 0) const;
    // Exact when the number's text is a plain decimal
    std::optional<Coord> get_coord(size_t index = 0) const;

    bool has_symbol(const std::string& name) const;

    // Structural equality; ignores number spelling, raw string text and layout
    bool operator==(const Node& o) const;
    bool operator!=(const Node& o) const { return !(*this == o); }

private:
    Kind kind_ = Kind::List;
    std::string text_;   // atom text or list tag
    double number_ = 0.0;
    std::optional<std::string> raw_;
    std::shared_ptr<const std::vector<Node>> children_;
    Layout layout_;
};

} // namespace kisexpr
