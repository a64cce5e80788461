#include "sexpr.h"
#include "utils.h"

#include <limits>

namespace kisexpr {

static const std::vector<Node>& no_children() {
    static const std::vector<Node> empty;
    return empty;
}

static const std::string& no_text() {
    static const std::string empty;
    return empty;
}

Node::Node() = default;

Node Node::symbol(std::string name) {
    Node n;
    n.kind_ = Kind::Symbol;
    n.text_ = std::move(name);
    return n;
}

Node Node::string(std::string value) {
    Node n;
    n.kind_ = Kind::String;
    n.text_ = std::move(value);
    return n;
}

Node Node::string(std::string value, std::string raw) {
    Node n = string(std::move(value));
    n.raw_ = std::move(raw);
    return n;
}

Node Node::number(double value) {
    return number(value, format_number(value));
}

Node Node::number(double value, std::string text) {
    Node n;
    n.kind_ = Kind::Number;
    n.number_ = value;
    n.text_ = std::move(text);
    return n;
}

Node Node::list(std::string tag, std::vector<Node> children) {
    Node n;
    n.kind_ = Kind::List;
    n.text_ = std::move(tag);
    if (!children.empty()) {
        n.children_ = std::make_shared<const std::vector<Node>>(std::move(children));
    }
    return n;
}

Node Node::with_layout(const Layout& layout) const {
    Node n = *this;
    n.layout_ = layout;
    return n;
}

const std::string& Node::text() const {
    return kind_ == Kind::List ? no_text() : text_;
}

const std::string& Node::tag() const {
    return kind_ == Kind::List ? text_ : no_text();
}

const std::vector<Node>& Node::children() const {
    return children_ ? *children_ : no_children();
}

const Node* Node::child(const std::string& tag) const {
    for (const auto& c : children()) {
        if (c.is_list() && c.text_ == tag) return &c;
    }
    return nullptr;
}

std::vector<const Node*> Node::find_all(const std::string& tag) const {
    std::vector<const Node*> result;
    for (const auto& c : children()) {
        if (c.is_list() && c.text_ == tag) result.push_back(&c);
    }
    return result;
}

size_t Node::atom_count() const {
    size_t count = 0;
    for (const auto& c : children()) {
        if (c.is_atom()) count++;
    }
    return count;
}

const Node* Node::atom(size_t index) const {
    for (const auto& c : children()) {
        if (!c.is_atom()) continue;
        if (index == 0) return &c;
        index--;
    }
    return nullptr;
}

std::optional<std::string> Node::get_string(size_t index) const {
    const Node* a = atom(index);
    if (!a) return std::nullopt;
    return a->text_;
}

std::optional<double> Node::get_double(size_t index) const {
    const Node* a = atom(index);
    if (!a || !a->is_number()) return std::nullopt;
    return a->number_;
}

std::optional<int> Node::get_int(size_t index) const {
    auto d = get_double(index);
    if (!d) return std::nullopt;
    if (*d > std::numeric_limits<int>::max() || *d < std::numeric_limits<int>::min()) {
        return std::nullopt;
    }
    return static_cast<int>(*d);
}

std::optional<bool> Node::get_bool(size_t index) const {
    const Node* a = atom(index);
    if (!a || !a->is_symbol()) return std::nullopt;
    if (a->text_ == "yes") return true;
    if (a->text_ == "no") return false;
    return std::nullopt;
}

std::optional<Coord> Node::get_coord(size_t index) const {
    const Node* a = atom(index);
    if (!a || !a->is_number()) return std::nullopt;
    if (auto exact = Coord::parse_mm(a->text_)) return exact;
    return Coord::from_mm(a->number_);
}

bool Node::has_symbol(const std::string& name) const {
    for (const auto& c : children()) {
        if (c.is_symbol() && c.text_ == name) return true;
    }
    return false;
}

bool Node::operator==(const Node& o) const {
    if (kind_ != o.kind_) return false;
    switch (kind_) {
        case Kind::Number:
            return number_ == o.number_;
        case Kind::Symbol:
        case Kind::String:
            return text_ == o.text_;
        case Kind::List:
            break;
    }
    if (text_ != o.text_) return false;
    if (children_ == o.children_) return true;
    return children() == o.children();
}

} // namespace kisexpr
