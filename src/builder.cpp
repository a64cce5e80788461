#include "builder.h"
#include "utils.h"

#include <cmath>
#include <stdexcept>

namespace kisexpr {

Builder::Builder(std::string tag)
    : tag_(std::move(tag)) {
    if (!is_safe_symbol(tag_)) {
        throw std::invalid_argument("invalid list tag '" + tag_ + "'");
    }
}

Builder& Builder::add_value(const std::string& value) {
    children_.push_back(Node::string(value));
    return *this;
}

Builder& Builder::add_value(const char* value) {
    if (!value) {
        throw std::invalid_argument("null string passed to add_value in '" + tag_ + "'");
    }
    return add_value(std::string(value));
}

Builder& Builder::add_real(double value) {
    if (!std::isfinite(value)) {
        throw std::invalid_argument("non-finite number passed to add_value in '" + tag_ + "'");
    }
    children_.push_back(Node::number(value));
    return *this;
}

Builder& Builder::add_symbol(const std::string& name) {
    if (!is_safe_symbol(name)) {
        throw std::invalid_argument("'" + name + "' cannot be written as a bare symbol");
    }
    children_.push_back(Node::symbol(name));
    return *this;
}

Builder& Builder::add_mm(Coord value) {
    children_.push_back(Node::number(value.to_mm(), value.to_string()));
    return *this;
}

Builder& Builder::add_bool(bool value) {
    children_.push_back(Node::symbol(value ? "yes" : "no"));
    return *this;
}

Builder& Builder::add_child(const std::string& tag, const std::function<void(Builder&)>& configure) {
    Builder child(tag);
    if (configure) configure(child);
    children_.push_back(child.build());
    return *this;
}

Builder& Builder::add_child(const Node& node) {
    children_.push_back(node);
    return *this;
}

Builder& Builder::keep_layout(const Node& source) {
    layout_ = source.layout();
    return *this;
}

Node Builder::build() const {
    return Node::list(tag_, children_).with_layout(layout_);
}

Node rebuild(const Node& list, const std::function<Node(const Node&)>& fn) {
    std::vector<Node> children;
    children.reserve(list.size());
    for (const auto& c : list.children()) {
        children.push_back(fn(c));
    }
    return Node::list(list.tag(), std::move(children)).with_layout(list.layout());
}

} // namespace kisexpr
