#pragma once

#include "coord.h"
#include "sexpr.h"
#include <functional>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

namespace kisexpr {

// Fluent construction of list nodes:
//
//   Node pad = Builder("pad").add_value("1").add_symbol("smd")
//                  .add_child("at", [](Builder& b) { b.add_mm(x).add_mm(y); })
//                  .build();
//
// Invalid arguments (empty tags, unsafe symbols, non-finite numbers) are
// caller bugs and throw std::invalid_argument.
class Builder {
public:
    explicit Builder(std::string tag);
    static Builder make(std::string tag) { return Builder(std::move(tag)); }

    // Quoted string atom
    Builder& add_value(const std::string& value);
    Builder& add_value(const char* value);

    // Number atom; integers are written without a decimal point
    template <typename T,
              typename std::enable_if<std::is_arithmetic<T>::value &&
                                      !std::is_same<T, bool>::value, int>::type = 0>
    Builder& add_value(T value) {
        if (std::is_integral<T>::value) {
            children_.push_back(Node::number(static_cast<double>(value), std::to_string(value)));
            return *this;
        }
        return add_real(static_cast<double>(value));
    }

    Builder& add_value(bool value) = delete;   // use add_bool

    // Bare symbol for keywords and layer names
    Builder& add_symbol(const std::string& name);
    // Number with the coordinate's exact mm text
    Builder& add_mm(Coord value);
    // yes / no symbol
    Builder& add_bool(bool value);

    // Nested list configured by the callback
    Builder& add_child(const std::string& tag, const std::function<void(Builder&)>& configure);
    // Already-built node (list or atom), e.g. a raw-passthrough subtree
    Builder& add_child(const Node& node);

    // Take over the line-break hints of a parsed list being rebuilt
    Builder& keep_layout(const Node& source);

    Node build() const;

private:
    std::string tag_;
    std::vector<Node> children_;
    Layout layout_;

    Builder& add_real(double value);
};

// Copy of a list with every child passed through fn. Tag and layout are kept.
Node rebuild(const Node& list, const std::function<Node(const Node&)>& fn);

} // namespace kisexpr
