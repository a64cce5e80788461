#pragma once

#include "builder.h"
#include "sexpr.h"
#include <functional>
#include <limits>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace kisexpr {

// How a field was encoded in the file it was read from
struct SourceFormat {
    bool parsed = false;          // came from a parsed document
    bool explicit_value = false;  // present in the file, or set in memory
    bool is_symbol = false;       // bare atom rather than quoted string
    bool child_node = true;       // (name yes) rather than bare `name`
    std::string token;            // tag actually used (uuid / tstamp ...)
    std::optional<Node> source;   // node the value was read from
};

// A value together with the encoding it had on disk.
//
// Values read from a file remember their encoding and are written back the
// same way; an unmodified value re-emits its source node verbatim. Values
// created in memory use the caller's canonical encoding.
template <typename T>
class EncodedValue {
public:
    // Absent, defaulted value
    EncodedValue() = default;

    // Fresh explicit value
    EncodedValue(T value)
        : value_(std::move(value)) {
        format_.explicit_value = true;
    }

    static EncodedValue from_source(T value, SourceFormat format) {
        EncodedValue v;
        v.value_ = std::move(value);
        v.format_ = std::move(format);
        v.format_.parsed = true;
        return v;
    }

    // Read-side marker for a field the parsed file did not contain
    static EncodedValue absent(T fallback = T()) {
        EncodedValue v;
        v.value_ = std::move(fallback);
        v.format_.parsed = true;
        return v;
    }

    const T& get() const { return value_; }
    const T& operator*() const { return value_; }
    const T* operator->() const { return &value_; }

    // Replaces the value. The recorded encoding is kept; the source node
    // is no longer written verbatim once the value differs.
    void set(T value) {
        if (!format_.explicit_value || !(value == value_)) {
            value_ = std::move(value);
            modified_ = true;
        }
        format_.explicit_value = true;
    }

    // Drop the field from the output
    void reset() {
        value_ = T();
        format_.explicit_value = false;
        modified_ = true;
    }

    bool was_parsed() const { return format_.parsed; }
    bool is_explicit() const { return format_.explicit_value; }
    bool is_modified() const { return modified_; }
    // Encoding was observed in a file rather than chosen
    bool was_observed() const { return format_.source.has_value(); }

    const SourceFormat& format() const { return format_; }
    SourceFormat& format() { return format_; }

private:
    T value_ = T();
    SourceFormat format_;
    bool modified_ = false;
};

// Modeled child or raw-passthrough subtree, in source order
template <typename T>
using Section = std::variant<T, Node>;

// Classify each list child of parent; unrecognized lists and all atoms are
// kept as raw sections.
template <typename T>
std::vector<Section<T>> split_sections(const Node& parent,
                                       const std::function<std::optional<T>(const Node&)>& classify) {
    std::vector<Section<T>> sections;
    sections.reserve(parent.size());
    for (const auto& c : parent.children()) {
        std::optional<T> field;
        if (c.is_list()) field = classify(c);
        if (field) {
            sections.emplace_back(std::in_place_index<0>, *field);
        } else {
            sections.emplace_back(std::in_place_index<1>, c);
        }
    }
    return sections;
}

enum class TextStyle {
    Quoted,
    Symbol
};

// --- Reading ---

// First atom of (tag value ...), also accepting legacy spellings of the tag
EncodedValue<std::string> read_text(const Node& parent, const std::string& tag,
                                    const std::vector<std::string>& legacy_tags = {});

// Atom directly inside parent, by atom index (e.g. a footprint's name)
EncodedValue<std::string> read_atom_text(const Node& parent, size_t index);

EncodedValue<double> read_double(const Node& parent, const std::string& tag);

template <typename T>
EncodedValue<T> read_number(const Node& parent, const std::string& tag) {
    EncodedValue<double> d = read_double(parent, tag);
    if (!d.is_explicit()) return EncodedValue<T>::absent();
    if constexpr (std::is_integral_v<T>) {
        // Saturate values the type cannot hold; the source text is kept
        if (*d >= static_cast<double>(std::numeric_limits<T>::max())) {
            return EncodedValue<T>::from_source(std::numeric_limits<T>::max(), d.format());
        }
        if (*d <= static_cast<double>(std::numeric_limits<T>::lowest())) {
            return EncodedValue<T>::from_source(std::numeric_limits<T>::lowest(), d.format());
        }
    }
    return EncodedValue<T>::from_source(static_cast<T>(*d), d.format());
}

// Bare `name` symbol, (name), (name yes) or (name no)
EncodedValue<bool> read_flag(const Node& parent, const std::string& name);

// --- Writing ---

// Emits (tag atom): the source list verbatim when unmodified, the source
// list with its first atom replaced when modified, else a fresh list.
void write_field(Builder& b, const std::string& canonical_tag, const Node& atom,
                 const SourceFormat& format, bool modified);

// Atom for a text value in its recorded style, else canonical. Symbols
// that cannot be written bare fall back to quotes.
Node text_atom(const EncodedValue<std::string>& value, TextStyle canonical);

void write_text(Builder& b, const std::string& canonical_tag,
                const EncodedValue<std::string>& value, TextStyle canonical);

void write_atom_text(Builder& b, const EncodedValue<std::string>& value, TextStyle canonical);

template <typename T>
Node number_atom(T value) {
    if constexpr (std::is_integral<T>::value) {
        return Node::number(static_cast<double>(value), std::to_string(value));
    } else {
        return Node::number(static_cast<double>(value));
    }
}

template <typename T>
void write_number(Builder& b, const std::string& canonical_tag, const EncodedValue<T>& value) {
    if (!value.is_explicit()) return;
    write_field(b, canonical_tag, number_atom(*value), value.format(), value.is_modified());
}

// canonical_child_node selects (name yes) over a bare symbol for values
// that were never read from a file.
void write_flag(Builder& b, const std::string& name, const EncodedValue<bool>& value,
                bool canonical_child_node);

} // namespace kisexpr
