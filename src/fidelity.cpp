#include "fidelity.h"
#include "utils.h"

namespace kisexpr {

static const Node* find_list(const Node& parent, const std::string& tag,
                             const std::vector<std::string>& legacy_tags) {
    if (const Node* n = parent.child(tag)) return n;
    for (const auto& legacy : legacy_tags) {
        if (const Node* n = parent.child(legacy)) return n;
    }
    return nullptr;
}

EncodedValue<std::string> read_text(const Node& parent, const std::string& tag,
                                    const std::vector<std::string>& legacy_tags) {
    const Node* list = find_list(parent, tag, legacy_tags);
    if (!list) return EncodedValue<std::string>::absent();

    SourceFormat format;
    format.explicit_value = true;
    format.token = list->tag();
    format.source = *list;

    std::string value;
    if (const Node* a = list->atom(0)) {
        value = a->text();
        format.is_symbol = !a->is_string();
    }
    return EncodedValue<std::string>::from_source(value, format);
}

EncodedValue<std::string> read_atom_text(const Node& parent, size_t index) {
    const Node* a = parent.atom(index);
    if (!a) return EncodedValue<std::string>::absent();

    SourceFormat format;
    format.explicit_value = true;
    format.is_symbol = !a->is_string();
    format.source = *a;
    return EncodedValue<std::string>::from_source(a->text(), format);
}

EncodedValue<double> read_double(const Node& parent, const std::string& tag) {
    const Node* list = parent.child(tag);
    if (!list) return EncodedValue<double>::absent();

    SourceFormat format;
    format.explicit_value = true;
    format.token = list->tag();
    format.source = *list;
    return EncodedValue<double>::from_source(list->get_double(0).value_or(0.0), format);
}

EncodedValue<bool> read_flag(const Node& parent, const std::string& name) {
    for (const auto& c : parent.children()) {
        if (c.is_symbol() && c.text() == name) {
            SourceFormat format;
            format.explicit_value = true;
            format.child_node = false;
            format.token = name;
            format.source = c;
            return EncodedValue<bool>::from_source(true, format);
        }
        if (c.is_list() && c.tag() == name) {
            SourceFormat format;
            format.explicit_value = true;
            format.child_node = true;
            format.token = name;
            format.source = c;
            // (hide) with no value means yes
            return EncodedValue<bool>::from_source(c.get_bool(0).value_or(true), format);
        }
    }
    return EncodedValue<bool>::absent(false);
}

void write_field(Builder& b, const std::string& canonical_tag, const Node& atom,
                 const SourceFormat& format, bool modified) {
    if (format.source && format.source->is_list()) {
        if (!modified) {
            b.add_child(*format.source);
            return;
        }
        if (format.source->atom_count() == 0) {
            // (tag) with no value: the value goes first
            Builder lb(format.source->tag());
            lb.keep_layout(*format.source);
            lb.add_child(atom);
            for (const auto& c : format.source->children()) lb.add_child(c);
            b.add_child(lb.build());
            return;
        }
        // Keep the recorded token, any trailing children and the layout
        bool replaced = false;
        b.add_child(rebuild(*format.source, [&](const Node& c) {
            if (!replaced && c.is_atom()) {
                replaced = true;
                return atom.with_layout(c.layout());
            }
            return c;
        }));
        return;
    }
    const std::string& tag = format.token.empty() ? canonical_tag : format.token;
    b.add_child(Builder(tag).add_child(atom).build());
}

Node text_atom(const EncodedValue<std::string>& value, TextStyle canonical) {
    const SourceFormat& format = value.format();
    if (format.source && format.source->is_atom() && !value.is_modified()) {
        return *format.source;
    }
    bool symbol = value.was_observed() ? format.is_symbol : canonical == TextStyle::Symbol;
    if (symbol && is_safe_symbol(*value)) {
        return Node::symbol(*value);
    }
    return Node::string(*value);
}

void write_text(Builder& b, const std::string& canonical_tag,
                const EncodedValue<std::string>& value, TextStyle canonical) {
    if (!value.is_explicit()) return;
    write_field(b, canonical_tag, text_atom(value, canonical), value.format(), value.is_modified());
}

void write_atom_text(Builder& b, const EncodedValue<std::string>& value, TextStyle canonical) {
    if (!value.is_explicit()) return;
    Node atom = text_atom(value, canonical);
    if (value.format().source) atom = atom.with_layout(value.format().source->layout());
    b.add_child(atom);
}

void write_flag(Builder& b, const std::string& name, const EncodedValue<bool>& value,
                bool canonical_child_node) {
    if (!value.is_explicit()) return;

    const SourceFormat& format = value.format();
    if (format.source && !value.is_modified()) {
        b.add_child(*format.source);
        return;
    }

    bool child_node = value.was_observed() ? format.child_node : canonical_child_node;
    if (child_node) {
        Node flag = Builder(name).add_bool(*value).build();
        if (format.source) flag = flag.with_layout(format.source->layout());
        b.add_child(flag);
    } else if (*value) {
        Node flag = Node::symbol(name);
        if (format.source) flag = flag.with_layout(format.source->layout());
        b.add_child(flag);
    }
}

} // namespace kisexpr
