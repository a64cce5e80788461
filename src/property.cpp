#include "property.h"

namespace kisexpr {

static std::optional<PropertyField> classify_property(const Node& n) {
    const std::string& tag = n.tag();
    if (tag == "id") return PropertyField::Id;
    if (tag == "at") return PropertyField::At;
    if (tag == "hide") return PropertyField::Hide;
    if (tag == "effects") return PropertyField::Effects;
    return std::nullopt;
}

static bool is_hide(const Node& n) {
    return (n.is_symbol() && n.text() == "hide") || (n.is_list() && n.tag() == "hide");
}

Property::Property(const std::string& key, const std::string& value)
    : key(key), value(value) {}

Property Property::read(const Node& node, std::vector<Diagnostic>& diagnostics) {
    Property p;
    p.source_ = node;

    if (node.atom_count() < 2) {
        std::string what = node.atom_count() == 0 ? "" : " '" + node.atom(0)->text() + "'";
        diagnostics.push_back({Severity::Warning,
                               "property" + what + " has fewer than two values", Location()});
    }
    p.key = read_atom_text(node, 0);
    p.value = read_atom_text(node, 1);
    p.id = read_number<int>(node, "id");

    if (const Node* at = node.child("at")) {
        PropertyPosition pos;
        pos.at = {at->get_coord(0).value_or(Coord()), at->get_coord(1).value_or(Coord())};
        pos.has_angle = at->atom_count() > 2;
        pos.angle = at->get_double(2).value_or(0.0);

        SourceFormat format;
        format.explicit_value = true;
        format.token = "at";
        format.source = *at;
        p.at = EncodedValue<PropertyPosition>::from_source(pos, format);
    } else {
        p.at = EncodedValue<PropertyPosition>::absent();
    }

    p.hidden = read_flag(node, "hide");
    if (p.hidden.is_explicit()) {
        p.hide_placement = HidePlacement::DirectChild;
        p.source_hide_placement_ = HidePlacement::DirectChild;
    }

    if (const Node* effects = node.child("effects")) {
        p.effects = *effects;
        if (!p.hidden.is_explicit()) {
            EncodedValue<bool> hide = read_flag(*effects, "hide");
            if (hide.is_explicit()) {
                p.hidden = hide;
                p.hide_placement = hide.format().child_node ? HidePlacement::ChildInEffects
                                                            : HidePlacement::BareInEffects;
                p.source_hide_placement_ = p.hide_placement;
            }
        }
    }

    p.sections_ = split_sections<PropertyField>(node, classify_property);
    return p;
}

EncodedValue<bool> Property::hidden_at(HidePlacement placement) const {
    if (source_hide_placement_ && *source_hide_placement_ == placement) return hidden;
    // Moved or never read: write it fresh in the requested placement
    if (!hidden.is_explicit()) return EncodedValue<bool>();
    return EncodedValue<bool>(*hidden);
}

void Property::write_at(Builder& b) const {
    if (!at.is_explicit()) return;
    const SourceFormat& format = at.format();
    if (format.source && !at.is_modified()) {
        b.add_child(*format.source);
        return;
    }
    Builder ab("at");
    ab.add_mm(at->at.x).add_mm(at->at.y);
    if (at->has_angle) ab.add_value(at->angle);
    if (format.source) ab.keep_layout(*format.source);
    b.add_child(ab.build());
}

void Property::write_effects(Builder& b) const {
    bool hide_inside = hide_placement != HidePlacement::DirectChild;
    EncodedValue<bool> hide = hidden_at(hide_placement);
    bool canonical_child = hide_placement == HidePlacement::ChildInEffects;

    if (!effects) {
        if (hide_inside && hide.is_explicit() && *hide) {
            Builder eb("effects");
            write_flag(eb, "hide", hide, canonical_child);
            b.add_child(eb.build());
        }
        return;
    }

    bool hide_changed = hide.is_modified() || !hide.was_parsed() ||
                        source_hide_placement_ != std::optional<HidePlacement>(hide_placement);
    bool has_hide = false;
    for (const auto& c : effects->children()) {
        if (is_hide(c)) has_hide = true;
    }
    if (!hide_changed || (!hide_inside && !has_hide)) {
        b.add_child(*effects);
        return;
    }

    Builder eb("effects");
    eb.keep_layout(*effects);
    bool written = false;
    for (const auto& c : effects->children()) {
        if (is_hide(c)) {
            if (hide_inside && !written) write_flag(eb, "hide", hide, canonical_child);
            written = true;
            continue;
        }
        eb.add_child(c);
    }
    if (hide_inside && !written) write_flag(eb, "hide", hide, canonical_child);
    b.add_child(eb.build());
}

Node Property::to_node() const {
    Builder b("property");
    if (source_) b.keep_layout(*source_);

    bool wrote_id = false, wrote_at = false, wrote_hide = false, wrote_effects = false;
    size_t atom_index = 0;

    // A flag added to a parsed property takes the line break of the node
    // it is inserted before
    auto write_direct_hide = [&](const Node* next) {
        if (wrote_hide) return;
        wrote_hide = true;
        if (hide_placement != HidePlacement::DirectChild) return;
        Builder flag("hide");
        write_flag(flag, "hide", hidden_at(HidePlacement::DirectChild), true);
        const Node built = flag.build();
        for (const auto& c : built.children()) {
            if (next && c.layout().empty()) {
                Layout layout;
                layout.break_before = next->layout().break_before;
                b.add_child(c.with_layout(layout));
            } else {
                b.add_child(c);
            }
        }
    };

    if (!source_) {
        write_atom_text(b, key, TextStyle::Quoted);
        write_atom_text(b, value, TextStyle::Quoted);
        atom_index = 2;
    }

    for (const auto& section : sections_) {
        if (section.index() == 1) {
            const Node& node = std::get<1>(section);
            if (node.is_atom() && atom_index < 2) {
                write_atom_text(b, atom_index == 0 ? key : value, TextStyle::Quoted);
                atom_index++;
                continue;
            }
            if (is_hide(node)) {
                write_direct_hide(nullptr);
                continue;
            }
            b.add_child(node);
            continue;
        }
        switch (std::get<0>(section)) {
            case PropertyField::Id:
                if (!wrote_id) write_number(b, "id", id);
                wrote_id = true;
                break;
            case PropertyField::At:
                if (!wrote_at) write_at(b);
                wrote_at = true;
                break;
            case PropertyField::Hide:
                write_direct_hide(nullptr);
                break;
            case PropertyField::Effects:
                write_direct_hide(effects ? &*effects : nullptr);
                if (!wrote_effects) write_effects(b);
                wrote_effects = true;
                break;
        }
    }

    // Fields the source did not have, in canonical order
    while (atom_index < 2) {
        write_atom_text(b, atom_index == 0 ? key : value, TextStyle::Quoted);
        atom_index++;
    }
    if (!wrote_id) write_number(b, "id", id);
    if (!wrote_at) write_at(b);
    write_direct_hide(nullptr);
    if (!wrote_effects) write_effects(b);

    return b.build();
}

std::vector<const Node*> find_properties(const Node& root) {
    std::vector<const Node*> result;
    std::vector<const Node*> stack = {&root};
    while (!stack.empty()) {
        const Node* node = stack.back();
        stack.pop_back();
        if (node->tag() == "property") {
            result.push_back(node);
            continue;
        }
        const auto& children = node->children();
        for (auto it = children.rbegin(); it != children.rend(); ++it) {
            if (it->is_list()) stack.push_back(&*it);
        }
    }
    return result;
}

} // namespace kisexpr
