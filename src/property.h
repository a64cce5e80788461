#pragma once

#include "diagnostic.h"
#include "fidelity.h"
#include "geometry.h"
#include "sexpr.h"
#include <optional>
#include <string>
#include <vector>

namespace kisexpr {

enum class PropertyField {
    Id,
    At,
    Hide,
    Effects
};

// Where a property's hidden flag lives
enum class HidePlacement {
    BareInEffects,   // (effects ... hide)          KiCad 6/7
    ChildInEffects,  // (effects ... (hide yes))    KiCad 8 symbols
    DirectChild      // (property ... (hide yes))   KiCad 9, KiCad 8 footprints
};

struct PropertyPosition {
    Point at;
    double angle = 0.0;
    bool has_angle = true;

    bool operator==(const PropertyPosition& o) const {
        return at == o.at && angle == o.angle && has_angle == o.has_angle;
    }
};

// (property "Key" "Value" (id N) (at X Y A) (hide yes) (effects ...))
// as found in symbol libraries, schematics and footprints.
struct Property {
    EncodedValue<std::string> key;
    EncodedValue<std::string> value;
    EncodedValue<int> id;                    // KiCad 6 only
    EncodedValue<PropertyPosition> at;
    EncodedValue<bool> hidden;
    HidePlacement hide_placement = HidePlacement::DirectChild;
    std::optional<Node> effects;             // kept raw apart from the hide flag

    Property() = default;
    Property(const std::string& key, const std::string& value);

    // Missing values are reported as warnings
    static Property read(const Node& node, std::vector<Diagnostic>& diagnostics);

    // An unmodified property comes back exactly as it was read
    Node to_node() const;

private:
    std::vector<Section<PropertyField>> sections_;
    std::optional<Node> source_;
    std::optional<HidePlacement> source_hide_placement_;

    void write_at(Builder& b) const;
    void write_effects(Builder& b) const;
    EncodedValue<bool> hidden_at(HidePlacement placement) const;
};

// Every property list in the tree, at any depth, in document order
std::vector<const Node*> find_properties(const Node& root);

} // namespace kisexpr
