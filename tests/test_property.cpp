#include <gtest/gtest.h>
#include "parser.h"
#include "property.h"
#include "writer.h"

using namespace kisexpr;

class PropertyTest : public ::testing::Test {
protected:
    std::vector<Diagnostic> diagnostics;

    Property read(const std::string& text) {
        ParseResult r = parse(text);
        EXPECT_FALSE(r.has_errors()) << text;
        return Property::read(r.root, diagnostics);
    }
};

TEST_F(PropertyTest, KiCad6PropertyRoundTrips) {
    const std::string text =
        "(property \"Reference\" \"R\" (id 0) (at 2.032 0 90)\n"
        "  (effects (font (size 1.27 1.27)) hide)\n"
        ")";
    Property p = read(text);
    EXPECT_EQ(*p.key, "Reference");
    EXPECT_EQ(*p.value, "R");
    ASSERT_TRUE(p.id.is_explicit());
    EXPECT_EQ(*p.id, 0);
    EXPECT_EQ(p.at->at.x.to_string(), "2.032");
    EXPECT_DOUBLE_EQ(p.at->angle, 90.0);
    EXPECT_TRUE(*p.hidden);
    EXPECT_EQ(p.hide_placement, HidePlacement::BareInEffects);
    EXPECT_TRUE(diagnostics.empty());

    EXPECT_EQ(write(p.to_node()), text + "\n");
}

TEST_F(PropertyTest, KiCad6UnhideRemovesBareSymbol) {
    Property p = read(
        "(property \"Reference\" \"R\" (id 0) (at 2.032 0 90)\n"
        "  (effects (font (size 1.27 1.27)) hide)\n"
        ")");
    p.hidden.set(false);
    EXPECT_EQ(write(p.to_node()),
              "(property \"Reference\" \"R\" (id 0) (at 2.032 0 90)\n"
              "  (effects (font (size 1.27 1.27)))\n"
              ")\n");
}

TEST_F(PropertyTest, KiCad8HideInsideEffects) {
    Property p = read(
        "(property \"Datasheet\" \"~\" (at 0 0 0) (effects (font (size 1.27 1.27)) (hide yes)))");
    EXPECT_FALSE(p.id.is_explicit());
    EXPECT_TRUE(*p.hidden);
    EXPECT_EQ(p.hide_placement, HidePlacement::ChildInEffects);

    p.hidden.set(false);
    EXPECT_EQ(write(p.to_node()),
              "(property \"Datasheet\" \"~\" (at 0 0 0) (effects (font (size 1.27 1.27)) (hide no)))\n");
}

TEST_F(PropertyTest, KiCad9HideAsDirectChild) {
    const std::string text =
        "(property \"Footprint\" \"\" (at 0 0 0) (hide yes) (effects (font (size 1.27 1.27))))";
    Property p = read(text);
    EXPECT_TRUE(*p.hidden);
    EXPECT_EQ(p.hide_placement, HidePlacement::DirectChild);
    EXPECT_EQ(write(p.to_node()), text + "\n");

    p.hidden.set(false);
    EXPECT_EQ(write(p.to_node()),
              "(property \"Footprint\" \"\" (at 0 0 0) (hide no) (effects (font (size 1.27 1.27))))\n");
}

TEST_F(PropertyTest, HidingAVisiblePropertyUsesCanonicalPlacement) {
    Property p = read("(property \"Value\" \"10k\" (at 0 0 0) (effects (font (size 1.27 1.27))))");
    EXPECT_FALSE(p.hidden.is_explicit());

    p.hidden.set(true);
    EXPECT_EQ(write(p.to_node()),
              "(property \"Value\" \"10k\" (at 0 0 0) (hide yes) (effects (font (size 1.27 1.27))))\n");
}

TEST_F(PropertyTest, FreshProperty) {
    Property p("Reference", "R");
    PropertyPosition pos;
    pos.at = {*Coord::parse_mm("1.27"), Coord()};
    p.at = EncodedValue<PropertyPosition>(pos);
    p.hidden = EncodedValue<bool>(true);

    EXPECT_EQ(write(p.to_node()),
              "(property \"Reference\" \"R\"\n"
              "  (at 1.27 0 0)\n"
              "  (hide yes)\n"
              ")\n");
}

TEST_F(PropertyTest, FreshPropertyWithLegacyHide) {
    Property p("Footprint", "");
    p.hidden = EncodedValue<bool>(true);
    p.hide_placement = HidePlacement::BareInEffects;
    EXPECT_EQ(write(p.to_node()), "(property \"Footprint\" \"\"\n  (effects hide)\n)\n");
}

TEST_F(PropertyTest, EditedValueKeepsEverythingElse) {
    Property p = read(
        "(property \"K\" \"V\" (at 1 2) (show_name) (do_not_autoplace) (effects (font (size 1 1))))");
    p.value.set("W");
    EXPECT_EQ(write(p.to_node()),
              "(property \"K\" \"W\" (at 1 2) (show_name) (do_not_autoplace) (effects (font (size 1 1))))\n");
}

TEST_F(PropertyTest, EditedPositionKeepsArity) {
    Property p = read("(property \"K\" \"V\" (at 1 2) (layer \"F.SilkS\"))");
    EXPECT_FALSE(p.at->has_angle);

    PropertyPosition pos = *p.at;
    pos.at.x = *Coord::parse_mm("3.5");
    p.at.set(pos);
    EXPECT_EQ(write(p.to_node()), "(property \"K\" \"V\" (at 3.5 2) (layer \"F.SilkS\"))\n");
}

TEST_F(PropertyTest, MissingValueIsAWarning) {
    Property p = read("(property \"Only\")");
    ASSERT_EQ(diagnostics.size(), 1u);
    EXPECT_EQ(diagnostics[0].severity, Severity::Warning);
    EXPECT_FALSE(p.value.is_explicit());
    EXPECT_EQ(write(p.to_node()), "(property \"Only\")\n");
}

TEST_F(PropertyTest, FindPropertiesAtAnyDepth) {
    ParseResult r = parse(
        "(kicad_symbol_lib\n"
        "  (symbol \"R\" (property \"Reference\" \"R\") (property \"Value\" \"R\")\n"
        "    (symbol \"R_0_1\" (rectangle (start 0 0) (end 1 1))))\n"
        "  (symbol \"C\" (property \"Reference\" \"C\"))\n"
        ")");
    std::vector<const Node*> props = find_properties(r.root);
    ASSERT_EQ(props.size(), 3u);
    EXPECT_EQ(props[0]->get_string(1), "R");
    EXPECT_EQ(props[1]->get_string(0), "Value");
    EXPECT_EQ(props[2]->get_string(1), "C");
}
