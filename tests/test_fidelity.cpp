#include <gtest/gtest.h>
#include "fidelity.h"
#include "parser.h"
#include "writer.h"

#include <limits>

using namespace kisexpr;

static Node parse_root(const char* text) {
    return parse(text).root;
}

// Canonical text collapsed onto a single line
static std::string one_line(const Node& n) {
    WriterOptions opts;
    opts.use_layout_hints = false;
    std::string out = write(n, opts);
    std::string flat;
    bool space = false;
    for (char c : out) {
        if (c == '\n' || c == ' ') {
            space = true;
            continue;
        }
        if (space && !flat.empty() && c != ')') flat += ' ';
        space = false;
        flat += c;
    }
    return flat;
}

TEST(EncodedValueTest, FreshValueIsExplicit) {
    EncodedValue<int> v(5);
    EXPECT_EQ(*v, 5);
    EXPECT_TRUE(v.is_explicit());
    EXPECT_FALSE(v.was_parsed());
    EXPECT_FALSE(v.is_modified());

    EncodedValue<int> absent;
    EXPECT_FALSE(absent.is_explicit());
}

TEST(EncodedValueTest, SetTracksModification) {
    Node parent = parse_root("(x (version 20211014))");
    EncodedValue<int> v = read_number<int>(parent, "version");
    v.set(20211014);
    EXPECT_FALSE(v.is_modified());
    v.set(20231120);
    EXPECT_TRUE(v.is_modified());
    EXPECT_EQ(v.get(), 20231120);
    EXPECT_TRUE(v.was_parsed());
}

TEST(EncodedValueTest, ResetDropsTheField) {
    Node parent = parse_root("(x (generator pcbnew))");
    EncodedValue<std::string> g = read_text(parent, "generator");
    g.reset();
    Builder b("x");
    write_text(b, "generator", g, TextStyle::Quoted);
    EXPECT_EQ(one_line(b.build()), "(x)");
}

TEST(FidelityTest, ReadTextRecordsQuoting) {
    Node parent = parse_root("(x (generator eeschema) (generator_version \"8.0\"))");
    EncodedValue<std::string> g = read_text(parent, "generator");
    EXPECT_EQ(*g, "eeschema");
    EXPECT_TRUE(g.format().is_symbol);
    EXPECT_TRUE(g.is_explicit());

    EncodedValue<std::string> gv = read_text(parent, "generator_version");
    EXPECT_EQ(*gv, "8.0");
    EXPECT_FALSE(gv.format().is_symbol);

    EncodedValue<std::string> missing = read_text(parent, "uuid");
    EXPECT_FALSE(missing.is_explicit());
    EXPECT_TRUE(missing.was_parsed());
}

TEST(FidelityTest, ModifiedTextKeepsRecordedStyle) {
    Node parent = parse_root("(x (generator eeschema))");
    EncodedValue<std::string> g = read_text(parent, "generator");
    g.set("kicad-sexpr");

    Builder b("x");
    write_text(b, "generator", g, TextStyle::Quoted);
    EXPECT_EQ(one_line(b.build()), "(x (generator kicad-sexpr))");
}

TEST(FidelityTest, UnsafeSymbolFallsBackToQuotes) {
    Node parent = parse_root("(x (generator eeschema))");
    EncodedValue<std::string> g = read_text(parent, "generator");
    g.set("two words");

    Builder b("x");
    write_text(b, "generator", g, TextStyle::Symbol);
    EXPECT_EQ(one_line(b.build()), "(x (generator \"two words\"))");
}

TEST(FidelityTest, FreshTextUsesCanonicalStyle) {
    EncodedValue<std::string> quoted(std::string("abc"));
    EncodedValue<std::string> bare(std::string("abc"));

    Builder b("x");
    write_text(b, "q", quoted, TextStyle::Quoted);
    write_text(b, "s", bare, TextStyle::Symbol);
    EXPECT_EQ(one_line(b.build()), "(x (q \"abc\") (s abc))");
}

TEST(FidelityTest, LegacyTokenIsKept) {
    Node parent = parse_root("(x (tstamp 5E4A3B2C))");
    EncodedValue<std::string> id = read_text(parent, "uuid", {"tstamp"});
    ASSERT_TRUE(id.is_explicit());
    EXPECT_EQ(id.format().token, "tstamp");

    id.set("6F000000");
    Builder b("x");
    write_text(b, "uuid", id, TextStyle::Quoted);
    EXPECT_EQ(one_line(b.build()), "(x (tstamp 6F000000))");
}

TEST(FidelityTest, UnmodifiedFieldIsWrittenVerbatim) {
    ParseResult r = parse("(x (version 20211014.0))");
    EncodedValue<int> v = read_number<int>(r.root, "version");
    Builder b("x");
    b.keep_layout(r.root);
    write_number(b, "version", v);
    EXPECT_EQ(write(b.build()), "(x (version 20211014.0))\n");
}

TEST(FidelityTest, OutOfRangeIntegerSaturates) {
    ParseResult r = parse("(x (id 3000000000))");
    EncodedValue<int> id = read_number<int>(r.root, "id");
    ASSERT_TRUE(id.is_explicit());
    EXPECT_EQ(*id, std::numeric_limits<int>::max());

    Builder b("x");
    b.keep_layout(r.root);
    write_number(b, "id", id);
    EXPECT_EQ(write(b.build()), "(x (id 3000000000))\n");

    EncodedValue<int> low = read_number<int>(parse_root("(x (id -3000000000))"), "id");
    EXPECT_EQ(*low, std::numeric_limits<int>::lowest());
}

TEST(FidelityTest, EmptyFieldIsWrittenVerbatim) {
    ParseResult r = parse("(x (generator))");
    EncodedValue<std::string> g = read_text(r.root, "generator");
    ASSERT_TRUE(g.is_explicit());
    EXPECT_EQ(*g, "");

    Builder b("x");
    b.keep_layout(r.root);
    write_text(b, "generator", g, TextStyle::Quoted);
    EXPECT_EQ(write(b.build()), "(x (generator))\n");
}

TEST(FidelityTest, ValueSetOnEmptyFieldGoesFirst) {
    Node parent = parse_root("(x (generator))");
    EncodedValue<std::string> g = read_text(parent, "generator");
    g.set("pcbnew");
    Builder b("x");
    write_text(b, "generator", g, TextStyle::Quoted);
    EXPECT_EQ(one_line(b.build()), "(x (generator \"pcbnew\"))");
}

TEST(FidelityTest, ModifiedNumberKeepsTrailingChildren) {
    Node parent = parse_root("(x (width 0.25 extra))");
    EncodedValue<double> w = read_number<double>(parent, "width");
    w.set(0.5);
    Builder b("x");
    write_number(b, "width", w);
    EXPECT_EQ(one_line(b.build()), "(x (width 0.5 extra))");
}

TEST(FidelityTest, ReadFlagVariants) {
    Node parent = parse_root("(effects (font (size 1 1)) hide)");
    EncodedValue<bool> bare = read_flag(parent, "hide");
    EXPECT_TRUE(*bare);
    EXPECT_FALSE(bare.format().child_node);

    EncodedValue<bool> child = read_flag(parse_root("(effects (hide yes))"), "hide");
    EXPECT_TRUE(*child);
    EXPECT_TRUE(child.format().child_node);

    EXPECT_FALSE(*read_flag(parse_root("(effects (hide no))"), "hide"));
    EXPECT_TRUE(*read_flag(parse_root("(effects (hide))"), "hide"));

    EncodedValue<bool> absent = read_flag(parse_root("(effects)"), "hide");
    EXPECT_FALSE(absent.is_explicit());
    EXPECT_FALSE(*absent);
}

TEST(FidelityTest, WriteFlagReproducesEncoding) {
    EncodedValue<bool> bare = read_flag(parse_root("(e hide)"), "hide");
    EncodedValue<bool> child = read_flag(parse_root("(e (hide yes))"), "hide");

    Builder b("e");
    write_flag(b, "hide", bare, true);
    write_flag(b, "hide", child, false);
    EXPECT_EQ(one_line(b.build()), "(e hide (hide yes))");

    bare.set(false);
    child.set(false);
    Builder off("e");
    write_flag(off, "hide", bare, true);
    write_flag(off, "hide", child, false);
    EXPECT_EQ(one_line(off.build()), "(e (hide no))");
}

TEST(FidelityTest, FreshFlagUsesCanonicalEncoding) {
    EncodedValue<bool> on(true);
    Builder child("e");
    write_flag(child, "hide", on, true);
    EXPECT_EQ(one_line(child.build()), "(e (hide yes))");

    Builder bare("e");
    write_flag(bare, "hide", on, false);
    EXPECT_EQ(one_line(bare.build()), "(e hide)");

    EncodedValue<bool> off(false);
    Builder none("e");
    write_flag(none, "hide", off, false);
    EXPECT_EQ(one_line(none.build()), "(e)");
}

TEST(FidelityTest, FlagSetOnAbsentFieldUsesCanonical) {
    EncodedValue<bool> flag = read_flag(parse_root("(e)"), "hide");
    flag.set(true);
    Builder b("e");
    write_flag(b, "hide", flag, true);
    EXPECT_EQ(one_line(b.build()), "(e (hide yes))");
}

TEST(FidelityTest, AtomTextKeepsSourceSpelling) {
    Node legacy = parse_root("(module R_0603 (layer F.Cu))");
    EncodedValue<std::string> name = read_atom_text(legacy, 0);
    EXPECT_EQ(*name, "R_0603");
    EXPECT_TRUE(name.format().is_symbol);

    Builder b("module");
    name.set("R_0805");
    write_atom_text(b, name, TextStyle::Quoted);
    EXPECT_EQ(one_line(b.build()), "(module R_0805)");
}

TEST(FidelityTest, SplitSectionsKeepsOrder) {
    Node parent = parse_root("(p \"k\" (id 1) (future 2) (at 0 0) tail)");
    auto sections = split_sections<int>(parent, [](const Node& n) -> std::optional<int> {
        if (n.tag() == "id") return 1;
        if (n.tag() == "at") return 2;
        return std::nullopt;
    });
    ASSERT_EQ(sections.size(), 5u);
    EXPECT_EQ(sections[0].index(), 1u);
    EXPECT_EQ(std::get<0>(sections[1]), 1);
    EXPECT_EQ(std::get<1>(sections[2]).tag(), "future");
    EXPECT_EQ(std::get<0>(sections[3]), 2);
    EXPECT_EQ(std::get<1>(sections[4]).text(), "tail");
}
