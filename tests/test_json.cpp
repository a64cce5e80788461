#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include "document.h"
#include "json_export.h"
#include "json_import.h"
#include "parser.h"
#include "writer.h"

#include <sstream>

using namespace kisexpr;
using json = nlohmann::json;

static json export_tree(const std::string& text) {
    ParseResult r = parse(text);
    EXPECT_FALSE(r.has_errors()) << text;
    std::ostringstream out;
    write_json(out, r.root);
    return json::parse(out.str());
}

TEST(JsonExportTest, TreeShape) {
    json j = export_tree("(pad \"1\" smd (at 1.50 -2))");
    EXPECT_EQ(j["tag"], "pad");
    ASSERT_EQ(j["children"].size(), 3u);
    EXPECT_EQ(j["children"][0]["string"], "1");
    EXPECT_EQ(j["children"][1]["symbol"], "smd");

    const json& at = j["children"][2];
    EXPECT_EQ(at["tag"], "at");
    EXPECT_DOUBLE_EQ(at["children"][0]["number"].get<double>(), 1.5);
    EXPECT_EQ(at["children"][0]["text"], "1.50");
    EXPECT_EQ(at["children"][1]["text"], "-2");
}

TEST(JsonExportTest, EscapedStringKeepsRawSpelling) {
    json j = export_tree("(property \"a\\\"b\" \"x\")");
    EXPECT_EQ(j["children"][0]["string"], "a\"b");
    EXPECT_EQ(j["children"][0]["raw"], "a\\\"b");
}

TEST(JsonExportTest, Diagnostics) {
    ParseResult r = parse("(kicad_sch (version 1)");
    ASSERT_TRUE(r.has_errors());
    std::ostringstream out;
    write_json_diagnostics(out, r.diagnostics);
    json j = json::parse(out.str());
    ASSERT_TRUE(j.is_array());
    ASSERT_FALSE(j.empty());
    EXPECT_EQ(j.back()["severity"], "error");
    EXPECT_EQ(j.back()["line"], 1);
    EXPECT_TRUE(j.back().contains("offset"));
}

TEST(JsonExportTest, DocumentSummary) {
    Document doc;
    ASSERT_TRUE(doc.load_file(std::string(KISEXPR_FIXTURE_DIR) + "/fp_kicad6.kicad_mod"));
    std::ostringstream out;
    write_json(out, doc);
    json j = json::parse(out.str());
    EXPECT_EQ(j["kind"], "footprint");
    EXPECT_EQ(j["version"], 20211014);
    EXPECT_EQ(j["generator"], "pcbnew");
    EXPECT_TRUE(j["generator_version"].is_null());
    EXPECT_EQ(j["name"], "R_0603_1608Metric");
    EXPECT_FALSE(j["has_errors"].get<bool>());
    EXPECT_TRUE(j["diagnostics"].empty());
    EXPECT_EQ(j["root"]["tag"], "footprint");
}

TEST(JsonImportTest, RestoresAtomSpelling) {
    const std::string text = "(pad \"a\\\"b\" smd (at 1.50 -2))";
    ParseResult r = parse(text);
    std::ostringstream out;
    write_json(out, r.root);

    Node root;
    ASSERT_TRUE(read_json(out.str(), root));
    EXPECT_EQ(write(root), "(pad \"a\\\"b\" smd\n  (at 1.50 -2)\n)\n");
}

TEST(JsonImportTest, NumberWithoutText) {
    Node root;
    ASSERT_TRUE(read_json(R"({"tag": "width", "children": [{"number": 2.5}]})", root));
    EXPECT_EQ(write(root), "(width 2.5)\n");
}

TEST(JsonImportTest, StreamInput) {
    std::istringstream in(R"({"tag": "layers", "children": [{"string": "F.Cu"}, {"symbol": "signal"}]})");
    Node root;
    ASSERT_TRUE(read_json(in, root));
    EXPECT_EQ(write(root), "(layers \"F.Cu\" signal)\n");
}

TEST(JsonImportTest, RejectsMalformedInput) {
    Node root = Node::list("keep");
    EXPECT_FALSE(read_json("{not json", root));
    EXPECT_FALSE(read_json(R"({"symbol": "x"})", root));
    EXPECT_FALSE(read_json(R"({"tag": "a", "children": [{"foo": 1}]})", root));
    EXPECT_FALSE(read_json(R"({"tag": "a", "children": [{"symbol": "a b"}]})", root));
    EXPECT_FALSE(read_json(R"({"tag": "a", "children": [{"number": 1, "text": "abc"}]})", root));
    EXPECT_FALSE(read_json(R"({"tag": "a", "children": {"symbol": "x"}})", root));
    EXPECT_FALSE(read_json(R"({"tag": 5})", root));
    EXPECT_FALSE(read_json(R"({"tag": "a(b"})", root));
    EXPECT_EQ(root.tag(), "keep");
}
