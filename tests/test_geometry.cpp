#include <gtest/gtest.h>
#include "geometry.h"
#include "parser.h"

using namespace kisexpr;

static Coord mm(const char* text) {
    return *Coord::parse_mm(text);
}

static Node parse_root(const char* text) {
    ParseResult r = parse(text);
    EXPECT_FALSE(r.has_errors());
    return r.root;
}

TEST(BoxTest, EmptyForNoPoints) {
    Box box = Box::compute({});
    EXPECT_TRUE(box.empty);
    EXPECT_EQ(box.width(), Coord());
    EXPECT_FALSE(box.contains(Point()));
}

TEST(BoxTest, ComputeAndQueries) {
    Box box = Box::compute({{mm("1"), mm("2")}, {mm("-3"), mm("5")}, {mm("0"), mm("-1")}});
    ASSERT_FALSE(box.empty);
    EXPECT_EQ(box.min, Point(mm("-3"), mm("-1")));
    EXPECT_EQ(box.max, Point(mm("1"), mm("5")));
    EXPECT_EQ(box.width().to_string(), "4");
    EXPECT_EQ(box.height().to_string(), "6");
    EXPECT_EQ(box.center(), Point(mm("-1"), mm("2")));
    EXPECT_TRUE(box.contains({mm("0"), mm("0")}));
    EXPECT_TRUE(box.contains({mm("1"), mm("5")}));
    EXPECT_FALSE(box.contains({mm("1.000001"), mm("0")}));
}

TEST(BoxTest, Merge) {
    Box a = Box::compute({{mm("0"), mm("0")}});
    Box b = Box::compute({{mm("2"), mm("3")}});
    a.merge(b);
    EXPECT_EQ(a.max, Point(mm("2"), mm("3")));
    a.merge(Box());
    EXPECT_EQ(a.min, Point());
}

TEST(GeometryTest, RotatePoint) {
    Point p = rotate_point({mm("1"), mm("0")}, Point(), 90.0);
    EXPECT_EQ(p, Point(mm("0"), mm("1")));
}

TEST(GeometryTest, FootprintToBoardFollowsKicadRotation) {
    // A pad 1 mm to the right of a footprint rotated by 90 degrees ends up
    // 1 mm above the origin (y grows downward)
    Point p = footprint_to_board({mm("1"), mm("0")}, {mm("10"), mm("10")}, 90.0);
    EXPECT_EQ(p, Point(mm("10"), mm("9")));

    Point q = footprint_to_board({mm("1"), mm("2")}, {mm("10"), mm("10")}, 0.0);
    EXPECT_EQ(q, Point(mm("11"), mm("12")));
}

TEST(GeometryTest, CollectsCoordinateLists) {
    Node root = parse_root(
        "(kicad_sch (version 20231120)\n"
        "  (wire (pts (xy 10 20) (xy 30 20)))\n"
        "  (junction (at 30 20))\n"
        "  (arc (start 0 0) (mid 1 1) (end 2 0))\n"
        "  (circle (center 5 5) (radius 1))\n"
        ")\n");
    std::vector<Point> points = collect_points(root);
    EXPECT_EQ(points.size(), 7u);

    Box box = compute_bounds(root);
    EXPECT_EQ(box.min, Point(mm("0"), mm("0")));
    EXPECT_EQ(box.max, Point(mm("30"), mm("20")));
}

TEST(GeometryTest, SkipsLibrarySymbolDefinitions) {
    Node root = parse_root(
        "(kicad_sch\n"
        "  (lib_symbols (symbol \"R\" (pin passive line (at 100 100 0))))\n"
        "  (symbol (at 5 5 0))\n"
        ")\n");
    Box box = compute_bounds(root);
    EXPECT_EQ(box.max, Point(mm("5"), mm("5")));
}

TEST(GeometryTest, PlacesBoardFootprints) {
    Node root = parse_root(
        "(kicad_pcb\n"
        "  (footprint \"R\" (at 10 10 90)\n"
        "    (pad \"1\" smd rect (at 1 0) (size 1 1)))\n"
        "  (segment (start 0 0) (end 20 0))\n"
        ")\n");
    std::vector<Point> points = collect_points(root);
    ASSERT_EQ(points.size(), 4u);
    EXPECT_EQ(points[0], Point(mm("10"), mm("10")));
    EXPECT_EQ(points[1], Point(mm("10"), mm("9")));
}

TEST(GeometryTest, IgnoresIncompleteCoordinates) {
    Node root = parse_root("(footprint \"X\" (at 1) (start a b) (end 1 2))");
    std::vector<Point> points = collect_points(root);
    ASSERT_EQ(points.size(), 1u);
    EXPECT_EQ(points[0], Point(mm("1"), mm("2")));
}
