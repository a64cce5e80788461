#pragma once

#include "coord.h"
#include "sexpr.h"
#include <vector>

namespace kisexpr {

constexpr double PI = 3.14159265358979323846;

struct Point {
    Coord x;
    Coord y;

    Point() = default;
    Point(Coord x, Coord y) : x(x), y(y) {}

    Point operator+(const Point& o) const { return {x + o.x, y + o.y}; }
    Point operator-(const Point& o) const { return {x - o.x, y - o.y}; }
    bool operator==(const Point& o) const { return x == o.x && y == o.y; }
    bool operator!=(const Point& o) const { return !(*this == o); }
};

inline double deg_to_rad(double deg) { return deg * PI / 180.0; }

// Rotate a point around an origin by angle_deg (counter-clockwise in
// y-up coordinates), rounded to the nearest nanometre
Point rotate_point(const Point& pt, const Point& origin, double angle_deg);

// Board position of a point given in footprint-local coordinates.
// KiCad's y axis points down, so a positive footprint angle turns
// clockwise on paper in these coordinates.
Point footprint_to_board(const Point& local, const Point& origin, double angle_deg);

// Axis-aligned bounding box. A default box is empty.
struct Box {
    Point min;
    Point max;
    bool empty = true;

    static Box compute(const std::vector<Point>& points);

    void add(const Point& pt);
    void merge(const Box& other);

    Coord width() const { return empty ? Coord() : max.x - min.x; }
    Coord height() const { return empty ? Coord() : max.y - min.y; }
    Point center() const;
    bool contains(const Point& pt) const;
};

// Coordinates of every (xy X Y), (at X Y ...), (start X Y), (end X Y),
// (mid X Y) and (center X Y) in the tree. Footprints placed on a board are
// transformed by their (at X Y angle); library symbol definitions inside
// a schematic are skipped.
std::vector<Point> collect_points(const Node& root);

Box compute_bounds(const Node& root);

} // namespace kisexpr
