#include "geometry.h"
#include <cmath>
#include <set>
#include <string>

namespace kisexpr {

Point rotate_point(const Point& pt, const Point& origin, double angle_deg) {
    double rad = deg_to_rad(angle_deg);
    double dx = (pt.x - origin.x).to_mm();
    double dy = (pt.y - origin.y).to_mm();
    double cos_a = std::cos(rad);
    double sin_a = std::sin(rad);
    return {
        origin.x + Coord::from_mm(dx * cos_a - dy * sin_a),
        origin.y + Coord::from_mm(dx * sin_a + dy * cos_a)
    };
}

Point footprint_to_board(const Point& local, const Point& origin, double angle_deg) {
    if (angle_deg == 0.0) return origin + local;
    return origin + rotate_point(local, Point(), -angle_deg);
}

Box Box::compute(const std::vector<Point>& points) {
    Box box;
    for (const auto& p : points) box.add(p);
    return box;
}

void Box::add(const Point& pt) {
    if (empty) {
        min = max = pt;
        empty = false;
        return;
    }
    min.x = Coord::min(min.x, pt.x);
    min.y = Coord::min(min.y, pt.y);
    max.x = Coord::max(max.x, pt.x);
    max.y = Coord::max(max.y, pt.y);
}

void Box::merge(const Box& other) {
    if (other.empty) return;
    add(other.min);
    add(other.max);
}

Point Box::center() const {
    if (empty) return {};
    return {(min.x + max.x) / 2, (min.y + max.y) / 2};
}

bool Box::contains(const Point& pt) const {
    return !empty && pt.x >= min.x && pt.x <= max.x && pt.y >= min.y && pt.y <= max.y;
}

namespace {

struct Placement {
    Point origin;
    double angle = 0.0;
    bool active = false;

    Point apply(const Point& p) const {
        return active ? footprint_to_board(p, origin, angle) : p;
    }
};

bool read_point(const Node& list, Point& pt) {
    auto x = list.get_coord(0);
    auto y = list.get_coord(1);
    if (!x || !y) return false;
    pt = {*x, *y};
    return true;
}

} // namespace

std::vector<Point> collect_points(const Node& root) {
    static const std::set<std::string> point_tags = {"xy", "at", "start", "end", "mid", "center"};

    std::vector<Point> points;
    struct Item {
        const Node* node;
        Placement placement;
    };
    std::vector<Item> stack;
    stack.push_back({&root, Placement()});

    while (!stack.empty()) {
        Item item = stack.back();
        stack.pop_back();
        const Node& node = *item.node;
        Placement placement = item.placement;

        if (node.tag() == "lib_symbols") continue;

        Point pt;
        if (point_tags.count(node.tag()) && read_point(node, pt)) {
            points.push_back(placement.apply(pt));
            continue;
        }

        // A footprint inside a board: its children are footprint-local
        bool placed = false;
        if (item.node != &root && (node.tag() == "footprint" || node.tag() == "module")) {
            if (const Node* at = node.child("at")) {
                if (read_point(*at, pt)) {
                    pt = placement.apply(pt);
                    points.push_back(pt);
                    placement.origin = pt;
                    placement.angle = at->get_double(2).value_or(0.0);
                    placement.active = true;
                    placed = true;
                }
            }
        }

        // Reverse order keeps the output in document order
        const auto& children = node.children();
        for (auto it = children.rbegin(); it != children.rend(); ++it) {
            if (!it->is_list()) continue;
            if (placed && it->tag() == "at") continue;
            stack.push_back({&*it, placement});
        }
    }
    return points;
}

Box compute_bounds(const Node& root) {
    return Box::compute(collect_points(root));
}

} // namespace kisexpr
