#pragma once

#include <optional>
#include <utility>
#include <vector>

namespace scenegen {

// Planar point on the floor (x, z in scene coordinates).
struct Point {
    double x = 0.0;
    double y = 0.0;
};

using Polygon = std::vector<Point>;
using Segment = std::pair<Point, Point>;

struct BoundingBox {
    double min_x = 0.0;
    double min_y = 0.0;
    double max_x = 0.0;
    double max_y = 0.0;

    double width() const { return max_x - min_x; }
    double height() const { return max_y - min_y; }
    bool empty() const { return !(max_x >= min_x) || !(max_y >= min_y); }
};

double polygon_signed_area(const Polygon& poly);
double polygon_area(const Polygon& poly);
Polygon ensure_ccw(Polygon poly);
BoundingBox polygon_bbox(const Polygon& poly);
Point polygon_centroid(const Polygon& poly);

// Counter-clockwise rotation in degrees.
Point rotate_point(const Point& p, double deg);
Point rotate_point_about(const Point& p, const Point& origin, double deg);
Polygon rotate_polygon_about(const Polygon& poly, const Point& origin, double deg);
Polygon translate_polygon(const Polygon& poly, double dx, double dy);
Polygon box_polygon(double min_x, double min_y, double max_x, double max_y);

bool segments_intersect(const Point& a, const Point& b, const Point& c, const Point& d, double eps = 1e-12);
bool point_in_polygon(const Point& p, const Polygon& poly, double eps = 1e-12);
bool polygons_intersect(const Polygon& poly_a, const Polygon& poly_b, double eps = 1e-12);

// True when the segment touches the polygon boundary or lies inside it.
bool segment_intersects_polygon(const Point& a, const Point& b, const Polygon& poly, double eps = 1e-12);

// Separating-axis test for convex polygons. Touching at an edge or a corner is NOT an overlap.
bool polygons_overlap_sat(const Polygon& poly_a, const Polygon& poly_b, double eps = 1e-12);

double distance_between(const Point& a, const Point& b);
// With the height difference.
double distance_between(double ax, double ay, double az, double bx, double by, double bz);
double point_segment_distance(const Point& p, const Point& a, const Point& b);

// Minimum distance between the two polygons; 0 when they intersect.
double polygon_distance(const Polygon& poly_a, const Polygon& poly_b);

// Liang-Barsky clip; nullopt when nothing of the segment is left in the box.
std::optional<Segment> clip_segment_to_box(const Point& a, const Point& b, const BoundingBox& box);

// Cyrus-Beck clip against a convex polygon (either winding).
std::optional<Segment> clip_segment_to_convex_polygon(const Point& a, const Point& b, const Polygon& poly);

// Sutherland-Hodgman clip of a convex polygon against an axis-aligned box.
Polygon clip_polygon_to_box(const Polygon& poly, const BoundingBox& box);

Point interpolate(const Point& a, const Point& b, double t);

}  // namespace scenegen
