#include "scenegen/geometry.hpp"

#include <algorithm>
#include <cmath>
#include <limits>

namespace scenegen {

namespace {

constexpr double kPi = 3.14159265358979323846;

long double orient_ld(const Point& a, const Point& b, const Point& c) {
    const long double bax = static_cast<long double>(b.x) - static_cast<long double>(a.x);
    const long double bay = static_cast<long double>(b.y) - static_cast<long double>(a.y);
    const long double cax = static_cast<long double>(c.x) - static_cast<long double>(a.x);
    const long double cay = static_cast<long double>(c.y) - static_cast<long double>(a.y);
    return bax * cay - bay * cax;
}

bool on_segment(const Point& a, const Point& b, const Point& p, double eps) {
    return (std::min(a.x, b.x) - eps <= p.x && p.x <= std::max(a.x, b.x) + eps &&
            std::min(a.y, b.y) - eps <= p.y && p.y <= std::max(a.y, b.y) + eps &&
            std::abs(orient_ld(a, b, p)) <= static_cast<long double>(eps));
}

bool bboxes_disjoint(const BoundingBox& a, const BoundingBox& b, double eps) {
    return a.max_x < b.min_x - eps || b.max_x < a.min_x - eps || a.max_y < b.min_y - eps ||
           b.max_y < a.min_y - eps;
}

// Projects the polygon onto the axis (nx, ny) and returns [min, max].
std::pair<double, double> project(const Polygon& poly, double nx, double ny) {
    double lo = std::numeric_limits<double>::infinity();
    double hi = -std::numeric_limits<double>::infinity();
    for (const auto& p : poly) {
        const double d = p.x * nx + p.y * ny;
        lo = std::min(lo, d);
        hi = std::max(hi, d);
    }
    return {lo, hi};
}

bool separated_on_edge_normals(const Polygon& edges_of, const Polygon& a, const Polygon& b, double eps) {
    for (size_t i = 0; i < edges_of.size(); ++i) {
        const auto& p = edges_of[i];
        const auto& q = edges_of[(i + 1) % edges_of.size()];
        double nx = -(q.y - p.y);
        double ny = q.x - p.x;
        const double len = std::hypot(nx, ny);
        if (len <= 0.0) {
            continue;
        }
        nx /= len;
        ny /= len;
        const auto [a_lo, a_hi] = project(a, nx, ny);
        const auto [b_lo, b_hi] = project(b, nx, ny);
        if (a_hi <= b_lo + eps || b_hi <= a_lo + eps) {
            return true;
        }
    }
    return false;
}

// One Sutherland-Hodgman pass; `inside` and `cross` describe the clipping half-plane.
template <typename InsideFn, typename CrossFn>
Polygon clip_half_plane(const Polygon& poly, InsideFn inside, CrossFn cross) {
    Polygon out;
    if (poly.empty()) {
        return out;
    }
    for (size_t i = 0; i < poly.size(); ++i) {
        const Point& cur = poly[i];
        const Point& prev = poly[(i + poly.size() - 1) % poly.size()];
        const bool cur_in = inside(cur);
        const bool prev_in = inside(prev);
        if (cur_in) {
            if (!prev_in) {
                out.push_back(cross(prev, cur));
            }
            out.push_back(cur);
        } else if (prev_in) {
            out.push_back(cross(prev, cur));
        }
    }
    return out;
}

}  // namespace

double polygon_signed_area(const Polygon& poly) {
    if (poly.size() < 3) {
        return 0.0;
    }
    double acc = 0.0;
    for (size_t i = 0; i < poly.size(); ++i) {
        const auto& a = poly[i];
        const auto& b = poly[(i + 1) % poly.size()];
        acc += a.x * b.y - a.y * b.x;
    }
    return acc * 0.5;
}

double polygon_area(const Polygon& poly) {
    return std::abs(polygon_signed_area(poly));
}

Polygon ensure_ccw(Polygon poly) {
    if (polygon_signed_area(poly) < 0.0) {
        std::reverse(poly.begin(), poly.end());
    }
    return poly;
}

BoundingBox polygon_bbox(const Polygon& poly) {
    if (poly.empty()) {
        return BoundingBox{};
    }

    double min_x = std::numeric_limits<double>::infinity();
    double min_y = std::numeric_limits<double>::infinity();
    double max_x = -std::numeric_limits<double>::infinity();
    double max_y = -std::numeric_limits<double>::infinity();

    for (const auto& p : poly) {
        min_x = std::min(min_x, p.x);
        min_y = std::min(min_y, p.y);
        max_x = std::max(max_x, p.x);
        max_y = std::max(max_y, p.y);
    }
    return BoundingBox{min_x, min_y, max_x, max_y};
}

Point polygon_centroid(const Polygon& poly) {
    if (poly.empty()) {
        return Point{};
    }
    const double a = polygon_signed_area(poly);
    if (std::abs(a) <= 1e-15) {
        // Degenerate: average of the vertices.
        Point c;
        for (const auto& p : poly) {
            c.x += p.x;
            c.y += p.y;
        }
        c.x /= static_cast<double>(poly.size());
        c.y /= static_cast<double>(poly.size());
        return c;
    }
    double cx = 0.0;
    double cy = 0.0;
    for (size_t i = 0; i < poly.size(); ++i) {
        const auto& p = poly[i];
        const auto& q = poly[(i + 1) % poly.size()];
        const double w = p.x * q.y - q.x * p.y;
        cx += (p.x + q.x) * w;
        cy += (p.y + q.y) * w;
    }
    return Point{cx / (6.0 * a), cy / (6.0 * a)};
}

Point rotate_point(const Point& p, double deg) {
    const double rad = deg * (kPi / 180.0);
    const double c = std::cos(rad);
    const double s = std::sin(rad);
    return Point{c * p.x - s * p.y, s * p.x + c * p.y};
}

Point rotate_point_about(const Point& p, const Point& origin, double deg) {
    const Point r = rotate_point(Point{p.x - origin.x, p.y - origin.y}, deg);
    return Point{r.x + origin.x, r.y + origin.y};
}

Polygon rotate_polygon_about(const Polygon& poly, const Point& origin, double deg) {
    Polygon out;
    out.reserve(poly.size());
    for (const auto& p : poly) {
        out.push_back(rotate_point_about(p, origin, deg));
    }
    return out;
}

Polygon translate_polygon(const Polygon& poly, double dx, double dy) {
    Polygon out;
    out.reserve(poly.size());
    for (const auto& p : poly) {
        out.push_back(Point{p.x + dx, p.y + dy});
    }
    return out;
}

Polygon box_polygon(double min_x, double min_y, double max_x, double max_y) {
    return Polygon{{min_x, min_y}, {max_x, min_y}, {max_x, max_y}, {min_x, max_y}};
}

bool segments_intersect(const Point& a, const Point& b, const Point& c, const Point& d, double eps) {
    const long double o1 = orient_ld(a, b, c);
    const long double o2 = orient_ld(a, b, d);
    const long double o3 = orient_ld(c, d, a);
    const long double o4 = orient_ld(c, d, b);
    const long double e = static_cast<long double>(eps);

    const bool ab_straddles = (o1 > e && o2 < -e) || (o1 < -e && o2 > e);
    const bool cd_straddles = (o3 > e && o4 < -e) || (o3 < -e && o4 > e);
    if (ab_straddles && cd_straddles) {
        return true;
    }

    return (std::abs(o1) <= e && on_segment(a, b, c, eps)) || (std::abs(o2) <= e && on_segment(a, b, d, eps)) ||
           (std::abs(o3) <= e && on_segment(c, d, a, eps)) || (std::abs(o4) <= e && on_segment(c, d, b, eps));
}

bool point_in_polygon(const Point& p, const Polygon& poly, double eps) {
    if (poly.size() < 3) {
        return false;
    }

    bool inside = false;
    for (size_t i = 0; i < poly.size(); ++i) {
        const auto& a = poly[i];
        const auto& b = poly[(i + 1) % poly.size()];

        if (on_segment(a, b, p, eps)) {
            return true;
        }

        const bool ay = (a.y > p.y);
        const bool by = (b.y > p.y);
        if (ay != by) {
            const double x_int = (b.x - a.x) * (p.y - a.y) / (b.y - a.y) + a.x;
            if (x_int > p.x + eps) {
                inside = !inside;
            }
        }
    }
    return inside;
}

bool polygons_intersect(const Polygon& poly_a, const Polygon& poly_b, double eps) {
    if (poly_a.empty() || poly_b.empty()) {
        return false;
    }
    if (bboxes_disjoint(polygon_bbox(poly_a), polygon_bbox(poly_b), eps)) {
        return false;
    }

    for (size_t i = 0; i < poly_a.size(); ++i) {
        const auto& a1 = poly_a[i];
        const auto& a2 = poly_a[(i + 1) % poly_a.size()];
        for (size_t j = 0; j < poly_b.size(); ++j) {
            const auto& b1 = poly_b[j];
            const auto& b2 = poly_b[(j + 1) % poly_b.size()];
            if (segments_intersect(a1, a2, b1, b2, eps)) {
                return true;
            }
        }
    }

    return point_in_polygon(poly_a[0], poly_b, eps) || point_in_polygon(poly_b[0], poly_a, eps);
}

bool segment_intersects_polygon(const Point& a, const Point& b, const Polygon& poly, double eps) {
    if (poly.size() < 3) {
        return false;
    }
    if (point_in_polygon(a, poly, eps) || point_in_polygon(b, poly, eps)) {
        return true;
    }
    for (size_t i = 0; i < poly.size(); ++i) {
        if (segments_intersect(a, b, poly[i], poly[(i + 1) % poly.size()], eps)) {
            return true;
        }
    }
    return false;
}

bool polygons_overlap_sat(const Polygon& poly_a, const Polygon& poly_b, double eps) {
    if (poly_a.size() < 3 || poly_b.size() < 3) {
        return false;
    }
    if (separated_on_edge_normals(poly_a, poly_a, poly_b, eps)) {
        return false;
    }
    return !separated_on_edge_normals(poly_b, poly_a, poly_b, eps);
}

double distance_between(const Point& a, const Point& b) {
    return std::hypot(a.x - b.x, a.y - b.y);
}

double distance_between(double ax, double ay, double az, double bx, double by, double bz) {
    const double dx = ax - bx;
    const double dy = ay - by;
    const double dz = az - bz;
    return std::sqrt(dx * dx + dy * dy + dz * dz);
}

double point_segment_distance(const Point& p, const Point& a, const Point& b) {
    const double vx = b.x - a.x;
    const double vy = b.y - a.y;
    const double len2 = vx * vx + vy * vy;
    if (len2 <= 0.0) {
        return distance_between(p, a);
    }
    const double t = std::clamp(((p.x - a.x) * vx + (p.y - a.y) * vy) / len2, 0.0, 1.0);
    return distance_between(p, Point{a.x + t * vx, a.y + t * vy});
}

double polygon_distance(const Polygon& poly_a, const Polygon& poly_b) {
    if (poly_a.empty() || poly_b.empty()) {
        return std::numeric_limits<double>::infinity();
    }
    if (polygons_intersect(poly_a, poly_b)) {
        return 0.0;
    }
    double best = std::numeric_limits<double>::infinity();
    auto scan = [&best](const Polygon& pts, const Polygon& edges) {
        for (const auto& p : pts) {
            for (size_t j = 0; j < edges.size(); ++j) {
                best = std::min(best, point_segment_distance(p, edges[j], edges[(j + 1) % edges.size()]));
            }
        }
    };
    scan(poly_a, poly_b);
    scan(poly_b, poly_a);
    return best;
}

std::optional<Segment> clip_segment_to_box(const Point& a, const Point& b, const BoundingBox& box) {
    const double dx = b.x - a.x;
    const double dy = b.y - a.y;
    double t0 = 0.0;
    double t1 = 1.0;

    const double p[4] = {-dx, dx, -dy, dy};
    const double q[4] = {a.x - box.min_x, box.max_x - a.x, a.y - box.min_y, box.max_y - a.y};
    for (int i = 0; i < 4; ++i) {
        if (p[i] == 0.0) {
            if (q[i] < 0.0) {
                return std::nullopt;
            }
            continue;
        }
        const double r = q[i] / p[i];
        if (p[i] < 0.0) {
            t0 = std::max(t0, r);
        } else {
            t1 = std::min(t1, r);
        }
        if (t0 > t1) {
            return std::nullopt;
        }
    }
    return Segment{interpolate(a, b, t0), interpolate(a, b, t1)};
}

std::optional<Segment> clip_segment_to_convex_polygon(const Point& a, const Point& b, const Polygon& poly) {
    if (poly.size() < 3) {
        return std::nullopt;
    }
    const Polygon ccw = ensure_ccw(poly);
    const double dx = b.x - a.x;
    const double dy = b.y - a.y;
    double t0 = 0.0;
    double t1 = 1.0;
    for (size_t i = 0; i < ccw.size(); ++i) {
        const Point& p = ccw[i];
        const Point& q = ccw[(i + 1) % ccw.size()];
        // Inward normal of a CCW edge.
        const double nx = -(q.y - p.y);
        const double ny = q.x - p.x;
        const double num = nx * (a.x - p.x) + ny * (a.y - p.y);
        const double den = nx * dx + ny * dy;
        if (std::abs(den) <= 1e-15) {
            if (num < -1e-12) {
                return std::nullopt;
            }
            continue;
        }
        const double t = -num / den;
        if (den > 0.0) {
            t0 = std::max(t0, t);
        } else {
            t1 = std::min(t1, t);
        }
        if (t0 > t1) {
            return std::nullopt;
        }
    }
    return Segment{interpolate(a, b, t0), interpolate(a, b, t1)};
}

Polygon clip_polygon_to_box(const Polygon& poly, const BoundingBox& box) {
    Polygon out = poly;
    auto cross_x = [](double x) {
        return [x](const Point& p, const Point& q) {
            const double t = (x - p.x) / (q.x - p.x);
            return Point{x, p.y + t * (q.y - p.y)};
        };
    };
    auto cross_y = [](double y) {
        return [y](const Point& p, const Point& q) {
            const double t = (y - p.y) / (q.y - p.y);
            return Point{p.x + t * (q.x - p.x), y};
        };
    };
    out = clip_half_plane(out, [&](const Point& p) { return p.x >= box.min_x; }, cross_x(box.min_x));
    out = clip_half_plane(out, [&](const Point& p) { return p.x <= box.max_x; }, cross_x(box.max_x));
    out = clip_half_plane(out, [&](const Point& p) { return p.y >= box.min_y; }, cross_y(box.min_y));
    out = clip_half_plane(out, [&](const Point& p) { return p.y <= box.max_y; }, cross_y(box.max_y));
    if (out.size() < 3 || polygon_area(out) <= 0.0) {
        return Polygon{};
    }
    return out;
}

Point interpolate(const Point& a, const Point& b, double t) {
    return Point{a.x + t * (b.x - a.x), a.y + t * (b.y - a.y)};
}

}  // namespace scenegen
