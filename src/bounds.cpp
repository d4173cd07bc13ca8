#include "scenegen/bounds.hpp"

#include <cmath>

namespace scenegen {
namespace {

constexpr double kPi = 3.14159265358979323846;

Point midpoint(const Point& a, const Point& b) {
    return Point{(a.x + b.x) * 0.5, (a.y + b.y) * 0.5};
}

std::vector<Point> sight_points(const Polygon& box, bool with_edges) {
    std::vector<Point> points(box.begin(), box.end());
    points.push_back(polygon_centroid(box));
    if (!with_edges) {
        return points;
    }
    const size_t n = box.size();
    for (size_t i = 0; i < n; ++i) {
        const Point& prev = box[(i + n - 1) % n];
        const Point& curr = box[i];
        const Point mid = midpoint(prev, curr);
        points.push_back(mid);
        points.push_back(midpoint(prev, mid));
        points.push_back(midpoint(mid, curr));
    }
    return points;
}

}  // namespace

const std::vector<double>& valid_rotations() {
    static const std::vector<double> rotations = {0.0, 45.0, 90.0, 135.0, 180.0, 225.0, 270.0, 315.0};
    return rotations;
}

Polygon rectangle_corners(
    double center_x,
    double center_z,
    double half_x,
    double half_z,
    double offset_x,
    double offset_z,
    double rotation_deg
) {
    const double rad = kPi * (2.0 - rotation_deg / 180.0);
    const double c = std::cos(rad);
    const double s = std::sin(rad);
    const double x_plus = half_x + offset_x;
    const double x_minus = -half_x + offset_x;
    const double z_plus = half_z + offset_z;
    const double z_minus = -half_z + offset_z;

    auto corner = [&](double x, double z) {
        return Point{center_x + x * c - z * s, center_z + x * s + z * c};
    };
    return Polygon{
        corner(x_plus, z_plus),
        corner(x_plus, z_minus),
        corner(x_minus, z_minus),
        corner(x_minus, z_plus),
    };
}

ObjectBounds create_bounds(
    const Vec3& dimensions,
    const Vec3& offset,
    const Vec3& position,
    const Vec3& rotation,
    double standing_y
) {
    ObjectBounds out;
    out.box_xz = rectangle_corners(
        position.x,
        position.z,
        dimensions.x * 0.5,
        dimensions.z * 0.5,
        offset.x,
        offset.z,
        rotation.y
    );
    out.min_y = position.y - standing_y;
    out.max_y = out.min_y + dimensions.y;
    return out;
}

bool rects_overlap(const ObjectBounds& a, const ObjectBounds& b) {
    return polygons_overlap_sat(a.box_xz, b.box_xz);
}

bool within_room(const ObjectBounds& bounds, const Vec3& room_dimensions) {
    const double half_x = room_dimensions.x * 0.5;
    const double half_z = room_dimensions.z * 0.5;
    for (const auto& p : bounds.box_xz) {
        if (p.x < -half_x || p.x > half_x || p.y < -half_z || p.y > half_z) {
            return false;
        }
    }
    return !bounds.box_xz.empty();
}

ObjectBounds performer_bounds(const Vec3& performer_position) {
    ObjectBounds out;
    out.box_xz = box_polygon(
        performer_position.x - kPerformerHalfWidth,
        performer_position.z - kPerformerHalfWidth,
        performer_position.x + kPerformerHalfWidth,
        performer_position.z + kPerformerHalfWidth
    );
    out.min_y = performer_position.y;
    out.max_y = performer_position.y + kPerformerHeight;
    return out;
}

bool validate_location_rect(
    const ObjectBounds& candidate,
    const Vec3& performer_position,
    const BoundsList& bounds_list,
    const Vec3& room_dimensions
) {
    if (!within_room(candidate, room_dimensions)) {
        return false;
    }
    auto clashes = [&](const ObjectBounds& other) {
        if (candidate.min_y >= other.max_y || candidate.max_y <= other.min_y) {
            return false;
        }
        return rects_overlap(candidate, other);
    };
    if (clashes(performer_bounds(performer_position))) {
        return false;
    }
    for (const auto& other : bounds_list) {
        if (clashes(other)) {
            return false;
        }
    }
    return true;
}

Obstruction visibility_line_obstructed(const Point& observer, const Polygon& blocker, const ObjectBounds& target) {
    Obstruction out;
    const std::vector<Point> full_points = sight_points(target.box_xz, false);
    int blocked = 0;
    for (const auto& p : full_points) {
        if (segment_intersects_polygon(observer, p, blocker)) {
            ++blocked;
        }
    }
    out.fully = blocked == static_cast<int>(full_points.size());
    if (blocked > 0) {
        out.partly = true;
        return out;
    }
    const std::vector<Point> partial_points = sight_points(target.box_xz, true);
    for (size_t i = full_points.size(); i < partial_points.size(); ++i) {
        if (segment_intersects_polygon(observer, partial_points[i], blocker)) {
            out.partly = true;
            break;
        }
    }
    return out;
}

bool does_fully_obstruct(const Vec3& performer_position, const ObjectBounds& target, const Polygon& blocker) {
    const Point observer{performer_position.x, performer_position.z};
    return visibility_line_obstructed(observer, blocker, target).fully;
}

bool does_partly_obstruct(const Vec3& performer_position, const ObjectBounds& target, const Polygon& blocker) {
    const Point observer{performer_position.x, performer_position.z};
    return visibility_line_obstructed(observer, blocker, target).partly;
}

double bounds_distance(const ObjectBounds& a, const ObjectBounds& b) {
    return polygon_distance(a.box_xz, b.box_xz);
}

}  // namespace scenegen
