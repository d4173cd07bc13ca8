#include "scenegen/placement.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace scenegen {
namespace {

constexpr double kPi = 3.14159265358979323846;

double deg_to_rad(double deg) {
    return deg * kPi / 180.0;
}

BoundingBox room_box(const Vec3& room, double inset = 0.0) {
    return BoundingBox{-room.x * 0.5 + inset, -room.z * 0.5 + inset, room.x * 0.5 - inset, room.z * 0.5 - inset};
}

Point performer_point(const PerformerStart& performer) {
    return Point{performer.position.x, performer.position.z};
}

double normalize_degrees(double deg) {
    double out = std::fmod(deg, 360.0);
    if (out < 0.0) {
        out += 360.0;
    }
    return out;
}

}  // namespace

std::optional<Location> calc_obj_pos(
    const PlacementArea& area,
    const Definition& def,
    BoundsList& bounds_list,
    const PositionFn& position_fn,
    const RotationFn& rotation_fn,
    int max_tries
) {
    for (int attempt = 0; attempt < max_tries; ++attempt) {
        const double rotation_y = def.rotation.y + rotation_fn();
        const std::optional<Point> point = position_fn();
        if (!point) {
            continue;
        }
        Location location;
        location.position = Vec3{point->x, def.position_y, point->y};
        location.rotation = Vec3{def.rotation.x, rotation_y, def.rotation.z};
        location.bounds = create_bounds(def.dimensions, def.offset, location.position, location.rotation, def.position_y);
        if (validate_location_rect(location.bounds, area.performer.position, bounds_list, area.room_dimensions)) {
            bounds_list.push_back(location.bounds);
            return location;
        }
    }
    return std::nullopt;
}

std::optional<Location> random_location(
    Rng& rng,
    const PlacementArea& area,
    const Definition& def,
    BoundsList& bounds_list,
    const RandomPlacementOptions& options
) {
    const double half_x = area.room_dimensions.x * 0.5;
    const double half_z = area.room_dimensions.z * 0.5;
    auto position_fn = [&]() -> std::optional<Point> {
        return Point{
            round_digits(uniform_real(rng, -half_x, half_x), kPositionDigits),
            round_digits(uniform_real(rng, -half_z, half_z), kPositionDigits),
        };
    };
    auto rotation_fn = [&]() {
        return options.rotation_y ? *options.rotation_y : random_choice(rng, valid_rotations());
    };
    return calc_obj_pos(area, def, bounds_list, position_fn, rotation_fn, options.max_tries);
}

std::optional<Location> location_in_front_of_performer(Rng& rng, const PlacementArea& area, const Definition& def) {
    const double rotation = area.performer.rotation.y;
    const double far = 2.0 * std::max(area.room_dimensions.x, area.room_dimensions.z);
    const Point origin = performer_point(area.performer);
    Point near_point = rotate_point(Point{0.0, kMinForwardVisibilityDistance}, -rotation);
    Point far_point = rotate_point(Point{0.0, far}, -rotation);
    near_point = Point{near_point.x + origin.x, near_point.y + origin.y};
    far_point = Point{far_point.x + origin.x, far_point.y + origin.y};

    const std::optional<Segment> sight = clip_segment_to_box(near_point, far_point, room_box(area.room_dimensions));
    if (!sight) {
        return std::nullopt;
    }
    auto position_fn = [&]() -> std::optional<Point> {
        return interpolate(sight->first, sight->second, uniform_real(rng, 0.0, 1.0));
    };
    auto rotation_fn = [rotation]() { return rotation; };
    BoundsList none;
    return calc_obj_pos(area, def, none, position_fn, rotation_fn);
}

std::optional<Location> location_in_back_of_performer(Rng& rng, const PlacementArea& area, const Definition& def) {
    const Vec3& room = area.room_dimensions;
    const double half = std::max(def.dimensions.x * 0.5 - def.offset.x, def.dimensions.z * 0.5 - def.offset.z);
    const Point origin = performer_point(area.performer);

    Polygon rear = box_polygon(-room.x, -room.z, room.x, -0.5 - half);
    rear = translate_polygon(rear, origin.x, origin.y);
    rear = rotate_polygon_about(rear, origin, -area.performer.rotation.y);
    const Polygon usable = clip_polygon_to_box(rear, room_box(room, half));
    if (usable.empty()) {
        return std::nullopt;
    }
    const BoundingBox bbox = polygon_bbox(usable);

    auto position_fn = [&]() -> std::optional<Point> {
        const double x = random_real(rng, bbox.min_x, bbox.max_x, kMinRandomInterval);
        const std::optional<Segment> line =
            clip_segment_to_convex_polygon(Point{x, bbox.min_y}, Point{x, bbox.max_y}, usable);
        if (!line) {
            return std::nullopt;
        }
        return interpolate(line->first, line->second, uniform_real(rng, 0.0, 1.0));
    };
    auto rotation_fn = [&]() { return random_choice(rng, valid_rotations()); };
    BoundsList none;
    return calc_obj_pos(area, def, none, position_fn, rotation_fn);
}

std::optional<Location> location_in_line_with_object(
    Rng& rng,
    const PlacementArea& area,
    const Definition& def,
    const Definition& static_def,
    const Location& static_location,
    const BoundsList& bounds_list,
    InLineMode mode
) {
    const bool adjacent = mode == InLineMode::kAdjacent;
    const bool behind = mode == InLineMode::kBehind;
    const bool obstruct = mode == InLineMode::kObstruct;
    const bool unreachable = mode == InLineMode::kUnreachable;

    const Vec3& sdim = static_def.dimensions;
    const Vec3& dim = def.dimensions;
    const double static_x = static_location.position.x + static_def.offset.x;
    const double static_z = static_location.position.z + static_def.offset.z;
    const ObjectBounds static_bounds = create_bounds(
        sdim, static_def.offset, static_location.position, static_location.rotation, static_def.position_y
    );

    const double min_distance = kMinGap + std::min(sdim.x * 0.5, sdim.z * 0.5) + std::min(dim.x * 0.5, dim.z * 0.5);
    const Point performer = performer_point(area.performer);
    const double performer_distance = distance_between(performer, Point{static_x, static_z});
    if (!adjacent && !behind && performer_distance < min_distance * 2.0) {
        return std::nullopt;
    }
    const double diagonal = kMinGap + std::hypot(sdim.x * 0.5, sdim.z * 0.5) + std::hypot(dim.x * 0.5, dim.z * 0.5);
    const double max_distance = (obstruct || unreachable) ? performer_distance - min_distance : diagonal;

    const double angle = std::atan2(static_z - performer.y, static_x - performer.x) * 180.0 / kPi;
    std::vector<double> rays;
    if (behind) {
        rays = {angle};
    } else if (adjacent) {
        rays = {angle + 90.0, angle + 270.0};
    } else {
        rays = {angle + 180.0};
    }
    shuffle_in_place(rng, rays);

    BoundsList blocking = bounds_list;
    blocking.push_back(static_bounds);
    const Vec3 rotation{def.rotation.x, normalize_degrees(def.rotation.y + 450.0 - angle), def.rotation.z};

    for (double ray : rays) {
        const double rad = deg_to_rad(ray);
        // Integer steps keep the walk free of accumulated rounding.
        for (int step = 0;; ++step) {
            const double distance = min_distance + step * kMoveDistance;
            if (distance > max_distance + 1e-9) {
                break;
            }
            Location candidate;
            candidate.position = Vec3{
                static_x + distance * std::cos(rad) - def.offset.x,
                def.position_y,
                static_z + distance * std::sin(rad) - def.offset.z,
            };
            candidate.rotation = rotation;
            candidate.bounds = create_bounds(dim, def.offset, candidate.position, rotation, def.position_y);
            if (!validate_location_rect(candidate.bounds, area.performer.position, blocking, area.room_dimensions)) {
                continue;
            }
            if (obstruct) {
                if (bounds_distance(candidate.bounds, static_bounds) > kMaxReach) {
                    continue;
                }
                if (!does_fully_obstruct(area.performer.position, static_location.bounds, candidate.bounds.box_xz)) {
                    continue;
                }
            }
            if (unreachable) {
                const double reach = bounds_distance(candidate.bounds, static_bounds) + std::min(dim.x * 0.5, dim.z * 0.5);
                if (reach <= kMaxReach) {
                    continue;
                }
            }
            return candidate;
        }
    }
    return std::nullopt;
}

std::optional<Location> location_far_from(
    Rng& rng,
    const PlacementArea& area,
    const Definition& def,
    const ObjectBounds& anchor,
    BoundsList& bounds_list
) {
    for (int attempt = 0; attempt < kMaxTries; ++attempt) {
        BoundsList scratch = bounds_list;
        const std::optional<Location> location = random_location(rng, area, def, scratch);
        if (location && bounds_distance(location->bounds, anchor) > kMinObjectsSeparationDistance) {
            bounds_list.push_back(location->bounds);
            return location;
        }
    }
    return std::nullopt;
}

}  // namespace scenegen
