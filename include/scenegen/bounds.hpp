#pragma once

#include <vector>

#include "scenegen/geometry.hpp"

namespace scenegen {

struct Vec3 {
    double x = 0.0;
    double y = 0.0;
    double z = 0.0;
};

constexpr int kMaxTries = 50;
constexpr double kMaxReach = 1.0;
constexpr double kMoveDistance = 0.1;
constexpr double kCameraY = 0.762;
constexpr double kPerformerHalfWidth = 0.27;
constexpr double kPerformerHeight = 1.08;
constexpr double kPerformerMass = 2.0;
constexpr double kPerformerWidth = kPerformerHalfWidth * 2.0;
constexpr double kMinRandomInterval = 0.05;
constexpr int kPositionDigits = 2;
constexpr double kMinObjectsSeparationDistance = 2.0;
constexpr double kMinForwardVisibilityDistance = 1.25;
constexpr double kMinGap = 0.1;

// Default room when the caller does not draw one.
constexpr Vec3 kDefaultRoomDimensions{10.0, 3.0, 10.0};

// Floor rectangle (corners a, b, c, d in x/z) plus its vertical extent.
struct ObjectBounds {
    Polygon box_xz;
    double min_y = 0.0;
    double max_y = 0.0;
};

// Append-only list of validated rectangles for one generation attempt.
using BoundsList = std::vector<ObjectBounds>;

struct Location {
    Vec3 position;
    Vec3 rotation;
    ObjectBounds bounds;
};

struct PerformerStart {
    Vec3 position;
    Vec3 rotation;
};

// The eight compass rotations {0, 45, ..., 315}.
const std::vector<double>& valid_rotations();

// Corners a=(X+,Z+), b=(X+,Z-), c=(X-,Z-), d=(X-,Z+) rotated clockwise by
// `rotation_deg` around (center_x, center_z).
Polygon rectangle_corners(
    double center_x,
    double center_z,
    double half_x,
    double half_z,
    double offset_x,
    double offset_z,
    double rotation_deg
);

ObjectBounds create_bounds(
    const Vec3& dimensions,
    const Vec3& offset,
    const Vec3& position,
    const Vec3& rotation,
    double standing_y
);

// Positive-area intersection of the footprints; touching is not an overlap.
bool rects_overlap(const ObjectBounds& a, const ObjectBounds& b);

bool within_room(const ObjectBounds& bounds, const Vec3& room_dimensions);

ObjectBounds performer_bounds(const Vec3& performer_position);

// In the room, and clear of the performer and every y-overlapping entry.
bool validate_location_rect(
    const ObjectBounds& candidate,
    const Vec3& performer_position,
    const BoundsList& bounds_list,
    const Vec3& room_dimensions
);

struct Obstruction {
    bool fully = false;
    bool partly = false;
};

// Sight lines from `observer` to sample points of `target`, tested against
// `blocker`. Fully uses the 4 corners and the centroid; partly also uses the
// edge midpoints and the midpoints of their halves (17 points).
Obstruction visibility_line_obstructed(const Point& observer, const Polygon& blocker, const ObjectBounds& target);

bool does_fully_obstruct(const Vec3& performer_position, const ObjectBounds& target, const Polygon& blocker);
bool does_partly_obstruct(const Vec3& performer_position, const ObjectBounds& target, const Polygon& blocker);

// Footprint distance, 0 when the footprints intersect.
double bounds_distance(const ObjectBounds& a, const ObjectBounds& b);

}  // namespace scenegen
