#pragma once

#include <functional>
#include <optional>

#include "scenegen/bounds.hpp"
#include "scenegen/definitions.hpp"
#include "scenegen/random.hpp"

namespace scenegen {

// Shared inputs of every placement search.
struct PlacementArea {
    Vec3 room_dimensions = kDefaultRoomDimensions;
    PerformerStart performer;
};

struct RandomPlacementOptions {
    // Added to the definition's base rotation; a random valid rotation when unset.
    std::optional<double> rotation_y;
    int max_tries = kMaxTries;
};

using PositionFn = std::function<std::optional<Point>()>;
using RotationFn = std::function<double()>;

// Bounded sampling loop behind every placement policy. On success the new
// rectangle is appended to `bounds_list`.
std::optional<Location> calc_obj_pos(
    const PlacementArea& area,
    const Definition& def,
    BoundsList& bounds_list,
    const PositionFn& position_fn,
    const RotationFn& rotation_fn,
    int max_tries = kMaxTries
);

// Uniform position anywhere in the room.
std::optional<Location> random_location(
    Rng& rng,
    const PlacementArea& area,
    const Definition& def,
    BoundsList& bounds_list,
    const RandomPlacementOptions& options = {}
);

// On the performer's line of sight, at least 1.25 ahead. Validated against the
// performer only.
std::optional<Location> location_in_front_of_performer(Rng& rng, const PlacementArea& area, const Definition& def);

// Somewhere in the half of the room behind the performer.
std::optional<Location> location_in_back_of_performer(Rng& rng, const PlacementArea& area, const Definition& def);

enum class InLineMode {
    kClose,        // in front of the anchor, facing the performer
    kAdjacent,     // beside the anchor, perpendicular to the sight line
    kBehind,       // on the far side of the anchor from the performer
    kObstruct,     // between, and hiding the anchor from the performer
    kUnreachable,  // between, and blocking the reach to the anchor
};

// Steps along rays from the anchor's center. Reads `bounds_list` but never
// appends to it.
std::optional<Location> location_in_line_with_object(
    Rng& rng,
    const PlacementArea& area,
    const Definition& def,
    const Definition& static_def,
    const Location& static_location,
    const BoundsList& bounds_list,
    InLineMode mode
);

// Random placement (on scratch copies) until more than 2.0 away from `anchor`.
std::optional<Location> location_far_from(
    Rng& rng,
    const PlacementArea& area,
    const Definition& def,
    const ObjectBounds& anchor,
    BoundsList& bounds_list
);

}  // namespace scenegen
