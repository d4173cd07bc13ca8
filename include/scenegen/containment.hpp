#pragma once

#include <optional>

#include "scenegen/definitions.hpp"
#include "scenegen/instance.hpp"

namespace scenegen {

enum class Orientation { kSideBySide, kFrontToBack };

struct ContainFit {
    int area_index = 0;
    std::optional<double> angle_a;
    std::optional<double> angle_b;
};

struct ContainBothFit {
    int area_index = 0;
    double angle_a = 0.0;
    double angle_b = 0.0;
    Orientation orientation = Orientation::kSideBySide;
};

// 0 when the target fits as is, 90 when it fits turned, nullopt otherwise.
std::optional<double> can_enclose(const EnclosedArea& area, const Definition& target);

// First area where each non-null target fits on its own. Null targets get no
// angle and always fit.
std::optional<ContainFit> can_contain(
    const Definition& container,
    const Definition* target_a,
    const Definition* target_b = nullptr
);

// First area where both targets fit together, side by side or front to back.
std::optional<ContainBothFit> can_contain_both(
    const Definition& container,
    const Definition& target_a,
    const Definition& target_b
);

// Puts the instance at the floor of the container's area. Rotation, when
// given, must be 0 or 90.
void put_object_in_container(
    Instance& instance,
    Instance& container,
    int area_index,
    std::optional<double> rotation = std::nullopt
);

// Throws std::invalid_argument unless both rotations are 0 or 90.
void put_objects_in_container(
    Instance& object_a,
    Instance& object_b,
    Instance& container,
    int area_index,
    Orientation orientation,
    double rotation_a,
    double rotation_b
);

}  // namespace scenegen
