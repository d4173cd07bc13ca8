#pragma once

#include <string>

#include "scenegen/definitions.hpp"

namespace scenegen {

// Base size of a catalog type; make_size_choice scales it uniformly.
struct BaseSize {
    Vec3 dimensions;
    double mass = 1.0;
    Vec3 offset;
    double position_y = 0.0;
    std::vector<EnclosedArea> enclosed_areas;
    std::optional<SidewaysVariant> sideways;
};

SizeChoice make_size_choice(const BaseSize& base, double multiplier);

// "tiny", "small", "medium", "large" or "huge".
std::string choose_size_text(const Vec3& dimensions);

// Unfinalized soccer ball, the retrieval target of every built-in plan list.
Definition create_soccer_ball(double size = 1.0);

// Finalized datasets, built once on first use.
const DefinitionDataset& pickupable_dataset();
const DefinitionDataset& container_dataset();
const DefinitionDataset& obstacle_occluder_dataset();

}  // namespace scenegen
