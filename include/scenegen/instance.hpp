#pragma once

#include <optional>
#include <string>
#include <vector>

#include "scenegen/bounds.hpp"
#include "scenegen/definitions.hpp"
#include "scenegen/random.hpp"

namespace scenegen {

// A definition materialized at one location in one scene.
struct Instance {
    std::string id;
    std::string type;
    std::string role;

    Vec3 position;
    Vec3 rotation;
    Vec3 scale{1.0, 1.0, 1.0};
    // Room coordinates, except for a child with a location_parent: then the
    // position and bounds are relative to the parent's enclosed area.
    ObjectBounds bounds;

    double mass = 1.0;
    std::vector<std::string> attributes;
    std::vector<std::string> materials;
    std::vector<std::string> salient_materials;

    Vec3 dimensions;
    Vec3 offset;
    double position_y = 0.0;
    Vec3 original_rotation;
    std::vector<EnclosedArea> enclosed_areas;
    std::vector<std::string> color;
    std::vector<std::string> shape;
    std::string size;
    std::string weight;
    std::string goal_string;
    bool untrained_category = false;
    bool untrained_color = false;
    bool untrained_combination = false;
    bool untrained_shape = false;
    bool untrained_size = false;

    std::optional<std::string> location_parent;
    std::optional<int> parent_area;
    std::vector<std::string> is_parent_of;
    std::optional<bool> can_contain_target;

    bool any_untrained() const {
        return untrained_category || untrained_color || untrained_combination || untrained_shape || untrained_size;
    }
};

// Random version-4 style identifier.
std::string make_object_id(Rng& rng);

// Throws std::invalid_argument when the definition is not finalized.
Instance instantiate_object(const Definition& def, const Location& location, Rng& rng);

// Moves the instance so its footprint sits where `location_def` was placed.
void move_to_location(Instance& instance, const Location& location, const Definition& location_def);

}  // namespace scenegen
