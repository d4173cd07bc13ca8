#pragma once

#include <string>
#include <utility>
#include <vector>

#include "scenegen/bounds.hpp"
#include "scenegen/instance.hpp"
#include "scenegen/plans.hpp"

namespace scenegen {

namespace role {
constexpr const char* kTarget = "target";
constexpr const char* kConfusor = "confusor";
constexpr const char* kContainer = "container";
constexpr const char* kContext = "context";
constexpr const char* kObstacle = "obstacle";
constexpr const char* kOccluder = "occluder";
}  // namespace role

// Roles in the order objects are listed in a scene.
const std::vector<std::string>& scene_roles();

struct SceneGoal {
    std::string category = "retrieval";
    std::string description;
    int last_step = 0;
    std::string target_id;
    // Upper-cased scene plan id ("A1"), empty for single-scene hypercubes.
    std::string scene_id;
    SliceTags slice_tags;
    // "<tag label> <value>" per slice tag.
    std::vector<std::string> slices;
    // Object count per role, in scene_roles() order.
    std::vector<std::pair<std::string, int>> role_counts;
};

struct Scene {
    std::string name;
    std::string hypercube_name;
    std::string hypercube_id;
    Vec3 room_dimensions = kDefaultRoomDimensions;
    PerformerStart performer_start;
    std::string floor_material;
    std::vector<std::string> floor_colors;
    std::string wall_material;
    std::vector<std::string> wall_colors;
    // True when any object plan of the scene is untrained.
    bool evaluation_only = false;
    SceneGoal goal;
    std::vector<Instance> objects;
};

// Step budget: twice around the room in 0.1 steps plus room to turn, times 5.
int step_limit_from_dimensions(double room_x, double room_z);

const Instance* find_object(const Scene& scene, const std::string& id);
std::vector<const Instance*> objects_with_role(const Scene& scene, const std::string& role_name);

}  // namespace scenegen
