#pragma once

#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "scenegen/definitions.hpp"

namespace scenegen {

enum class LocationPlan {
    kFront,    // in front of the performer
    kBack,     // in back of the performer
    kClose,    // confusor: beside the target; target: by container 0; obstacle/occluder: behind the target
    kFar,      // far away from the target
    kBetween,  // between the performer and the target
    kRandom,   // anywhere in the room
    kInside0,  // inside the large container at index 0
    kNone,     // not in the scene
};

const char* location_plan_name(LocationPlan plan);

struct ObjectPlan {
    LocationPlan location = LocationPlan::kNone;
    bool untrained = false;
    // Fixed definition for the role, usually unset.
    std::optional<Definition> definition;
};

// Slice tag keys, in the camelCase form written to the scene info.
namespace slice_tag {
constexpr const char* kContainersLarge = "largeContainers";
constexpr const char* kContainersSmall = "smallContainers";
constexpr const char* kContainersTrained = "containersTrained";
constexpr const char* kObstacleBetween = "obstacleBetween";
constexpr const char* kObstacleTrained = "obstacleTrained";
constexpr const char* kOccluders = "occluders";
constexpr const char* kOccludersTrained = "occludersTrained";
constexpr const char* kTargetBehind = "targetBehind";
constexpr const char* kTargetHidden = "targetHidden";
constexpr const char* kTargetInside = "targetInside";
}  // namespace slice_tag

// Insertion-ordered tag -> value pairs.
using SliceTags = std::vector<std::pair<std::string, std::string>>;

// Setup of a single scene in an interactive hypercube.
struct InteractivePlan {
    std::string scene_id;
    SliceTags slice_tags;
    ObjectPlan target_plan;
    std::vector<ObjectPlan> confusor_plan_list;  // zero or one
    std::vector<ObjectPlan> large_container_plan_list;
    std::vector<ObjectPlan> obstacle_plan_list;
    std::vector<ObjectPlan> occluder_plan_list;
    std::vector<ObjectPlan> small_container_plan_list;

    // Replaces the value of an existing tag, or appends a new one.
    void set_slice_tag(const std::string& tag, const std::string& value);
    const std::string* slice_tag(const std::string& tag) const;
    bool any_untrained() const;
};

enum class HypercubeType { kSingle, kContainer, kContainerEval, kObstacle, kOccluder };

const char* hypercube_type_name(HypercubeType type);
// Accepts "single", "container", "container-eval", "obstacle" or "occluder".
// Throws std::invalid_argument otherwise.
HypercubeType parse_hypercube_type(const std::string& name);

// Plan lists, sorted by scene id.
std::vector<InteractivePlan> create_single_plan_list();
std::vector<InteractivePlan> create_container_plan_list();
std::vector<InteractivePlan> create_container_eval_plan_list();
std::vector<InteractivePlan> create_obstacle_plan_list();
std::vector<InteractivePlan> create_occluder_plan_list();
std::vector<InteractivePlan> create_plan_list(HypercubeType type);

// Finalized soccer ball used as the target of every built-in plan list.
Definition soccer_ball_target();

// "targetInside" -> "target inside".
std::string tag_to_label(const std::string& tag);

}  // namespace scenegen
