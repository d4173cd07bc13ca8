#include "scenegen/plans.hpp"

#include <cctype>
#include <cstring>
#include <map>
#include <stdexcept>

#include "scenegen/catalog.hpp"

namespace scenegen {
namespace {

constexpr const char* kYes = "yes";
constexpr const char* kNo = "no";

bool one_of(char c, const char* letters) {
    return std::strchr(letters, c) != nullptr;
}

ObjectPlan plan(LocationPlan location) {
    ObjectPlan out;
    out.location = location;
    return out;
}

ObjectPlan target_plan(LocationPlan location) {
    ObjectPlan out = plan(location);
    out.definition = soccer_ball_target();
    return out;
}

std::vector<InteractivePlan> sorted_values(std::map<std::string, InteractivePlan>& plans) {
    std::vector<InteractivePlan> out;
    out.reserve(plans.size());
    for (auto& kv : plans) {
        out.push_back(std::move(kv.second));
    }
    return out;
}

// Shared layout of the training and evaluation container lists.
std::vector<InteractivePlan> container_plans(const char* letters, const char* close_letters, bool with_small_containers) {
    std::map<std::string, InteractivePlan> plans;
    for (const char* p = letters; *p; ++p) {
        for (const char j : {'1', '2'}) {
            InteractivePlan scene;
            scene.scene_id = std::string(1, *p) + j;
            scene.set_slice_tag(slice_tag::kContainersLarge, "1");
            scene.set_slice_tag(slice_tag::kContainersSmall, "0");
            scene.set_slice_tag(slice_tag::kContainersTrained, kYes);
            scene.set_slice_tag(slice_tag::kTargetInside, kYes);
            scene.target_plan = target_plan(LocationPlan::kInside0);
            scene.large_container_plan_list = {
                plan(LocationPlan::kRandom),
                plan(LocationPlan::kNone),
                plan(LocationPlan::kNone),
            };
            if (with_small_containers) {
                scene.small_container_plan_list = {plan(LocationPlan::kNone), plan(LocationPlan::kNone)};
            }
            plans[scene.scene_id] = std::move(scene);
        }
    }

    for (auto& kv : plans) {
        InteractivePlan& scene = kv.second;
        const char i = scene.scene_id[0];
        const bool untrained = scene.scene_id[1] == '2';

        // Target next to the container instead of inside it.
        if (one_of(i, close_letters)) {
            scene.target_plan.location = LocationPlan::kClose;
            scene.set_slice_tag(slice_tag::kTargetInside, kNo);
        }

        // One or two more large containers anywhere in the room.
        if (one_of(i, "abcdefghijkl")) {
            scene.large_container_plan_list[1].location = LocationPlan::kRandom;
            if (one_of(i, "abcdef")) {
                scene.large_container_plan_list[2].location = LocationPlan::kRandom;
                scene.set_slice_tag(slice_tag::kContainersLarge, "3");
            } else {
                scene.set_slice_tag(slice_tag::kContainersLarge, "2");
            }
        }

        // One or two small containers anywhere in the room.
        if (with_small_containers && one_of(i, "bcefhiklnoqr")) {
            scene.small_container_plan_list[0].location = LocationPlan::kRandom;
            if (one_of(i, "cfilor")) {
                scene.small_container_plan_list[1].location = LocationPlan::kRandom;
                scene.set_slice_tag(slice_tag::kContainersSmall, "2");
            } else {
                scene.set_slice_tag(slice_tag::kContainersSmall, "1");
            }
        }

        if (untrained) {
            for (ObjectPlan& container : scene.large_container_plan_list) {
                container.untrained = true;
            }
            for (ObjectPlan& container : scene.small_container_plan_list) {
                container.untrained = true;
            }
            scene.set_slice_tag(slice_tag::kContainersTrained, kNo);
        }
    }
    return sorted_values(plans);
}

}  // namespace

const char* location_plan_name(LocationPlan plan) {
    switch (plan) {
        case LocationPlan::kFront:
            return "front";
        case LocationPlan::kBack:
            return "back";
        case LocationPlan::kClose:
            return "close";
        case LocationPlan::kFar:
            return "far";
        case LocationPlan::kBetween:
            return "between";
        case LocationPlan::kRandom:
            return "random";
        case LocationPlan::kInside0:
            return "inside_0";
        case LocationPlan::kNone:
            return "none";
    }
    return "unknown";
}

void InteractivePlan::set_slice_tag(const std::string& tag, const std::string& value) {
    for (auto& kv : slice_tags) {
        if (kv.first == tag) {
            kv.second = value;
            return;
        }
    }
    slice_tags.emplace_back(tag, value);
}

const std::string* InteractivePlan::slice_tag(const std::string& tag) const {
    for (const auto& kv : slice_tags) {
        if (kv.first == tag) {
            return &kv.second;
        }
    }
    return nullptr;
}

bool InteractivePlan::any_untrained() const {
    if (target_plan.untrained) {
        return true;
    }
    for (const auto* list : {&confusor_plan_list, &large_container_plan_list, &obstacle_plan_list,
                             &occluder_plan_list, &small_container_plan_list}) {
        for (const ObjectPlan& object_plan : *list) {
            if (object_plan.untrained) {
                return true;
            }
        }
    }
    return false;
}

const char* hypercube_type_name(HypercubeType type) {
    switch (type) {
        case HypercubeType::kSingle:
            return "single";
        case HypercubeType::kContainer:
            return "container";
        case HypercubeType::kContainerEval:
            return "container-eval";
        case HypercubeType::kObstacle:
            return "obstacle";
        case HypercubeType::kOccluder:
            return "occluder";
    }
    return "unknown";
}

HypercubeType parse_hypercube_type(const std::string& name) {
    for (HypercubeType type : {HypercubeType::kSingle, HypercubeType::kContainer, HypercubeType::kContainerEval,
                               HypercubeType::kObstacle, HypercubeType::kOccluder}) {
        if (name == hypercube_type_name(type)) {
            return type;
        }
    }
    throw std::invalid_argument("parse_hypercube_type: unknown hypercube type " + name);
}

Definition soccer_ball_target() {
    static const Definition ball = finalize_each_choice(create_soccer_ball()).front();
    return ball;
}

std::vector<InteractivePlan> create_single_plan_list() {
    InteractivePlan scene;
    scene.target_plan = target_plan(LocationPlan::kRandom);
    return {scene};
}

std::vector<InteractivePlan> create_container_plan_list() {
    return container_plans("abcdefghijklmnopqr", "defjklpqr", true);
}

std::vector<InteractivePlan> create_container_eval_plan_list() {
    return container_plans("adgjmp", "djp", false);
}

std::vector<InteractivePlan> create_obstacle_plan_list() {
    std::map<std::string, InteractivePlan> plans;
    for (const char i : {'a', 'b', 'c', 'd'}) {
        for (const char j : {'1', '2'}) {
            InteractivePlan scene;
            scene.scene_id = std::string(1, i) + j;
            scene.set_slice_tag(slice_tag::kObstacleBetween, kYes);
            scene.set_slice_tag(slice_tag::kObstacleTrained, kYes);
            scene.set_slice_tag(slice_tag::kTargetBehind, kYes);
            scene.target_plan = target_plan(LocationPlan::kBack);
            scene.obstacle_plan_list = {plan(LocationPlan::kBetween)};

            if (one_of(i, "cd")) {
                scene.target_plan.location = LocationPlan::kFront;
                scene.set_slice_tag(slice_tag::kTargetBehind, kNo);
            }
            if (one_of(i, "bd")) {
                scene.obstacle_plan_list[0].location = LocationPlan::kClose;
                scene.set_slice_tag(slice_tag::kObstacleBetween, kNo);
            }
            if (j == '2') {
                scene.obstacle_plan_list[0].untrained = true;
                scene.set_slice_tag(slice_tag::kObstacleTrained, kNo);
            }
            plans[scene.scene_id] = std::move(scene);
        }
    }
    return sorted_values(plans);
}

std::vector<InteractivePlan> create_occluder_plan_list() {
    std::map<std::string, InteractivePlan> plans;
    for (const char i : std::string("abcdefghijkl")) {
        for (const char j : {'1', '2'}) {
            InteractivePlan scene;
            scene.scene_id = std::string(1, i) + j;
            scene.set_slice_tag(slice_tag::kOccluders, "1");
            scene.set_slice_tag(slice_tag::kOccludersTrained, kYes);
            scene.set_slice_tag(slice_tag::kTargetBehind, kYes);
            scene.set_slice_tag(slice_tag::kTargetHidden, kYes);
            scene.target_plan = target_plan(LocationPlan::kBack);
            scene.occluder_plan_list = {
                plan(LocationPlan::kBetween),
                plan(LocationPlan::kNone),
                plan(LocationPlan::kNone),
            };

            if (one_of(i, "cdghkl")) {
                scene.target_plan.location = LocationPlan::kFront;
                scene.set_slice_tag(slice_tag::kTargetBehind, kNo);
            }
            // Main occluder behind the target, so the target stays visible.
            if (one_of(i, "bdfhjl")) {
                scene.occluder_plan_list[0].location = LocationPlan::kClose;
                scene.set_slice_tag(slice_tag::kTargetHidden, kNo);
            }
            if (one_of(i, "abcdefgh")) {
                scene.occluder_plan_list[1].location = LocationPlan::kRandom;
                if (one_of(i, "abcd")) {
                    scene.occluder_plan_list[2].location = LocationPlan::kRandom;
                    scene.set_slice_tag(slice_tag::kOccluders, "3");
                } else {
                    scene.set_slice_tag(slice_tag::kOccluders, "2");
                }
            }
            if (j == '2') {
                for (ObjectPlan& occluder : scene.occluder_plan_list) {
                    occluder.untrained = true;
                }
                scene.set_slice_tag(slice_tag::kOccludersTrained, kNo);
            }
            plans[scene.scene_id] = std::move(scene);
        }
    }
    return sorted_values(plans);
}

std::vector<InteractivePlan> create_plan_list(HypercubeType type) {
    switch (type) {
        case HypercubeType::kSingle:
            return create_single_plan_list();
        case HypercubeType::kContainer:
            return create_container_plan_list();
        case HypercubeType::kContainerEval:
            return create_container_eval_plan_list();
        case HypercubeType::kObstacle:
            return create_obstacle_plan_list();
        case HypercubeType::kOccluder:
            return create_occluder_plan_list();
    }
    throw std::invalid_argument("create_plan_list: unknown hypercube type");
}

std::string tag_to_label(const std::string& tag) {
    std::string out;
    out.reserve(tag.size() + 4);
    for (size_t i = 0; i < tag.size(); ++i) {
        const unsigned char c = static_cast<unsigned char>(tag[i]);
        if (i > 0 && std::isupper(c)) {
            out.push_back(' ');
        }
        out.push_back(static_cast<char>(std::tolower(c)));
    }
    return out;
}

}  // namespace scenegen
