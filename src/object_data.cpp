#include "scenegen/object_data.hpp"

#include <algorithm>
#include <stdexcept>

namespace scenegen {
namespace {

Instance make_template(const Definition& def, Rng& rng) {
    Location origin;
    origin.position = Vec3{0.0, def.position_y, 0.0};
    origin.rotation = def.rotation;
    origin.bounds = create_bounds(def.dimensions, def.offset, origin.position, origin.rotation, def.position_y);
    return instantiate_object(def, origin, rng);
}

}  // namespace

const Definition* identify_larger_definition(const Definition* one, const Definition* two) {
    if (!one) {
        return two;
    }
    if (!two) {
        return one;
    }
    const double one_area = one->dimensions.x * one->dimensions.z;
    const double two_area = two->dimensions.x * two->dimensions.z;
    return one_area >= two_area ? one : two;
}

ObjectData::ObjectData(std::string role_name, const ObjectPlan& object_plan)
    : role(std::move(role_name)),
      location_plan_list{object_plan.location},
      untrained_plan_list{object_plan.untrained},
      original_definition(object_plan.definition),
      trained_definition(object_plan.definition),
      untrained_definition(object_plan.definition),
      instance_list(1) {}

void ObjectData::append_object_plan(const ObjectPlan& object_plan) {
    location_plan_list.push_back(object_plan.location);
    untrained_plan_list.push_back(object_plan.untrained);
    instance_list.emplace_back();
}

BoundsList ObjectData::assign_location(
    const Location& location,
    LocationPlan plan,
    const std::optional<std::vector<int>>& indexes
) {
    if (!trained_template || !trained_definition) {
        throw std::invalid_argument("ObjectData::assign_location: " + role + " has no trained template");
    }
    Instance trained = *trained_template;
    move_to_location(trained, location, *trained_definition);

    std::optional<Instance> untrained;
    if (untrained_template && untrained_definition) {
        untrained = *untrained_template;
        move_to_location(*untrained, location, *untrained_definition);
    }

    bool trained_needed = false;
    bool untrained_needed = false;
    for (size_t i = 0; i < location_plan_list.size(); ++i) {
        if (location_plan_list[i] != plan) {
            continue;
        }
        if (indexes && std::find(indexes->begin(), indexes->end(), static_cast<int>(i)) == indexes->end()) {
            continue;
        }
        if (untrained_plan_list[i]) {
            if (!untrained) {
                throw std::invalid_argument(
                    "ObjectData::assign_location: " + role + " has no untrained template for scene " +
                    std::to_string(i)
                );
            }
            instance_list[i] = *untrained;
            untrained_needed = true;
        } else {
            instance_list[i] = trained;
            trained_needed = true;
        }
    }

    BoundsList out;
    if (trained_needed) {
        out.push_back(trained.bounds);
    }
    if (untrained_needed) {
        out.push_back(untrained->bounds);
    }
    return out;
}

BoundsList ObjectData::variant_bounds(const Location& location) const {
    BoundsList out;
    if (trained_template && trained_definition) {
        Instance trained = *trained_template;
        move_to_location(trained, location, *trained_definition);
        out.push_back(trained.bounds);
    }
    if (untrained_template && untrained_definition) {
        Instance untrained = *untrained_template;
        move_to_location(untrained, location, *untrained_definition);
        out.push_back(untrained.bounds);
    }
    return out;
}

BoundsList ObjectData::assign_location_front(const Location& location) {
    return assign_location(location, LocationPlan::kFront, std::nullopt);
}

BoundsList ObjectData::assign_location_back(const Location& location) {
    return assign_location(location, LocationPlan::kBack, std::nullopt);
}

BoundsList ObjectData::assign_location_random(const Location& location) {
    return assign_location(location, LocationPlan::kRandom, std::nullopt);
}

BoundsList ObjectData::assign_location_between(const Location& location, const std::vector<int>& indexes) {
    return assign_location(location, LocationPlan::kBetween, indexes);
}

BoundsList ObjectData::assign_location_close(const Location& location, const std::optional<std::vector<int>>& indexes) {
    return assign_location(location, LocationPlan::kClose, indexes);
}

BoundsList ObjectData::assign_location_far(const Location& location, const std::vector<int>& indexes) {
    return assign_location(location, LocationPlan::kFar, indexes);
}

bool ObjectData::uses(LocationPlan plan) const {
    return std::find(location_plan_list.begin(), location_plan_list.end(), plan) != location_plan_list.end();
}

std::vector<ObjectData::ContainedIndex> ObjectData::contained_indexes(const ObjectData* second) const {
    std::vector<ContainedIndex> out;
    for (size_t i = 0; i < location_plan_list.size(); ++i) {
        if (location_plan_list[i] != LocationPlan::kInside0) {
            continue;
        }
        const bool together = second && second->location_plan_list[i] == LocationPlan::kInside0;
        out.push_back(ContainedIndex{static_cast<int>(i), together});
    }
    return out;
}

bool ObjectData::containerize_with(const ObjectData* other) const {
    if (!other) {
        return false;
    }
    for (size_t i = 0; i < location_plan_list.size(); ++i) {
        if (location_plan_list[i] == LocationPlan::kInside0 && other->location_plan_list[i] == LocationPlan::kInside0) {
            return true;
        }
    }
    return false;
}

std::vector<std::pair<LocationPlan, std::vector<int>>> ObjectData::locations_with_indexes(
    const std::vector<ReceptacleData>& containers
) const {
    std::vector<std::pair<LocationPlan, std::vector<int>>> out;
    for (size_t i = 0; i < location_plan_list.size(); ++i) {
        LocationPlan distinct = location_plan_list[i];
        if (distinct == LocationPlan::kInside0) {
            if (containers.empty()) {
                throw std::invalid_argument("ObjectData::locations_with_indexes: " + role + " is inside a missing container");
            }
            distinct = containers.front().location_plan_list[i];
        }
        auto it = std::find_if(out.begin(), out.end(), [distinct](const auto& kv) { return kv.first == distinct; });
        if (it == out.end()) {
            out.emplace_back(distinct, std::vector<int>{static_cast<int>(i)});
        } else {
            it->second.push_back(static_cast<int>(i));
        }
    }
    return out;
}

const Definition& ObjectData::larger_definition() const {
    if (!trained_definition) {
        throw std::invalid_argument("ObjectData::larger_definition: " + role + " has no definition yet");
    }
    if (!untrained_definition) {
        return *trained_definition;
    }
    return *identify_larger_definition(&*trained_definition, &*untrained_definition);
}

const Definition& ObjectData::larger_definition_of(
    const std::vector<ReceptacleData>& containers,
    const ObjectData* second
) const {
    const bool second_close_and_inside = second && second->is_close() && second->is_inside();

    // Both in the same container (assumed to be container 0).
    if (is_inside() || second_close_and_inside) {
        if (containers.empty()) {
            throw std::invalid_argument("ObjectData::larger_definition_of: " + role + " is inside a missing container");
        }
        return containers.front().larger_definition();
    }

    // Next to one another.
    if (second && second->is_close()) {
        return *identify_larger_definition(&larger_definition(), &second->larger_definition());
    }
    return larger_definition();
}

void ObjectData::recreate_both_templates(Rng& rng) {
    trained_template.reset();
    untrained_template.reset();
    if (trained_definition) {
        trained_template = make_template(*trained_definition, rng);
    }
    if (untrained_definition) {
        untrained_template = make_template(*untrained_definition, rng);
        if (trained_template) {
            untrained_template->id = trained_template->id;
        }
    }
}

void ObjectData::reset_all_instances() {
    for (auto& instance : instance_list) {
        instance.reset();
    }
}

void ObjectData::reset_all_properties() {
    trained_definition = original_definition;
    untrained_definition = original_definition;
    trained_template.reset();
    untrained_template.reset();
    reset_all_instances();
}

}  // namespace scenegen
