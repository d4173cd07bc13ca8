#pragma once

#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "scenegen/containment.hpp"
#include "scenegen/instance.hpp"
#include "scenegen/plans.hpp"

namespace scenegen {

// Definition with the larger x by z footprint; either may be null. It may not
// cover the other footprint when one is wider and the other deeper.
const Definition* identify_larger_definition(const Definition* one, const Definition* two);

struct ReceptacleData;

// Plans, definitions and per-scene instances of one object across every scene
// of a hypercube.
struct ObjectData {
    ObjectData(std::string role_name, const ObjectPlan& object_plan);

    std::string role;
    // One entry per scene.
    std::vector<LocationPlan> location_plan_list;
    std::vector<bool> untrained_plan_list;

    // Fixed by the plan, usually unset.
    std::optional<Definition> original_definition;
    std::optional<Definition> trained_definition;
    std::optional<Definition> untrained_definition;

    // Instances not yet tied to a scene or a final location.
    std::optional<Instance> trained_template;
    std::optional<Instance> untrained_template;

    std::vector<std::optional<Instance>> instance_list;

    void append_object_plan(const ObjectPlan& object_plan);
    size_t scene_count() const { return location_plan_list.size(); }

    // Each assign_location_* copies the matching template to `location` for
    // every scene using that plan (limited to `indexes` when given) and returns
    // the bounds of the copies that were used.
    BoundsList assign_location_front(const Location& location);
    BoundsList assign_location_back(const Location& location);
    BoundsList assign_location_random(const Location& location);
    BoundsList assign_location_between(const Location& location, const std::vector<int>& indexes);
    BoundsList assign_location_close(const Location& location, const std::optional<std::vector<int>>& indexes);
    BoundsList assign_location_far(const Location& location, const std::vector<int>& indexes);

    // Bounds each template would take at `location`, trained first.
    BoundsList variant_bounds(const Location& location) const;

    bool uses(LocationPlan plan) const;
    bool is_front() const { return uses(LocationPlan::kFront); }
    bool is_back() const { return uses(LocationPlan::kBack); }
    bool is_close() const { return uses(LocationPlan::kClose); }
    bool is_random() const { return uses(LocationPlan::kRandom); }
    bool is_inside() const { return uses(LocationPlan::kInside0); }

    struct ContainedIndex {
        int scene_index = 0;
        // The second object shares the container in this scene.
        bool with_second = false;
    };
    // Scenes in which this object is inside container 0.
    std::vector<ContainedIndex> contained_indexes(const ObjectData* second) const;

    // True when this object and `other` are ever inside the same container in
    // the same scene.
    bool containerize_with(const ObjectData* other) const;

    // Distinct location plans (INSIDE_0 resolved to container 0's plan) with
    // the scenes using each, in first-use order.
    std::vector<std::pair<LocationPlan, std::vector<int>>> locations_with_indexes(
        const std::vector<ReceptacleData>& containers
    ) const;

    // Larger of the trained and untrained definitions. Throws
    // std::invalid_argument before a definition is chosen.
    const Definition& larger_definition() const;

    // Larger footprint that must be reserved for this object: its container's
    // when it (or a close second object) is ever contained, the larger of the
    // two objects when the second is close, and its own otherwise.
    const Definition& larger_definition_of(
        const std::vector<ReceptacleData>& containers,
        const ObjectData* second
    ) const;

    // Both templates share one id.
    void recreate_both_templates(Rng& rng);
    void reset_all_instances();
    // Definitions back to the plan's, templates and instances cleared.
    void reset_all_properties();

private:
    BoundsList assign_location(
        const Location& location,
        LocationPlan plan,
        const std::optional<std::vector<int>>& indexes
    );
};

// Where the target (and confusor) go inside a receptacle.
struct Containment {
    int area_index = 0;
    std::optional<Orientation> orientation;
    std::optional<double> target_angle;
    std::optional<double> confusor_angle;
};

// Anything that may hold objects: containers, obstacles and occluders.
struct ReceptacleData : ObjectData {
    using ObjectData::ObjectData;

    Containment trained_containment;
    Containment untrained_containment;

    const Containment& containment_for_scene(size_t scene_index) const {
        return untrained_plan_list[scene_index] ? untrained_containment : trained_containment;
    }
};

}  // namespace scenegen
