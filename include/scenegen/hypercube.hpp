#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

#include "scenegen/bounds.hpp"
#include "scenegen/object_data.hpp"
#include "scenegen/placement.hpp"
#include "scenegen/plans.hpp"
#include "scenegen/random.hpp"
#include "scenegen/result.hpp"
#include "scenegen/scene.hpp"

namespace scenegen {

// Small context object counts 0..10 and their weights.
const std::vector<double>& context_object_weights();

struct HypercubeOptions {
    // Whole-attempt retries, and placement retries within one attempt.
    int max_tries = kMaxTries;

    // 0 = silent, 1 = progress and failures, 2 = per-attempt debug.
    int log_level = 0;
    std::string log_prefix = "[hypercube]";

    bool context_objects = true;
    // Random 10..15 x 3..5 x 10..15 room when unset.
    std::optional<Vec3> room_dimensions;
};

// Shared mutable state of one generation attempt.
struct PlacementContext {
    Vec3 room_dimensions = kDefaultRoomDimensions;
    PerformerStart performer;
    BoundsList bounds;

    PlacementArea area() const { return PlacementArea{room_dimensions, performer}; }
};

// A performer start at least kPerformerWidth inside every wall, facing one of
// the valid rotations.
PerformerStart generate_performer_start(Rng& rng, const Vec3& room_dimensions);

// Family of interactive retrieval scenes sharing one room, one performer start
// and one set of object definitions, differing only as their plans say.
class InteractiveHypercube {
public:
    // Throws std::invalid_argument when the plans are empty, inconsistent, or
    // use location plans a role does not support.
    InteractiveHypercube(std::string name, std::vector<InteractivePlan> plan_list, HypercubeOptions options = {});

    // One scene per plan, sorted by scene id, or a kHypercube failure once
    // every attempt failed.
    Result<std::vector<Scene>> generate(Rng& rng);

    const std::string& name() const { return name_; }
    const std::vector<InteractivePlan>& plans() const { return plan_list_; }

private:
    using Status = Result<void>;
    using TargetLocations = std::map<LocationPlan, Location>;

    void initialize_object_data();
    void validate_object_plan() const;

    ObjectData& target() { return targets_.front(); }
    ObjectData* confusor() { return confusors_.empty() ? nullptr : &confusors_.front(); }
    // Target, confusor, obstacles and occluders.
    std::vector<ObjectData*> critical_object_data();
    // Every role in scene order: target, confusor, large and small
    // containers, obstacles, occluders.
    std::vector<ObjectData*> all_object_data();
    std::vector<const ObjectData*> all_object_data() const;

    void reset_attempt(Rng& rng);
    Status initialize_each_hypercube_object(Rng& rng);

    // Definition selection.
    Status choose_each_object_definition(Rng& rng);
    void assign_target_definition(Rng& rng);
    Status assign_confusor_definition(Rng& rng);
    Status assign_container_definition(ReceptacleData& container, bool find_invalid_container, Rng& rng);
    Result<Containment> choose_container_definition(
        ReceptacleData& container,
        const Definition* confusor_definition,
        const DefinitionDataset& dataset,
        bool find_invalid_container,
        bool untrained,
        Rng& rng
    );
    Status assign_obstacle_or_occluder_definition(
        ObjectData& object_data,
        const Definition& target_definition,
        bool is_occluder,
        Rng& rng
    );
    Result<Definition> choose_obstacle_or_occluder_definition(
        const Definition& target_definition,
        const DefinitionDataset& dataset,
        bool is_occluder,
        Rng& rng
    );

    // Anchored placement.
    void create_each_object_template(Rng& rng);
    Status assign_each_object_location(Rng& rng);
    Result<TargetLocations> assign_target_location(const Definition& target_definition, Rng& rng);
    Status assign_front_and_back_location(const Definition& target_definition, TargetLocations& locations, Rng& rng);
    Status assign_confusor_obstacle_occluder_location(
        const Definition& target_definition,
        const TargetLocations& locations,
        Rng& rng
    );
    Status assign_single_obstacle_occluder_location(
        ReceptacleData& object_data,
        const Definition& target_definition,
        const Location& target_location,
        const std::vector<int>& indexes,
        LocationPlan plan,
        InLineMode mode,
        Rng& rng
    );
    Status assign_container_location(Rng& rng);
    Status assign_object_location_inside_container();

    // Each generate_* accepts a location only once every variant of `placed`
    // (when given) passes fits_every_variant there.
    Result<Location> generate_close_to(
        const ObjectData* placed,
        const Definition& definition,
        const Definition& existing_definition,
        const Location& existing_location,
        InLineMode mode,
        Rng& rng
    );
    Result<Location> generate_far_from(
        const ObjectData& placed,
        const Definition& definition,
        const Location& existing_location,
        Rng& rng
    );
    // Random location facing the performer's rotation. With target locations,
    // it must neither fully obstruct (nor be fully obstructed by) any placed
    // object, nor partly obstruct any of the target locations.
    Result<Location> generate_random_location(
        const ObjectData& placed,
        const Definition& definition,
        Rng& rng,
        const std::vector<Location>* target_locations = nullptr,
        const Definition* second_definition = nullptr
    );
    Status generate_front_and_back(
        const Definition& definition,
        const std::vector<const ObjectData*>& placed,
        Location& front,
        Location& back,
        Rng& rng
    );
    // Every trained and untrained rectangle of `placed` at `location` is in
    // the room and clear of the performer and of every placed bounds.
    bool fits_every_variant(const std::vector<const ObjectData*>& placed, const Location& location) const;

    // Commit.
    Status initialize_context_objects(Rng& rng);
    Scene build_scene(size_t scene_index) const;
    Status update_floor_and_walls(std::vector<Scene>& scenes, Rng& rng) const;

    void extend_bounds(const BoundsList& bounds);
    void log(int level, const std::string& message) const;
    void log_object_data(const ObjectData& object_data) const;

    std::string name_;
    std::vector<InteractivePlan> plan_list_;
    HypercubeOptions options_;

    std::vector<ObjectData> targets_;
    std::vector<ObjectData> confusors_;
    std::vector<ReceptacleData> large_containers_;
    std::vector<ReceptacleData> obstacles_;
    std::vector<ReceptacleData> occluders_;
    std::vector<ReceptacleData> small_containers_;

    PlacementContext context_;
    std::vector<Instance> context_object_list_;
    std::string hypercube_id_;
    std::string floor_material_;
    std::vector<std::string> floor_colors_;
    std::string wall_material_;
    std::vector<std::string> wall_colors_;
};

// "retrieval" plus the plan family ("retrieval container").
std::string hypercube_name(HypercubeType type);

InteractiveHypercube make_hypercube(HypercubeType type, HypercubeOptions options = {});

}  // namespace scenegen
