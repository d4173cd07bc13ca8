#include "scenegen/hypercube.hpp"

#include <algorithm>
#include <cctype>
#include <iostream>
#include <set>
#include <sstream>
#include <stdexcept>

#include "scenegen/catalog.hpp"
#include "scenegen/logging.hpp"
#include "scenegen/materials.hpp"

namespace scenegen {
namespace {

constexpr const char* kDefaultLogPrefix = "[hypercube]";

std::string upper(std::string s) {
    for (char& c : s) {
        c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    }
    return s;
}

std::string describe(const Vec3& v) {
    std::ostringstream out;
    out << "(" << v.x << ", " << v.y << ", " << v.z << ")";
    return out.str();
}

const char* in_line_mode_name(InLineMode mode) {
    switch (mode) {
        case InLineMode::kClose:
            return "close";
        case InLineMode::kAdjacent:
            return "adjacent";
        case InLineMode::kBehind:
            return "behind";
        case InLineMode::kObstruct:
            return "obstruct";
        case InLineMode::kUnreachable:
            return "unreachable";
    }
    return "unknown";
}

template <typename Data>
void append_plans(
    std::vector<Data>& data_list,
    const std::vector<ObjectPlan>& plans,
    const char* role_name,
    size_t scene_index
) {
    if (scene_index == 0) {
        for (const auto& plan : plans) {
            data_list.emplace_back(role_name, plan);
        }
        return;
    }
    if (plans.size() != data_list.size()) {
        throw std::invalid_argument(
            "InteractiveHypercube: scene " + std::to_string(scene_index) + " has " + std::to_string(plans.size()) +
            " " + role_name + " plans, expected " + std::to_string(data_list.size())
        );
    }
    for (size_t j = 0; j < plans.size(); ++j) {
        data_list[j].append_object_plan(plans[j]);
    }
}

// Role must not use any of `forbidden` in any scene.
void check_plans(const ObjectData& data, const std::vector<LocationPlan>& forbidden) {
    for (const LocationPlan plan : forbidden) {
        if (data.uses(plan)) {
            throw std::invalid_argument(
                "InteractiveHypercube: " + data.role + " cannot have location plan " + location_plan_name(plan)
            );
        }
    }
}

bool uses_in(const ObjectData& data, LocationPlan plan, const std::vector<int>& indexes) {
    for (const int i : indexes) {
        if (data.location_plan_list[static_cast<size_t>(i)] == plan) {
            return true;
        }
    }
    return false;
}

bool any_of_flags(const std::vector<bool>& flags) {
    return std::find(flags.begin(), flags.end(), true) != flags.end();
}

}  // namespace

const std::vector<double>& context_object_weights() {
    static const std::vector<double> weights{5, 5, 10, 10, 12.5, 15, 12.5, 10, 10, 5, 5};
    return weights;
}

PerformerStart generate_performer_start(Rng& rng, const Vec3& room_dimensions) {
    const double limit_x = room_dimensions.x * 0.5 - kPerformerWidth;
    const double limit_z = room_dimensions.z * 0.5 - kPerformerWidth;
    PerformerStart out;
    out.position.x = round_digits(uniform_real(rng, -limit_x, limit_x), kPositionDigits);
    out.position.y = 0.0;
    out.position.z = round_digits(uniform_real(rng, -limit_z, limit_z), kPositionDigits);
    out.rotation.y = random_choice(rng, valid_rotations());
    return out;
}

InteractiveHypercube::InteractiveHypercube(
    std::string name,
    std::vector<InteractivePlan> plan_list,
    HypercubeOptions options
)
    : name_(std::move(name)), plan_list_(std::move(plan_list)), options_(std::move(options)) {
    if (plan_list_.empty()) {
        throw std::invalid_argument("InteractiveHypercube: " + name_ + " has no plans");
    }
    if (options_.max_tries < 1) {
        throw std::invalid_argument("InteractiveHypercube: max_tries must be >= 1");
    }
    if (options_.log_prefix.empty()) {
        options_.log_prefix = kDefaultLogPrefix;
    }
    initialize_object_data();
    validate_object_plan();
}

void InteractiveHypercube::initialize_object_data() {
    for (size_t i = 0; i < plan_list_.size(); ++i) {
        const InteractivePlan& plan = plan_list_[i];
        if (plan.confusor_plan_list.size() > 1) {
            throw std::invalid_argument("InteractiveHypercube: at most one confusor per scene");
        }
        if (i == 0) {
            targets_.emplace_back(role::kTarget, plan.target_plan);
        } else {
            targets_.front().append_object_plan(plan.target_plan);
        }
        append_plans(confusors_, plan.confusor_plan_list, role::kConfusor, i);
        append_plans(large_containers_, plan.large_container_plan_list, role::kContainer, i);
        append_plans(obstacles_, plan.obstacle_plan_list, role::kObstacle, i);
        append_plans(occluders_, plan.occluder_plan_list, role::kOccluder, i);
        append_plans(small_containers_, plan.small_container_plan_list, role::kContainer, i);
    }
}

void InteractiveHypercube::validate_object_plan() const {
    const ObjectData& target_data = targets_.front();
    for (const auto& plan : plan_list_) {
        if (plan.target_plan.definition != plan_list_.front().target_plan.definition) {
            throw std::invalid_argument("InteractiveHypercube: each scene must have the same target definition");
        }
    }
    if (any_of_flags(target_data.untrained_plan_list)) {
        throw std::invalid_argument("InteractiveHypercube: the target cannot be untrained");
    }
    check_plans(target_data, {LocationPlan::kBetween, LocationPlan::kFar});
    for (const auto& data : confusors_) {
        check_plans(data, {LocationPlan::kBetween, LocationPlan::kRandom});
    }
    for (const auto* list : {&large_containers_, &small_containers_}) {
        for (const auto& data : *list) {
            check_plans(
                data,
                {LocationPlan::kFront, LocationPlan::kBack, LocationPlan::kClose, LocationPlan::kFar,
                 LocationPlan::kBetween, LocationPlan::kInside0}
            );
        }
    }
    for (const auto* list : {&obstacles_, &occluders_}) {
        for (const auto& data : *list) {
            check_plans(
                data,
                {LocationPlan::kBack, LocationPlan::kFar, LocationPlan::kFront, LocationPlan::kInside0}
            );
        }
    }

    // Inside and close-to-container scenes need the first large container.
    for (size_t i = 0; i < target_data.scene_count(); ++i) {
        const LocationPlan plan = target_data.location_plan_list[i];
        const bool confusor_inside =
            !confusors_.empty() && confusors_.front().location_plan_list[i] == LocationPlan::kInside0;
        if (plan != LocationPlan::kInside0 && plan != LocationPlan::kClose && !confusor_inside) {
            continue;
        }
        if (large_containers_.empty() || large_containers_.front().location_plan_list[i] != LocationPlan::kRandom) {
            throw std::invalid_argument(
                "InteractiveHypercube: scene " + std::to_string(i) +
                " needs a placed large container for its target or confusor"
            );
        }
    }
}

std::vector<ObjectData*> InteractiveHypercube::critical_object_data() {
    std::vector<ObjectData*> out;
    for (auto& data : targets_) {
        out.push_back(&data);
    }
    for (auto& data : confusors_) {
        out.push_back(&data);
    }
    for (auto& data : obstacles_) {
        out.push_back(&data);
    }
    for (auto& data : occluders_) {
        out.push_back(&data);
    }
    return out;
}

std::vector<ObjectData*> InteractiveHypercube::all_object_data() {
    std::vector<ObjectData*> out;
    for (auto& data : targets_) {
        out.push_back(&data);
    }
    for (auto& data : confusors_) {
        out.push_back(&data);
    }
    for (auto* list : {&large_containers_, &small_containers_, &obstacles_, &occluders_}) {
        for (auto& data : *list) {
            out.push_back(&data);
        }
    }
    return out;
}

std::vector<const ObjectData*> InteractiveHypercube::all_object_data() const {
    std::vector<const ObjectData*> out;
    for (const auto& data : targets_) {
        out.push_back(&data);
    }
    for (const auto& data : confusors_) {
        out.push_back(&data);
    }
    for (const auto* list : {&large_containers_, &small_containers_, &obstacles_, &occluders_}) {
        for (const auto& data : *list) {
            out.push_back(&data);
        }
    }
    return out;
}

void InteractiveHypercube::extend_bounds(const BoundsList& bounds) {
    context_.bounds.insert(context_.bounds.end(), bounds.begin(), bounds.end());
}

void InteractiveHypercube::log(int level, const std::string& message) const {
    if (options_.log_level < level) {
        return;
    }
    std::lock_guard<std::mutex> lk(log_mutex());
    std::cerr << options_.log_prefix << " " << message << "\n";
}

void InteractiveHypercube::log_object_data(const ObjectData& object_data) const {
    if (options_.log_level < 2) {
        return;
    }
    std::ostringstream out;
    out << object_data.role;
    if (object_data.trained_definition) {
        out << " trained=" << object_data.trained_definition->type;
    }
    if (object_data.untrained_definition) {
        out << " untrained=" << object_data.untrained_definition->type;
    }
    for (size_t i = 0; i < object_data.instance_list.size(); ++i) {
        out << " [" << i << " " << location_plan_name(object_data.location_plan_list[i]);
        if (object_data.instance_list[i]) {
            out << " " << describe(object_data.instance_list[i]->position);
        }
        out << "]";
    }
    log(2, out.str());
}

Result<std::vector<Scene>> InteractiveHypercube::generate(Rng& rng) {
    hypercube_id_ = upper(make_object_id(rng));
    Failure last = placement_failure("no attempt made");

    for (int attempt = 1; attempt <= options_.max_tries; ++attempt) {
        reset_attempt(rng);
        Status status = initialize_each_hypercube_object(rng);
        if (status.is_ok()) {
            status = initialize_context_objects(rng);
        }
        if (status.is_err()) {
            last = status.error();
            log(2, "attempt " + std::to_string(attempt) + " failed (" + failure_kind_name(last.kind) +
                       "): " + last.message);
            continue;
        }

        std::vector<Scene> scenes;
        scenes.reserve(plan_list_.size());
        for (size_t i = 0; i < plan_list_.size(); ++i) {
            scenes.push_back(build_scene(i));
        }
        status = update_floor_and_walls(scenes, rng);
        if (status.is_err()) {
            last = status.error();
            log(2, "attempt " + std::to_string(attempt) + " failed: " + last.message);
            continue;
        }

        std::stable_sort(scenes.begin(), scenes.end(), [](const Scene& a, const Scene& b) {
            return a.goal.scene_id < b.goal.scene_id;
        });
        log(1, name_ + ": " + std::to_string(scenes.size()) + " scenes after " + std::to_string(attempt) +
                   " attempt(s)");
        return Result<std::vector<Scene>>::ok(std::move(scenes));
    }

    log(1, name_ + ": failed after " + std::to_string(options_.max_tries) + " attempts");
    return Result<std::vector<Scene>>::err(Failure{
        FailureKind::kHypercube,
        name_ + ": " + std::to_string(options_.max_tries) + " attempts failed, last " + failure_kind_name(last.kind) +
            " failure: " + last.message,
    });
}

void InteractiveHypercube::reset_attempt(Rng& rng) {
    context_ = PlacementContext{};
    if (options_.room_dimensions) {
        context_.room_dimensions = *options_.room_dimensions;
    } else {
        context_.room_dimensions = Vec3{
            static_cast<double>(uniform_int(rng, 10, 15)),
            static_cast<double>(uniform_int(rng, 3, 5)),
            static_cast<double>(uniform_int(rng, 10, 15)),
        };
    }
    context_.performer = generate_performer_start(rng, context_.room_dimensions);
    context_object_list_.clear();

    for (ObjectData* data : all_object_data()) {
        data->reset_all_properties();
    }
    for (auto* list : {&large_containers_, &small_containers_, &obstacles_, &occluders_}) {
        for (auto& data : *list) {
            data.trained_containment = Containment{};
            data.untrained_containment = Containment{};
        }
    }

    const MaterialTuple& floor = random_choice(rng, floor_materials());
    floor_material_ = floor.id;
    floor_colors_ = floor.colors;
    const MaterialTuple& wall = random_choice(rng, wall_materials());
    wall_material_ = wall.id;
    wall_colors_ = wall.colors;

    log(2, "room " + describe(context_.room_dimensions) + " performer " + describe(context_.performer.position) +
               " facing " + std::to_string(context_.performer.rotation.y));
}

InteractiveHypercube::Status InteractiveHypercube::initialize_each_hypercube_object(Rng& rng) {
    Status status = choose_each_object_definition(rng);
    if (status.is_err()) {
        return status;
    }

    Failure last = placement_failure("no placement attempt made");
    for (int attempt = 0; attempt < options_.max_tries; ++attempt) {
        context_.bounds.clear();
        for (ObjectData* data : all_object_data()) {
            data->reset_all_instances();
        }
        create_each_object_template(rng);

        status = assign_each_object_location(rng);
        if (status.is_err()) {
            last = status.error();
            log(2, "placement failed: " + last.message);
            continue;
        }

        const ObjectData& target_data = target();
        for (size_t i = 0; i < target_data.instance_list.size(); ++i) {
            if (!target_data.instance_list[i]) {
                return Status::err(placement_failure("target has no location in scene " + std::to_string(i)));
            }
        }
        for (const ObjectData* data : all_object_data()) {
            log_object_data(*data);
        }
        return Status::ok();
    }
    return Status::err(last);
}

// ---------------------------------------------------------------------------
// Definition selection
// ---------------------------------------------------------------------------

InteractiveHypercube::Status InteractiveHypercube::choose_each_object_definition(Rng& rng) {
    assign_target_definition(rng);

    if (confusor()) {
        Status status = assign_confusor_definition(rng);
        if (status.is_err()) {
            return status;
        }
    }
    for (auto& container : large_containers_) {
        Status status = assign_container_definition(container, false, rng);
        if (status.is_err()) {
            return status;
        }
    }
    for (auto& container : small_containers_) {
        Status status = assign_container_definition(container, true, rng);
        if (status.is_err()) {
            return status;
        }
    }

    const Definition larger = target().larger_definition_of(large_containers_, confusor());
    for (auto& obstacle : obstacles_) {
        Status status = assign_obstacle_or_occluder_definition(obstacle, larger, false, rng);
        if (status.is_err()) {
            return status;
        }
    }
    for (auto& occluder : occluders_) {
        Status status = assign_obstacle_or_occluder_definition(occluder, larger, true, rng);
        if (status.is_err()) {
            return status;
        }
    }
    return Status::ok();
}

void InteractiveHypercube::assign_target_definition(Rng& rng) {
    ObjectData& target_data = target();
    if (!target_data.trained_definition) {
        target_data.trained_definition = pickupable_dataset().filter_on_trained().choose_random_definition(rng);
    }
    // The target is never untrained.
    target_data.untrained_definition.reset();
    log(2, "target " + target_data.trained_definition->type);
}

InteractiveHypercube::Status InteractiveHypercube::assign_confusor_definition(Rng& rng) {
    ObjectData& confusor_data = *confusor();
    if (confusor_data.original_definition) {
        return Status::ok();
    }
    const Definition& target_definition = *target().trained_definition;

    auto trained = get_similar_definition(target_definition, pickupable_dataset().filter_on_trained(), rng);
    if (!trained) {
        return Status::err(definition_failure("no trained confusor similar to " + target_definition.type));
    }
    confusor_data.trained_definition = std::move(*trained);

    auto untrained = get_similar_definition(
        target_definition,
        pickupable_dataset().filter_on_untrained(UntrainedTag::kShape),
        rng
    );
    if (!untrained && any_of_flags(confusor_data.untrained_plan_list)) {
        return Status::err(definition_failure("no untrained confusor similar to " + target_definition.type));
    }
    confusor_data.untrained_definition = std::move(untrained);
    return Status::ok();
}

InteractiveHypercube::Status InteractiveHypercube::assign_container_definition(
    ReceptacleData& container,
    bool find_invalid_container,
    Rng& rng
) {
    DefinitionDataset trained_dataset;
    DefinitionDataset untrained_dataset;
    if (container.original_definition) {
        const DefinitionGroups fixed(
            1,
            DefinitionSelections(1, DefinitionVariations(1, *container.original_definition))
        );
        trained_dataset = DefinitionDataset(fixed);
        untrained_dataset = DefinitionDataset(fixed);
    } else {
        trained_dataset = container_dataset().filter_on_trained();
        untrained_dataset = container_dataset().filter_on_untrained(UntrainedTag::kShape);
    }

    const ObjectData* confusor_data = confusor();
    const Definition* trained_confusor =
        confusor_data && confusor_data->trained_definition ? &*confusor_data->trained_definition : nullptr;
    const Definition* untrained_confusor =
        confusor_data && confusor_data->untrained_definition ? &*confusor_data->untrained_definition
                                                             : trained_confusor;

    auto trained = choose_container_definition(
        container, trained_confusor, trained_dataset, find_invalid_container, false, rng
    );
    if (trained.is_err()) {
        return Status::err(trained.error());
    }
    container.trained_containment = trained.value();

    if (any_of_flags(container.untrained_plan_list)) {
        auto untrained = choose_container_definition(
            container, untrained_confusor, untrained_dataset, find_invalid_container, true, rng
        );
        if (untrained.is_err()) {
            return Status::err(untrained.error());
        }
        container.untrained_containment = untrained.value();
    }
    return Status::ok();
}

Result<Containment> InteractiveHypercube::choose_container_definition(
    ReceptacleData& container,
    const Definition* confusor_definition,
    const DefinitionDataset& dataset,
    bool find_invalid_container,
    bool untrained,
    Rng& rng
) {
    ObjectData& target_data = target();
    const ObjectData* confusor_data = confusor();
    const Definition current = *target_data.trained_definition;

    // Only the first pass of the container holding the target may turn the
    // target sideways; every later container must fit it as already chosen.
    const bool holds_target = !large_containers_.empty() && &container == &large_containers_.front();
    std::vector<Definition> target_definition_list;
    if (holds_target && !untrained) {
        Definition upright = current.not_sideways ? revert_sideways(current) : current;
        auto sideways = make_sideways_definition(upright);
        target_definition_list.push_back(std::move(upright));
        if (sideways) {
            target_definition_list.push_back(std::move(*sideways));
        }
    } else {
        target_definition_list.push_back(current);
    }

    const bool together = target_data.containerize_with(confusor_data);
    if (together && !confusor_definition) {
        return Result<Containment>::err(definition_failure("container needs a confusor definition"));
    }
    const Definition* inside_confusor = confusor_data && confusor_data->is_inside() ? confusor_definition : nullptr;
    const bool check_target = target_data.is_inside() || find_invalid_container;

    // Draw without replacement: a random group, then a random selection in it.
    const DefinitionGroups& groups = dataset.groups();
    std::vector<size_t> group_indexes;
    std::vector<std::vector<size_t>> inner_indexes(groups.size());
    for (size_t g = 0; g < groups.size(); ++g) {
        for (size_t s = 0; s < groups[g].size(); ++s) {
            inner_indexes[g].push_back(s);
        }
        if (!inner_indexes[g].empty()) {
            group_indexes.push_back(g);
        }
    }

    while (!group_indexes.empty()) {
        const size_t group_index = random_choice(rng, group_indexes);
        std::vector<size_t>& inner = inner_indexes[group_index];
        const size_t inner_index = random_choice(rng, inner);
        inner.erase(std::find(inner.begin(), inner.end(), inner_index));
        if (inner.empty()) {
            group_indexes.erase(std::find(group_indexes.begin(), group_indexes.end(), group_index));
        }
        const DefinitionVariations& variations = groups[group_index][inner_index];
        if (variations.empty()) {
            continue;
        }
        const Definition& definition = random_choice(rng, variations);

        for (const Definition& target_definition : target_definition_list) {
            Containment containment;
            bool valid = false;
            if (together) {
                auto fit = can_contain_both(definition, target_definition, *confusor_definition);
                if (fit) {
                    valid = true;
                    containment.area_index = fit->area_index;
                    containment.orientation = fit->orientation;
                    containment.target_angle = fit->angle_a;
                    containment.confusor_angle = fit->angle_b;
                }
            } else {
                auto fit = can_contain(definition, check_target ? &target_definition : nullptr, inside_confusor);
                if (fit) {
                    valid = true;
                    containment.area_index = fit->area_index;
                    containment.target_angle = fit->angle_a;
                    containment.confusor_angle = fit->angle_b;
                }
            }
            if (valid == find_invalid_container) {
                continue;
            }
            target_data.trained_definition = target_definition;
            if (untrained) {
                container.untrained_definition = definition;
            } else {
                container.trained_definition = definition;
            }
            log(2, std::string(find_invalid_container ? "small" : "large") + " container " + definition.type +
                       (untrained ? " (untrained)" : "") + " for target " + target_definition.type);
            return Result<Containment>::ok(find_invalid_container ? Containment{} : containment);
        }
    }

    return Result<Containment>::err(definition_failure(
        std::string("no ") + (find_invalid_container ? "invalid" : "valid") + (untrained ? " untrained" : " trained") +
        " container for target " + current.type
    ));
}

InteractiveHypercube::Status InteractiveHypercube::assign_obstacle_or_occluder_definition(
    ObjectData& object_data,
    const Definition& target_definition,
    bool is_occluder,
    Rng& rng
) {
    if (object_data.original_definition) {
        return Status::ok();
    }
    const DefinitionDataset& dataset = obstacle_occluder_dataset();

    auto trained = choose_obstacle_or_occluder_definition(target_definition, dataset.filter_on_trained(), is_occluder, rng);
    if (trained.is_err()) {
        return Status::err(trained.error());
    }
    object_data.trained_definition = std::move(trained).value();

    if (any_of_flags(object_data.untrained_plan_list)) {
        auto untrained = choose_obstacle_or_occluder_definition(
            target_definition,
            dataset.filter_on_untrained(UntrainedTag::kShape),
            is_occluder,
            rng
        );
        if (untrained.is_err()) {
            return Status::err(untrained.error());
        }
        object_data.untrained_definition = std::move(untrained).value();
    }
    return Status::ok();
}

Result<Definition> InteractiveHypercube::choose_obstacle_or_occluder_definition(
    const Definition& target_definition,
    const DefinitionDataset& dataset,
    bool is_occluder,
    Rng& rng
) {
    std::vector<Definition> candidates;
    for (Definition& definition : dataset.definitions(rng)) {
        if (!(is_occluder ? definition.occluder : definition.obstacle)) {
            continue;
        }
        // Too short or too light to block the performer.
        if (definition.dimensions.y < kPerformerHalfWidth) {
            continue;
        }
        if (!(definition.mass * definition.mass_multiplier > kPerformerMass)) {
            continue;
        }
        if (is_occluder && definition.dimensions.y < target_definition.dimensions.y) {
            continue;
        }
        // Wide enough to cover the target, facing front or turned sideways.
        if (definition.dimensions.x >= target_definition.dimensions.x) {
            candidates.push_back(std::move(definition));
        } else if (definition.dimensions.z >= target_definition.dimensions.x) {
            definition.rotation.y += 90.0;
            candidates.push_back(std::move(definition));
        }
    }
    if (candidates.empty()) {
        return Result<Definition>::err(definition_failure(
            std::string("no ") + (is_occluder ? "occluder" : "obstacle") + " large enough for " +
            target_definition.type
        ));
    }
    return Result<Definition>::ok(random_choice(rng, candidates));
}

// ---------------------------------------------------------------------------
// Anchored placement
// ---------------------------------------------------------------------------

void InteractiveHypercube::create_each_object_template(Rng& rng) {
    for (ObjectData* data : all_object_data()) {
        data->recreate_both_templates(rng);
    }
}

InteractiveHypercube::Status InteractiveHypercube::assign_each_object_location(Rng& rng) {
    const Definition larger = target().larger_definition_of(large_containers_, confusor());

    auto locations = assign_target_location(larger, rng);
    if (locations.is_err()) {
        return Status::err(locations.error());
    }
    Status status = assign_confusor_obstacle_occluder_location(larger, locations.value(), rng);
    if (status.is_err()) {
        return status;
    }
    status = assign_container_location(rng);
    if (status.is_err()) {
        return status;
    }
    return assign_object_location_inside_container();
}

Result<InteractiveHypercube::TargetLocations> InteractiveHypercube::assign_target_location(
    const Definition& target_definition,
    Rng& rng
) {
    TargetLocations locations;
    Status status = assign_front_and_back_location(target_definition, locations, rng);
    if (status.is_err()) {
        return Result<TargetLocations>::err(status.error());
    }

    ReceptacleData* container = large_containers_.empty() ? nullptr : &large_containers_.front();
    std::optional<Location> container_location;
    if (container && container->is_random()) {
        auto location = generate_random_location(*container, container->larger_definition(), rng);
        if (location.is_err()) {
            return Result<TargetLocations>::err(location.error());
        }
        extend_bounds(container->assign_location_random(location.value()));
        container_location = location.value();
    }

    ObjectData& target_data = target();
    if (target_data.is_close()) {
        if (!container || !container_location) {
            return Result<TargetLocations>::err(placement_failure("target is close to a container that was not placed"));
        }
        auto location = generate_close_to(
            &target_data,
            target_data.larger_definition(),
            container->larger_definition(),
            *container_location,
            InLineMode::kClose,
            rng
        );
        if (location.is_err()) {
            return Result<TargetLocations>::err(location.error());
        }
        extend_bounds(target_data.assign_location_close(location.value(), std::nullopt));
        locations[LocationPlan::kClose] = location.value();
    }

    if (target_data.is_random()) {
        auto location = generate_random_location(target_data, target_definition, rng);
        if (location.is_err()) {
            return Result<TargetLocations>::err(location.error());
        }
        extend_bounds(target_data.assign_location_random(location.value()));
        locations[LocationPlan::kRandom] = location.value();
    }

    // Scenes with the target inside container 0 anchor on the container.
    if (target_data.is_inside() && container_location && !locations.count(LocationPlan::kRandom)) {
        locations[LocationPlan::kRandom] = *container_location;
    }
    return Result<TargetLocations>::ok(std::move(locations));
}

InteractiveHypercube::Status InteractiveHypercube::assign_front_and_back_location(
    const Definition& target_definition,
    TargetLocations& locations,
    Rng& rng
) {
    std::vector<ObjectData*> front_back{&target()};
    if (confusor()) {
        front_back.push_back(confusor());
    }
    std::vector<const ObjectData*> placed;
    for (const ObjectData* data : front_back) {
        if (data->is_front() || data->is_back()) {
            placed.push_back(data);
        }
    }
    if (placed.empty()) {
        return Status::ok();
    }

    Location front;
    Location back;
    Status status = generate_front_and_back(target_definition, placed, front, back, rng);
    if (status.is_err()) {
        return status;
    }
    for (ObjectData* data : front_back) {
        extend_bounds(data->assign_location_front(front));
        extend_bounds(data->assign_location_back(back));
    }
    locations[LocationPlan::kFront] = front;
    locations[LocationPlan::kBack] = back;
    return Status::ok();
}

InteractiveHypercube::Status InteractiveHypercube::generate_front_and_back(
    const Definition& definition,
    const std::vector<const ObjectData*>& placed,
    Location& front,
    Location& back,
    Rng& rng
) {
    for (int attempt = 0; attempt < options_.max_tries; ++attempt) {
        std::optional<Location> front_location;
        std::optional<Location> back_location;
        for (int i = 0; i < options_.max_tries && !front_location; ++i) {
            auto candidate = location_in_front_of_performer(rng, context_.area(), definition);
            if (candidate && fits_every_variant(placed, *candidate)) {
                front_location = candidate;
            }
        }
        if (front_location) {
            for (int i = 0; i < options_.max_tries && !back_location; ++i) {
                auto candidate = location_in_back_of_performer(rng, context_.area(), definition);
                if (candidate && fits_every_variant(placed, *candidate)) {
                    back_location = candidate;
                }
            }
        }
        if (front_location && back_location) {
            front = *front_location;
            back = *back_location;
            return Status::ok();
        }
        // Some performer starts leave no room ahead or behind.
        context_.performer = generate_performer_start(rng, context_.room_dimensions);
        log(2, "performer moved to " + describe(context_.performer.position));
    }
    return Status::err(placement_failure("no front and back locations for " + definition.type));
}

InteractiveHypercube::Status InteractiveHypercube::assign_confusor_obstacle_occluder_location(
    const Definition& target_definition,
    const TargetLocations& locations,
    Rng& rng
) {
    ObjectData* confusor_data = confusor();
    std::vector<Location> target_locations;

    for (const auto& entry : target().locations_with_indexes(large_containers_)) {
        const std::vector<int>& indexes = entry.second;
        auto it = locations.find(entry.first);
        if (it == locations.end()) {
            return Status::err(
                placement_failure(std::string("no target location for plan ") + location_plan_name(entry.first))
            );
        }
        const Location& target_location = it->second;
        target_locations.push_back(target_location);

        for (auto* list : {&obstacles_, &occluders_}) {
            const bool is_obstacle = list == &obstacles_;
            for (auto& data : *list) {
                if (uses_in(data, LocationPlan::kBetween, indexes)) {
                    Status status = assign_single_obstacle_occluder_location(
                        data,
                        target_definition,
                        target_location,
                        indexes,
                        LocationPlan::kBetween,
                        is_obstacle ? InLineMode::kUnreachable : InLineMode::kObstruct,
                        rng
                    );
                    if (status.is_err()) {
                        return status;
                    }
                }
                if (uses_in(data, LocationPlan::kClose, indexes)) {
                    Status status = assign_single_obstacle_occluder_location(
                        data, target_definition, target_location, indexes, LocationPlan::kClose, InLineMode::kBehind, rng
                    );
                    if (status.is_err()) {
                        return status;
                    }
                }
            }
        }

        if (!confusor_data) {
            continue;
        }
        if (uses_in(*confusor_data, LocationPlan::kClose, indexes)) {
            auto location = generate_close_to(
                confusor_data,
                confusor_data->larger_definition(),
                target_definition,
                target_location,
                InLineMode::kAdjacent,
                rng
            );
            if (location.is_err()) {
                return Status::err(location.error());
            }
            extend_bounds(confusor_data->assign_location_close(location.value(), indexes));
        }
        if (uses_in(*confusor_data, LocationPlan::kFar, indexes)) {
            auto location =
                generate_far_from(*confusor_data, confusor_data->larger_definition(), target_location, rng);
            if (location.is_err()) {
                return Status::err(location.error());
            }
            extend_bounds(confusor_data->assign_location_far(location.value(), indexes));
        }
    }

    // One random location per role, kept out of the way of every target location.
    for (auto* list : {&obstacles_, &occluders_}) {
        for (auto& data : *list) {
            if (!data.is_random()) {
                continue;
            }
            auto location = generate_random_location(
                data,
                *data.trained_definition,
                rng,
                &target_locations,
                data.untrained_definition ? &*data.untrained_definition : nullptr
            );
            if (location.is_err()) {
                return Status::err(location.error());
            }
            extend_bounds(data.assign_location_random(location.value()));
        }
    }
    return Status::ok();
}

InteractiveHypercube::Status InteractiveHypercube::assign_single_obstacle_occluder_location(
    ReceptacleData& object_data,
    const Definition& target_definition,
    const Location& target_location,
    const std::vector<int>& indexes,
    LocationPlan plan,
    InLineMode mode,
    Rng& rng
) {
    std::vector<int> trained_indexes;
    std::vector<int> untrained_indexes;
    for (const int i : indexes) {
        const size_t scene = static_cast<size_t>(i);
        if (object_data.location_plan_list[scene] != plan) {
            continue;
        }
        (object_data.untrained_plan_list[scene] ? untrained_indexes : trained_indexes).push_back(i);
    }

    // Trained and untrained shapes differ, so each gets its own location.
    for (const bool untrained : {false, true}) {
        const std::vector<int>& scene_indexes = untrained ? untrained_indexes : trained_indexes;
        if (scene_indexes.empty()) {
            continue;
        }
        const auto& definition = untrained ? object_data.untrained_definition : object_data.trained_definition;
        if (!definition) {
            return Status::err(definition_failure(
                object_data.role + " has no " + (untrained ? "untrained" : "trained") + " definition"
            ));
        }
        // Only this variant moves to the location.
        auto location = generate_close_to(nullptr, *definition, target_definition, target_location, mode, rng);
        if (location.is_err()) {
            return Status::err(location.error());
        }
        extend_bounds(
            plan == LocationPlan::kBetween ? object_data.assign_location_between(location.value(), scene_indexes)
                                           : object_data.assign_location_close(location.value(), scene_indexes)
        );
    }
    return Status::ok();
}

InteractiveHypercube::Status InteractiveHypercube::assign_container_location(Rng& rng) {
    std::vector<ReceptacleData*> remaining;
    for (size_t i = 1; i < large_containers_.size(); ++i) {
        remaining.push_back(&large_containers_[i]);
    }
    for (auto& container : small_containers_) {
        remaining.push_back(&container);
    }
    for (ReceptacleData* container : remaining) {
        if (!container->is_random()) {
            continue;
        }
        auto location = generate_random_location(*container, container->larger_definition(), rng);
        if (location.is_err()) {
            return Status::err(location.error());
        }
        extend_bounds(container->assign_location_random(location.value()));
    }
    return Status::ok();
}

InteractiveHypercube::Status InteractiveHypercube::assign_object_location_inside_container() {
    ObjectData& target_data = target();
    ObjectData* confusor_data = confusor();
    const auto target_inside = target_data.contained_indexes(confusor_data);
    std::vector<ObjectData::ContainedIndex> confusor_inside;
    if (confusor_data) {
        confusor_inside = confusor_data->contained_indexes(&target_data);
    }
    if (target_inside.empty() && confusor_inside.empty()) {
        return Status::ok();
    }
    if (large_containers_.empty()) {
        return Status::err(placement_failure("no large container to hold the target"));
    }
    ReceptacleData& container = large_containers_.front();

    auto container_in = [&container](size_t scene) -> Instance* {
        auto& instance = container.instance_list[scene];
        return instance ? &*instance : nullptr;
    };

    for (const auto& contained : target_inside) {
        const size_t scene = static_cast<size_t>(contained.scene_index);
        Instance* container_instance = container_in(scene);
        if (!container_instance) {
            return Status::err(placement_failure("container 0 is missing in scene " + std::to_string(scene)));
        }
        const Containment& containment = container.containment_for_scene(scene);
        Instance target_instance = *target_data.trained_template;

        if (!contained.with_second) {
            put_object_in_container(target_instance, *container_instance, containment.area_index, containment.target_angle);
        } else {
            if (!containment.orientation || !containment.target_angle || !containment.confusor_angle) {
                return Status::err(placement_failure("container " + container_instance->type + " has no joint layout"));
            }
            const auto& confusor_template = confusor_data->untrained_plan_list[scene] ? confusor_data->untrained_template
                                                                                      : confusor_data->trained_template;
            if (!confusor_template) {
                return Status::err(definition_failure("confusor has no template for scene " + std::to_string(scene)));
            }
            Instance confusor_instance = *confusor_template;
            put_objects_in_container(
                target_instance,
                confusor_instance,
                *container_instance,
                containment.area_index,
                *containment.orientation,
                *containment.target_angle,
                *containment.confusor_angle
            );
            confusor_data->instance_list[scene] = std::move(confusor_instance);
        }
        target_data.instance_list[scene] = std::move(target_instance);
    }

    for (const auto& contained : confusor_inside) {
        if (contained.with_second) {
            continue;
        }
        const size_t scene = static_cast<size_t>(contained.scene_index);
        Instance* container_instance = container_in(scene);
        if (!container_instance) {
            return Status::err(placement_failure("container 0 is missing in scene " + std::to_string(scene)));
        }
        const auto& confusor_template = confusor_data->untrained_plan_list[scene] ? confusor_data->untrained_template
                                                                                  : confusor_data->trained_template;
        if (!confusor_template) {
            return Status::err(definition_failure("confusor has no template for scene " + std::to_string(scene)));
        }
        Instance confusor_instance = *confusor_template;
        const Containment& containment = container.containment_for_scene(scene);
        put_object_in_container(
            confusor_instance, *container_instance, containment.area_index, containment.confusor_angle
        );
        confusor_data->instance_list[scene] = std::move(confusor_instance);
    }
    return Status::ok();
}

bool InteractiveHypercube::fits_every_variant(
    const std::vector<const ObjectData*>& placed,
    const Location& location
) const {
    for (const ObjectData* data : placed) {
        for (const ObjectBounds& bounds : data->variant_bounds(location)) {
            if (!validate_location_rect(
                    bounds, context_.performer.position, context_.bounds, context_.room_dimensions
                )) {
                return false;
            }
        }
    }
    return true;
}

Result<Location> InteractiveHypercube::generate_close_to(
    const ObjectData* placed,
    const Definition& definition,
    const Definition& existing_definition,
    const Location& existing_location,
    InLineMode mode,
    Rng& rng
) {
    for (int attempt = 0; attempt < options_.max_tries; ++attempt) {
        auto location = location_in_line_with_object(
            rng, context_.area(), definition, existing_definition, existing_location, context_.bounds, mode
        );
        if (!location) {
            break;
        }
        if (!placed || fits_every_variant({placed}, *location)) {
            return Result<Location>::ok(*location);
        }
    }
    return Result<Location>::err(placement_failure(
        std::string("no ") + in_line_mode_name(mode) + " location for " + definition.type + " near " +
        existing_definition.type
    ));
}

Result<Location> InteractiveHypercube::generate_far_from(
    const ObjectData& placed,
    const Definition& definition,
    const Location& existing_location,
    Rng& rng
) {
    for (int attempt = 0; attempt < options_.max_tries; ++attempt) {
        BoundsList scratch = context_.bounds;
        auto location = location_far_from(rng, context_.area(), definition, existing_location.bounds, scratch);
        if (!location) {
            break;
        }
        if (fits_every_variant({&placed}, *location)) {
            return Result<Location>::ok(*location);
        }
    }
    return Result<Location>::err(placement_failure("no far location for " + definition.type));
}

Result<Location> InteractiveHypercube::generate_random_location(
    const ObjectData& placed,
    const Definition& definition,
    Rng& rng,
    const std::vector<Location>* target_locations,
    const Definition* second_definition
) {
    const Definition& chosen = *identify_larger_definition(&definition, second_definition);
    const Vec3& performer = context_.performer.position;
    RandomPlacementOptions placement;
    placement.rotation_y = context_.performer.rotation.y;
    placement.max_tries = options_.max_tries;

    for (int attempt = 0; attempt < options_.max_tries; ++attempt) {
        BoundsList scratch = context_.bounds;
        auto location = random_location(rng, context_.area(), chosen, scratch, placement);
        if (!location) {
            return Result<Location>::err(placement_failure("no random location for " + chosen.type));
        }
        if (!fits_every_variant({&placed}, *location)) {
            continue;
        }
        if (!target_locations) {
            return Result<Location>::ok(*location);
        }

        std::optional<ObjectBounds> second_bounds;
        if (second_definition) {
            second_bounds = create_bounds(
                second_definition->dimensions,
                second_definition->offset,
                location->position,
                location->rotation,
                second_definition->position_y
            );
        }
        bool blocked = false;
        for (const ObjectBounds& other : context_.bounds) {
            if (does_fully_obstruct(performer, location->bounds, other.box_xz) ||
                does_fully_obstruct(performer, other, location->bounds.box_xz)) {
                blocked = true;
                break;
            }
            if (second_bounds && (does_fully_obstruct(performer, *second_bounds, other.box_xz) ||
                                  does_fully_obstruct(performer, other, second_bounds->box_xz))) {
                blocked = true;
                break;
            }
        }
        if (blocked) {
            continue;
        }
        const bool hides_target = std::any_of(
            target_locations->begin(),
            target_locations->end(),
            [&](const Location& target_location) {
                return does_partly_obstruct(performer, target_location.bounds, location->bounds.box_xz);
            }
        );
        if (!hides_target) {
            return Result<Location>::ok(*location);
        }
    }
    return Result<Location>::err(placement_failure("no visible random location for " + chosen.type));
}

// ---------------------------------------------------------------------------
// Commit
// ---------------------------------------------------------------------------

InteractiveHypercube::Status InteractiveHypercube::initialize_context_objects(Rng& rng) {
    if (!options_.context_objects) {
        return Status::ok();
    }
    const size_t count = weighted_choice(rng, context_object_weights());
    if (count == 0) {
        return Status::ok();
    }

    const std::vector<ObjectData*> critical = critical_object_data();
    std::vector<std::string> excluded_shapes;
    for (const ObjectData* data : critical) {
        for (const auto* definition : {&data->trained_definition, &data->untrained_definition}) {
            if (*definition && !(*definition)->shape.empty()) {
                excluded_shapes.push_back((*definition)->shape.back());
            }
        }
    }
    const DefinitionDataset dataset =
        pickupable_dataset().filter_on_trained().filter_on_custom([&excluded_shapes](const Definition& definition) {
            return definition.shape.empty() ||
                   std::find(excluded_shapes.begin(), excluded_shapes.end(), definition.shape.back()) ==
                       excluded_shapes.end();
        });
    if (dataset.empty()) {
        return Status::err(definition_failure("no context object shaped unlike the target"));
    }

    const Vec3& performer = context_.performer.position;
    RandomPlacementOptions placement;
    placement.rotation_y = context_.performer.rotation.y;
    placement.max_tries = options_.max_tries;

    for (size_t n = 0; n < count; ++n) {
        const Definition definition = dataset.choose_random_definition(rng);
        std::optional<Location> chosen;
        BoundsList chosen_bounds;
        for (int attempt = 0; attempt < options_.max_tries && !chosen; ++attempt) {
            BoundsList scratch = context_.bounds;
            auto location = random_location(rng, context_.area(), definition, scratch, placement);
            if (!location) {
                return Status::err(placement_failure("no location for context object " + definition.type));
            }
            bool hides = false;
            for (const ObjectData* data : critical) {
                for (const auto& instance : data->instance_list) {
                    if (instance && does_fully_obstruct(performer, instance->bounds, location->bounds.box_xz)) {
                        hides = true;
                    }
                }
            }
            if (!hides) {
                chosen = location;
                chosen_bounds = std::move(scratch);
            }
        }
        if (!chosen) {
            return Status::err(placement_failure("every context object location hides a critical object"));
        }
        context_.bounds = std::move(chosen_bounds);
        Instance instance = instantiate_object(definition, *chosen, rng);
        instance.role = role::kContext;
        context_object_list_.push_back(std::move(instance));
    }
    log(2, std::to_string(context_object_list_.size()) + " context objects");
    return Status::ok();
}

Scene InteractiveHypercube::build_scene(size_t scene_index) const {
    const InteractivePlan& plan = plan_list_[scene_index];
    Scene scene;
    scene.hypercube_name = name_;
    scene.hypercube_id = hypercube_id_;
    scene.room_dimensions = context_.room_dimensions;
    scene.performer_start = context_.performer;
    scene.floor_material = floor_material_;
    scene.floor_colors = floor_colors_;
    scene.wall_material = wall_material_;
    scene.wall_colors = wall_colors_;
    scene.evaluation_only = plan.any_untrained();

    auto add = [&](const ObjectData& data, const char* role_name, std::optional<bool> can_contain_target) {
        const auto& instance = data.instance_list[scene_index];
        if (!instance) {
            return;
        }
        Instance object = *instance;
        object.role = role_name;
        if (can_contain_target) {
            object.can_contain_target = can_contain_target;
        }
        scene.objects.push_back(std::move(object));
    };

    for (const auto& data : targets_) {
        add(data, role::kTarget, std::nullopt);
    }
    for (const auto& data : confusors_) {
        add(data, role::kConfusor, std::nullopt);
    }
    for (const auto& data : large_containers_) {
        add(data, role::kContainer, true);
    }
    for (const auto& data : small_containers_) {
        add(data, role::kContainer, false);
    }
    for (const auto& instance : context_object_list_) {
        scene.objects.push_back(instance);
    }
    for (const auto& data : obstacles_) {
        add(data, role::kObstacle, std::nullopt);
    }
    for (const auto& data : occluders_) {
        add(data, role::kOccluder, std::nullopt);
    }

    const Instance& target_instance = scene.objects.front();
    SceneGoal& goal = scene.goal;
    goal.description = "Find and pick up the " + target_instance.goal_string + ".";
    goal.target_id = target_instance.id;
    goal.last_step = step_limit_from_dimensions(scene.room_dimensions.x, scene.room_dimensions.z);
    goal.scene_id = upper(plan.scene_id);
    goal.slice_tags = plan.slice_tags;
    for (const auto& tag : plan.slice_tags) {
        goal.slices.push_back(tag_to_label(tag.first) + " " + tag.second);
    }
    for (const std::string& role_name : scene_roles()) {
        goal.role_counts.emplace_back(role_name, static_cast<int>(objects_with_role(scene, role_name).size()));
    }

    scene.name = goal.scene_id.empty() ? name_ : name_ + " " + goal.scene_id;
    return scene;
}

InteractiveHypercube::Status InteractiveHypercube::update_floor_and_walls(std::vector<Scene>& scenes, Rng& rng) const {
    std::set<std::string> object_colors;
    for (const ObjectData* data : all_object_data()) {
        for (const auto* instance : {&data->trained_template, &data->untrained_template}) {
            if (*instance) {
                object_colors.insert((*instance)->color.begin(), (*instance)->color.end());
            }
        }
    }
    auto clashes = [&object_colors](const std::vector<std::string>& colors) {
        return std::any_of(colors.begin(), colors.end(), [&object_colors](const std::string& color) {
            return object_colors.count(color) > 0;
        });
    };

    struct Surface {
        const char* name;
        const MaterialList& options;
        std::string material;
        std::vector<std::string> colors;
    };
    Surface surfaces[] = {
        {"floor", floor_materials(), floor_material_, floor_colors_},
        {"wall", wall_materials(), wall_material_, wall_colors_},
    };
    for (Surface& surface : surfaces) {
        if (!clashes(surface.colors)) {
            continue;
        }
        MaterialList choice_list = surface.options;
        shuffle_in_place(rng, choice_list);
        bool successful = false;
        for (const MaterialTuple& choice : choice_list) {
            if (!clashes(choice.colors)) {
                surface.material = choice.id;
                surface.colors = choice.colors;
                successful = true;
                break;
            }
        }
        if (!successful) {
            return Status::err(definition_failure(std::string("every ") + surface.name + " material clashes with an object"));
        }
    }

    for (Scene& scene : scenes) {
        scene.floor_material = surfaces[0].material;
        scene.floor_colors = surfaces[0].colors;
        scene.wall_material = surfaces[1].material;
        scene.wall_colors = surfaces[1].colors;
    }
    return Status::ok();
}

std::string hypercube_name(HypercubeType type) {
    switch (type) {
        case HypercubeType::kSingle:
            return "retrieval";
        case HypercubeType::kContainer:
        case HypercubeType::kContainerEval:
            return "retrieval container";
        case HypercubeType::kObstacle:
            return "retrieval obstacle";
        case HypercubeType::kOccluder:
            return "retrieval occluder";
    }
    return "retrieval";
}

InteractiveHypercube make_hypercube(HypercubeType type, HypercubeOptions options) {
    if (options.log_prefix.empty() || options.log_prefix == kDefaultLogPrefix) {
        options.log_prefix = std::string("[hypercube ") + hypercube_type_name(type) + "]";
    }
    return InteractiveHypercube(hypercube_name(type), create_plan_list(type), std::move(options));
}

}  // namespace scenegen
