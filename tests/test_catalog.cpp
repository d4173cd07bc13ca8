// Catalog datasets and definition helpers.

#include <algorithm>
#include <iostream>
#include <string>
#include <vector>

#include "scenegen/catalog.hpp"
#include "scenegen/materials.hpp"
#include "scenegen/plans.hpp"
#include "test_harness.hpp"

using namespace scenegen;

namespace {

bool test_soccer_ball_finalizes() {
    const std::vector<Definition> defs = finalize_each_choice(create_soccer_ball());
    TEST_ASSERT(defs.size() == 1, "one size choice, got " << defs.size());
    const Definition& ball = defs.front();
    TEST_ASSERT(!ball.has_choices(), "choices left after finalize");
    TEST_ASSERT(near(ball.dimensions.x, 0.22), "ball width " << ball.dimensions.x);
    TEST_ASSERT(ball.size == "tiny", "ball size text " << ball.size);
    TEST_ASSERT(ball.pickupable(), "ball not pickupable");
    TEST_ASSERT(soccer_ball_target() == ball, "target ball differs from finalized ball");

    const Definition big = finalize_each_choice(create_soccer_ball(2.0)).front();
    TEST_ASSERT(near(big.dimensions.y, 0.44), "scaled ball height " << big.dimensions.y);
    TEST_ASSERT(near(big.offset.y, 0.22), "scaled ball offset " << big.offset.y);
    TEST_PASS();
}

bool test_datasets_are_finalized() {
    for (const DefinitionDataset* dataset :
         {&pickupable_dataset(), &container_dataset(), &obstacle_occluder_dataset()}) {
        TEST_ASSERT(!dataset->empty(), "empty dataset");
        for (const auto& def : dataset->definitions_unshuffled()) {
            TEST_ASSERT(!def.has_choices(), def.type << " still has choices");
            TEST_ASSERT(def.dimensions.x > 0.0 && def.dimensions.y > 0.0 && def.dimensions.z > 0.0,
                        def.type << " has no dimensions");
        }
    }
    TEST_PASS();
}

bool test_trained_and_untrained_filters() {
    const DefinitionDataset trained = pickupable_dataset().filter_on_trained();
    TEST_ASSERT(!trained.empty(), "no trained pickupables");
    for (const auto& def : trained.definitions_unshuffled()) {
        TEST_ASSERT(!def.any_untrained(), def.type << " is untrained");
    }

    const DefinitionDataset shapes = pickupable_dataset().filter_on_untrained(UntrainedTag::kShape);
    TEST_ASSERT(!shapes.empty(), "no untrained shapes");
    for (const auto& def : shapes.definitions_unshuffled()) {
        TEST_ASSERT(def.untrained_shape, def.type << " not untrained in shape");
        TEST_ASSERT(!def.untrained_color && !def.untrained_size, def.type << " untrained in another tag");
    }
    TEST_ASSERT(trained.size() + shapes.size() <= pickupable_dataset().size(), "filters overlap");
    TEST_PASS();
}

bool test_filter_on_type() {
    const DefinitionDataset balls = pickupable_dataset().filter_on_type({"soccer_ball"});
    TEST_ASSERT(!balls.empty(), "no soccer balls");
    for (const auto& def : balls.definitions_unshuffled()) {
        TEST_ASSERT(def.type == "soccer_ball", "unexpected type " << def.type);
    }
    const DefinitionDataset others = pickupable_dataset().filter_on_type({}, {"soccer_ball"});
    for (const auto& def : others.definitions_unshuffled()) {
        TEST_ASSERT(def.type != "soccer_ball", "soccer ball not excluded");
    }
    TEST_ASSERT(balls.size() + others.size() == pickupable_dataset().size(), "type split loses definitions");
    TEST_PASS();
}

bool test_similar_definition() {
    Rng rng(11);
    const Definition target = soccer_ball_target();
    for (int i = 0; i < 20; ++i) {
        const auto similar = get_similar_definition(target, pickupable_dataset(), rng);
        TEST_ASSERT(similar.has_value(), "no similar definition");
        if (similar->difference == "color") {
            TEST_ASSERT(is_similar_except_in_color(target, *similar), "color difference not similar");
        } else if (similar->difference == "size") {
            TEST_ASSERT(is_similar_except_in_size(target, *similar), "size difference not similar");
            TEST_ASSERT(similar->type == target.type, "size difference changed type");
        } else {
            TEST_ASSERT(similar->difference == "shape", "unknown difference " << similar->difference);
            TEST_ASSERT(is_similar_except_in_shape(target, *similar), "shape difference not similar");
        }
        TEST_ASSERT(*similar != target, "similar definition equals target");
    }
    TEST_PASS();
}

bool test_materials_match() {
    TEST_ASSERT(do_materials_match({"a"}, {"a"}, {}, {}), "same materials");
    TEST_ASSERT(!do_materials_match({"a"}, {"b"}, {"red"}, {"red"}), "materials win over colors");
    TEST_ASSERT(do_materials_match({}, {"b"}, {"red", "blue"}, {"blue"}), "shared color");
    TEST_ASSERT(!do_materials_match({}, {}, {"red"}, {"blue"}), "no shared color");
    TEST_PASS();
}

bool test_materials_resolve() {
    for (const DefinitionDataset* dataset :
         {&pickupable_dataset(), &container_dataset(), &obstacle_occluder_dataset()}) {
        for (const auto& def : dataset->definitions_unshuffled()) {
            for (const auto& id : def.materials) {
                const MaterialTuple* material = find_material(id);
                TEST_ASSERT(material != nullptr, def.type << " uses unknown material " << id);
                for (const auto& color : material->colors) {
                    TEST_ASSERT(std::find(def.color.begin(), def.color.end(), color) != def.color.end(),
                                def.type << " misses color " << color << " of " << id);
                }
            }
        }
    }
    TEST_ASSERT(find_material("no_such_material") == nullptr, "unknown material found");
    TEST_PASS();
}

bool test_containers_have_areas() {
    bool any_untrained = false;
    for (const auto& def : container_dataset().definitions_unshuffled()) {
        TEST_ASSERT(!def.enclosed_areas.empty(), def.type << " has no enclosed area");
        TEST_ASSERT(def.has_attribute("receptacle") && def.has_attribute("openable"),
                    def.type << " not an openable receptacle");
        const EnclosedArea& area = def.enclosed_areas.front();
        TEST_ASSERT(area.dimensions.x <= def.dimensions.x && area.dimensions.z <= def.dimensions.z,
                    def.type << " area larger than container");
        any_untrained = any_untrained || def.untrained_shape;
    }
    TEST_ASSERT(any_untrained, "no untrained container shapes");
    TEST_PASS();
}

bool test_obstacles_and_occluders() {
    bool obstacle = false;
    bool occluder = false;
    for (const auto& def : obstacle_occluder_dataset().definitions_unshuffled()) {
        TEST_ASSERT(def.obstacle || def.occluder, def.type << " neither obstacle nor occluder");
        TEST_ASSERT(!def.pickupable(), def.type << " is pickupable");
        obstacle = obstacle || def.obstacle;
        occluder = occluder || def.occluder;
    }
    TEST_ASSERT(obstacle && occluder, "missing obstacle or occluder furniture");
    TEST_PASS();
}

bool test_sideways_round_trip() {
    const auto trophies = pickupable_dataset().filter_on_type({"trophy"}).definitions_unshuffled();
    TEST_ASSERT(!trophies.empty(), "no trophy");
    const Definition& trophy = trophies.front();
    TEST_ASSERT(trophy.sideways.has_value(), "trophy has no sideways variant");

    const auto sideways = make_sideways_definition(trophy);
    TEST_ASSERT(sideways.has_value(), "sideways definition missing");
    TEST_ASSERT(near(sideways->rotation.x, 90.0), "sideways rotation " << sideways->rotation.x);
    TEST_ASSERT(sideways->dimensions.z > sideways->dimensions.y, "sideways trophy still upright");
    TEST_ASSERT(!sideways->sideways.has_value(), "sideways definition can turn again");

    const Definition upright = revert_sideways(*sideways);
    TEST_ASSERT(near(upright.dimensions.y, trophy.dimensions.y), "revert lost height");
    TEST_ASSERT(near(upright.rotation.x, 0.0), "revert kept rotation");
    TEST_ASSERT(!upright.not_sideways.has_value(), "revert kept saved variant");

    TEST_ASSERT(!make_sideways_definition(soccer_ball_target()).has_value(), "ball turned sideways");
    TEST_PASS();
}

bool test_size_text() {
    TEST_ASSERT(choose_size_text(Vec3{0.22, 0.22, 0.22}) == "tiny", "tiny");
    TEST_ASSERT(choose_size_text(Vec3{0.3, 0.3, 0.3}) == "small", "small");
    TEST_ASSERT(choose_size_text(Vec3{0.8, 0.4, 0.6}) == "medium", "medium");
    TEST_ASSERT(choose_size_text(Vec3{1.2, 1.2, 1.2}) == "large", "large");
    TEST_ASSERT(choose_size_text(Vec3{2.0, 2.0, 2.0}) == "huge", "huge");
    TEST_PASS();
}

bool test_tag_labels() {
    TEST_ASSERT(tag_to_label(slice_tag::kTargetBehind) == "target behind", tag_to_label(slice_tag::kTargetBehind));
    TEST_ASSERT(tag_to_label(slice_tag::kContainersLarge) == "large containers",
                tag_to_label(slice_tag::kContainersLarge));
    TEST_ASSERT(tag_to_label("occluders") == "occluders", "single word");
    TEST_PASS();
}

}  // namespace

int main() {
    std::cout << "================================================" << std::endl;
    std::cout << "Catalog Tests" << std::endl;
    std::cout << "================================================" << std::endl;

    RUN_TEST(test_soccer_ball_finalizes);
    RUN_TEST(test_datasets_are_finalized);
    RUN_TEST(test_trained_and_untrained_filters);
    RUN_TEST(test_filter_on_type);
    RUN_TEST(test_similar_definition);
    RUN_TEST(test_materials_match);
    RUN_TEST(test_materials_resolve);
    RUN_TEST(test_containers_have_areas);
    RUN_TEST(test_obstacles_and_occluders);
    RUN_TEST(test_sideways_round_trip);
    RUN_TEST(test_size_text);
    RUN_TEST(test_tag_labels);
    
    return report_results("Catalog");
}
