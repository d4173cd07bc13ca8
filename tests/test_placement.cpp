// Placement policies against the bounds registry.

#include <cmath>
#include <iostream>
#include <stdexcept>

#include "scenegen/placement.hpp"
#include "test_harness.hpp"

using namespace scenegen;

namespace {

PlacementArea origin_area(const Vec3& room = Vec3{10.0, 3.0, 10.0}) {
    PlacementArea area;
    area.room_dimensions = room;
    area.performer.position = Vec3{0.0, 0.0, 0.0};
    area.performer.rotation = Vec3{0.0, 0.0, 0.0};
    return area;
}

Location anchor_at(const Definition& def, const Vec3& position) {
    Location location;
    location.position = position;
    location.rotation = def.rotation;
    location.bounds = create_bounds(def.dimensions, def.offset, position, def.rotation, def.position_y);
    return location;
}

double planar_distance(const Vec3& a, const Vec3& b) {
    return std::hypot(a.x - b.x, a.z - b.z);
}

bool test_random_stays_in_room_when_dense() {
    Rng rng(42);
    const PlacementArea area = origin_area(Vec3{6.0, 3.0, 6.0});
    const Definition crate = box_definition("crate", Vec3{0.6, 0.5, 0.6});
    BoundsList bounds;
    int placed = 0;
    for (int i = 0; i < 300; ++i) {
        const size_t before = bounds.size();
        const auto location = random_location(rng, area, crate, bounds);
        if (!location) {
            TEST_ASSERT(bounds.size() == before, "failed placement must not touch the registry");
            continue;
        }
        ++placed;
        TEST_ASSERT(within_room(location->bounds, area.room_dimensions), "placement " << i << " left the room");
        TEST_ASSERT(bounds.size() == before + 1, "success appends exactly one rectangle");
        for (size_t j = 0; j < before; ++j) {
            TEST_ASSERT(!rects_overlap(location->bounds, bounds[j]), "placement " << i << " overlaps entry " << j);
        }
        TEST_ASSERT(!rects_overlap(location->bounds, performer_bounds(area.performer.position)), "overlaps performer");
    }
    TEST_ASSERT(placed >= 10, "a 6x6 room holds at least 10 crates, placed " << placed);
    TEST_PASS();
}

bool test_random_fixed_rotation() {
    Rng rng(1);
    const PlacementArea area = origin_area();
    Definition def = box_definition("box", Vec3{0.4, 0.4, 0.4});
    def.rotation.y = 10.0;
    BoundsList bounds;
    RandomPlacementOptions options;
    options.rotation_y = 45.0;
    const auto location = random_location(rng, area, def, bounds, options);
    TEST_ASSERT(location, "empty room always has space");
    TEST_ASSERT(near(location->rotation.y, 55.0), "base rotation plus the fixed rotation");
    TEST_PASS();
}

bool test_front_is_on_the_sight_line() {
    Rng rng(9);
    const PlacementArea area = origin_area();
    const Definition ball = box_definition("ball", Vec3{0.2, 0.2, 0.2});
    for (int i = 0; i < 20; ++i) {
        const auto location = location_in_front_of_performer(rng, area, ball);
        TEST_ASSERT(location, "open room has a front location");
        TEST_ASSERT(near(location->position.x, 0.0, 1e-9), "front location left the sight line");
        TEST_ASSERT(location->position.z >= kMinForwardVisibilityDistance - 1e-9, "front location too close");
        TEST_ASSERT(within_room(location->bounds, area.room_dimensions), "front location outside the room");
    }
    TEST_PASS();
}

bool test_back_is_behind_the_performer() {
    Rng rng(10);
    const PlacementArea area = origin_area();
    const Definition ball = box_definition("ball", Vec3{0.2, 0.2, 0.2});
    for (int i = 0; i < 20; ++i) {
        const auto location = location_in_back_of_performer(rng, area, ball);
        TEST_ASSERT(location, "open room has a back location");
        TEST_ASSERT(location->position.z <= -0.5 - 0.1 + 1e-9, "back location not behind the performer");
        TEST_ASSERT(within_room(location->bounds, area.room_dimensions), "back location outside the room");
    }
    TEST_PASS();
}

bool test_obstruct_hides_the_anchor() {
    Rng rng(3);
    const PlacementArea area = origin_area();
    const Definition target = box_definition("ball", Vec3{0.3, 0.3, 0.3});
    const Definition wall = box_definition("wall", Vec3{1.5, 1.0, 0.2});
    const Location anchor = anchor_at(target, Vec3{0.0, 0.0, 4.0});
    BoundsList bounds{anchor.bounds};

    const auto location =
        location_in_line_with_object(rng, area, wall, target, anchor, bounds, InLineMode::kObstruct);
    TEST_ASSERT(location, "a wide wall can hide the ball");
    TEST_ASSERT(does_fully_obstruct(area.performer.position, anchor.bounds, location->bounds.box_xz), "not hidden");
    TEST_ASSERT(location->position.z > 0.0 && location->position.z < 4.0, "wall is not between");
    TEST_ASSERT(bounds.size() == 1, "in-line search never appends");
    TEST_PASS();
}

bool test_unreachable_blocks_the_reach() {
    Rng rng(4);
    const PlacementArea area = origin_area();
    const Definition target = box_definition("ball", Vec3{0.3, 0.3, 0.3});
    const Definition couch = box_definition("couch", Vec3{1.5, 0.8, 0.6});
    const Location anchor = anchor_at(target, Vec3{3.0, 0.0, 3.0});

    const auto location =
        location_in_line_with_object(rng, area, couch, target, anchor, BoundsList{}, InLineMode::kUnreachable);
    TEST_ASSERT(location, "room for a couch between performer and ball");
    const double reach = bounds_distance(location->bounds, anchor.bounds) + 0.3;
    TEST_ASSERT(reach > kMaxReach, "couch too close to block the reach: " << reach);
    TEST_ASSERT(
        planar_distance(location->position, area.performer.position) <
            planar_distance(anchor.position, area.performer.position),
        "couch is not on the performer's side"
    );
    TEST_PASS();
}

bool test_close_adjacent_and_behind() {
    Rng rng(5);
    const PlacementArea area = origin_area();
    const Definition anchor_def = box_definition("crate", Vec3{0.5, 0.5, 0.5});
    const Definition toy = box_definition("toy", Vec3{0.3, 0.3, 0.3});
    const Location anchor = anchor_at(anchor_def, Vec3{0.0, 0.0, 3.0});
    const BoundsList bounds{anchor.bounds};
    const double anchor_distance = planar_distance(anchor.position, area.performer.position);

    const auto close = location_in_line_with_object(rng, area, toy, anchor_def, anchor, bounds, InLineMode::kClose);
    TEST_ASSERT(close, "close location exists");
    TEST_ASSERT(planar_distance(close->position, area.performer.position) < anchor_distance, "close is in front");
    TEST_ASSERT(!rects_overlap(close->bounds, anchor.bounds), "close overlaps the anchor");

    const auto adjacent =
        location_in_line_with_object(rng, area, toy, anchor_def, anchor, bounds, InLineMode::kAdjacent);
    TEST_ASSERT(adjacent, "adjacent location exists");
    TEST_ASSERT(bounds_distance(adjacent->bounds, anchor.bounds) <= 0.5, "adjacent is too far");
    TEST_ASSERT(near(adjacent->position.z, anchor.position.z, 1e-9), "adjacent is beside the anchor");

    const auto behind = location_in_line_with_object(rng, area, toy, anchor_def, anchor, bounds, InLineMode::kBehind);
    TEST_ASSERT(behind, "behind location exists");
    TEST_ASSERT(planar_distance(behind->position, area.performer.position) > anchor_distance, "behind is in front");
    TEST_PASS();
}

bool test_obstruct_fails_when_anchor_too_close() {
    Rng rng(6);
    const PlacementArea area = origin_area();
    const Definition target = box_definition("ball", Vec3{0.3, 0.3, 0.3});
    const Definition wall = box_definition("wall", Vec3{1.5, 1.0, 0.2});
    const Location anchor = anchor_at(target, Vec3{0.0, 0.0, 0.5});
    const auto location =
        location_in_line_with_object(rng, area, wall, target, anchor, BoundsList{}, InLineMode::kObstruct);
    TEST_ASSERT(!location, "no room between performer and a ball at arm's length");
    TEST_PASS();
}

bool test_far_from_anchor() {
    Rng rng(8);
    const PlacementArea area = origin_area();
    const Definition toy = box_definition("toy", Vec3{0.3, 0.3, 0.3});
    const Location anchor = anchor_at(toy, Vec3{2.0, 0.0, 2.0});
    for (int i = 0; i < 10; ++i) {
        BoundsList bounds{anchor.bounds};
        const auto location = location_far_from(rng, area, toy, anchor.bounds, bounds);
        TEST_ASSERT(location, "a 10x10 room has far locations");
        TEST_ASSERT(bounds_distance(location->bounds, anchor.bounds) > kMinObjectsSeparationDistance, "not far");
        TEST_ASSERT(bounds.size() == 2, "far placement appends its rectangle");
    }
    TEST_PASS();
}

}  // namespace

int main() {
    std::cout << "================================================" << std::endl;
    std::cout << "Placement Tests" << std::endl;
    std::cout << "================================================" << std::endl;

    RUN_TEST(test_random_stays_in_room_when_dense);
    RUN_TEST(test_random_fixed_rotation);
    RUN_TEST(test_front_is_on_the_sight_line);
    RUN_TEST(test_back_is_behind_the_performer);
    RUN_TEST(test_obstruct_hides_the_anchor);
    RUN_TEST(test_unreachable_blocks_the_reach);
    RUN_TEST(test_close_adjacent_and_behind);
    RUN_TEST(test_obstruct_fails_when_anchor_too_close);
    RUN_TEST(test_far_from_anchor);

    return report_results("Placement");
}
