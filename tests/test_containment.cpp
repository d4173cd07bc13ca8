// Enclosed-area fitting and putting objects inside containers.

#include <algorithm>
#include <iostream>
#include <stdexcept>

#include "scenegen/containment.hpp"
#include "scenegen/instance.hpp"
#include "test_harness.hpp"

using namespace scenegen;

namespace {

Definition chest(const Vec3& area_dimensions) {
    Definition def = box_definition("chest", Vec3{area_dimensions.x + 0.1, area_dimensions.y + 0.1, area_dimensions.z + 0.1});
    def.attributes = {"receptacle", "openable"};
    def.enclosed_areas = {EnclosedArea{Vec3{0.0, area_dimensions.y * 0.5 + 0.05, 0.0}, area_dimensions}};
    return def;
}

Instance place(const Definition& def, const Vec3& position, Rng& rng) {
    Location location;
    location.position = position;
    location.rotation = def.rotation;
    location.bounds = create_bounds(def.dimensions, def.offset, position, def.rotation, def.position_y);
    return instantiate_object(def, location, rng);
}

bool test_can_enclose_examples() {
    const EnclosedArea area{Vec3{}, Vec3{1.0, 1.0, 1.0}};
    TEST_ASSERT(!can_enclose(area, box_definition("long", Vec3{0.5, 1.0, 2.0})), "2 deep never fits in 1");
    const auto fit = can_enclose(area, box_definition("cube", Vec3{0.5, 0.5, 0.5}));
    TEST_ASSERT(fit && *fit == 0.0, "small cube fits unturned");
    TEST_PASS();
}

bool test_can_enclose_turned() {
    const EnclosedArea area{Vec3{}, Vec3{1.0, 0.5, 0.4}};
    const auto fit = can_enclose(area, box_definition("bar", Vec3{0.3, 0.2, 0.9}));
    TEST_ASSERT(fit && *fit == 90.0, "bar fits only when turned a quarter");
    TEST_ASSERT(!can_enclose(area, box_definition("tall", Vec3{0.3, 0.6, 0.3})), "too tall for the area");
    TEST_PASS();
}

bool test_can_contain_null_targets() {
    const Definition container = chest(Vec3{0.5, 0.3, 0.5});
    const auto empty = can_contain(container, nullptr, nullptr);
    TEST_ASSERT(empty && empty->area_index == 0, "null targets fit the first area");
    TEST_ASSERT(!empty->angle_a && !empty->angle_b, "null targets get no angle");

    const Definition ball = box_definition("ball", Vec3{0.2, 0.2, 0.2});
    const Definition big = box_definition("big", Vec3{0.8, 0.2, 0.8});
    const auto one = can_contain(container, &ball, nullptr);
    TEST_ASSERT(one && one->angle_a && *one->angle_a == 0.0, "ball fits unturned");
    TEST_ASSERT(!can_contain(container, &ball, &big), "each target must fit on its own");

    const Definition solid = box_definition("solid", Vec3{1.0, 1.0, 1.0});
    TEST_ASSERT(!can_contain(solid, nullptr, nullptr), "no enclosed area holds nothing");
    TEST_PASS();
}

bool test_can_contain_both_footprint_within_area() {
    const Vec3 area{0.6, 0.3, 0.4};
    const Definition container = chest(area);
    const double sizes[] = {0.1, 0.15, 0.25, 0.35, 0.45};
    int fits = 0;
    for (double ax : sizes) {
        for (double az : sizes) {
            const Definition a = box_definition("a", Vec3{ax, 0.2, az});
            const Definition b = box_definition("b", Vec3{az, 0.1, ax * 0.5});
            const auto fit = can_contain_both(container, a, b);
            if (!fit) {
                continue;
            }
            ++fits;
            const double a_w = fit->angle_a == 90.0 ? a.dimensions.z : a.dimensions.x;
            const double a_d = fit->angle_a == 90.0 ? a.dimensions.x : a.dimensions.z;
            const double b_w = fit->angle_b == 90.0 ? b.dimensions.z : b.dimensions.x;
            const double b_d = fit->angle_b == 90.0 ? b.dimensions.x : b.dimensions.z;
            double width = 0.0;
            double depth = 0.0;
            if (fit->orientation == Orientation::kSideBySide) {
                width = a_w + b_w;
                depth = std::max(a_d, b_d);
            } else {
                width = std::max(a_w, b_w);
                depth = a_d + b_d;
            }
            TEST_ASSERT(width <= area.x + 1e-12, "layout wider than the area: " << width);
            TEST_ASSERT(depth <= area.z + 1e-12, "layout deeper than the area: " << depth);
        }
    }
    TEST_ASSERT(fits > 0, "some pairs must fit");
    TEST_PASS();
}

bool test_can_contain_both_checks_height() {
    const Definition container = chest(Vec3{1.0, 0.2, 1.0});
    const Definition flat = box_definition("flat", Vec3{0.2, 0.1, 0.2});
    const Definition tall = box_definition("tall", Vec3{0.2, 0.3, 0.2});
    TEST_ASSERT(can_contain_both(container, flat, flat), "two flat boxes fit");
    TEST_ASSERT(!can_contain_both(container, flat, tall), "tall box is higher than the area");
    TEST_PASS();
}

bool test_put_inside_is_repeatable() {
    Rng rng(7);
    const Definition container_def = chest(Vec3{0.5, 0.3, 0.5});
    const Definition toy_def = box_definition("toy", Vec3{0.2, 0.1, 0.3});
    const Instance toy_template = place(toy_def, Vec3{}, rng);

    Instance container_a = place(container_def, Vec3{1.0, 0.0, 2.0}, rng);
    Instance toy_a = toy_template;
    put_object_in_container(toy_a, container_a, 0, 90.0);

    Instance container_b = place(container_def, Vec3{1.0, 0.0, 2.0}, rng);
    Instance toy_b = toy_template;
    put_object_in_container(toy_b, container_b, 0, 90.0);

    TEST_ASSERT(toy_a.bounds.box_xz.size() == toy_b.bounds.box_xz.size(), "same corner count");
    for (size_t i = 0; i < toy_a.bounds.box_xz.size(); ++i) {
        TEST_ASSERT(
            toy_a.bounds.box_xz[i].x == toy_b.bounds.box_xz[i].x && toy_a.bounds.box_xz[i].y == toy_b.bounds.box_xz[i].y,
            "corner " << i << " differs"
        );
    }
    TEST_ASSERT(toy_a.bounds.min_y == toy_b.bounds.min_y && toy_a.bounds.max_y == toy_b.bounds.max_y, "same height");
    TEST_ASSERT(toy_a.rotation.y == 90.0, "rotation applied");
    TEST_ASSERT(toy_a.location_parent && *toy_a.location_parent == container_a.id, "linked to the container");
    TEST_ASSERT(container_a.is_parent_of.size() == 1 && container_a.is_parent_of[0] == toy_a.id, "container knows it");
    TEST_PASS();
}

bool test_put_inside_rests_on_area_floor() {
    Rng rng(11);
    const Definition container_def = chest(Vec3{0.5, 0.3, 0.5});
    Instance container = place(container_def, Vec3{}, rng);
    Instance toy = place(box_definition("toy", Vec3{0.1, 0.1, 0.1}), Vec3{3.0, 0.0, 3.0}, rng);
    put_object_in_container(toy, container, 0);
    const EnclosedArea& area = container.enclosed_areas[0];
    TEST_ASSERT(near(toy.position.y, area.position.y - area.dimensions.y * 0.5), "toy sits on the area floor");
    TEST_ASSERT(near(toy.position.x, area.position.x) && near(toy.position.z, area.position.z), "toy centered");
    TEST_PASS();
}

bool test_child_bounds_are_container_relative() {
    Rng rng(19);
    const Definition container_def = chest(Vec3{0.5, 0.3, 0.5});
    Instance near_corner = place(container_def, Vec3{4.0, 0.0, -3.0}, rng);
    Instance at_center = place(container_def, Vec3{}, rng);
    const Instance toy_template = place(box_definition("toy", Vec3{0.1, 0.1, 0.1}), Vec3{}, rng);

    Instance toy_a = toy_template;
    put_object_in_container(toy_a, near_corner, 0);
    Instance toy_b = toy_template;
    put_object_in_container(toy_b, at_center, 0);

    const BoundingBox box = polygon_bbox(toy_a.bounds.box_xz);
    TEST_ASSERT(near((box.min_x + box.max_x) * 0.5, 0.0, 1e-9), "child x is in room coordinates");
    TEST_ASSERT(near((box.min_y + box.max_y) * 0.5, 0.0, 1e-9), "child z is in room coordinates");
    TEST_ASSERT(near(toy_a.position.x, toy_b.position.x) && near(toy_a.position.z, toy_b.position.z),
                "child position depends on where the container is");
    TEST_PASS();
}

bool test_put_inside_rejects_bad_input() {
    Rng rng(3);
    Instance container = place(chest(Vec3{0.5, 0.3, 0.5}), Vec3{}, rng);
    Instance a = place(box_definition("a", Vec3{0.1, 0.1, 0.1}), Vec3{}, rng);
    Instance b = place(box_definition("b", Vec3{0.1, 0.1, 0.1}), Vec3{}, rng);

    bool threw = false;
    try {
        put_object_in_container(a, container, 3);
    } catch (const std::out_of_range&) {
        threw = true;
    }
    TEST_ASSERT(threw, "missing area must throw std::out_of_range");

    threw = false;
    try {
        put_objects_in_container(a, b, container, 0, Orientation::kSideBySide, 45.0, 0.0);
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    TEST_ASSERT(threw, "45 degrees must throw std::invalid_argument");
    TEST_PASS();
}

bool test_put_two_inside_side_by_side() {
    Rng rng(5);
    const Definition container_def = chest(Vec3{0.6, 0.3, 0.4});
    const Definition a_def = box_definition("a", Vec3{0.25, 0.1, 0.2});
    const Definition b_def = box_definition("b", Vec3{0.3, 0.1, 0.2});
    const auto fit = can_contain_both(container_def, a_def, b_def);
    TEST_ASSERT(fit, "pair fits");
    Instance container = place(container_def, Vec3{}, rng);
    Instance a = place(a_def, Vec3{}, rng);
    Instance b = place(b_def, Vec3{}, rng);
    put_objects_in_container(a, b, container, fit->area_index, fit->orientation, fit->angle_a, fit->angle_b);
    TEST_ASSERT(!rects_overlap(a.bounds, b.bounds), "objects inside do not overlap");
    TEST_ASSERT(container.is_parent_of.size() == 2, "container holds both");
    TEST_PASS();
}

}  // namespace

int main() {
    std::cout << "================================================" << std::endl;
    std::cout << "Containment Tests" << std::endl;
    std::cout << "================================================" << std::endl;

    RUN_TEST(test_can_enclose_examples);
    RUN_TEST(test_can_enclose_turned);
    RUN_TEST(test_can_contain_null_targets);
    RUN_TEST(test_can_contain_both_footprint_within_area);
    RUN_TEST(test_can_contain_both_checks_height);
    RUN_TEST(test_put_inside_is_repeatable);
    RUN_TEST(test_put_inside_rests_on_area_floor);
    RUN_TEST(test_child_bounds_are_container_relative);
    RUN_TEST(test_put_inside_rejects_bad_input);
    RUN_TEST(test_put_two_inside_side_by_side);

    return report_results("Containment");
}
