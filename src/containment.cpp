#include "scenegen/containment.hpp"

#include <algorithm>
#include <stdexcept>
#include <string>

namespace scenegen {
namespace {

const EnclosedArea& area_at(const Instance& container, int area_index) {
    if (area_index < 0 || area_index >= static_cast<int>(container.enclosed_areas.size())) {
        throw std::out_of_range(
            "enclosed area " + std::to_string(area_index) + " not found on container " + container.type
        );
    }
    return container.enclosed_areas[static_cast<size_t>(area_index)];
}

void link(Instance& child, Instance& container, int area_index) {
    child.location_parent = container.id;
    child.parent_area = area_index;
    container.is_parent_of.push_back(child.id);
}

void refresh_bounds(Instance& instance) {
    instance.bounds =
        create_bounds(instance.dimensions, instance.offset, instance.position, instance.rotation, instance.position_y);
}

bool quarter_turn(double rotation) {
    return rotation == 0.0 || rotation == 90.0;
}

}  // namespace

std::optional<double> can_enclose(const EnclosedArea& area, const Definition& target) {
    const Vec3& a = area.dimensions;
    const Vec3& t = target.dimensions;
    if (a.x >= t.x && a.y >= t.y && a.z >= t.z) {
        return 0.0;
    }
    if (a.x >= t.z && a.y >= t.y && a.z >= t.x) {
        return 90.0;
    }
    return std::nullopt;
}

std::optional<ContainFit> can_contain(const Definition& container, const Definition* target_a, const Definition* target_b) {
    for (size_t i = 0; i < container.enclosed_areas.size(); ++i) {
        const EnclosedArea& area = container.enclosed_areas[i];
        ContainFit fit;
        fit.area_index = static_cast<int>(i);
        if (target_a) {
            fit.angle_a = can_enclose(area, *target_a);
            if (!fit.angle_a) {
                continue;
            }
        }
        if (target_b) {
            fit.angle_b = can_enclose(area, *target_b);
            if (!fit.angle_b) {
                continue;
            }
        }
        return fit;
    }
    return std::nullopt;
}

std::optional<ContainBothFit> can_contain_both(
    const Definition& container,
    const Definition& target_a,
    const Definition& target_b
) {
    const double ax = target_a.dimensions.x;
    const double az = target_a.dimensions.z;
    const double bx = target_b.dimensions.x;
    const double bz = target_b.dimensions.z;
    const double height = std::max(target_a.dimensions.y, target_b.dimensions.y);

    struct Layout {
        double width;
        double depth;
        double angle_a;
        double angle_b;
        Orientation orientation;
    };
    const Layout layouts[] = {
        {ax + bx, std::max(az, bz), 0.0, 0.0, Orientation::kSideBySide},
        {ax + bz, std::max(az, bx), 0.0, 90.0, Orientation::kSideBySide},
        {az + bx, std::max(ax, bz), 90.0, 0.0, Orientation::kSideBySide},
        {az + bz, std::max(ax, bx), 90.0, 90.0, Orientation::kSideBySide},
        {std::max(ax, bx), az + bz, 0.0, 0.0, Orientation::kFrontToBack},
        {std::max(ax, bz), az + bx, 0.0, 90.0, Orientation::kFrontToBack},
        {std::max(az, bx), ax + bz, 90.0, 0.0, Orientation::kFrontToBack},
        {std::max(az, bz), ax + bx, 90.0, 90.0, Orientation::kFrontToBack},
    };

    for (size_t i = 0; i < container.enclosed_areas.size(); ++i) {
        const Vec3& c = container.enclosed_areas[i].dimensions;
        if (c.y < height) {
            continue;
        }
        for (const auto& layout : layouts) {
            if (c.x >= layout.width && c.z >= layout.depth) {
                return ContainBothFit{static_cast<int>(i), layout.angle_a, layout.angle_b, layout.orientation};
            }
        }
    }
    return std::nullopt;
}

void put_object_in_container(Instance& instance, Instance& container, int area_index, std::optional<double> rotation) {
    const EnclosedArea& area = area_at(container, area_index);
    const bool sideways = rotation && *rotation == 90.0;

    instance.position = area.position;
    instance.position.x -= sideways ? instance.offset.z : instance.offset.x;
    instance.position.z -= sideways ? instance.offset.x : instance.offset.z;
    // Rest on the floor of the area.
    instance.position.y += -area.dimensions.y * 0.5 + instance.position_y;
    if (rotation) {
        instance.rotation.y = *rotation;
    }
    refresh_bounds(instance);
    link(instance, container, area_index);
}

void put_objects_in_container(
    Instance& object_a,
    Instance& object_b,
    Instance& container,
    int area_index,
    Orientation orientation,
    double rotation_a,
    double rotation_b
) {
    if (!quarter_turn(rotation_a)) {
        throw std::invalid_argument(
            "put_objects_in_container: only 0 and 90 degree rotations supported for object a, not " +
            std::to_string(rotation_a)
        );
    }
    if (!quarter_turn(rotation_b)) {
        throw std::invalid_argument(
            "put_objects_in_container: only 0 and 90 degree rotations supported for object b, not " +
            std::to_string(rotation_b)
        );
    }
    const EnclosedArea& area = area_at(container, area_index);

    object_a.position = area.position;
    object_b.position = area.position;
    if (orientation == Orientation::kSideBySide) {
        const double width_a = rotation_a == 0.0 ? object_a.dimensions.x : object_a.dimensions.z;
        const double width_b = rotation_b == 0.0 ? object_b.dimensions.x : object_b.dimensions.z;
        object_a.position.x -= width_a * 0.5;
        object_b.position.x += width_b * 0.5;
    } else {
        const double depth_a = rotation_a == 0.0 ? object_a.dimensions.z : object_a.dimensions.x;
        const double depth_b = rotation_b == 0.0 ? object_b.dimensions.z : object_b.dimensions.x;
        object_a.position.z -= depth_a * 0.5;
        object_b.position.z += depth_b * 0.5;
    }
    object_a.position.y += -area.dimensions.y * 0.5 + object_a.position_y;
    object_b.position.y += -area.dimensions.y * 0.5 + object_b.position_y;
    object_a.rotation.y = rotation_a;
    object_b.rotation.y = rotation_b;
    refresh_bounds(object_a);
    refresh_bounds(object_b);
    link(object_a, container, area_index);
    link(object_b, container, area_index);
}

}  // namespace scenegen
