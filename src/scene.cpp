#include "scenegen/scene.hpp"

namespace scenegen {

const std::vector<std::string>& scene_roles() {
    static const std::vector<std::string> roles{
        role::kTarget, role::kConfusor, role::kContainer, role::kContext, role::kObstacle, role::kOccluder,
    };
    return roles;
}

int step_limit_from_dimensions(double room_x, double room_z) {
    const double x = room_x > 0.0 ? room_x : kDefaultRoomDimensions.x;
    const double z = room_z > 0.0 ? room_z : kDefaultRoomDimensions.z;
    const double moving = (x * 10.0 + z * 10.0) * 2.0;
    const double rotating = 100.0;
    return static_cast<int>((moving + rotating) * 5.0);
}

const Instance* find_object(const Scene& scene, const std::string& id) {
    for (const auto& object : scene.objects) {
        if (object.id == id) {
            return &object;
        }
    }
    return nullptr;
}

std::vector<const Instance*> objects_with_role(const Scene& scene, const std::string& role_name) {
    std::vector<const Instance*> out;
    for (const auto& object : scene.objects) {
        if (object.role == role_name) {
            out.push_back(&object);
        }
    }
    return out;
}

}  // namespace scenegen
