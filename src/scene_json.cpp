#include "scenegen/scene_json.hpp"

#include <algorithm>

namespace scenegen {
namespace {

nlohmann::json vec3_json(const Vec3& v) {
    return nlohmann::json{{"x", v.x}, {"y", v.y}, {"z", v.z}};
}

bool has_attribute(const Instance& object, const char* name) {
    return std::find(object.attributes.begin(), object.attributes.end(), name) != object.attributes.end();
}

nlohmann::json object_json(const Instance& object) {
    nlohmann::json j;
    j["id"] = object.id;
    j["type"] = object.type;
    j["role"] = object.role;
    j["materials"] = object.materials;
    j["salientMaterials"] = object.salient_materials;
    j["mass"] = object.mass;
    for (const char* attribute : {"moveable", "pickupable", "receptacle", "openable"}) {
        j[attribute] = has_attribute(object, attribute);
    }
    if (object.location_parent) {
        j["locationParent"] = *object.location_parent;
    }
    if (object.can_contain_target) {
        j["canContainTarget"] = *object.can_contain_target;
    }

    nlohmann::json show;
    show["stepBegin"] = 0;
    show["position"] = vec3_json(object.position);
    show["rotation"] = vec3_json(object.rotation);
    show["scale"] = vec3_json(object.scale);
    j["shows"] = nlohmann::json::array({show});

    nlohmann::json debug;
    debug["color"] = object.color;
    debug["shape"] = object.shape;
    debug["size"] = object.size;
    debug["weight"] = object.weight;
    debug["goalString"] = object.goal_string;
    debug["dimensions"] = vec3_json(object.dimensions);
    debug["untrainedCategory"] = object.untrained_category;
    debug["untrainedColor"] = object.untrained_color;
    debug["untrainedCombination"] = object.untrained_combination;
    debug["untrainedShape"] = object.untrained_shape;
    debug["untrainedSize"] = object.untrained_size;
    j["debug"] = debug;
    return j;
}

}  // namespace

nlohmann::json scene_document(const Scene& scene) {
    nlohmann::json j;
    j["name"] = scene.name;
    j["version"] = 2;
    j["roomDimensions"] = vec3_json(scene.room_dimensions);
    j["performerStart"] = {
        {"position", vec3_json(scene.performer_start.position)},
        {"rotation", vec3_json(scene.performer_start.rotation)},
    };
    j["floorMaterial"] = scene.floor_material;
    j["wallMaterial"] = scene.wall_material;
    j["evaluationOnly"] = scene.evaluation_only;

    const SceneGoal& goal = scene.goal;
    nlohmann::json scene_info;
    scene_info["id"] = goal.scene_id.empty() ? std::vector<std::string>{} : std::vector<std::string>{goal.scene_id};
    scene_info["slices"] = goal.slices;
    scene_info["tertiaryType"] = goal.category;
    scene_info["count"] = nlohmann::json::object();
    for (const auto& count : goal.role_counts) {
        scene_info["count"][count.first] = count.second;
    }
    for (const auto& tag : goal.slice_tags) {
        scene_info[tag.first] = tag.second;
    }

    nlohmann::json goal_json;
    goal_json["category"] = goal.category;
    goal_json["description"] = goal.description;
    goal_json["last_step"] = goal.last_step;
    goal_json["metadata"]["target"]["id"] = goal.target_id;
    goal_json["sceneInfo"] = scene_info;
    j["goal"] = goal_json;

    j["objects"] = nlohmann::json::array();
    for (const auto& object : scene.objects) {
        j["objects"].push_back(object_json(object));
    }

    j["debug"] = {
        {"hypercubeName", scene.hypercube_name},
        {"hypercubeId", scene.hypercube_id},
        {"floorColors", scene.floor_colors},
        {"wallColors", scene.wall_colors},
    };
    return j;
}

void write_scene_json(std::ostream& out, const Scene& scene) {
    out << scene_document(scene).dump() << "\n";
}

std::string scene_to_json(const Scene& scene) {
    return scene_document(scene).dump() + "\n";
}

std::string scene_file_name(const std::string& prefix, const Scene& scene, int index) {
    std::string stem = scene.hypercube_name;
    if (!scene.goal.scene_id.empty()) {
        stem += "_" + scene.goal.scene_id;
    } else {
        stem += "_" + std::to_string(index + 1);
    }
    for (char& c : stem) {
        if (c == ' ') {
            c = '_';
        }
    }
    return prefix + stem + ".json";
}

}  // namespace scenegen
