#include "scenegen/instance.hpp"

#include <algorithm>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace scenegen {

std::string make_object_id(Rng& rng) {
    std::uniform_int_distribution<int> hex(0, 15);
    std::ostringstream out;
    out << std::hex;
    for (int i = 0; i < 32; ++i) {
        if (i == 8 || i == 12 || i == 16 || i == 20) {
            out << '-';
        }
        if (i == 12) {
            out << 4;
        } else if (i == 16) {
            out << (8 + hex(rng) % 4);
        } else {
            out << hex(rng);
        }
    }
    return out.str();
}

Instance instantiate_object(const Definition& def, const Location& location, Rng& rng) {
    if (def.has_choices()) {
        throw std::invalid_argument("instantiate_object: definition " + def.type + " still has choice lists");
    }
    if (def.color.empty()) {
        throw std::invalid_argument("instantiate_object: definition " + def.type + " has no colors");
    }

    Instance out;
    out.id = make_object_id(rng);
    out.type = def.type;
    out.position = location.position;
    out.rotation = location.rotation;
    out.scale = def.scale;
    out.bounds = location.bounds;
    out.mass = def.mass * def.mass_multiplier;
    out.attributes = def.attributes;
    out.materials = def.materials;
    out.salient_materials = def.salient_materials;
    out.dimensions = def.dimensions;
    out.offset = def.offset;
    out.position_y = def.position_y;
    out.original_rotation = def.rotation;
    out.enclosed_areas = def.enclosed_areas;
    out.shape = def.shape;
    out.size = def.size;
    out.untrained_category = def.untrained_category;
    out.untrained_color = def.untrained_color;
    out.untrained_combination = def.untrained_combination;
    out.untrained_shape = def.untrained_shape;
    out.untrained_size = def.untrained_size;

    out.color = def.color;
    std::sort(out.color.begin(), out.color.end());
    out.color.erase(std::unique(out.color.begin(), out.color.end()), out.color.end());

    if (def.has_attribute("pickupable")) {
        out.weight = "light";
    } else if (def.has_attribute("moveable")) {
        out.weight = "heavy";
    } else {
        out.weight = "massive";
    }

    // size weight color(s) material(s) shape
    std::vector<std::string> words;
    if (!out.size.empty()) {
        words.push_back(out.size);
    }
    words.push_back(out.weight);
    words.insert(words.end(), out.color.begin(), out.color.end());
    words.insert(words.end(), out.salient_materials.begin(), out.salient_materials.end());
    words.insert(words.end(), out.shape.begin(), out.shape.end());
    std::ostringstream goal;
    for (size_t i = 0; i < words.size(); ++i) {
        goal << (i ? " " : "") << words[i];
    }
    out.goal_string = goal.str();
    return out;
}

void move_to_location(Instance& instance, const Location& location, const Definition& location_def) {
    instance.position = location.position;
    instance.position.x += location_def.offset.x - instance.offset.x;
    instance.position.z += location_def.offset.z - instance.offset.z;
    instance.position.y += instance.position_y - location_def.position_y;
    instance.rotation = location.rotation;
    instance.bounds =
        create_bounds(instance.dimensions, instance.offset, instance.position, instance.rotation, instance.position_y);
}

}  // namespace scenegen
