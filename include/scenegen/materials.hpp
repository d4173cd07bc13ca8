#pragma once

#include <set>
#include <string>
#include <vector>

namespace scenegen {

struct MaterialTuple {
    std::string id;
    std::vector<std::string> colors;
};

using MaterialList = std::vector<MaterialTuple>;

const MaterialList& block_blank_materials();
const MaterialList& metal_materials();
const MaterialList& plastic_materials();
const MaterialList& rubber_materials();
const MaterialList& wood_materials();
const MaterialList& floor_materials();
const MaterialList& wall_materials();

// Materials whose colors are held back from training scenes.
const std::set<std::string>& untrained_color_materials();

// Category name ("plastic", "wood", ...) to its list; throws std::out_of_range.
const MaterialList& material_category(const std::string& name);

// Material id to its tuple across every category; nullptr when unknown.
const MaterialTuple* find_material(const std::string& id);

}  // namespace scenegen
