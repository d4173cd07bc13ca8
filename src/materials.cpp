#include "scenegen/materials.hpp"

#include <map>
#include <stdexcept>

namespace scenegen {
namespace {

const MaterialTuple kBlackWood{"AI2-THOR/Materials/Wood/BlackWood", {"black"}};
const MaterialTuple kDarkWood2{"AI2-THOR/Materials/Wood/DarkWood2", {"black"}};
const MaterialTuple kDarkWoodSmooth2{"AI2-THOR/Materials/Wood/DarkWoodSmooth2", {"black"}};
const MaterialTuple kLightWoodCounters1{"AI2-THOR/Materials/Wood/LightWoodCounters 1", {"brown", "orange"}};
const MaterialTuple kWoodFine{"AI2-THOR/Materials/Wood/TexturesCom_WoodFine0050_1_seamless_S", {"brown", "red"}};
const MaterialTuple kWornWood{"AI2-THOR/Materials/Wood/WornWood", {"brown", "black"}};
const MaterialTuple kKinderBlueWood{"UnityAssetStore/Kindergarten_Interior/Models/Materials/color wood 1", {"blue"}};
const MaterialTuple kKinderRedWood{"UnityAssetStore/Kindergarten_Interior/Models/Materials/color wood 2", {"red"}};
const MaterialTuple kKinderGreenWood{"UnityAssetStore/Kindergarten_Interior/Models/Materials/color wood 3", {"green"}};
const MaterialTuple kKinderYellowWood{"UnityAssetStore/Kindergarten_Interior/Models/Materials/color wood 4", {"yellow"}};
const MaterialTuple kNurseryBrownWood{"UnityAssetStore/Baby_Room/Models/Materials/wood 1", {"brown"}};

const MaterialTuple kDrywall{"AI2-THOR/Materials/Walls/Drywall", {"white", "grey"}};
const MaterialTuple kDrywallBeige{"AI2-THOR/Materials/Walls/DrywallBeige", {"white", "brown"}};

const std::map<std::string, const MaterialList*>& categories() {
    static const std::map<std::string, const MaterialList*> table = {
        {"block_blank", &block_blank_materials()},
        {"metal", &metal_materials()},
        {"plastic", &plastic_materials()},
        {"rubber", &rubber_materials()},
        {"wood", &wood_materials()},
        {"floor", &floor_materials()},
        {"wall", &wall_materials()},
    };
    return table;
}

}  // namespace

const MaterialList& block_blank_materials() {
    static const MaterialList list = {
        {"UnityAssetStore/Wooden_Toys_Bundle/ToyBlocks/meshes/Materials/blue_1x1", {"blue"}},
        {"UnityAssetStore/Wooden_Toys_Bundle/ToyBlocks/meshes/Materials/gray_1x1", {"grey"}},
        {"UnityAssetStore/Wooden_Toys_Bundle/ToyBlocks/meshes/Materials/green_1x1", {"green"}},
        {"UnityAssetStore/Wooden_Toys_Bundle/ToyBlocks/meshes/Materials/red_1x1", {"red"}},
        {"UnityAssetStore/Wooden_Toys_Bundle/ToyBlocks/meshes/Materials/wood_1x1", {"brown"}},
        {"UnityAssetStore/Wooden_Toys_Bundle/ToyBlocks/meshes/Materials/yellow_1x1", {"yellow"}},
    };
    return list;
}

const MaterialList& metal_materials() {
    static const MaterialList list = {
        {"AI2-THOR/Materials/Metals/BlackSmoothMeta", {"black"}},
        {"AI2-THOR/Materials/Metals/Brass 1", {"yellow", "brown"}},
        {"AI2-THOR/Materials/Metals/BrownMetal 1", {"brown"}},
        {"AI2-THOR/Materials/Metals/BrushedAluminum_Blue", {"blue", "grey"}},
        {"AI2-THOR/Materials/Metals/BrushedIron_AlbedoTransparency", {"black", "grey"}},
        {"AI2-THOR/Materials/Metals/GenericStainlessSteel", {"grey"}},
        {"AI2-THOR/Materials/Metals/HammeredMetal_AlbedoTransparency 1", {"brown"}},
        {"AI2-THOR/Materials/Metals/Metal", {"grey", "white"}},
        {"AI2-THOR/Materials/Metals/WhiteMetal", {"white"}},
        {"UnityAssetStore/Baby_Room/Models/Materials/cabinet metal", {"grey"}},
    };
    return list;
}

const MaterialList& plastic_materials() {
    static const MaterialList list = {
        {"AI2-THOR/Materials/Plastics/BlackPlastic", {"black"}},
        {"AI2-THOR/Materials/Plastics/OrangePlastic", {"orange"}},
        {"AI2-THOR/Materials/Plastics/WhitePlastic", {"white"}},
        {"UnityAssetStore/Kindergarten_Interior/Models/Materials/color 1", {"red"}},
        {"UnityAssetStore/Kindergarten_Interior/Models/Materials/color 2", {"blue"}},
        {"UnityAssetStore/Kindergarten_Interior/Models/Materials/color 3", {"green"}},
        {"UnityAssetStore/Kindergarten_Interior/Models/Materials/color 4", {"yellow"}},
    };
    return list;
}

const MaterialList& rubber_materials() {
    static const MaterialList list = {
        {"AI2-THOR/Materials/Plastics/BlueRubber", {"blue"}},
        {"AI2-THOR/Materials/Plastics/LightBlueRubber", {"blue"}},
    };
    return list;
}

const MaterialList& wood_materials() {
    static const MaterialList list = {
        {"AI2-THOR/Materials/Wood/BedroomFloor1", {"brown", "orange"}},
        kBlackWood,
        kDarkWood2,
        kDarkWoodSmooth2,
        kLightWoodCounters1,
        {"AI2-THOR/Materials/Wood/LightWoodCounters3", {"brown", "red"}},
        {"AI2-THOR/Materials/Wood/LightWoodCounters4", {"brown"}},
        kWoodFine,
        {"AI2-THOR/Materials/Wood/WhiteWood", {"white"}},
        {"AI2-THOR/Materials/Wood/WoodFloorsCross", {"brown", "yellow"}},
        {"AI2-THOR/Materials/Wood/WoodGrain_Brown", {"brown"}},
        {"AI2-THOR/Materials/Wood/WoodGrain_Tan", {"brown"}},
        kWornWood,
        kKinderBlueWood,
        kKinderRedWood,
        kKinderGreenWood,
        kKinderYellowWood,
        kNurseryBrownWood,
    };
    return list;
}

const MaterialList& floor_materials() {
    static const MaterialList list = {
        {"AI2-THOR/Materials/Fabrics/Carpet2", {"brown", "grey"}},
        {"AI2-THOR/Materials/Fabrics/Carpet3", {"brown"}},
        {"AI2-THOR/Materials/Fabrics/Carpet4", {"blue", "black"}},
        {"AI2-THOR/Materials/Fabrics/Carpet8", {"black"}},
        {"AI2-THOR/Materials/Fabrics/CarpetDark", {"yellow", "brown"}},
        {"AI2-THOR/Materials/Fabrics/CarpetDark 1", {"brown"}},
        {"AI2-THOR/Materials/Fabrics/CarpetDarkGreen", {"green"}},
        {"AI2-THOR/Materials/Fabrics/CarpetGreen", {"green"}},
        {"AI2-THOR/Materials/Fabrics/CarpetWhite", {"white"}},
        {"AI2-THOR/Materials/Fabrics/CarpetWhite 3", {"white", "grey"}},
        kDarkWood2,
        kDarkWoodSmooth2,
        kLightWoodCounters1,
        kWoodFine,
        kWornWood,
        kKinderBlueWood,
        kKinderRedWood,
        kKinderGreenWood,
        kKinderYellowWood,
        kNurseryBrownWood,
    };
    return list;
}

const MaterialList& wall_materials() {
    static const MaterialList list = {
        {"AI2-THOR/Materials/Walls/BrownDrywall", {"brown"}},
        kDrywall,
        kDrywallBeige,
        {"AI2-THOR/Materials/Walls/DrywallGreen", {"green"}},
        {"AI2-THOR/Materials/Walls/DrywallOrange", {"orange"}},
        {"AI2-THOR/Materials/Walls/Drywall4Tiled", {"white"}},
        {"AI2-THOR/Materials/Walls/EggshellDrywall", {"blue"}},
        {"AI2-THOR/Materials/Walls/RedDrywall", {"red"}},
        {"AI2-THOR/Materials/Walls/WallDrywallGrey", {"grey", "white"}},
        {"AI2-THOR/Materials/Walls/YellowDrywall", {"yellow"}},
    };
    return list;
}

const std::set<std::string>& untrained_color_materials() {
    // Empty for the current evaluation round.
    static const std::set<std::string> ids;
    return ids;
}

const MaterialList& material_category(const std::string& name) {
    const auto& table = categories();
    const auto it = table.find(name);
    if (it == table.end()) {
        throw std::out_of_range("material_category: unknown category " + name);
    }
    return *it->second;
}

const MaterialTuple* find_material(const std::string& id) {
    for (const auto& entry : categories()) {
        for (const auto& material : *entry.second) {
            if (material.id == id) {
                return &material;
            }
        }
    }
    return nullptr;
}

}  // namespace scenegen
