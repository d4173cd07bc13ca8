#include "scenegen/catalog.hpp"

#include <cmath>

namespace scenegen {
namespace {

const MaterialChoice kBlockWood{{"block_blank"}, {"wood"}, 2.0};
const MaterialChoice kMetal{{"metal"}, {"metal"}, 3.0};
const MaterialChoice kPlastic{{"plastic"}, {"plastic"}, 1.0};
const MaterialChoice kRubber{{"rubber"}, {"rubber"}, 1.5};
const MaterialChoice kWood{{"wood"}, {"wood"}, 2.0};

double round4(double v) {
    return std::round(v * 10000.0) / 10000.0;
}

bool is_of_size(const Vec3& d, double size) {
    return (d.x < size && d.y < size && d.z < size) ||
           ((d.x * d.y * d.z) < size * size * size && d.x < 2.0 * size && d.y < 2.0 * size && d.z < 2.0 * size);
}

std::vector<SizeChoice> sizes(const BaseSize& base, const std::vector<double>& multipliers) {
    std::vector<SizeChoice> out;
    out.reserve(multipliers.size());
    for (double m : multipliers) {
        out.push_back(make_size_choice(base, m));
    }
    return out;
}

Definition base_definition(
    const std::string& type,
    const std::vector<std::string>& attributes,
    const std::vector<std::string>& shape
) {
    Definition def;
    def.type = type;
    def.attributes = attributes;
    def.shape = shape;
    return def;
}

// Openable container with its interior area; x/z/y dims in meters at scale 1.
Definition container(
    const std::string& type,
    const Vec3& dimensions,
    const Vec3& area_dimensions,
    double area_y,
    const std::vector<double>& multipliers,
    bool untrained_shape,
    const std::string& shape
) {
    BaseSize base;
    base.dimensions = dimensions;
    base.mass = 5.0;
    base.offset = Vec3{0.0, dimensions.y * 0.5, 0.0};
    base.position_y = 0.0;
    base.enclosed_areas = {EnclosedArea{Vec3{0.0, area_y, 0.0}, area_dimensions}};

    Definition def = base_definition(type, {"receptacle", "openable"}, {shape});
    def.occluder = true;
    def.untrained_shape = untrained_shape;
    def.choose_material_list = {kMetal, kPlastic, kWood};
    def.choose_size_list = sizes(base, multipliers);
    return def;
}

Definition furniture(
    const std::string& type,
    const BaseSize& base,
    bool obstacle,
    bool occluder,
    bool untrained_shape,
    const std::string& shape
) {
    Definition def = base_definition(type, {"moveable", "receptacle"}, {shape});
    def.obstacle = obstacle;
    def.occluder = occluder;
    def.stack_target = true;
    def.untrained_shape = untrained_shape;
    def.choose_size_list = sizes(base, {1.0});
    return def;
}

}  // namespace

SizeChoice make_size_choice(const BaseSize& base, double multiplier) {
    SizeChoice choice;
    const Vec3 dims{base.dimensions.x * multiplier, base.dimensions.y * multiplier, base.dimensions.z * multiplier};
    choice.dimensions = dims;
    choice.offset = Vec3{base.offset.x * multiplier, base.offset.y * multiplier, base.offset.z * multiplier};
    choice.position_y = base.position_y * multiplier;
    choice.scale = Vec3{multiplier, multiplier, multiplier};
    choice.mass = std::round(base.mass * multiplier * 10000.0) / 10000.0;
    std::vector<EnclosedArea> areas;
    for (const auto& area : base.enclosed_areas) {
        areas.push_back(EnclosedArea{
            Vec3{round4(area.position.x * multiplier), round4(area.position.y * multiplier),
                 round4(area.position.z * multiplier)},
            Vec3{round4(area.dimensions.x * multiplier), round4(area.dimensions.y * multiplier),
                 round4(area.dimensions.z * multiplier)},
        });
    }
    choice.enclosed_areas = areas;
    if (base.sideways) {
        SidewaysVariant sideways = *base.sideways;
        sideways.dimensions = Vec3{sideways.dimensions.x * multiplier, sideways.dimensions.y * multiplier,
                                   sideways.dimensions.z * multiplier};
        sideways.offset = Vec3{sideways.offset.x * multiplier, sideways.offset.y * multiplier,
                               sideways.offset.z * multiplier};
        sideways.position_y *= multiplier;
        choice.sideways = sideways;
    }
    choice.size = choose_size_text(dims);
    return choice;
}

std::string choose_size_text(const Vec3& dimensions) {
    if (is_of_size(dimensions, 0.25)) return "tiny";
    if (is_of_size(dimensions, 0.5)) return "small";
    if (is_of_size(dimensions, 1.0)) return "medium";
    if (is_of_size(dimensions, 1.5)) return "large";
    return "huge";
}

Definition create_soccer_ball(double size) {
    static const BaseSize base{Vec3{0.22, 0.22, 0.22}, 1.0, Vec3{0.0, 0.11, 0.0}, 0.11, {}, std::nullopt};
    Definition def = base_definition("soccer_ball", {"moveable", "pickupable"}, {"ball"});
    def.color = {"white", "black"};
    def.salient_materials = {"rubber"};
    def.choose_size_list = {make_size_choice(base, size)};
    return def;
}

const DefinitionDataset& pickupable_dataset() {
    static const DefinitionDataset dataset = [] {
        const BaseSize primitive{Vec3{1.0, 1.0, 1.0}, 1.0, Vec3{0.0, 0.5, 0.0}, 0.5, {}, std::nullopt};
        const BaseSize block{Vec3{0.1, 0.1, 0.1}, 0.333, Vec3{0.0, 0.05, 0.0}, 0.05, {}, std::nullopt};
        const BaseSize duck{Vec3{0.21, 0.17, 0.065}, 1.0, Vec3{0.0, 0.085, 0.0}, 0.005, {}, std::nullopt};
        const BaseSize racecar{Vec3{0.07, 0.06, 0.15}, 0.5, Vec3{0.0, 0.03, 0.0}, 0.005, {}, std::nullopt};
        const BaseSize turtle{Vec3{0.24, 0.14, 0.085}, 1.0, Vec3{0.0, 0.07, 0.0}, 0.005, {}, std::nullopt};
        const BaseSize trophy{
            Vec3{0.19, 0.3, 0.14},
            1.0,
            Vec3{0.0, 0.15, 0.0},
            0.005,
            {},
            SidewaysVariant{Vec3{0.19, 0.14, 0.3}, Vec3{0.0, 0.0, 0.15}, 0.075, Vec3{90.0, 0.0, 0.0}},
        };

        Definition ball = base_definition("ball", {"moveable", "pickupable"}, {"ball"});
        ball.choose_material_list = {kPlastic, kRubber};
        ball.choose_size_list = sizes(primitive, {0.05, 0.1, 0.25, 0.5});

        Definition soccer_ball = create_soccer_ball();
        soccer_ball.choose_size_list.push_back(make_size_choice(
            BaseSize{Vec3{0.22, 0.22, 0.22}, 1.0, Vec3{0.0, 0.11, 0.0}, 0.11, {}, std::nullopt},
            2.0
        ));

        Definition cube = base_definition("block_blank_wood_cube", {"moveable", "pickupable"}, {"block"});
        cube.choose_material_list = {kBlockWood};
        cube.choose_size_list = sizes(block, {1.0, 2.0});

        Definition cylinder = base_definition("block_blank_wood_cylinder", {"moveable", "pickupable"}, {"cylinder"});
        cylinder.choose_material_list = {kBlockWood};
        cylinder.choose_size_list = sizes(block, {1.0, 2.0});

        Definition duck_on_wheels = base_definition("duck_on_wheels", {"moveable", "pickupable"}, {"duck"});
        duck_on_wheels.choose_material_list = {kWood};
        duck_on_wheels.choose_size_list = sizes(duck, {1.0, 1.5, 2.0});

        Definition toy_racecar = base_definition("racecar_red", {"moveable", "pickupable"}, {"car"});
        toy_racecar.color = {"red"};
        toy_racecar.salient_materials = {"wood"};
        toy_racecar.choose_size_list = sizes(racecar, {1.0, 1.5, 2.0});

        Definition turtle_on_wheels = base_definition("turtle_on_wheels", {"moveable", "pickupable"}, {"turtle"});
        turtle_on_wheels.untrained_shape = true;
        turtle_on_wheels.choose_material_list = {kWood};
        turtle_on_wheels.choose_size_list = sizes(turtle, {1.0, 1.5, 2.0});

        Definition trophy_def = base_definition("trophy", {"moveable", "pickupable"}, {"trophy"});
        trophy_def.color = {"grey"};
        trophy_def.salient_materials = {"metal"};
        trophy_def.choose_size_list = sizes(trophy, {1.0});

        return create_dataset({
            {ball, soccer_ball},
            {cube, cylinder},
            {duck_on_wheels, toy_racecar, turtle_on_wheels},
            {trophy_def},
        });
    }();
    return dataset;
}

const DefinitionDataset& container_dataset() {
    static const DefinitionDataset dataset = [] {
        const std::vector<double> case_sizes = {1.0, 1.25, 1.5, 2.0, 2.25, 2.5};
        return create_dataset({
            {
                container("case_1", {0.71, 0.19, 0.54}, {0.69, 0.175, 0.4}, 0.0925, case_sizes, false, "case"),
                container("case_3", {0.81, 0.21, 0.78}, {0.79, 0.17, 0.53}, 0.105, case_sizes, false, "case"),
            },
            {
                container(
                    "chest_1", {0.83, 0.42, 0.55}, {0.77, 0.33, 0.49}, 0.195, {0.3, 0.5, 0.7, 0.9, 1.1, 1.3}, false,
                    "chest"
                ),
                container(
                    "chest_2", {0.52, 0.42, 0.72}, {0.44, 0.25, 0.31}, 0.165, {0.5, 0.75, 1.25, 1.5, 1.75, 2.0},
                    false, "chest"
                ),
                container(
                    "chest_3", {0.46, 0.26, 0.52}, {0.35, 0.12, 0.21}, 0.09, {0.8, 1.2, 1.6, 2.0, 2.4}, false, "chest"
                ),
            },
            {
                container(
                    "chest_4", {0.72, 0.35, 0.6}, {0.64, 0.24, 0.24}, 0.16, {0.5, 0.75, 1.25, 1.5}, true, "chest"
                ),
                container(
                    "chest_8", {0.42, 0.32, 0.68}, {0.36, 0.135, 0.28}, 0.09, {0.8, 1.2, 1.8, 2.4, 3.0}, true, "chest"
                ),
            },
        });
    }();
    return dataset;
}

const DefinitionDataset& obstacle_occluder_dataset() {
    static const DefinitionDataset dataset = [] {
        Definition chair_1 = furniture(
            "chair_1", BaseSize{{0.54, 1.04, 0.46}, 4.0, {0.0, 0.51, 0.0}, 0.0, {}, std::nullopt}, true, false, false,
            "chair"
        );
        chair_1.choose_material_list = {kWood, kMetal, kPlastic};

        Definition table_1 = furniture(
            "table_1", BaseSize{{0.69, 0.88, 1.63}, 3.0, {0.0, 0.44, 0.0}, 0.0, {}, std::nullopt}, true, false, false,
            "table"
        );
        table_1.choose_material_list = {kWood, kMetal};

        Definition sofa_1 = furniture(
            "sofa_1", BaseSize{{2.64, 1.15, 1.23}, 45.0, {0.0, 0.575, 0.0}, 0.0, {}, std::nullopt}, true, true, false,
            "sofa"
        );
        sofa_1.color = {"brown"};
        sofa_1.salient_materials = {"fabric"};

        Definition sofa_chair_1 = furniture(
            "sofa_chair_1", BaseSize{{1.43, 1.15, 1.23}, 30.0, {0.0, 0.575, 0.0}, 0.0, {}, std::nullopt}, true, true,
            false, "sofa chair"
        );
        sofa_chair_1.color = {"blue"};
        sofa_chair_1.salient_materials = {"fabric"};

        Definition bookcase = furniture(
            "bookcase_1_shelf", BaseSize{{1.0, 1.0, 0.5}, 6.0, {0.0, 0.5, 0.0}, 0.0, {}, std::nullopt}, true, true,
            false, "bookcase"
        );
        bookcase.choose_material_list = {kWood, kMetal};

        Definition antique_chair = furniture(
            "antique_chair_1", BaseSize{{0.76, 1.26, 0.64}, 10.0, {0.0, 0.63, 0.0}, 0.0, {}, std::nullopt}, true,
            false, true, "chair"
        );
        antique_chair.choose_material_list = {kWood};

        Definition antique_sofa = furniture(
            "antique_sofa_1", BaseSize{{2.0, 1.4, 0.68}, 20.0, {0.0, 0.7, 0.0}, 0.0, {}, std::nullopt}, true, true,
            true, "sofa"
        );
        antique_sofa.choose_material_list = {kWood};

        Definition antique_armchair = furniture(
            "antique_armchair_2", BaseSize{{1.4, 1.7, 1.4}, 10.0, {0.0, 0.85, 0.0}, 0.0, {}, std::nullopt}, false,
            true, true, "sofa chair"
        );
        antique_armchair.color = {"blue", "purple", "yellow"};
        antique_armchair.salient_materials = {"fabric", "wood"};

        return create_dataset({
            {chair_1, antique_chair},
            {table_1},
            {sofa_1, sofa_chair_1, antique_sofa, antique_armchair},
            {bookcase},
        });
    }();
    return dataset;
}

}  // namespace scenegen
