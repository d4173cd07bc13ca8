#pragma once

#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "scenegen/bounds.hpp"
#include "scenegen/random.hpp"

namespace scenegen {

constexpr double kMaxSizeDiff = 0.05;

struct EnclosedArea {
    Vec3 position;
    Vec3 dimensions;
};

// Alternate orientation of a definition (for example a toy lying on its side).
struct SidewaysVariant {
    Vec3 dimensions;
    Vec3 offset;
    double position_y = 0.0;
    Vec3 rotation;
};

struct MaterialChoice {
    std::vector<std::string> material_category;
    std::vector<std::string> salient_materials;
    double mass_multiplier = 1.0;
};

// Unset fields leave the definition untouched when the choice is applied.
struct SizeChoice {
    std::optional<Vec3> dimensions;
    std::optional<Vec3> offset;
    std::optional<double> position_y;
    std::optional<Vec3> scale;
    std::optional<double> mass;
    std::optional<std::vector<EnclosedArea>> enclosed_areas;
    std::optional<SidewaysVariant> sideways;
    std::optional<std::string> size;
    std::optional<bool> untrained_shape;
    std::optional<bool> untrained_size;
};

struct TypeChoice {
    std::string type;
    std::optional<std::vector<std::string>> color;
    std::optional<std::vector<std::string>> materials;
    std::optional<std::vector<std::string>> shape;
    std::optional<bool> untrained_shape;
    std::vector<MaterialChoice> choose_material_list;
    std::vector<SizeChoice> choose_size_list;
};

enum class UntrainedTag { kCategory, kColor, kCombination, kShape, kSize };

struct Definition {
    std::string type;
    Vec3 dimensions;
    Vec3 offset;
    double position_y = 0.0;
    Vec3 rotation;
    Vec3 scale{1.0, 1.0, 1.0};
    double mass = 1.0;
    double mass_multiplier = 1.0;

    // "moveable", "pickupable", "receptacle", "openable".
    std::vector<std::string> attributes;
    bool obstacle = false;
    bool occluder = false;
    bool stack_target = false;

    std::vector<EnclosedArea> enclosed_areas;
    std::vector<std::string> shape;
    std::vector<std::string> color;
    std::vector<std::string> materials;
    std::vector<std::string> material_category;
    std::vector<std::string> salient_materials;
    std::string size;

    bool untrained_category = false;
    bool untrained_color = false;
    bool untrained_combination = false;
    bool untrained_shape = false;
    bool untrained_size = false;

    std::optional<SidewaysVariant> sideways;
    std::optional<SidewaysVariant> not_sideways;

    // Set by get_similar_definition: "color", "size" or "shape".
    std::string difference;

    std::vector<MaterialChoice> choose_material_list;
    std::vector<SizeChoice> choose_size_list;
    std::vector<TypeChoice> choose_type_list;

    bool has_attribute(const std::string& name) const;
    bool pickupable() const { return has_attribute("pickupable"); }
    bool untrained(UntrainedTag tag) const;
    bool any_untrained() const;
    bool has_choices() const;
};

bool operator==(const Definition& a, const Definition& b);
bool operator!=(const Definition& a, const Definition& b);

void assign_chosen_material(Definition& def, const MaterialChoice& choice);
void assign_chosen_size(Definition& def, const SizeChoice& choice);
void assign_chosen_type(Definition& def, const TypeChoice& choice);

// Applies the given choices (type first, then material, then size). Null
// choices fall back to a random pick from the definition's own lists.
Definition finalize_definition(
    Definition def,
    Rng& rng,
    const TypeChoice* type_choice = nullptr,
    const MaterialChoice* material_choice = nullptr,
    const SizeChoice* size_choice = nullptr
);

// One finalized definition per combination of material, size and type choice,
// in declaration order.
std::vector<Definition> finalize_each_choice(const Definition& def);

// One definition per material of the first material category (same material
// in every slot). Colors are the union of the material colors.
std::vector<Definition> finalize_materials_and_colors(const Definition& def);

// Copy with the sideways orientation applied and the original kept in
// not_sideways; nullopt when the definition has no sideways variant.
std::optional<Definition> make_sideways_definition(const Definition& def);

// Restores the upright orientation saved by make_sideways_definition.
Definition revert_sideways(Definition def);

using DefinitionVariations = std::vector<Definition>;
using DefinitionSelections = std::vector<DefinitionVariations>;
using DefinitionGroups = std::vector<DefinitionSelections>;

// Triple-nested catalog: group -> selection -> material variations.
class DefinitionDataset {
public:
    DefinitionDataset() = default;
    explicit DefinitionDataset(DefinitionGroups groups) : groups_(std::move(groups)) {}

    std::vector<Definition> definitions(Rng& rng) const;
    std::vector<Definition> definitions_unshuffled() const;
    const DefinitionGroups& groups() const { return groups_; }
    size_t size() const;
    bool empty() const { return groups_.empty(); }

    // Random group, then random selection, then random variation.
    Definition choose_random_definition(Rng& rng) const;

    DefinitionDataset filter_on_custom(const std::function<bool(const Definition&)>& keep) const;
    DefinitionDataset filter_on_trained() const;
    // Untrained in `tag` and trained in every other tag.
    DefinitionDataset filter_on_untrained(UntrainedTag tag) const;
    DefinitionDataset filter_on_type(
        const std::vector<std::string>& must_be,
        const std::vector<std::string>& cannot_be = {}
    ) const;

private:
    DefinitionGroups groups_;
};

// Finalizes every choice and material of each definition in each group.
DefinitionDataset create_dataset(const std::vector<std::vector<Definition>>& definition_groups);

bool do_materials_match(
    const std::vector<std::string>& materials_a,
    const std::vector<std::string>& materials_b,
    const std::vector<std::string>& colors_a,
    const std::vector<std::string>& colors_b
);

bool is_similar_except_in_color(const Definition& a, const Definition& b);
bool is_similar_except_in_shape(const Definition& a, const Definition& b);
bool is_similar_except_in_size(const Definition& a, const Definition& b);

// First definition in the (shuffled) dataset that differs from `target` in
// exactly one of color, size or shape.
std::optional<Definition> get_similar_definition(const Definition& target, const DefinitionDataset& dataset, Rng& rng);

}  // namespace scenegen
