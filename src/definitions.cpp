#include "scenegen/definitions.hpp"

#include <algorithm>
#include <set>
#include <stdexcept>

#include "scenegen/materials.hpp"

namespace scenegen {
namespace {

bool same_vec(const Vec3& a, const Vec3& b) {
    return a.x == b.x && a.y == b.y && a.z == b.z;
}

bool within_size_diff(double a, double b) {
    return (a + kMaxSizeDiff) >= b && (a - kMaxSizeDiff) <= b;
}

bool all_sizes_close(const Definition& a, const Definition& b) {
    return within_size_diff(a.dimensions.x, b.dimensions.x) && within_size_diff(a.dimensions.y, b.dimensions.y) &&
           within_size_diff(a.dimensions.z, b.dimensions.z);
}

void append_unique(std::vector<std::string>& out, const std::vector<std::string>& items) {
    for (const auto& item : items) {
        if (std::find(out.begin(), out.end(), item) == out.end()) {
            out.push_back(item);
        }
    }
}

struct ChoiceCombo {
    const MaterialChoice* material = nullptr;
    const SizeChoice* size = nullptr;
};

}  // namespace

bool Definition::has_attribute(const std::string& name) const {
    return std::find(attributes.begin(), attributes.end(), name) != attributes.end();
}

bool Definition::untrained(UntrainedTag tag) const {
    switch (tag) {
        case UntrainedTag::kCategory:
            return untrained_category;
        case UntrainedTag::kColor:
            return untrained_color;
        case UntrainedTag::kCombination:
            return untrained_combination;
        case UntrainedTag::kShape:
            return untrained_shape;
        case UntrainedTag::kSize:
            return untrained_size;
    }
    return false;
}

bool Definition::any_untrained() const {
    return untrained_category || untrained_color || untrained_combination || untrained_shape || untrained_size;
}

bool Definition::has_choices() const {
    return !choose_material_list.empty() || !choose_size_list.empty() || !choose_type_list.empty();
}

bool operator==(const Definition& a, const Definition& b) {
    return a.type == b.type && same_vec(a.dimensions, b.dimensions) && same_vec(a.offset, b.offset) &&
           same_vec(a.rotation, b.rotation) && same_vec(a.scale, b.scale) && a.position_y == b.position_y &&
           a.mass == b.mass && a.mass_multiplier == b.mass_multiplier && a.materials == b.materials &&
           a.color == b.color && a.shape == b.shape && a.size == b.size && a.attributes == b.attributes;
}

bool operator!=(const Definition& a, const Definition& b) {
    return !(a == b);
}

void assign_chosen_material(Definition& def, const MaterialChoice& choice) {
    def.material_category = choice.material_category;
    def.salient_materials = choice.salient_materials;
    def.mass_multiplier *= choice.mass_multiplier;
    def.choose_material_list.clear();
}

void assign_chosen_size(Definition& def, const SizeChoice& choice) {
    if (choice.dimensions) def.dimensions = *choice.dimensions;
    if (choice.offset) def.offset = *choice.offset;
    if (choice.position_y) def.position_y = *choice.position_y;
    if (choice.scale) def.scale = *choice.scale;
    if (choice.mass) def.mass = *choice.mass;
    if (choice.enclosed_areas) def.enclosed_areas = *choice.enclosed_areas;
    if (choice.sideways) def.sideways = choice.sideways;
    if (choice.size) def.size = *choice.size;
    if (choice.untrained_shape) def.untrained_shape = *choice.untrained_shape;
    if (choice.untrained_size) def.untrained_size = *choice.untrained_size;
    def.choose_size_list.clear();
}

void assign_chosen_type(Definition& def, const TypeChoice& choice) {
    def.type = choice.type;
    if (choice.color) def.color = *choice.color;
    if (choice.materials) def.materials = *choice.materials;
    if (choice.shape) def.shape = *choice.shape;
    if (choice.untrained_shape) def.untrained_shape = *choice.untrained_shape;
    if (!choice.choose_material_list.empty()) {
        def.choose_material_list = choice.choose_material_list;
    }
    if (!choice.choose_size_list.empty()) {
        def.choose_size_list = choice.choose_size_list;
    }
    def.choose_type_list.clear();
}

Definition finalize_definition(
    Definition def,
    Rng& rng,
    const TypeChoice* type_choice,
    const MaterialChoice* material_choice,
    const SizeChoice* size_choice
) {
    // The type choice may replace the material and size lists, so it goes first.
    if (!type_choice && !def.choose_type_list.empty()) {
        type_choice = &random_choice(rng, def.choose_type_list);
    }
    if (type_choice) {
        const TypeChoice chosen = *type_choice;
        assign_chosen_type(def, chosen);
    }

    if (!material_choice && !def.choose_material_list.empty()) {
        material_choice = &random_choice(rng, def.choose_material_list);
    }
    if (material_choice) {
        const MaterialChoice chosen = *material_choice;
        assign_chosen_material(def, chosen);
    }

    if (!size_choice && !def.choose_size_list.empty()) {
        size_choice = &random_choice(rng, def.choose_size_list);
    }
    if (size_choice) {
        const SizeChoice chosen = *size_choice;
        assign_chosen_size(def, chosen);
    }
    return def;
}

std::vector<Definition> finalize_each_choice(const Definition& def) {
    std::vector<Definition> out;
    // A type choice may bring its own material and size lists, so resolve it first.
    if (!def.choose_type_list.empty()) {
        for (const auto& type_choice : def.choose_type_list) {
            Definition typed = def;
            assign_chosen_type(typed, type_choice);
            for (auto& finalized : finalize_each_choice(typed)) {
                out.push_back(std::move(finalized));
            }
        }
        return out;
    }

    std::vector<ChoiceCombo> combos;
    auto expand = [&combos](size_t count, auto assign) {
        if (count == 0) {
            return;
        }
        std::vector<ChoiceCombo> next;
        const std::vector<ChoiceCombo> previous = combos.empty() ? std::vector<ChoiceCombo>{ChoiceCombo{}} : combos;
        for (size_t i = 0; i < count; ++i) {
            for (ChoiceCombo combo : previous) {
                assign(combo, i);
                next.push_back(combo);
            }
        }
        combos = std::move(next);
    };
    expand(def.choose_material_list.size(), [&def](ChoiceCombo& c, size_t i) {
        c.material = &def.choose_material_list[i];
    });
    expand(def.choose_size_list.size(), [&def](ChoiceCombo& c, size_t i) { c.size = &def.choose_size_list[i]; });

    if (combos.empty()) {
        out.push_back(def);
        return out;
    }
    // Every choice is explicit here, so the generator is never drawn from.
    Rng unused_rng(0);
    for (const auto& combo : combos) {
        out.push_back(finalize_definition(def, unused_rng, nullptr, combo.material, combo.size));
    }
    return out;
}

std::vector<Definition> finalize_materials_and_colors(const Definition& def) {
    std::vector<Definition> out;
    if (def.material_category.empty()) {
        out.push_back(def);
        return out;
    }
    const MaterialList& list = material_category(def.material_category.front());
    const size_t slots = def.material_category.size();
    for (const auto& material : list) {
        Definition copy = def;
        copy.color.clear();
        copy.materials.assign(slots, material.id);
        if (untrained_color_materials().count(material.id) > 0) {
            copy.untrained_color = true;
        }
        append_unique(copy.color, material.colors);
        out.push_back(std::move(copy));
    }
    return out;
}

std::optional<Definition> make_sideways_definition(const Definition& def) {
    if (!def.sideways) {
        return std::nullopt;
    }
    Definition out = def;
    out.not_sideways = SidewaysVariant{def.dimensions, def.offset, def.position_y, def.rotation};
    out.dimensions = def.sideways->dimensions;
    out.offset = def.sideways->offset;
    out.position_y = def.sideways->position_y;
    out.rotation = def.sideways->rotation;
    out.sideways.reset();
    return out;
}

Definition revert_sideways(Definition def) {
    if (def.not_sideways) {
        def.dimensions = def.not_sideways->dimensions;
        def.offset = def.not_sideways->offset;
        def.position_y = def.not_sideways->position_y;
        def.rotation = def.not_sideways->rotation;
        def.not_sideways.reset();
    }
    return def;
}

std::vector<Definition> DefinitionDataset::definitions(Rng& rng) const {
    std::vector<Definition> out = definitions_unshuffled();
    shuffle_in_place(rng, out);
    return out;
}

std::vector<Definition> DefinitionDataset::definitions_unshuffled() const {
    std::vector<Definition> out;
    for (const auto& selections : groups_) {
        for (const auto& variations : selections) {
            out.insert(out.end(), variations.begin(), variations.end());
        }
    }
    return out;
}

size_t DefinitionDataset::size() const {
    size_t n = 0;
    for (const auto& selections : groups_) {
        for (const auto& variations : selections) {
            n += variations.size();
        }
    }
    return n;
}

Definition DefinitionDataset::choose_random_definition(Rng& rng) const {
    if (groups_.empty()) {
        throw std::invalid_argument("choose_random_definition: empty dataset");
    }
    return random_choice(rng, random_choice(rng, random_choice(rng, groups_)));
}

DefinitionDataset DefinitionDataset::filter_on_custom(const std::function<bool(const Definition&)>& keep) const {
    DefinitionGroups out;
    for (const auto& selections : groups_) {
        DefinitionSelections kept_selections;
        for (const auto& variations : selections) {
            DefinitionVariations kept;
            for (const auto& def : variations) {
                if (keep(def)) {
                    kept.push_back(def);
                }
            }
            if (!kept.empty()) {
                kept_selections.push_back(std::move(kept));
            }
        }
        if (!kept_selections.empty()) {
            out.push_back(std::move(kept_selections));
        }
    }
    return DefinitionDataset(std::move(out));
}

DefinitionDataset DefinitionDataset::filter_on_trained() const {
    return filter_on_custom([](const Definition& def) { return !def.any_untrained(); });
}

DefinitionDataset DefinitionDataset::filter_on_untrained(UntrainedTag tag) const {
    return filter_on_custom([tag](const Definition& def) {
        if (!def.untrained(tag)) {
            return false;
        }
        for (UntrainedTag other : {UntrainedTag::kCategory,
                                   UntrainedTag::kColor,
                                   UntrainedTag::kCombination,
                                   UntrainedTag::kShape,
                                   UntrainedTag::kSize}) {
            if (other != tag && def.untrained(other)) {
                return false;
            }
        }
        return true;
    });
}

DefinitionDataset DefinitionDataset::filter_on_type(
    const std::vector<std::string>& must_be,
    const std::vector<std::string>& cannot_be
) const {
    return filter_on_custom([&must_be, &cannot_be](const Definition& def) {
        if (!cannot_be.empty()) {
            return std::find(cannot_be.begin(), cannot_be.end(), def.type) == cannot_be.end();
        }
        if (!must_be.empty()) {
            return std::find(must_be.begin(), must_be.end(), def.type) != must_be.end();
        }
        return true;
    });
}

DefinitionDataset create_dataset(const std::vector<std::vector<Definition>>& definition_groups) {
    DefinitionGroups groups;
    for (const auto& group : definition_groups) {
        DefinitionSelections selections;
        for (const auto& def : group) {
            for (const auto& intermediate : finalize_each_choice(def)) {
                selections.push_back(finalize_materials_and_colors(intermediate));
            }
        }
        groups.push_back(std::move(selections));
    }
    return DefinitionDataset(std::move(groups));
}

bool do_materials_match(
    const std::vector<std::string>& materials_a,
    const std::vector<std::string>& materials_b,
    const std::vector<std::string>& colors_a,
    const std::vector<std::string>& colors_b
) {
    if (!materials_a.empty() && !materials_b.empty()) {
        return materials_a == materials_b;
    }
    const std::set<std::string> set_a(colors_a.begin(), colors_a.end());
    for (const auto& c : colors_b) {
        if (set_a.count(c) > 0) {
            return true;
        }
    }
    return false;
}

bool is_similar_except_in_color(const Definition& a, const Definition& b) {
    return a != b && a.type == b.type && !do_materials_match(a.materials, b.materials, a.color, b.color) &&
           all_sizes_close(a, b);
}

bool is_similar_except_in_shape(const Definition& a, const Definition& b) {
    return a != b && a.type != b.type && do_materials_match(a.materials, b.materials, a.color, b.color) &&
           all_sizes_close(a, b);
}

bool is_similar_except_in_size(const Definition& a, const Definition& b) {
    const bool any_size_differs = !within_size_diff(a.dimensions.x, b.dimensions.x) ||
                                  !within_size_diff(a.dimensions.y, b.dimensions.y) ||
                                  !within_size_diff(a.dimensions.z, b.dimensions.z);
    return a != b && a.type == b.type && do_materials_match(a.materials, b.materials, a.color, b.color) &&
           any_size_differs;
}

std::optional<Definition> get_similar_definition(const Definition& target, const DefinitionDataset& dataset, Rng& rng) {
    std::vector<std::string> choices = {"color", "size", "shape"};
    shuffle_in_place(rng, choices);
    for (const auto& choice : choices) {
        const auto similar = choice == "color"  ? is_similar_except_in_color
                             : choice == "size" ? is_similar_except_in_size
                                                : is_similar_except_in_shape;
        for (auto& def : dataset.definitions(rng)) {
            if (similar(target, def)) {
                def.difference = choice;
                return def;
            }
        }
    }
    return std::nullopt;
}

}  // namespace scenegen
