#pragma once

#include <ostream>
#include <string>

#include <nlohmann/json.hpp>

#include "scenegen/scene.hpp"

namespace scenegen {

// One scene document. Bounds, templates and definition choice lists are
// internal and never written.
nlohmann::json scene_document(const Scene& scene);

// Compact dump of scene_document plus a trailing newline.
void write_scene_json(std::ostream& out, const Scene& scene);
std::string scene_to_json(const Scene& scene);

// "<prefix><hypercube name>_<scene id>.json" with spaces replaced by '_'.
std::string scene_file_name(const std::string& prefix, const Scene& scene, int index);

}  // namespace scenegen
