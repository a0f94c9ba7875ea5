#ifndef DAMASCUS_CLI_RECIPE_HPP
#define DAMASCUS_CLI_RECIPE_HPP

#include "steel_catalog.hpp"
#include <nlohmann/json.hpp>
#include <billet/billet.hpp>
#include <billet/operation.hpp>
#include <section/cross_section.hpp>
#include <string>
#include <vector>

namespace damascus::cli {

// A complete forging session read from JSON:
// {
//   "steels": {"<key>": {...custom grade...}},
//   "billet": {
//     "width": 50, "length": 100,
//     "resolution": {"width_segments": 1, "length_segments": 1},
//     "alternating": {"count": 30, "bright": "15N20", "dark": "1084",
//                     "bright_thickness": 0.8, "dark_thickness": 0.8}
//     or "layers": [{"steel": "1084", "thickness": 0.8}, ...]
//   },
//   "operations": [{"operation": "forge", "shape": "square", ...},
//                  {"operation": "raindrop", "grid": 3, "spacing": 10, "radius": 2}, ...],
//   "section": {"slice_position": 0, "resolution": 500}
// }
struct Recipe {
    double width = 50.0;
    double length = 100.0;
    MeshResolution resolution;
    std::vector<LayerSpec> layers;
    std::vector<Operation> operations;   // Raindrop grids already expanded
    SectionParams section;
};

// Steel names are resolved against `catalog` plus the recipe's own "steels".
// Throws Error(InvalidParameter) for unknown steels, operations or a recipe
// without layers.
Recipe recipe_from_json(const nlohmann::json& j, const SteelCatalog& catalog);

Recipe load_recipe(const std::string& path, const SteelCatalog& catalog = SteelCatalog::builtin());

// New billet with the recipe's layers stacked
Billet build_billet(const Recipe& recipe);

// Run every operation in order. Stops at the first failure, which propagates.
void apply_operations(Billet& billet, const std::vector<Operation>& operations);

}  // namespace damascus::cli

#endif // DAMASCUS_CLI_RECIPE_HPP
