#include "recipe.hpp"
#include "logging.hpp"
#include <common/error.hpp>
#include <forge/forge.hpp>
#include <deform/wedge.hpp>
#include <deform/twist.hpp>
#include <deform/compression.hpp>
#include <deform/drill.hpp>
#include <serialization/json_serialization.hpp>
#include <serialization/operation_json.hpp>
#include <type_traits>

namespace damascus::cli {

namespace {

std::vector<LayerSpec> layers_from_json(const nlohmann::json& billet, const SteelCatalog& catalog) {
    std::vector<LayerSpec> layers;

    if (billet.contains("alternating")) {
        const auto& alt = billet["alternating"];
        size_t count = count_from_json(alt, "count", 30);
        double bright_t = alt.value("bright_thickness", 0.8);
        double dark_t = alt.value("dark_thickness", 0.8);
        Material bright = catalog.get(alt.value("bright", std::string("15N20"))).material();
        Material dark = catalog.get(alt.value("dark", std::string("1084"))).material();
        layers = alternating_stack(count, bright_t, dark_t, bright, dark);
    } else if (billet.contains("layers")) {
        for (const auto& entry : billet["layers"]) {
            LayerSpec spec;
            if (entry.contains("steel")) {
                spec.material = catalog.get(entry["steel"].get<std::string>()).material();
            } else {
                spec.material = entry.at("material").get<Material>();
            }
            spec.thickness = entry.value("thickness", 0.8);
            layers.push_back(spec);
        }
    }

    if (layers.empty()) {
        throw Error(ErrorCode::InvalidParameter,
                    "recipe billet needs a non-empty 'layers' list or an 'alternating' stack");
    }
    return layers;
}

}  // namespace

Recipe recipe_from_json(const nlohmann::json& j, const SteelCatalog& catalog) {
    auto log = damascus::logging::get_logger();

    SteelCatalog steels = catalog;
    if (j.contains("steels")) {
        add_custom_steels(steels, j["steels"]);
    }

    if (!j.contains("billet")) {
        throw Error(ErrorCode::InvalidParameter, "recipe has no 'billet' section");
    }
    const auto& billet = j["billet"];

    Recipe recipe;
    recipe.width = billet.value("width", recipe.width);
    recipe.length = billet.value("length", recipe.length);
    if (billet.contains("resolution")) {
        recipe.resolution = billet["resolution"].get<MeshResolution>();
    }
    recipe.layers = layers_from_json(billet, steels);

    if (j.contains("operations")) {
        for (const auto& entry : j["operations"]) {
            if (entry.value("operation", std::string()) == "raindrop") {
                auto holes = raindrop_holes(entry.value("grid", 3),
                                            entry.value("spacing", 10.0),
                                            entry.value("radius", 2.0));
                recipe.operations.insert(recipe.operations.end(), holes.begin(), holes.end());
            } else {
                recipe.operations.push_back(operation_from_json(entry));
            }
        }
    }

    if (j.contains("section")) {
        const auto& section = j["section"];
        recipe.section.slice_position = section.value("slice_position", recipe.section.slice_position);
        recipe.section.resolution = count_from_json(section, "resolution", recipe.section.resolution);
    }

    log->debug("Recipe: {}x{}mm, {} layers, {} operations",
               recipe.width, recipe.length, recipe.layers.size(), recipe.operations.size());
    return recipe;
}

Recipe load_recipe(const std::string& path, const SteelCatalog& catalog) {
    return recipe_from_json(json::read_json_file(path), catalog);
}

Billet build_billet(const Recipe& recipe) {
    Billet billet(recipe.width, recipe.length);
    billet.stack_layers(recipe.layers, recipe.resolution);
    return billet;
}

void apply_operations(Billet& billet, const std::vector<Operation>& operations) {
    for (const auto& op : operations) {
        std::visit([&](const auto& params) {
            using T = std::decay_t<decltype(params)>;
            if constexpr (std::is_same_v<T, ForgeParams>) {
                forge(billet, params);
            } else if constexpr (std::is_same_v<T, WedgeParams>) {
                apply_wedge(billet, params);
            } else if constexpr (std::is_same_v<T, TwistParams>) {
                apply_twist(billet, params);
            } else if constexpr (std::is_same_v<T, CompressionParams>) {
                apply_compression(billet, params);
            } else if constexpr (std::is_same_v<T, DrillParams>) {
                drill_hole(billet, params);
            }
        }, op);
    }
}

}  // namespace damascus::cli
