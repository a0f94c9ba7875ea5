#include "steel_catalog.hpp"
#include <common/error.hpp>
#include <algorithm>

namespace damascus::cli {

MaterialKind SteelGrade::kind() const {
    return (etch_color == "bright" || etch_color == "medium-bright")
        ? MaterialKind::HighNickel
        : MaterialKind::HighCarbon;
}

Material SteelGrade::material() const {
    return Material{
        .kind = kind(),
        .stiffness = modulus_mpsi * kMpsiToMpa,
        .yield_strength = yield_strength
    };
}

SteelCatalog SteelCatalog::builtin() {
    SteelCatalog catalog;
    catalog.add({.key = "1084", .name = "1084 High Carbon Steel", .category = "High Carbon",
                 .etch_color = "dark", .modulus_mpsi = 30.0, .yield_strength = 415.0,
                 .movement_level = 2});
    catalog.add({.key = "15N20", .name = "15N20 High Nickel Alloy Steel",
                 .category = "High Carbon / Nickel Alloy",
                 .etch_color = "bright", .modulus_mpsi = 30.0, .yield_strength = 450.0,
                 .movement_level = 3});
    catalog.add({.key = "O1", .name = "O1 Oil-Hardening Tool Steel",
                 .category = "Low Alloy Tool Steel",
                 .etch_color = "medium-dark", .modulus_mpsi = 30.0, .yield_strength = 480.0,
                 .movement_level = 5});
    catalog.add({.key = "A2", .name = "A2 Air-Hardening Tool Steel",
                 .category = "High Alloy Tool Steel",
                 .etch_color = "medium", .modulus_mpsi = 29.0, .yield_strength = 560.0,
                 .movement_level = 8});
    catalog.add({.key = "D2", .name = "D2 High-Carbon High-Chromium Tool Steel",
                 .category = "High Alloy Tool Steel",
                 .etch_color = "medium", .modulus_mpsi = 29.0, .yield_strength = 620.0,
                 .movement_level = 9});
    catalog.add({.key = "MagnaCut", .name = "CPM MagnaCut", .category = "Powder Metallurgy",
                 .etch_color = "medium-bright", .modulus_mpsi = 31.0, .yield_strength = 700.0,
                 .movement_level = 10});
    catalog.add({.key = "CruWear", .name = "CPM CruWear", .category = "Powder Metallurgy",
                 .etch_color = "medium", .modulus_mpsi = 30.0, .yield_strength = 680.0,
                 .movement_level = 10});
    catalog.add({.key = "52100", .name = "52100 Bearing Steel",
                 .category = "High Carbon / Low Chrome",
                 .etch_color = "dark", .modulus_mpsi = 30.0, .yield_strength = 550.0,
                 .movement_level = 4});
    return catalog;
}

void SteelCatalog::add(SteelGrade grade) {
    auto it = std::find_if(grades_.begin(), grades_.end(),
                           [&](const SteelGrade& g) { return g.key == grade.key; });
    if (it != grades_.end()) {
        *it = std::move(grade);
    } else {
        grades_.push_back(std::move(grade));
    }
}

const SteelGrade* SteelCatalog::find(const std::string& key) const {
    auto it = std::find_if(grades_.begin(), grades_.end(),
                           [&](const SteelGrade& g) { return g.key == key; });
    return it != grades_.end() ? &*it : nullptr;
}

const SteelGrade& SteelCatalog::get(const std::string& key) const {
    const SteelGrade* grade = find(key);
    if (!grade) {
        throw Error(ErrorCode::InvalidParameter, "unknown steel: " + key);
    }
    return *grade;
}

void add_custom_steels(SteelCatalog& catalog, const nlohmann::json& j) {
    for (const auto& [key, data] : j.items()) {
        SteelGrade grade;
        grade.key = key;
        grade.name = data.value("name", key);
        grade.category = data.value("category", std::string("Custom"));
        grade.etch_color = data.value("etch_color", std::string("medium"));
        grade.modulus_mpsi = data.value("modulus_elasticity", 30.0);
        grade.yield_strength = data.value("yield_strength", 415.0);
        grade.movement_level = data.value("movement_level", 5);
        grade.is_custom = true;
        if (!(grade.modulus_mpsi > 0.0) || !(grade.yield_strength > 0.0)) {
            throw Error(ErrorCode::InvalidParameter,
                        "steel " + key + ": modulus and yield strength must be positive");
        }
        catalog.add(std::move(grade));
    }
}

}  // namespace damascus::cli
