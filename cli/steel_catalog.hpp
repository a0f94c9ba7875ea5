#ifndef DAMASCUS_CLI_STEEL_CATALOG_HPP
#define DAMASCUS_CLI_STEEL_CATALOG_HPP

#include <nlohmann/json.hpp>
#include <material/material.hpp>
#include <string>
#include <vector>

namespace damascus::cli {

// Conversion from psi x 10^6 to MPa
constexpr double kMpsiToMpa = 6894.757;

// A named commercial steel. Only the material() projection reaches the core.
struct SteelGrade {
    std::string key;
    std::string name;
    std::string category;
    std::string etch_color;        // bright, medium-bright, medium, medium-dark, dark
    double modulus_mpsi = 30.0;    // Modulus of elasticity, psi x 10^6
    double yield_strength = 415.0; // Annealed yield strength (MPa)
    int movement_level = 5;        // 1 = moves easily under the hammer, 10 = very stiff
    bool is_custom = false;

    // Bright and medium-bright steels etch as the nickel layer
    MaterialKind kind() const;

    Material material() const;
};

class SteelCatalog {
public:
    // 1084, 15N20, O1, A2, D2, MagnaCut, CruWear, 52100
    static SteelCatalog builtin();

    // Adds or replaces by key
    void add(SteelGrade grade);

    const SteelGrade* find(const std::string& key) const;

    // Throws Error(InvalidParameter) for an unknown key
    const SteelGrade& get(const std::string& key) const;

    const std::vector<SteelGrade>& grades() const { return grades_; }

private:
    std::vector<SteelGrade> grades_;
};

// Custom steel entries: {"<key>": {name, category, etch_color, modulus_elasticity,
// yield_strength, movement_level}}
void add_custom_steels(SteelCatalog& catalog, const nlohmann::json& j);

}  // namespace damascus::cli

#endif // DAMASCUS_CLI_STEEL_CATALOG_HPP
