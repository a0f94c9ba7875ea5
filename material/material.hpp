#ifndef DAMASCUS_MATERIAL_MATERIAL_HPP
#define DAMASCUS_MATERIAL_MATERIAL_HPP

#include <cstdint>
#include <string>

namespace damascus {

// Slope of the stress-strain curve past yield, as a share of the elastic
// modulus (linear work hardening)
constexpr double kHardeningRatio = 0.05;

// Closed set of steel identities the engine distinguishes. Which commercial
// steel backs an identity is decided by the caller.
enum class MaterialKind : uint8_t {
    HighNickel,   // etches bright (e.g. 15N20)
    HighCarbon    // etches dark (e.g. 1084)
};

const char* to_string(MaterialKind kind);

struct Rgb {
    uint8_t r = 0;
    uint8_t g = 0;
    uint8_t b = 0;
};

// Material identity plus the numeric constants the deformation operators use.
// Values are plain numbers resolved by the caller before any engine call.
struct Material {
    MaterialKind kind = MaterialKind::HighCarbon;
    double stiffness = 207000.0;       // Young's-modulus-like constant (MPa)
    double yield_strength = 415.0;     // Yield strength (MPa)

    // Nominal elastic strain at the yield point
    double yield_strain() const {
        return yield_strength / stiffness;
    }

    // Elastic strain for a nominal stress (epsilon = sigma / E)
    double elastic_strain(double stress) const {
        return stress / stiffness;
    }

    // Past the yield point the layer flows plastically instead of straining
    // elastically.
    bool yields_under(double stress) const {
        return stress >= yield_strength;
    }

    // Total strain under a nominal stress: elastic up to the yield point,
    // then plastic flow along the hardening slope
    double strain_under(double stress) const {
        if (!yields_under(stress)) {
            return elastic_strain(stress);
        }
        return yield_strain() + (stress - yield_strength) / (kHardeningRatio * stiffness);
    }

    bool is_bright() const {
        return kind == MaterialKind::HighNickel;
    }

    // Grey level used by the cross-section extractor
    uint8_t gray_level() const {
        return is_bright() ? 230 : 50;
    }

    // Display colour used by the mesh exporter
    Rgb color() const {
        return is_bright() ? Rgb{230, 230, 230} : Rgb{51, 51, 51};
    }

    static Material high_nickel() {
        return Material{
            .kind = MaterialKind::HighNickel,
            .stiffness = 186000.0,
            .yield_strength = 310.0
        };
    }

    static Material high_carbon() {
        return Material{
            .kind = MaterialKind::HighCarbon,
            .stiffness = 207000.0,
            .yield_strength = 415.0
        };
    }
};

}  // namespace damascus

#endif // DAMASCUS_MATERIAL_MATERIAL_HPP
