#include "material_response.hpp"
#include <algorithm>

namespace damascus {

std::vector<double> layer_response_factors(const BilletFrame& frame, double nominal_strain) {
    std::vector<double> factors(frame.layers.size(), 1.0);
    if (frame.layers.empty() || nominal_strain <= 0.0) {
        return factors;
    }

    double stiffness_sum = 0.0;
    for (const auto& layer : frame.layers) {
        stiffness_sum += layer.material.stiffness;
    }
    double reference_stiffness = stiffness_sum / static_cast<double>(frame.layers.size());
    double stress = reference_stiffness * nominal_strain;

    double max_strain = 0.0;
    for (size_t i = 0; i < frame.layers.size(); ++i) {
        factors[i] = frame.layers[i].material.strain_under(stress);
        max_strain = std::max(max_strain, factors[i]);
    }

    // The most compliant layer follows the tool
    for (auto& factor : factors) {
        factor /= max_strain;
    }
    return factors;
}

}  // namespace damascus
