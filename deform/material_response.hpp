#ifndef DAMASCUS_DEFORM_MATERIAL_RESPONSE_HPP
#define DAMASCUS_DEFORM_MATERIAL_RESPONSE_HPP

#include <billet/frame.hpp>
#include <vector>

namespace damascus {

// Per-layer share of a tool displacement, in [0, 1].
//
// The tool imposes `nominal_strain` on the stack. The stack's mean stiffness
// turns that into a nominal stress (sigma = E_ref * strain). Each layer strains
// by Material::strain_under(sigma): sigma / E_i below its yield strength, plus
// hardening flow beyond it. Factors are those strains relative to the largest
// one, so the softest layer takes the full displacement. A zero nominal strain
// gives 1 for every layer.
std::vector<double> layer_response_factors(const BilletFrame& frame, double nominal_strain);

}  // namespace damascus

#endif // DAMASCUS_DEFORM_MATERIAL_RESPONSE_HPP
