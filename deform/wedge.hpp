#ifndef DAMASCUS_DEFORM_WEDGE_HPP
#define DAMASCUS_DEFORM_WEDGE_HPP

#include <billet/billet.hpp>
#include <billet/frame.hpp>
#include <billet/operation.hpp>
#include <billet/operation_record.hpp>

namespace damascus {

// Gaussian falloff of the wedge across the width, sigma = width / 3
double wedge_intensity(double distance_from_center, double width);

// Throws Error(InvalidParameter) for a negative or non-finite depth or gap,
// or an angle not strictly between -90 and 90 degrees
void validate(const WedgeParams& params, const BilletFrame& frame);

// Feather split: drives the top of the stack down along the centre line and
// pushes each side outward. Displacement grows with the layer's height in the
// stack and is scaled per layer by layer_response_factors().
void transform_frame(BilletFrame& frame, const WedgeParams& params, StageReport* report);

OperationStats apply_wedge(Billet& billet, const WedgeParams& params);

}  // namespace damascus

#endif // DAMASCUS_DEFORM_WEDGE_HPP
