#ifndef DAMASCUS_DEFORM_TWIST_HPP
#define DAMASCUS_DEFORM_TWIST_HPP

#include <billet/billet.hpp>
#include <billet/frame.hpp>
#include <billet/operation.hpp>
#include <billet/operation_record.hpp>

namespace damascus {

// Rotation in radians at length coordinate `y` of a bar of `length` centred
// on y = 0: zero at -length/2, the full angle at +length/2
double twist_angle_at(double y, double length, double angle_degrees);

// Throws Error(InvalidParameter) for a non-finite angle and
// Error(PreconditionFailed) when the frame has never been forged
void validate(const TwistParams& params, const BilletFrame& frame);

// Torsion about the length axis through the centre of the cross-section
void transform_frame(BilletFrame& frame, const TwistParams& params, StageReport* report);

OperationStats apply_twist(Billet& billet, const TwistParams& params);

}  // namespace damascus

#endif // DAMASCUS_DEFORM_TWIST_HPP
