#ifndef DAMASCUS_FORGE_FORGE_HPP
#define DAMASCUS_FORGE_FORGE_HPP

#include <billet/billet.hpp>
#include <billet/frame.hpp>
#include <billet/operation.hpp>
#include <billet/operation_record.hpp>

namespace damascus {

// Leg length of the corner cut for a chamfer fraction. The fraction is taken
// of half the smaller cross-section side, so 0 keeps the square and 1 turns
// it into a diamond.
double chamfer_leg(double width, double height, double chamfer_fraction);

// Area of a square of side `size` with its four corners cut by chamfer_leg()
double octagon_area(double size, double chamfer_fraction);

// Final bar length for a volume drawn out to the target cross-section
double forged_length(double volume, const ForgeParams& params);

// Throws Error(InvalidParameter) for a non-positive size, heat count below 1
// or an octagon chamfer outside [0, 1]
void validate(const ForgeParams& params, const BilletFrame& frame);

// Progressive multi-heat forging of a frame to a square or octagonal bar.
//
// Every heat interpolates width, height and length linearly from the frame's
// dimensions towards the target and derives its scale factors from those
// starting dimensions, never from the previous heat. Only the last heat's
// geometry is kept; earlier heats are computed (and checked) when `report`
// is given.
void transform_frame(BilletFrame& frame, const ForgeParams& params, StageReport* report);

// Forge the billet. Returns the committed operation's statistics.
OperationStats forge(Billet& billet, const ForgeParams& params);

}  // namespace damascus

#endif // DAMASCUS_FORGE_FORGE_HPP
