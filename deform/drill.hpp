#ifndef DAMASCUS_DEFORM_DRILL_HPP
#define DAMASCUS_DEFORM_DRILL_HPP

#include <billet/billet.hpp>
#include <billet/frame.hpp>
#include <billet/operation.hpp>
#include <billet/operation_record.hpp>
#include <vector>

namespace damascus {

// Push applied inside the hole, as a multiple of the radius
constexpr double kDrillCorePush = 1.5;

// Peak of the Gaussian push between one and two radii
constexpr double kDrillRingPush = 0.3;

// Outward push, as a multiple of the radius, for a vertex `distance` away
// from the hole centre. Zero at two radii and beyond.
double drill_push(double distance, double radius);

// Throws Error(InvalidParameter) for a negative or non-finite radius or a
// non-finite centre. A zero radius is accepted and moves nothing.
void validate(const DrillParams& params, const BilletFrame& frame);

// Radial push in the width/length plane around (x_pos, z_pos). Connectivity
// is untouched; no material is removed.
void transform_frame(BilletFrame& frame, const DrillParams& params, StageReport* report);

OperationStats drill_hole(Billet& billet, const DrillParams& params);

// grid x grid hole centres, `spacing` apart and centred on the billet
std::vector<DrillParams> raindrop_holes(int grid, double spacing, double radius);

}  // namespace damascus

#endif // DAMASCUS_DEFORM_DRILL_HPP
