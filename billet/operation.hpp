#ifndef DAMASCUS_BILLET_OPERATION_HPP
#define DAMASCUS_BILLET_OPERATION_HPP

#include <cstdint>
#include <variant>

namespace damascus {

// Cross-section the billet has been forged to. Slab = never forged.
enum class CrossSectionShape : uint8_t {
    Slab,
    Square,
    Octagon
};

const char* to_string(CrossSectionShape shape);

// Parameter sets, one per operator. Defaults are the values a smith would
// start from.

struct ForgeParams {
    CrossSectionShape shape = CrossSectionShape::Square;
    double target_size = 20.0;        // Side of the target square / across flats (mm)
    int heat_count = 5;               // Number of progressive heats, >= 1
    double chamfer_fraction = 0.15;   // Octagon only: corner cut as a fraction of half the size
};

struct WedgeParams {
    double wedge_depth = 20.0;        // mm
    double wedge_angle = 30.0;        // degrees from vertical
    double split_gap = 5.0;           // mm
};

// Twist is always about the length axis
struct TwistParams {
    double angle_degrees = 90.0;
};

struct CompressionParams {
    double compression_factor = 0.8;  // (0, 1]
};

// Hole centre in the width/length plane: x_pos along width, z_pos along length
struct DrillParams {
    double x_pos = 0.0;
    double z_pos = 0.0;
    double radius = 10.0;
};

using Operation = std::variant<
    ForgeParams,
    WedgeParams,
    TwistParams,
    CompressionParams,
    DrillParams
>;

// Name written to logs and the operation history
const char* operation_name(const Operation& op);

// Forge and compression must conserve volume; the pattern operators need not
bool conserves_volume(const Operation& op);

}  // namespace damascus

#endif // DAMASCUS_BILLET_OPERATION_HPP
