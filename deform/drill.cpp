#include "drill.hpp"
#include "logging.hpp"
#include <common/error.hpp>
#include <engine/pipeline.hpp>
#include <cmath>
#include <string>

namespace damascus {

namespace {

// Vertices on the hole axis have no outward direction and stay put
constexpr double kAxisBand = 1e-3;

}  // namespace

double drill_push(double distance, double radius) {
    if (distance < radius) {
        return kDrillCorePush;
    }
    if (distance < 2.0 * radius) {
        double d = distance - radius;
        return kDrillRingPush * std::exp(-(d * d) / (2.0 * radius * radius));
    }
    return 0.0;
}

void validate(const DrillParams& params, const BilletFrame& /*frame*/) {
    if (!(std::isfinite(params.radius) && params.radius >= 0.0)) {
        throw Error(ErrorCode::InvalidParameter,
                    "drill radius must be non-negative, got " + std::to_string(params.radius));
    }
    if (!std::isfinite(params.x_pos) || !std::isfinite(params.z_pos)) {
        throw Error(ErrorCode::InvalidParameter, "drill position must be finite");
    }
}

void transform_frame(BilletFrame& frame, const DrillParams& params, StageReport* /*report*/) {
    const double radius = params.radius;

    #pragma omp parallel for schedule(static) if(frame.layers.size() > 8)
    for (size_t i = 0; i < frame.layers.size(); ++i) {
        for (auto& p : frame.layers[i].vertices) {
            double dx = p.x - params.x_pos;
            double dy = p.y - params.z_pos;
            double distance = std::sqrt(dx * dx + dy * dy);
            double push = drill_push(distance, radius);
            if (push > 0.0 && distance > kAxisBand) {
                double amount = radius * push / distance;
                p.x += dx * amount;
                p.y += dy * amount;
            }
        }
    }
}

OperationStats drill_hole(Billet& billet, const DrillParams& params) {
    auto log = damascus::logging::get_logger();
    log->info("Drill: hole at ({:.1f}, {:.1f}) radius {:.1f}mm",
              params.x_pos, params.z_pos, params.radius);
    return OperationRunner::run(billet, params);
}

std::vector<DrillParams> raindrop_holes(int grid, double spacing, double radius) {
    std::vector<DrillParams> holes;
    if (grid <= 0) {
        return holes;
    }
    holes.reserve(static_cast<size_t>(grid) * static_cast<size_t>(grid));
    double offset = (grid - 1) / 2.0;
    for (int i = 0; i < grid; ++i) {
        for (int j = 0; j < grid; ++j) {
            holes.push_back(DrillParams{
                .x_pos = (i - offset) * spacing,
                .z_pos = (j - offset) * spacing,
                .radius = radius
            });
        }
    }
    return holes;
}

}  // namespace damascus
