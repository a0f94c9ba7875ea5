#include "wedge.hpp"
#include "material_response.hpp"
#include "logging.hpp"
#include <common/error.hpp>
#include <engine/pipeline.hpp>
#include <algorithm>
#include <cmath>
#include <numbers>
#include <string>

namespace damascus {

namespace {

// Vertices this close to the centre line are pushed towards +x
constexpr double kCenterBand = 1e-3;

}  // namespace

double wedge_intensity(double distance_from_center, double width) {
    double sigma = width / 3.0;
    return std::exp(-(distance_from_center * distance_from_center) / (2.0 * sigma * sigma));
}

void validate(const WedgeParams& params, const BilletFrame& /*frame*/) {
    if (!(std::isfinite(params.wedge_depth) && params.wedge_depth >= 0.0)) {
        throw Error(ErrorCode::InvalidParameter,
                    "wedge depth must be non-negative, got " + std::to_string(params.wedge_depth));
    }
    if (!(std::isfinite(params.wedge_angle) && std::abs(params.wedge_angle) < 90.0)) {
        throw Error(ErrorCode::InvalidParameter,
                    "wedge angle must be within (-90, 90) degrees, got " +
                    std::to_string(params.wedge_angle));
    }
    if (!(std::isfinite(params.split_gap) && params.split_gap >= 0.0)) {
        throw Error(ErrorCode::InvalidParameter,
                    "split gap must be non-negative, got " + std::to_string(params.split_gap));
    }
}

void transform_frame(BilletFrame& frame, const WedgeParams& params, StageReport* report) {
    const double height = frame.height;
    const double width = frame.width;
    const double angle = params.wedge_angle * std::numbers::pi / 180.0;
    const double spread = params.split_gap + params.wedge_depth * std::tan(angle);

    const double nominal_strain = std::min(params.wedge_depth / height, 1.0);
    std::vector<double> factors = layer_response_factors(frame, nominal_strain);

    #pragma omp parallel for schedule(static) if(frame.layers.size() > 8)
    for (size_t i = 0; i < frame.layers.size(); ++i) {
        auto& layer = frame.layers[i];

        // Mid-plane of the layer, 0 at the bottom of the stack and 1 at the top
        double normalized_height = (layer.z_position + layer.thickness / 2.0) / height;
        double scale = normalized_height * factors[i];

        for (auto& p : layer.vertices) {
            double intensity = wedge_intensity(p.x, width);
            double side = std::abs(p.x) > kCenterBand ? std::copysign(1.0, p.x) : 1.0;
            p.z -= params.wedge_depth * intensity * scale;
            p.x += side * spread * intensity * scale;
        }
    }

    if (report) {
        auto log = damascus::logging::get_logger();
        for (size_t i = 0; i < factors.size(); ++i) {
            log->debug("  layer #{} ({}): response factor {:.3f}",
                       i, to_string(frame.layers[i].material.kind), factors[i]);
        }
        report->layer_factors = std::move(factors);
    }
}

OperationStats apply_wedge(Billet& billet, const WedgeParams& params) {
    auto log = damascus::logging::get_logger();
    log->info("Wedge split: depth {:.1f}mm, angle {:.1f}deg, gap {:.1f}mm",
              params.wedge_depth, params.wedge_angle, params.split_gap);
    return OperationRunner::run(billet, params);
}

}  // namespace damascus
