#include "forge.hpp"
#include "logging.hpp"
#include <common/error.hpp>
#include <engine/pipeline.hpp>
#include <algorithm>
#include <cmath>
#include <string>

namespace damascus {

namespace {

// Map a point of the w x h rectangle into the octagon with the given corner
// leg. Every point moves towards the section centre (x = 0, z = half_height)
// by the ratio of the octagon's to the rectangle's extent along its ray, so
// the rectangle's outline lands on the octagon's and interior layers follow
// without folding.
Vec3 clip_to_octagon(const Vec3& p, double half_width, double half_height, double leg) {
    double u = p.x;
    double v = p.z - half_height;
    double limit = half_width + half_height - leg;

    double rect = std::max(std::abs(u) / half_width, std::abs(v) / half_height);
    double octagon = std::max(rect, (std::abs(u) + std::abs(v)) / limit);
    if (!(octagon > rect)) {
        return p;
    }

    double k = rect / octagon;
    return {u * k, p.y, half_height + v * k};
}

}  // namespace

double chamfer_leg(double width, double height, double chamfer_fraction) {
    return 0.5 * chamfer_fraction * std::min(width, height);
}

double octagon_area(double size, double chamfer_fraction) {
    double leg = chamfer_leg(size, size, chamfer_fraction);
    return size * size - 2.0 * leg * leg;
}

double forged_length(double volume, const ForgeParams& params) {
    double area = params.shape == CrossSectionShape::Octagon
        ? octagon_area(params.target_size, params.chamfer_fraction)
        : params.target_size * params.target_size;
    return volume / area;
}

void validate(const ForgeParams& params, const BilletFrame& /*frame*/) {
    if (params.shape == CrossSectionShape::Slab) {
        throw Error(ErrorCode::InvalidParameter, "forge target must be square or octagon");
    }
    if (!(std::isfinite(params.target_size) && params.target_size > 0.0)) {
        throw Error(ErrorCode::InvalidParameter,
                    "forge target size must be positive, got " + std::to_string(params.target_size));
    }
    if (params.heat_count < 1) {
        throw Error(ErrorCode::InvalidParameter,
                    "forge heat count must be at least 1, got " + std::to_string(params.heat_count));
    }
    if (params.shape == CrossSectionShape::Octagon &&
        !(std::isfinite(params.chamfer_fraction) &&
          params.chamfer_fraction >= 0.0 && params.chamfer_fraction <= 1.0)) {
        throw Error(ErrorCode::InvalidParameter,
                    "octagon chamfer fraction must be within [0, 1], got " +
                    std::to_string(params.chamfer_fraction));
    }
}

void transform_frame(BilletFrame& frame, const ForgeParams& params, StageReport* report) {
    auto log = damascus::logging::get_logger();

    const double w0 = frame.width;
    const double h0 = frame.height;
    const double l0 = frame.length;
    const double v0 = frame.volume();
    const double size = params.target_size;
    const bool octagon = params.shape == CrossSectionShape::Octagon;
    const double chamfer = octagon ? params.chamfer_fraction : 0.0;
    const double target_length = forged_length(v0, params);
    const int heats = params.heat_count;

    // Replay only needs the final heat
    const int first_heat = report ? 1 : heats;

    std::vector<Vertices> shaped(frame.layers.size());
    double w = w0;
    double h = h0;
    double l = l0;

    for (int heat = first_heat; heat <= heats; ++heat) {
        double progress = static_cast<double>(heat) / static_cast<double>(heats);
        w = lerp(w0, size, progress);
        h = lerp(h0, size, progress);
        l = lerp(l0, target_length, progress);

        const double leg = chamfer_leg(w, h, chamfer * progress);
        const Affine scale = Affine::scale(w / w0, l / l0, h / h0);

        #pragma omp parallel for schedule(static) if(frame.layers.size() > 8)
        for (size_t i = 0; i < frame.layers.size(); ++i) {
            Vertices vertices = transform(frame.layers[i].vertices, scale);
            if (leg > 0.0) {
                for (auto& p : vertices) {
                    p = clip_to_octagon(p, w / 2.0, h / 2.0, leg);
                }
            }
            shaped[i] = std::move(vertices);
        }

        if (report) {
            double fill = (w * h - 2.0 * leg * leg) / (w * h);
            HeatReport heat_report;
            heat_report.heat = heat;
            heat_report.width = w;
            heat_report.height = h;
            heat_report.length = l;
            heat_report.volume_ratio = (w * h * l * fill) / v0;
            report->heats.push_back(heat_report);

            log->debug("  heat {}/{}: {:.2f}W x {:.2f}L x {:.2f}H mm, volume ratio {:.4f}",
                       heat, heats, w, l, h, heat_report.volume_ratio);

            // The final heat is checked by the runner
            if (heat < heats) {
                for (size_t i = 0; i < shaped.size(); ++i) {
                    for (const auto& p : shaped[i]) {
                        if (!p.is_finite()) {
                            throw Error(ErrorCode::NonFiniteGeometry,
                                        "heat " + std::to_string(heat) + ", layer " +
                                        std::to_string(i) + ": non-finite vertex");
                        }
                    }
                }
            }
        }
    }

    const double thickness_scale = h / h0;
    for (size_t i = 0; i < frame.layers.size(); ++i) {
        auto& layer = frame.layers[i];
        layer.vertices = std::move(shaped[i]);
        layer.thickness *= thickness_scale;
        layer.z_position *= thickness_scale;
    }

    const double area = octagon ? octagon_area(size, chamfer) : size * size;
    frame.width = w;
    frame.height = h;
    frame.length = l;
    frame.section_fill = area / (w * h);
    frame.shape = params.shape;
}

OperationStats forge(Billet& billet, const ForgeParams& params) {
    auto log = damascus::logging::get_logger();
    log->info("Forging to {} {:.1f}mm over {} heats",
              to_string(params.shape), params.target_size, params.heat_count);
    return OperationRunner::run(billet, params);
}

}  // namespace damascus
