#include "twist.hpp"
#include "logging.hpp"
#include <common/error.hpp>
#include <engine/pipeline.hpp>
#include <cmath>
#include <numbers>
#include <string>

namespace damascus {

double twist_angle_at(double y, double length, double angle_degrees) {
    double t = (y + length / 2.0) / length;
    return angle_degrees * std::numbers::pi / 180.0 * t;
}

void validate(const TwistParams& params, const BilletFrame& frame) {
    if (!std::isfinite(params.angle_degrees)) {
        throw Error(ErrorCode::InvalidParameter, "twist angle must be finite");
    }
    if (frame.shape == CrossSectionShape::Slab) {
        throw Error(ErrorCode::PreconditionFailed,
                    "twist requires a billet forged to a square or octagon first");
    }
}

void transform_frame(BilletFrame& frame, const TwistParams& params, StageReport* /*report*/) {
    const double length = frame.length;
    const Vec3 pivot{0.0, 0.0, frame.height / 2.0};

    #pragma omp parallel for schedule(static) if(frame.layers.size() > 8)
    for (size_t i = 0; i < frame.layers.size(); ++i) {
        for (auto& p : frame.layers[i].vertices) {
            double theta = twist_angle_at(p.y, length, params.angle_degrees);
            p = Affine::rotation_about_length(theta, pivot).apply(p);
        }
    }
}

OperationStats apply_twist(Billet& billet, const TwistParams& params) {
    auto log = damascus::logging::get_logger();
    log->info("Twist: {:.1f}deg about the length axis", params.angle_degrees);
    return OperationRunner::run(billet, params);
}

}  // namespace damascus
