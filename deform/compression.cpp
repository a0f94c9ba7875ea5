#include "compression.hpp"
#include "logging.hpp"
#include <common/error.hpp>
#include <engine/pipeline.hpp>
#include <cmath>
#include <string>

namespace damascus {

double compression_spread(double compression_factor) {
    return 1.0 / std::sqrt(compression_factor);
}

void validate(const CompressionParams& params, const BilletFrame& /*frame*/) {
    double f = params.compression_factor;
    if (!(std::isfinite(f) && f > 0.0 && f <= 1.0)) {
        throw Error(ErrorCode::InvalidParameter,
                    "compression factor must be within (0, 1], got " + std::to_string(f));
    }
}

void transform_frame(BilletFrame& frame, const CompressionParams& params, StageReport* /*report*/) {
    const double f = params.compression_factor;
    const double spread = compression_spread(f);
    const Affine scale = Affine::scale(spread, spread, f);

    #pragma omp parallel for schedule(static) if(frame.layers.size() > 8)
    for (size_t i = 0; i < frame.layers.size(); ++i) {
        auto& layer = frame.layers[i];
        layer.vertices = transform(layer.vertices, scale);
        layer.thickness *= f;
        layer.z_position *= f;
    }

    frame.height *= f;
    frame.width *= spread;
    frame.length *= spread;
}

OperationStats apply_compression(Billet& billet, const CompressionParams& params) {
    auto log = damascus::logging::get_logger();
    log->info("Compression: factor {:.3f}", params.compression_factor);
    return OperationRunner::run(billet, params);
}

}  // namespace damascus
