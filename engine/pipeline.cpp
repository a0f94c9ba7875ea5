#include "pipeline.hpp"
#include "logging.hpp"
#include <common/error.hpp>
#include <forge/forge.hpp>
#include <deform/wedge.hpp>
#include <deform/twist.hpp>
#include <deform/compression.hpp>
#include <deform/drill.hpp>
#include <algorithm>
#include <chrono>
#include <cmath>
#include <string>

namespace damascus {

void apply_stage(BilletFrame& frame, const Operation& op, StageReport* report) {
    std::visit([&](const auto& params) {
        transform_frame(frame, params, report);
    }, op);
}

BilletFrame replay(const Billet& billet) {
    BilletFrame frame = billet.original_frame();
    for (const auto& record : billet.history()) {
        apply_stage(frame, record.params, nullptr);
    }
    return frame;
}

BilletFrame replay_with(const Billet& billet, const Operation& op) {
    BilletFrame frame = replay(billet);
    apply_stage(frame, op, nullptr);
    return frame;
}

DisplacementStats displacement_between(const Vertices& before, const Vertices& after) {
    DisplacementStats stats;
    const size_t n = std::min(before.size(), after.size());
    stats.vertex_count = n;
    if (n == 0) {
        return stats;
    }

    double sum = 0.0;
    for (size_t i = 0; i < n; ++i) {
        double d = before[i].distance_to(after[i]);
        sum += d;
        stats.max = std::max(stats.max, d);
        if (d > 0.0) {
            ++stats.vertices_moved;
        }
    }
    stats.mean = sum / static_cast<double>(n);
    return stats;
}

OperationStats OperationRunner::run(Billet& billet, const Operation& op) {
    auto log = damascus::logging::get_logger();
    const char* name = operation_name(op);
    auto start = std::chrono::steady_clock::now();

    if (billet.empty()) {
        Error error(ErrorCode::PreconditionFailed, std::string(name) + " on a billet with no layers");
        log->error("{}", error.what());
        throw error;
    }

    BilletFrame before = replay(billet);
    BilletFrame candidate = before;
    StageReport report;

    try {
        std::visit([&](const auto& params) {
            damascus::validate(params, before);
        }, op);
        apply_stage(candidate, op, &report);
        validate(billet, before, candidate, op);
    } catch (const Error& e) {
        log->error("{} rejected, billet unchanged: {}", name, e.what());
        throw;
    }

    auto timestamp = std::chrono::system_clock::now();

    OperationStats stats;
    stats.volume_before = before.volume();
    stats.volume_after = candidate.volume();
    stats.height_before = before.height;
    stats.height_after = candidate.height;
    stats.width_after = candidate.width;
    stats.length_after = candidate.length;
    stats.heats = report.heats;

    std::vector<LayerOperationRecord> layer_records;
    layer_records.reserve(candidate.layers.size());

    double displacement_sum = 0.0;
    for (size_t i = 0; i < candidate.layers.size(); ++i) {
        LayerOperationRecord record;
        record.params = op;
        record.timestamp = timestamp;
        record.displacement = displacement_between(before.layers[i].vertices,
                                                   candidate.layers[i].vertices);
        record.thickness_before = before.layers[i].thickness;
        record.thickness_after = candidate.layers[i].thickness;
        if (i < report.layer_factors.size()) {
            record.material_factor = report.layer_factors[i];
        }

        auto& total = stats.displacement;
        total.max = std::max(total.max, record.displacement.max);
        total.vertices_moved += record.displacement.vertices_moved;
        total.vertex_count += record.displacement.vertex_count;
        displacement_sum += record.displacement.mean * record.displacement.vertex_count;

        log->debug("  layer #{}: max displacement {:.3f}mm, mean {:.3f}mm, thickness {:.3f} -> {:.3f}mm",
                   i, record.displacement.max, record.displacement.mean,
                   record.thickness_before, record.thickness_after);

        layer_records.push_back(std::move(record));
    }
    if (stats.displacement.vertex_count > 0) {
        stats.displacement.mean = displacement_sum / static_cast<double>(stats.displacement.vertex_count);
    }

    OperationRecord record;
    record.params = op;
    record.timestamp = timestamp;
    record.duration_seconds = std::chrono::duration<double>(
        std::chrono::steady_clock::now() - start).count();
    record.stats = stats;

    billet.commit(std::move(candidate), std::move(record), std::move(layer_records));

    log->info("{} complete in {:.3f}s: {} vertices moved, max {:.3f}mm, mean {:.3f}mm",
              name, billet.history().back().duration_seconds,
              stats.displacement.vertices_moved, stats.displacement.max, stats.displacement.mean);
    log->info("  billet now {:.2f}W x {:.2f}L x {:.2f}H mm, volume {:.1f}mm^3",
              billet.width(), billet.length(), billet.height(), billet.volume());

    return stats;
}

void OperationRunner::validate(const Billet& billet, const BilletFrame& before,
                               const BilletFrame& candidate, const Operation& op) {
    if (candidate.layers.size() != billet.layer_count()) {
        throw Error(ErrorCode::DegenerateGeometry, "layer count changed");
    }

    if (!(std::isfinite(candidate.width) && candidate.width > 0.0) ||
        !(std::isfinite(candidate.length) && candidate.length > 0.0) ||
        !(std::isfinite(candidate.height) && candidate.height > 0.0)) {
        throw Error(ErrorCode::NonFiniteGeometry, "billet dimensions are not finite and positive");
    }

    std::vector<MeshCheck> checks(candidate.layers.size());

    #pragma omp parallel for schedule(static) if(candidate.layers.size() > 8)
    for (size_t i = 0; i < candidate.layers.size(); ++i) {
        const auto& layer = billet.layers()[i];
        const auto& state = candidate.layers[i];
        if (state.vertices.size() != layer.original_vertices().size()) {
            checks[i].fail(ErrorCode::DegenerateGeometry, "vertex count changed");
            continue;
        }
        if (!(std::isfinite(state.thickness) && state.thickness > 0.0) ||
            !std::isfinite(state.z_position)) {
            checks[i].fail(ErrorCode::NonFiniteGeometry, "thickness or z position is not finite");
            continue;
        }
        checks[i] = check_mesh(state.vertices, layer.triangles());
    }

    for (size_t i = 0; i < checks.size(); ++i) {
        if (!checks[i].valid) {
            throw Error(checks[i].code, "layer " + std::to_string(i) + ": " + checks[i].message);
        }
    }

    double sum = candidate.layer_height_sum();
    if (std::abs(sum - candidate.height) > kVolumeTolerance * candidate.height) {
        throw Error(ErrorCode::HeightMismatch,
                    "layer thicknesses sum to " + std::to_string(sum) +
                    "mm but billet height is " + std::to_string(candidate.height) + "mm");
    }

    if (conserves_volume(op)) {
        double v0 = before.volume();
        double v1 = candidate.volume();
        if (std::abs(v1 - v0) > kVolumeTolerance * v0) {
            throw Error(ErrorCode::VolumeNotConserved,
                        "volume changed from " + std::to_string(v0) + " to " + std::to_string(v1));
        }
    }
}

}  // namespace damascus
