#ifndef DAMASCUS_BILLET_OPERATION_RECORD_HPP
#define DAMASCUS_BILLET_OPERATION_RECORD_HPP

#include "operation.hpp"
#include <chrono>
#include <cstddef>
#include <vector>

namespace damascus {

using Timestamp = std::chrono::system_clock::time_point;

// Per-vertex displacement between the state before and after an operation
struct DisplacementStats {
    double max = 0.0;
    double mean = 0.0;
    size_t vertices_moved = 0;
    size_t vertex_count = 0;
};

// Dimensions reached at the end of one forging heat
struct HeatReport {
    int heat = 0;
    double width = 0.0;
    double height = 0.0;
    double length = 0.0;
    double volume_ratio = 1.0;   // heat volume / volume before forging
};

// Stage-specific detail filled in by an operator while it runs
struct StageReport {
    std::vector<HeatReport> heats;          // forge
    std::vector<double> layer_factors;      // wedge: material response per layer
};

struct OperationStats {
    DisplacementStats displacement;
    double volume_before = 0.0;
    double volume_after = 0.0;
    double height_before = 0.0;
    double height_after = 0.0;
    double width_after = 0.0;
    double length_after = 0.0;
    std::vector<HeatReport> heats;
};

// Billet-level history entry. `params` is the cumulative parameter state the
// current geometry is replayed from.
struct OperationRecord {
    Operation params;
    Timestamp timestamp;
    double duration_seconds = 0.0;
    OperationStats stats;
};

// Per-layer history entry
struct LayerOperationRecord {
    Operation params;
    Timestamp timestamp;
    DisplacementStats displacement;
    double thickness_before = 0.0;
    double thickness_after = 0.0;
    double material_factor = 1.0;
};

}  // namespace damascus

#endif // DAMASCUS_BILLET_OPERATION_RECORD_HPP
