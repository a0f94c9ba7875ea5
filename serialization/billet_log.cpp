#include "billet_log.hpp"
#include "json_serialization.hpp"
#include "operation_json.hpp"
#include "logging.hpp"

namespace damascus {

namespace {

nlohmann::json layer_stats_to_json(const LayerStats& s) {
    return {
        {"index", s.layer_index},
        {"material", s.material},
        {"thickness", s.thickness},
        {"z_position", s.z_position},
        {"vertex_count", s.vertex_count},
        {"triangle_count", s.triangle_count},
        {"bounds", s.bounds},
        {"centroid", s.centroid},
        {"deformation_count", s.deformation_count}
    };
}

nlohmann::json layer_record_to_json(const LayerOperationRecord& r) {
    return {
        {"operation", operation_name(r.params)},
        {"timestamp", json::format_timestamp(r.timestamp)},
        {"parameters", operation_parameters_to_json(r.params)},
        {"displacement", r.displacement},
        {"thickness_before", r.thickness_before},
        {"thickness_after", r.thickness_after},
        {"material_factor", r.material_factor}
    };
}

}  // namespace

nlohmann::json billet_stats_to_json(const BilletStats& stats) {
    nlohmann::json layers = nlohmann::json::array();
    for (const auto& layer : stats.layers) {
        layers.push_back(layer_stats_to_json(layer));
    }
    return {
        {"layer_count", stats.layer_count},
        {"width", stats.width},
        {"length", stats.length},
        {"height", stats.height},
        {"volume", stats.volume},
        {"shape", stats.shape},
        {"total_vertices", stats.total_vertices},
        {"total_triangles", stats.total_triangles},
        {"operation_count", stats.operation_count},
        {"layers", layers}
    };
}

nlohmann::json operation_log_to_json(const Billet& billet) {
    nlohmann::json log;
    log["version"] = json::LOG_FORMAT_VERSION;
    log["exported_at"] = json::get_timestamp();

    log["billet_info"] = {
        {"width", billet.width()},
        {"length", billet.length()},
        {"layer_count", billet.layer_count()},
        {"height", billet.height()},
        {"shape", billet.shape()},
        {"original_width", billet.original_width()},
        {"original_length", billet.original_length()}
    };

    nlohmann::json operations = nlohmann::json::array();
    for (const auto& record : billet.history()) {
        operations.push_back({
            {"operation", operation_name(record.params)},
            {"timestamp", json::format_timestamp(record.timestamp)},
            {"duration", record.duration_seconds},
            {"parameters", operation_parameters_to_json(record.params)},
            {"stats", record.stats}
        });
    }
    log["operations"] = operations;

    nlohmann::json layers = nlohmann::json::array();
    for (const auto& layer : billet.layers()) {
        nlohmann::json history = nlohmann::json::array();
        for (const auto& record : layer.history()) {
            history.push_back(layer_record_to_json(record));
        }
        layers.push_back({
            {"index", layer.index()},
            {"material", layer.material()},
            {"original_thickness", layer.original_thickness()},
            {"original_z_position", layer.original_z_position()},
            {"thickness", layer.thickness()},
            {"z_position", layer.z_position()},
            {"history", history}
        });
    }
    log["layers"] = layers;

    nlohmann::json final_stats = billet_stats_to_json(billet.stats());
    final_stats.erase("layers");
    log["final_stats"] = final_stats;

    return log;
}

void save_operation_log(const Billet& billet, const std::string& path) {
    json::write_json_file(path, operation_log_to_json(billet));

    auto log = damascus::logging::get_logger();
    log->info("Wrote operation log ({} operations) to {}", billet.history().size(), path);
}

}  // namespace damascus
