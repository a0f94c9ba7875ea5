#ifndef DAMASCUS_SERIALIZATION_BILLET_LOG_HPP
#define DAMASCUS_SERIALIZATION_BILLET_LOG_HPP

#include <nlohmann/json.hpp>
#include <billet/billet.hpp>
#include <string>

namespace damascus {

nlohmann::json billet_stats_to_json(const BilletStats& stats);

// Operation log of a billet:
// {
//   "version": ..., "exported_at": ...,
//   "billet_info": {width, length, layer_count, height, ...},
//   "operations": [{operation, timestamp, duration, parameters, stats}],
//   "layers": [{index, material, ..., history: [...]}],
//   "final_stats": {...}
// }
nlohmann::json operation_log_to_json(const Billet& billet);

// Throws Error(IoFailure) when the file can't be written
void save_operation_log(const Billet& billet, const std::string& path);

}  // namespace damascus

#endif // DAMASCUS_SERIALIZATION_BILLET_LOG_HPP
