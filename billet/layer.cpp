#include "layer.hpp"

namespace damascus {

Layer::Layer(uint32_t index, const Material& material, double thickness,
             double z_position, Mesh mesh)
    : index_(index),
      material_(material),
      thickness_(thickness),
      z_position_(z_position),
      original_thickness_(thickness),
      original_z_position_(z_position) {
    auto vertices = std::make_shared<const Vertices>(std::move(mesh.vertices));
    current_ = vertices;
    original_ = vertices;
    topology_ = std::make_shared<const Topology>(std::move(mesh.triangles));
}

LayerState Layer::original_state() const {
    return LayerState{material_, *original_, original_thickness_, original_z_position_};
}

LayerState Layer::current_state() const {
    return LayerState{material_, *current_, thickness_, z_position_};
}

LayerStats Layer::stats() const {
    LayerStats stats;
    stats.layer_index = index_;
    stats.vertex_count = current_->size();
    stats.triangle_count = topology_->size();
    stats.bounds = compute_bounds(*current_);
    stats.material = material_.kind;
    stats.thickness = thickness_;
    stats.z_position = z_position_;
    stats.deformation_count = history_.size();

    Vec3 sum;
    for (const auto& v : *current_) {
        sum += v;
    }
    if (!current_->empty()) {
        stats.centroid = sum / static_cast<double>(current_->size());
    }
    return stats;
}

void Layer::reserve_history() {
    history_.reserve(history_.size() + 1);
}

void Layer::commit(std::shared_ptr<const Vertices> vertices, double thickness,
                   double z_position, LayerOperationRecord&& record) {
    current_ = std::move(vertices);
    thickness_ = thickness;
    z_position_ = z_position;
    history_.push_back(std::move(record));
}

}  // namespace damascus
