#ifndef DAMASCUS_BILLET_LAYER_HPP
#define DAMASCUS_BILLET_LAYER_HPP

#include "frame.hpp"
#include "operation_record.hpp"
#include <material/material.hpp>
#include <mesh/mesh.hpp>
#include <cstdint>
#include <memory>
#include <vector>

namespace damascus {

struct LayerStats {
    uint32_t layer_index = 0;
    size_t vertex_count = 0;
    size_t triangle_count = 0;
    Bounds bounds;
    Vec3 centroid;
    MaterialKind material = MaterialKind::HighCarbon;
    double thickness = 0.0;
    double z_position = 0.0;
    size_t deformation_count = 0;
};

// One steel sheet of the billet as a closed triangle mesh.
//
// The creation-time snapshot (vertices, thickness, z position) never changes
// and is the reference every operation is recomputed from. Current vertices
// are held behind a shared pointer and replaced wholesale, so a reader that
// took vertex_snapshot() keeps a consistent array across later commits.
class Layer {
public:
    Layer(uint32_t index, const Material& material, double thickness,
          double z_position, Mesh mesh);

    uint32_t index() const { return index_; }
    const Material& material() const { return material_; }

    double thickness() const { return thickness_; }
    double z_position() const { return z_position_; }
    double original_thickness() const { return original_thickness_; }
    double original_z_position() const { return original_z_position_; }

    const Vertices& vertices() const { return *current_; }
    const Vertices& original_vertices() const { return *original_; }
    const Topology& triangles() const { return *topology_; }
    std::shared_ptr<const Vertices> vertex_snapshot() const { return current_; }

    const std::vector<LayerOperationRecord>& history() const { return history_; }

    // Working copy of the creation-time state
    LayerState original_state() const;

    // Working copy of the current state
    LayerState current_state() const;

    LayerStats stats() const;

private:
    friend class Billet;

    // Room for one more history entry, so that commit() does not allocate
    void reserve_history();

    // Swap in validated vertices and append the history entry. Does not
    // allocate after reserve_history().
    void commit(std::shared_ptr<const Vertices> vertices, double thickness,
                double z_position, LayerOperationRecord&& record);

    uint32_t index_;
    Material material_;

    double thickness_;
    double z_position_;
    double original_thickness_;
    double original_z_position_;

    std::shared_ptr<const Vertices> current_;
    std::shared_ptr<const Vertices> original_;
    std::shared_ptr<const Topology> topology_;

    std::vector<LayerOperationRecord> history_;
};

}  // namespace damascus

#endif // DAMASCUS_BILLET_LAYER_HPP
