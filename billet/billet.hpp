#ifndef DAMASCUS_BILLET_BILLET_HPP
#define DAMASCUS_BILLET_BILLET_HPP

#include "layer.hpp"
#include "frame.hpp"
#include "operation_record.hpp"
#include <material/material.hpp>
#include <mesh/mesh.hpp>
#include <vector>

namespace damascus {

// One entry of a stack-construction call, bottom layer first
struct LayerSpec {
    Material material;
    double thickness = 1.0;
};

// Classic alternating stack: even indices high-nickel, odd indices high-carbon
std::vector<LayerSpec> alternating_stack(size_t count,
                                         double nickel_thickness,
                                         double carbon_thickness,
                                         const Material& nickel = Material::high_nickel(),
                                         const Material& carbon = Material::high_carbon());

struct BilletStats {
    size_t layer_count = 0;
    double width = 0.0;
    double length = 0.0;
    double height = 0.0;
    double volume = 0.0;
    CrossSectionShape shape = CrossSectionShape::Slab;
    size_t total_vertices = 0;
    size_t total_triangles = 0;
    size_t operation_count = 0;
    std::vector<LayerStats> layers;
};

// The layered solid being forged.
//
// A billet starts empty, is populated exactly once by stack_layers(), and
// from then on only changes through the operators. Resetting means building
// a new Billet. Layers are never inserted, removed or reordered.
class Billet {
public:
    Billet(double width, double length);

    // Create one box layer per LayerSpec, stacked contiguously from z = 0 and
    // centred on x = 0, y = 0. Snapshots every layer's original state.
    void stack_layers(const std::vector<LayerSpec>& stack,
                      const MeshResolution& resolution = MeshResolution{});

    double width() const { return width_; }
    double length() const { return length_; }
    double height() const { return height_; }
    double section_fill() const { return section_fill_; }
    double volume() const { return width_ * length_ * height_ * section_fill_; }

    CrossSectionShape shape() const { return shape_; }
    bool is_forged() const { return shape_ != CrossSectionShape::Slab; }

    bool empty() const { return layers_.empty(); }
    size_t layer_count() const { return layers_.size(); }
    const std::vector<Layer>& layers() const { return layers_; }
    const Layer& layer(size_t index) const;

    double original_width() const { return original_width_; }
    double original_length() const { return original_length_; }

    const std::vector<OperationRecord>& history() const { return history_; }

    // Frame built from the creation-time snapshots
    BilletFrame original_frame() const;

    // Frame holding the current committed state
    BilletFrame current_frame() const;

    BilletStats stats() const;

private:
    friend class OperationRunner;

    // Swap in a validated frame. `layer_records` holds one entry per layer.
    // Either every layer takes the new state or, if an allocation fails,
    // none does.
    void commit(BilletFrame&& frame, OperationRecord record,
                std::vector<LayerOperationRecord> layer_records);

    double width_;
    double length_;
    double height_ = 0.0;
    double section_fill_ = 1.0;
    CrossSectionShape shape_ = CrossSectionShape::Slab;

    double original_width_;
    double original_length_;

    std::vector<Layer> layers_;
    std::vector<OperationRecord> history_;
};

}  // namespace damascus

#endif // DAMASCUS_BILLET_BILLET_HPP
