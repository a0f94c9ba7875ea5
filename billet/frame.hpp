#ifndef DAMASCUS_BILLET_FRAME_HPP
#define DAMASCUS_BILLET_FRAME_HPP

#include "operation.hpp"
#include <material/material.hpp>
#include <mesh/mesh.hpp>
#include <vector>

namespace damascus {

// Mutable working copy of one layer while an operation is computed
struct LayerState {
    Material material;
    Vertices vertices;
    double thickness = 0.0;
    double z_position = 0.0;
};

// Complete candidate state of a billet. Operators transform frames; the
// billet only ever receives a frame that passed validation.
struct BilletFrame {
    double width = 0.0;
    double length = 0.0;
    double height = 0.0;
    double section_fill = 1.0;   // cross-section area / (width * height)
    CrossSectionShape shape = CrossSectionShape::Slab;
    std::vector<LayerState> layers;

    double volume() const {
        return width * length * height * section_fill;
    }

    double layer_height_sum() const {
        double sum = 0.0;
        for (const auto& layer : layers) {
            sum += layer.thickness;
        }
        return sum;
    }
};

}  // namespace damascus

#endif // DAMASCUS_BILLET_FRAME_HPP
