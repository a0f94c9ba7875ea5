#include "billet.hpp"
#include "logging.hpp"
#include <common/error.hpp>
#include <cmath>
#include <stdexcept>
#include <string>

namespace damascus {

std::vector<LayerSpec> alternating_stack(size_t count,
                                         double nickel_thickness,
                                         double carbon_thickness,
                                         const Material& nickel,
                                         const Material& carbon) {
    std::vector<LayerSpec> stack;
    stack.reserve(count);
    for (size_t i = 0; i < count; ++i) {
        bool bright = (i % 2 == 0);
        stack.push_back(bright ? LayerSpec{nickel, nickel_thickness}
                               : LayerSpec{carbon, carbon_thickness});
    }
    return stack;
}

Billet::Billet(double width, double length)
    : width_(width),
      length_(length),
      original_width_(width),
      original_length_(length) {
    if (!(std::isfinite(width) && width > 0.0) || !(std::isfinite(length) && length > 0.0)) {
        throw Error(ErrorCode::InvalidParameter,
                    "billet width and length must be positive, got " +
                    std::to_string(width) + " x " + std::to_string(length));
    }
    auto log = damascus::logging::get_logger();
    log->debug("Created billet {}mm x {}mm", width, length);
}

void Billet::stack_layers(const std::vector<LayerSpec>& stack, const MeshResolution& resolution) {
    auto log = damascus::logging::get_logger();

    if (!layers_.empty()) {
        throw Error(ErrorCode::PreconditionFailed,
                    "billet already has layers; build a new billet to reset");
    }
    if (stack.empty()) {
        throw Error(ErrorCode::InvalidParameter, "layer stack is empty");
    }
    if (resolution.width_segments == 0 || resolution.length_segments == 0) {
        throw Error(ErrorCode::InvalidParameter, "mesh resolution must be at least 1x1");
    }
    for (size_t i = 0; i < stack.size(); ++i) {
        const auto& spec = stack[i];
        if (!(std::isfinite(spec.thickness) && spec.thickness > 0.0)) {
            throw Error(ErrorCode::InvalidParameter,
                        "layer " + std::to_string(i) + " thickness must be positive");
        }
        if (!(spec.material.stiffness > 0.0) || !(spec.material.yield_strength > 0.0)) {
            throw Error(ErrorCode::InvalidParameter,
                        "layer " + std::to_string(i) + " material constants must be positive");
        }
    }

    std::vector<Layer> layers;
    layers.reserve(stack.size());

    double z = 0.0;
    for (size_t i = 0; i < stack.size(); ++i) {
        const auto& spec = stack[i];
        Mesh mesh = make_box({-width_ / 2.0, -length_ / 2.0, z},
                             {width_, length_, spec.thickness},
                             resolution);
        log->trace("Layer #{}: {} z={:.3f} t={:.3f}, {} vertices",
                   i, to_string(spec.material.kind), z, spec.thickness, mesh.vertices.size());
        layers.emplace_back(static_cast<uint32_t>(i), spec.material, spec.thickness, z, std::move(mesh));
        z += spec.thickness;
    }

    layers_ = std::move(layers);
    height_ = z;

    log->info("Stacked {} layers, total height {:.2f}mm", layers_.size(), height_);
}

const Layer& Billet::layer(size_t index) const {
    if (index >= layers_.size()) {
        throw std::out_of_range("Billet::layer: invalid layer index");
    }
    return layers_[index];
}

BilletFrame Billet::original_frame() const {
    BilletFrame frame;
    frame.width = original_width_;
    frame.length = original_length_;
    frame.layers.reserve(layers_.size());
    for (const auto& layer : layers_) {
        frame.layers.push_back(layer.original_state());
        frame.height += layer.original_thickness();
    }
    return frame;
}

BilletFrame Billet::current_frame() const {
    BilletFrame frame;
    frame.width = width_;
    frame.length = length_;
    frame.height = height_;
    frame.section_fill = section_fill_;
    frame.shape = shape_;
    frame.layers.reserve(layers_.size());
    for (const auto& layer : layers_) {
        frame.layers.push_back(layer.current_state());
    }
    return frame;
}

BilletStats Billet::stats() const {
    BilletStats stats;
    stats.layer_count = layers_.size();
    stats.width = width_;
    stats.length = length_;
    stats.height = height_;
    stats.volume = volume();
    stats.shape = shape_;
    stats.operation_count = history_.size();
    stats.layers.reserve(layers_.size());
    for (const auto& layer : layers_) {
        stats.total_vertices += layer.vertices().size();
        stats.total_triangles += layer.triangles().size();
        stats.layers.push_back(layer.stats());
    }
    return stats;
}

void Billet::commit(BilletFrame&& frame, OperationRecord record,
                    std::vector<LayerOperationRecord> layer_records) {
    // Everything that can throw happens before the first layer changes
    std::vector<std::shared_ptr<const Vertices>> staged;
    staged.reserve(layers_.size());
    for (auto& state : frame.layers) {
        staged.push_back(std::make_shared<const Vertices>(std::move(state.vertices)));
    }
    for (auto& layer : layers_) {
        layer.reserve_history();
    }
    history_.reserve(history_.size() + 1);

    for (size_t i = 0; i < layers_.size(); ++i) {
        layers_[i].commit(std::move(staged[i]), frame.layers[i].thickness,
                          frame.layers[i].z_position, std::move(layer_records[i]));
    }
    width_ = frame.width;
    length_ = frame.length;
    height_ = frame.height;
    section_fill_ = frame.section_fill;
    shape_ = frame.shape;
    history_.push_back(std::move(record));
}

}  // namespace damascus
