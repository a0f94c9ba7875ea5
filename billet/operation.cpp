#include "operation.hpp"
#include <type_traits>

namespace damascus {

const char* to_string(CrossSectionShape shape) {
    switch (shape) {
        case CrossSectionShape::Slab: return "slab";
        case CrossSectionShape::Square: return "square";
        case CrossSectionShape::Octagon: return "octagon";
    }
    return "unknown";
}

const char* operation_name(const Operation& op) {
    return std::visit([](const auto& params) -> const char* {
        using T = std::decay_t<decltype(params)>;
        if constexpr (std::is_same_v<T, ForgeParams>) {
            return params.shape == CrossSectionShape::Octagon ? "forge_octagon" : "forge_square";
        } else if constexpr (std::is_same_v<T, WedgeParams>) {
            return "wedge_deformation";
        } else if constexpr (std::is_same_v<T, TwistParams>) {
            return "twist";
        } else if constexpr (std::is_same_v<T, CompressionParams>) {
            return "compression";
        } else {
            return "drill_hole";
        }
    }, op);
}

bool conserves_volume(const Operation& op) {
    return std::holds_alternative<ForgeParams>(op) ||
           std::holds_alternative<CompressionParams>(op);
}

}  // namespace damascus
