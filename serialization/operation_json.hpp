#ifndef DAMASCUS_SERIALIZATION_OPERATION_JSON_HPP
#define DAMASCUS_SERIALIZATION_OPERATION_JSON_HPP

#include <nlohmann/json.hpp>
#include <math/vec3.hpp>
#include <common/error.hpp>
#include <mesh/mesh.hpp>
#include <material/material.hpp>
#include <billet/operation.hpp>
#include <billet/operation_record.hpp>
#include <cstdint>
#include <limits>
#include <string>
#include <type_traits>

namespace damascus {

// Positive integer field, `fallback` when absent. Negative, fractional or
// out-of-range values are InvalidParameter rather than wrapping.
inline uint32_t count_from_json(const nlohmann::json& j, const char* key, uint32_t fallback) {
    if (!j.contains(key)) {
        return fallback;
    }
    const auto& value = j[key];
    if (!value.is_number_integer()) {
        throw Error(ErrorCode::InvalidParameter, std::string("'") + key + "' must be an integer");
    }
    if (value.is_number_unsigned()) {
        auto n = value.get<uint64_t>();
        if (n >= 1 && n <= std::numeric_limits<uint32_t>::max()) {
            return static_cast<uint32_t>(n);
        }
    } else {
        auto n = value.get<int64_t>();
        if (n >= 1 && n <= static_cast<int64_t>(std::numeric_limits<uint32_t>::max())) {
            return static_cast<uint32_t>(n);
        }
    }
    throw Error(ErrorCode::InvalidParameter,
                std::string("'") + key + "' must be between 1 and " +
                std::to_string(std::numeric_limits<uint32_t>::max()) + ", got " + value.dump());
}

NLOHMANN_JSON_SERIALIZE_ENUM(MaterialKind, {
    {MaterialKind::HighNickel, "high_nickel"},
    {MaterialKind::HighCarbon, "high_carbon"},
})

NLOHMANN_JSON_SERIALIZE_ENUM(CrossSectionShape, {
    {CrossSectionShape::Slab, "slab"},
    {CrossSectionShape::Square, "square"},
    {CrossSectionShape::Octagon, "octagon"},
})

// Vec3 serialization
inline void to_json(nlohmann::json& j, const Vec3& v) {
    j = nlohmann::json::array({v.x, v.y, v.z});
}

// Bounds serialization
inline void to_json(nlohmann::json& j, const Bounds& b) {
    if (b.empty) {
        j = nullptr;
        return;
    }
    j = {
        {"min", b.min},
        {"max", b.max}
    };
}

// MeshResolution serialization
inline void to_json(nlohmann::json& j, const MeshResolution& r) {
    j = {
        {"width_segments", r.width_segments},
        {"length_segments", r.length_segments}
    };
}

inline void from_json(const nlohmann::json& j, MeshResolution& r) {
    r.width_segments = count_from_json(j, "width_segments", 1);
    r.length_segments = count_from_json(j, "length_segments", 1);
}

// Material serialization
inline void to_json(nlohmann::json& j, const Material& m) {
    j = {
        {"kind", m.kind},
        {"stiffness", m.stiffness},
        {"yield_strength", m.yield_strength}
    };
}

inline void from_json(const nlohmann::json& j, Material& m) {
    m.kind = j.at("kind").get<MaterialKind>();
    Material defaults = m.kind == MaterialKind::HighNickel ? Material::high_nickel()
                                                           : Material::high_carbon();
    m.stiffness = j.value("stiffness", defaults.stiffness);
    m.yield_strength = j.value("yield_strength", defaults.yield_strength);
}

// Operator parameter serialization. Missing keys keep the struct defaults.
inline void to_json(nlohmann::json& j, const ForgeParams& p) {
    j = {
        {"shape", p.shape},
        {"target_size", p.target_size},
        {"heat_count", p.heat_count}
    };
    if (p.shape == CrossSectionShape::Octagon) {
        j["chamfer_fraction"] = p.chamfer_fraction;
    }
}

inline void from_json(const nlohmann::json& j, ForgeParams& p) {
    ForgeParams defaults;
    p.shape = j.value("shape", defaults.shape);
    p.target_size = j.value("target_size", defaults.target_size);
    p.heat_count = j.value("heat_count", defaults.heat_count);
    p.chamfer_fraction = j.value("chamfer_fraction", defaults.chamfer_fraction);
}

inline void to_json(nlohmann::json& j, const WedgeParams& p) {
    j = {
        {"wedge_depth", p.wedge_depth},
        {"wedge_angle", p.wedge_angle},
        {"split_gap", p.split_gap}
    };
}

inline void from_json(const nlohmann::json& j, WedgeParams& p) {
    WedgeParams defaults;
    p.wedge_depth = j.value("wedge_depth", defaults.wedge_depth);
    p.wedge_angle = j.value("wedge_angle", defaults.wedge_angle);
    p.split_gap = j.value("split_gap", defaults.split_gap);
}

inline void to_json(nlohmann::json& j, const TwistParams& p) {
    j = {
        {"angle_degrees", p.angle_degrees},
        {"axis", "length"}
    };
}

inline void from_json(const nlohmann::json& j, TwistParams& p) {
    p.angle_degrees = j.value("angle_degrees", TwistParams{}.angle_degrees);
    if (j.contains("axis") && j["axis"] != "length") {
        throw Error(ErrorCode::InvalidParameter,
                    "twist axis must be 'length', got " + j["axis"].dump());
    }
}

inline void to_json(nlohmann::json& j, const CompressionParams& p) {
    j = {
        {"compression_factor", p.compression_factor}
    };
}

inline void from_json(const nlohmann::json& j, CompressionParams& p) {
    p.compression_factor = j.value("compression_factor", CompressionParams{}.compression_factor);
}

inline void to_json(nlohmann::json& j, const DrillParams& p) {
    j = {
        {"x_pos", p.x_pos},
        {"z_pos", p.z_pos},
        {"radius", p.radius}
    };
}

inline void from_json(const nlohmann::json& j, DrillParams& p) {
    DrillParams defaults;
    p.x_pos = j.value("x_pos", defaults.x_pos);
    p.z_pos = j.value("z_pos", defaults.z_pos);
    p.radius = j.value("radius", defaults.radius);
}

// Parameters of any operation, without its name
inline nlohmann::json operation_parameters_to_json(const Operation& op) {
    return std::visit([](const auto& params) -> nlohmann::json {
        return params;
    }, op);
}

// {"operation": <name>, ...parameters}
inline nlohmann::json operation_to_json(const Operation& op) {
    nlohmann::json j = operation_parameters_to_json(op);
    j["operation"] = operation_name(op);
    return j;
}

// Accepts the names written by operation_to_json() and the short recipe
// names (forge, wedge, drill). "forge_square"/"forge_octagon" fix the shape.
inline Operation operation_from_json(const nlohmann::json& j) {
    if (!j.is_object() || !j.contains("operation")) {
        throw Error(ErrorCode::InvalidParameter, "operation entry needs an 'operation' name");
    }
    std::string name = j["operation"].get<std::string>();

    if (name == "forge" || name == "forge_square" || name == "forge_octagon") {
        ForgeParams params = j.get<ForgeParams>();
        if (name == "forge_square") params.shape = CrossSectionShape::Square;
        if (name == "forge_octagon") params.shape = CrossSectionShape::Octagon;
        return params;
    } else if (name == "wedge" || name == "wedge_deformation") {
        return j.get<WedgeParams>();
    } else if (name == "twist") {
        return j.get<TwistParams>();
    } else if (name == "compression") {
        return j.get<CompressionParams>();
    } else if (name == "drill" || name == "drill_hole") {
        return j.get<DrillParams>();
    } else {
        throw Error(ErrorCode::InvalidParameter, "unknown operation: " + name);
    }
}

// Statistics serialization
inline void to_json(nlohmann::json& j, const DisplacementStats& s) {
    j = {
        {"max_displacement", s.max},
        {"mean_displacement", s.mean},
        {"vertices_moved", s.vertices_moved},
        {"vertex_count", s.vertex_count}
    };
}

inline void to_json(nlohmann::json& j, const HeatReport& h) {
    j = {
        {"heat", h.heat},
        {"width", h.width},
        {"height", h.height},
        {"length", h.length},
        {"volume_ratio", h.volume_ratio}
    };
}

inline void to_json(nlohmann::json& j, const OperationStats& s) {
    j = s.displacement;
    j["volume_before"] = s.volume_before;
    j["volume_after"] = s.volume_after;
    j["height_before"] = s.height_before;
    j["height_after"] = s.height_after;
    j["width_after"] = s.width_after;
    j["length_after"] = s.length_after;
    if (!s.heats.empty()) {
        j["heats"] = s.heats;
    }
}

}  // namespace damascus

#endif // DAMASCUS_SERIALIZATION_OPERATION_JSON_HPP
