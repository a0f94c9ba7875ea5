#ifndef DAMASCUS_MESH_MESH_HPP
#define DAMASCUS_MESH_MESH_HPP

// Minimal mesh interface used by the engine: vertex buffer, triangle index
// buffer, plane intersection and affine transforms. No external geometry
// library is involved.

#include <math/vec3.hpp>
#include <common/error.hpp>
#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace damascus {

using VertexIndex = uint32_t;

struct Triangle {
    VertexIndex a = 0;
    VertexIndex b = 0;
    VertexIndex c = 0;
};

using Vertices = std::vector<Vec3>;
using Topology = std::vector<Triangle>;

enum class Axis : uint8_t { X = 0, Y = 1, Z = 2 };

// Subdivision of a layer box. Thickness is never subdivided.
struct MeshResolution {
    uint32_t width_segments = 1;
    uint32_t length_segments = 1;
};

struct Mesh {
    Vertices vertices;
    Topology triangles;
};

struct Bounds {
    Vec3 min;
    Vec3 max;
    bool empty = true;

    void expand(const Vec3& p);
    void expand(const Bounds& other);
    Vec3 size() const { return empty ? Vec3{} : max - min; }
    Vec3 center() const { return empty ? Vec3{} : (min + max) * 0.5; }
};

// 3x3 linear part plus translation: p' = M * p + t
struct Affine {
    std::array<std::array<double, 3>, 3> m{{{1.0, 0.0, 0.0},
                                            {0.0, 1.0, 0.0},
                                            {0.0, 0.0, 1.0}}};
    Vec3 t;

    Vec3 apply(const Vec3& p) const {
        return {
            m[0][0] * p.x + m[0][1] * p.y + m[0][2] * p.z + t.x,
            m[1][0] * p.x + m[1][1] * p.y + m[1][2] * p.z + t.y,
            m[2][0] * p.x + m[2][1] * p.y + m[2][2] * p.z + t.z
        };
    }

    static Affine identity() { return Affine{}; }
    static Affine scale(double sx, double sy, double sz);
    static Affine translation(const Vec3& offset);

    // Rotation by `radians` in the x-z plane around the line parallel to y
    // through `pivot` (x and z of pivot are used).
    static Affine rotation_about_length(double radians, const Vec3& pivot);
};

// Closed axis-aligned box from `min_corner` with extents `size`, each face a
// grid of (segments_u x segments_v) quads with outward winding. Side quads are
// split into two triangles. Quads of the two length-end faces are fanned into
// four around a centre vertex. Seam vertices are duplicated per face.
Mesh make_box(const Vec3& min_corner, const Vec3& size, const MeshResolution& resolution);

Vertices transform(const Vertices& vertices, const Affine& affine);

Bounds compute_bounds(const Vertices& vertices);

double triangle_area(const Vec3& a, const Vec3& b, const Vec3& c);

// Intersection of a triangle with the plane {p : p[axis] == position}.
// Vertices on the plane count as lying on the positive side, so an edge shared
// by two triangles yields exactly one segment.
std::optional<std::pair<Vec3, Vec3>> intersect_plane(const Vec3& a, const Vec3& b, const Vec3& c,
                                                     Axis axis, double position);

// Mirrors the ValidationResult shape used elsewhere: first failure wins.
struct MeshCheck {
    bool valid = true;
    ErrorCode code = ErrorCode::InvalidParameter;
    std::string message;

    void fail(ErrorCode c, const std::string& msg) {
        if (!valid) return;
        valid = false;
        code = c;
        message = msg;
    }
};

constexpr double kMinTriangleArea = 1e-12;

// Checks finiteness, index range and non-zero triangle area.
MeshCheck check_mesh(const Vertices& vertices, const Topology& triangles,
                     double min_area = kMinTriangleArea);

}  // namespace damascus

#endif // DAMASCUS_MESH_MESH_HPP
