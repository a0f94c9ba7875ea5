#include "mesh.hpp"
#include <algorithm>
#include <cmath>

namespace damascus {

void Bounds::expand(const Vec3& p) {
    if (empty) {
        min = p;
        max = p;
        empty = false;
        return;
    }
    min.x = std::min(min.x, p.x);
    min.y = std::min(min.y, p.y);
    min.z = std::min(min.z, p.z);
    max.x = std::max(max.x, p.x);
    max.y = std::max(max.y, p.y);
    max.z = std::max(max.z, p.z);
}

void Bounds::expand(const Bounds& other) {
    if (other.empty) return;
    expand(other.min);
    expand(other.max);
}

Affine Affine::scale(double sx, double sy, double sz) {
    Affine a;
    a.m[0][0] = sx;
    a.m[1][1] = sy;
    a.m[2][2] = sz;
    return a;
}

Affine Affine::translation(const Vec3& offset) {
    Affine a;
    a.t = offset;
    return a;
}

Affine Affine::rotation_about_length(double radians, const Vec3& pivot) {
    const double c = std::cos(radians);
    const double s = std::sin(radians);

    // x' = cx + (x - cx) c - (z - cz) s
    // z' = cz + (x - cx) s + (z - cz) c
    Affine a;
    a.m = {{{c, 0.0, -s},
            {0.0, 1.0, 0.0},
            {s, 0.0, c}}};
    a.t = {pivot.x - c * pivot.x + s * pivot.z,
           0.0,
           pivot.z - s * pivot.x - c * pivot.z};
    return a;
}

namespace {

// With `centre_fan` every quad gets a centre vertex and four triangles. The
// length-end faces use it so that no end triangle has all three vertices on
// the outline of the cross-section, which forging may flatten onto one line.
void add_face_grid(Mesh& mesh, const Vec3& origin, const Vec3& u, const Vec3& v,
                   uint32_t segments_u, uint32_t segments_v, bool centre_fan = false) {
    const auto base = static_cast<VertexIndex>(mesh.vertices.size());
    const uint32_t stride = segments_u + 1;

    for (uint32_t j = 0; j <= segments_v; ++j) {
        for (uint32_t i = 0; i <= segments_u; ++i) {
            double fu = static_cast<double>(i) / segments_u;
            double fv = static_cast<double>(j) / segments_v;
            mesh.vertices.push_back(origin + u * fu + v * fv);
        }
    }

    for (uint32_t j = 0; j < segments_v; ++j) {
        for (uint32_t i = 0; i < segments_u; ++i) {
            VertexIndex p00 = base + j * stride + i;
            VertexIndex p10 = p00 + 1;
            VertexIndex p01 = p00 + stride;
            VertexIndex p11 = p01 + 1;
            if (centre_fan) {
                auto c = static_cast<VertexIndex>(mesh.vertices.size());
                mesh.vertices.push_back((mesh.vertices[p00] + mesh.vertices[p11]) * 0.5);
                mesh.triangles.push_back({p00, p10, c});
                mesh.triangles.push_back({p10, p11, c});
                mesh.triangles.push_back({p11, p01, c});
                mesh.triangles.push_back({p01, p00, c});
            } else {
                mesh.triangles.push_back({p00, p10, p11});
                mesh.triangles.push_back({p00, p11, p01});
            }
        }
    }
}

}  // namespace

Mesh make_box(const Vec3& min_corner, const Vec3& size, const MeshResolution& resolution) {
    const uint32_t nx = std::max<uint32_t>(1, resolution.width_segments);
    const uint32_t ny = std::max<uint32_t>(1, resolution.length_segments);

    const Vec3 along_w{size.x, 0.0, 0.0};
    const Vec3 along_l{0.0, size.y, 0.0};
    const Vec3 along_t{0.0, 0.0, size.z};
    const Vec3& o = min_corner;

    Mesh mesh;
    mesh.vertices.reserve(2 * (nx + 1) * (ny + 1) + 4 * (nx + 1) + 2 * nx + 4 * (ny + 1));

    add_face_grid(mesh, o, along_l, along_w, ny, nx);                        // bottom, -z
    add_face_grid(mesh, o + along_t, along_w, along_l, nx, ny);              // top, +z
    add_face_grid(mesh, o, along_w, along_t, nx, 1, true);                   // front, -y
    add_face_grid(mesh, o + along_l, along_t, along_w, 1, nx, true);         // back, +y
    add_face_grid(mesh, o, along_t, along_l, 1, ny);                         // left, -x
    add_face_grid(mesh, o + along_w, along_l, along_t, ny, 1);               // right, +x

    return mesh;
}

Vertices transform(const Vertices& vertices, const Affine& affine) {
    Vertices out;
    out.reserve(vertices.size());
    for (const auto& v : vertices) {
        out.push_back(affine.apply(v));
    }
    return out;
}

Bounds compute_bounds(const Vertices& vertices) {
    Bounds bounds;
    for (const auto& v : vertices) {
        bounds.expand(v);
    }
    return bounds;
}

double triangle_area(const Vec3& a, const Vec3& b, const Vec3& c) {
    return 0.5 * (b - a).cross(c - a).length();
}

std::optional<std::pair<Vec3, Vec3>> intersect_plane(const Vec3& a, const Vec3& b, const Vec3& c,
                                                     Axis axis, double position) {
    const auto k = static_cast<std::size_t>(axis);
    const std::array<Vec3, 3> p{a, b, c};
    const std::array<double, 3> d{a[k] - position, b[k] - position, c[k] - position};

    bool any_below = false;
    bool any_above = false;
    for (double di : d) {
        if (di < 0.0) any_below = true; else any_above = true;
    }
    if (!any_below || !any_above) {
        return std::nullopt;
    }

    // Exactly two edges connect a vertex below to a vertex on/above the plane
    std::array<Vec3, 2> hits;
    int count = 0;
    for (int i = 0; i < 3; ++i) {
        int j = (i + 1) % 3;
        bool below_i = d[i] < 0.0;
        bool below_j = d[j] < 0.0;
        if (below_i == below_j) continue;
        double t = d[i] / (d[i] - d[j]);
        Vec3 hit = p[i] + (p[j] - p[i]) * t;
        hit[k] = position;
        if (count < 2) {
            hits[count] = hit;
        }
        ++count;
    }

    if (count != 2 || hits[0] == hits[1]) {
        return std::nullopt;
    }
    return std::make_pair(hits[0], hits[1]);
}

MeshCheck check_mesh(const Vertices& vertices, const Topology& triangles, double min_area) {
    MeshCheck check;

    for (size_t i = 0; i < vertices.size(); ++i) {
        if (!vertices[i].is_finite()) {
            check.fail(ErrorCode::NonFiniteGeometry,
                       "vertex " + std::to_string(i) + " has a non-finite coordinate");
            return check;
        }
    }

    const auto count = vertices.size();
    for (size_t t = 0; t < triangles.size(); ++t) {
        const auto& tri = triangles[t];
        if (tri.a >= count || tri.b >= count || tri.c >= count) {
            check.fail(ErrorCode::DegenerateGeometry,
                       "triangle " + std::to_string(t) + " references a missing vertex");
            return check;
        }
        double area = triangle_area(vertices[tri.a], vertices[tri.b], vertices[tri.c]);
        if (!(area > min_area)) {
            check.fail(ErrorCode::DegenerateGeometry,
                       "triangle " + std::to_string(t) + " collapsed to zero area");
            return check;
        }
    }

    return check;
}

}  // namespace damascus
