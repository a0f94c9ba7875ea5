#include "mesh_export.hpp"
#include "logging.hpp"
#include <common/error.hpp>
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <memory>
#include <sstream>

namespace damascus {

namespace {

void write_text(const std::string& path, const std::string& content) {
    std::ofstream file(path);
    if (!file) {
        throw Error(ErrorCode::IoFailure, "cannot write to file: " + path);
    }
    file << content;
    if (!file) {
        throw Error(ErrorCode::IoFailure, "failed writing file: " + path);
    }
}

Vec3 face_normal(const Vec3& a, const Vec3& b, const Vec3& c) {
    Vec3 n = (b - a).cross(c - a);
    double len = n.length();
    return len > 0.0 ? n / len : Vec3{};
}

const char* material_name(MaterialKind kind) {
    return to_string(kind);
}

}  // namespace

const char* to_string(MeshFormat format) {
    switch (format) {
        case MeshFormat::Obj: return "obj";
        case MeshFormat::Ply: return "ply";
        case MeshFormat::Stl: return "stl";
    }
    return "unknown";
}

const char* file_extension(MeshFormat format) {
    switch (format) {
        case MeshFormat::Obj: return ".obj";
        case MeshFormat::Ply: return ".ply";
        case MeshFormat::Stl: return ".stl";
    }
    return "";
}

MeshFormat mesh_format_from_path(const std::string& path) {
    std::string ext = std::filesystem::path(path).extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
    if (ext == ".obj") return MeshFormat::Obj;
    if (ext == ".ply") return MeshFormat::Ply;
    if (ext == ".stl") return MeshFormat::Stl;
    throw Error(ErrorCode::InvalidParameter,
                "unsupported mesh format '" + ext + "' (expected .obj, .ply or .stl)");
}

std::vector<size_t> all_layers(const Billet& billet) {
    std::vector<size_t> indices(billet.layer_count());
    for (size_t i = 0; i < indices.size(); ++i) {
        indices[i] = i;
    }
    return indices;
}

std::string layer_file_path(const std::string& path, size_t index) {
    std::filesystem::path p(path);
    std::ostringstream name;
    name << p.stem().string() << "_layer" << std::setw(3) << std::setfill('0') << index
         << p.extension().string();
    return (p.parent_path() / name.str()).string();
}

std::string to_obj(const Billet& billet, const std::vector<size_t>& layer_indices,
                   const std::string& mtl_file, int precision) {
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(precision);

    ss << "# Damascus billet OBJ export\n";
    ss << "# Layers: " << layer_indices.size() << "\n";
    ss << "# Billet: " << billet.width() << " x " << billet.length() << " x "
       << billet.height() << " mm\n";
    if (!mtl_file.empty()) {
        ss << "mtllib " << mtl_file << "\n";
    }

    // OBJ indices are 1-based and global across objects
    size_t base = 1;
    for (size_t index : layer_indices) {
        const Layer& layer = billet.layer(index);
        auto vertices = layer.vertex_snapshot();

        ss << "\no layer_" << index << "\n";
        if (!mtl_file.empty()) {
            ss << "usemtl " << material_name(layer.material().kind) << "\n";
        }
        for (const auto& v : *vertices) {
            ss << "v " << v.x << " " << v.y << " " << v.z << "\n";
        }
        for (const auto& tri : layer.triangles()) {
            ss << "f " << base + tri.a << " " << base + tri.b << " " << base + tri.c << "\n";
        }
        base += vertices->size();
    }

    return ss.str();
}

std::string to_mtl(const Billet& billet) {
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(4);
    ss << "# Damascus billet materials\n";

    for (MaterialKind kind : {MaterialKind::HighNickel, MaterialKind::HighCarbon}) {
        bool used = std::any_of(billet.layers().begin(), billet.layers().end(),
                                [kind](const Layer& l) { return l.material().kind == kind; });
        if (!used) continue;

        Rgb c = Material{.kind = kind}.color();
        ss << "\nnewmtl " << material_name(kind) << "\n";
        ss << "Kd " << c.r / 255.0 << " " << c.g / 255.0 << " " << c.b / 255.0 << "\n";
        ss << "Ka 0.0000 0.0000 0.0000\n";
        ss << "illum 1\n";
    }
    return ss.str();
}

std::string to_ply(const Billet& billet, const std::vector<size_t>& layer_indices, int precision) {
    std::vector<std::shared_ptr<const Vertices>> snapshots;
    size_t vertex_count = 0;
    size_t face_count = 0;
    for (size_t index : layer_indices) {
        const Layer& layer = billet.layer(index);
        snapshots.push_back(layer.vertex_snapshot());
        vertex_count += snapshots.back()->size();
        face_count += layer.triangles().size();
    }

    std::ostringstream ss;
    ss << std::fixed << std::setprecision(precision);
    ss << "ply\n";
    ss << "format ascii 1.0\n";
    ss << "comment Damascus billet export\n";
    ss << "element vertex " << vertex_count << "\n";
    ss << "property float x\nproperty float y\nproperty float z\n";
    ss << "element face " << face_count << "\n";
    ss << "property list uchar int vertex_indices\n";
    ss << "property uchar red\nproperty uchar green\nproperty uchar blue\n";
    ss << "end_header\n";

    for (const auto& vertices : snapshots) {
        for (const auto& v : *vertices) {
            ss << v.x << " " << v.y << " " << v.z << "\n";
        }
    }

    size_t base = 0;
    for (size_t k = 0; k < layer_indices.size(); ++k) {
        const Layer& layer = billet.layer(layer_indices[k]);
        Rgb c = layer.material().color();
        for (const auto& tri : layer.triangles()) {
            ss << "3 " << base + tri.a << " " << base + tri.b << " " << base + tri.c << " "
               << static_cast<int>(c.r) << " " << static_cast<int>(c.g) << " "
               << static_cast<int>(c.b) << "\n";
        }
        base += snapshots[k]->size();
    }

    return ss.str();
}

std::string to_stl(const Billet& billet, const std::vector<size_t>& layer_indices, int precision) {
    std::ostringstream ss;
    ss << std::scientific << std::setprecision(precision);
    ss << "solid damascus\n";

    for (size_t index : layer_indices) {
        const Layer& layer = billet.layer(index);
        auto vertices = layer.vertex_snapshot();
        for (const auto& tri : layer.triangles()) {
            const Vec3& a = (*vertices)[tri.a];
            const Vec3& b = (*vertices)[tri.b];
            const Vec3& c = (*vertices)[tri.c];
            Vec3 n = face_normal(a, b, c);
            ss << "  facet normal " << n.x << " " << n.y << " " << n.z << "\n";
            ss << "    outer loop\n";
            for (const Vec3* v : {&a, &b, &c}) {
                ss << "      vertex " << v->x << " " << v->y << " " << v->z << "\n";
            }
            ss << "    endloop\n";
            ss << "  endfacet\n";
        }
    }

    ss << "endsolid damascus\n";
    return ss.str();
}

std::vector<std::string> export_mesh(const Billet& billet, const std::string& path,
                                     const ExportOptions& options) {
    auto log = damascus::logging::get_logger();
    std::vector<std::string> written;

    auto encode = [&](const std::vector<size_t>& indices, const std::string& mtl_file) {
        switch (options.format) {
            case MeshFormat::Obj: return to_obj(billet, indices, mtl_file, options.precision);
            case MeshFormat::Ply: return to_ply(billet, indices, options.precision);
            case MeshFormat::Stl: return to_stl(billet, indices, options.precision);
        }
        return std::string();
    };

    std::string mtl_file;
    if (options.format == MeshFormat::Obj) {
        std::filesystem::path mtl_path(path);
        mtl_path.replace_extension(".mtl");
        write_text(mtl_path.string(), to_mtl(billet));
        written.push_back(mtl_path.string());
        mtl_file = mtl_path.filename().string();
    }

    if (options.per_layer) {
        for (size_t i = 0; i < billet.layer_count(); ++i) {
            std::string layer_path = layer_file_path(path, i);
            write_text(layer_path, encode({i}, mtl_file));
            written.push_back(layer_path);
        }
    } else {
        write_text(path, encode(all_layers(billet), mtl_file));
        written.push_back(path);
    }

    log->info("Exported {} layers as {} to {} ({} files)",
              billet.layer_count(), to_string(options.format), path, written.size());
    return written;
}

std::vector<std::string> export_mesh(const Billet& billet, const std::string& path) {
    ExportOptions options;
    options.format = mesh_format_from_path(path);
    return export_mesh(billet, path, options);
}

}  // namespace damascus
