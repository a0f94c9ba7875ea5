#ifndef DAMASCUS_EXPORT_MESH_EXPORT_HPP
#define DAMASCUS_EXPORT_MESH_EXPORT_HPP

#include <billet/billet.hpp>
#include <cstdint>
#include <string>
#include <vector>

namespace damascus {

enum class MeshFormat : uint8_t {
    Obj,   // Wavefront OBJ + companion .mtl
    Ply,   // ASCII PLY, per-face RGB
    Stl    // ASCII STL, geometry only
};

const char* to_string(MeshFormat format);
const char* file_extension(MeshFormat format);

// Format named by the path's extension (case-insensitive).
// Throws Error(InvalidParameter) for anything else.
MeshFormat mesh_format_from_path(const std::string& path);

struct ExportOptions {
    MeshFormat format = MeshFormat::Obj;
    bool per_layer = false;   // One file per layer: <stem>_layerNNN.<ext>
    int precision = 6;
};

// Text encoders for a subset of layers, in the given order.
std::string to_obj(const Billet& billet, const std::vector<size_t>& layer_indices,
                   const std::string& mtl_file = "", int precision = 6);
std::string to_mtl(const Billet& billet);
std::string to_ply(const Billet& billet, const std::vector<size_t>& layer_indices, int precision = 6);
std::string to_stl(const Billet& billet, const std::vector<size_t>& layer_indices, int precision = 6);

// 0, 1, ..., layer_count - 1
std::vector<size_t> all_layers(const Billet& billet);

// Path of layer `index` when exporting per layer
std::string layer_file_path(const std::string& path, size_t index);

// Write the billet's current geometry. Returns every file written (the .mtl
// included). Reads only; throws Error(IoFailure) when a file can't be written.
std::vector<std::string> export_mesh(const Billet& billet, const std::string& path,
                                     const ExportOptions& options);

// Format taken from the path's extension, merged output
std::vector<std::string> export_mesh(const Billet& billet, const std::string& path);

}  // namespace damascus

#endif // DAMASCUS_EXPORT_MESH_EXPORT_HPP
