#include <gtest/gtest.h>
#include "mesh_export.hpp"
#include "forge.hpp"
#include "test_helpers.hpp"
#include <filesystem>
#include <fstream>
#include <sstream>

using namespace damascus;
using namespace damascus::test;

namespace {

size_t count_lines_starting_with(const std::string& text, const std::string& prefix) {
    std::istringstream in(text);
    std::string line;
    size_t count = 0;
    while (std::getline(in, line)) {
        if (line.rfind(prefix, 0) == 0) {
            ++count;
        }
    }
    return count;
}

std::string read_file(const std::string& path) {
    std::ifstream file(path);
    std::stringstream buffer;
    buffer << file.rdbuf();
    return buffer.str();
}

}  // namespace

// ============================================
// Formats
// ============================================

TEST(MeshFormatTest, FromExtension) {
    EXPECT_EQ(mesh_format_from_path("billet.obj"), MeshFormat::Obj);
    EXPECT_EQ(mesh_format_from_path("out/billet.PLY"), MeshFormat::Ply);
    EXPECT_EQ(mesh_format_from_path("billet.Stl"), MeshFormat::Stl);
    expect_error(ErrorCode::InvalidParameter, [] { mesh_format_from_path("billet.txt"); });
    expect_error(ErrorCode::InvalidParameter, [] { mesh_format_from_path("billet"); });
}

TEST(MeshFormatTest, LayerFilePath) {
    EXPECT_EQ(layer_file_path("out/billet.obj", 7), "out/billet_layer007.obj");
    EXPECT_EQ(layer_file_path("billet.stl", 123), "billet_layer123.stl");
}

// ============================================
// Encoders
// ============================================

TEST(ObjExportTest, CountsAndMaterials) {
    Billet billet = small_billet(4);
    std::string obj = to_obj(billet, all_layers(billet), "billet.mtl");

    EXPECT_EQ(count_lines_starting_with(obj, "v "), 4u * 26u);
    EXPECT_EQ(count_lines_starting_with(obj, "f "), 4u * 16u);
    EXPECT_EQ(count_lines_starting_with(obj, "o layer_"), 4u);
    EXPECT_EQ(count_lines_starting_with(obj, "mtllib billet.mtl"), 1u);
    EXPECT_EQ(count_lines_starting_with(obj, "usemtl high_nickel"), 2u);
    EXPECT_EQ(count_lines_starting_with(obj, "usemtl high_carbon"), 2u);
}

TEST(ObjExportTest, FaceIndicesAreGlobal) {
    Billet billet = small_billet(2);
    std::string obj = to_obj(billet, all_layers(billet));

    // Without a material file there are no material statements
    EXPECT_EQ(obj.find("usemtl"), std::string::npos);
    EXPECT_EQ(obj.find("mtllib"), std::string::npos);

    // The second layer's faces index past the first layer's 26 vertices
    std::istringstream in(obj);
    std::string line;
    size_t max_index = 0;
    while (std::getline(in, line)) {
        if (line.rfind("f ", 0) == 0) {
            std::istringstream face(line.substr(2));
            size_t a, b, c;
            face >> a >> b >> c;
            EXPECT_GE(std::min({a, b, c}), 1u);
            max_index = std::max({max_index, a, b, c});
        }
    }
    EXPECT_EQ(max_index, 52u);
}

TEST(ObjExportTest, MaterialLibrary) {
    Billet billet = small_billet(2);
    std::string mtl = to_mtl(billet);
    EXPECT_NE(mtl.find("newmtl high_nickel"), std::string::npos);
    EXPECT_NE(mtl.find("newmtl high_carbon"), std::string::npos);
    EXPECT_NE(mtl.find("Kd 0.9020 0.9020 0.9020"), std::string::npos);
    EXPECT_NE(mtl.find("Kd 0.2000 0.2000 0.2000"), std::string::npos);
}

TEST(PlyExportTest, HeaderCountsMatchBody) {
    Billet billet = small_billet(3);
    std::string ply = to_ply(billet, all_layers(billet));

    EXPECT_EQ(ply.rfind("ply\nformat ascii 1.0\n", 0), 0u);
    EXPECT_NE(ply.find("element vertex 78\n"), std::string::npos);
    EXPECT_NE(ply.find("element face 48\n"), std::string::npos);

    // Faces carry their layer's colour
    EXPECT_EQ(count_lines_starting_with(ply, "3 "), 48u);
    EXPECT_NE(ply.find(" 230 230 230\n"), std::string::npos);
    EXPECT_NE(ply.find(" 51 51 51\n"), std::string::npos);
}

TEST(StlExportTest, OneFacetPerTriangle) {
    Billet billet = small_billet(2);
    std::string stl = to_stl(billet, all_layers(billet));

    EXPECT_EQ(stl.rfind("solid damascus\n", 0), 0u);
    EXPECT_EQ(count_lines_starting_with(stl, "  facet normal"), 32u);
    EXPECT_EQ(count_lines_starting_with(stl, "      vertex"), 96u);
    EXPECT_NE(stl.find("endsolid damascus"), std::string::npos);
}

TEST(StlExportTest, SubsetOfLayers) {
    Billet billet = small_billet(4);
    std::string stl = to_stl(billet, {2});
    EXPECT_EQ(count_lines_starting_with(stl, "  facet normal"), 16u);
}

TEST(ObjExportTest, ReflectsCurrentGeometry) {
    Billet billet = standard_billet();
    forge(billet, ForgeParams{.shape = CrossSectionShape::Square, .target_size = 20.0, .heat_count = 1});
    std::string obj = to_obj(billet, {0});

    // The forged bar is 300 mm long, centred on y = 0
    EXPECT_NE(obj.find(" 150.000000 "), std::string::npos);
    EXPECT_EQ(obj.find(" 50.000000 "), std::string::npos);
}

// ============================================
// Writing files
// ============================================

TEST(ExportMeshTest, WritesObjAndMaterialLibrary) {
    Billet billet = small_billet(2);
    std::string path = temp_path("damascus_export.obj");
    auto written = export_mesh(billet, path);

    ASSERT_EQ(written.size(), 2u);
    EXPECT_EQ(std::filesystem::path(written[0]).extension(), ".mtl");
    EXPECT_EQ(written[1], path);
    EXPECT_TRUE(std::filesystem::exists(written[0]));

    std::string obj = read_file(path);
    EXPECT_NE(obj.find("mtllib damascus_export.mtl"), std::string::npos);
    EXPECT_EQ(count_lines_starting_with(obj, "f "), 32u);
}

TEST(ExportMeshTest, PerLayerFiles) {
    Billet billet = small_billet(3);
    std::string path = temp_path("damascus_layers.stl");
    ExportOptions options{.format = MeshFormat::Stl, .per_layer = true};
    auto written = export_mesh(billet, path, options);

    ASSERT_EQ(written.size(), 3u);
    EXPECT_EQ(written[0], temp_path("damascus_layers_layer000.stl"));
    EXPECT_EQ(written[2], temp_path("damascus_layers_layer002.stl"));
    for (const auto& file : written) {
        std::string stl = read_file(file);
        EXPECT_EQ(count_lines_starting_with(stl, "  facet normal"), 16u) << file;
    }
}

TEST(ExportMeshTest, UnknownExtensionRejected) {
    Billet billet = small_billet(2);
    expect_error(ErrorCode::InvalidParameter, [&] { export_mesh(billet, temp_path("billet.txt")); });
}

TEST(ExportMeshTest, MissingDirectoryIsIoFailure) {
    Billet billet = small_billet(2);
    std::string path = temp_path("no_such_dir_damascus/billet.ply");
    expect_error(ErrorCode::IoFailure, [&] { export_mesh(billet, path); });
}

TEST(ExportMeshTest, DoesNotModifyBillet) {
    Billet billet = small_billet(3);
    BilletSnapshot snapshot(billet);
    export_mesh(billet, temp_path("damascus_readonly.ply"));
    snapshot.expect_unchanged(billet);
}
