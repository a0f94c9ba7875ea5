#include <gtest/gtest.h>
#include "recipe.hpp"
#include "steel_catalog.hpp"
#include "cli_common.hpp"
#include "logging.hpp"
#include "test_helpers.hpp"
#include <cmath>
#include <fstream>
#include <iterator>
#include <vector>

using namespace damascus;
using namespace damascus::cli;
using namespace damascus::test;

// ============================================
// Steel catalogue
// ============================================

TEST(SteelCatalogTest, BuiltinGrades) {
    SteelCatalog catalog = SteelCatalog::builtin();
    EXPECT_EQ(catalog.grades().size(), 8u);
    for (const char* key : {"1084", "15N20", "O1", "A2", "D2", "MagnaCut", "CruWear", "52100"}) {
        EXPECT_NE(catalog.find(key), nullptr) << key;
    }
    EXPECT_EQ(catalog.find("440C"), nullptr);
    expect_error(ErrorCode::InvalidParameter, [&] { catalog.get("440C"); });
}

TEST(SteelCatalogTest, EtchColourPicksMaterialKind) {
    SteelCatalog catalog = SteelCatalog::builtin();
    EXPECT_EQ(catalog.get("15N20").kind(), MaterialKind::HighNickel);
    EXPECT_EQ(catalog.get("MagnaCut").kind(), MaterialKind::HighNickel);
    EXPECT_EQ(catalog.get("1084").kind(), MaterialKind::HighCarbon);
    EXPECT_EQ(catalog.get("A2").kind(), MaterialKind::HighCarbon);
}

TEST(SteelCatalogTest, ModulusConvertsToMegapascal) {
    Material m = SteelCatalog::builtin().get("1084").material();
    EXPECT_DOUBLE_EQ(m.stiffness, 30.0 * kMpsiToMpa);
    EXPECT_DOUBLE_EQ(m.yield_strength, 415.0);
}

TEST(SteelCatalogTest, CustomSteels) {
    SteelCatalog catalog = SteelCatalog::builtin();
    add_custom_steels(catalog, {
        {"W2", {{"etch_color", "dark"}, {"modulus_elasticity", 29.5}, {"yield_strength", 500.0}}},
        {"1084", {{"name", "Shop 1084"}, {"etch_color", "bright"}}}
    });

    const SteelGrade& w2 = catalog.get("W2");
    EXPECT_TRUE(w2.is_custom);
    EXPECT_EQ(w2.name, "W2");
    EXPECT_DOUBLE_EQ(w2.material().stiffness, 29.5 * kMpsiToMpa);

    // Same key replaces the built-in grade
    EXPECT_EQ(catalog.grades().size(), 9u);
    EXPECT_EQ(catalog.get("1084").name, "Shop 1084");
    EXPECT_EQ(catalog.get("1084").kind(), MaterialKind::HighNickel);

    expect_error(ErrorCode::InvalidParameter, [&] {
        add_custom_steels(catalog, {{"bad", {{"modulus_elasticity", -1.0}}}});
    });
}

// ============================================
// Recipes
// ============================================

TEST(RecipeTest, AlternatingStack) {
    Recipe recipe = recipe_from_json({
        {"billet", {
            {"width", 40.0},
            {"length", 80.0},
            {"alternating", {{"count", 10}, {"bright", "15N20"}, {"dark", "52100"},
                             {"bright_thickness", 0.5}, {"dark_thickness", 1.0}}}
        }}
    }, SteelCatalog::builtin());

    EXPECT_DOUBLE_EQ(recipe.width, 40.0);
    EXPECT_DOUBLE_EQ(recipe.length, 80.0);
    ASSERT_EQ(recipe.layers.size(), 10u);
    EXPECT_EQ(recipe.layers[0].material.kind, MaterialKind::HighNickel);
    EXPECT_DOUBLE_EQ(recipe.layers[0].thickness, 0.5);
    EXPECT_EQ(recipe.layers[1].material.kind, MaterialKind::HighCarbon);
    EXPECT_DOUBLE_EQ(recipe.layers[1].thickness, 1.0);
    EXPECT_DOUBLE_EQ(recipe.layers[1].material.yield_strength, 550.0);
    EXPECT_TRUE(recipe.operations.empty());
}

TEST(RecipeTest, ExplicitLayersAndCustomSteel) {
    Recipe recipe = recipe_from_json({
        {"steels", {{"Nickel200", {{"etch_color", "bright"}, {"yield_strength", 150.0}}}}},
        {"billet", {
            {"layers", {
                {{"steel", "Nickel200"}, {"thickness", 0.2}},
                {{"steel", "1084"}, {"thickness", 2.0}},
                {{"material", {{"kind", "high_carbon"}}}}
            }}
        }}
    }, SteelCatalog::builtin());

    ASSERT_EQ(recipe.layers.size(), 3u);
    EXPECT_EQ(recipe.layers[0].material.kind, MaterialKind::HighNickel);
    EXPECT_DOUBLE_EQ(recipe.layers[0].material.yield_strength, 150.0);
    EXPECT_DOUBLE_EQ(recipe.layers[1].thickness, 2.0);
    EXPECT_EQ(recipe.layers[2].material.kind, MaterialKind::HighCarbon);
    EXPECT_DOUBLE_EQ(recipe.layers[2].thickness, 0.8);
}

TEST(RecipeTest, OperationsAndRaindropExpansion) {
    Recipe recipe = recipe_from_json({
        {"billet", {{"alternating", {{"count", 4}}}}},
        {"operations", {
            {{"operation", "forge"}, {"target_size", 20.0}, {"heat_count", 2}},
            {{"operation", "raindrop"}, {"grid", 2}, {"spacing", 6.0}, {"radius", 1.5}},
            {{"operation", "twist"}, {"angle_degrees", 90.0}}
        }},
        {"section", {{"slice_position", 12.5}, {"resolution", 200}}}
    }, SteelCatalog::builtin());

    ASSERT_EQ(recipe.operations.size(), 6u);
    EXPECT_TRUE(std::holds_alternative<ForgeParams>(recipe.operations[0]));
    for (size_t i = 1; i <= 4; ++i) {
        ASSERT_TRUE(std::holds_alternative<DrillParams>(recipe.operations[i]));
        const auto& hole = std::get<DrillParams>(recipe.operations[i]);
        EXPECT_DOUBLE_EQ(std::abs(hole.x_pos), 3.0);
        EXPECT_DOUBLE_EQ(std::abs(hole.z_pos), 3.0);
        EXPECT_DOUBLE_EQ(hole.radius, 1.5);
    }
    EXPECT_TRUE(std::holds_alternative<TwistParams>(recipe.operations[5]));
    EXPECT_DOUBLE_EQ(recipe.section.slice_position, 12.5);
    EXPECT_EQ(recipe.section.resolution, 200u);
}

TEST(RecipeTest, Rejections) {
    SteelCatalog catalog = SteelCatalog::builtin();
    expect_error(ErrorCode::InvalidParameter, [&] {
        recipe_from_json({{"operations", nlohmann::json::array()}}, catalog);
    });
    expect_error(ErrorCode::InvalidParameter, [&] {
        recipe_from_json({{"billet", {{"width", 50.0}}}}, catalog);
    });
    expect_error(ErrorCode::InvalidParameter, [&] {
        recipe_from_json({{"billet", {{"alternating", {{"bright", "Unobtainium"}}}}}}, catalog);
    });
    expect_error(ErrorCode::InvalidParameter, [&] {
        recipe_from_json({
            {"billet", {{"alternating", {{"count", 4}}}}},
            {"operations", nlohmann::json::array({{{"operation", "anneal"}}})}
        }, catalog);
    });
}

TEST(RecipeTest, CountsMustBePositiveIntegers) {
    SteelCatalog catalog = SteelCatalog::builtin();
    for (const nlohmann::json& count : {nlohmann::json(-4), nlohmann::json(0), nlohmann::json(2.5),
                                        nlohmann::json(int64_t{1} << 40), nlohmann::json("ten")}) {
        expect_error(ErrorCode::InvalidParameter, [&] {
            recipe_from_json({{"billet", {{"alternating", {{"count", count}}}}}}, catalog);
        });
    }
    expect_error(ErrorCode::InvalidParameter, [&] {
        recipe_from_json({
            {"billet", {{"alternating", {{"count", 4}}}, {"resolution", {{"width_segments", -1}}}}}
        }, catalog);
    });
    expect_error(ErrorCode::InvalidParameter, [&] {
        recipe_from_json({
            {"billet", {{"alternating", {{"count", 4}}}}},
            {"section", {{"resolution", -500}}}
        }, catalog);
    });

    Recipe recipe = recipe_from_json({
        {"billet", {{"alternating", {{"count", 4}}}, {"resolution", {{"width_segments", 8}}}}}
    }, catalog);
    EXPECT_EQ(recipe.resolution.width_segments, 8u);
    EXPECT_EQ(recipe.resolution.length_segments, 1u);
}

TEST(RecipeTest, ForgeEndToEnd) {
    Recipe recipe = recipe_from_json({
        {"billet", {{"width", 50.0}, {"length", 100.0}, {"alternating", {{"count", 30}}}}},
        {"operations", nlohmann::json::array({{{"operation", "forge"}, {"shape", "square"},
                                                 {"target_size", 20.0}}})}
    }, SteelCatalog::builtin());

    Billet billet = build_billet(recipe);
    EXPECT_EQ(billet.layer_count(), 30u);
    EXPECT_NEAR(billet.height(), 24.0, 1e-9);

    apply_operations(billet, recipe.operations);
    EXPECT_NEAR(billet.length(), 300.0, 1e-6);
    EXPECT_EQ(billet.shape(), CrossSectionShape::Square);
    EXPECT_EQ(billet.history().size(), 1u);
}

TEST(RecipeTest, FailedOperationStopsTheRun) {
    Recipe recipe = recipe_from_json({
        {"billet", {{"alternating", {{"count", 4}}}}},
        {"operations", {
            {{"operation", "compression"}, {"compression_factor", 0.5}},
            {{"operation", "compression"}, {"compression_factor", 0.0}},
            {{"operation", "twist"}}
        }}
    }, SteelCatalog::builtin());

    Billet billet = build_billet(recipe);
    expect_error(ErrorCode::InvalidParameter, [&] { apply_operations(billet, recipe.operations); });
    EXPECT_EQ(billet.history().size(), 1u);
}

TEST(RecipeTest, LoadFromFile) {
    std::string path = temp_path("damascus_recipe.json");
    {
        std::ofstream file(path);
        file << R"({"billet": {"alternating": {"count": 6}},
                    "operations": [{"operation": "wedge", "wedge_depth": 1.0}]})";
    }
    Recipe recipe = load_recipe(path);
    EXPECT_EQ(recipe.layers.size(), 6u);
    EXPECT_EQ(recipe.operations.size(), 1u);

    expect_error(ErrorCode::IoFailure, [] { load_recipe(temp_path("damascus_no_recipe.json")); });
}

// ============================================
// Command line
// ============================================

TEST(CommandLineTest, ParsesCommonArguments) {
    const char* args[] = {"damascus", "run", "recipe.json", "-o", "out.ply", "--per-layer",
                          "--log", "ops.json", "--section", "cut.pgm", "--slice", "-12.5",
                          "--resolution", "300", "-v"};
    int argc = static_cast<int>(std::size(args));
    auto [ctx, next] = parse_common_args(argc, const_cast<char**>(args), 2);

    EXPECT_EQ(next, argc);
    EXPECT_EQ(ctx.input_path, "recipe.json");
    EXPECT_EQ(ctx.output_path, "out.ply");
    EXPECT_TRUE(ctx.per_layer);
    EXPECT_EQ(ctx.log_path, "ops.json");
    EXPECT_EQ(ctx.section_path, "cut.pgm");
    ASSERT_TRUE(ctx.slice_position.has_value());
    EXPECT_DOUBLE_EQ(*ctx.slice_position, -12.5);
    EXPECT_EQ(ctx.resolution, 300u);
    EXPECT_TRUE(ctx.verbose);
}

TEST(CommandLineTest, RejectsBadArguments) {
    auto parse = [](std::vector<const char*> args) {
        parse_common_args(static_cast<int>(args.size()), const_cast<char**>(args.data()), 2);
    };
    EXPECT_THROW(parse({"damascus", "run", "--bogus"}), std::runtime_error);
    EXPECT_THROW(parse({"damascus", "run", "a.json", "b.json"}), std::runtime_error);
    EXPECT_THROW(parse({"damascus", "run", "a.json", "-o"}), std::runtime_error);
    EXPECT_THROW(parse({"damascus", "run", "a.json", "--slice", "mid"}), std::runtime_error);
    EXPECT_THROW(parse({"damascus", "run", "a.json", "--resolution", "0"}), std::runtime_error);
    EXPECT_THROW(parse({"damascus", "run", "a.json", "--resolution", "12.5"}), std::runtime_error);
    EXPECT_THROW(parse({"damascus", "run", "a.json", "--resolution", "4294967296"}), std::runtime_error);
    EXPECT_THROW(parse({"damascus", "run", "a.json", "--resolution", "1e300"}), std::runtime_error);
    EXPECT_THROW(parse({"damascus", "run", "a.json", "--resolution", "nan"}), std::runtime_error);
}

TEST(CommandLineTest, LogLevelNames) {
    EXPECT_EQ(logging::level_from_name("debug"), spdlog::level::debug);
    EXPECT_EQ(logging::level_from_name("error"), spdlog::level::err);
    EXPECT_EQ(logging::level_from_name("off"), spdlog::level::off);
    EXPECT_FALSE(logging::level_from_name("loud").has_value());
}
