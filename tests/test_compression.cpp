#include <gtest/gtest.h>
#include "compression.hpp"
#include "forge.hpp"
#include "twist.hpp"
#include "test_helpers.hpp"
#include <cmath>
#include <limits>

using namespace damascus;
using namespace damascus::test;

TEST(CompressionTest, ScenarioD_HalvesHeightAndLayers) {
    Billet billet = standard_billet();
    ASSERT_NEAR(billet.height(), 24.0, 1e-9);

    apply_compression(billet, CompressionParams{0.5});

    EXPECT_NEAR(billet.height(), 12.0, 1e-9);
    for (const auto& layer : billet.layers()) {
        EXPECT_NEAR(layer.thickness(), layer.original_thickness() * 0.5, 1e-12);
        EXPECT_NEAR(layer.z_position(), layer.original_z_position() * 0.5, 1e-12);

        Bounds b = compute_bounds(layer.vertices());
        EXPECT_NEAR(b.min.z, layer.z_position(), 1e-9);
        EXPECT_NEAR(b.max.z - b.min.z, layer.thickness(), 1e-9);
    }
}

TEST(CompressionTest, SpreadsLaterallyToKeepVolume) {
    Billet billet = standard_billet();
    double volume = billet.volume();
    apply_compression(billet, CompressionParams{0.5});

    EXPECT_NEAR(billet.volume(), volume, volume * kVolumeTolerance);
    EXPECT_NEAR(billet.width(), 50.0 * std::sqrt(2.0), 1e-9);
    EXPECT_NEAR(billet.length(), 100.0 * std::sqrt(2.0), 1e-9);
    EXPECT_DOUBLE_EQ(compression_spread(0.25), 2.0);
}

TEST(CompressionTest, IsCumulative) {
    Billet billet = standard_billet();
    apply_compression(billet, CompressionParams{0.5});
    apply_compression(billet, CompressionParams{0.5});
    EXPECT_NEAR(billet.height(), 6.0, 1e-9);
    EXPECT_NEAR(billet.layer(10).thickness(), 0.2, 1e-12);
}

TEST(CompressionTest, FactorOneIsIdentity) {
    Billet billet = standard_billet();
    auto before = all_vertices(billet);
    apply_compression(billet, CompressionParams{1.0});
    EXPECT_EQ(all_vertices(billet), before);
    EXPECT_EQ(billet.history().size(), 1u);
}

TEST(CompressionTest, AppliesToTwistedState) {
    Billet billet = standard_billet();
    forge(billet, ForgeParams{.shape = CrossSectionShape::Square, .target_size = 20.0, .heat_count = 1});
    apply_twist(billet, TwistParams{45.0});
    auto twisted = all_vertices(billet);

    apply_compression(billet, CompressionParams{0.8});

    double spread = compression_spread(0.8);
    for (size_t l = 0; l < billet.layer_count(); ++l) {
        const auto& current = billet.layer(l).vertices();
        for (size_t i = 0; i < current.size(); ++i) {
            EXPECT_NEAR(current[i].z, twisted[l][i].z * 0.8, 1e-9);
            EXPECT_NEAR(current[i].x, twisted[l][i].x * spread, 1e-9);
        }
    }
    EXPECT_NEAR(billet.height(), 16.0, 1e-9);
}

TEST(CompressionTest, RejectsOutOfRangeFactor) {
    Billet billet = standard_billet();
    BilletSnapshot snapshot(billet);
    for (double f : {0.0, -0.5, 1.5, std::numeric_limits<double>::quiet_NaN()}) {
        expect_error(ErrorCode::InvalidParameter, [&] {
            apply_compression(billet, CompressionParams{f});
        });
    }
    snapshot.expect_unchanged(billet);
}
