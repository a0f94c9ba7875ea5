#include <gtest/gtest.h>
#include "twist.hpp"
#include "forge.hpp"
#include "test_helpers.hpp"
#include <cmath>
#include <limits>
#include <numbers>

using namespace damascus;
using namespace damascus::test;

namespace {

Billet forged_bar() {
    Billet billet = standard_billet();
    forge(billet, ForgeParams{.shape = CrossSectionShape::Square, .target_size = 20.0, .heat_count = 3});
    return billet;
}

}  // namespace

TEST(TwistTest, AngleVariesLinearlyAlongLength) {
    EXPECT_DOUBLE_EQ(twist_angle_at(-50.0, 100.0, 90.0), 0.0);
    EXPECT_DOUBLE_EQ(twist_angle_at(50.0, 100.0, 90.0), std::numbers::pi / 2.0);
    EXPECT_DOUBLE_EQ(twist_angle_at(0.0, 100.0, 90.0), std::numbers::pi / 4.0);
}

TEST(TwistTest, ScenarioC_RequiresForging) {
    Billet billet = standard_billet();
    BilletSnapshot snapshot(billet);
    expect_error(ErrorCode::PreconditionFailed, [&] { apply_twist(billet, TwistParams{90.0}); });
    snapshot.expect_unchanged(billet);
}

// forged_bar() has one length segment, so every vertex sits on an end plane
TEST(TwistTest, FullTurnIsPeriodic) {
    Billet billet = forged_bar();
    auto before = all_vertices(billet);
    apply_twist(billet, TwistParams{360.0});
    EXPECT_LT(max_vertex_distance(before, all_vertices(billet)), 1e-9);
}

TEST(TwistTest, TwoHalfTurnsMakeAFullTurn) {
    Billet billet = forged_bar();
    auto before = all_vertices(billet);
    apply_twist(billet, TwistParams{180.0});
    EXPECT_GT(max_vertex_distance(before, all_vertices(billet)), 1.0);
    apply_twist(billet, TwistParams{180.0});
    EXPECT_LT(max_vertex_distance(before, all_vertices(billet)), 1e-9);
}

TEST(TwistTest, FullTurnRestoresEndPlanesOnly) {
    Billet billet = standard_billet(MeshResolution{.width_segments = 2, .length_segments = 4});
    forge(billet, ForgeParams{.shape = CrossSectionShape::Square, .target_size = 20.0, .heat_count = 1});
    const double length = billet.length();
    const double centre_z = billet.height() / 2.0;
    auto before = all_vertices(billet);
    apply_twist(billet, TwistParams{360.0});

    size_t interior = 0;
    for (size_t l = 0; l < billet.layer_count(); ++l) {
        const auto& current = billet.layer(l).vertices();
        for (size_t i = 0; i < current.size(); ++i) {
            const Vec3& o = before[l][i];
            const Vec3& c = current[i];
            if (std::abs(std::abs(o.y) - length / 2.0) < 1e-6) {
                EXPECT_LT(c.distance_to(o), 1e-9);
                continue;
            }

            // Interior sections keep the angle of their place along the bar
            double angle = twist_angle_at(o.y, length, 360.0);
            double dz = o.z - centre_z;
            EXPECT_NEAR(c.x, o.x * std::cos(angle) - dz * std::sin(angle), 1e-9);
            EXPECT_NEAR(c.z - centre_z, o.x * std::sin(angle) + dz * std::cos(angle), 1e-9);
            ++interior;
        }
    }
    EXPECT_GT(interior, 0u);

    // A quarter of the way along, the section is a quarter turn out
    EXPECT_GT(max_vertex_distance(before, all_vertices(billet)), 10.0);
}

TEST(TwistTest, QuarterTurnRotatesFarEndOnly) {
    Billet billet = forged_bar();
    const double half_length = billet.length() / 2.0;
    const double centre_z = billet.height() / 2.0;
    auto before = all_vertices(billet);
    apply_twist(billet, TwistParams{90.0});

    for (size_t l = 0; l < billet.layer_count(); ++l) {
        const auto& current = billet.layer(l).vertices();
        for (size_t i = 0; i < current.size(); ++i) {
            const Vec3& o = before[l][i];
            const Vec3& c = current[i];
            EXPECT_NEAR(c.y, o.y, 1e-12);
            if (std::abs(o.y + half_length) < 1e-6) {
                EXPECT_LT(c.distance_to(o), 1e-9);
            } else if (std::abs(o.y - half_length) < 1e-6) {
                // 90 degrees: (x, z - cz) -> (-(z - cz), x)
                EXPECT_NEAR(c.x, -(o.z - centre_z), 1e-9);
                EXPECT_NEAR(c.z - centre_z, o.x, 1e-9);
            }
        }
    }
}

TEST(TwistTest, PreservesDistanceFromAxis) {
    Billet billet = forged_bar();
    const double cz = billet.height() / 2.0;
    auto before = all_vertices(billet);
    apply_twist(billet, TwistParams{137.0});

    for (size_t l = 0; l < billet.layer_count(); ++l) {
        const auto& current = billet.layer(l).vertices();
        for (size_t i = 0; i < current.size(); ++i) {
            double r0 = std::hypot(before[l][i].x, before[l][i].z - cz);
            double r1 = std::hypot(current[i].x, current[i].z - cz);
            EXPECT_NEAR(r0, r1, 1e-9);
        }
    }
}

TEST(TwistTest, KeepsDimensionsAndVolume) {
    Billet billet = forged_bar();
    double volume = billet.volume();
    double length = billet.length();
    apply_twist(billet, TwistParams{90.0});
    EXPECT_DOUBLE_EQ(billet.volume(), volume);
    EXPECT_DOUBLE_EQ(billet.length(), length);
}

TEST(TwistTest, WorksOnOctagon) {
    Billet billet = standard_billet();
    forge(billet, ForgeParams{.shape = CrossSectionShape::Octagon, .target_size = 20.0,
                              .heat_count = 2, .chamfer_fraction = 0.2});
    auto before = all_vertices(billet);
    apply_twist(billet, TwistParams{-360.0});
    EXPECT_LT(max_vertex_distance(before, all_vertices(billet)), 1e-9);
}

TEST(TwistTest, RejectsNonFiniteAngle) {
    Billet billet = forged_bar();
    BilletSnapshot snapshot(billet);
    expect_error(ErrorCode::InvalidParameter, [&] {
        apply_twist(billet, TwistParams{std::numeric_limits<double>::quiet_NaN()});
    });
    snapshot.expect_unchanged(billet);
}
