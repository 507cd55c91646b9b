#include <gtest/gtest.h>
#include "geosurf/surface.hpp"
#include "geosurf/constants.hpp"
#include <algorithm>
#include <cmath>
#include <limits>
#include <numbers>

using namespace geosurf;
using namespace geosurf::constants;

static constexpr double PI = std::numbers::pi;

// ─── Evaluation ───────────────────────────────────────────────────────────────

TEST(Surface_Evaluate, Sphere_EquatorPoint) {
    auto sphere = Surface::make_sphere(5.0);
    Position3D p = sphere.evaluate(PI / 2.0, 0.0);

    EXPECT_NEAR(p(0), 5.0, 1e-12);
    EXPECT_NEAR(p(1), 0.0, 1e-12);
    EXPECT_NEAR(p(2), 0.0, 1e-12);
}

TEST(Surface_Evaluate, Sphere_EveryPointAtRadius) {
    auto sphere = Surface::make_sphere(3.0);
    for (double u = 0.1; u < PI; u += 0.37)
        for (double v = 0.0; v < 2.0 * PI; v += 0.53)
            EXPECT_NEAR(sphere.evaluate(u, v).norm(), 3.0, 1e-12)
                << "at (" << u << ", " << v << ")";
}

TEST(Surface_Evaluate, ParameterPointOverload_MatchesScalarOverload) {
    auto torus = Surface::make_torus(5.0, 1.0);
    EXPECT_EQ(torus.evaluate(ParameterPoint(0.2, 0.9)), torus.evaluate(0.2, 0.9));
}

TEST(Surface_Evaluate, NonFiniteCoordinate_BecomesInvalidPosition) {
    Surface hemisphere([](double u, double v) {
        return Position3D(u, std::sqrt(1.0 - u * u - v * v), v);
    });

    EXPECT_TRUE(hemisphere.is_defined(0.1, 0.1));
    EXPECT_FALSE(hemisphere.is_defined(2.0, 0.0));
    EXPECT_TRUE(hemisphere.evaluate(2.0, 0.0).array().isNaN().all());
}

TEST(Surface_Evaluate, InfiniteCoordinate_BecomesInvalidPosition) {
    Surface blowup([](double u, double v) {
        return Position3D(1.0 / u, 0.0, v);
    });

    EXPECT_TRUE(blowup.evaluate(0.0, 1.0).array().isNaN().all());
}

TEST(Surface_Evaluate, InvalidPosition_IsAllNaN) {
    EXPECT_TRUE(invalid_position().array().isNaN().all());
}

// ─── Factories ────────────────────────────────────────────────────────────────

TEST(Surface_Factories, Plane_HeightIsConstant) {
    auto plane = Surface::make_plane(2.5);
    EXPECT_EQ(plane.evaluate(3.0, -4.0), Position3D(3.0, 2.5, -4.0));
}

TEST(Surface_Factories, Cylinder_RadiusAroundYAxis) {
    auto cyl = Surface::make_cylinder(2.0);
    Position3D p = cyl.evaluate(7.0, 1.1);
    EXPECT_NEAR(std::hypot(p(0), p(2)), 2.0, 1e-12);
    EXPECT_NEAR(p(1), 7.0, 1e-12);
}

TEST(Surface_Factories, Torus_DistanceFromTubeCentre) {
    auto torus = Surface::make_torus(5.0, 1.0);
    Position3D p = torus.evaluate(0.7, 2.0);
    double ring = std::hypot(p(0), p(2)) - 5.0;
    EXPECT_NEAR(std::hypot(ring, p(1)), 1.0, 1e-12);
}

TEST(Surface_Factories, Saddle_HeightIsDifferenceOfSquares) {
    auto saddle = Surface::make_saddle(10.0);
    EXPECT_NEAR(saddle.evaluate(3.0, 1.0)(1), 0.8, 1e-12);
}

TEST(Surface_Factories, HyperboloidTwoSheets_StaysOnUpperSheet) {
    auto h = Surface::make_hyperboloid_two_sheets(1.0, 1.0, 1.0);
    Position3D p = h.evaluate(1.3, 0.4);
    // y² − x² − z² = 1
    EXPECT_NEAR(p(1) * p(1) - p(0) * p(0) - p(2) * p(2), 1.0, 1e-10);
    EXPECT_GT(p(1), 0.0);
}

// ─── Catalogue ────────────────────────────────────────────────────────────────

TEST(Surface_Catalogue, ListsElevenPresetsInDisplayOrder) {
    auto names = preset_names();
    ASSERT_EQ(names.size(), 11u);
    EXPECT_EQ(names.front(), "plane");
    EXPECT_EQ(names[1], "sphere");
    EXPECT_EQ(names.back(), "crossed-through");
}

TEST(Surface_Catalogue, EveryPresetIsDefinedInsideItsRange) {
    for (const auto& name : preset_names()) {
        auto preset = find_preset(name);
        ASSERT_TRUE(preset.has_value()) << name;

        double u = 0.5 * (preset->u_range.min + preset->u_range.max);
        double v = 0.5 * (preset->v_range.min + preset->v_range.max);
        EXPECT_TRUE(preset->surface.is_defined(u, v)) << name;
        EXPECT_EQ(preset->name, name);
    }
}

TEST(Surface_Catalogue, Sphere_DefaultRadiusIsFive) {
    auto preset = find_preset("sphere");
    ASSERT_TRUE(preset.has_value());
    EXPECT_DOUBLE_EQ(preset->parameters.at("r"), 5.0);
    EXPECT_NEAR(preset->surface.evaluate(1.0, 2.0).norm(), 5.0, 1e-12);
}

TEST(Surface_Catalogue, Override_ReplacesDefault) {
    auto preset = find_preset("sphere", {{"r", 2.0}});
    ASSERT_TRUE(preset.has_value());
    EXPECT_DOUBLE_EQ(preset->parameters.at("r"), 2.0);
    EXPECT_NEAR(preset->surface.evaluate(1.0, 2.0).norm(), 2.0, 1e-12);
}

TEST(Surface_Catalogue, Torus_ParameterNamesAreCaseSensitive) {
    auto preset = find_preset("torus", {{"R", 7.0}, {"r", 0.5}});
    ASSERT_TRUE(preset.has_value());
    EXPECT_DOUBLE_EQ(preset->parameters.at("R"), 7.0);
    EXPECT_DOUBLE_EQ(preset->parameters.at("r"), 0.5);
}

TEST(Surface_Catalogue, UnknownName_ReturnsNullopt) {
    EXPECT_FALSE(find_preset("klein-bottle").has_value());
}

TEST(Surface_Catalogue, UnknownParameter_ReturnsNullopt) {
    EXPECT_FALSE(find_preset("sphere", {{"q", 1.0}}).has_value());
    EXPECT_FALSE(find_preset("paraboloid", {{"r", 1.0}}).has_value());
}
