/// @file tests/integration/test_full_pipeline.cpp
/// @brief End-to-end tests of the preset → solver / animator → CSV pipeline.

#include "geosurf/animator.hpp"
#include "geosurf/cli.hpp"
#include "geosurf/geodesic.hpp"
#include "geosurf/path_writer.hpp"
#include "geosurf/surface.hpp"

#include <gtest/gtest.h>

#include <cmath>
#include <sstream>
#include <string>
#include <vector>

using namespace geosurf;
using namespace geosurf::geodesic;

namespace {

std::size_t count_lines(const std::string& text) {
    std::size_t n = 0;
    std::istringstream in(text);
    for (std::string line; std::getline(in, line);) ++n;
    return n;
}

} // namespace

// ─── Every preset ─────────────────────────────────────────────────────────────

TEST(Pipeline_Presets, EveryPresetSolvesWithinBudget) {
    for (const auto& name : preset_names()) {
        auto preset = find_preset(name);
        ASSERT_TRUE(preset.has_value()) << name;

        const ParameterPoint start(
            0.5 * (preset->u_range.min + preset->u_range.max),
            0.5 * (preset->v_range.min + preset->v_range.max));

        GeodesicSolver solver(preset->surface);
        SolveResult r;
        ASSERT_NO_THROW(r = solver.solve(GeodesicState{start, Velocity2D(0.1, 0.1)},
                                         SolveConfig{.dt = 0.05, .max_steps = 50,
                                                     .integrator = Integrator::RungeKutta4}))
            << name;

        EXPECT_EQ(r.path.size(), 51u) << name;
        EXPECT_EQ(r.path.front(), start) << name;
        EXPECT_TRUE(std::isfinite(r.length)) << name;
        EXPECT_GT(r.length, 0.0) << name;
    }
}

// ─── CLI → solver → CSV ───────────────────────────────────────────────────────

TEST(Pipeline_Batch, CliOptionsDriveSolveAndExport) {
    std::vector<std::string> args{"--preset", "torus", "--param", "r=2",
                                  "--start", "0.3,0", "--velocity", "1,0.4",
                                  "--dt", "0.02", "--steps", "200", "--max-length", "3"};
    auto opts = cli::parse_cli(args);
    ASSERT_TRUE(opts.has_value());

    auto preset = find_preset(opts->preset, opts->parameters);
    ASSERT_TRUE(preset.has_value());
    EXPECT_DOUBLE_EQ(preset->parameters.at("r"), 2.0);
    EXPECT_DOUBLE_EQ(preset->parameters.at("R"), 5.0);

    GeodesicSolver solver(preset->surface);
    SolveResult r = solver.solve(GeodesicState{opts->start, opts->velocity}, opts->solve);

    EXPECT_GE(r.length, 3.0);
    EXPECT_LT(r.steps_taken, 200);

    const std::string csv = io::PathWriter::format_csv(preset->surface, r.path);
    EXPECT_EQ(count_lines(csv), r.path.size() + 1);
    EXPECT_EQ(csv.find("nan"), std::string::npos);
}

// ─── Animator vs batch ────────────────────────────────────────────────────────

TEST(Pipeline_Animate, AnimatorTracksBatchSolve) {
    // One sub-step per tick with matching dt reproduces the batch path.
    auto preset = find_preset("sphere");
    ASSERT_TRUE(preset.has_value());

    const ParameterPoint start(1.0, 0.0);
    const Velocity2D     velocity(0.2, 0.5);
    const double         dt = 0.01;

    animation::Animator anim(preset->surface,
                             animation::AnimatorConfig{.integrator = Integrator::RungeKutta4,
                                                       .substeps_per_frame = 1});
    anim.reset(start, velocity);
    for (int i = 0; i < 100; ++i) anim.tick(dt);

    SolveResult r = GeodesicSolver(preset->surface).solve(
        GeodesicState{start, velocity},
        SolveConfig{.dt = dt, .max_steps = 100, .integrator = Integrator::RungeKutta4});

    ASSERT_EQ(anim.path().size(), 100u);
    for (std::size_t i = 0; i < 100; ++i)
        EXPECT_TRUE(anim.path()[i].isApprox(r.path[i + 1], 1e-12)) << "step " << i;
}
