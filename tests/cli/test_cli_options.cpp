#include <gtest/gtest.h>
#include "geosurf/cli.hpp"

#include <numbers>
#include <string>
#include <vector>

using namespace geosurf;
using namespace geosurf::cli;
using geosurf::geodesic::Integrator;
using geosurf::geodesic::VelocityNormalization;

namespace {

std::optional<CliOptions> parse(std::vector<std::string> args) {
    return parse_cli(args);
}

} // namespace

// ─── Defaults ─────────────────────────────────────────────────────────────────

TEST(Cli_Defaults, NoArguments_SphereScene) {
    auto opts = parse({});
    ASSERT_TRUE(opts.has_value());

    EXPECT_EQ(opts->mode, RunMode::Batch);
    EXPECT_EQ(opts->preset, "sphere");
    EXPECT_TRUE(opts->parameters.empty());
    EXPECT_DOUBLE_EQ(opts->start(0), std::numbers::pi / 4.0);
    EXPECT_DOUBLE_EQ(opts->start(1), 0.0);
    EXPECT_DOUBLE_EQ(opts->velocity(0), 1.0);
    EXPECT_DOUBLE_EQ(opts->velocity(1), 1.0);
    EXPECT_DOUBLE_EQ(opts->solve.dt, 0.05);
    EXPECT_EQ(opts->solve.max_steps, 50);
    EXPECT_DOUBLE_EQ(opts->solve.max_length, 0.0);
    EXPECT_EQ(opts->solve.integrator, Integrator::RungeKutta4);
    EXPECT_EQ(opts->solve.normalization, VelocityNormalization::AsGiven);
    EXPECT_FALSE(opts->output_path.has_value());
    EXPECT_FALSE(opts->verbose);
}

// ─── Modes ────────────────────────────────────────────────────────────────────

TEST(Cli_Mode, HelpShortCircuits) {
    // Anything after --help is ignored, even malformed input.
    auto opts = parse({"--help", "--dt", "oops"});
    ASSERT_TRUE(opts.has_value());
    EXPECT_EQ(opts->mode, RunMode::Help);

    auto short_opts = parse({"-h"});
    ASSERT_TRUE(short_opts.has_value());
    EXPECT_EQ(short_opts->mode, RunMode::Help);
}

TEST(Cli_Mode, ListPresets_SkipsPresetValidation) {
    auto opts = parse({"--preset", "klein-bottle", "--list-presets"});
    ASSERT_TRUE(opts.has_value());
    EXPECT_EQ(opts->mode, RunMode::ListPresets);
}

TEST(Cli_Mode, Animate) {
    auto opts = parse({"--animate", "--frames", "120", "--fps", "30",
                       "--substeps", "4", "--speed", "0.5", "--max-points", "200"});
    ASSERT_TRUE(opts.has_value());
    EXPECT_EQ(opts->mode, RunMode::Animate);
    EXPECT_EQ(opts->frames, 120);
    EXPECT_DOUBLE_EQ(opts->fps, 30.0);
    EXPECT_EQ(opts->substeps, 4);
    EXPECT_DOUBLE_EQ(opts->speed, 0.5);
    EXPECT_EQ(opts->max_points, 200u);
}

// ─── Valid flags ──────────────────────────────────────────────────────────────

TEST(Cli_Flags, BatchSettings) {
    auto opts = parse({"--preset", "torus", "--param", "R=4", "--param", "r=0.5",
                       "--start", "0.3,-1", "--velocity", "1,0.4",
                       "--dt", "0.01", "--steps", "500", "--max-length", "12.5",
                       "--integrator", "euler", "--normalize", "-v", "-o", "out.csv"});
    ASSERT_TRUE(opts.has_value());

    EXPECT_EQ(opts->preset, "torus");
    EXPECT_DOUBLE_EQ(opts->parameters.at("R"), 4.0);
    EXPECT_DOUBLE_EQ(opts->parameters.at("r"), 0.5);
    EXPECT_DOUBLE_EQ(opts->start(0), 0.3);
    EXPECT_DOUBLE_EQ(opts->start(1), -1.0);
    EXPECT_DOUBLE_EQ(opts->velocity(1), 0.4);
    EXPECT_DOUBLE_EQ(opts->solve.dt, 0.01);
    EXPECT_EQ(opts->solve.max_steps, 500);
    EXPECT_DOUBLE_EQ(opts->solve.max_length, 12.5);
    EXPECT_EQ(opts->solve.integrator, Integrator::Euler);
    EXPECT_EQ(opts->solve.normalization, VelocityNormalization::UnitSpeed);
    EXPECT_TRUE(opts->verbose);
    ASSERT_TRUE(opts->output_path.has_value());
    EXPECT_EQ(*opts->output_path, "out.csv");
}

TEST(Cli_Flags, ZeroStepsAndZeroLengthAccepted) {
    auto opts = parse({"--steps", "0", "--max-length", "0"});
    ASSERT_TRUE(opts.has_value());
    EXPECT_EQ(opts->solve.max_steps, 0);
}

TEST(Cli_Flags, AnimatorConfigMirrorsOptions) {
    auto opts = parse({"--integrator", "euler", "--normalize", "--substeps", "7",
                       "--speed", "3", "--max-points", "42"});
    ASSERT_TRUE(opts.has_value());

    auto config = opts->animator_config();
    EXPECT_EQ(config.integrator, Integrator::Euler);
    EXPECT_EQ(config.normalization, VelocityNormalization::UnitSpeed);
    EXPECT_EQ(config.substeps_per_frame, 7);
    EXPECT_DOUBLE_EQ(config.speed, 3.0);
    EXPECT_EQ(config.max_points, 42u);
}

TEST(Cli_Flags, Formulas_ReplacePresetAndResolveParameters) {
    auto opts = parse({"--x", "%r * sin(%u) * cos(%v)", "--y", "%r * cos(%u) + %h",
                       "--z", "%r * sin(%u) * sin(%v)", "--param", "r=2"});
    ASSERT_TRUE(opts.has_value());
    ASSERT_TRUE(opts->formulas.has_value());

    EXPECT_EQ(opts->formulas->y, "%r * cos(%u) + %h");
    EXPECT_EQ(opts->preset, "formula");
    EXPECT_EQ(opts->parameters.size(), 2u);
    EXPECT_DOUBLE_EQ(opts->parameters.at("r"), 2.0);
    EXPECT_DOUBLE_EQ(opts->parameters.at("h"), 0.0);
}

TEST(Cli_Flags, NoFormulas_ByDefault) {
    auto opts = parse({"--preset", "torus"});
    ASSERT_TRUE(opts.has_value());
    EXPECT_FALSE(opts->formulas.has_value());
}

TEST(Cli_Flags, FramesTimesSubstepsAtCeilingAccepted) {
    auto opts = parse({"--animate", "--frames", "100000", "--substeps", "100"});
    ASSERT_TRUE(opts.has_value());
    EXPECT_EQ(opts->frames, 100000);
}

// ─── Rejected input ───────────────────────────────────────────────────────────

TEST(Cli_Errors, UnknownFlag) {
    EXPECT_FALSE(parse({"--frobnicate"}).has_value());
}

TEST(Cli_Errors, MissingValue) {
    EXPECT_FALSE(parse({"--dt"}).has_value());
    EXPECT_FALSE(parse({"--preset"}).has_value());
}

TEST(Cli_Errors, MalformedNumbers) {
    EXPECT_FALSE(parse({"--dt", "fast"}).has_value());
    EXPECT_FALSE(parse({"--dt", "0.1x"}).has_value());
    EXPECT_FALSE(parse({"--dt", "nan"}).has_value());
    EXPECT_FALSE(parse({"--steps", "2.5"}).has_value());
    EXPECT_FALSE(parse({"--start", "1"}).has_value());
    EXPECT_FALSE(parse({"--start", "1,"}).has_value());
    EXPECT_FALSE(parse({"--velocity", "a,b"}).has_value());
    EXPECT_FALSE(parse({"--param", "R"}).has_value());
    EXPECT_FALSE(parse({"--param", "=4"}).has_value());
    EXPECT_FALSE(parse({"--param", "R=big"}).has_value());
}

TEST(Cli_Errors, OutOfRangeValues) {
    EXPECT_FALSE(parse({"--dt", "0"}).has_value());
    EXPECT_FALSE(parse({"--dt", "-0.1"}).has_value());
    EXPECT_FALSE(parse({"--steps", "-1"}).has_value());
    EXPECT_FALSE(parse({"--steps", "10000001"}).has_value());
    EXPECT_FALSE(parse({"--max-length", "-2"}).has_value());
    EXPECT_FALSE(parse({"--frames", "0"}).has_value());
    EXPECT_FALSE(parse({"--fps", "0"}).has_value());
    EXPECT_FALSE(parse({"--substeps", "0"}).has_value());
    EXPECT_FALSE(parse({"--max-points", "-3"}).has_value());
}

TEST(Cli_Errors, UnknownIntegrator) {
    EXPECT_FALSE(parse({"--integrator", "rk45"}).has_value());
}

TEST(Cli_Errors, UnknownPresetOrParameter) {
    EXPECT_FALSE(parse({"--preset", "klein-bottle"}).has_value());
    EXPECT_FALSE(parse({"--preset", "sphere", "--param", "R=2"}).has_value());
    EXPECT_FALSE(parse({"--animate", "--preset", "nowhere"}).has_value());
}

TEST(Cli_Errors, PartialFormulaSet) {
    EXPECT_FALSE(parse({"--x", "%u"}).has_value());
    EXPECT_FALSE(parse({"--x", "%u", "--z", "%v"}).has_value());
}

TEST(Cli_Errors, ParameterNotUsedByFormulas) {
    EXPECT_FALSE(parse({"--x", "%u", "--y", "%h", "--z", "%v",
                        "--param", "r=1"}).has_value());
}

TEST(Cli_Errors, AnimationBeyondStepCeiling) {
    // 1e7 frames × 100000 substeps would run 1e12 integration steps.
    EXPECT_FALSE(parse({"--animate", "--frames", "10000000",
                        "--substeps", "100000"}).has_value());
    EXPECT_FALSE(parse({"--animate", "--frames", "100001", "--substeps", "100"}).has_value());
}

TEST(Cli_Usage, MentionsEveryFlag) {
    const std::string text = usage();
    for (const char* flag : {"--preset", "--param", "--start", "--velocity", "--normalize",
                             "--integrator", "--dt", "--steps", "--max-length", "--animate",
                             "--frames", "--fps", "--substeps", "--speed", "--max-points",
                             "--output", "--verbose", "--list-presets", "--help",
                             "--x", "--y", "--z"})
        EXPECT_NE(text.find(flag), std::string::npos) << flag;
}
