#pragma once

/// @file include/geosurf/cli.hpp
/// @brief Command-line configuration for the geosurf executable.
///
/// # Module: CLI Options
///
/// ## Responsibility
/// Turn argv into a validated `CliOptions` value. The default scene is the
/// radius-5 sphere, start point (π/4, 0), velocity (1, 1), dt = 0.05 and
/// 50 steps.
///
/// ## Guarantees
/// - Never throws; malformed input yields `nullopt` and one diagnostic line
///   on stderr
/// - A returned `CliOptions` names a known preset (or carries all three
///   surface formulas), has positive dt, non-negative budgets and a usable
///   animation setup
/// - `frames × substeps` never exceeds `constants::MAX_STEP_COUNT`

#include "geosurf/animator.hpp"
#include "geosurf/constants.hpp"
#include "geosurf/formula.hpp"
#include "geosurf/geodesic.hpp"
#include "geosurf/surface.hpp"
#include "geosurf/types.hpp"

#include <numbers>
#include <optional>
#include <span>
#include <string>

namespace geosurf::cli {

/// What the executable should do.
enum class RunMode {
    Batch,        ///< Bounded batch solve, summary + optional CSV
    Animate,      ///< Drive the Animator for a fixed number of frames
    ListPresets,  ///< Print the surface catalogue
    Help,         ///< Print usage
};

/// Fully parsed command line.
struct CliOptions {
    RunMode        mode   = RunMode::Batch;
    std::string    preset = "sphere";
    Parameters     parameters;  ///< Overrides of the preset defaults

    /// Set by `--x/--y/--z`; replaces the preset. `parameters` then holds
    /// every parameter the formulas use (unset ones are 0).
    std::optional<SurfaceFormulas> formulas;

    ParameterPoint start    = ParameterPoint(std::numbers::pi / 4.0, 0.0);
    Velocity2D     velocity = Velocity2D(1.0, 1.0);

    /// Batch solve settings. The CLI defaults to RK4.
    geodesic::SolveConfig solve{
        .dt            = constants::DEFAULT_TIME_STEP,
        .max_steps     = constants::DEFAULT_STEP_COUNT,
        .max_length    = constants::DEFAULT_MAX_LENGTH,
        .integrator    = geodesic::Integrator::RungeKutta4,
        .normalization = geodesic::VelocityNormalization::AsGiven,
    };

    /// Animation settings (integrator and normalisation mirror `solve`).
    int         frames     = constants::DEFAULT_FRAME_COUNT;
    double      fps        = constants::DEFAULT_FRAME_RATE;
    int         substeps   = constants::DEFAULT_SUBSTEPS_PER_FRAME;
    double      speed      = 1.0;
    std::size_t max_points = constants::DEFAULT_MAX_PATH_POINTS;

    std::optional<std::string> output_path;  ///< CSV destination, if any
    bool                       verbose = false;

    /// Animator configuration derived from these options.
    [[nodiscard]] animation::AnimatorConfig animator_config() const noexcept;
};

/// Parse the arguments following the program name.
///
/// # Returns
/// - `CliOptions` on success
/// - `nullopt` on an unknown flag, a missing or malformed value, an
///   unknown preset / preset parameter, an incomplete formula set, or an
///   animation longer than the step ceiling (a diagnostic is printed to
///   stderr)
[[nodiscard]] std::optional<CliOptions> parse_cli(std::span<const std::string> args);

/// Usage text printed by `--help`.
std::string usage();

} // namespace geosurf::cli
