/// @file src/main.cpp
/// @brief geosurf CLI entry point.
///
/// Usage:
///   geosurf [options]              Solve one bounded geodesic path
///   geosurf --animate [options]    Drive the animator frame by frame
///   geosurf --list-presets         List built-in surfaces
///   geosurf --help                 Print usage

#include "geosurf/animator.hpp"
#include "geosurf/cli.hpp"
#include "geosurf/geodesic.hpp"
#include "geosurf/path_writer.hpp"
#include "geosurf/surface.hpp"

#ifdef GEOSURF_HAS_FORMULAS
#include "geosurf/formula_surface.hpp"
#endif

#include <fmt/core.h>

#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace {

using geosurf::cli::CliOptions;

void print_presets() {
    for (const auto& name : geosurf::preset_names()) {
        const auto preset = geosurf::find_preset(name);
        if (!preset) {
            continue;
        }

        std::string params;
        for (const auto& [key, value] : preset->parameters) {
            params += fmt::format(" {}={}", key, value);
        }
        fmt::print("{:<16} u∈[{:g}, {:g}]  v∈[{:g}, {:g}]{}\n",
                   name,
                   preset->u_range.min, preset->u_range.max,
                   preset->v_range.min, preset->v_range.max,
                   params);
        fmt::print("{:<16} --x '{}' --y '{}' --z '{}'\n", "",
                   preset->formulas.x, preset->formulas.y, preset->formulas.z);
    }
}

/// The surface to integrate on: the compiled formulas if given, otherwise
/// the catalogue preset. Prints the reason on failure.
std::optional<geosurf::SurfacePreset> load_surface(const CliOptions& opts) {
    if (!opts.formulas) {
        auto preset = geosurf::find_preset(opts.preset, opts.parameters);
        if (!preset) {
            fmt::print(stderr, "Error: unknown preset '{}'\n", opts.preset);
        }
        return preset;
    }

#ifdef GEOSURF_HAS_FORMULAS
    std::string error;
    auto surface = geosurf::compile_formula_surface(*opts.formulas, opts.parameters, error);
    if (!surface) {
        fmt::print(stderr, "Error: cannot compile formula {}\n", error);
        return std::nullopt;
    }
    // Formula surfaces carry no natural domain; the ranges are display hints.
    return geosurf::SurfacePreset{
        .name       = opts.preset,
        .surface    = *std::move(surface),
        .u_range    = {-10.0, 10.0},
        .v_range    = {-10.0, 10.0},
        .parameters = opts.parameters,
        .formulas   = *opts.formulas,
    };
#else
    fmt::print(stderr, "Error: geosurf was built without formula support (tinyexpr)\n");
    return std::nullopt;
#endif
}

/// Write the path if an output file was requested.
/// Returns 0 on success, 1 on error.
int export_path(const CliOptions& opts, const geosurf::Surface& surface,
                const geosurf::Path& path) {
    if (!opts.output_path) {
        return 0;
    }
    if (!geosurf::io::PathWriter::write_csv(*opts.output_path, surface, path)) {
        fmt::print(stderr, "Error: cannot write '{}'\n", *opts.output_path);
        return 1;
    }
    fmt::print("Wrote {} points to '{}'\n", path.size(), *opts.output_path);
    return 0;
}

/// Run one bounded batch solve.
/// Returns 0 on success, 1 on error.
int run_batch(const CliOptions& opts, const geosurf::SurfacePreset& preset) {
    using namespace geosurf::geodesic;

    const GeodesicSolver solver(preset.surface);
    const SolveResult    result = solver.solve(
        GeodesicState{opts.start, opts.velocity}, opts.solve);

    if (opts.verbose) {
        for (std::size_t i = 0; i < result.path.size(); ++i) {
            fmt::print(stderr, "step {:5d}: u={:.6f} v={:.6f}\n",
                       i, result.path[i](0), result.path[i](1));
        }
    }

    fmt::print("surface={} integrator={} velocity={} dt={} steps={} length={:.6f}\n",
               preset.name,
               to_string(opts.solve.integrator),
               to_string(opts.solve.normalization),
               opts.solve.dt,
               result.steps_taken,
               result.length);
    fmt::print("final u={:.6f} v={:.6f} du={:.6f} dv={:.6f}\n",
               result.final_state.position(0), result.final_state.position(1),
               result.final_state.velocity(0), result.final_state.velocity(1));

    if (!result.final_state.is_finite()) {
        fmt::print(stderr,
            "Warning: path left the region where the surface is defined\n");
    }

    return export_path(opts, preset.surface, result.path);
}

/// Drive the animator with a fixed frame time of 1/fps.
/// Returns 0 on success, 1 on error.
int run_animate(const CliOptions& opts, const geosurf::SurfacePreset& preset) {
    geosurf::animation::Animator animator(preset.surface, opts.animator_config());
    animator.reset(opts.start, opts.velocity);

    const double frame_time = 1.0 / opts.fps;
    int frames_run = 0;
    for (; frames_run < opts.frames && animator.running(); ++frames_run) {
        const std::size_t added = animator.tick(frame_time);
        if (opts.verbose) {
            const auto& s = animator.state();
            fmt::print(stderr, "frame {:5d}: +{} points  u={:.6f} v={:.6f}\n",
                       frames_run, added, s.position(0), s.position(1));
        }
    }

    const auto snap = animator.snapshot();
    fmt::print("surface={} integrator={} frames={} substeps={} points={} {}\n",
               preset.name,
               to_string(opts.solve.integrator),
               frames_run,
               opts.substeps,
               snap.path.size(),
               snap.running ? "running" : "stopped");

    return export_path(opts, preset.surface, snap.path);
}

}  // anonymous namespace

int main(int argc, char* argv[]) {
    const std::vector<std::string> args(argv + 1, argv + argc);

    const auto opts = geosurf::cli::parse_cli(args);
    if (!opts) {
        fmt::print(stderr, "{}", geosurf::cli::usage());
        return 1;
    }

    switch (opts->mode) {
        case geosurf::cli::RunMode::Help:
            fmt::print("{}", geosurf::cli::usage());
            return 0;
        case geosurf::cli::RunMode::ListPresets:
            print_presets();
            return 0;
        case geosurf::cli::RunMode::Batch:
        case geosurf::cli::RunMode::Animate:
            break;
    }

    const auto preset = load_surface(*opts);
    if (!preset) {
        return 1;
    }

    if (opts->mode == geosurf::cli::RunMode::Animate) {
        return run_animate(*opts, *preset);
    }
    return run_batch(*opts, *preset);
}
