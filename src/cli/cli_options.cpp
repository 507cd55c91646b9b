/// @file src/cli/cli_options.cpp
/// @brief argv parsing for the geosurf executable.

#include "geosurf/cli.hpp"

#include <fmt/core.h>

#include <charconv>
#include <cmath>
#include <cstdio>
#include <string_view>
#include <system_error>
#include <utility>

namespace geosurf::cli {

namespace {

std::optional<double> parse_double(std::string_view text) noexcept {
    double value = 0.0;
    const char* end = text.data() + text.size();
    const auto [ptr, ec] = std::from_chars(text.data(), end, value);
    if (ec != std::errc{} || ptr != end || !std::isfinite(value)) {
        return std::nullopt;
    }
    return value;
}

std::optional<long long> parse_integer(std::string_view text) noexcept {
    long long value = 0;
    const char* end = text.data() + text.size();
    const auto [ptr, ec] = std::from_chars(text.data(), end, value);
    if (ec != std::errc{} || ptr != end) {
        return std::nullopt;
    }
    return value;
}

/// "a,b" → (a, b).
std::optional<Eigen::Vector2d> parse_pair(std::string_view text) noexcept {
    const auto comma = text.find(',');
    if (comma == std::string_view::npos) {
        return std::nullopt;
    }
    const auto first  = parse_double(text.substr(0, comma));
    const auto second = parse_double(text.substr(comma + 1));
    if (!first || !second) {
        return std::nullopt;
    }
    return Eigen::Vector2d(*first, *second);
}

void report(std::string_view flag, std::string_view message) {
    fmt::print(stderr, "Error: {} {}\n", flag, message);
}

} // namespace

animation::AnimatorConfig CliOptions::animator_config() const noexcept {
    return animation::AnimatorConfig{
        .integrator         = solve.integrator,
        .substeps_per_frame = substeps,
        .speed              = speed,
        .max_points         = max_points,
        .normalization      = solve.normalization,
    };
}

std::optional<CliOptions> parse_cli(std::span<const std::string> args) {
    CliOptions opts;
    std::optional<std::string> formula_x;
    std::optional<std::string> formula_y;
    std::optional<std::string> formula_z;

    for (std::size_t i = 0; i < args.size(); ++i) {
        const std::string_view flag = args[i];

        // Flags without a value.
        if (flag == "--help" || flag == "-h") {
            opts.mode = RunMode::Help;
            return opts;
        }
        if (flag == "--list-presets") {
            opts.mode = RunMode::ListPresets;
            continue;
        }
        if (flag == "--animate") {
            opts.mode = RunMode::Animate;
            continue;
        }
        if (flag == "--normalize") {
            opts.solve.normalization = geodesic::VelocityNormalization::UnitSpeed;
            continue;
        }
        if (flag == "--verbose" || flag == "-v") {
            opts.verbose = true;
            continue;
        }

        // Every remaining flag takes exactly one value.
        if (i + 1 >= args.size()) {
            report(flag, "requires a value");
            return std::nullopt;
        }
        const std::string_view value = args[++i];

        if (flag == "--preset") {
            opts.preset = std::string(value);
        } else if (flag == "--x") {
            formula_x = std::string(value);
        } else if (flag == "--y") {
            formula_y = std::string(value);
        } else if (flag == "--z") {
            formula_z = std::string(value);
        } else if (flag == "--param") {
            const auto eq = value.find('=');
            const auto number = eq == std::string_view::npos
                ? std::optional<double>{}
                : parse_double(value.substr(eq + 1));
            if (!number || eq == 0) {
                report(flag, fmt::format("expects name=value, got '{}'", value));
                return std::nullopt;
            }
            opts.parameters[std::string(value.substr(0, eq))] = *number;
        } else if (flag == "--start") {
            const auto p = parse_pair(value);
            if (!p) {
                report(flag, fmt::format("expects u,v, got '{}'", value));
                return std::nullopt;
            }
            opts.start = *p;
        } else if (flag == "--velocity") {
            const auto w = parse_pair(value);
            if (!w) {
                report(flag, fmt::format("expects du,dv, got '{}'", value));
                return std::nullopt;
            }
            opts.velocity = *w;
        } else if (flag == "--dt") {
            const auto dt = parse_double(value);
            if (!dt || *dt <= 0.0) {
                report(flag, "must be a positive number");
                return std::nullopt;
            }
            opts.solve.dt = *dt;
        } else if (flag == "--steps") {
            const auto n = parse_integer(value);
            if (!n || *n < 0 || *n > constants::MAX_STEP_COUNT) {
                report(flag, fmt::format("must be an integer in [0, {}]",
                                         constants::MAX_STEP_COUNT));
                return std::nullopt;
            }
            opts.solve.max_steps = static_cast<int>(*n);
        } else if (flag == "--max-length") {
            const auto len = parse_double(value);
            if (!len || *len < 0.0) {
                report(flag, "must be a non-negative number (0 = unlimited)");
                return std::nullopt;
            }
            opts.solve.max_length = *len;
        } else if (flag == "--integrator") {
            const auto integrator = geodesic::parse_integrator(value);
            if (!integrator) {
                report(flag, fmt::format("must be 'rk' or 'euler', got '{}'", value));
                return std::nullopt;
            }
            opts.solve.integrator = *integrator;
        } else if (flag == "--frames") {
            const auto n = parse_integer(value);
            if (!n || *n < 1 || *n > constants::MAX_STEP_COUNT) {
                report(flag, "must be a positive integer");
                return std::nullopt;
            }
            opts.frames = static_cast<int>(*n);
        } else if (flag == "--fps") {
            const auto fps = parse_double(value);
            if (!fps || *fps <= 0.0) {
                report(flag, "must be a positive number");
                return std::nullopt;
            }
            opts.fps = *fps;
        } else if (flag == "--substeps") {
            const auto n = parse_integer(value);
            if (!n || *n < 1 || *n > 100'000) {
                report(flag, "must be an integer in [1, 100000]");
                return std::nullopt;
            }
            opts.substeps = static_cast<int>(*n);
        } else if (flag == "--speed") {
            const auto speed = parse_double(value);
            if (!speed) {
                report(flag, "must be a finite number");
                return std::nullopt;
            }
            opts.speed = *speed;
        } else if (flag == "--max-points") {
            const auto n = parse_integer(value);
            if (!n || *n < 0) {
                report(flag, "must be a non-negative integer (0 = unlimited)");
                return std::nullopt;
            }
            opts.max_points = static_cast<std::size_t>(*n);
        } else if (flag == "--output" || flag == "-o") {
            opts.output_path = std::string(value);
        } else {
            fmt::print(stderr, "Unknown option: {}\n", flag);
            return std::nullopt;
        }
    }

    if (formula_x || formula_y || formula_z) {
        if (!formula_x || !formula_y || !formula_z) {
            fmt::print(stderr, "Error: --x, --y and --z must be given together\n");
            return std::nullopt;
        }
        SurfaceFormulas formulas{*formula_x, *formula_y, *formula_z};
        auto resolved = resolve_parameters(formulas, opts.parameters);
        if (!resolved) {
            fmt::print(stderr,
                "Error: --param names a parameter the formulas do not use\n");
            return std::nullopt;
        }
        opts.parameters = std::move(*resolved);
        opts.formulas   = std::move(formulas);
        opts.preset     = "formula";
    }

    if (opts.mode == RunMode::Animate) {
        const long long total = static_cast<long long>(opts.frames) * opts.substeps;
        if (total > constants::MAX_STEP_COUNT) {
            fmt::print(stderr,
                "Error: --frames × --substeps = {} exceeds the step ceiling {}\n",
                total, constants::MAX_STEP_COUNT);
            return std::nullopt;
        }
    }

    if (!opts.formulas &&
        (opts.mode == RunMode::Batch || opts.mode == RunMode::Animate)) {
        if (!find_preset(opts.preset, opts.parameters)) {
            fmt::print(stderr,
                "Error: unknown preset '{}' or parameter not defined for it "
                "(see --list-presets)\n", opts.preset);
            return std::nullopt;
        }
    }

    return opts;
}

std::string usage() {
    return
        "Usage:\n"
        "  geosurf [options]                 Solve one geodesic path\n"
        "  geosurf --animate [options]       Animate a particle frame by frame\n"
        "  geosurf --list-presets            List built-in surfaces\n"
        "  geosurf --help                    Show this help\n"
        "\n"
        "Surface:\n"
        "  --preset <name>        Catalogue surface (default: sphere)\n"
        "  --param <k>=<value>    Override a surface parameter, repeatable\n"
        "  --x, --y, --z <expr>   Define the surface by formulas instead of a preset,\n"
        "                         e.g. --x '%r*sin(%u)*cos(%v)'; %u %v %pi %e and\n"
        "                         one-letter parameters %a..%Z; all three required\n"
        "\n"
        "Initial conditions:\n"
        "  --start <u>,<v>        Start point (default: 0.785398,0)\n"
        "  --velocity <du>,<dv>   Initial velocity (default: 1,1)\n"
        "  --normalize            Rescale velocity to unit metric length\n"
        "\n"
        "Integration:\n"
        "  --integrator rk|euler  Scheme (default: rk)\n"
        "  --dt <h>               Step size for batch mode (default: 0.05)\n"
        "  --steps <n>            Step budget for batch mode (default: 50)\n"
        "  --max-length <L>       Length cap for batch mode, 0 = none (default: 0)\n"
        "\n"
        "Animation:\n"
        "  --frames <n>           Frames to simulate (default: 600);\n"
        "                         frames × substeps must not exceed 10000000\n"
        "  --fps <f>              Frame rate; elapsed time per frame is 1/f (default: 60)\n"
        "  --substeps <s>         Integration steps per frame (default: 10)\n"
        "  --speed <x>            Simulated seconds per real second (default: 1)\n"
        "  --max-points <p>       Stop after p path points, 0 = none (default: 0)\n"
        "\n"
        "Output:\n"
        "  --output, -o <file>    Write the path as CSV (step,u,v,x,y,z)\n"
        "  --verbose, -v          Trace every step / frame on stderr\n";
}

} // namespace geosurf::cli
