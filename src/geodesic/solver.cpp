/// @file src/geodesic/solver.cpp
/// @brief Bounded-length batch geodesic solve.

#include "geosurf/geodesic.hpp"

#include <algorithm>
#include <cmath>

namespace geosurf::geodesic {

namespace {

// Upfront path reservation; a length cap usually ends the loop long before
// a large step budget is spent.
constexpr int MAX_RESERVED_STEPS = 4096;

} // namespace

// ─── Construction ─────────────────────────────────────────────────────────────

GeodesicSolver::GeodesicSolver(const Surface& surface)
    : surface_(surface)
    , stepper_(surface)
    , metric_(surface) {}

// ─── solve ────────────────────────────────────────────────────────────────────

SolveResult GeodesicSolver::solve(const GeodesicState& initial,
                                  const SolveConfig&   config) const {
    const int  steps      = std::clamp(config.max_steps, 0, constants::MAX_STEP_COUNT);
    const bool length_cap = config.max_length != 0.0;

    GeodesicState current{
        initial.position,
        normalize_velocity(surface_, initial.position, initial.velocity,
                           config.normalization),
    };

    SolveResult result{Path{}, 0.0, 0, current};
    result.path.reserve(static_cast<std::size_t>(std::min(steps, MAX_RESERVED_STEPS)) + 1);
    result.path.push_back(current.position);

    for (int i = 0; i < steps; ++i) {
        const Matrix2 g = metric_.evaluate(current.position);

        const GeodesicState next = stepper_.step(current, config.dt, config.integrator);
        const Velocity2D    disp = next.position - current.position;

        result.length += std::sqrt(tensor::MetricTensor::quadratic_form(g, disp));
        result.path.push_back(next.position);
        ++result.steps_taken;
        current = next;

        // NaN lengths never satisfy the comparison; the step budget still ends the loop.
        if (length_cap && result.length >= config.max_length) {
            break;
        }
    }

    result.final_state = current;
    return result;
}

// ─── path_length ──────────────────────────────────────────────────────────────

double GeodesicSolver::path_length(const Path& path) const {
    double total = 0.0;
    for (std::size_t i = 1; i < path.size(); ++i) {
        total += metric_.norm(path[i - 1], path[i] - path[i - 1]);
    }
    return total;
}

} // namespace geosurf::geodesic
