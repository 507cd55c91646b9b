#pragma once

/// @file include/geosurf/geodesic.hpp
/// @brief Geodesic stepping and bounded path solving on a parametric surface.
///
/// # Module: Geodesic Integration
///
/// ## Responsibility
/// Integrates the geodesic equation in parameter space,
///
///   du^k/dt = w^k
///   dw^k/dt = −Γ^k_ij w^i w^j
///
/// one transition at a time (`GeodesicStepper`) or as a bounded batch path
/// (`GeodesicSolver`).
///
/// ## Guarantees
/// - Every call terminates: batch solves are bounded by a step budget
/// - No exceptions: an undefined surface point or singular metric yields
///   NaN states, and integration carries on from them without recovering
/// - Velocities are used as given unless `VelocityNormalization::UnitSpeed`
///   is selected explicitly
///
/// ## NOT Responsible For
/// - Adaptive step-size control
/// - Boundary-value (shooting) searches between two points
/// - Animation cadence (see geosurf/animator.hpp)

#include "geosurf/constants.hpp"
#include "geosurf/surface.hpp"
#include "geosurf/tensor.hpp"
#include "geosurf/types.hpp"

#include <optional>
#include <string_view>

namespace geosurf::geodesic {

// ─── GeodesicState ────────────────────────────────────────────────────────────

/// Phase-space state of the geodesic ODE: parameter point and velocity.
struct GeodesicState {
    ParameterPoint position; ///< (u, v)
    Velocity2D     velocity; ///< (du/dt, dv/dt)

    /// Pointwise addition of two states (used internally by RK4).
    GeodesicState operator+(const GeodesicState& o) const noexcept {
        return {position + o.position, velocity + o.velocity};
    }

    /// Scalar multiplication (used internally by RK4).
    friend GeodesicState operator*(double s, const GeodesicState& g) noexcept {
        return {s * g.position, s * g.velocity};
    }

    /// True iff all position and velocity components are finite.
    [[nodiscard]] bool is_finite() const noexcept {
        return position.allFinite() && velocity.allFinite();
    }
};

// ─── Configuration Enums ──────────────────────────────────────────────────────

/// Numerical scheme used for one geodesic transition.
enum class Integrator {
    RungeKutta4, ///< Classical 4th-order Runge-Kutta ("rk")
    Euler,       ///< Explicit Euler ("euler")
};

/// Parse "rk" or "euler". Returns nullopt for any other name.
[[nodiscard]] std::optional<Integrator> parse_integrator(std::string_view name) noexcept;

/// "rk" or "euler".
std::string_view to_string(Integrator integrator) noexcept;

/// How an initial velocity is interpreted before integration.
enum class VelocityNormalization {
    AsGiven,   ///< Velocity magnitude sets the traversal speed
    UnitSpeed, ///< Rescaled to unit metric length at the start point
};

/// "as-given" or "unit-speed".
std::string_view to_string(VelocityNormalization mode) noexcept;

/// Apply `mode` to an initial velocity at `point`.
///
/// UnitSpeed divides by the metric norm; a zero or non-finite norm leaves
/// the velocity unchanged.
Velocity2D normalize_velocity(const Surface&        surface,
                              const ParameterPoint& point,
                              const Velocity2D&     velocity,
                              VelocityNormalization mode);

// ─── GeodesicStepper ──────────────────────────────────────────────────────────

/// Advances a GeodesicState by one time increment.
///
/// # Example
/// ```cpp
/// auto sphere = geosurf::Surface::make_sphere(5.0);
/// GeodesicStepper stepper(sphere);
/// GeodesicState s{ParameterPoint(M_PI / 2, 0.0), Velocity2D(0.0, 1.0)};
/// s = stepper.step(s, 0.01, Integrator::RungeKutta4);
/// ```
class GeodesicStepper {
public:
    /// Construct over a surface (held by const-reference).
    explicit GeodesicStepper(const Surface& surface);
    explicit GeodesicStepper(Surface&&) = delete;  // would dangle

    /// Geodesic acceleration a^k = −Γ^k_ij w^i w^j at `position`.
    Velocity2D acceleration(const ParameterPoint& position,
                            const Velocity2D&     velocity) const;

    /// One explicit Euler step, acceleration taken at the current point.
    /// One Christoffel evaluation.
    GeodesicState euler_step(const GeodesicState& state, double dt) const;

    /// One classical RK4 step. Four Christoffel evaluations.
    GeodesicState rk4_step(const GeodesicState& state, double dt) const;

    /// Dispatch to the selected scheme.
    GeodesicState step(const GeodesicState& state,
                       double               dt,
                       Integrator           integrator = Integrator::RungeKutta4) const;

private:
    /// (dx/dt, dw/dt) of the first-order system at state s.
    GeodesicState derivative(const GeodesicState& s) const;

    tensor::ChristoffelSymbols christoffel_;
};

// ─── GeodesicSolver ───────────────────────────────────────────────────────────

/// Parameters of a bounded batch solve.
struct SolveConfig {
    /// Time increment of every step.
    double dt = constants::DEFAULT_TIME_STEP;

    /// Maximum number of steps. Clamped to [0, MAX_STEP_COUNT].
    int max_steps = constants::DEFAULT_STEP_COUNT;

    /// Cap on the accumulated metric length. 0 disables the cap.
    double max_length = constants::DEFAULT_MAX_LENGTH;

    /// Scheme used for every step.
    Integrator integrator = Integrator::Euler;

    /// Treatment of the initial velocity.
    VelocityNormalization normalization = VelocityNormalization::AsGiven;
};

/// Outcome of a batch solve.
struct SolveResult {
    Path          path;         ///< Initial point followed by one point per step
    double        length;       ///< Accumulated metric length of all steps
    int           steps_taken;  ///< path.size() − 1
    GeodesicState final_state;  ///< State after the last step
};

/// Produces a bounded-length discrete geodesic path.
///
/// Each step's length is measured with the metric at the pre-step point,
///
///   ℓ = √(g_uu Δu² + 2 g_uv Δu Δv + g_vv Δv²),
///
/// and iteration halts once the step budget is spent or the accumulated
/// length reaches `max_length`. The step that crosses the cap is kept, so
/// the last point may overshoot it by at most one step.
class GeodesicSolver {
public:
    /// Construct over a surface (held by const-reference).
    explicit GeodesicSolver(const Surface& surface);
    explicit GeodesicSolver(Surface&&) = delete;  // would dangle

    /// Integrate from `initial` under `config`.
    SolveResult solve(const GeodesicState& initial,
                      const SolveConfig&   config = SolveConfig{}) const;

    /// Total metric length of a path, each segment measured at its start.
    double path_length(const Path& path) const;

private:
    const Surface&       surface_;
    GeodesicStepper      stepper_;
    tensor::MetricTensor metric_;
};

} // namespace geosurf::geodesic
