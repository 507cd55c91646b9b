#pragma once

/// @file include/geosurf/animator.hpp
/// @brief Frame-by-frame geodesic animation driver state.
///
/// # Module: Geodesic Animator
///
/// ## Responsibility
/// Owns the mutable ODE state of one animated particle and advances it once
/// per display tick. Each tick is split into a fixed number of sub-steps so
/// fast particles stay stable:
///
///   dt = elapsed · speed / substeps_per_frame
///
/// Positions produced by every sub-step accumulate into a growing path that
/// renderers read through immutable snapshots.
///
/// ## Guarantees
/// - `tick` is bounded: at most `substeps_per_frame` stepper calls
/// - Never throws on numeric input; NaN states keep being advanced
/// - Not thread-safe for writes: one driver owns the animator
///
/// ## NOT Responsible For
/// - Clocks, timers or refresh-rate scheduling (the caller supplies elapsed)
/// - Rendering of the snapshot

#include "geosurf/constants.hpp"
#include "geosurf/geodesic.hpp"
#include "geosurf/surface.hpp"
#include "geosurf/types.hpp"

#include <cstddef>

namespace geosurf::animation {

/// Configuration of an Animator.
struct AnimatorConfig {
    /// Scheme used for every sub-step.
    geodesic::Integrator integrator = geodesic::Integrator::RungeKutta4;

    /// Integration steps per tick. Values below 1 are treated as 1.
    int substeps_per_frame = constants::DEFAULT_SUBSTEPS_PER_FRAME;

    /// Simulated time per second of elapsed real time.
    double speed = 1.0;

    /// Path point budget; the animator stops once it is reached. 0 = unlimited.
    std::size_t max_points = constants::DEFAULT_MAX_PATH_POINTS;

    /// Treatment of the velocity passed to reset().
    geodesic::VelocityNormalization normalization =
        geodesic::VelocityNormalization::AsGiven;
};

/// Immutable view of the animation for a renderer.
struct AnimationSnapshot {
    geodesic::GeodesicState state;
    Path                    path;
    bool                    running;
};

/// Per-tick geodesic integration for a single particle.
///
/// # Example
/// ```cpp
/// auto torus = geosurf::Surface::make_torus(5.0, 1.0);
/// Animator anim(torus);
/// anim.reset({0.0, 0.0}, {1.0, 0.3});
/// while (anim.running()) {
///     anim.tick(1.0 / 60.0);
///     render(anim.snapshot());
/// }
/// ```
class Animator {
public:
    /// Construct over a surface (held by const-reference). Starts stopped.
    explicit Animator(const Surface& surface, AnimatorConfig config = AnimatorConfig{});
    explicit Animator(Surface&&, AnimatorConfig = AnimatorConfig{}) = delete;  // would dangle

    /// Start a new particle: replaces the state, clears the path and resumes.
    void reset(const ParameterPoint& point, const Velocity2D& velocity);

    /// Stop advancing. Subsequent ticks do nothing until reset().
    void stop() noexcept { running_ = false; }

    /// Advance by `elapsed_seconds` of real time.
    ///
    /// # Returns
    /// Number of points appended to the path. Zero when stopped, or when
    /// `elapsed_seconds` is not a positive finite number.
    std::size_t tick(double elapsed_seconds);

    /// Copy of the current state and path.
    [[nodiscard]] AnimationSnapshot snapshot() const;

    [[nodiscard]] bool running() const noexcept { return running_; }
    [[nodiscard]] const geodesic::GeodesicState& state() const noexcept { return state_; }
    [[nodiscard]] const Path& path() const noexcept { return path_; }
    [[nodiscard]] const AnimatorConfig& config() const noexcept { return config_; }

private:
    bool budget_exhausted() const noexcept;

    const Surface&            surface_;
    geodesic::GeodesicStepper stepper_;
    AnimatorConfig            config_;
    geodesic::GeodesicState   state_;
    Path                      path_;
    bool                      running_ = false;
};

} // namespace geosurf::animation
