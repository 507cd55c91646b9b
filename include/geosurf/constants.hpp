#pragma once

#include <cstddef>

/// @file include/geosurf/constants.hpp
/// @brief Numerical constants and configuration defaults for GeoSurf.

namespace geosurf::constants {

// ─── Numerical Tolerances ─────────────────────────────────────────────────────

/// General floating-point comparison epsilon.
static constexpr double FLOAT_EPSILON = 1e-12;

/// Step h of every forward-difference derivative: f'(x) ≈ (f(x+h) − f(x)) / h.
static constexpr double DIFF_DELTA = 1e-4;

// ─── Batch Solver Defaults ────────────────────────────────────────────────────

/// Default time increment of a single integration step.
static constexpr double DEFAULT_TIME_STEP = 0.05;

/// Default number of steps of a batch solve.
static constexpr int DEFAULT_STEP_COUNT = 50;

/// Default cumulative length cap. Zero disables the cap.
static constexpr double DEFAULT_MAX_LENGTH = 0.0;

/// Hard ceiling on the number of steps a batch solve will take.
static constexpr int MAX_STEP_COUNT = 10'000'000;

// ─── Animation Defaults ───────────────────────────────────────────────────────

/// Integration steps taken per displayed frame.
static constexpr int DEFAULT_SUBSTEPS_PER_FRAME = 10;

/// Default display refresh rate for the CLI animation driver.
static constexpr double DEFAULT_FRAME_RATE = 60.0;

/// Default number of frames simulated by the CLI animation driver.
static constexpr int DEFAULT_FRAME_COUNT = 600;

/// Default path point budget of the animator. Zero means unlimited.
static constexpr std::size_t DEFAULT_MAX_PATH_POINTS = 0;

} // namespace geosurf::constants
