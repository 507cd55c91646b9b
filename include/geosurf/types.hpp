#pragma once

/// @file include/geosurf/types.hpp
/// @brief Shared primitive types for the GeoSurf geodesic engine.
///
/// Every module includes this file. It defines the value types and the
/// Eigen-based linear-algebra aliases used throughout the system.

#include <Eigen/Dense>
#include <array>
#include <functional>
#include <limits>
#include <map>
#include <string>
#include <vector>

namespace geosurf {

/// Dimensionality of the parameter domain (u, v).
static constexpr int PARAM_DIM = 2;

/// Dimensionality of the embedding space (x, y, z).
static constexpr int EMBED_DIM = 3;

// ─── Linear Algebra Aliases ───────────────────────────────────────────────────

/// A point of the surface in 3D space.
/// All three components NaN means "surface undefined here".
using Position3D = Eigen::Vector<double, EMBED_DIM>;

/// Coordinates (u, v) on the parameter domain of a surface.
using ParameterPoint = Eigen::Vector<double, PARAM_DIM>;

/// Tangent direction in parameter space: (du/dt, dv/dt).
using Velocity2D = Eigen::Vector<double, PARAM_DIM>;

/// Symmetric 2×2 metric tensor g_ij = e_i · e_j.
using Matrix2 = Eigen::Matrix<double, PARAM_DIM, PARAM_DIM>;

/// Christoffel symbols indexed as gamma[k](i, j).
using ChristoffelArray = std::array<Matrix2, PARAM_DIM>;

/// An ordered, append-only sequence of parameter points.
using Path = std::vector<ParameterPoint>;

/// The surface function capability: (u, v) → position in 3D.
/// Must be total; failures are reported with invalid_position().
using SurfaceFunction = std::function<Position3D(double, double)>;

/// Named scalar surface parameters, e.g. {"r", 5.0}.
using Parameters = std::map<std::string, double>;

/// Closed display interval [min, max] of a parameter.
struct Range {
    double min;
    double max;
};

// ─── Sentinels ────────────────────────────────────────────────────────────────

/// The "surface undefined here" position.
inline Position3D invalid_position() noexcept {
    const double nan = std::numeric_limits<double>::quiet_NaN();
    return Position3D(nan, nan, nan);
}

} // namespace geosurf
