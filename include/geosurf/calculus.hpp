#pragma once

/// @file include/geosurf/calculus.hpp
/// @brief Finite-difference calculus on functions of (u, v).
///
/// # Module: Differential Calculus Utilities
///
/// ## Responsibility
/// Forward-difference derivatives of scalar- and vector-valued functions,
/// and the tangent basis vectors e_u = ∂r/∂u, e_v = ∂r/∂v of a surface:
///
///   f'(x) ≈ (f(x + h) − f(x)) / h,   h = constants::DIFF_DELTA
///
/// ## Guarantees
/// - Pure: no state, no caching between calls, safe to call concurrently
/// - Never throws; NaN / Inf from the underlying function propagate
///
/// ## NOT Responsible For
/// - Central or higher-order difference schemes
/// - Adaptive step selection

#include "geosurf/constants.hpp"
#include "geosurf/surface.hpp"
#include "geosurf/types.hpp"

#include <type_traits>

namespace geosurf::calculus {

/// Forward-difference derivative of a one-variable function at x.
///
/// `f` may return a double or any Eigen vector type.
template <typename F>
auto derivative(const F& f, double x, double h = constants::DIFF_DELTA)
    -> std::decay_t<decltype(f(x))> {
    using Result = std::decay_t<decltype(f(x))>;
    const Result ahead = f(x + h);
    const Result here  = f(x);
    return Result((ahead - here) / h);
}

/// ∂f/∂u at (u, v), holding v fixed.
template <typename F>
auto partial_u(const F& f, double u, double v, double h = constants::DIFF_DELTA)
    -> std::decay_t<decltype(f(u, v))> {
    return derivative([&f, v](double u_) { return f(u_, v); }, u, h);
}

/// ∂f/∂v at (u, v), holding u fixed.
template <typename F>
auto partial_v(const F& f, double u, double v, double h = constants::DIFF_DELTA)
    -> std::decay_t<decltype(f(u, v))> {
    return derivative([&f, u](double v_) { return f(u, v_); }, v, h);
}

// ─── Tangent Basis ────────────────────────────────────────────────────────────

/// The pair of tangent vectors spanning the tangent plane at a point.
struct TangentBasis {
    Position3D e_u;  ///< ∂r/∂u
    Position3D e_v;  ///< ∂r/∂v
};

/// Tangent basis vector along u: ∂r/∂u at (u, v).
Position3D u_base(const Surface& surface, double u, double v);

/// Tangent basis vector along v: ∂r/∂v at (u, v).
Position3D v_base(const Surface& surface, double u, double v);

/// Both tangent basis vectors at (u, v).
TangentBasis tangent_basis(const Surface& surface, double u, double v);

} // namespace geosurf::calculus
