#pragma once

/// @file include/geosurf/tensor.hpp
/// @brief Metric tensor and Christoffel symbols of a parametric surface.
///
/// # Module: Tensor Calculus
///
/// ## Responsibility
/// Implements the intrinsic geometry of a surface r(u, v):
///   - `MetricTensor`       — g_ij = e_i · e_j and its closed-form inverse
///   - `ChristoffelSymbols` — Γ^k_ij, obtained from the derivatives of the
///                            tangent basis fields projected onto the basis
///
/// ## Geometric Interpretation
/// The metric converts parameter-space displacements into real 3D lengths.
/// The Christoffel symbols describe how the tangent basis turns as the point
/// moves; they are the coefficients of the geodesic equation
///   d²x^k/dt² + Γ^k_ij (dx^i/dt)(dx^j/dt) = 0.
///
/// ## Guarantees
/// - Every quantity is computed pointwise; nothing is cached between points
/// - No exceptions: a singular metric or an undefined surface point yields
///   Inf / NaN entries, which the caller must tolerate
/// - Thread-safe reads: const member functions are safe to call concurrently
///
/// ## NOT Responsible For
/// - Curvature tensors (Riemann, Gaussian curvature)
/// - Time integration (see geosurf/geodesic.hpp)

#include "geosurf/constants.hpp"
#include "geosurf/surface.hpp"
#include "geosurf/types.hpp"

namespace geosurf::tensor {

// ─── MetricTensor ─────────────────────────────────────────────────────────────

/// The first fundamental form of a surface:
///
///   g = | e_u·e_u  e_u·e_v |
///       | e_u·e_v  e_v·e_v |
///
/// # Example
/// ```cpp
/// auto plane = geosurf::Surface::make_plane();
/// geosurf::tensor::MetricTensor g(plane);
/// auto gx = g.evaluate(1.0, 2.0);  // identity
/// ```
class MetricTensor {
public:
    /// Construct over a surface (held by const-reference).
    explicit MetricTensor(const Surface& surface);
    explicit MetricTensor(Surface&&) = delete;  // would dangle

    /// Evaluate g_ij at (u, v) from the finite-difference tangent basis.
    Matrix2 evaluate(double u, double v) const;

    Matrix2 evaluate(const ParameterPoint& x) const {
        return evaluate(x(0), x(1));
    }

    /// Metric built from a known tangent basis.
    static Matrix2 from_basis(const Position3D& e_u,
                              const Position3D& e_v) noexcept;

    /// Closed-form inverse of a symmetric 2×2 metric:
    ///   det = g_uu g_vv − g_uv²
    ///   g⁻¹ = (1/det) · | g_vv  −g_uv |
    ///                   | −g_uv  g_uu |
    ///
    /// Not guarded: det = 0 produces Inf / NaN entries.
    static Matrix2 inverse(const Matrix2& g) noexcept;

    /// Squared length of a parameter-space vector w at x:
    ///   g_uu w_u² + 2 g_uv w_u w_v + g_vv w_v².
    double norm_squared(const ParameterPoint& x, const Velocity2D& w) const;

    /// √norm_squared(x, w).
    double norm(const ParameterPoint& x, const Velocity2D& w) const;

    /// Bilinear form w·(g w) with an already evaluated metric.
    static double quadratic_form(const Matrix2& g, const Velocity2D& w) noexcept;

private:
    const Surface& surface_;
};

// ─── ChristoffelSymbols ───────────────────────────────────────────────────────

/// Computes Christoffel symbols at a point using the extrinsic formulation.
///
/// With u_u = ∂e_u/∂u, u_v = ∂e_u/∂v (= ∂e_v/∂u) and v_v = ∂e_v/∂v, the
/// symbols of the first kind are the projections onto the basis:
///
///   Γ_{m,ij} = (∂e_i/∂x^j) · e_m
///
/// and the second kind raises the first index with the inverse metric:
///
///   Γ^k_ij = Σ_m g^{km} Γ_{m,ij}
///
/// This is equivalent to ½ g^{km}(∂_i g_jm + ∂_j g_im − ∂_m g_ij) but needs
/// only derivatives of the basis fields, not of the metric.
class ChristoffelSymbols {
public:
    /// Construct over a surface (held by const-reference).
    explicit ChristoffelSymbols(const Surface& surface);
    explicit ChristoffelSymbols(Surface&&) = delete;  // would dangle

    /// Symbols of the first kind, indexed result[m](i, j) = Γ_{m,ij}.
    ChristoffelArray first_kind(double u, double v) const;

    /// Symbols of the second kind, indexed result[k](i, j) = Γ^k_ij.
    /// result[k](0, 1) and result[k](1, 0) are always bit-identical.
    ChristoffelArray compute(double u, double v) const;

    ChristoffelArray compute(const ParameterPoint& x) const {
        return compute(x(0), x(1));
    }

    /// Contract the symbols with a velocity: result^k = Γ^k_ij w^i w^j.
    ///
    /// This is the geodesic acceleration with the sign flipped.
    static Velocity2D contract(const ChristoffelArray& gamma,
                               const Velocity2D&       w) noexcept;

private:
    const Surface& surface_;
};

} // namespace geosurf::tensor
