/// @file src/tensor/christoffel.cpp
/// @brief Christoffel symbols of the first and second kind.
///
/// Extrinsic formulation: Γ_{m,ij} = (∂e_i/∂x^j) · e_m, where the basis
/// field derivatives are taken by forward differences of the
/// finite-difference basis itself.

#include "geosurf/tensor.hpp"
#include "geosurf/calculus.hpp"

namespace geosurf::tensor {

namespace {

/// Assemble a symmetric 2×2 block from its three distinct entries.
Matrix2 symmetric(double d00, double d01, double d11) noexcept {
    Matrix2 m;
    m << d00, d01,
         d01, d11;
    return m;
}

} // namespace

// ─── Construction ─────────────────────────────────────────────────────────────

ChristoffelSymbols::ChristoffelSymbols(const Surface& surface)
    : surface_(surface) {}

// ─── first_kind ───────────────────────────────────────────────────────────────

ChristoffelArray ChristoffelSymbols::first_kind(double u, double v) const {
    const Surface& s = surface_;
    auto e_u_field = [&s](double u_, double v_) { return calculus::u_base(s, u_, v_); };
    auto e_v_field = [&s](double u_, double v_) { return calculus::v_base(s, u_, v_); };

    // Basis field derivatives. ∂e_v/∂u equals ∂e_u/∂v and is not computed.
    const Position3D u_u = calculus::partial_u(e_u_field, u, v);
    const Position3D u_v = calculus::partial_v(e_u_field, u, v);
    const Position3D v_v = calculus::partial_v(e_v_field, u, v);

    const calculus::TangentBasis basis = calculus::tangent_basis(s, u, v);
    const Position3D& e_u = basis.e_u;
    const Position3D& e_v = basis.e_v;

    ChristoffelArray result;
    result[0] = symmetric(u_u.dot(e_u), u_v.dot(e_u), v_v.dot(e_u));
    result[1] = symmetric(u_u.dot(e_v), u_v.dot(e_v), v_v.dot(e_v));
    return result;
}

// ─── compute ──────────────────────────────────────────────────────────────────

ChristoffelArray ChristoffelSymbols::compute(double u, double v) const {
    const MetricTensor metric(surface_);
    const Matrix2 g_inv = MetricTensor::inverse(metric.evaluate(u, v));

    const ChristoffelArray lower = first_kind(u, v);

    // Γ^k_ij = g^{k0} Γ_{0,ij} + g^{k1} Γ_{1,ij}; the off-diagonal entry is
    // written once and mirrored so the lower indices stay exactly symmetric.
    ChristoffelArray result;
    for (int k = 0; k < PARAM_DIM; ++k) {
        const double a = g_inv(k, 0);
        const double b = g_inv(k, 1);
        result[k] = symmetric(a * lower[0](0, 0) + b * lower[1](0, 0),
                              a * lower[0](0, 1) + b * lower[1](0, 1),
                              a * lower[0](1, 1) + b * lower[1](1, 1));
    }

    return result;
}

// ─── contract ─────────────────────────────────────────────────────────────────

Velocity2D ChristoffelSymbols::contract(const ChristoffelArray& gamma,
                                        const Velocity2D&       w) noexcept {
    // result^k = Γ^k_uu w_u² + 2 Γ^k_uv w_u w_v + Γ^k_vv w_v²
    Velocity2D result;
    for (int k = 0; k < PARAM_DIM; ++k) {
        result(k) = gamma[k](0, 0) * w(0) * w(0)
                  + 2.0 * gamma[k](0, 1) * w(0) * w(1)
                  + gamma[k](1, 1) * w(1) * w(1);
    }
    return result;
}

} // namespace geosurf::tensor
