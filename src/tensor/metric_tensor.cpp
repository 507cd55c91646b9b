/// @file src/tensor/metric_tensor.cpp
/// @brief Implementation of MetricTensor.

#include "geosurf/tensor.hpp"
#include "geosurf/calculus.hpp"

#include <cmath>

namespace geosurf::tensor {

// ─── Construction ─────────────────────────────────────────────────────────────

MetricTensor::MetricTensor(const Surface& surface)
    : surface_(surface) {}

// ─── Core Operations ──────────────────────────────────────────────────────────

Matrix2 MetricTensor::evaluate(double u, double v) const {
    const calculus::TangentBasis basis = calculus::tangent_basis(surface_, u, v);
    return from_basis(basis.e_u, basis.e_v);
}

Matrix2 MetricTensor::from_basis(const Position3D& e_u,
                                 const Position3D& e_v) noexcept {
    const double uu = e_u.dot(e_u);
    const double uv = e_u.dot(e_v);
    const double vv = e_v.dot(e_v);

    Matrix2 g;
    g << uu, uv,
         uv, vv;
    return g;
}

Matrix2 MetricTensor::inverse(const Matrix2& g) noexcept {
    const double uu = g(0, 0);
    const double uv = g(0, 1);
    const double vv = g(1, 1);

    const double det            = uu * vv - uv * uv;
    const double det_reciprocal = 1.0 / det;

    Matrix2 g_inv;
    g_inv <<  det_reciprocal * vv, -det_reciprocal * uv,
             -det_reciprocal * uv,  det_reciprocal * uu;
    return g_inv;
}

double MetricTensor::quadratic_form(const Matrix2& g, const Velocity2D& w) noexcept {
    return g(0, 0) * w(0) * w(0)
         + 2.0 * g(0, 1) * w(0) * w(1)
         + g(1, 1) * w(1) * w(1);
}

double MetricTensor::norm_squared(const ParameterPoint& x,
                                  const Velocity2D&     w) const {
    return quadratic_form(evaluate(x), w);
}

double MetricTensor::norm(const ParameterPoint& x, const Velocity2D& w) const {
    return std::sqrt(norm_squared(x, w));
}

} // namespace geosurf::tensor
