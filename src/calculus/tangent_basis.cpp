/// @file src/calculus/tangent_basis.cpp
/// @brief Tangent basis vectors of a parametric surface.

#include "geosurf/calculus.hpp"

namespace geosurf::calculus {

Position3D u_base(const Surface& surface, double u, double v) {
    return partial_u(
        [&surface](double u_, double v_) { return surface.evaluate(u_, v_); },
        u, v);
}

Position3D v_base(const Surface& surface, double u, double v) {
    return partial_v(
        [&surface](double u_, double v_) { return surface.evaluate(u_, v_); },
        u, v);
}

TangentBasis tangent_basis(const Surface& surface, double u, double v) {
    return TangentBasis{u_base(surface, u, v), v_base(surface, u, v)};
}

} // namespace geosurf::calculus
