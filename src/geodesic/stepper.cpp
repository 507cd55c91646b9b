/// @file src/geodesic/stepper.cpp
/// @brief Euler and RK4 transitions of the geodesic ODE.
///
///   dx^k/dt = w^k
///   dw^k/dt = −Γ^k_ij w^i w^j

#include "geosurf/geodesic.hpp"

namespace geosurf::geodesic {

// ─── Construction ─────────────────────────────────────────────────────────────

GeodesicStepper::GeodesicStepper(const Surface& surface)
    : christoffel_(surface) {}

// ─── acceleration ─────────────────────────────────────────────────────────────

Velocity2D GeodesicStepper::acceleration(const ParameterPoint& position,
                                         const Velocity2D&     velocity) const {
    const ChristoffelArray gamma = christoffel_.compute(position);
    return -tensor::ChristoffelSymbols::contract(gamma, velocity);
}

GeodesicState GeodesicStepper::derivative(const GeodesicState& s) const {
    return GeodesicState{s.velocity, acceleration(s.position, s.velocity)};
}

// ─── Schemes ──────────────────────────────────────────────────────────────────

GeodesicState GeodesicStepper::euler_step(const GeodesicState& state,
                                          double               dt) const {
    const Velocity2D accel = acceleration(state.position, state.velocity);
    return GeodesicState{state.position + dt * state.velocity,
                         state.velocity + dt * accel};
}

GeodesicState GeodesicStepper::rk4_step(const GeodesicState& state,
                                        double               dt) const {
    const GeodesicState k1 = derivative(state);
    const GeodesicState k2 = derivative(state + (dt / 2.0) * k1);
    const GeodesicState k3 = derivative(state + (dt / 2.0) * k2);
    const GeodesicState k4 = derivative(state + dt * k3);

    return state + (dt / 6.0) * (k1 + 2.0 * k2 + 2.0 * k3 + k4);
}

GeodesicState GeodesicStepper::step(const GeodesicState& state,
                                    double               dt,
                                    Integrator           integrator) const {
    if (integrator == Integrator::Euler) {
        return euler_step(state, dt);
    }
    return rk4_step(state, dt);
}

} // namespace geosurf::geodesic
