/// @file src/geodesic/integrator.cpp
/// @brief Integrator selection and initial-velocity normalisation.

#include "geosurf/geodesic.hpp"

#include <cmath>

namespace geosurf::geodesic {

std::optional<Integrator> parse_integrator(std::string_view name) noexcept {
    if (name == "rk") {
        return Integrator::RungeKutta4;
    }
    if (name == "euler") {
        return Integrator::Euler;
    }
    return std::nullopt;
}

std::string_view to_string(Integrator integrator) noexcept {
    switch (integrator) {
        case Integrator::RungeKutta4: return "rk";
        case Integrator::Euler:       return "euler";
    }
    return "unknown";
}

std::string_view to_string(VelocityNormalization mode) noexcept {
    switch (mode) {
        case VelocityNormalization::AsGiven:   return "as-given";
        case VelocityNormalization::UnitSpeed: return "unit-speed";
    }
    return "unknown";
}

Velocity2D normalize_velocity(const Surface&        surface,
                              const ParameterPoint& point,
                              const Velocity2D&     velocity,
                              VelocityNormalization mode) {
    if (mode == VelocityNormalization::AsGiven) {
        return velocity;
    }

    const tensor::MetricTensor metric(surface);
    const double speed = metric.norm(point, velocity);
    if (!std::isfinite(speed) || speed == 0.0) {
        return velocity;
    }
    return velocity / speed;
}

} // namespace geosurf::geodesic
