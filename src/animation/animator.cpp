/// @file src/animation/animator.cpp
/// @brief Implementation of the per-tick geodesic Animator.

#include "geosurf/animator.hpp"

#include <algorithm>
#include <cmath>

namespace geosurf::animation {

// ─── Construction ─────────────────────────────────────────────────────────────

Animator::Animator(const Surface& surface, AnimatorConfig config)
    : surface_(surface)
    , stepper_(surface)
    , config_(config)
    , state_{ParameterPoint::Zero(), Velocity2D::Zero()} {
    config_.substeps_per_frame = std::max(config_.substeps_per_frame, 1);
}

// ─── Control ──────────────────────────────────────────────────────────────────

void Animator::reset(const ParameterPoint& point, const Velocity2D& velocity) {
    state_.position = point;
    state_.velocity = geodesic::normalize_velocity(surface_, point, velocity,
                                                   config_.normalization);
    path_.clear();
    running_ = true;
}

bool Animator::budget_exhausted() const noexcept {
    return config_.max_points != 0 && path_.size() >= config_.max_points;
}

// ─── tick ─────────────────────────────────────────────────────────────────────

std::size_t Animator::tick(double elapsed_seconds) {
    if (!running_ || !std::isfinite(elapsed_seconds) || elapsed_seconds <= 0.0) {
        return 0;
    }

    const int    substeps = config_.substeps_per_frame;
    const double dt       = elapsed_seconds * config_.speed / substeps;

    std::size_t appended = 0;
    for (int i = 0; i < substeps; ++i) {
        state_ = stepper_.step(state_, dt, config_.integrator);
        path_.push_back(state_.position);
        ++appended;

        if (budget_exhausted()) {
            running_ = false;
            break;
        }
    }

    return appended;
}

// ─── snapshot ─────────────────────────────────────────────────────────────────

AnimationSnapshot Animator::snapshot() const {
    return AnimationSnapshot{state_, path_, running_};
}

} // namespace geosurf::animation
