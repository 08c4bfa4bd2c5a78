/**
 * Motion Smoother
 *
 * Spring-damper filtering of anchor positions between the noisy
 * per-frame landmark targets and what is drawn on screen.
 */

#include "physics/MotionSmoother.h"
#include <algorithm>
#include <cmath>

namespace jewelry_tryon {

void integrateSpringDamper(PhysicsState& state,
                           const Eigen::Vector2d& target,
                           const PhysicsParams& params,
                           double dt_frames) {
    if (!(dt_frames > 0.0) || !std::isfinite(dt_frames)) {
        return;
    }

    // Stability of the explicit step needs h below ~5 frames for the
    // allowed coefficient range, one frame per step keeps a wide margin.
    int num_steps = static_cast<int>(std::ceil(dt_frames - 1e-9));
    num_steps = std::max(num_steps, 1);
    const double h = dt_frames / num_steps;

    for (int i = 0; i < num_steps; ++i) {
        Eigen::Vector2d spring_force = (target - state.position) * params.stiffness;
        Eigen::Vector2d damping_force = -state.velocity * (1.0 - params.damping);
        state.velocity += (spring_force + damping_force) * h;
        state.position += state.velocity * h;
    }
}

void MotionSmoother::configureAnchor(const std::string& name, const PhysicsParams& params) {
    params_[name] = params;
}

const PhysicsParams& MotionSmoother::getParams(const std::string& name) const {
    auto it = params_.find(name);
    if (it != params_.end()) {
        return it->second;
    }
    return default_params_;
}

Eigen::Vector2d MotionSmoother::update(const std::string& name,
                                       const Eigen::Vector2d& target,
                                       double dt_seconds) {
    const PhysicsParams& params = getParams(name);

    auto it = states_.find(name);
    if (it == states_.end() || !params.enabled) {
        snap(name, target);
        return target;
    }

    PhysicsState& state = it->second;
    if (!(dt_seconds > 0.0) || !std::isfinite(dt_seconds)) {
        return state.position;
    }

    double dt = std::min(dt_seconds, max_dt_);
    integrateSpringDamper(state, target, params, dt * reference_fps_);
    return state.position;
}

void MotionSmoother::snap(const std::string& name, const Eigen::Vector2d& target) {
    states_[name] = PhysicsState(target);
}

} // namespace jewelry_tryon
