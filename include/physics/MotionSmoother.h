#pragma once

#include <Eigen/Dense>
#include <map>
#include <string>

namespace jewelry_tryon {

/**
 * Spring-damper coefficients for one anchor.
 * stiffness and damping are per reference frame (see CalibrationParams::reference_fps).
 */
struct PhysicsParams {
    bool enabled = true;
    double stiffness = 0.15;  // (0, 1]: pull toward the target
    double damping = 0.85;    // [0, 1): 1 - damping is the velocity drag

    bool isValid() const {
        return stiffness > 0.0 && stiffness <= 1.0 && damping >= 0.0 && damping < 1.0;
    }
};

/**
 * Persistent per-anchor state, pixel space
 */
struct PhysicsState {
    Eigen::Vector2d position;
    Eigen::Vector2d velocity;

    PhysicsState()
        : position(Eigen::Vector2d::Zero()), velocity(Eigen::Vector2d::Zero()) {}
    explicit PhysicsState(const Eigen::Vector2d& pos)
        : position(pos), velocity(Eigen::Vector2d::Zero()) {}
};

/**
 * Advance one state toward a target by dt reference frames.
 *
 * Explicit integration of
 *   springForce  = (target - position) * stiffness
 *   dampingForce = -velocity * (1 - damping)
 *   velocity    += (springForce + dampingForce) * dt
 *   position    += velocity * dt
 * in sub-steps of at most one reference frame, independently per axis.
 */
void integrateSpringDamper(PhysicsState& state,
                           const Eigen::Vector2d& target,
                           const PhysicsParams& params,
                           double dt_frames);

/**
 * Keyed table of spring-damper filters, one per anchor name.
 *
 * Owns every PhysicsState of a try-on session. States are created on the
 * first update of an anchor and discarded by reset().
 */
class MotionSmoother {
public:
    MotionSmoother() = default;

    /**
     * @param reference_fps Frame rate the coefficients are expressed at
     * @param max_dt Longest step in seconds, longer pauses are clamped
     */
    MotionSmoother(double reference_fps, double max_dt)
        : reference_fps_(reference_fps), max_dt_(max_dt) {}

    /**
     * Register an anchor with its coefficients (no state is created yet)
     */
    void configureAnchor(const std::string& name, const PhysicsParams& params);

    /**
     * Feed the raw target for one tick and return the display position.
     * Disabled physics snaps to the target and zeroes the velocity.
     * A non-positive or non-finite dt leaves an existing state untouched.
     */
    Eigen::Vector2d update(const std::string& name, const Eigen::Vector2d& target, double dt_seconds);

    /**
     * Force an anchor onto the target with zero velocity
     */
    void snap(const std::string& name, const Eigen::Vector2d& target);

    /**
     * Drop all states (session end). Anchor coefficients are kept.
     */
    void reset() { states_.clear(); }

    bool hasState(const std::string& name) const {
        return states_.find(name) != states_.end();
    }

    /**
     * State of an anchor, throws std::out_of_range if it has none
     */
    const PhysicsState& getState(const std::string& name) const { return states_.at(name); }

    size_t numStates() const { return states_.size(); }

    const PhysicsParams& getParams(const std::string& name) const;

private:
    double reference_fps_ = 60.0;
    double max_dt_ = 0.1;
    PhysicsParams default_params_;
    std::map<std::string, PhysicsParams> params_;
    std::map<std::string, PhysicsState> states_;
};

} // namespace jewelry_tryon
