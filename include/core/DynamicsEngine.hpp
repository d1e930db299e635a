/**
 * @file DynamicsEngine.hpp
 * @brief Point-mass vehicle dynamics with waypoint autopilot
 *
 * Produces the ground-truth trajectory of the simulated vehicle. A
 * proportional autopilot converts the active waypoint into a force command
 * which is integrated with explicit Euler steps under gravity, linear air
 * resistance and velocity/acceleration limits.
 *
 * @author peanut-nav
 * @date Created: 2025-09-10
 * @last Modified: 2025-09-18
 * @version 0.5.0
 */

#pragma once
#include "params/SimParamsBase.hpp"
#include <Eigen/Dense>
#include <optional>

class DynamicsEngine {
public:
    DynamicsEngine() = default;
    explicit DynamicsEngine(const VehicleParams& params);

    /**
     * @brief Overwrite the kinematic state
     *
     * @param position x, y, altitude (m)
     * @param velocity vx, vy, vz (m/s)
     * @param heading Heading (rad)
     */
    void setState(const Eigen::Vector3d& position,
                  const Eigen::Vector3d& velocity,
                  double heading);

    /**
     * @brief Set the autopilot target
     */
    void setWaypoint(const Eigen::Vector3d& waypoint) { target_waypoint_ = waypoint; }

    void clearWaypoint() { target_waypoint_.reset(); }

    void setAutopilotActive(bool active) { autopilot_active_ = active; }

    bool isAutopilotActive() const { return autopilot_active_; }

    const std::optional<Eigen::Vector3d>& getWaypoint() const { return target_waypoint_; }

    /**
     * @brief Compute the force command that steers toward a target
     *
     * Desired velocity is Kp_pos * (target - position) - Kp_vel * velocity,
     * clamped per axis. The acceleration command tracks it with the velocity
     * gain and is clamped per axis. The vertical force carries an additional
     * m*g hover term.
     *
     * @param target Target waypoint (m)
     * @return Force command (N)
     */
    Eigen::Vector3d computeAutopilotControl(const Eigen::Vector3d& target) const;

    /**
     * @brief Integrate the equations of motion over one time step
     *
     * @param dt Time step (s)
     * @param force Applied force (N), vertical axis includes hover compensation
     */
    void advance(double dt, const Eigen::Vector3d& force = Eigen::Vector3d::Zero());

    /**
     * @brief Advance one step with the autopilot, or drift when it is idle
     *
     * @param dt Time step (s)
     */
    void step(double dt);

    const VehicleState& getState() const { return state_; }

    const VehicleParams& getParams() const { return params_; }

    double distanceToWaypoint(const Eigen::Vector3d& waypoint) const;

    double headingToWaypoint(const Eigen::Vector3d& waypoint) const;

    double speed() const { return state_.velocity.norm(); }

private:
    VehicleParams params_;
    VehicleState state_;
    std::optional<Eigen::Vector3d> target_waypoint_;
    bool autopilot_active_ = true;
};
