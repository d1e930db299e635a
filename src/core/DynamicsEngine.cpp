/**
 * @file DynamicsEngine.cpp
 * @brief Implementation of point-mass vehicle dynamics
 *
 * @author peanut-nav
 * @date Created: 2025-09-10
 * @last Modified: 2025-09-18
 * @version 0.5.0
 */

#include "core/DynamicsEngine.hpp"
#include "MathUtils.hpp"
#include <algorithm>
#include <cmath>

using namespace Eigen;

DynamicsEngine::DynamicsEngine(const VehicleParams& params)
    : params_(params) {}

void DynamicsEngine::setState(const Vector3d& position,
                              const Vector3d& velocity,
                              double heading) {
    state_.position = position;
    state_.velocity = velocity;
    state_.acceleration.setZero();
    state_.heading = heading;
    state_.yaw_rate = 0.0;
}

// ================== Autopilot ==================
Vector3d DynamicsEngine::computeAutopilotControl(const Vector3d& target) const {
    const Vector3d delta = target - state_.position;

    Vector3d desired_velocity = params_.kp_position * delta - params_.kp_velocity * state_.velocity;
    desired_velocity = NavigationUtils::clampSymmetric(desired_velocity, params_.max_velocity);

    Vector3d acceleration = params_.velocity_tracking_gain * (desired_velocity - state_.velocity);
    acceleration = NavigationUtils::clampSymmetric(acceleration, params_.max_acceleration);

    Vector3d force = acceleration * params_.mass;
    force.z() += params_.mass * params_.gravity;  // Hover compensation
    return force;
}

// ================== Integration ==================
void DynamicsEngine::advance(double dt, const Vector3d& force) {
    Vector3d acceleration = force / params_.mass;
    acceleration.z() -= params_.gravity;

    // Linear drag on the horizontal axes only
    acceleration.x() -= params_.air_resistance * state_.velocity.x();
    acceleration.y() -= params_.air_resistance * state_.velocity.y();
    state_.acceleration = acceleration;

    state_.velocity += acceleration * dt;

    const double horizontal_speed = NavigationUtils::horizontalSpeed(state_.velocity);
    if (horizontal_speed > params_.max_velocity) {
        const double scale = params_.max_velocity / horizontal_speed;
        state_.velocity.x() *= scale;
        state_.velocity.y() *= scale;
    }

    state_.position += state_.velocity * dt;

    // Ground contact
    if (state_.position.z() < 0.0) {
        state_.position.z() = 0.0;
        state_.velocity.z() = std::max(0.0, state_.velocity.z());
    }

    // Heading is held at low speed to avoid atan2 jitter
    const double previous_heading = state_.heading;
    if (NavigationUtils::horizontalSpeed(state_.velocity) > params_.heading_speed_threshold) {
        state_.heading = std::atan2(state_.velocity.y(), state_.velocity.x());
    }
    state_.yaw_rate = dt > 0.0
        ? NavigationUtils::wrapToPi(state_.heading - previous_heading) / dt
        : 0.0;
}

void DynamicsEngine::step(double dt) {
    if (autopilot_active_ && target_waypoint_) {
        advance(dt, computeAutopilotControl(*target_waypoint_));
    } else {
        advance(dt);
    }
}

// ================== Geometry ==================
double DynamicsEngine::distanceToWaypoint(const Vector3d& waypoint) const {
    return NavigationUtils::distance3d(state_.position, waypoint);
}

double DynamicsEngine::headingToWaypoint(const Vector3d& waypoint) const {
    return std::atan2(waypoint.y() - state_.position.y(),
                      waypoint.x() - state_.position.x());
}
