/**
 * @file MissionController.cpp
 * @brief Implementation of the mission state machine
 *
 * @author peanut-nav
 * @date Created: 2025-09-10
 * @last Modified: 2025-09-18
 * @version 0.5.0
 */

#include "core/MissionController.hpp"
#include "MathUtils.hpp"
#include <algorithm>
#include <numeric>
#include <stdexcept>

using namespace Eigen;

MissionController::MissionController(const MissionParams& params, double dt)
    : params_(params), dt_(dt) {
    if (params_.waypoints.empty()) {
        throw std::invalid_argument("Mission requires at least one waypoint");
    }
    if (dt_ <= 0.0) {
        throw std::invalid_argument("Mission time step must be positive");
    }
    refreshJammingState();
}

// ================== Tick Processing ==================
void MissionController::update(const Vector3d& current_position) {
    // Elapsed time is derived from the tick count to avoid summation drift
    ++ticks_;
    current_time_ = static_cast<double>(ticks_) * dt_;

    refreshJammingState();

    const double distance_to_waypoint =
        NavigationUtils::distance3d(current_position, getCurrentWaypoint());

    if (distance_to_waypoint < params_.waypoint_reached_threshold) {
        setWaypointReached();
    }

    // Coarse odometer, not the flown path length
    total_distance_ += distance_to_waypoint * dt_;

    if (current_time_ >= params_.mission_duration) {
        mission_active_ = false;
    }
}

void MissionController::refreshJammingState() {
    gps_jammed_ = isInJammingPeriod();
    navigation_mode_ = gps_jammed_ ? NavigationMode::SENSOR : NavigationMode::GPS;
}

void MissionController::updateError(double error) {
    max_error_ = std::max(max_error_, error);

    if (gps_jammed_) {
        error_during_jamming_.push_back(error);
    }
}

void MissionController::setWaypointReached() {
    if (current_waypoint_index_ < getTotalWaypoints() - 1) {
        current_waypoint_index_++;
        waypoints_reached_++;
    } else {
        mission_complete_ = true;
    }
}

const Vector3d& MissionController::getCurrentWaypoint() const {
    return params_.waypoints[current_waypoint_index_];
}

// ================== Mission Metrics ==================
double MissionController::getMissionProgress() const {
    const double time_progress = current_time_ / params_.mission_duration;
    const double waypoint_progress =
        static_cast<double>(waypoints_reached_) / getTotalWaypoints();

    return std::min(1.0, 0.7 * waypoint_progress + 0.3 * time_progress);
}

double MissionController::calculateSuccessRate() const {
    const double waypoint_score =
        (static_cast<double>(waypoints_reached_) / getTotalWaypoints()) * 80.0;
    const double error_score = std::max(0.0, 20.0 - max_error_ * 5.0);

    return std::min(1.0, (waypoint_score + error_score) / 100.0);
}

double MissionController::getRecoveryTime() const {
    if (error_during_jamming_.size() < 2) {
        return 0.0;
    }
    return params_.nominal_recovery_time;
}

double MissionController::getAverageErrorDuringJamming() const {
    if (error_during_jamming_.empty()) {
        return 0.0;
    }
    const double sum = std::accumulate(error_during_jamming_.begin(),
                                       error_during_jamming_.end(), 0.0);
    return sum / static_cast<double>(error_during_jamming_.size());
}

double MissionController::getPeakErrorDuringJamming() const {
    if (error_during_jamming_.empty()) {
        return 0.0;
    }
    return *std::max_element(error_during_jamming_.begin(), error_during_jamming_.end());
}

// ================== Jamming Window ==================
bool MissionController::isInJammingPeriod() const {
    return params_.jamming_start_time <= current_time_ &&
           current_time_ < params_.jamming_end_time;
}

double MissionController::timeUntilNextJamming() const {
    if (current_time_ < params_.jamming_start_time) {
        return params_.jamming_start_time - current_time_;
    }
    if (current_time_ < params_.jamming_end_time) {
        return 0.0;
    }
    return -1.0;
}

double MissionController::timeUntilJammingEnds() const {
    if (!isInJammingPeriod()) {
        return -1.0;
    }
    return params_.jamming_end_time - current_time_;
}

MissionStatus MissionController::getStatus() const {
    MissionStatus status;
    status.current_time = current_time_;
    status.mission_active = mission_active_;
    status.mission_complete = mission_complete_;
    status.current_waypoint = getCurrentWaypoint();
    status.current_waypoint_index = current_waypoint_index_;
    status.waypoints_reached = waypoints_reached_;
    status.total_waypoints = getTotalWaypoints();
    status.gps_jammed = gps_jammed_;
    status.navigation_mode = navigation_mode_;
    status.mission_progress = getMissionProgress();
    status.jamming_active = isInJammingPeriod();
    status.time_until_next_jamming = timeUntilNextJamming();
    status.time_until_jamming_ends = timeUntilJammingEnds();
    return status;
}
