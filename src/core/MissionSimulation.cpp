/**
 * @file MissionSimulation.cpp
 * @brief Implementation of the closed-loop simulation tick
 *
 * @author peanut-nav
 * @date Created: 2025-09-10
 * @last Modified: 2025-09-18
 * @version 0.5.0
 */

#include "core/MissionSimulation.hpp"
#include "initializers/SimInitializer.hpp"
#include "MathUtils.hpp"
#include <cmath>
#include <random>
#include <stdexcept>

using namespace Eigen;

MissionSimulation::MissionSimulation()
    : MissionSimulation(create_default_params()) {}

MissionSimulation::MissionSimulation(const SimParams& params)
    : params_(params),
      dynamics_(params.vehicle),
      sensors_(params.sensors, std::mt19937(params.seed)),
      estimator_(params.filter, params.dt),
      mission_(params.mission, params.dt) {
    SimInitializer initializer;
    initializer.initialize_state(dynamics_, params_);
    initializer.initialize_filter(estimator_, params_);

    dynamics_.setWaypoint(mission_.getCurrentWaypoint());
    dynamics_.setAutopilotActive(true);
}

// ================== Simulation Tick ==================
const StateSnapshot& MissionSimulation::step() {
    const double time = getTime();

    // Everything this tick is reported against the truth at tick start
    const VehicleState truth = dynamics_.getState();

    estimator_.predict();

    sensors_.setGpsJamming(mission_.isGpsJammed(), params_.sensors.gps_jamming_strength);
    const MeasurementBundle measurements =
        sensors_.measureAll(truth, params_.dt, params_.vehicle.gravity);

    const bool gps_valid = measurements.gps.valid && measurements.gps.position.has_value();
    if (gps_valid) {
        const Vector3d& fix = *measurements.gps.position;
        estimator_.updateGps(fix.x(), fix.y(), fix.z());
        mission_.setNavigationMode(NavigationMode::GPS);
    } else {
        mission_.setNavigationMode(NavigationMode::SENSOR);
    }
    const NavigationMode tick_mode = mission_.getNavigationMode();

    if (measurements.optical_flow.valid) {
        estimator_.updateOpticalFlow(measurements.optical_flow.velocity.x(),
                                     measurements.optical_flow.velocity.y());
    }

    dynamics_.setWaypoint(mission_.getCurrentWaypoint());
    dynamics_.step(params_.dt);

    mission_.update(truth.position);

    const Vector2d estimate = estimator_.getPosition();
    const Vector2d true_xy = truth.position.head<2>();
    const double error = NavigationUtils::distance2d(estimate, true_xy);
    mission_.updateError(error);

    const double confidence = estimator_.getConfidence() * 100.0;

    current_state_.true_position = true_xy;
    current_state_.estimated_position = estimate;
    current_state_.velocity = truth.velocity.head<2>();
    current_state_.heading = truth.heading;
    current_state_.altitude = truth.position.z();
    current_state_.gps_available = gps_valid;
    current_state_.navigation_mode = tick_mode;
    current_state_.error = error;
    current_state_.confidence = confidence;
    current_state_.current_waypoint = mission_.getCurrentWaypoint().head<2>();
    current_state_.mission_progress = mission_.getMissionProgress() * 100.0;

    TrajectoryEntry entry;
    entry.time = time;
    entry.true_x = true_xy.x();
    entry.true_y = true_xy.y();
    entry.est_x = estimate.x();
    entry.est_y = estimate.y();
    entry.error = error;
    entry.confidence = confidence;
    entry.gps_status = gps_valid ? GpsStatus::ACTIVE : GpsStatus::JAMMED;
    entry.nav_mode = tick_mode;
    trajectory_.push_back(entry);

    ++tick_count_;
    return current_state_;
}

SimulationResults MissionSimulation::run(double duration) {
    if (!(duration > 0.0)) {
        throw std::invalid_argument("Simulation duration must be positive");
    }

    const long num_steps = std::lround(duration / params_.dt);
    for (long i = 0; i < num_steps; i++) {
        step();
        if (!mission_.isMissionActive()) {
            break;
        }
    }

    return getResults();
}

// ================== Results ==================
MissionMetrics MissionSimulation::getMetrics() const {
    MissionMetrics metrics;
    metrics.waypoints_reached = mission_.getWaypointsReached();
    metrics.total_waypoints = mission_.getTotalWaypoints();
    metrics.mission_success_rate = mission_.calculateSuccessRate() * 100.0;
    metrics.max_position_error = mission_.getMaxError();
    metrics.final_confidence = estimator_.getConfidence() * 100.0;
    metrics.total_distance = mission_.getTotalDistance();
    return metrics;
}

JammingAnalysis MissionSimulation::getJammingAnalysis() const {
    const MissionParams& mission = params_.mission;

    JammingAnalysis analysis;
    analysis.jam_start_time = mission.jamming_start_time;
    analysis.jam_end_time = mission.jamming_end_time;

    // Last tick before the window opens
    const long before_index = std::lround(mission.jamming_start_time / params_.dt) - 1;
    if (before_index >= 0 && before_index < static_cast<long>(trajectory_.size())) {
        analysis.error_before_jam = trajectory_[before_index].error;
    }

    analysis.peak_error_during_jam = mission_.getPeakErrorDuringJamming();
    analysis.average_error_during_jam = mission_.getAverageErrorDuringJamming();

    if (!trajectory_.empty()) {
        analysis.error_after_recovery = trajectory_.back().error;
    }
    analysis.recovery_time = mission_.getRecoveryTime();
    return analysis;
}

SimulationResults MissionSimulation::getResults() const {
    SimulationResults results;
    results.status = mission_.isMissionComplete() ? "success" : "running";
    results.trajectory_data = trajectory_;
    results.metrics = getMetrics();
    results.jamming_analysis = getJammingAnalysis();
    results.current_state = current_state_;
    results.mission_status = mission_.getStatus();
    return results;
}
