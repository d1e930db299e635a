/**
 * @file MissionController.hpp
 * @brief Waypoint sequencing, jamming window and mission statistics
 *
 * Tracks elapsed mission time in whole ticks, switches between GPS-guided
 * and sensor-only navigation exactly at the jamming window boundaries,
 * advances the active waypoint when the vehicle comes within the reached
 * threshold, and accumulates the error statistics used for reporting.
 *
 * @author peanut-nav
 * @date Created: 2025-09-10
 * @last Modified: 2025-09-18
 * @version 0.5.0
 */

#pragma once
#include "params/SimParamsBase.hpp"
#include <Eigen/Dense>
#include <vector>

class MissionController {
public:
    /**
     * @brief Construct the mission
     *
     * @param params Waypoints, thresholds and jamming window
     * @param dt Tick length (s)
     * @throws std::invalid_argument if there are no waypoints or dt <= 0
     */
    MissionController(const MissionParams& params, double dt);

    /**
     * @brief Advance mission time by one tick and process the vehicle position
     *
     * @param current_position Ground-truth position (m)
     */
    void update(const Eigen::Vector3d& current_position);

    /**
     * @brief Record the estimate error for this tick
     */
    void updateError(double error);

    /**
     * @brief Mark the active waypoint reached
     *
     * Moves to the next waypoint, or completes the mission at the last one.
     */
    void setWaypointReached();

    const Eigen::Vector3d& getCurrentWaypoint() const;

    /**
     * @brief Progress in [0, 1]: 70% waypoints reached, 30% elapsed time
     */
    double getMissionProgress() const;

    /**
     * @brief Success rate in [0, 1]: 80% waypoint completion, 20% peak error
     */
    double calculateSuccessRate() const;

    /**
     * @brief Reported time for the filter to recover after jamming (s)
     *
     * Nominal constant once at least two jammed error samples exist, else 0.
     */
    double getRecoveryTime() const;

    double getAverageErrorDuringJamming() const;
    double getPeakErrorDuringJamming() const;

    bool isInJammingPeriod() const;

    /// Seconds until the jamming window opens; 0 while jamming, -1 after it
    double timeUntilNextJamming() const;

    /// Seconds until the jamming window closes; -1 when not jamming
    double timeUntilJammingEnds() const;

    MissionStatus getStatus() const;

    void setNavigationMode(NavigationMode mode) { navigation_mode_ = mode; }
    NavigationMode getNavigationMode() const { return navigation_mode_; }

    double getCurrentTime() const { return current_time_; }
    int getCurrentWaypointIndex() const { return current_waypoint_index_; }
    int getWaypointsReached() const { return waypoints_reached_; }
    int getTotalWaypoints() const { return static_cast<int>(params_.waypoints.size()); }
    double getTotalDistance() const { return total_distance_; }
    double getMaxError() const { return max_error_; }
    const std::vector<double>& getErrorDuringJamming() const { return error_during_jamming_; }

    bool isGpsJammed() const { return gps_jammed_; }
    bool isMissionActive() const { return mission_active_; }
    bool isMissionComplete() const { return mission_complete_; }

    const MissionParams& getParams() const { return params_; }

private:
    /**
     * @brief Recompute the jammed flag and navigation mode from elapsed time
     */
    void refreshJammingState();

    MissionParams params_;
    double dt_;

    long ticks_ = 0;
    double current_time_ = 0.0;
    int current_waypoint_index_ = 0;

    bool gps_jammed_ = false;
    NavigationMode navigation_mode_ = NavigationMode::GPS;
    bool mission_active_ = true;
    bool mission_complete_ = false;

    double total_distance_ = 0.0;
    int waypoints_reached_ = 0;
    double max_error_ = 0.0;
    std::vector<double> error_during_jamming_;
};
