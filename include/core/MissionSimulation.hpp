/**
 * @file MissionSimulation.hpp
 * @brief Closed-loop GPS-denial simulation
 *
 * Couples the vehicle dynamics, the sensor suite, the Kalman estimator and
 * the mission controller into a fixed-step loop. Each tick samples the
 * sensors at the current truth, fuses what is valid, flies the vehicle one
 * step toward the active waypoint and records the estimate error.
 *
 * @author peanut-nav
 * @date Created: 2025-09-10
 * @last Modified: 2025-09-18
 * @version 0.5.0
 */

#pragma once
#include "SimulationParams.hpp"
#include "core/DynamicsEngine.hpp"
#include "core/KfEstimator.hpp"
#include "core/MissionController.hpp"
#include "core/SensorModel.hpp"
#include <vector>

class MissionSimulation {
public:
    /**
     * @brief Default scenario: five waypoints, jamming from 3 s to 6 s
     */
    MissionSimulation();

    /**
     * @brief Build a simulation from explicit parameters
     *
     * @throws std::invalid_argument if dt <= 0 or there are no waypoints
     */
    explicit MissionSimulation(const SimParams& params);

    /**
     * @brief Advance the simulation by one tick
     *
     * @return Snapshot of the tick, reported against the truth at tick start
     */
    const StateSnapshot& step();

    /**
     * @brief Step until duration has elapsed or the mission is inactive
     *
     * @param duration Simulated time to run (s)
     * @return Aggregate results
     * @throws std::invalid_argument if duration <= 0
     */
    SimulationResults run(double duration);

    SimulationResults getResults() const;
    MissionMetrics getMetrics() const;
    JammingAnalysis getJammingAnalysis() const;

    const StateSnapshot& getCurrentState() const { return current_state_; }
    const std::vector<TrajectoryEntry>& getTrajectoryData() const { return trajectory_; }

    double getTime() const { return static_cast<double>(tick_count_) * params_.dt; }
    long getTickCount() const { return tick_count_; }

    const SimParams& getParams() const { return params_; }
    const DynamicsEngine& getDynamics() const { return dynamics_; }
    const SensorModel& getSensors() const { return sensors_; }
    const KfEstimator& getEstimator() const { return estimator_; }
    const MissionController& getMission() const { return mission_; }

private:
    SimParams params_;

    DynamicsEngine dynamics_;
    SensorModel sensors_;
    KfEstimator estimator_;
    MissionController mission_;

    long tick_count_ = 0;
    StateSnapshot current_state_;
    std::vector<TrajectoryEntry> trajectory_;
};
