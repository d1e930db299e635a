/**
 * @file SimulationParams.hpp
 * @brief Aggregation header for simulation parameters
 *
 * @author peanut-nav
 * @date Created: 2025-07-22
 * @last Modified: 2025-09-18
 * @version 0.5.0
 */

#pragma once
#include "params/SimParamsBase.hpp"
#include "params/KfParams.hpp"

/**
 * @brief Complete configuration of one simulation instance
 */
struct SimParams {
    double dt = 0.1;          ///< Fixed simulation time step (s)
    unsigned int seed = 10;   ///< Sensor noise generator seed

    VehicleParams vehicle;
    SensorParams sensors;
    FilterParams filter;
    MissionParams mission;
    InitialPose initial_pose;
};

/**
 * @brief Create the default mission configuration
 *
 * Five-waypoint loop, jamming between 3 s and 6 s, vehicle at the origin
 * holding 5 m altitude, 0.1 s time step.
 */
inline SimParams create_default_params() {
    return SimParams{};
}
