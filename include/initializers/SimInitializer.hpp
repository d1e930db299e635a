/**
 * @file SimInitializer.hpp
 * @brief Simulation system initializer
 *
 * Handles loading of mission configuration from a data directory and
 * seeding of the vehicle dynamics and estimator from the initial pose.
 *
 * @author peanut-nav
 * @date Created: 2025-09-10
 * @last Modified: 2025-09-18
 * @version 0.5.0
 */

#pragma once
#include "../SimulationParams.hpp"
#include "../core/DynamicsEngine.hpp"
#include "../core/KfEstimator.hpp"
#include <string>

/**
 * @brief Initializes simulation components
 *
 * Responsible for:
 * - Loading waypoints and the jamming schedule from files
 * - Placing the vehicle at its initial pose
 * - Aligning the estimator with the initial pose
 */
class SimInitializer {
public:
    SimInitializer() = default;

    /**
     * @brief Initializes simulation parameters
     *
     * Reads waypoints.dat and mission.dat from dataDir when they exist;
     * missing files leave the defaults in place.
     *
     * @param params Parameter container to populate
     * @param dataDir Directory containing mission data files
     * @throws std::runtime_error if a present file is malformed
     */
    void initialize_params(SimParams& params, const std::string& dataDir) const;

    /**
     * @brief Places the vehicle at the initial pose
     * @param dynamics Dynamics engine to initialize
     * @param params Simulation parameters
     */
    void initialize_state(DynamicsEngine& dynamics, const SimParams& params) const;

    /**
     * @brief Sets the estimator state to the initial horizontal pose
     * @param estimator Estimator to initialize
     * @param params Simulation parameters
     */
    void initialize_filter(KfEstimator& estimator, const SimParams& params) const;
};
