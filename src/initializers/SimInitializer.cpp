/**
 * @file SimInitializer.cpp
 * @brief Implementation of the simulation initializer
 *
 * @author peanut-nav
 * @date Created: 2025-09-10
 * @last Modified: 2025-09-18
 * @version 0.5.0
 */

#include "initializers/SimInitializer.hpp"
#include "DataLoader.hpp"
#include <filesystem>
#include <iostream>

namespace fs = std::filesystem;

// Initialize simulation parameters from the data directory
void SimInitializer::initialize_params(SimParams& params, const std::string& dataDir) const {
    const fs::path dir(dataDir);

    const fs::path waypointFile = dir / "waypoints.dat";
    if (fs::exists(waypointFile)) {
        params.mission.waypoints = DataLoader::loadWaypoints(waypointFile.string());
        std::cout << "  Loaded " << params.mission.waypoints.size()
                  << " waypoints from " << waypointFile.string() << std::endl;
    } else {
        std::cout << "  No waypoints.dat found, using default route" << std::endl;
    }

    const fs::path missionFile = dir / "mission.dat";
    if (fs::exists(missionFile)) {
        DataLoader::loadMissionConfig(missionFile.string(), params.mission);
        std::cout << "  Loaded jamming schedule from " << missionFile.string() << std::endl;
    } else {
        std::cout << "  No mission.dat found, using default jamming schedule" << std::endl;
    }
}

// Place the vehicle at the configured initial pose
void SimInitializer::initialize_state(DynamicsEngine& dynamics, const SimParams& params) const {
    const InitialPose& pose = params.initial_pose;
    dynamics.setState(pose.position, pose.velocity, pose.heading);
}

// Start the estimator at the true horizontal pose
void SimInitializer::initialize_filter(KfEstimator& estimator, const SimParams& params) const {
    const InitialPose& pose = params.initial_pose;
    estimator.setState(pose.position.x(), pose.position.y(),
                       pose.velocity.x(), pose.velocity.y());
}
