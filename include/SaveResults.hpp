/**
 * @file SaveResults.hpp
 * @brief Simulation results saving utilities
 *
 * Provides functionality to save the trajectory log and the run summary
 * to output files.
 *
 * @author peanut-nav
 * @date Created: 2025-07-22
 * @last Modified: 2025-09-18
 * @version 0.5.0
 */

#pragma once
#include "params/SimParamsBase.hpp"
#include <string>
#include <vector>

/**
 * @brief Simulation results saving class
 */
class SaveResults {
public:
    /**
     * @brief Save the trajectory log to <outputDir>/<prefix>_trajectory.dat
     *
     * @param trajectory Trajectory entries in tick order
     * @param outputDir Destination directory
     * @param prefix Filename prefix (default: "SIM")
     * @return false if the file could not be opened
     */
    static bool saveTrajectory(const std::vector<TrajectoryEntry>& trajectory,
                               const std::string& outputDir,
                               const std::string& prefix = "SIM");

    /**
     * @brief Save metrics and jamming analysis to <outputDir>/<prefix>_summary.dat
     *
     * @param results Results of a completed run
     * @param outputDir Destination directory
     * @param prefix Filename prefix (default: "SIM")
     * @return false if the file could not be opened
     */
    static bool saveSummary(const SimulationResults& results,
                            const std::string& outputDir,
                            const std::string& prefix = "SIM");
};
