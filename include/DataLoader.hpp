/**
 * @file DataLoader.hpp
 * @brief Mission data loading utilities
 *
 * Reads whitespace-separated numeric text files. Blank lines and lines
 * starting with '#' are ignored.
 *
 * Author: peanut-nav
 * Created: 2025-07-22
 * Last Modified: 2025-09-18
 * Version: 0.5.0
 */

#pragma once
#include "params/SimParamsBase.hpp"
#include <Eigen/Dense>
#include <string>
#include <vector>

/**
 * @brief Mission data loading class
 *
 * Handles loading of waypoint lists and jamming schedules from files.
 */
class DataLoader {
public:
    /**
     * @brief Load a waypoint list
     *
     * One waypoint per line: x y z (m).
     *
     * @param filePath Path to waypoint file
     * @return Waypoints in file order
     * @throws std::runtime_error if the file cannot be opened, a row is
     *         malformed, or no waypoint is present
     */
    static std::vector<Eigen::Vector3d> loadWaypoints(const std::string& filePath);

    /**
     * @brief Load the jamming schedule and mission duration
     *
     * A single data row: jamming_start jamming_end mission_duration (s).
     *
     * @param filePath Path to mission file
     * @param[out] mission Mission parameters to update
     * @throws std::runtime_error on open failure, malformed data, or an
     *         inconsistent schedule
     */
    static void loadMissionConfig(const std::string& filePath, MissionParams& mission);

private:
    /**
     * @brief Read the numeric rows of a data file, skipping comments
     *
     * @param filePath Path to data file
     * @param columns Required number of values per row
     */
    static std::vector<std::vector<double>> readRows(const std::string& filePath,
                                                     std::size_t columns);
};
