/**
 * @file DataLoader.cpp
 * @brief Implementation of mission data loading utilities
 *
 * Author: peanut-nav
 * Created: 2025-07-22
 * Last Modified: 2025-09-18
 * Version: 0.5.0
 */

#include "DataLoader.hpp"
#include <fstream>
#include <sstream>
#include <stdexcept>

std::vector<std::vector<double>> DataLoader::readRows(const std::string& filePath,
                                                      std::size_t columns) {
    std::ifstream file(filePath);
    if (!file.is_open()) {
        throw std::runtime_error("Unable to open data file: " + filePath);
    }

    std::vector<std::vector<double>> rows;
    std::string line;
    int lineNumber = 0;
    while (std::getline(file, line)) {
        lineNumber++;

        const auto first = line.find_first_not_of(" \t\r");
        if (first == std::string::npos || line[first] == '#') {
            continue;
        }

        std::istringstream iss(line);
        std::vector<double> row;
        double value;
        while (iss >> value) {
            row.push_back(value);
        }
        // Stopped on something that is not a number
        if (!iss.eof()) {
            throw std::runtime_error("Invalid data in " + filePath +
                                     " at line " + std::to_string(lineNumber));
        }
        if (row.size() != columns) {
            throw std::runtime_error("Expected " + std::to_string(columns) +
                                     " values in " + filePath +
                                     " at line " + std::to_string(lineNumber));
        }
        rows.push_back(row);
    }

    return rows;
}

std::vector<Eigen::Vector3d> DataLoader::loadWaypoints(const std::string& filePath) {
    const auto rows = readRows(filePath, 3);
    if (rows.empty()) {
        throw std::runtime_error("No waypoints found in " + filePath);
    }

    std::vector<Eigen::Vector3d> waypoints;
    waypoints.reserve(rows.size());
    for (const auto& row : rows) {
        waypoints.emplace_back(row[0], row[1], row[2]);
    }
    return waypoints;
}

void DataLoader::loadMissionConfig(const std::string& filePath, MissionParams& mission) {
    const auto rows = readRows(filePath, 3);
    if (rows.size() != 1) {
        throw std::runtime_error("Expected exactly one schedule row in " + filePath);
    }

    const double jamStart = rows[0][0];
    const double jamEnd = rows[0][1];
    const double duration = rows[0][2];

    if (jamStart < 0.0 || jamEnd < jamStart) {
        throw std::runtime_error("Invalid jamming window in " + filePath);
    }
    if (duration <= 0.0) {
        throw std::runtime_error("Mission duration must be positive in " + filePath);
    }

    mission.jamming_start_time = jamStart;
    mission.jamming_end_time = jamEnd;
    mission.mission_duration = duration;
}
