/**
 * @file SaveResults.cpp
 * @brief Implementation of results saving utilities
 *
 * @author peanut-nav
 * @date Created: 2025-07-22
 * @last Modified: 2025-09-18
 * @version 0.5.0
 */

#include "SaveResults.hpp"
#include <fstream>
#include <iomanip>
#include <iostream>

/**
 * @brief Save the trajectory log
 *
 * Writes one fixed-width row per tick for offline plotting.
 */
bool SaveResults::saveTrajectory(const std::vector<TrajectoryEntry>& trajectory,
                                 const std::string& outputDir,
                                 const std::string& prefix) {
    const std::string fileName = prefix + "_trajectory.dat";
    std::ofstream outFile(outputDir + "/" + fileName);
    if (!outFile) {
        std::cerr << "Error: Unable to open output file: " << fileName << std::endl;
        return false;
    }

    outFile << std::fixed << std::setprecision(4);

    for (size_t i = 0; i < trajectory.size(); i++) {
        const TrajectoryEntry& e = trajectory[i];
        outFile << std::setw(8) << i + 1 << "   "           // Index
                << std::setw(10) << e.time << "  "          // Time (s)
                << std::setw(12) << e.true_x << "  "        // True x (m)
                << std::setw(12) << e.true_y << "  "        // True y (m)
                << std::setw(12) << e.est_x << "  "         // Estimated x (m)
                << std::setw(12) << e.est_y << "  "         // Estimated y (m)
                << std::setw(12) << e.error << "  "         // Horizontal error (m)
                << std::setw(10) << e.confidence << "  "    // Confidence (%)
                << std::setw(8) << toString(e.gps_status) << "  "
                << std::setw(8) << toString(e.nav_mode) << "\n";
    }

    outFile.close();
    std::cout << "Trajectory saved to " << fileName << std::endl;
    return true;
}

/**
 * @brief Save the run summary
 */
bool SaveResults::saveSummary(const SimulationResults& results,
                              const std::string& outputDir,
                              const std::string& prefix) {
    const std::string fileName = prefix + "_summary.dat";
    std::ofstream outFile(outputDir + "/" + fileName);
    if (!outFile) {
        std::cerr << "Error: Unable to open output file: " << fileName << std::endl;
        return false;
    }

    const MissionMetrics& m = results.metrics;
    const JammingAnalysis& j = results.jamming_analysis;

    outFile << std::fixed << std::setprecision(2);
    outFile << "# Mission metrics\n"
            << "status                   " << results.status << "\n"
            << "waypoints_reached        " << m.waypoints_reached << "\n"
            << "total_waypoints          " << m.total_waypoints << "\n"
            << "mission_success_rate     " << m.mission_success_rate << "\n"
            << "max_position_error       " << m.max_position_error << "\n"
            << "final_confidence         " << m.final_confidence << "\n"
            << "total_distance           " << m.total_distance << "\n";

    outFile << "# GPS jamming analysis\n"
            << "jam_start_time           " << j.jam_start_time << "\n"
            << "jam_end_time             " << j.jam_end_time << "\n"
            << "error_before_jam         " << j.error_before_jam << "\n"
            << "peak_error_during_jam    " << j.peak_error_during_jam << "\n"
            << "average_error_during_jam " << j.average_error_during_jam << "\n"
            << "error_after_recovery     " << j.error_after_recovery << "\n"
            << "recovery_time            " << j.recovery_time << "\n";

    outFile.close();
    std::cout << "Summary saved to " << fileName << std::endl;
    return true;
}
