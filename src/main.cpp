/**
 * @file main.cpp
 * @brief Main application for the GPS-denial mission simulation
 *
 * Implements the main workflow: configuration loading, simulation run,
 * results saving and jamming performance report.
 *
 * Usage: jamnav_sim [duration] [seed] [dataDir] [outputDir]
 *
 * @author peanut-nav
 * @date Created: 2025-07-22
 * @last Modified: 2025-09-18
 * @version 0.5.0
 */

#include "SimulationParams.hpp"
#include "initializers/SimInitializer.hpp"
#include "core/MissionSimulation.hpp"
#include "SaveResults.hpp"
#include <exception>
#include <iomanip>
#include <iostream>
#include <string>

namespace {

constexpr double MAX_DURATION = 300.0;  ///< Longest run accepted from the command line (s)

}

int main(int argc, char** argv) {
    try {
        double duration = 90.0;
        unsigned int seed = 10;
        std::string dataDir = "../data";
        std::string outputDir = "../data";

        if (argc > 1) duration = std::stod(argv[1]);
        if (argc > 2) seed = static_cast<unsigned int>(std::stoul(argv[2]));
        if (argc > 3) dataDir = argv[3];
        if (argc > 4) outputDir = argv[4];

        if (duration <= 0.0) {
            std::cerr << "Error: Duration must be positive" << std::endl;
            return 1;
        }
        if (duration > MAX_DURATION) {
            std::cerr << "Error: Duration cannot exceed " << MAX_DURATION << " seconds" << std::endl;
            return 1;
        }

        // Load mission configuration
        std::cout << "=== GPS-Denied Navigation Simulation Startup ===" << std::endl;
        std::cout << "\nLoading mission configuration..." << std::endl;
        SimParams params = create_default_params();
        params.seed = seed;
        SimInitializer initializer;
        initializer.initialize_params(params, dataDir);

        std::cout << "System Configuration: " << std::endl;
        std::cout << "  Time Step: " << params.dt << " s" << std::endl;
        std::cout << "  Duration: " << duration << " s" << std::endl;
        std::cout << "  Seed: " << params.seed << std::endl;
        std::cout << "  Waypoints: " << params.mission.waypoints.size() << std::endl;
        std::cout << "  Jamming Window: " << params.mission.jamming_start_time << " - "
                  << params.mission.jamming_end_time << " s" << std::endl;
        std::cout << "  Jamming Strength: " << params.sensors.gps_jamming_strength << std::endl;

        // Run simulation
        std::cout << "\nRunning simulation..." << std::endl;
        MissionSimulation simulation(params);
        const SimulationResults results = simulation.run(duration);
        std::cout << "Simulation completed after " << simulation.getTime() << " s" << std::endl;

        // Save results
        std::cout << "\nSaving simulation results..." << std::endl;
        const bool saved = SaveResults::saveTrajectory(results.trajectory_data, outputDir) &&
                           SaveResults::saveSummary(results, outputDir);

        const MissionMetrics& m = results.metrics;
        const JammingAnalysis& j = results.jamming_analysis;

        std::cout << std::fixed << std::setprecision(2);
        std::cout << "\n===== Mission Metrics =====" << std::endl;
        std::cout << "Status: " << results.status << std::endl;
        std::cout << "Waypoints reached: " << m.waypoints_reached << " / " << m.total_waypoints << std::endl;
        std::cout << "Success rate: " << m.mission_success_rate << " %" << std::endl;
        std::cout << "Max position error: " << m.max_position_error << " m" << std::endl;
        std::cout << "Final confidence: " << m.final_confidence << " %" << std::endl;
        std::cout << "Total distance: " << m.total_distance << " m" << std::endl;

        std::cout << "\n===== GPS Jamming Analysis =====" << std::endl;
        std::cout << "Jamming window: " << j.jam_start_time << " - " << j.jam_end_time << " s" << std::endl;
        std::cout << "Error before jamming: " << j.error_before_jam << " m" << std::endl;
        std::cout << "Peak error during jamming: " << j.peak_error_during_jam << " m" << std::endl;
        std::cout << "Average error during jamming: " << j.average_error_during_jam << " m" << std::endl;
        std::cout << "Error after recovery: " << j.error_after_recovery << " m" << std::endl;
        std::cout << "Recovery time: " << j.recovery_time << " s" << std::endl;

        std::cout << "\n=== GPS-Denied Navigation Simulation Completed ===" << std::endl;
        return saved ? 0 : 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
