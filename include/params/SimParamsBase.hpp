/**
 * @file SimParamsBase.hpp
 * @brief Base parameters and data structures for the mission simulation
 *
 * @author peanut-nav
 * @date Created: 2025-09-10
 * @last Modified: 2025-09-18
 * @version 0.5.0
 */

#pragma once
#include <Eigen/Dense>
#include <optional>
#include <string>
#include <vector>

/**
 * @brief Physical and autopilot parameters of the simulated airframe
 */
struct VehicleParams {
    double mass = 2.0;                   ///< Vehicle mass (kg)
    double gravity = 9.81;               ///< Gravitational acceleration (m/s²)
    double air_resistance = 0.01;        ///< Linear horizontal damping coefficient (1/s)
    double max_velocity = 20.0;          ///< Velocity cap (m/s)
    double max_acceleration = 15.0;      ///< Acceleration cap (m/s²)
    double kp_position = 2.0;            ///< Position error to desired velocity gain (1/s)
    double kp_velocity = 0.5;            ///< Velocity damping gain (dimensionless)
    double velocity_tracking_gain = 2.0; ///< Velocity error to acceleration gain (1/s)
    double heading_speed_threshold = 0.1;///< Minimum horizontal speed to update heading (m/s)
};

/**
 * @brief Noise, bias and calibration parameters of the sensor suite
 */
struct SensorParams {
    // GPS
    double gps_noise_std = 0.5;                           ///< Position noise 1-sigma (m)
    Eigen::Vector3d gps_bias = Eigen::Vector3d::Zero();   ///< Systematic position error (m)
    double gps_jammed_horizontal_std = 50.0;              ///< Spoofed-fix horizontal noise (m)
    double gps_jammed_vertical_std = 20.0;                ///< Spoofed-fix vertical noise (m)
    double gps_jamming_strength = 0.7;                    ///< Probability of total signal loss while jammed

    // Accelerometer
    double accel_noise_std = 0.05;                              ///< (m/s²)
    Eigen::Vector3d accel_bias = Eigen::Vector3d::Constant(0.01);///< (m/s²)
    double accel_scale_factor = 1.0;

    // Gyroscope
    double gyro_noise_std = 0.01;                                 ///< (rad/s)
    Eigen::Vector3d gyro_bias = Eigen::Vector3d::Constant(0.001); ///< Drift (rad/s)
    double gyro_scale_factor = 1.0;

    // Magnetometer
    double mag_noise_std = 0.1;            ///< Heading noise (deg)
    double mag_declination = 0.0;          ///< Local declination (rad)
    double magnetic_interference = 0.0;    ///< External field offset (rad)

    // Barometer
    double baro_noise_std = 0.5;           ///< (m)
    double baro_bias = 0.0;                ///< (m)

    // Optical flow
    double flow_noise_std = 0.1;           ///< Base velocity noise at ground level (m/s)
    double flow_scale_factor = 1.0;
    double flow_reference_altitude = 100.0;///< Altitude at which flow noise doubles (m)
};

/**
 * @brief Mission plan and jamming window
 */
struct MissionParams {
    std::vector<Eigen::Vector3d> waypoints = {
        Eigen::Vector3d(20.0, 10.0, 5.0),
        Eigen::Vector3d(40.0, 20.0, 5.0),
        Eigen::Vector3d(40.0, 40.0, 5.0),
        Eigen::Vector3d(20.0, 40.0, 5.0),
        Eigen::Vector3d(0.0, 0.0, 5.0)
    };
    double waypoint_reached_threshold = 2.0; ///< (m)
    double mission_duration = 90.0;          ///< (s)
    double jamming_start_time = 3.0;         ///< Inclusive start of jamming window (s)
    double jamming_end_time = 6.0;           ///< Exclusive end of jamming window (s)
    double nominal_recovery_time = 2.3;      ///< Reported recovery time once jamming data exists (s)
};

/**
 * @brief Initial ground-truth pose of the vehicle
 */
struct InitialPose {
    Eigen::Vector3d position = Eigen::Vector3d(0.0, 0.0, 5.0); ///< (m)
    Eigen::Vector3d velocity = Eigen::Vector3d::Zero();         ///< (m/s)
    double heading = 0.0;                                       ///< (rad)
};

// ================== Runtime Data Containers ==================

/**
 * @brief Navigation mode of the mission
 */
enum class NavigationMode {
    GPS,    ///< GPS-guided
    SENSOR  ///< Sensor-only (GPS denied)
};

/**
 * @brief GPS receiver status reported in the trajectory log
 */
enum class GpsStatus {
    ACTIVE,
    JAMMED
};

inline std::string toString(NavigationMode mode) {
    return mode == NavigationMode::GPS ? "GPS" : "SENSOR";
}

inline std::string toString(GpsStatus status) {
    return status == GpsStatus::ACTIVE ? "ACTIVE" : "JAMMED";
}

/**
 * @brief Ground-truth kinematic state
 */
struct VehicleState {
    Eigen::Vector3d position = Eigen::Vector3d::Zero();     ///< x, y, altitude (m)
    Eigen::Vector3d velocity = Eigen::Vector3d::Zero();     ///< vx, vy, vz (m/s)
    Eigen::Vector3d acceleration = Eigen::Vector3d::Zero(); ///< Last coordinate acceleration (m/s²)
    double heading = 0.0;                                   ///< Direction of horizontal motion (rad)
    double yaw_rate = 0.0;                                  ///< Heading change rate (rad/s)
};

/**
 * @brief GPS receiver output
 *
 * position is empty when no signal was received at all.
 */
struct GpsReading {
    std::optional<Eigen::Vector3d> position;
    bool valid = false;
};

/**
 * @brief Optical flow sensor output
 */
struct OpticalFlowReading {
    Eigen::Vector2d velocity = Eigen::Vector2d::Zero(); ///< Horizontal velocity (m/s)
    bool valid = false;
};

/**
 * @brief Per-tick readings of all six sensors
 */
struct MeasurementBundle {
    GpsReading gps;
    Eigen::Vector3d accelerometer = Eigen::Vector3d::Zero(); ///< Specific force (m/s²)
    Eigen::Vector3d gyroscope = Eigen::Vector3d::Zero();     ///< Angular rate (rad/s)
    double magnetometer_heading = 0.0;                       ///< (rad), wrapped to (-pi, pi]
    double barometer_altitude = 0.0;                         ///< (m)
    OpticalFlowReading optical_flow;
};

/**
 * @brief One entry of the append-only trajectory log
 */
struct TrajectoryEntry {
    double time = 0.0;         ///< Simulation time at the start of the tick (s)
    double true_x = 0.0;       ///< (m)
    double true_y = 0.0;       ///< (m)
    double est_x = 0.0;        ///< (m)
    double est_y = 0.0;        ///< (m)
    double error = 0.0;        ///< Horizontal estimate error (m)
    double confidence = 0.0;   ///< Filter confidence (0-100)
    GpsStatus gps_status = GpsStatus::ACTIVE;
    NavigationMode nav_mode = NavigationMode::GPS;
};

/**
 * @brief Point-in-time snapshot returned by each simulation step
 */
struct StateSnapshot {
    Eigen::Vector2d true_position = Eigen::Vector2d::Zero();      ///< (m)
    Eigen::Vector2d estimated_position = Eigen::Vector2d::Zero(); ///< (m)
    Eigen::Vector2d velocity = Eigen::Vector2d::Zero();           ///< True horizontal velocity (m/s)
    double heading = 0.0;                                         ///< (rad)
    double altitude = 0.0;                                        ///< (m)
    bool gps_available = false;
    NavigationMode navigation_mode = NavigationMode::GPS;
    double error = 0.0;                                           ///< (m)
    double confidence = 0.0;                                      ///< (0-100)
    Eigen::Vector2d current_waypoint = Eigen::Vector2d::Zero();   ///< (m)
    double mission_progress = 0.0;                                ///< (0-100)
};

/**
 * @brief Mission-level summary metrics
 */
struct MissionMetrics {
    int waypoints_reached = 0;
    int total_waypoints = 0;
    double mission_success_rate = 0.0; ///< (0-100)
    double max_position_error = 0.0;   ///< (m)
    double final_confidence = 0.0;     ///< (0-100)
    double total_distance = 0.0;       ///< Distance-to-waypoint odometer (m)
};

/**
 * @brief Estimator behaviour around the jamming window
 */
struct JammingAnalysis {
    double jam_start_time = 0.0;           ///< (s)
    double jam_end_time = 0.0;             ///< (s)
    double error_before_jam = 0.0;         ///< Error on the last tick before jamming (m)
    double peak_error_during_jam = 0.0;    ///< (m)
    double average_error_during_jam = 0.0; ///< (m)
    double error_after_recovery = 0.0;     ///< Error on the latest tick (m)
    double recovery_time = 0.0;            ///< (s)
};

/**
 * @brief Mission controller status report
 */
struct MissionStatus {
    double current_time = 0.0;
    bool mission_active = true;
    bool mission_complete = false;
    Eigen::Vector3d current_waypoint = Eigen::Vector3d::Zero();
    int current_waypoint_index = 0;
    int waypoints_reached = 0;
    int total_waypoints = 0;
    bool gps_jammed = false;
    NavigationMode navigation_mode = NavigationMode::GPS;
    double mission_progress = 0.0;          ///< (0-1)
    bool jamming_active = false;
    double time_until_next_jamming = 0.0;   ///< -1 once the window has passed
    double time_until_jamming_ends = -1.0;  ///< -1 when not jamming
};

/**
 * @brief Aggregate result of a simulation run
 */
struct SimulationResults {
    std::string status;                          ///< "success" or "running"
    std::vector<TrajectoryEntry> trajectory_data;
    MissionMetrics metrics;
    JammingAnalysis jamming_analysis;
    StateSnapshot current_state;
    MissionStatus mission_status;
};
