/**
 * @file SensorModel.hpp
 * @brief Noisy multi-sensor measurement model with GPS jamming
 *
 * Derives GPS, accelerometer, gyroscope, magnetometer, barometer and optical
 * flow readings from ground truth. Every reading draws independent
 * zero-mean Gaussian noise from a seeded generator owned by the model, so
 * two models constructed with the same seed produce identical sequences.
 *
 * While jammed the GPS receiver either loses the signal completely or
 * reports a grossly perturbed fix; neither outcome is marked valid.
 *
 * @author peanut-nav
 * @date Created: 2025-09-10
 * @last Modified: 2025-09-18
 * @version 0.5.0
 */

#pragma once
#include "params/SimParamsBase.hpp"
#include <Eigen/Dense>
#include <random>

class SensorModel {
public:
    /**
     * @brief Construct the sensor suite
     *
     * @param params Noise, bias and calibration parameters
     * @param rng Random engine used for every noise draw
     */
    SensorModel(const SensorParams& params, std::mt19937 rng);

    /**
     * @brief Enable or disable GPS jamming
     *
     * @param jammed Jamming active
     * @param strength Probability of complete signal loss, clamped to [0, 1]
     */
    void setGpsJamming(bool jammed, double strength);

    bool isGpsJammed() const { return gps_jammed_; }
    double getJammingStrength() const { return gps_jamming_strength_; }

    /**
     * @brief Sample the GPS receiver
     *
     * @param true_position Ground-truth position (m)
     * @return Reading; valid only when not jammed
     */
    GpsReading measureGps(const Eigen::Vector3d& true_position);

    /**
     * @brief Sample the accelerometer
     *
     * Gravity is removed from the vertical axis before scale and bias are
     * applied, the sensor reports specific force.
     *
     * @param true_acceleration Coordinate acceleration (m/s²)
     * @param gravity Gravitational acceleration (m/s²)
     */
    Eigen::Vector3d measureAccelerometer(const Eigen::Vector3d& true_acceleration,
                                         double gravity = 9.81);

    /**
     * @brief Sample the gyroscope and integrate the attitude-drift accumulator
     *
     * @param true_angular_rate Body angular rate (rad/s)
     * @param dt Integration interval for the drift accumulator (s)
     */
    Eigen::Vector3d measureGyroscope(const Eigen::Vector3d& true_angular_rate, double dt);

    /**
     * @brief Sample the magnetometer heading, wrapped to (-pi, pi]
     */
    double measureMagnetometer(double true_heading);

    /**
     * @brief Sample the barometric altitude, floored at zero
     */
    double measureBarometer(double true_altitude);

    /**
     * @brief Sample the optical flow sensor
     *
     * Noise grows with altitude up to twice the base value at the reference
     * altitude.
     */
    OpticalFlowReading measureOpticalFlow(const Eigen::Vector2d& true_velocity, double altitude);

    /**
     * @brief Sample all six sensors for one tick
     *
     * @param truth Ground-truth vehicle state
     * @param dt Tick length (s)
     * @param gravity Gravitational acceleration (m/s²)
     */
    MeasurementBundle measureAll(const VehicleState& truth, double dt, double gravity = 9.81);

    /// Integrated gyroscope output (rad), informational only
    const Eigen::Vector3d& getGyroIntegral() const { return gyro_integral_; }

    void resetGyroIntegral() { gyro_integral_.setZero(); }

    const Eigen::Vector3d& lastAccelerometer() const { return last_accel_; }

    const SensorParams& getParams() const { return params_; }

private:
    double gaussian(double stddev);

    SensorParams params_;
    std::mt19937 rng_;
    std::normal_distribution<double> normal_{0.0, 1.0};
    std::uniform_real_distribution<double> uniform_{0.0, 1.0};

    bool gps_jammed_ = false;
    double gps_jamming_strength_ = 0.0;

    Eigen::Vector3d gyro_integral_ = Eigen::Vector3d::Zero();
    Eigen::Vector3d last_accel_ = Eigen::Vector3d::Zero();
};
