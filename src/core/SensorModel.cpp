/**
 * @file SensorModel.cpp
 * @brief Implementation of the noisy multi-sensor measurement model
 *
 * @author peanut-nav
 * @date Created: 2025-09-10
 * @last Modified: 2025-09-18
 * @version 0.5.0
 */

#include "core/SensorModel.hpp"
#include "MathUtils.hpp"
#include <algorithm>
#include <utility>

using namespace Eigen;

SensorModel::SensorModel(const SensorParams& params, std::mt19937 rng)
    : params_(params), rng_(std::move(rng)) {}

void SensorModel::setGpsJamming(bool jammed, double strength) {
    gps_jammed_ = jammed;
    gps_jamming_strength_ = std::max(0.0, std::min(1.0, strength));
}

double SensorModel::gaussian(double stddev) {
    return stddev * normal_(rng_);
}

// ================== GPS ==================
GpsReading SensorModel::measureGps(const Vector3d& true_position) {
    GpsReading reading;

    if (gps_jammed_) {
        if (uniform_(rng_) < gps_jamming_strength_) {
            return reading;  // No signal
        }
        // Spoofed or multipath-corrupted fix, never trusted
        Vector3d bad = true_position;
        bad.x() += gaussian(params_.gps_jammed_horizontal_std);
        bad.y() += gaussian(params_.gps_jammed_horizontal_std);
        bad.z() += gaussian(params_.gps_jammed_vertical_std);
        reading.position = bad;
        return reading;
    }

    Vector3d fix = true_position + params_.gps_bias;
    fix.x() += gaussian(params_.gps_noise_std);
    fix.y() += gaussian(params_.gps_noise_std);
    fix.z() += gaussian(params_.gps_noise_std);
    reading.position = fix;
    reading.valid = true;
    return reading;
}

// ================== Inertial ==================
Vector3d SensorModel::measureAccelerometer(const Vector3d& true_acceleration, double gravity) {
    Vector3d specific_force = true_acceleration;
    specific_force.z() -= gravity;

    Vector3d accel = specific_force * params_.accel_scale_factor + params_.accel_bias;
    accel.x() += gaussian(params_.accel_noise_std);
    accel.y() += gaussian(params_.accel_noise_std);
    accel.z() += gaussian(params_.accel_noise_std);

    last_accel_ = accel;
    return accel;
}

Vector3d SensorModel::measureGyroscope(const Vector3d& true_angular_rate, double dt) {
    Vector3d gyro = true_angular_rate * params_.gyro_scale_factor + params_.gyro_bias;
    gyro.x() += gaussian(params_.gyro_noise_std);
    gyro.y() += gaussian(params_.gyro_noise_std);
    gyro.z() += gaussian(params_.gyro_noise_std);

    gyro_integral_ += gyro * dt;
    return gyro;
}

// ================== Heading / Altitude ==================
double SensorModel::measureMagnetometer(double true_heading) {
    double heading = true_heading + params_.mag_declination + params_.magnetic_interference;
    heading += gaussian(NavigationUtils::deg2rad(params_.mag_noise_std));
    return NavigationUtils::wrapToPi(heading);
}

double SensorModel::measureBarometer(double true_altitude) {
    const double altitude = true_altitude + params_.baro_bias + gaussian(params_.baro_noise_std);
    return std::max(0.0, altitude);
}

// ================== Optical Flow ==================
OpticalFlowReading SensorModel::measureOpticalFlow(const Vector2d& true_velocity, double altitude) {
    const double altitude_factor = std::min(1.0, altitude / params_.flow_reference_altitude);
    const double noise_std = params_.flow_noise_std * (1.0 + altitude_factor);

    OpticalFlowReading reading;
    reading.velocity = true_velocity * params_.flow_scale_factor;
    reading.velocity.x() += gaussian(noise_std);
    reading.velocity.y() += gaussian(noise_std);
    reading.valid = true;
    return reading;
}

MeasurementBundle SensorModel::measureAll(const VehicleState& truth, double dt, double gravity) {
    MeasurementBundle bundle;
    bundle.gps = measureGps(truth.position);
    bundle.accelerometer = measureAccelerometer(truth.acceleration, gravity);
    bundle.gyroscope = measureGyroscope(Vector3d(0.0, 0.0, truth.yaw_rate), dt);
    bundle.magnetometer_heading = measureMagnetometer(truth.heading);
    bundle.barometer_altitude = measureBarometer(truth.position.z());
    bundle.optical_flow = measureOpticalFlow(truth.velocity.head<2>(), truth.position.z());
    return bundle;
}
