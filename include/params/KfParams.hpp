/**
 * @file KfParams.hpp
 * @brief Parameters for the position/velocity Kalman filter
 *
 * @author peanut-nav
 * @date Created: 2025-07-22
 * @last Modified: 2025-09-18
 * @version 0.5.0
 */

#pragma once
#include <Eigen/Dense>

/**
 * @brief Kalman filter tuning
 *
 * State ordering is [px, py, vx, vy].
 */
struct FilterParams {
    /// Initial covariance diagonal: large position, moderate velocity uncertainty
    Eigen::Vector4d initial_covariance = Eigen::Vector4d(100.0, 100.0, 10.0, 10.0);

    /// Process noise diagonal (position, position, velocity, velocity)
    Eigen::Vector4d process_noise = Eigen::Vector4d(0.001, 0.001, 0.01, 0.01);

    double gps_noise_std = 0.5;   ///< GPS position measurement 1-sigma (m)
    double flow_noise_std = 0.2;  ///< Optical flow velocity measurement 1-sigma (m/s)

    /// Project P onto (P + P^T)/2 after each measurement update
    bool symmetrize_covariance = false;
};
