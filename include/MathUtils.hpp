/**
 * @file MathUtils.hpp
 * @brief Mathematical utilities for navigation computations
 *
 * Provides angle conversions and wrapping, scalar clamping and the
 * planar/spatial distance helpers shared by the dynamics, sensor and
 * mission components.
 *
 * @author peanut-nav
 * @date Created: 2025-07-22
 * @last Modified: 2025-09-18
 * @version 0.5.0
 */

#pragma once
#include <cmath>
#include <Eigen/Dense>

namespace NavigationUtils {

/**
 * @brief Degrees to radians conversion constant
 */
constexpr double DEG_TO_RAD = M_PI / 180.0;

/**
 * @brief Radians to degrees conversion constant
 */
constexpr double RAD_TO_DEG = 180.0 / M_PI;

/**
 * @brief Convert degrees to radians
 * @tparam T Numeric type (float/double)
 * @param deg Angle in degrees
 * @return Angle in radians
 */
template <typename T>
T deg2rad(T deg) {
    return deg * static_cast<T>(DEG_TO_RAD);
}

/**
 * @brief Convert radians to degrees
 * @tparam T Numeric type (float/double)
 * @param rad Angle in radians
 * @return Angle in degrees
 */
template <typename T>
T rad2deg(T rad) {
    return rad * static_cast<T>(RAD_TO_DEG);
}

/**
 * @brief Wrap an angle into the half-open interval (-pi, pi]
 *
 * @tparam T Numeric type (float/double)
 * @param angle Angle in radians
 * @return Equivalent angle in (-pi, pi]
 */
template <typename T>
T wrapToPi(T angle) {
    const T two_pi = static_cast<T>(2.0 * M_PI);
    while (angle > static_cast<T>(M_PI)) {
        angle -= two_pi;
    }
    while (angle <= -static_cast<T>(M_PI)) {
        angle += two_pi;
    }
    return angle;
}

/**
 * @brief Clamp a value into the symmetric range [-limit, limit]
 */
template <typename T>
T clampSymmetric(T value, T limit) {
    if (value > limit) return limit;
    if (value < -limit) return -limit;
    return value;
}

/**
 * @brief Component-wise symmetric clamp of a 3-vector
 */
inline Eigen::Vector3d clampSymmetric(const Eigen::Vector3d& v, double limit) {
    return Eigen::Vector3d(clampSymmetric(v.x(), limit),
                           clampSymmetric(v.y(), limit),
                           clampSymmetric(v.z(), limit));
}

/**
 * @brief Euclidean distance between two points in 3-D
 */
inline double distance3d(const Eigen::Vector3d& a, const Eigen::Vector3d& b) {
    return (b - a).norm();
}

/**
 * @brief Euclidean distance between two points in the horizontal plane
 */
inline double distance2d(const Eigen::Vector2d& a, const Eigen::Vector2d& b) {
    return (b - a).norm();
}

/**
 * @brief Horizontal speed of a velocity vector (vx, vy components only)
 */
inline double horizontalSpeed(const Eigen::Vector3d& velocity) {
    return std::hypot(velocity.x(), velocity.y());
}

} // namespace NavigationUtils
