/**
 * @file KfEstimator.hpp
 * @brief Linear Kalman filter for planar position/velocity estimation
 *
 * Estimates x = [px, py, vx, vy] with a constant-velocity transition model.
 * GPS fixes observe position and optical flow observes velocity; both
 * updates share the same gain/innovation algebra and differ only in the
 * observation matrix and noise. All matrix algebra goes through the
 * dimension-checked DenseMatrix kernel.
 *
 * @author peanut-nav
 * @date Created: 2025-07-22
 * @last Modified: 2025-09-18
 * @version 0.5.0
 */

#pragma once
#include "LinearAlgebra.hpp"
#include "params/KfParams.hpp"
#include <Eigen/Dense>

class KfEstimator {
public:
    static constexpr int STATE_DIM = 4;
    static constexpr double DEAD_RECKONING_VARIANCE_GROWTH = 1.01;

    /**
     * @brief Construct the filter with zero state and the initial covariance
     *
     * @param params Filter tuning
     * @param dt Propagation interval (s)
     */
    explicit KfEstimator(const FilterParams& params = FilterParams(), double dt = 0.1);

    /**
     * @brief Propagate state and covariance one interval
     *
     * x <- F x, P <- F P F^T + Q
     */
    void predict();

    /**
     * @brief Fuse a GPS position fix
     *
     * Only the horizontal components are observed; altitude is accepted
     * for interface symmetry with the receiver output.
     *
     * @throws SingularMatrixError if the innovation covariance is singular
     */
    void updateGps(double gps_x, double gps_y, double gps_z);

    /**
     * @brief Fuse an optical flow velocity measurement
     *
     * @return false if the update was skipped because the innovation
     *         covariance was singular
     */
    bool updateOpticalFlow(double flow_x, double flow_y);

    /**
     * @brief Integrate a horizontal acceleration into the state
     *
     * p <- p + v dt + 0.5 a dt^2, v <- v + a dt, and every diagonal
     * entry of P grows by 1%. Covariance cross terms are left as is.
     */
    void updateDeadReckoning(double accel_x, double accel_y);

    /**
     * @brief Confidence heuristic in [0, 1]: max(0, 1 - trace(P)/100)
     */
    double getConfidence() const;

    /**
     * @brief RMS of the position variances, sqrt((P00 + P11) / 2)
     */
    double getError() const;

    void setState(double x, double y, double vx, double vy);

    Eigen::Vector4d getState() const;
    Eigen::Vector2d getPosition() const;
    Eigen::Vector2d getVelocity() const;

    const DenseMatrix& getCovariance() const { return P_; }

    double getTimeStep() const { return dt_; }
    double timeSinceGps() const { return time_since_gps_; }

    /// True when a GPS fix was fused since the last prediction
    bool isGpsAvailable() const { return gps_available_; }

private:
    /**
     * @brief Build the constant-velocity transition matrix for dt_
     */
    DenseMatrix buildTransitionMatrix() const;

    /**
     * @brief Run one measurement update
     *
     * K = P H^T (H P H^T + R)^-1, x <- x + K (z - H x), P <- (I - K H) P
     */
    void kalmanUpdateStep(const DenseMatrix& Z,
                          const DenseMatrix& H,
                          const DenseMatrix& R);

    FilterParams params_;
    double dt_;

    DenseMatrix x_;   ///< State column vector (4x1)
    DenseMatrix P_;   ///< Error covariance (4x4)
    DenseMatrix F_;   ///< State transition (4x4)
    DenseMatrix Q_;   ///< Process noise (4x4)

    bool gps_available_ = true;
    double time_since_gps_ = 0.0;
};
