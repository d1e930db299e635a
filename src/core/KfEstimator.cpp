/**
 * @file KfEstimator.cpp
 * @brief Implementation of the planar position/velocity Kalman filter
 *
 * Contains the prediction step, the shared measurement update used by the
 * GPS and optical flow observations, and the uncertainty summaries exposed
 * to the mission layer.
 *
 * @author peanut-nav
 * @date Created: 2025-07-22
 * @last Modified: 2025-09-18
 * @version 0.5.0
 */

#include "core/KfEstimator.hpp"
#include <algorithm>
#include <cmath>

using namespace Eigen;

// ================== Initialization ==================
KfEstimator::KfEstimator(const FilterParams& params, double dt)
    : params_(params),
      dt_(dt),
      x_(STATE_DIM, 1),
      P_(STATE_DIM, STATE_DIM),
      F_(STATE_DIM, STATE_DIM),
      Q_(STATE_DIM, STATE_DIM) {
    for (int i = 0; i < STATE_DIM; i++) {
        P_.set(i, i, params_.initial_covariance(i));
        Q_.set(i, i, params_.process_noise(i));
    }
    F_ = buildTransitionMatrix();
}

DenseMatrix KfEstimator::buildTransitionMatrix() const {
    DenseMatrix F = DenseMatrix::identity(STATE_DIM);
    F.set(0, 2, dt_);  // px += vx * dt
    F.set(1, 3, dt_);  // py += vy * dt
    return F;
}

// ================== State Prediction ==================
void KfEstimator::predict() {
    x_ = DenseMatrix::multiply(F_, x_);

    const DenseMatrix FP = DenseMatrix::multiply(F_, P_);
    const DenseMatrix FPFt = DenseMatrix::multiply(FP, DenseMatrix::transpose(F_));
    P_ = DenseMatrix::add(FPFt, Q_);

    gps_available_ = false;
    time_since_gps_ += dt_;
}

void KfEstimator::updateDeadReckoning(double accel_x, double accel_y) {
    const double vx = x_.get(2, 0);
    const double vy = x_.get(3, 0);
    const double half_dt2 = 0.5 * dt_ * dt_;

    x_.set(0, 0, x_.get(0, 0) + vx * dt_ + accel_x * half_dt2);
    x_.set(1, 0, x_.get(1, 0) + vy * dt_ + accel_y * half_dt2);
    x_.set(2, 0, vx + accel_x * dt_);
    x_.set(3, 0, vy + accel_y * dt_);

    for (int i = 0; i < STATE_DIM; i++) {
        P_.set(i, i, P_.get(i, i) * DEAD_RECKONING_VARIANCE_GROWTH);
    }
}

// ================== Measurement Update ==================
void KfEstimator::updateGps(double gps_x, double gps_y, double /*gps_z*/) {
    DenseMatrix Z(2, 1);
    Z.set(0, 0, gps_x);
    Z.set(1, 0, gps_y);

    DenseMatrix H(2, STATE_DIM);
    H.set(0, 0, 1.0);
    H.set(1, 1, 1.0);

    const double r = params_.gps_noise_std * params_.gps_noise_std;
    DenseMatrix R(2, 2);
    R.set(0, 0, r);
    R.set(1, 1, r);

    // Singular innovation covariance propagates to the caller
    kalmanUpdateStep(Z, H, R);

    gps_available_ = true;
    time_since_gps_ = 0.0;
}

bool KfEstimator::updateOpticalFlow(double flow_x, double flow_y) {
    DenseMatrix Z(2, 1);
    Z.set(0, 0, flow_x);
    Z.set(1, 0, flow_y);

    DenseMatrix H(2, STATE_DIM);
    H.set(0, 2, 1.0);
    H.set(1, 3, 1.0);

    const double r = params_.flow_noise_std * params_.flow_noise_std;
    DenseMatrix R(2, 2);
    R.set(0, 0, r);
    R.set(1, 1, r);

    try {
        kalmanUpdateStep(Z, H, R);
    } catch (const SingularMatrixError&) {
        // Ill-conditioned flow frame, state left unchanged
        return false;
    }
    return true;
}

void KfEstimator::kalmanUpdateStep(const DenseMatrix& Z,
                                   const DenseMatrix& H,
                                   const DenseMatrix& R) {
    const DenseMatrix Ht = DenseMatrix::transpose(H);

    // Innovation covariance S = H P H^T + R
    const DenseMatrix S = DenseMatrix::add(
        DenseMatrix::multiply(DenseMatrix::multiply(H, P_), Ht), R);
    const DenseMatrix S_inv = S.invert();

    // Kalman gain K = P H^T S^-1
    const DenseMatrix K = DenseMatrix::multiply(DenseMatrix::multiply(P_, Ht), S_inv);

    // Innovation y = z - H x
    const DenseMatrix y = DenseMatrix::subtract(Z, DenseMatrix::multiply(H, x_));

    // Nothing is committed until every product above has succeeded
    DenseMatrix x_new = DenseMatrix::add(x_, DenseMatrix::multiply(K, y));
    const DenseMatrix I_KH = DenseMatrix::subtract(DenseMatrix::identity(STATE_DIM),
                                                   DenseMatrix::multiply(K, H));
    DenseMatrix P_new = DenseMatrix::multiply(I_KH, P_);

    if (params_.symmetrize_covariance) {
        P_new = DenseMatrix::fromEigen(0.5 * (P_new.toEigen() + P_new.toEigen().transpose()));
    }

    x_ = x_new;
    P_ = P_new;
}

// ================== Uncertainty Summaries ==================
double KfEstimator::getConfidence() const {
    return std::max(0.0, 1.0 - P_.trace() / 100.0);
}

double KfEstimator::getError() const {
    return std::sqrt((P_.get(0, 0) + P_.get(1, 1)) / 2.0);
}

// ================== State Access ==================
void KfEstimator::setState(double x, double y, double vx, double vy) {
    x_.set(0, 0, x);
    x_.set(1, 0, y);
    x_.set(2, 0, vx);
    x_.set(3, 0, vy);
}

Vector4d KfEstimator::getState() const {
    return Vector4d(x_.get(0, 0), x_.get(1, 0), x_.get(2, 0), x_.get(3, 0));
}

Vector2d KfEstimator::getPosition() const {
    return Vector2d(x_.get(0, 0), x_.get(1, 0));
}

Vector2d KfEstimator::getVelocity() const {
    return Vector2d(x_.get(2, 0), x_.get(3, 0));
}
