/**
 * @file test_sensor_model.cpp
 * @brief Statistical tests for the noisy sensor suite
 *
 * @author peanut-nav
 * @date Created: 2025-09-10
 * @last Modified: 2025-09-18
 * @version 0.5.0
 */

#include <gtest/gtest.h>
#include <cmath>
#include <random>
#include "core/SensorModel.hpp"
#include "MathUtils.hpp"

using Eigen::Vector2d;
using Eigen::Vector3d;

namespace {

constexpr int NUM_DRAWS = 10000;

}

class SensorModelTest : public ::testing::Test {
protected:
    SensorParams params;
    const Vector3d truth{12.0, -7.0, 5.0};
};

TEST_F(SensorModelTest, GpsValidWhenNotJammed) {
    SensorModel sensors(params, std::mt19937(1));

    double sum = 0.0, sumSq = 0.0;
    for (int i = 0; i < NUM_DRAWS; i++) {
        GpsReading r = sensors.measureGps(truth);
        ASSERT_TRUE(r.valid);
        ASSERT_TRUE(r.position.has_value());
        const double e = r.position->x() - truth.x();
        sum += e;
        sumSq += e * e;
    }
    const double mean = sum / NUM_DRAWS;
    const double stddev = std::sqrt(sumSq / NUM_DRAWS - mean * mean);
    EXPECT_NEAR(mean, 0.0, 0.05);
    EXPECT_NEAR(stddev, params.gps_noise_std, 0.05);
}

TEST_F(SensorModelTest, JammedGpsNeverValid) {
    SensorModel sensors(params, std::mt19937(2));
    sensors.setGpsJamming(true, params.gps_jamming_strength);

    int noSignal = 0;
    for (int i = 0; i < NUM_DRAWS; i++) {
        GpsReading r = sensors.measureGps(truth);
        ASSERT_FALSE(r.valid);
        if (!r.position) {
            noSignal++;
        }
    }
    EXPECT_NEAR(static_cast<double>(noSignal) / NUM_DRAWS, params.gps_jamming_strength, 0.05);
}

TEST_F(SensorModelTest, FullStrengthJammingHasNoSignal) {
    SensorModel sensors(params, std::mt19937(3));
    sensors.setGpsJamming(true, 1.0);
    for (int i = 0; i < 1000; i++) {
        EXPECT_FALSE(sensors.measureGps(truth).position.has_value());
    }
}

TEST_F(SensorModelTest, JammingStrengthIsClamped) {
    SensorModel sensors(params, std::mt19937(4));
    sensors.setGpsJamming(true, 3.0);
    EXPECT_DOUBLE_EQ(sensors.getJammingStrength(), 1.0);
    sensors.setGpsJamming(true, -1.0);
    EXPECT_DOUBLE_EQ(sensors.getJammingStrength(), 0.0);

    sensors.setGpsJamming(false, 0.7);
    EXPECT_FALSE(sensors.isGpsJammed());
    EXPECT_TRUE(sensors.measureGps(truth).valid);
}

TEST_F(SensorModelTest, AccelerometerRemovesGravity) {
    SensorModel sensors(params, std::mt19937(5));

    Vector3d sum = Vector3d::Zero();
    Vector3d last = Vector3d::Zero();
    for (int i = 0; i < NUM_DRAWS; i++) {
        last = sensors.measureAccelerometer(Vector3d(1.0, 0.0, 0.0), 9.81);
        sum += last;
    }
    const Vector3d mean = sum / NUM_DRAWS;
    EXPECT_NEAR(mean.x(), 1.0 + params.accel_bias.x(), 0.01);
    EXPECT_NEAR(mean.y(), params.accel_bias.y(), 0.01);
    EXPECT_NEAR(mean.z(), -9.81 + params.accel_bias.z(), 0.01);
    EXPECT_TRUE(sensors.lastAccelerometer().isApprox(last));
}

TEST_F(SensorModelTest, GyroscopeIntegrates) {
    params.gyro_noise_std = 0.0;
    params.gyro_bias = Vector3d::Zero();
    SensorModel sensors(params, std::mt19937(6));

    for (int i = 0; i < 10; i++) {
        sensors.measureGyroscope(Vector3d(0.0, 0.0, 0.5), 0.1);
    }
    EXPECT_NEAR(sensors.getGyroIntegral().z(), 0.5, 1e-12);

    sensors.resetGyroIntegral();
    EXPECT_DOUBLE_EQ(sensors.getGyroIntegral().norm(), 0.0);
}

TEST_F(SensorModelTest, MagnetometerWrapsHeading) {
    SensorModel sensors(params, std::mt19937(7));
    for (int i = 0; i < 1000; i++) {
        const double h = sensors.measureMagnetometer(M_PI);
        EXPECT_GT(h, -M_PI);
        EXPECT_LE(h, M_PI);
    }
}

TEST_F(SensorModelTest, MagnetometerNoiseIsInDegrees) {
    params.mag_noise_std = 2.0;
    SensorModel sensors(params, std::mt19937(11));

    double sumSq = 0.0;
    for (int i = 0; i < NUM_DRAWS; i++) {
        const double e = sensors.measureMagnetometer(0.0);
        sumSq += e * e;
    }
    EXPECT_NEAR(NavigationUtils::rad2deg(std::sqrt(sumSq / NUM_DRAWS)), 2.0, 0.1);
}

TEST_F(SensorModelTest, BarometerNeverNegative) {
    SensorModel sensors(params, std::mt19937(8));
    for (int i = 0; i < 1000; i++) {
        EXPECT_GE(sensors.measureBarometer(0.0), 0.0);
    }
}

TEST_F(SensorModelTest, OpticalFlowNoiseGrowsWithAltitude) {
    SensorModel low(params, std::mt19937(9));
    SensorModel high(params, std::mt19937(9));

    double lowSq = 0.0, highSq = 0.0;
    for (int i = 0; i < NUM_DRAWS; i++) {
        OpticalFlowReading a = low.measureOpticalFlow(Vector2d(2.0, 1.0), 0.0);
        OpticalFlowReading b = high.measureOpticalFlow(Vector2d(2.0, 1.0), 500.0);
        EXPECT_TRUE(a.valid);
        EXPECT_TRUE(b.valid);
        lowSq += std::pow(a.velocity.x() - 2.0, 2);
        highSq += std::pow(b.velocity.x() - 2.0, 2);
    }
    // Noise scale saturates at twice the base value
    EXPECT_NEAR(std::sqrt(lowSq / NUM_DRAWS), params.flow_noise_std, 0.01);
    EXPECT_NEAR(std::sqrt(highSq / NUM_DRAWS), 2.0 * params.flow_noise_std, 0.02);
}

TEST_F(SensorModelTest, SameSeedSameReadings) {
    SensorModel a(params, std::mt19937(42));
    SensorModel b(params, std::mt19937(42));

    VehicleState state;
    state.position = truth;
    state.velocity = Vector3d(3.0, 4.0, 0.0);
    state.heading = 0.9;

    for (int i = 0; i < 50; i++) {
        MeasurementBundle ma = a.measureAll(state, 0.1);
        MeasurementBundle mb = b.measureAll(state, 0.1);
        ASSERT_TRUE(*ma.gps.position == *mb.gps.position);
        ASSERT_TRUE(ma.accelerometer == mb.accelerometer);
        ASSERT_TRUE(ma.optical_flow.velocity == mb.optical_flow.velocity);
        ASSERT_DOUBLE_EQ(ma.magnetometer_heading, mb.magnetometer_heading);
    }
}

int main(int argc, char **argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
