/**
 * @file test_math_utils.cpp
 * @brief Unit tests for MathUtils functionality
 *
 * Contains tests for:
 * - Degree/radian conversion
 * - Angle wrapping
 * - Symmetric clamping
 * - Distance helpers
 *
 * @author peanut-nav
 * @date Created: 2025-07-22
 * @last Modified: 2025-09-18
 * @version 0.5.0
 */

#include <gtest/gtest.h>
#include <cmath>
#include "MathUtils.hpp"

using namespace NavigationUtils;

constexpr double EPSILON = 1e-12;  ///< Tolerance for floating-point comparisons

// Test degree to radian conversion
TEST(MathUtilsTest, Deg2Rad) {
    EXPECT_NEAR(deg2rad(0.0), 0.0, EPSILON);
    EXPECT_NEAR(deg2rad(180.0), M_PI, EPSILON);
    EXPECT_NEAR(deg2rad(90.0), M_PI / 2, EPSILON);
    EXPECT_NEAR(rad2deg(M_PI), 180.0, EPSILON);
}

// Test heading wrap into (-pi, pi]
TEST(MathUtilsTest, WrapToPi) {
    EXPECT_NEAR(wrapToPi(0.0), 0.0, EPSILON);
    EXPECT_NEAR(wrapToPi(2.5 * M_PI), 0.5 * M_PI, EPSILON);
    EXPECT_NEAR(wrapToPi(-M_PI), M_PI, EPSILON);
    EXPECT_NEAR(wrapToPi(2 * M_PI + 0.5), 0.5, EPSILON);
    EXPECT_NEAR(wrapToPi(-2 * M_PI - 0.5), -0.5, EPSILON);
}

TEST(MathUtilsTest, ClampSymmetric) {
    EXPECT_DOUBLE_EQ(clampSymmetric(25.0, 20.0), 20.0);
    EXPECT_DOUBLE_EQ(clampSymmetric(-25.0, 20.0), -20.0);
    EXPECT_DOUBLE_EQ(clampSymmetric(3.0, 20.0), 3.0);

    Eigen::Vector3d v = clampSymmetric(Eigen::Vector3d(30.0, -40.0, 1.0), 15.0);
    EXPECT_DOUBLE_EQ(v.x(), 15.0);
    EXPECT_DOUBLE_EQ(v.y(), -15.0);
    EXPECT_DOUBLE_EQ(v.z(), 1.0);
}

TEST(MathUtilsTest, Distances) {
    EXPECT_NEAR(distance3d(Eigen::Vector3d(0, 0, 0), Eigen::Vector3d(1, 2, 2)), 3.0, EPSILON);
    EXPECT_NEAR(distance2d(Eigen::Vector2d(1, 1), Eigen::Vector2d(4, 5)), 5.0, EPSILON);
    EXPECT_NEAR(horizontalSpeed(Eigen::Vector3d(3, 4, 100)), 5.0, EPSILON);
}

int main(int argc, char **argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
