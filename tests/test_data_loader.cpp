/**
 * @file test_data_loader.cpp
 * @brief Unit tests for DataLoader and SimInitializer configuration loading
 *
 * Contains tests for:
 * - Waypoint and mission schedule parsing
 * - Rejection of missing or malformed files
 * - Parameter initialization from a data directory
 *
 * @author peanut-nav
 * @date Created: 2025-07-22
 * @last Modified: 2025-09-18
 * @version 0.5.0
 */

#include <gtest/gtest.h>
#include "DataLoader.hpp"
#include "initializers/SimInitializer.hpp"
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>

namespace fs = std::filesystem;

// Test fixture with a scratch data directory
class DataLoaderTest : public ::testing::Test {
protected:
    void SetUp() override {
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        dataDir = fs::temp_directory_path() / (std::string("jamnav_loader_") + info->name());
        fs::remove_all(dataDir);
        fs::create_directories(dataDir);
    }

    void TearDown() override {
        fs::remove_all(dataDir);
    }

    std::string writeFile(const std::string& name, const std::string& content) {
        const fs::path path = dataDir / name;
        std::ofstream out(path);
        out << content;
        return path.string();
    }

    fs::path dataDir;
};

TEST_F(DataLoaderTest, LoadWaypoints) {
    const std::string path = writeFile("waypoints.dat",
        "# x y z\n"
        "10.0  5.0  5.0\n"
        "\n"
        "  -3.5 2 8\n");

    const auto waypoints = DataLoader::loadWaypoints(path);
    ASSERT_EQ(waypoints.size(), 2u);
    EXPECT_DOUBLE_EQ(waypoints[0].x(), 10.0);
    EXPECT_DOUBLE_EQ(waypoints[1].x(), -3.5);
    EXPECT_DOUBLE_EQ(waypoints[1].z(), 8.0);
}

TEST_F(DataLoaderTest, MissingFileThrows) {
    EXPECT_THROW(DataLoader::loadWaypoints((dataDir / "absent.dat").string()), std::runtime_error);

    MissionParams mission;
    EXPECT_THROW(DataLoader::loadMissionConfig((dataDir / "absent.dat").string(), mission),
                 std::runtime_error);
}

TEST_F(DataLoaderTest, MalformedWaypointsThrow) {
    EXPECT_THROW(DataLoader::loadWaypoints(writeFile("a.dat", "1 2\n")), std::runtime_error);
    EXPECT_THROW(DataLoader::loadWaypoints(writeFile("b.dat", "1 2 three\n")), std::runtime_error);
    EXPECT_THROW(DataLoader::loadWaypoints(writeFile("c.dat", "# only a comment\n")), std::runtime_error);
}

TEST_F(DataLoaderTest, LoadMissionConfig) {
    MissionParams mission;
    DataLoader::loadMissionConfig(writeFile("mission.dat", "# start end duration\n10 15 60\n"), mission);
    EXPECT_DOUBLE_EQ(mission.jamming_start_time, 10.0);
    EXPECT_DOUBLE_EQ(mission.jamming_end_time, 15.0);
    EXPECT_DOUBLE_EQ(mission.mission_duration, 60.0);
}

TEST_F(DataLoaderTest, InvalidScheduleIsRejected) {
    MissionParams mission;
    EXPECT_THROW(DataLoader::loadMissionConfig(writeFile("a.dat", "6 3 90\n"), mission), std::runtime_error);
    EXPECT_THROW(DataLoader::loadMissionConfig(writeFile("b.dat", "3 6 0\n"), mission), std::runtime_error);
    EXPECT_THROW(DataLoader::loadMissionConfig(writeFile("c.dat", "3 6 90\n1 2 3\n"), mission), std::runtime_error);

    // Rejected files leave the parameters untouched
    EXPECT_DOUBLE_EQ(mission.jamming_start_time, 3.0);
    EXPECT_DOUBLE_EQ(mission.jamming_end_time, 6.0);
}

TEST_F(DataLoaderTest, InitializerLoadsDataDirectory) {
    writeFile("waypoints.dat", "5 5 5\n10 10 5\n");
    writeFile("mission.dat", "1.5 2.5 30\n");

    SimParams params = create_default_params();
    SimInitializer initializer;
    initializer.initialize_params(params, dataDir.string());

    ASSERT_EQ(params.mission.waypoints.size(), 2u);
    EXPECT_DOUBLE_EQ(params.mission.waypoints[1].y(), 10.0);
    EXPECT_DOUBLE_EQ(params.mission.jamming_start_time, 1.5);
    EXPECT_DOUBLE_EQ(params.mission.mission_duration, 30.0);
}

TEST_F(DataLoaderTest, InitializerKeepsDefaultsWithoutFiles) {
    SimParams params = create_default_params();
    SimInitializer initializer;
    initializer.initialize_params(params, dataDir.string());

    EXPECT_EQ(params.mission.waypoints.size(), 5u);
    EXPECT_DOUBLE_EQ(params.mission.jamming_start_time, 3.0);
    EXPECT_DOUBLE_EQ(params.mission.jamming_end_time, 6.0);
}

TEST_F(DataLoaderTest, InitializerSeedsDynamicsAndFilter) {
    SimParams params = create_default_params();
    params.initial_pose.position = Eigen::Vector3d(3.0, 4.0, 10.0);
    params.initial_pose.velocity = Eigen::Vector3d(1.0, -1.0, 0.0);

    SimInitializer initializer;
    DynamicsEngine dynamics(params.vehicle);
    KfEstimator estimator(params.filter, params.dt);
    initializer.initialize_state(dynamics, params);
    initializer.initialize_filter(estimator, params);

    EXPECT_TRUE(dynamics.getState().position.isApprox(params.initial_pose.position));
    EXPECT_DOUBLE_EQ(estimator.getPosition().x(), 3.0);
    EXPECT_DOUBLE_EQ(estimator.getVelocity().y(), -1.0);
}

int main(int argc, char **argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
