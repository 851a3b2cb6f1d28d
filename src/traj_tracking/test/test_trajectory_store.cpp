#include <gtest/gtest.h>
#include <traj_tracking/bounds_guard.h>
#include <traj_tracking/trajectory_store.h>
#include <boost/filesystem.hpp>
#include <fstream>
#include <limits>
#include <sstream>

using namespace traj_tracking;

namespace {

// 直线轨迹 (0,[0,0,0]) -> (10,[10,0,0])
Trajectory straightLine() {
    Eigen::VectorXd t(2);
    t << 0.0, 10.0;
    Eigen::Matrix3Xd p(3, 2);
    p << 0.0, 10.0, 0.0, 0.0, 0.0, 0.0;
    return Trajectory(t, p);
}

Trajectory parseText(const std::string& text) {
    std::istringstream in(text);
    return TrajectoryStore::parse(in);
}

}  // namespace

TEST(TrajectoryStoreTest, OriginalTimingKeptWhenWithinLimit) {
    SpeedConstraint constraint(2.0, 0.8);
    SpeedCheck check = TrajectoryStore::validateSpeed(straightLine(), constraint);
    EXPECT_TRUE(check.ok);
    EXPECT_DOUBLE_EQ(check.avg_speed, 1.0);
    EXPECT_DOUBLE_EQ(check.max_allowed_speed, 1.6);

    Trajectory ref = TrajectoryStore::buildReference(straightLine(), boost::none, constraint, false);
    ASSERT_EQ(ref.size(), 2);
    EXPECT_DOUBLE_EQ(ref.time()(0), 0.0);
    EXPECT_DOUBLE_EQ(ref.time()(1), 10.0);
}

TEST(TrajectoryStoreTest, TooShortDurationReportsRequiredDuration) {
    SpeedConstraint constraint(2.0, 0.8);
    try {
        TrajectoryStore::buildReference(straightLine(), 2.0, constraint, false);
        FAIL() << "expected SpeedLimitExceeded";
    } catch (const SpeedLimitExceeded& e) {
        EXPECT_DOUBLE_EQ(e.avg_speed, 5.0);
        EXPECT_DOUBLE_EQ(e.max_allowed_speed, 1.6);
        EXPECT_NEAR(e.required_duration, 6.25, 1e-12);
    }
}

TEST(TrajectoryStoreTest, AutoAdjustRaisesDurationToMinimum) {
    SpeedConstraint constraint(2.0, 0.8);
    Trajectory ref = TrajectoryStore::buildReference(straightLine(), 2.0, constraint, true);
    EXPECT_NEAR(ref.duration(), 6.25, 1e-12);
    EXPECT_TRUE(TrajectoryStore::validateSpeed(ref, constraint).ok);
}

TEST(TrajectoryStoreTest, LongerDurationNeverRaisesAverageSpeed) {
    SpeedConstraint constraint(2.0, 0.8);
    const double durations[] = {2.0, 6.25 * (1.0 - 1e-6), 6.25, 8.0, 20.0};

    double last_avg = std::numeric_limits<double>::infinity();
    for (double d : durations) {
        SpeedCheck check = TrajectoryStore::validateSpeed(TrajectoryStore::scaleToDuration(straightLine(), d), constraint);
        EXPECT_LE(check.avg_speed, last_avg) << "duration " << d;
        EXPECT_NEAR(check.required_duration, 6.25, 1e-12);
        // 只有 required_duration 处结果翻转
        EXPECT_EQ(check.ok, d >= 6.25) << "duration " << d;
        last_avg = check.avg_speed;
    }
}

TEST(TrajectoryStoreTest, AutoAdjustSlowsDownFastOriginalTiming) {
    Eigen::VectorXd t(3);
    t << 0.0, 1.0, 2.0;
    Eigen::Matrix3Xd p(3, 3);
    p << 0.0, 2.0, 4.0, 0.0, 0.0, 0.0, 1.0, 1.0, 1.0;
    Trajectory fast(t, p);
    SpeedConstraint constraint(1.0, 0.8);

    EXPECT_THROW(TrajectoryStore::buildReference(fast, boost::none, constraint, false), SpeedLimitExceeded);
    Trajectory ref = TrajectoryStore::buildReference(fast, boost::none, constraint, true);
    EXPECT_NEAR(ref.duration(), 5.0, 1e-12);
}

TEST(TrajectoryStoreTest, ScaleToDurationIsUniformAndMonotonic) {
    Eigen::VectorXd t(5);
    t << 0.0, 0.1, 0.5, 2.0, 3.0;
    Eigen::Matrix3Xd p = Eigen::Matrix3Xd::Random(3, 5);
    Trajectory scaled = TrajectoryStore::scaleToDuration(Trajectory(t, p), 8.0);

    ASSERT_EQ(scaled.size(), 5);
    for (int i = 0; i < 5; i++) EXPECT_DOUBLE_EQ(scaled.time()(i), 2.0 * i);
    EXPECT_EQ(scaled.time()(4), 8.0);
    for (int i = 1; i < 5; i++) EXPECT_GT(scaled.time()(i), scaled.time()(i - 1));
    // 位置不变
    EXPECT_TRUE(scaled.positions().isApprox(p));
}

TEST(TrajectoryStoreTest, InvalidDurationRejected) {
    EXPECT_THROW(TrajectoryStore::scaleToDuration(straightLine(), 0.0), InvalidDurationError);
    EXPECT_THROW(TrajectoryStore::scaleToDuration(straightLine(), -3.0), InvalidDurationError);
    EXPECT_THROW(TrajectoryStore::buildReference(straightLine(), 0.0, SpeedConstraint(), true), InvalidDurationError);
}

TEST(TrajectoryStoreTest, DegenerateTrajectoryRejected) {
    Eigen::VectorXd t(1);
    t << 0.0;
    Eigen::Matrix3Xd p = Eigen::Matrix3Xd::Zero(3, 1);
    EXPECT_THROW(TrajectoryStore::computeAverageSpeed(Trajectory(t, p)), DegenerateTrajectoryError);
}

TEST(TrajectoryStoreTest, ParsesPositionRows) {
    Trajectory traj = parseText("0,1,2\n0,0.5,1\n0,0,0\n1,1,1\n");
    ASSERT_EQ(traj.size(), 3);
    EXPECT_DOUBLE_EQ(traj.duration(), 2.0);
    EXPECT_DOUBLE_EQ(traj.position(2)(0), 1.0);
    EXPECT_FALSE(traj.hasVelocities());
}

TEST(TrajectoryStoreTest, ParsesOptionalVelocityRows) {
    Trajectory traj = parseText("0,1\n0,1\n0,0\n1,1\n0.5,0.5\n0,0\n0,0\n");
    ASSERT_TRUE(traj.hasVelocities());
    EXPECT_DOUBLE_EQ(traj.velocities()(0, 1), 0.5);
}

TEST(TrajectoryStoreTest, MalformedTablesRejected) {
    EXPECT_THROW(parseText("0,1\n0,1\n0,0\n"), FormatError);
    EXPECT_THROW(parseText("0,1\n0,1\n0\n1,1\n"), FormatError);
    EXPECT_THROW(parseText("0,1\n0,abc\n0,0\n1,1\n"), FormatError);
    EXPECT_THROW(parseText("0\n0\n0\n1\n"), FormatError);
}

TEST(TrajectoryStoreTest, NonMonotonicTimeRejected) {
    EXPECT_THROW(parseText("0,2,1\n0,1,2\n0,0,0\n1,1,1\n"), OrderError);
    EXPECT_THROW(parseText("0,1,1\n0,1,2\n0,0,0\n1,1,1\n"), OrderError);
    EXPECT_THROW(parseText("0.5,1\n0,1\n0,0\n1,1\n"), OrderError);
}

TEST(TrajectoryStoreTest, LoadsFromFile) {
    boost::filesystem::path file = boost::filesystem::temp_directory_path() / boost::filesystem::unique_path("traj_%%%%%%.csv");
    {
        std::ofstream out(file.string());
        out << "0,5,10\n0,2,4\n0,0,0\n1,1,1\n";
    }
    Trajectory ref = TrajectoryStore::buildReference(file.string(), 20.0, SpeedConstraint(1.0, 0.8), false);
    EXPECT_DOUBLE_EQ(ref.duration(), 20.0);
    EXPECT_DOUBLE_EQ(ref.time()(1), 10.0);
    boost::filesystem::remove(file);

    EXPECT_THROW(TrajectoryStore::load(file.string()), FormatError);
}

// 随包发布的示例轨迹在默认配置下必须可用
TEST(TrajectoryStoreTest, ShippedFigureEightPassesDefaultChecks) {
    const std::string file = std::string(TRAJ_TRACKING_DATA_DIR) + "/figure_eight.csv";
    ASSERT_TRUE(boost::filesystem::exists(file)) << file;

    Trajectory ref = TrajectoryStore::buildReference(file, 20.0, SpeedConstraint(1.0, 0.8), false);
    EXPECT_DOUBLE_EQ(ref.duration(), 20.0);
    EXPECT_NO_THROW(requireTrajectoryWithin(ref, BoundsRegion()));
}
