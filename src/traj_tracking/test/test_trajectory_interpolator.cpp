#include <gtest/gtest.h>
#include <traj_tracking/trajectory_interpolator.h>
#include <limits>

using namespace traj_tracking;

namespace {

std::shared_ptr<const Trajectory> makeTrajectory() {
    Eigen::VectorXd t(3);
    t << 0.0, 1.0, 3.0;
    Eigen::Matrix3Xd p(3, 3);
    p << 0.0, 1.0, 1.0,  //
        0.0, 0.0, 2.0,   //
        1.0, 1.0, 1.5;
    return std::make_shared<const Trajectory>(t, p);
}

}  // namespace

TEST(TrajectoryInterpolatorTest, ReturnsSamplesAtSampleTimes) {
    TrajectoryInterpolator interp(makeTrajectory());
    for (int i = 0; i < 3; i++) {
        double t = interp.trajectory().time()(i);
        EXPECT_TRUE(interp.positionAt(t).isApprox(interp.trajectory().position(i)));
    }
    EXPECT_DOUBLE_EQ(interp.duration(), 3.0);
}

TEST(TrajectoryInterpolatorTest, InterpolatesEachAxisLinearly) {
    TrajectoryInterpolator interp(makeTrajectory());
    Eigen::Vector3d p = interp.positionAt(0.25);
    EXPECT_DOUBLE_EQ(p(0), 0.25);
    EXPECT_DOUBLE_EQ(p(1), 0.0);
    EXPECT_DOUBLE_EQ(p(2), 1.0);

    p = interp.positionAt(2.0);
    EXPECT_DOUBLE_EQ(p(0), 1.0);
    EXPECT_DOUBLE_EQ(p(1), 1.0);
    EXPECT_DOUBLE_EQ(p(2), 1.25);
}

TEST(TrajectoryInterpolatorTest, ExtrapolatesOutsideRange) {
    TrajectoryInterpolator interp(makeTrajectory());
    Eigen::Vector3d before = interp.positionAt(-1.0);
    EXPECT_DOUBLE_EQ(before(0), -1.0);
    EXPECT_DOUBLE_EQ(before(2), 1.0);

    Eigen::Vector3d after = interp.positionAt(5.0);
    EXPECT_DOUBLE_EQ(after(0), 1.0);
    EXPECT_DOUBLE_EQ(after(1), 4.0);
    EXPECT_DOUBLE_EQ(after(2), 2.0);
}

TEST(TrajectoryInterpolatorTest, SameQueryGivesSameResult) {
    TrajectoryInterpolator interp(makeTrajectory());
    Eigen::Vector3d a = interp.positionAt(1.7);
    Eigen::Vector3d b = interp.positionAt(1.7);
    EXPECT_EQ(a, b);
}

TEST(TrajectoryInterpolatorTest, FailsOnUnusableInput) {
    TrajectoryInterpolator interp(makeTrajectory());
    EXPECT_THROW(interp.positionAt(std::numeric_limits<double>::quiet_NaN()), InterpolationFailure);

    Eigen::VectorXd t1(1);
    t1 << 0.0;
    EXPECT_THROW(TrajectoryInterpolator::positionAt(0.0, Trajectory(t1, Eigen::Matrix3Xd::Zero(3, 1))), InterpolationFailure);

    Eigen::VectorXd t2(3);
    t2 << 0.0, 0.0, 1.0;
    EXPECT_THROW(TrajectoryInterpolator::positionAt(0.0, Trajectory(t2, Eigen::Matrix3Xd::Zero(3, 3))), InterpolationFailure);
}
