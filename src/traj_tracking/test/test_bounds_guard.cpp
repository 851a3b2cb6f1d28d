#include <gtest/gtest.h>
#include <traj_tracking/bounds_guard.h>

using namespace traj_tracking;

TEST(BoundsGuardTest, ClampsEachAxisIndependently) {
    BoundsRegion region(-2.4, 2.4, -1.8, 1.6);
    Eigen::Vector2d p = clamp(3.0, -5.0, region);
    EXPECT_DOUBLE_EQ(p(0), 2.4);
    EXPECT_DOUBLE_EQ(p(1), -1.8);

    p = clamp(0.3, 0.4, region);
    EXPECT_DOUBLE_EQ(p(0), 0.3);
    EXPECT_DOUBLE_EQ(p(1), 0.4);
}

TEST(BoundsGuardTest, ContainmentIsInclusive) {
    BoundsRegion region;
    EXPECT_TRUE(isWithin(2.4, 1.6, region));
    EXPECT_TRUE(isWithin(-2.4, -1.8, region));
    EXPECT_FALSE(isWithin(2.41, 0.0, region));
    EXPECT_FALSE(isWithin(0.0, 1.61, region));
}

TEST(BoundsGuardTest, RegionValidity) {
    EXPECT_TRUE(isValidRegion(BoundsRegion()));
    EXPECT_TRUE(isValidRegion(BoundsRegion(0, 0, 1, 1)));
    EXPECT_FALSE(isValidRegion(BoundsRegion(1, 0, 0, 1)));
}

TEST(BoundsGuardTest, TrajectoryOutsideRegionRejected) {
    Eigen::VectorXd t(2);
    t << 0.0, 1.0;
    Eigen::Matrix3Xd inside(3, 2);
    inside << -1.0, 1.0, 0.0, 1.5, 1.0, 1.0;
    EXPECT_NO_THROW(requireTrajectoryWithin(Trajectory(t, inside), BoundsRegion()));

    Eigen::Matrix3Xd outside_x(3, 2);
    outside_x << -1.0, 2.5, 0.0, 0.0, 1.0, 1.0;
    EXPECT_THROW(requireTrajectoryWithin(Trajectory(t, outside_x), BoundsRegion()), BoundsViolation);

    Eigen::Matrix3Xd outside_y(3, 2);
    outside_y << 0.0, 0.0, -1.9, 0.0, 1.0, 1.0;
    EXPECT_THROW(requireTrajectoryWithin(Trajectory(t, outside_y), BoundsRegion()), BoundsViolation);
}
