#include <ros/console.h>
#include <traj_tracking/bounds_guard.h>
#include <algorithm>
#include <cstdio>

namespace traj_tracking {

bool isValidRegion(const BoundsRegion& region) {
    return region.x_min <= region.x_max && region.y_min <= region.y_max;
}

Eigen::Vector2d clamp(double x, double y, const BoundsRegion& region) {
    return Eigen::Vector2d(std::min(std::max(x, region.x_min), region.x_max), std::min(std::max(y, region.y_min), region.y_max));
}

bool isWithin(double x, double y, const BoundsRegion& region) {
    return region.x_min <= x && x <= region.x_max && region.y_min <= y && y <= region.y_max;
}

void requireTrajectoryWithin(const Trajectory& traj, const BoundsRegion& region) {
    if (traj.size() == 0)
        return;
    Eigen::Vector3d lo = traj.positions().rowwise().minCoeff();
    Eigen::Vector3d hi = traj.positions().rowwise().maxCoeff();
    char buf[160];
    if (lo(0) < region.x_min || hi(0) > region.x_max) {
        std::snprintf(buf, sizeof(buf), "trajectory X values [%.2f, %.2f] exceed region limits (%.2f, %.2f)", lo(0), hi(0), region.x_min, region.x_max);
        throw BoundsViolation(buf);
    }
    if (lo(1) < region.y_min || hi(1) > region.y_max) {
        std::snprintf(buf, sizeof(buf), "trajectory Y values [%.2f, %.2f] exceed region limits (%.2f, %.2f)", lo(1), hi(1), region.y_min, region.y_max);
        throw BoundsViolation(buf);
    }
    ROS_INFO("[bounds] trajectory validated within X(%.2f, %.2f) Y(%.2f, %.2f)", region.x_min, region.x_max, region.y_min, region.y_max);
}

}  // namespace traj_tracking
