#ifndef _TRAJ_TRACKING_BOUNDS_GUARD_H
#define _TRAJ_TRACKING_BOUNDS_GUARD_H

#include <traj_tracking/tracking_errors.h>
#include <traj_tracking/trajectory.h>
#include <Eigen/Dense>

namespace traj_tracking {

// 实验场地 XY 安全区域
struct BoundsRegion {
    double x_min = -2.4;
    double x_max = 2.4;
    double y_min = -1.8;
    double y_max = 1.6;

    BoundsRegion() {}
    BoundsRegion(double xmin, double xmax, double ymin, double ymax) : x_min(xmin), x_max(xmax), y_min(ymin), y_max(ymax) {}
};

bool isValidRegion(const BoundsRegion& region);

// 各轴独立截断到 [min, max]，不做对角缩放
Eigen::Vector2d clamp(double x, double y, const BoundsRegion& region);

// 闭区间包含判断，用于中止决策（越界即降落，不做静默截断）
bool isWithin(double x, double y, const BoundsRegion& region);

// 起飞前检查整条轨迹，越界抛出 BoundsViolation
void requireTrajectoryWithin(const Trajectory& traj, const BoundsRegion& region);

}  // namespace traj_tracking

#endif
