#ifndef _TRAJ_TRACKING_TRAJECTORY_INTERPOLATOR_H
#define _TRAJ_TRACKING_TRAJECTORY_INTERPOLATOR_H

#include <traj_tracking/tracking_errors.h>
#include <traj_tracking/trajectory.h>
#include <Eigen/Dense>
#include <memory>

namespace traj_tracking {

/**
 * @brief 按时间查询参考轨迹上的期望位置
 * 各轴独立分段线性插值；t 超出 [t_min, t_max] 时按最近一段的斜率线性外推（不截断），
 * 需要截断时由调用方自行限制 t。无内部状态，相同输入总得到相同输出。
 */
class TrajectoryInterpolator {
   public:
    explicit TrajectoryInterpolator(std::shared_ptr<const Trajectory> traj) : traj_(traj) {}

    Eigen::Vector3d positionAt(double t) const { return positionAt(t, *traj_); }
    double duration() const { return traj_->duration(); }
    const Trajectory& trajectory() const { return *traj_; }

    static Eigen::Vector3d positionAt(double t, const Trajectory& traj);

   private:
    std::shared_ptr<const Trajectory> traj_;
};

}  // namespace traj_tracking

#endif
