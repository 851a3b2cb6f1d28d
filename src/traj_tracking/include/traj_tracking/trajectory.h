#ifndef _TRAJ_TRACKING_TRAJECTORY_H
#define _TRAJ_TRACKING_TRAJECTORY_H

#include <Eigen/Dense>

namespace traj_tracking {

/**
 * @brief 离散参考轨迹 (t, p)
 * 加载后不可修改；时间缩放通过 retimed() 生成新的副本。
 * 速度行 (CSV 第 5-7 行) 仅作参考保存，不参与跟踪。
 */
class Trajectory {
   public:
    Trajectory() {}
    Trajectory(const Eigen::VectorXd& time, const Eigen::Matrix3Xd& positions);
    Trajectory(const Eigen::VectorXd& time, const Eigen::Matrix3Xd& positions, const Eigen::Matrix3Xd& velocities);

    const Eigen::VectorXd& time() const { return time_; }
    const Eigen::Matrix3Xd& positions() const { return positions_; }
    const Eigen::Matrix3Xd& velocities() const { return velocities_; }
    bool hasVelocities() const { return velocities_.cols() > 0; }

    int size() const { return static_cast<int>(time_.size()); }
    double startTime() const;
    double endTime() const;
    double duration() const;
    // 相邻样本欧氏距离之和
    double pathLength() const;

    Eigen::Vector3d position(int i) const { return positions_.col(i); }
    Eigen::Vector3d firstPosition() const { return positions_.col(0); }

    // 保持位置不变，替换时间序列
    Trajectory retimed(const Eigen::VectorXd& new_time) const;

   private:
    Eigen::VectorXd time_;
    Eigen::Matrix3Xd positions_;
    Eigen::Matrix3Xd velocities_;
};

// 速度约束：max_allowed_speed = speed_limit * safety_margin
struct SpeedConstraint {
    double speed_limit = 1.0;
    double safety_margin = 0.8;

    SpeedConstraint() {}
    SpeedConstraint(double limit, double margin) : speed_limit(limit), safety_margin(margin) {}

    double maxAllowedSpeed() const { return speed_limit * safety_margin; }
};

// 速度校验结果
struct SpeedCheck {
    bool ok = false;
    double avg_speed = 0.0;
    double max_allowed_speed = 0.0;
    double required_duration = 0.0;  // 路径长度 / 最大允许速度
};

}  // namespace traj_tracking

#endif
