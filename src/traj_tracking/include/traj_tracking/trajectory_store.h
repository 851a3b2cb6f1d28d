#ifndef _TRAJ_TRACKING_TRAJECTORY_STORE_H
#define _TRAJ_TRACKING_TRAJECTORY_STORE_H

#include <traj_tracking/tracking_errors.h>
#include <traj_tracking/trajectory.h>
#include <boost/optional.hpp>
#include <istream>
#include <string>

namespace traj_tracking {

/**
 * @brief 参考轨迹的加载、速度校验与时间缩放
 *
 * CSV 格式：无表头，逗号分隔，至少 4 行
 *   第 1 行：时间 (s)，从 0 开始严格递增
 *   第 2-4 行：x, y, z (m)
 *   第 5-7 行（可选）：vx, vy, vz，仅保存不参与跟踪
 * 每一列为一个采样点。
 */
class TrajectoryStore {
   public:
    static Trajectory load(const std::string& csv_file);
    static Trajectory parse(std::istream& in);

    static double computeAverageSpeed(const Trajectory& traj);

    // 不抛异常的校验
    static SpeedCheck validateSpeed(const Trajectory& traj, const SpeedConstraint& constraint);
    // 违反约束时抛出 SpeedLimitExceeded
    static SpeedCheck requireSpeed(const Trajectory& traj, const SpeedConstraint& constraint);

    // t_i = i / (n-1) * target_duration
    static Trajectory scaleToDuration(const Trajectory& traj, double target_duration);

    /**
     * @brief 加载 -> 校验 -> (自动调整) -> 缩放 -> 再校验
     * @param target_duration 期望飞行时间，为空时保留原始时间
     * @param auto_adjust 时长不足时是否自动提高到最短安全时长
     */
    static Trajectory buildReference(const std::string& csv_file, const boost::optional<double>& target_duration, const SpeedConstraint& constraint,
                                     bool auto_adjust);
    static Trajectory buildReference(const Trajectory& raw, const boost::optional<double>& target_duration, const SpeedConstraint& constraint,
                                     bool auto_adjust);
};

}  // namespace traj_tracking

#endif
