#ifndef _TRAJ_TRACKING_TRACKING_ERRORS_H
#define _TRAJ_TRACKING_TRACKING_ERRORS_H

#include <stdexcept>
#include <string>

namespace traj_tracking {

// 轨迹相关错误的基类：加载、校验、缩放阶段抛出，起飞前即终止
class TrajectoryError : public std::runtime_error {
   public:
    explicit TrajectoryError(const std::string& message) : std::runtime_error(message) {}
};

// CSV 表格格式错误（行数不足、行长度不一致、非数字等）
class FormatError : public TrajectoryError {
   public:
    explicit FormatError(const std::string& message) : TrajectoryError(message) {}
};

// 时间序列不是从 0 开始严格递增
class OrderError : public TrajectoryError {
   public:
    explicit OrderError(const std::string& message) : TrajectoryError(message) {}
};

// 样本数不足或总时长不为正
class DegenerateTrajectoryError : public TrajectoryError {
   public:
    explicit DegenerateTrajectoryError(const std::string& message) : TrajectoryError(message) {}
};

class InvalidDurationError : public TrajectoryError {
   public:
    explicit InvalidDurationError(const std::string& message) : TrajectoryError(message) {}
};

/**
 * @brief 轨迹平均速度超过安全速度
 * 携带校验结果，required_duration 为满足约束的最短飞行时间
 */
class SpeedLimitExceeded : public TrajectoryError {
   public:
    double avg_speed;
    double max_allowed_speed;
    double required_duration;

    SpeedLimitExceeded(const std::string& message, double avg_speed, double max_allowed_speed, double required_duration)
        : TrajectoryError(message), avg_speed(avg_speed), max_allowed_speed(max_allowed_speed), required_duration(required_duration) {}
};

// 轨迹点或位姿超出安全区域
class BoundsViolation : public TrajectoryError {
   public:
    explicit BoundsViolation(const std::string& message) : TrajectoryError(message) {}
};

// 插值失败（非有限时间、零长度段等），飞行中出现时必须降落
class InterpolationFailure : public TrajectoryError {
   public:
    explicit InterpolationFailure(const std::string& message) : TrajectoryError(message) {}
};

}  // namespace traj_tracking

#endif
