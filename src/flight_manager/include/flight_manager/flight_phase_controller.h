#ifndef _FLIGHT_MANAGER_FLIGHT_PHASE_CONTROLLER_H
#define _FLIGHT_MANAGER_FLIGHT_PHASE_CONTROLLER_H

#include <flight_manager/input_source.h>
#include <flight_manager/step_outcome.h>
#include <flight_manager/vehicle_link.h>
#include <traj_tracking/bounds_guard.h>
#include <traj_tracking/flight_data.h>
#include <traj_tracking/trajectory_interpolator.h>
#include <Eigen/Dense>
#include <memory>
#include <string>
#include <vector>

namespace traj_tracking {

enum class FlightPhase { TAKEOFF, STABILIZING, TRACKING, LANDING, DONE, ABORTED };

enum class AbortReason {
    NONE,
    STOP_REQUEST,
    UNSAFE,
    BOUNDS_VIOLATION,
    POSE_TIMEOUT,
    TAKEOFF_TIMEOUT,
    STABILIZE_TIMEOUT,
    INTERPOLATION_FAILURE
};

enum class FlightMode { TRACKING, TELEOP };

const char* toString(FlightPhase phase);
const char* toString(AbortReason reason);

struct FlightFsmParams {
    double takeoff_timeout = 12.0;
    double takeoff_altitude = 0.4;  // 起飞完成高度，实际取 min(takeoff_altitude, 0.5 * target.z)
    double hover_height = 1.0;      // 遥控模式悬停高度
    double min_hover_time = 2.0;    // 从起飞开始计
    double stable_tolerance = 0.30;
    double stabilize_timeout = 10.0;
    double landing_altitude = 0.1;
    double landing_timeout = 5.0;

    double teleop_step = 0.002;  // m / tick
    double climb_step = 0.002;   // m / tick
    double min_altitude = 0.3;
    double max_altitude = 1.5;
    double max_flight_time = 100.0;  // 从悬停结束开始计

    double progress_period = 2.0;
};

/**
 * @brief 机群飞行阶段状态机
 *
 * TAKEOFF -> STABILIZING -> TRACKING -> LANDING -> DONE
 * 任一阶段中止（停止请求、不安全、越界、超时、插值失败）都先进入 LANDING，降落结束后为 ABORTED。
 * 每个控制周期调用一次 tick(now)，now 为单调时钟秒数；机群共用一个阶段，各机按顺序处理。
 */
class FlightPhaseController {
   public:
    // 轨迹跟踪模式：每架飞机一条参考轨迹
    FlightPhaseController(const std::vector<std::shared_ptr<VehicleLink>>& vehicles, const std::vector<TrajectoryInterpolator>& references,
                          const BoundsRegion& region, const FlightFsmParams& params, std::shared_ptr<InputSource> input = nullptr);
    // 遥控模式：目标由操作员输入驱动
    FlightPhaseController(const std::vector<std::shared_ptr<VehicleLink>>& vehicles, const BoundsRegion& region, const FlightFsmParams& params,
                          std::shared_ptr<InputSource> input);

    void start(double now);
    FlightPhase tick(double now);
    // 外部停止请求，下一个周期生效
    void requestStop() { stop_requested_ = true; }

    FlightPhase phase() const { return phase_; }
    AbortReason abortReason() const { return abort_reason_; }
    FlightMode mode() const { return mode_; }
    bool isFinished() const { return phase_ == FlightPhase::DONE || phase_ == FlightPhase::ABORTED; }

    size_t vehicleCount() const { return vehicles_.size(); }
    bool hasTarget(size_t i) const { return states_[i].has_target; }
    const Eigen::Vector3d& target(size_t i) const { return states_[i].target; }
    bool isStable(size_t i) const { return states_[i].stable; }
    double hoverTime() const { return hover_time_; }
    double trajectoryDuration() const { return max_duration_; }

    const FlightDataRecorder& recorder(size_t i) const { return recorders_[i]; }
    const std::vector<FlightDataRecorder>& recorders() const { return recorders_; }

   private:
    struct VehicleState {
        bool has_target = false;
        Eigen::Vector3d target = Eigen::Vector3d::Zero();
        bool stable = false;
        bool landed = false;
    };

    FlightMode mode_;
    std::vector<std::shared_ptr<VehicleLink>> vehicles_;
    std::vector<TrajectoryInterpolator> references_;
    BoundsRegion region_;
    FlightFsmParams params_;
    std::shared_ptr<InputSource> input_;

    std::vector<VehicleState> states_;
    std::vector<FlightDataRecorder> recorders_;

    FlightPhase phase_ = FlightPhase::TAKEOFF;
    AbortReason abort_reason_ = AbortReason::NONE;
    bool started_ = false;
    bool stop_requested_ = false;
    double start_time_ = 0.0;
    double stabilize_start_ = 0.0;
    double hover_time_ = 0.0;
    double landing_start_ = 0.0;
    double max_duration_ = 0.0;
    double last_progress_ = 0.0;
    OperatorCommand command_;

    void init();
    bool checkSafety(double now);
    void stepTakeoff(double now, double elapsed);
    void stepStabilizing(double now, double elapsed);
    void stepTracking(double now, double elapsed);
    void stepTeleop(double now, double elapsed);
    void stepLanding(double now);

    StepOutcome pollInput(double now);
    StepOutcome interpolate(size_t i, double t, Eigen::Vector3d& desired) const;
    StepOutcome record(size_t i, double t, const VehiclePose& pose);
    // 按策略处理步骤结果，返回 false 表示已转入降落
    bool handle(const StepOutcome& outcome, FailurePolicy policy, AbortReason reason, double now);

    void beginLanding(double now);
    void abort(AbortReason reason, double now);
    void finish();
};

}  // namespace traj_tracking

#endif
