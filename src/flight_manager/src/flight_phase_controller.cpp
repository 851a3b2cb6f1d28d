#include <flight_manager/flight_phase_controller.h>
#include <ros/console.h>
#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace traj_tracking {

const char* toString(FlightPhase phase) {
    switch (phase) {
        case FlightPhase::TAKEOFF:
            return "TAKEOFF";
        case FlightPhase::STABILIZING:
            return "STABILIZING";
        case FlightPhase::TRACKING:
            return "TRACKING";
        case FlightPhase::LANDING:
            return "LANDING";
        case FlightPhase::DONE:
            return "DONE";
        case FlightPhase::ABORTED:
            return "ABORTED";
    }
    return "UNKNOWN";
}

const char* toString(AbortReason reason) {
    switch (reason) {
        case AbortReason::NONE:
            return "NONE";
        case AbortReason::STOP_REQUEST:
            return "STOP_REQUEST";
        case AbortReason::UNSAFE:
            return "UNSAFE";
        case AbortReason::BOUNDS_VIOLATION:
            return "BOUNDS_VIOLATION";
        case AbortReason::POSE_TIMEOUT:
            return "POSE_TIMEOUT";
        case AbortReason::TAKEOFF_TIMEOUT:
            return "TAKEOFF_TIMEOUT";
        case AbortReason::STABILIZE_TIMEOUT:
            return "STABILIZE_TIMEOUT";
        case AbortReason::INTERPOLATION_FAILURE:
            return "INTERPOLATION_FAILURE";
    }
    return "UNKNOWN";
}

FlightPhaseController::FlightPhaseController(const std::vector<std::shared_ptr<VehicleLink>>& vehicles,
                                             const std::vector<TrajectoryInterpolator>& references, const BoundsRegion& region,
                                             const FlightFsmParams& params, std::shared_ptr<InputSource> input)
    : mode_(FlightMode::TRACKING), vehicles_(vehicles), references_(references), region_(region), params_(params), input_(input) {
    if (references_.size() != vehicles_.size())
        throw std::invalid_argument("one reference trajectory is required per vehicle");
    for (size_t i = 0; i < references_.size(); i++) max_duration_ = std::max(max_duration_, references_[i].duration());
    init();
}

FlightPhaseController::FlightPhaseController(const std::vector<std::shared_ptr<VehicleLink>>& vehicles, const BoundsRegion& region,
                                             const FlightFsmParams& params, std::shared_ptr<InputSource> input)
    : mode_(FlightMode::TELEOP), vehicles_(vehicles), region_(region), params_(params), input_(input) {
    if (!input_)
        throw std::invalid_argument("teleop mode requires an input source");
    init();
}

void FlightPhaseController::init() {
    if (vehicles_.empty())
        throw std::invalid_argument("vehicle list is empty");
    for (size_t i = 0; i < vehicles_.size(); i++) {
        if (!vehicles_[i])
            throw std::invalid_argument("null vehicle link");
    }
    if (!isValidRegion(region_))
        throw std::invalid_argument("invalid safety region");
    states_.resize(vehicles_.size());
    for (size_t i = 0; i < vehicles_.size(); i++) recorders_.emplace_back(static_cast<int>(i));
}

void FlightPhaseController::start(double now) {
    start_time_ = now;
    last_progress_ = now;
    started_ = true;
    ROS_INFO("[flight_fsm] %zu vehicle(s), mode %s, taking off", vehicles_.size(), mode_ == FlightMode::TRACKING ? "TRACKING" : "TELEOP");
}

FlightPhase FlightPhaseController::tick(double now) {
    if (isFinished())
        return phase_;
    if (!started_)
        start(now);
    double elapsed = now - start_time_;

    if (phase_ != FlightPhase::LANDING) {
        handle(pollInput(now), FailurePolicy::IGNORE_AND_CONTINUE, AbortReason::NONE, now);
        if (!checkSafety(now))
            return phase_;
    }

    switch (phase_) {
        case FlightPhase::TAKEOFF:
            stepTakeoff(now, elapsed);
            break;
        case FlightPhase::STABILIZING:
            stepStabilizing(now, elapsed);
            break;
        case FlightPhase::TRACKING:
            if (mode_ == FlightMode::TRACKING)
                stepTracking(now, elapsed);
            else
                stepTeleop(now, elapsed);
            break;
        case FlightPhase::LANDING:
            stepLanding(now);
            break;
        default:
            break;
    }
    return phase_;
}

StepOutcome FlightPhaseController::pollInput(double now) {
    command_ = OperatorCommand();
    if (!input_)
        return StepOutcome::success();
    try {
        command_ = input_->poll(now);
    } catch (const std::exception& e) {
        command_ = OperatorCommand();
        return StepOutcome::failure(std::string("input read failed: ") + e.what());
    }
    return StepOutcome::success();
}

bool FlightPhaseController::checkSafety(double now) {
    // 遥控模式下操作员停止属于正常结束，由 stepTeleop 处理
    bool operator_landing = mode_ == FlightMode::TELEOP && phase_ == FlightPhase::TRACKING && command_.stop;
    if (stop_requested_ || (command_.stop && !operator_landing)) {
        abort(AbortReason::STOP_REQUEST, now);
        return false;
    }
    for (size_t i = 0; i < vehicles_.size(); i++) {
        if (!vehicles_[i]->isSafe()) {
            ROS_ERROR("[flight_fsm] %s reports unsafe state", vehicles_[i]->name().c_str());
            abort(AbortReason::UNSAFE, now);
            return false;
        }
        boost::optional<VehiclePose> pose = vehicles_[i]->pose();
        if (pose && !isWithin(pose->position(0), pose->position(1), region_)) {
            ROS_ERROR("[flight_fsm] %s at (%.2f, %.2f) left the safety region", vehicles_[i]->name().c_str(), pose->position(0),
                      pose->position(1));
            abort(AbortReason::BOUNDS_VIOLATION, now);
            return false;
        }
    }
    return true;
}

void FlightPhaseController::stepTakeoff(double now, double elapsed) {
    bool all_ready = true;
    bool all_targets = true;
    for (size_t i = 0; i < vehicles_.size(); i++) {
        VehicleState& s = states_[i];
        boost::optional<VehiclePose> pose = vehicles_[i]->pose();

        // 只有观测到真实位姿后才建立目标，避免向原点跳变
        if (!s.has_target && pose) {
            if (mode_ == FlightMode::TRACKING) {
                s.target = references_[i].trajectory().firstPosition();
            } else {
                s.target = Eigen::Vector3d(pose->position(0), pose->position(1), params_.hover_height);
            }
            s.has_target = true;
            ROS_INFO("[flight_fsm] %s takeoff target (%.2f, %.2f, %.2f)", vehicles_[i]->name().c_str(), s.target(0), s.target(1),
                     s.target(2));
        }
        if (!s.has_target) {
            all_targets = false;
            all_ready = false;
            continue;
        }
        vehicles_[i]->sendPositionSetpoint(s.target);

        double threshold = std::min(params_.takeoff_altitude, 0.5 * s.target(2));
        if (!pose || pose->position(2) <= threshold)
            all_ready = false;
    }

    if (all_ready) {
        phase_ = FlightPhase::STABILIZING;
        stabilize_start_ = now;
        ROS_INFO("[flight_fsm] takeoff complete at t=%.2f, stabilizing", elapsed);
        return;
    }
    if (elapsed >= params_.takeoff_timeout) {
        if (!all_targets) {
            ROS_ERROR("[flight_fsm] no valid pose within %.1f s, landing for safety", params_.takeoff_timeout);
            abort(AbortReason::POSE_TIMEOUT, now);
        } else {
            ROS_ERROR("[flight_fsm] takeoff altitude not reached within %.1f s", params_.takeoff_timeout);
            abort(AbortReason::TAKEOFF_TIMEOUT, now);
        }
    }
}

void FlightPhaseController::stepStabilizing(double now, double elapsed) {
    bool all_stable = true;
    for (size_t i = 0; i < vehicles_.size(); i++) {
        VehicleState& s = states_[i];
        vehicles_[i]->sendPositionSetpoint(s.target);

        boost::optional<VehiclePose> pose = vehicles_[i]->pose();
        bool stable = pose && (pose->position - s.target).norm() < params_.stable_tolerance && elapsed >= params_.min_hover_time;
        if (stable && !s.stable)
            ROS_INFO("[flight_fsm] %s stable at t=%.2f", vehicles_[i]->name().c_str(), elapsed);
        s.stable = stable;
        if (!stable)
            all_stable = false;
    }

    if (all_stable) {
        // 最后一架稳定的时刻作为机群共同的轨迹零点
        hover_time_ = elapsed;
        phase_ = FlightPhase::TRACKING;
        last_progress_ = now;
        ROS_INFO("[flight_fsm] all vehicles stable, hover time %.2f s", hover_time_);
        if (mode_ == FlightMode::TRACKING)
            stepTracking(now, elapsed);
        else
            stepTeleop(now, elapsed);
        return;
    }
    if (now - stabilize_start_ >= params_.stabilize_timeout) {
        ROS_ERROR("[flight_fsm] vehicles not stable within %.1f s", params_.stabilize_timeout);
        abort(AbortReason::STABILIZE_TIMEOUT, now);
    }
}

StepOutcome FlightPhaseController::interpolate(size_t i, double t, Eigen::Vector3d& desired) const {
    try {
        desired = references_[i].positionAt(t);
    } catch (const TrajectoryError& e) {
        return StepOutcome::failure(e.what());
    }
    if (!desired.allFinite())
        return StepOutcome::failure("interpolated setpoint is not finite");
    return StepOutcome::success();
}

StepOutcome FlightPhaseController::record(size_t i, double t, const VehiclePose& pose) {
    if (!recorders_[i].recordState(t, pose, states_[i].target))
        return StepOutcome::failure("recorder rejected sample");
    return StepOutcome::success();
}

bool FlightPhaseController::handle(const StepOutcome& outcome, FailurePolicy policy, AbortReason reason, double now) {
    if (outcome.ok)
        return true;
    if (policy == FailurePolicy::IGNORE_AND_CONTINUE) {
        ROS_WARN("[flight_fsm] %s, ignored", outcome.error.c_str());
        return true;
    }
    ROS_ERROR("[flight_fsm] %s, aborting", outcome.error.c_str());
    abort(reason, now);
    return false;
}

void FlightPhaseController::stepTracking(double now, double elapsed) {
    double traj_time = elapsed - hover_time_;
    if (traj_time > max_duration_) {
        ROS_INFO("[flight_fsm] trajectory completed (%.2f s), landing", max_duration_);
        beginLanding(now);
        return;
    }

    for (size_t i = 0; i < vehicles_.size(); i++) {
        // 较短的轨迹到终点后保持最后一个航点
        double t = std::min(traj_time, references_[i].duration());
        Eigen::Vector3d desired;
        if (!handle(interpolate(i, t, desired), FailurePolicy::ABORT_TO_LANDING, AbortReason::INTERPOLATION_FAILURE, now))
            return;
        states_[i].target = desired;
        vehicles_[i]->sendPositionSetpoint(desired);

        boost::optional<VehiclePose> pose = vehicles_[i]->pose();
        if (traj_time >= 0 && pose)
            handle(record(i, traj_time, *pose), FailurePolicy::IGNORE_AND_CONTINUE, AbortReason::NONE, now);
    }

    if (now - last_progress_ >= params_.progress_period) {
        last_progress_ = now;
        ROS_INFO("[flight_fsm] tracking %.1f / %.1f s", traj_time, max_duration_);
    }
}

void FlightPhaseController::stepTeleop(double now, double elapsed) {
    double flight_time = elapsed - hover_time_;
    if (command_.stop) {
        ROS_INFO("[flight_fsm] operator requested landing");
        beginLanding(now);
        return;
    }
    if (flight_time > params_.max_flight_time) {
        ROS_INFO("[flight_fsm] max flight time reached (%.1f s), landing", params_.max_flight_time);
        beginLanding(now);
        return;
    }

    for (size_t i = 0; i < vehicles_.size(); i++) {
        VehicleState& s = states_[i];
        Eigen::Vector2d xy = s.target.head<2>() + command_.direction * params_.teleop_step;
        s.target.head<2>() = clamp(xy(0), xy(1), region_);
        double z = s.target(2) + command_.climb * params_.climb_step;
        s.target(2) = std::min(std::max(z, params_.min_altitude), params_.max_altitude);
        vehicles_[i]->sendPositionSetpoint(s.target);

        boost::optional<VehiclePose> pose = vehicles_[i]->pose();
        if (pose)
            handle(record(i, flight_time, *pose), FailurePolicy::IGNORE_AND_CONTINUE, AbortReason::NONE, now);
    }

    if (now - last_progress_ >= params_.progress_period) {
        last_progress_ = now;
        ROS_INFO("[flight_fsm] teleop %.1f s, target (%.2f, %.2f, %.2f)", flight_time, states_[0].target(0), states_[0].target(1),
                 states_[0].target(2));
    }
}

void FlightPhaseController::stepLanding(double now) {
    bool all_down = true;
    for (size_t i = 0; i < vehicles_.size(); i++) {
        VehicleState& s = states_[i];
        if (s.landed)
            continue;
        boost::optional<VehiclePose> pose = vehicles_[i]->pose();
        if (pose && pose->position(2) < params_.landing_altitude) {
            s.landed = true;
            ROS_INFO("[flight_fsm] %s landed", vehicles_[i]->name().c_str());
            continue;
        }
        // 无位姿的飞机同样发送降落指令
        vehicles_[i]->landInPlace();
        all_down = false;
    }

    if (all_down) {
        finish();
        return;
    }
    if (now - landing_start_ >= params_.landing_timeout) {
        ROS_WARN("[flight_fsm] landing not confirmed within %.1f s, forcing exit", params_.landing_timeout);
        finish();
    }
}

void FlightPhaseController::beginLanding(double now) {
    phase_ = FlightPhase::LANDING;
    landing_start_ = now;
    stepLanding(now);
}

void FlightPhaseController::abort(AbortReason reason, double now) {
    if (abort_reason_ == AbortReason::NONE)
        abort_reason_ = reason;
    ROS_ERROR("[flight_fsm] abort: %s, landing", toString(reason));
    beginLanding(now);
}

void FlightPhaseController::finish() {
    phase_ = abort_reason_ == AbortReason::NONE ? FlightPhase::DONE : FlightPhase::ABORTED;
    for (size_t i = 0; i < recorders_.size(); i++) recorders_[i].finalize();
    ROS_INFO("[flight_fsm] flight finished: %s", toString(phase_));
}

}  // namespace traj_tracking
