#include <traj_tracking/tracking_errors.h>
#include <traj_tracking/trajectory.h>

namespace traj_tracking {

Trajectory::Trajectory(const Eigen::VectorXd& time, const Eigen::Matrix3Xd& positions) : time_(time), positions_(positions) {
    if (positions_.cols() != time_.size())
        throw FormatError("trajectory has " + std::to_string(time_.size()) + " time samples but " + std::to_string(positions_.cols()) + " positions");
}

Trajectory::Trajectory(const Eigen::VectorXd& time, const Eigen::Matrix3Xd& positions, const Eigen::Matrix3Xd& velocities)
    : Trajectory(time, positions) {
    if (velocities.cols() != 0 && velocities.cols() != time_.size())
        throw FormatError("trajectory velocity rows have " + std::to_string(velocities.cols()) + " columns, expected " + std::to_string(time_.size()));
    velocities_ = velocities;
}

double Trajectory::startTime() const {
    return time_.size() > 0 ? time_(0) : 0.0;
}

double Trajectory::endTime() const {
    return time_.size() > 0 ? time_(time_.size() - 1) : 0.0;
}

double Trajectory::duration() const {
    return endTime() - startTime();
}

double Trajectory::pathLength() const {
    double length = 0.0;
    for (int i = 1; i < positions_.cols(); i++) {
        length += (positions_.col(i) - positions_.col(i - 1)).norm();
    }
    return length;
}

Trajectory Trajectory::retimed(const Eigen::VectorXd& new_time) const {
    return Trajectory(new_time, positions_, velocities_);
}

}  // namespace traj_tracking
