#include <traj_tracking/trajectory_interpolator.h>
#include <algorithm>
#include <cmath>
#include <string>

namespace traj_tracking {

Eigen::Vector3d TrajectoryInterpolator::positionAt(double t, const Trajectory& traj) {
    const int n = traj.size();
    if (n < 2)
        throw InterpolationFailure("trajectory has " + std::to_string(n) + " samples, at least 2 required");
    if (!std::isfinite(t))
        throw InterpolationFailure("query time is not finite");

    const Eigen::VectorXd& time = traj.time();
    // 定位所在段 [seg, seg+1]，两端超出时使用首段/末段外推
    int seg;
    if (t <= time(0)) {
        seg = 0;
    } else if (t >= time(n - 1)) {
        seg = n - 2;
    } else {
        const double* begin = time.data();
        const double* it = std::upper_bound(begin, begin + n, t);
        seg = static_cast<int>(it - begin) - 1;
    }

    double dur = time(seg + 1) - time(seg);
    if (!(dur > 0))
        throw InterpolationFailure("zero-length trajectory segment at sample " + std::to_string(seg));

    double ratio = (t - time(seg)) / dur;
    const Eigen::Matrix3Xd& pos = traj.positions();
    return pos.col(seg) + ratio * (pos.col(seg + 1) - pos.col(seg));
}

}  // namespace traj_tracking
