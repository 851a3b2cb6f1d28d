#include <ros/console.h>
#include <traj_tracking/trajectory_store.h>
#include <cmath>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <vector>

namespace traj_tracking {

namespace {
// 速度比较的相对容差，保证按 required_duration 缩放后的轨迹能通过复检
constexpr double kSpeedTolerance = 1e-9;
constexpr int kMinRows = 4;
constexpr int kVelocityRows = 7;

std::string trim(const std::string& s) {
    const char* ws = " \t\r\n";
    size_t b = s.find_first_not_of(ws);
    if (b == std::string::npos)
        return "";
    size_t e = s.find_last_not_of(ws);
    return s.substr(b, e - b + 1);
}

double parseCell(const std::string& cell, int row, int col) {
    std::string text = trim(cell);
    size_t used = 0;
    double value = 0.0;
    try {
        value = std::stod(text, &used);
    } catch (const std::exception&) {
        used = 0;
    }
    if (text.empty() || used != text.size() || !std::isfinite(value)) {
        std::ostringstream oss;
        oss << "non-numeric value '" << text << "' at row " << row + 1 << ", column " << col + 1;
        throw FormatError(oss.str());
    }
    return value;
}

std::string fmt3(double v) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(3) << v;
    return oss.str();
}

bool exceeds(double avg_speed, double max_allowed_speed) {
    return avg_speed > max_allowed_speed * (1.0 + kSpeedTolerance);
}
}  // namespace

Trajectory TrajectoryStore::load(const std::string& csv_file) {
    std::ifstream in(csv_file);
    if (!in.is_open())
        throw FormatError("failed to open trajectory file '" + csv_file + "'");
    ROS_INFO("[traj_store] loading trajectory from %s", csv_file.c_str());
    return parse(in);
}

Trajectory TrajectoryStore::parse(std::istream& in) {
    // 逐行读取，空行忽略
    std::vector<std::vector<double>> rows;
    std::string line;
    while (std::getline(in, line)) {
        if (trim(line).empty())
            continue;
        std::vector<double> row;
        std::stringstream ss(line);
        std::string cell;
        int col = 0;
        while (std::getline(ss, cell, ',')) {
            row.push_back(parseCell(cell, static_cast<int>(rows.size()), col));
            col++;
        }
        rows.push_back(row);
    }

    if (static_cast<int>(rows.size()) < kMinRows)
        throw FormatError("trajectory table should have at least " + std::to_string(kMinRows) + " rows, got " + std::to_string(rows.size()));

    const size_t n = rows[0].size();
    for (size_t r = 1; r < rows.size(); r++) {
        if (rows[r].size() != n)
            throw FormatError("trajectory table is not rectangular: row " + std::to_string(r + 1) + " has " + std::to_string(rows[r].size()) +
                              " columns, expected " + std::to_string(n));
    }
    if (n < 2)
        throw FormatError("trajectory needs at least 2 samples, got " + std::to_string(n));

    Eigen::VectorXd time(n);
    Eigen::Matrix3Xd positions(3, n);
    for (size_t i = 0; i < n; i++) {
        time(i) = rows[0][i];
        positions.col(i) << rows[1][i], rows[2][i], rows[3][i];
    }

    // 时间必须从 0 开始严格递增
    if (time(0) != 0.0)
        throw OrderError("trajectory time must start at 0, got " + fmt3(time(0)));
    for (size_t i = 1; i < n; i++) {
        if (!(time(i) > time(i - 1)))
            throw OrderError("trajectory time is not strictly increasing at sample " + std::to_string(i) + " (" + fmt3(time(i - 1)) + " -> " + fmt3(time(i)) +
                             ")");
    }

    Eigen::Matrix3Xd velocities;
    if (static_cast<int>(rows.size()) >= kVelocityRows) {
        velocities.resize(3, n);
        for (size_t i = 0; i < n; i++) {
            velocities.col(i) << rows[4][i], rows[5][i], rows[6][i];
        }
    }
    return Trajectory(time, positions, velocities);
}

double TrajectoryStore::computeAverageSpeed(const Trajectory& traj) {
    if (traj.size() < 2)
        throw DegenerateTrajectoryError("need at least 2 time points to compute speed");
    double total_time = traj.duration();
    if (total_time <= 0)
        throw DegenerateTrajectoryError("trajectory duration must be positive, got " + fmt3(total_time));
    return traj.pathLength() / total_time;
}

SpeedCheck TrajectoryStore::validateSpeed(const Trajectory& traj, const SpeedConstraint& constraint) {
    SpeedCheck check;
    check.avg_speed = computeAverageSpeed(traj);
    check.max_allowed_speed = constraint.maxAllowedSpeed();
    check.required_duration = traj.pathLength() / check.max_allowed_speed;
    check.ok = !exceeds(check.avg_speed, check.max_allowed_speed);
    return check;
}

SpeedCheck TrajectoryStore::requireSpeed(const Trajectory& traj, const SpeedConstraint& constraint) {
    SpeedCheck check = validateSpeed(traj, constraint);
    if (!check.ok) {
        std::string msg = "trajectory average speed (" + fmt3(check.avg_speed) + " m/s) exceeds safe limit (" + fmt3(check.max_allowed_speed) + " m/s at " +
                          fmt3(constraint.safety_margin * 100.0) + "% of speed limit " + fmt3(constraint.speed_limit) +
                          " m/s), increase flight time to at least " + fmt3(check.required_duration) + " s";
        throw SpeedLimitExceeded(msg, check.avg_speed, check.max_allowed_speed, check.required_duration);
    }
    return check;
}

Trajectory TrajectoryStore::scaleToDuration(const Trajectory& traj, double target_duration) {
    const int n = traj.size();
    if (n < 2)
        throw InvalidDurationError("need at least 2 time points to scale trajectory");
    if (!(target_duration > 0))
        throw InvalidDurationError("target duration must be positive, got " + fmt3(target_duration));

    // 均匀重排时间，末点精确等于 target_duration
    Eigen::VectorXd scaled(n);
    for (int i = 0; i < n; i++) {
        scaled(i) = static_cast<double>(i) / (n - 1) * target_duration;
    }
    scaled(n - 1) = target_duration;
    return traj.retimed(scaled);
}

Trajectory TrajectoryStore::buildReference(const std::string& csv_file, const boost::optional<double>& target_duration, const SpeedConstraint& constraint,
                                           bool auto_adjust) {
    return buildReference(load(csv_file), target_duration, constraint, auto_adjust);
}

Trajectory TrajectoryStore::buildReference(const Trajectory& raw, const boost::optional<double>& target_duration, const SpeedConstraint& constraint,
                                           bool auto_adjust) {
    boost::optional<double> flight_time = target_duration;
    if (flight_time && !(*flight_time > 0))
        throw InvalidDurationError("requested flight time must be positive, got " + fmt3(*flight_time));
    SpeedCheck check = validateSpeed(raw, constraint);

    if (!check.ok) {
        if (!flight_time) {
            if (!auto_adjust) {
                throw SpeedLimitExceeded("original trajectory too fast (avg " + fmt3(check.avg_speed) + " m/s > safe " + fmt3(check.max_allowed_speed) +
                                             " m/s), minimum flight time required: " + fmt3(check.required_duration) + " s",
                                         check.avg_speed, check.max_allowed_speed, check.required_duration);
            }
            ROS_WARN("[traj_store] original timing too fast, auto adjust flight time to %.3f s", check.required_duration);
            flight_time = check.required_duration;
        }
    }
    if (flight_time && *flight_time < check.required_duration && exceeds(raw.pathLength() / *flight_time, check.max_allowed_speed)) {
        if (!auto_adjust) {
            double avg = raw.pathLength() / *flight_time;
            throw SpeedLimitExceeded("flight time " + fmt3(*flight_time) + " s is too short, minimum required is " + fmt3(check.required_duration) + " s",
                                     avg, check.max_allowed_speed, check.required_duration);
        }
        ROS_WARN("[traj_store] flight time %.3f s too short, auto adjust to %.3f s", *flight_time, check.required_duration);
        flight_time = check.required_duration;
    }

    if (!flight_time) {
        ROS_INFO("[traj_store] keep original timing: %d samples, %.3f s, avg %.3f m/s", raw.size(), raw.duration(), check.avg_speed);
        return raw;
    }

    Trajectory scaled = scaleToDuration(raw, *flight_time);
    // 缩放后的复检失败说明计算逻辑有误，直接向上抛出
    SpeedCheck final_check = requireSpeed(scaled, constraint);
    ROS_INFO("[traj_store] trajectory scaled: %d samples, %.3f s, avg %.3f m/s (limit %.3f m/s)", scaled.size(), scaled.duration(), final_check.avg_speed,
             final_check.max_allowed_speed);
    return scaled;
}

}  // namespace traj_tracking
