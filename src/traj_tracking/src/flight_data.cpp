#include <ros/console.h>
#include <traj_tracking/flight_data.h>
#include <boost/filesystem.hpp>
#include <cmath>
#include <cstdio>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <limits>
#include <stdexcept>

namespace traj_tracking {

bool FlightDataRecorder::recordState(double t, const VehiclePose& actual, const Eigen::Vector3d& desired) {
    if (finalized_) {
        ROS_WARN("[recorder] cf_%02d recording is finalized, sample at t=%.3f dropped", vehicle_idx_, t);
        return false;
    }
    FlightSample sample;
    sample.t = t;
    sample.actual_position = actual.position;
    sample.actual_velocity = actual.velocity;
    sample.desired_position = desired;
    samples_.push_back(sample);
    return true;
}

std::string FlightDataRecorder::saveToCsv(const std::string& save_dir) const {
    boost::filesystem::create_directories(save_dir);

    // 文件名带时间戳，避免覆盖
    std::time_t now = std::time(nullptr);
    std::tm tm_now;
    localtime_r(&now, &tm_now);
    char time_str[32];
    std::strftime(time_str, sizeof(time_str), "%Y%m%d%H%M%S", &tm_now);
    char name[64];
    std::snprintf(name, sizeof(name), "cf_%02d_%s.csv", vehicle_idx_, time_str);
    std::string file_name = (boost::filesystem::path(save_dir) / name).string();

    std::ofstream out(file_name);
    if (!out.is_open())
        throw std::runtime_error("failed to open '" + file_name + "' for writing");
    out << std::setprecision(17);

    const double nan = std::numeric_limits<double>::quiet_NaN();
    // 共 10 行：time, 实际位置 3 行, 实际速度 3 行, 期望位置 3 行
    for (int row = 0; row < 10; row++) {
        for (size_t i = 0; i < samples_.size(); i++) {
            const FlightSample& s = samples_[i];
            double v;
            if (row == 0)
                v = s.t;
            else if (row <= 3)
                v = s.actual_position(row - 1);
            else if (row <= 6)
                v = s.actual_velocity ? (*s.actual_velocity)(row - 4) : nan;
            else
                v = s.desired_position(row - 7);
            if (i > 0)
                out << ',';
            out << v;
        }
        out << '\n';
    }
    if (!out)
        throw std::runtime_error("failed while writing '" + file_name + "'");

    ROS_INFO("[recorder] flight data saved to: %s", file_name.c_str());
    return file_name;
}

Eigen::Matrix3Xd FlightDataAnalyzer::computeTrackingError() const {
    Eigen::Matrix3Xd error(3, samples_.size());
    for (size_t i = 0; i < samples_.size(); i++) {
        error.col(i) = samples_[i].desired_position - samples_[i].actual_position;
    }
    return error;
}

FlightStatistics FlightDataAnalyzer::getStatistics() const {
    FlightStatistics stats;
    stats.num_samples = static_cast<int>(samples_.size());
    if (samples_.empty())
        return stats;

    Eigen::Matrix3Xd error = computeTrackingError();
    Eigen::Matrix3Xd abs_error = error.cwiseAbs();
    const double n = static_cast<double>(samples_.size());

    stats.total_time = samples_.back().t;
    stats.pos_rms_error = (error.cwiseProduct(error).rowwise().sum() / n).cwiseSqrt();
    stats.pos_mean_error = abs_error.rowwise().sum() / n;
    stats.pos_max_error = abs_error.rowwise().maxCoeff();
    return stats;
}

}  // namespace traj_tracking
