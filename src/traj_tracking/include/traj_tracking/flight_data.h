#ifndef _TRAJ_TRACKING_FLIGHT_DATA_H
#define _TRAJ_TRACKING_FLIGHT_DATA_H

#include <Eigen/Dense>
#include <boost/optional.hpp>
#include <string>
#include <vector>

namespace traj_tracking {

// 外部定位服务给出的位姿（位置 + 可选速度）
struct VehiclePose {
    Eigen::Vector3d position = Eigen::Vector3d::Zero();
    boost::optional<Eigen::Vector3d> velocity;

    VehiclePose() {}
    explicit VehiclePose(const Eigen::Vector3d& p) : position(p) {}
    VehiclePose(const Eigen::Vector3d& p, const Eigen::Vector3d& v) : position(p), velocity(v) {}
};

// 单个记录样本：时间、实际位置/速度、期望位置
struct FlightSample {
    double t;
    Eigen::Vector3d actual_position;
    boost::optional<Eigen::Vector3d> actual_velocity;
    Eigen::Vector3d desired_position;
};

/**
 * @brief 飞行数据记录器
 * 只在 TRACKING 且轨迹时间非负时追加样本；finalize() 之后只读。
 */
class FlightDataRecorder {
   public:
    explicit FlightDataRecorder(int vehicle_idx) : vehicle_idx_(vehicle_idx) {}

    // 追加一条记录，已 finalize 时拒绝并返回 false
    bool recordState(double t, const VehiclePose& actual, const Eigen::Vector3d& desired);
    void finalize() { finalized_ = true; }
    bool isFinalized() const { return finalized_; }

    int vehicleIndex() const { return vehicle_idx_; }
    const std::vector<FlightSample>& samples() const { return samples_; }
    size_t size() const { return samples_.size(); }

    /**
     * @brief 保存为 CSV，文件名 cf_<idx>_<时间戳>.csv
     * 行布局：time; x,y,z 实际; vx,vy,vz 实际; x,y,z 期望；每列一个样本
     * @return 写入的文件路径
     */
    std::string saveToCsv(const std::string& save_dir) const;

   private:
    int vehicle_idx_;
    bool finalized_ = false;
    std::vector<FlightSample> samples_;
};

struct FlightStatistics {
    double total_time = 0.0;
    int num_samples = 0;
    Eigen::Vector3d pos_rms_error = Eigen::Vector3d::Zero();
    Eigen::Vector3d pos_mean_error = Eigen::Vector3d::Zero();
    Eigen::Vector3d pos_max_error = Eigen::Vector3d::Zero();
};

// 跟踪误差统计，误差定义为 desired - actual
class FlightDataAnalyzer {
   public:
    // 只持有样本的引用，样本必须比分析器存活更久
    explicit FlightDataAnalyzer(const std::vector<FlightSample>& samples) : samples_(samples) {}
    explicit FlightDataAnalyzer(std::vector<FlightSample>&&) = delete;

    Eigen::Matrix3Xd computeTrackingError() const;
    // 没有样本时返回全零结果，调用方需先检查 num_samples
    FlightStatistics getStatistics() const;

   private:
    const std::vector<FlightSample>& samples_;
};

}  // namespace traj_tracking

#endif
