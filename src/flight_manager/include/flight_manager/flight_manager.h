#ifndef _FLIGHT_MANAGER_H
#define _FLIGHT_MANAGER_H

#include <flight_manager/flight_phase_controller.h>
#include <flight_manager/input_source.h>
#include <flight_manager/ros_vehicle_link.h>
#include <ros/ros.h>
#include <sensor_msgs/PointCloud2.h>
#include <std_msgs/Empty.h>
#include <traj_tracking/trajectory_store.h>
#include <visualization_msgs/Marker.h>
#include <memory>
#include <string>
#include <vector>

namespace traj_tracking {

/*
飞行管理节点：
1) 从参数服务器读取配置，加载参考轨迹并做速度、边界检查（失败则抛出异常，不发送任何指令）
2) 为每架飞机创建 RosVehicleLink，构建 FlightPhaseController
3) 单线程控制循环：spinOnce -> tick -> 可视化 -> sleep
4) 结束后保存飞行数据并打印跟踪误差统计
*/
class FlightManager {
   private:
    ros::NodeHandle nh_;
    ros::NodeHandle nh_global_;  // 飞机话题与手柄话题使用全局命名空间
    FlightMode mode_;

    // --- 参数 ---
    std::vector<std::string> vehicle_names_;
    std::vector<std::string> trajectory_files_;
    double flight_time_;
    SpeedConstraint constraint_;
    bool auto_adjust_;
    BoundsRegion region_;
    bool save_flag_;
    std::string save_dir_;
    double control_rate_;
    double odom_timeout_, odom_lost_timeout_;
    double yaw_;
    std::string input_device_;
    std::string joy_topic_;
    double key_hold_time_, joy_deadzone_;
    FlightFsmParams fsm_params_;

    // --- 轨迹与控制 ---
    std::vector<std::shared_ptr<const Trajectory>> references_;
    std::vector<std::shared_ptr<VehicleLink>> links_;
    std::shared_ptr<InputSource> input_;
    std::unique_ptr<FlightPhaseController> controller_;

    // --- ROS 相关 ---
    ros::Subscriber abort_sub_;
    ros::Publisher ref_cloud_pub_;
    ros::Publisher desired_pub_;
    visualization_msgs::Marker _vis_desired;

    void readParams();
    void loadReferences();
    void createInput();
    void rcvAbortCallback(const std_msgs::Empty::ConstPtr& msg);

    void publishReferences();
    StepOutcome publishDesired();
    void report();

   public:
    FlightManager(ros::NodeHandle& nh, FlightMode mode);
    ~FlightManager() {}

    // 运行控制循环直到 DONE / ABORTED，返回进程退出码
    int run();
};

}  // namespace traj_tracking

#endif
