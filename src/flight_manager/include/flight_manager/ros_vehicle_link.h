#ifndef _FLIGHT_MANAGER_ROS_VEHICLE_LINK_H
#define _FLIGHT_MANAGER_ROS_VEHICLE_LINK_H

#include <flight_manager/vehicle_link.h>
#include <nav_msgs/Odometry.h>
#include <quadrotor_msgs/PositionCommand.h>
#include <quadrotor_msgs/TakeoffLand.h>
#include <ros/ros.h>
#include <std_msgs/Bool.h>

namespace traj_tracking {

/*
基于 ROS 话题的飞控服务实现：
输入：<name>/odom（nav_msgs/Odometry），<name>/safety（std_msgs/Bool）
输出：<name>/position_cmd（quadrotor_msgs/PositionCommand），<name>/takeoff_land（quadrotor_msgs/TakeoffLand）
回调与控制循环在同一线程（ros::spinOnce），位姿以最新值快照方式读取。
*/
class RosVehicleLink : public VehicleLink {
   private:
    std::string name_;
    ros::Subscriber _odom_sub;
    ros::Subscriber _safety_sub;
    ros::Publisher _cmd_pub;
    ros::Publisher _land_pub;

    nav_msgs::Odometry _odom;
    bool _has_odom = false;
    ros::Time _last_odom_time;
    bool _safety_flag = true;  // 未收到安全话题时默认安全

    double _odom_timeout;       // 超过该时间的位姿视为不可用
    double _odom_lost_timeout;  // 收到过里程计后丢失超过该时间视为不安全
    double _yaw;                // 固定偏航角
    quadrotor_msgs::PositionCommand _cmd;

    void rcvOdometryCallback(const nav_msgs::Odometry::ConstPtr& odom);
    void rcvSafetyCallback(const std_msgs::Bool::ConstPtr& msg);
    void setGains(double pos_gain[3], double vel_gain[3]);

   public:
    RosVehicleLink(ros::NodeHandle& nh, const std::string& name, double odom_timeout, double odom_lost_timeout, double yaw);
    ~RosVehicleLink() {}

    boost::optional<VehiclePose> pose() const override;
    void sendPositionSetpoint(const Eigen::Vector3d& target) override;
    void landInPlace() override;
    bool isSafe() const override;
    std::string name() const override { return name_; }
};

}  // namespace traj_tracking

#endif
