#include <flight_manager/ros_vehicle_link.h>

namespace traj_tracking {

const int _DIM_x = 0;
const int _DIM_y = 1;
const int _DIM_z = 2;

RosVehicleLink::RosVehicleLink(ros::NodeHandle& nh, const std::string& name, double odom_timeout, double odom_lost_timeout, double yaw)
    : name_(name), _odom_timeout(odom_timeout), _odom_lost_timeout(odom_lost_timeout), _yaw(yaw) {
    _odom_sub = nh.subscribe(name + "/odom", 50, &RosVehicleLink::rcvOdometryCallback, this, ros::TransportHints().tcpNoDelay());
    _safety_sub = nh.subscribe(name + "/safety", 1, &RosVehicleLink::rcvSafetyCallback, this);
    _cmd_pub = nh.advertise<quadrotor_msgs::PositionCommand>(name + "/position_cmd", 50);
    _land_pub = nh.advertise<quadrotor_msgs::TakeoffLand>(name + "/takeoff_land", 1);

    double pos_gain[3] = {5.7, 5.7, 6.2};
    double vel_gain[3] = {3.4, 3.4, 4.0};
    setGains(pos_gain, vel_gain);
}

void RosVehicleLink::setGains(double pos_gain[3], double vel_gain[3]) {
    _cmd.kx[_DIM_x] = pos_gain[_DIM_x];
    _cmd.kx[_DIM_y] = pos_gain[_DIM_y];
    _cmd.kx[_DIM_z] = pos_gain[_DIM_z];

    _cmd.kv[_DIM_x] = vel_gain[_DIM_x];
    _cmd.kv[_DIM_y] = vel_gain[_DIM_y];
    _cmd.kv[_DIM_z] = vel_gain[_DIM_z];
}

void RosVehicleLink::rcvOdometryCallback(const nav_msgs::Odometry::ConstPtr& odom) {
    if (odom->child_frame_id == "X" || odom->child_frame_id == "O")
        return;
    _odom = *odom;
    _has_odom = true;
    _last_odom_time = ros::Time::now();
}

void RosVehicleLink::rcvSafetyCallback(const std_msgs::Bool::ConstPtr& msg) {
    if (_safety_flag && !msg->data)
        ROS_WARN("[%s] safety flag cleared by monitor", name_.c_str());
    _safety_flag = msg->data;
}

boost::optional<VehiclePose> RosVehicleLink::pose() const {
    if (!_has_odom)
        return boost::none;
    // 过期位姿视为不可用，不回退到原点
    if ((ros::Time::now() - _last_odom_time).toSec() > _odom_timeout)
        return boost::none;

    Eigen::Vector3d p(_odom.pose.pose.position.x, _odom.pose.pose.position.y, _odom.pose.pose.position.z);
    Eigen::Vector3d v(_odom.twist.twist.linear.x, _odom.twist.twist.linear.y, _odom.twist.twist.linear.z);
    return VehiclePose(p, v);
}

void RosVehicleLink::sendPositionSetpoint(const Eigen::Vector3d& target) {
    _cmd.header.stamp = ros::Time::now();
    _cmd.header.frame_id = "world";
    _cmd.trajectory_flag = quadrotor_msgs::PositionCommand::TRAJECTORY_STATUS_READY;

    _cmd.position.x = target(_DIM_x);
    _cmd.position.y = target(_DIM_y);
    _cmd.position.z = target(_DIM_z);

    _cmd.velocity.x = 0.0;
    _cmd.velocity.y = 0.0;
    _cmd.velocity.z = 0.0;

    _cmd.acceleration.x = 0.0;
    _cmd.acceleration.y = 0.0;
    _cmd.acceleration.z = 0.0;

    _cmd.yaw = _yaw;
    _cmd.yaw_dot = 0.0;
    _cmd_pub.publish(_cmd);
}

void RosVehicleLink::landInPlace() {
    quadrotor_msgs::TakeoffLand msg;
    msg.takeoff_land_cmd = quadrotor_msgs::TakeoffLand::LAND;
    _land_pub.publish(msg);
}

bool RosVehicleLink::isSafe() const {
    if (!_safety_flag)
        return false;
    // 收到过里程计后长时间丢失，说明定位系统失去跟踪
    if (_has_odom && (ros::Time::now() - _last_odom_time).toSec() > _odom_lost_timeout)
        return false;
    return true;
}

}  // namespace traj_tracking
