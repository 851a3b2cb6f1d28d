/*
该程序是基于 ROS 的多机轨迹跟踪节点，主要功能：
加载预先录制的参考轨迹（CSV），按期望飞行时间缩放并做速度、边界检查；
控制一架或多架飞机依次完成 起飞 -> 悬停稳定（机群同步）-> 轨迹跟踪 -> 降落；
记录实际位置与期望位置，结束后输出跟踪误差统计。

输入：
<name>/odom：各飞机里程计（nav_msgs/Odometry）
<name>/safety：安全标志（std_msgs/Bool）
~abort：外部中止（std_msgs/Empty）

输出：
<name>/position_cmd：位置指令（quadrotor_msgs/PositionCommand）
<name>/takeoff_land：降落指令（quadrotor_msgs/TakeoffLand）
可视化话题：参考轨迹点云、期望位置 Marker。
*/
#include <flight_manager/flight_manager.h>

int main(int argc, char** argv) {
    ros::init(argc, argv, "traj_tracking_node");
    ros::NodeHandle nh_priv("~");

    std::unique_ptr<traj_tracking::FlightManager> manager;
    try {
        manager.reset(new traj_tracking::FlightManager(nh_priv, traj_tracking::FlightMode::TRACKING));
    } catch (const traj_tracking::SpeedLimitExceeded& e) {
        ROS_ERROR("[flight_manager] %s", e.what());
        ROS_ERROR("[flight_manager] minimum safe flight time is %.2f s, set flight_time or enable auto_adjust", e.required_duration);
        return 1;
    } catch (const std::exception& e) {
        ROS_ERROR("[flight_manager] pre-flight check failed: %s", e.what());
        return 1;
    }
    return manager->run();
}
