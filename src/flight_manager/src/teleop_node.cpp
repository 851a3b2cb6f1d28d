/*
遥控飞行节点：
起飞到当前位置上方的悬停高度，机群稳定后由键盘或手柄控制目标位置（XY 限制在安全区域内，高度限制在上下限内），
操作员停止或达到最长飞行时间后降落。可选加载一条参考轨迹，仅用于可视化。
键盘：方向键移动，w/s 升降，q 或 ESC 降落；手柄：轴 0/1 移动，轴 3 升降，按键 6 降落。
*/
#include <flight_manager/flight_manager.h>

int main(int argc, char** argv) {
    ros::init(argc, argv, "teleop_node");
    ros::NodeHandle nh_priv("~");

    std::unique_ptr<traj_tracking::FlightManager> manager;
    try {
        manager.reset(new traj_tracking::FlightManager(nh_priv, traj_tracking::FlightMode::TELEOP));
    } catch (const std::exception& e) {
        ROS_ERROR("[flight_manager] pre-flight check failed: %s", e.what());
        return 1;
    }
    return manager->run();
}
