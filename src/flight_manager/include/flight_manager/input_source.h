#ifndef _FLIGHT_MANAGER_INPUT_SOURCE_H
#define _FLIGHT_MANAGER_INPUT_SOURCE_H

#include <Eigen/Dense>
#include <ros/ros.h>
#include <sensor_msgs/Joy.h>
#include <termios.h>
#include <map>
#include <string>

namespace traj_tracking {

// 每个控制周期读取一次的操作员指令快照
struct OperatorCommand {
    Eigen::Vector2d direction = Eigen::Vector2d::Zero();  // 单位向量或零
    double climb = 0.0;                                   // [-1, 1]
    bool stop = false;
};

/**
 * @brief 操作员输入设备接口
 * 控制器在主循环线程中每个周期调用一次 poll()，不存在跨线程共享标志。
 */
class InputSource {
   public:
    virtual ~InputSource() {}
    virtual OperatorCommand poll(double now) = 0;
};

/*
键盘输入：终端 raw 模式下非阻塞读取 stdin。
方向键 -> XY 方向，w/s -> 升降，ESC 或 q -> 停止。
终端不上报按键释放，按键在最后一次重复后保持 key_hold_time 秒。
*/
class KeyboardInput : public InputSource {
   public:
    enum Key { KEY_UP = 0, KEY_DOWN, KEY_LEFT, KEY_RIGHT, KEY_CLIMB, KEY_DESCEND };

    explicit KeyboardInput(double key_hold_time = 0.15, bool use_terminal = true);
    ~KeyboardInput();

    OperatorCommand poll(double now) override;

    // 解码一段终端字节流，不依赖终端，可单独测试
    // 空字节流表示本周期无输入，此时保留的单独 ESC 判定为停止
    void feed(const std::string& bytes, double now);
    OperatorCommand command(double now) const;

   private:
    double key_hold_time_;
    bool use_terminal_;
    bool raw_mode_ = false;
    struct termios saved_attr_;
    std::string pending_;              // 未解码完的转义序列
    std::map<int, double> last_seen_;  // 按键 -> 最后出现时间
    bool stop_ = false;

    void enableRawMode();
    void restoreTerminal();
    bool held(int key, double now) const;
};

/*
手柄输入：订阅 sensor_msgs/Joy，回调与主循环同线程，只保存最新消息。
轴 0/1 -> XY 方向（轴 1 取反），轴 3 -> 升降（取反），按键 6 -> 停止。
*/
class JoystickInput : public InputSource {
   public:
    JoystickInput(ros::NodeHandle& nh, const std::string& topic, double deadzone = 0.2);
    // 不订阅话题，仅用于直接注入消息
    explicit JoystickInput(double deadzone = 0.2);

    OperatorCommand poll(double now) override;
    void rcvJoyCallback(const sensor_msgs::Joy::ConstPtr& msg);

   private:
    ros::Subscriber _joy_sub;
    sensor_msgs::Joy _joy;
    bool _has_joy = false;
    double deadzone_;

    double axis(size_t idx) const;
    bool button(size_t idx) const;
};

}  // namespace traj_tracking

#endif
