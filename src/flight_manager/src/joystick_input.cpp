#include <flight_manager/input_source.h>
#include <algorithm>
#include <cmath>

namespace traj_tracking {

JoystickInput::JoystickInput(ros::NodeHandle& nh, const std::string& topic, double deadzone) : deadzone_(deadzone) {
    _joy_sub = nh.subscribe(topic, 10, &JoystickInput::rcvJoyCallback, this);
    ROS_INFO("[input] joystick listening on %s, button 6 lands", _joy_sub.getTopic().c_str());
}

JoystickInput::JoystickInput(double deadzone) : deadzone_(deadzone) {}

void JoystickInput::rcvJoyCallback(const sensor_msgs::Joy::ConstPtr& msg) {
    _joy = *msg;
    _has_joy = true;
}

double JoystickInput::axis(size_t idx) const {
    if (idx >= _joy.axes.size())
        return 0.0;
    return _joy.axes[idx];
}

bool JoystickInput::button(size_t idx) const {
    if (idx >= _joy.buttons.size())
        return false;
    return _joy.buttons[idx] != 0;
}

OperatorCommand JoystickInput::poll(double /*now*/) {
    OperatorCommand cmd;
    if (!_has_joy)
        return cmd;

    double x = axis(0);
    double y = -axis(1);
    if (fabs(x) >= deadzone_ || fabs(y) >= deadzone_)
        cmd.direction = Eigen::Vector2d(x, y).normalized();

    double z = -axis(3);
    if (fabs(z) >= deadzone_)
        cmd.climb = std::min(std::max(z, -1.0), 1.0);

    cmd.stop = button(6);
    return cmd;
}

}  // namespace traj_tracking
