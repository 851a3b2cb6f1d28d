#include <flight_manager/input_source.h>
#include <ros/console.h>
#include <errno.h>
#include <fcntl.h>
#include <string.h>
#include <unistd.h>

namespace traj_tracking {

KeyboardInput::KeyboardInput(double key_hold_time, bool use_terminal) : key_hold_time_(key_hold_time), use_terminal_(use_terminal) {
    if (use_terminal_)
        enableRawMode();
}

KeyboardInput::~KeyboardInput() { restoreTerminal(); }

void KeyboardInput::enableRawMode() {
    if (!isatty(STDIN_FILENO)) {
        ROS_WARN("[input] stdin is not a terminal, keyboard input disabled");
        return;
    }
    if (tcgetattr(STDIN_FILENO, &saved_attr_) != 0) {
        ROS_WARN("[input] tcgetattr failed: %s", strerror(errno));
        return;
    }
    struct termios raw = saved_attr_;
    raw.c_lflag &= ~(ICANON | ECHO);
    raw.c_cc[VMIN] = 0;
    raw.c_cc[VTIME] = 0;
    if (tcsetattr(STDIN_FILENO, TCSANOW, &raw) != 0) {
        ROS_WARN("[input] tcsetattr failed: %s", strerror(errno));
        return;
    }
    raw_mode_ = true;
    ROS_INFO("[input] keyboard ready: arrows move, w/s climb, q or ESC lands");
}

void KeyboardInput::restoreTerminal() {
    if (raw_mode_) {
        tcsetattr(STDIN_FILENO, TCSANOW, &saved_attr_);
        raw_mode_ = false;
    }
}

void KeyboardInput::feed(const std::string& bytes, double now) {
    std::string buf = pending_ + bytes;
    pending_.clear();

    size_t i = 0;
    while (i < buf.size()) {
        char c = buf[i];
        if (c == '\x1b') {
            // 方向键为 ESC [ A/B/C/D；单独的 ESC 表示停止
            if (i + 1 >= buf.size()) {
                // 末尾的 ESC 先保留一个周期，下一次读取仍无后续字节才算停止
                if (bytes.empty())
                    stop_ = true;
                else
                    pending_ = buf.substr(i);
                break;
            }
            if (buf[i + 1] != '[') {
                stop_ = true;
                i++;
                continue;
            }
            if (i + 2 >= buf.size()) {
                pending_ = buf.substr(i);
                break;
            }
            switch (buf[i + 2]) {
                case 'A':
                    last_seen_[KEY_UP] = now;
                    break;
                case 'B':
                    last_seen_[KEY_DOWN] = now;
                    break;
                case 'C':
                    last_seen_[KEY_RIGHT] = now;
                    break;
                case 'D':
                    last_seen_[KEY_LEFT] = now;
                    break;
                default:
                    break;
            }
            i += 3;
            continue;
        }
        if (c == 'w' || c == 'W')
            last_seen_[KEY_CLIMB] = now;
        else if (c == 's' || c == 'S')
            last_seen_[KEY_DESCEND] = now;
        else if (c == 'q' || c == 'Q')
            stop_ = true;
        i++;
    }
}

bool KeyboardInput::held(int key, double now) const {
    std::map<int, double>::const_iterator it = last_seen_.find(key);
    if (it == last_seen_.end())
        return false;
    return now - it->second <= key_hold_time_;
}

OperatorCommand KeyboardInput::command(double now) const {
    OperatorCommand cmd;
    double dx = 0, dy = 0;
    if (held(KEY_RIGHT, now))
        dx += 1;
    if (held(KEY_LEFT, now))
        dx -= 1;
    if (held(KEY_UP, now))
        dy += 1;
    if (held(KEY_DOWN, now))
        dy -= 1;
    if (dx != 0 || dy != 0)
        cmd.direction = Eigen::Vector2d(dx, dy).normalized();

    if (held(KEY_CLIMB, now))
        cmd.climb += 1;
    if (held(KEY_DESCEND, now))
        cmd.climb -= 1;
    cmd.stop = stop_;
    return cmd;
}

OperatorCommand KeyboardInput::poll(double now) {
    std::string bytes;
    if (raw_mode_) {
        char buf[64];
        ssize_t n = read(STDIN_FILENO, buf, sizeof(buf));
        if (n > 0) {
            bytes.assign(buf, n);
        } else if (n < 0 && errno != EAGAIN && errno != EWOULDBLOCK) {
            // 读取失败时按零指令处理
            ROS_WARN("[input] keyboard read failed: %s", strerror(errno));
        }
    }
    // 没有新字节时也要调用，以确认保留的单独 ESC
    feed(bytes, now);
    return command(now);
}

}  // namespace traj_tracking
