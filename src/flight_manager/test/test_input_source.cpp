#include <flight_manager/input_source.h>
#include <gtest/gtest.h>
#include <boost/make_shared.hpp>
#include <cmath>

using namespace traj_tracking;

TEST(KeyboardInputTest, ArrowKeysGiveUnitDirection) {
    KeyboardInput keys(0.15, false);
    keys.feed("\x1b[A", 0.0);
    OperatorCommand cmd = keys.command(0.0);
    EXPECT_DOUBLE_EQ(cmd.direction(0), 0.0);
    EXPECT_DOUBLE_EQ(cmd.direction(1), 1.0);
    EXPECT_FALSE(cmd.stop);

    keys.feed("\x1b[C", 0.05);
    cmd = keys.command(0.05);
    EXPECT_NEAR(cmd.direction(0), std::sqrt(0.5), 1e-12);
    EXPECT_NEAR(cmd.direction(1), std::sqrt(0.5), 1e-12);
    EXPECT_NEAR(cmd.direction.norm(), 1.0, 1e-12);
}

TEST(KeyboardInputTest, OpposingKeysCancel) {
    KeyboardInput keys(0.15, false);
    keys.feed("\x1b[D\x1b[C", 1.0);
    EXPECT_TRUE(keys.command(1.0).direction.isZero());
}

TEST(KeyboardInputTest, KeyReleasedAfterHoldTime) {
    KeyboardInput keys(0.15, false);
    keys.feed("\x1b[B", 1.0);
    EXPECT_DOUBLE_EQ(keys.command(1.1).direction(1), -1.0);
    EXPECT_TRUE(keys.command(1.2).direction.isZero());
}

TEST(KeyboardInputTest, ClimbKeys) {
    KeyboardInput keys(0.15, false);
    keys.feed("w", 0.0);
    EXPECT_DOUBLE_EQ(keys.command(0.0).climb, 1.0);
    keys.feed("s", 0.5);
    EXPECT_DOUBLE_EQ(keys.command(0.5).climb, -1.0);
    keys.feed("ws", 1.0);
    EXPECT_DOUBLE_EQ(keys.command(1.0).climb, 0.0);
}

TEST(KeyboardInputTest, EscapeSequenceSplitAcrossReads) {
    KeyboardInput keys(0.15, false);
    keys.feed("\x1b[", 0.0);
    EXPECT_FALSE(keys.command(0.0).stop);
    keys.feed("D", 0.01);
    OperatorCommand cmd = keys.command(0.01);
    EXPECT_DOUBLE_EQ(cmd.direction(0), -1.0);
    EXPECT_FALSE(cmd.stop);
}

TEST(KeyboardInputTest, EscapeAtEndOfReadWaitsForRestOfArrowKey) {
    KeyboardInput keys(0.15, false);
    keys.feed(std::string(63, 'x') + "\x1b", 0.0);
    EXPECT_FALSE(keys.command(0.0).stop);
    keys.feed("[A", 0.01);
    OperatorCommand cmd = keys.command(0.01);
    EXPECT_DOUBLE_EQ(cmd.direction(1), 1.0);
    EXPECT_FALSE(cmd.stop);
    EXPECT_FALSE(keys.poll(0.02).stop);
}

TEST(KeyboardInputTest, StopKeys) {
    KeyboardInput esc(0.15, false);
    esc.feed("\x1b", 0.0);
    EXPECT_FALSE(esc.command(0.0).stop);
    // 下一个周期没有后续字节，ESC 生效
    EXPECT_TRUE(esc.poll(0.01).stop);
    // 停止请求保持
    EXPECT_TRUE(esc.command(10.0).stop);

    KeyboardInput esc_then_key(0.15, false);
    esc_then_key.feed("\x1b", 0.0);
    esc_then_key.feed("w", 0.01);
    EXPECT_TRUE(esc_then_key.command(0.01).stop);

    KeyboardInput quit(0.15, false);
    quit.feed("q", 0.0);
    EXPECT_TRUE(quit.poll(0.0).stop);
}

TEST(JoystickInputTest, NoMessageGivesZeroCommand) {
    JoystickInput joy(0.2);
    OperatorCommand cmd = joy.poll(0.0);
    EXPECT_TRUE(cmd.direction.isZero());
    EXPECT_DOUBLE_EQ(cmd.climb, 0.0);
    EXPECT_FALSE(cmd.stop);
}

TEST(JoystickInputTest, AxesMapToCommand) {
    JoystickInput joy(0.2);
    sensor_msgs::JoyPtr msg = boost::make_shared<sensor_msgs::Joy>();
    msg->axes = {0.5, 0.5, 0.0, -0.6};
    msg->buttons = {0, 0, 0, 0, 0, 0, 0};
    joy.rcvJoyCallback(msg);

    OperatorCommand cmd = joy.poll(0.0);
    EXPECT_NEAR(cmd.direction(0), std::sqrt(0.5), 1e-6);
    EXPECT_NEAR(cmd.direction(1), -std::sqrt(0.5), 1e-6);
    EXPECT_NEAR(cmd.climb, 0.6, 1e-6);
    EXPECT_FALSE(cmd.stop);
}

TEST(JoystickInputTest, DeadzoneAndShortMessages) {
    JoystickInput joy(0.2);
    sensor_msgs::JoyPtr msg = boost::make_shared<sensor_msgs::Joy>();
    msg->axes = {0.1, -0.1};
    joy.rcvJoyCallback(msg);
    OperatorCommand cmd = joy.poll(0.0);
    EXPECT_TRUE(cmd.direction.isZero());
    EXPECT_DOUBLE_EQ(cmd.climb, 0.0);
    EXPECT_FALSE(cmd.stop);

    msg = boost::make_shared<sensor_msgs::Joy>();
    msg->buttons = {0, 0, 0, 0, 0, 0, 1};
    joy.rcvJoyCallback(msg);
    EXPECT_TRUE(joy.poll(0.0).stop);
}
