#include <gtest/gtest.h>

#include "RobotDevice.h"
#include "SimRobot.h"

#include <algorithm>
#include <map>

class RobotCommands : public ::testing::Test {
protected:
  SimRobot robot;
  RobotDevice device{&robot};

  void SetUp() override {
    std::string error;
    ASSERT_EQ(device.acquire(error), DEVICE_OK);
  }
  void TearDown() override { device.release(); }

  std::string ok(const std::string &text) {
    std::string result;
    EXPECT_EQ(device.evaluate(text, result), DEVICE_OK) << text << ": " << result;
    return result;
  }
  std::string fails(const std::string &text) {
    std::string result;
    EXPECT_EQ(device.evaluate(text, result), DEVICE_ERROR) << text;
    return result;
  }
};

TEST_F(RobotCommands, SayTextBothForms) {
  EXPECT_EQ(ok("robot say_text hi"), "");
  EXPECT_EQ(ok("robot.say_text {hello there}"), "");
  EXPECT_EQ(ok("robot say_text \"good bye\" now"), "");

  ASSERT_EQ(robot.spoken().size(), 3u);
  EXPECT_EQ(robot.spoken()[0], "hi");
  EXPECT_EQ(robot.spoken()[1], "hello there");
  EXPECT_EQ(robot.spoken()[2], "good bye now");
}

TEST_F(RobotCommands, CallForm) {
  EXPECT_EQ(ok("robot.say_text('hi')"), "");
  EXPECT_EQ(ok("robot.battery()"), "3.9");
  EXPECT_EQ(ok("  robot.say_text(\"it's, here\")  "), "");
  EXPECT_EQ(ok("robot.say_text('a \\'quoted\\' word')"), "");

  ASSERT_EQ(robot.spoken().size(), 3u);
  EXPECT_EQ(robot.spoken()[0], "hi");
  EXPECT_EQ(robot.spoken()[1], "it's, here");
  EXPECT_EQ(robot.spoken()[2], "a 'quoted' word");
}

TEST_F(RobotCommands, CallFormArguments) {
  ok("robot.set_wheel_motors(50, -25.5)");
  EXPECT_DOUBLE_EQ(robot.state().left_wheel_speed, 50);
  EXPECT_DOUBLE_EQ(robot.state().right_wheel_speed, -25.5);

  ok("robot.set_wheel_motors( 10 , 20 , 30 , 40 , )");
  EXPECT_DOUBLE_EQ(robot.state().right_wheel_accel, 40);

  ok("robot.set_freeplay(True)");
  EXPECT_FALSE(robot.state().in_control);
  ok("robot.set_freeplay(False)");
  EXPECT_TRUE(robot.state().in_control);
}

TEST_F(RobotCommands, CallFormUsesSameChecks) {
  EXPECT_EQ(fails("robot.say_text()"),
	    "wrong # args: should be \"robot say_text text\"");
  EXPECT_EQ(fails("robot.battery(1)"),
	    "wrong # args: should be \"robot battery\"");
  EXPECT_EQ(fails("robot.set_lift_motor('fast')"),
	    "expected floating-point number but got \"fast\"");
  EXPECT_EQ(fails("robot.dance()")
	    .rfind("unknown robot operation \"dance\": must be ", 0), 0u);
}

TEST_F(RobotCommands, MalformedCalls) {
  EXPECT_EQ(fails("robot.say_text('hi)"),
	    "unterminated string in \"robot.say_text('hi)\"");
  EXPECT_EQ(fails("robot.say_text('hi'"),
	    "malformed call \"robot.say_text('hi'\"");
  EXPECT_EQ(fails("robot.battery() now"),
	    "malformed call \"robot.battery() now\"");
  EXPECT_EQ(fails("robot.set_wheel_motors(1,,2)"),
	    "missing argument in \"robot.set_wheel_motors(1,,2)\"");
  EXPECT_EQ(fails("robot.say_text('a' 'b')"),
	    "expected \",\" or \")\" in \"robot.say_text('a' 'b')\"");
  EXPECT_TRUE(robot.spoken().empty());
}

TEST_F(RobotCommands, NothingIsSubstituted) {
  ok("robot say_text {[exec rm -rf /]} $HOME");
  ASSERT_EQ(robot.spoken().size(), 1u);
  EXPECT_EQ(robot.spoken()[0], "[exec rm -rf /] $HOME");
}

TEST_F(RobotCommands, UnknownCommandName) {
  EXPECT_EQ(fails("exit"), "invalid command name \"exit\"");
  EXPECT_EQ(fails("puts hello"), "invalid command name \"puts\"");
}

TEST_F(RobotCommands, UnknownOperation) {
  std::string err = fails("robot dance");
  EXPECT_EQ(err.rfind("unknown robot operation \"dance\": must be ", 0), 0u) << err;
  EXPECT_NE(err.find("say_text"), std::string::npos);
  EXPECT_NE(err.find(", or stop_all_motors"), std::string::npos);
}

TEST_F(RobotCommands, ArgumentCounts) {
  EXPECT_EQ(fails("robot"),
	    "wrong # args: should be \"robot operation ?arg ...?\"");
  EXPECT_EQ(fails("robot say_text"),
	    "wrong # args: should be \"robot say_text text\"");
  EXPECT_EQ(fails("robot battery now"),
	    "wrong # args: should be \"robot battery\"");
  EXPECT_EQ(fails("robot set_wheel_motors 1 2 3"),
	    "wrong # args: should be \"robot set_wheel_motors left right "
	    "?left_accel right_accel?\"");
}

TEST_F(RobotCommands, UnbalancedQuoting) {
  EXPECT_EQ(fails("robot say_text {hi"),
	    "unbalanced braces or quotes in \"robot say_text {hi\"");
}

TEST_F(RobotCommands, EmptyCommand) {
  EXPECT_EQ(fails("   "), "empty command");
}

TEST_F(RobotCommands, ListAnimationsHidesTestAnimations) {
  std::string list = ok("robot list_animations");
  std::vector<std::string> names;
  std::string error;
  ASSERT_EQ(CommandTable::split(list, names, error), ROBOT_OK);

  EXPECT_EQ(names.size(), 10u);
  EXPECT_TRUE(std::is_sorted(names.begin(), names.end()));
  for (const auto &n : names) EXPECT_FALSE(robot_animation_hidden(n)) << n;
}

TEST_F(RobotCommands, PlayAnimation) {
  ok("robot play_animation anim_turn_left_01");
  ASSERT_EQ(robot.played().size(), 1u);

  EXPECT_EQ(fails("robot play_animation ANIMATION_TEST"),
	    "unknown animation \"ANIMATION_TEST\"");
  EXPECT_EQ(fails("robot play_animation anim_nope"),
	    "unknown animation \"anim_nope\"");
  EXPECT_EQ(robot.played().size(), 1u);
}

TEST_F(RobotCommands, WheelMotorsDefaultAndClamp) {
  ok("robot set_wheel_motors 50 -25");
  robot_state_t s = robot.state();
  EXPECT_DOUBLE_EQ(s.left_wheel_speed, 50);
  EXPECT_DOUBLE_EQ(s.right_wheel_speed, -25);
  EXPECT_DOUBLE_EQ(s.left_wheel_accel, 200);
  EXPECT_DOUBLE_EQ(s.right_wheel_accel, -100);
  EXPECT_FALSE(s.on_charger);

  ok("robot.set_wheel_motors 500 10 5000 5");
  s = robot.state();
  EXPECT_DOUBLE_EQ(s.left_wheel_speed, SimRobot::MAX_WHEEL_SPEED);
  EXPECT_DOUBLE_EQ(s.left_wheel_accel, SimRobot::MAX_WHEEL_ACCEL);
  EXPECT_DOUBLE_EQ(s.right_wheel_accel, 5);

  EXPECT_EQ(fails("robot set_wheel_motors fast 1"),
	    "expected floating-point number but got \"fast\"");
}

TEST_F(RobotCommands, StopAllMotors) {
  ok("robot set_wheel_motors 10 10");
  ok("robot set_lift_motor 2");
  ok("robot set_head_motor -1.5");
  EXPECT_DOUBLE_EQ(robot.state().head_speed, -1.5);

  EXPECT_EQ(ok("robot stop_all_motors"), "");
  robot_state_t s = robot.state();
  EXPECT_EQ(s.left_wheel_speed, 0.0);
  EXPECT_EQ(s.right_wheel_speed, 0.0);
  EXPECT_EQ(s.lift_speed, 0.0);
  EXPECT_EQ(s.head_speed, 0.0);
}

TEST_F(RobotCommands, Charger) {
  EXPECT_TRUE(robot.state().on_charger);
  ok("robot drive_off_charger");
  EXPECT_FALSE(robot.state().on_charger);
  ok("robot drive_on_charger");
  EXPECT_TRUE(robot.state().on_charger);
}

TEST_F(RobotCommands, FreeplayReleasesControl) {
  ok("robot set_freeplay true");
  EXPECT_EQ(fails("robot say_text hi"),
	    "robot control released (freeplay enabled)");

  // state queries still work without control
  EXPECT_EQ(ok("robot battery"), "3.9");

  ok("robot set_freeplay 0");
  ok("robot say_text hi");

  EXPECT_EQ(fails("robot set_freeplay maybe"),
	    "expected boolean value but got \"maybe\"");
}

TEST_F(RobotCommands, StatusIsDict) {
  robot.set_battery_volts(3.75);
  std::vector<std::string> words;
  std::string error;
  ASSERT_EQ(CommandTable::split(ok("robot status"), words, error), ROBOT_OK);
  ASSERT_EQ(words.size(), 16u);

  std::map<std::string, std::string> dict;
  for (size_t i = 0; i < words.size(); i += 2) dict[words[i]] = words[i+1];
  EXPECT_EQ(dict["connected"], "1");
  EXPECT_EQ(dict["in_control"], "1");
  EXPECT_EQ(dict["on_charger"], "1");
  EXPECT_EQ(dict["battery"], "3.75");
  EXPECT_EQ(dict["left_wheel"], "0.0");
}

TEST(RobotDevice, DisconnectedRobotRefusesMotion) {
  SimRobot robot;
  RobotDevice device(&robot);
  std::string result;
  EXPECT_EQ(device.evaluate("robot say_text hi", result), DEVICE_ERROR);
  EXPECT_EQ(result, "robot not connected");
}

TEST(RobotDevice, UnreachableRobotFailsAcquire) {
  SimRobot robot;
  robot.set_reachable(false);
  RobotDevice device(&robot);
  std::string error;
  EXPECT_EQ(device.acquire(error), DEVICE_ERROR);
  EXPECT_EQ(error, "robot not reachable");
  EXPECT_EQ(robot.connect_count(), 0);
}

TEST(RobotDevice, OtherBoundName) {
  SimRobot robot;
  RobotDevice device(&robot, "vector");
  std::string result;
  ASSERT_EQ(device.acquire(result), DEVICE_OK);
  EXPECT_EQ(device.evaluate("vector.say_text hi", result), DEVICE_OK);
  EXPECT_EQ(device.evaluate("robot say_text hi", result), DEVICE_ERROR);
  EXPECT_EQ(result, "invalid command name \"robot\"");
  device.release();
}
