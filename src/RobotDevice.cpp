#include "RobotDevice.h"
#include "TclCompat.h"

#include <algorithm>

RobotDevice::RobotDevice(Robot *robot, std::string bound_name):
  robot(robot), table(std::move(bound_name))
{
  add_robot_commands(table);
}

int RobotDevice::acquire(std::string &error)
{
  return robot->connect(error) == ROBOT_OK ? DEVICE_OK : DEVICE_ERROR;
}

int RobotDevice::evaluate(const std::string &text, std::string &result)
{
  return table.dispatch(*robot, text, result) == ROBOT_OK ?
    DEVICE_OK : DEVICE_ERROR;
}

void RobotDevice::release()
{
  robot->disconnect();
}

bool robot_animation_hidden(const std::string &name)
{
  /* test animations that don't behave well */
  return name == "ANIMATION_TEST" || name == "soundTestAnim";
}

/*
 * argument conversion, messages follow Tcl's own
 */

static int get_double(const std::string &s, double &d, std::string &error)
{
  if (Tcl_GetDouble(NULL, s.c_str(), &d) != TCL_OK) {
    error = "expected floating-point number but got \"" + s + "\"";
    return ROBOT_ERROR;
  }
  return ROBOT_OK;
}

static int get_boolean(const std::string &s, bool &b, std::string &error)
{
  int v;
  if (Tcl_GetBoolean(NULL, s.c_str(), &v) != TCL_OK) {
    error = "expected boolean value but got \"" + s + "\"";
    return ROBOT_ERROR;
  }
  b = v;
  return ROBOT_OK;
}

static std::string print_double(double d)
{
  char buf[TCL_DOUBLE_SPACE];
  Tcl_PrintDouble(NULL, d, buf);
  return std::string(buf);
}

/******************************* say_text ******************************/

static int say_text_op(Robot &robot, const std::vector<std::string> &args,
		       std::string &result)
{
  /* remaining words are spoken as one phrase */
  std::string text = args[0];
  for (size_t i = 1; i < args.size(); i++) text += " " + args[i];
  return robot.say_text(text, result);
}

/***************************** animations ******************************/

static int list_animations_op(Robot &robot,
			      const std::vector<std::string> &args,
			      std::string &result)
{
  std::vector<std::string> names;
  for (const auto &name : robot.animations()) {
    if (!robot_animation_hidden(name)) names.push_back(name);
  }
  std::sort(names.begin(), names.end());
  result = CommandTable::merge(names);
  return ROBOT_OK;
}

static int play_animation_op(Robot &robot,
			     const std::vector<std::string> &args,
			     std::string &result)
{
  if (robot_animation_hidden(args[0])) {
    result = "unknown animation \"" + args[0] + "\"";
    return ROBOT_ERROR;
  }
  return robot.play_animation(args[0], result);
}

/******************************* motors ********************************/

static int set_wheel_motors_op(Robot &robot,
			       const std::vector<std::string> &args,
			       std::string &result)
{
  double left, right;
  if (get_double(args[0], left, result) != ROBOT_OK) return ROBOT_ERROR;
  if (get_double(args[1], right, result) != ROBOT_OK) return ROBOT_ERROR;

  /* default acceleration is four times the target speed */
  double left_accel = left * 4, right_accel = right * 4;
  if (args.size() == 4) {
    if (get_double(args[2], left_accel, result) != ROBOT_OK) return ROBOT_ERROR;
    if (get_double(args[3], right_accel, result) != ROBOT_OK) return ROBOT_ERROR;
  }
  else if (args.size() != 2) {
    result = "wrong # args: should be \"robot set_wheel_motors left right "
      "?left_accel right_accel?\"";
    return ROBOT_ERROR;
  }
  return robot.set_wheel_motors(left, right, left_accel, right_accel, result);
}

static int set_lift_motor_op(Robot &robot,
			     const std::vector<std::string> &args,
			     std::string &result)
{
  double speed;
  if (get_double(args[0], speed, result) != ROBOT_OK) return ROBOT_ERROR;
  return robot.set_lift_motor(speed, result);
}

static int set_head_motor_op(Robot &robot,
			     const std::vector<std::string> &args,
			     std::string &result)
{
  double speed;
  if (get_double(args[0], speed, result) != ROBOT_OK) return ROBOT_ERROR;
  return robot.set_head_motor(speed, result);
}

static int stop_all_motors_op(Robot &robot,
			      const std::vector<std::string> &args,
			      std::string &result)
{
  if (robot.set_wheel_motors(0, 0, 0, 0, result) != ROBOT_OK) return ROBOT_ERROR;
  if (robot.set_lift_motor(0, result) != ROBOT_OK) return ROBOT_ERROR;
  return robot.set_head_motor(0, result);
}

/****************************** charger ********************************/

static int drive_off_charger_op(Robot &robot,
				const std::vector<std::string> &args,
				std::string &result)
{
  return robot.drive_off_charger(result);
}

static int drive_on_charger_op(Robot &robot,
			       const std::vector<std::string> &args,
			       std::string &result)
{
  return robot.drive_on_charger(result);
}

/************************** control and state **************************/

static int set_freeplay_op(Robot &robot,
			   const std::vector<std::string> &args,
			   std::string &result)
{
  bool freeplay;
  if (get_boolean(args[0], freeplay, result) != ROBOT_OK) return ROBOT_ERROR;

  /* freeplay means the robot runs its own behaviors, so release control */
  robot.request_control(!freeplay);
  return ROBOT_OK;
}

static int battery_op(Robot &robot, const std::vector<std::string> &args,
		      std::string &result)
{
  result = print_double(robot.battery_volts());
  return ROBOT_OK;
}

static int status_op(Robot &robot, const std::vector<std::string> &args,
		     std::string &result)
{
  robot_state_t s = robot.state();
  std::vector<std::string> dict = {
    "connected",   s.connected ? "1" : "0",
    "in_control",  s.in_control ? "1" : "0",
    "on_charger",  s.on_charger ? "1" : "0",
    "left_wheel",  print_double(s.left_wheel_speed),
    "right_wheel", print_double(s.right_wheel_speed),
    "lift_speed",  print_double(s.lift_speed),
    "head_speed",  print_double(s.head_speed),
    "battery",     print_double(s.battery_volts)
  };
  result = CommandTable::merge(dict);
  return ROBOT_OK;
}

void add_robot_commands(CommandTable &table)
{
  table.add("say_text", 1, -1, "text", say_text_op);
  table.add("list_animations", 0, 0, "", list_animations_op);
  table.add("play_animation", 1, 1, "name", play_animation_op);
  table.add("set_wheel_motors", 2, 4, "left right ?left_accel right_accel?",
	    set_wheel_motors_op);
  table.add("set_lift_motor", 1, 1, "speed", set_lift_motor_op);
  table.add("set_head_motor", 1, 1, "speed", set_head_motor_op);
  table.add("stop_all_motors", 0, 0, "", stop_all_motors_op);
  table.add("drive_off_charger", 0, 0, "", drive_off_charger_op);
  table.add("drive_on_charger", 0, 0, "", drive_on_charger_op);
  table.add("set_freeplay", 1, 1, "enabled", set_freeplay_op);
  table.add("battery", 0, 0, "", battery_op);
  table.add("status", 0, 0, "", status_op);
}
