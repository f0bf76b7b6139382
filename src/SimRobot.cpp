#include "SimRobot.h"

#include <algorithm>
#include <chrono>
#include <thread>

static double clamp(double v, double limit)
{
  if (v > limit) return limit;
  if (v < -limit) return -limit;
  return v;
}

SimRobot::SimRobot()
{
  state_.connected = false;
  state_.in_control = true;
  state_.on_charger = true;
  state_.left_wheel_speed = state_.right_wheel_speed = 0.0;
  state_.left_wheel_accel = state_.right_wheel_accel = 0.0;
  state_.lift_speed = 0.0;
  state_.head_speed = 0.0;
  state_.battery_volts = 3.9;

  anim_list = {
    "ANIMATION_TEST",
    "anim_blackjack_victorwin_01",
    "anim_feedback_shutup_01",
    "anim_fistbump_success_01",
    "anim_knowledgegraph_success_01",
    "anim_pounce_success_02",
    "anim_reacttoface_unidentified_01",
    "anim_rtpickup_loop_10",
    "anim_turn_left_01",
    "anim_volume_stage_05",
    "anim_wakeword_groggyeyes_listenloop_01",
    "soundTestAnim"
  };
}

void SimRobot::delay(void)
{
  if (latency_ms > 0)
    std::this_thread::sleep_for(std::chrono::milliseconds(latency_ms));
}

int SimRobot::check_ready(std::string &error)
{
  if (!state_.connected) {
    error = "robot not connected";
    return ROBOT_ERROR;
  }
  if (!state_.in_control) {
    error = "robot control released (freeplay enabled)";
    return ROBOT_ERROR;
  }
  return ROBOT_OK;
}

int SimRobot::connect(std::string &error)
{
  if (!reachable) {
    error = "robot not reachable";
    return ROBOT_ERROR;
  }
  state_.connected = true;
  connects++;
  return ROBOT_OK;
}

void SimRobot::disconnect()
{
  state_.connected = false;
  state_.left_wheel_speed = state_.right_wheel_speed = 0.0;
  state_.left_wheel_accel = state_.right_wheel_accel = 0.0;
  state_.lift_speed = state_.head_speed = 0.0;
}

int SimRobot::say_text(const std::string &text, std::string &error)
{
  if (check_ready(error) != ROBOT_OK) return ROBOT_ERROR;
  delay();
  state_.last_spoken = text;
  spoken_.push_back(text);
  return ROBOT_OK;
}

std::vector<std::string> SimRobot::animations()
{
  return anim_list;
}

int SimRobot::play_animation(const std::string &name, std::string &error)
{
  if (check_ready(error) != ROBOT_OK) return ROBOT_ERROR;
  if (std::find(anim_list.begin(), anim_list.end(), name) == anim_list.end()) {
    error = "unknown animation \"" + name + "\"";
    return ROBOT_ERROR;
  }
  delay();
  state_.last_animation = name;
  played_.push_back(name);
  return ROBOT_OK;
}

int SimRobot::set_wheel_motors(double left, double right,
			       double left_accel, double right_accel,
			       std::string &error)
{
  if (check_ready(error) != ROBOT_OK) return ROBOT_ERROR;
  delay();
  state_.left_wheel_speed = clamp(left, MAX_WHEEL_SPEED);
  state_.right_wheel_speed = clamp(right, MAX_WHEEL_SPEED);
  state_.left_wheel_accel = clamp(left_accel, MAX_WHEEL_ACCEL);
  state_.right_wheel_accel = clamp(right_accel, MAX_WHEEL_ACCEL);

  /* any wheel motion takes the robot off its charger contacts */
  if (state_.left_wheel_speed != 0.0 || state_.right_wheel_speed != 0.0)
    state_.on_charger = false;
  return ROBOT_OK;
}

int SimRobot::set_lift_motor(double speed, std::string &error)
{
  if (check_ready(error) != ROBOT_OK) return ROBOT_ERROR;
  delay();
  state_.lift_speed = clamp(speed, MAX_LIFT_SPEED);
  return ROBOT_OK;
}

int SimRobot::set_head_motor(double speed, std::string &error)
{
  if (check_ready(error) != ROBOT_OK) return ROBOT_ERROR;
  delay();
  state_.head_speed = clamp(speed, MAX_HEAD_SPEED);
  return ROBOT_OK;
}

int SimRobot::drive_off_charger(std::string &error)
{
  if (check_ready(error) != ROBOT_OK) return ROBOT_ERROR;
  delay();
  state_.on_charger = false;
  return ROBOT_OK;
}

int SimRobot::drive_on_charger(std::string &error)
{
  if (check_ready(error) != ROBOT_OK) return ROBOT_ERROR;
  delay();
  state_.left_wheel_speed = state_.right_wheel_speed = 0.0;
  state_.on_charger = true;
  return ROBOT_OK;
}

void SimRobot::request_control(bool enable)
{
  state_.in_control = enable;
}
