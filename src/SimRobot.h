#ifndef SIMROBOT_H
#define SIMROBOT_H

#include <vector>
#include <string>

#include "Robot.h"

/*
 * SimRobot
 *   in-process stand in for a robot: keeps motor, charger and control
 *   state, records speech and animations, can be made unreachable or
 *   slow to exercise the failure paths
 */
class SimRobot : public Robot
{
  robot_state_t state_;
  std::vector<std::string> anim_list;
  std::vector<std::string> spoken_;
  std::vector<std::string> played_;
  bool reachable = true;
  int latency_ms = 0;
  int connects = 0;

  int check_ready(std::string &error);
  void delay(void);

 public:
  static constexpr double MAX_WHEEL_SPEED = 220.0;
  static constexpr double MAX_WHEEL_ACCEL = 1000.0;
  static constexpr double MAX_LIFT_SPEED = 10.0;
  static constexpr double MAX_HEAD_SPEED = 10.0;

  SimRobot();

  int connect(std::string &error) override;
  void disconnect() override;

  int say_text(const std::string &text, std::string &error) override;
  std::vector<std::string> animations() override;
  int play_animation(const std::string &name, std::string &error) override;

  int set_wheel_motors(double left, double right,
		       double left_accel, double right_accel,
		       std::string &error) override;
  int set_lift_motor(double speed, std::string &error) override;
  int set_head_motor(double speed, std::string &error) override;

  int drive_off_charger(std::string &error) override;
  int drive_on_charger(std::string &error) override;
  void request_control(bool enable) override;

  double battery_volts() override { return state_.battery_volts; }
  robot_state_t state() override { return state_; }

  // simulation controls
  void set_reachable(bool r) { reachable = r; }
  void set_latency_ms(int ms) { latency_ms = ms; }
  void set_battery_volts(double v) { state_.battery_volts = v; }
  int connect_count(void) const { return connects; }
  const std::vector<std::string> &spoken(void) const { return spoken_; }
  const std::vector<std::string> &played(void) const { return played_; }
};

#endif
