#ifndef ROBOT_H
#define ROBOT_H

#include <string>
#include <vector>

enum robot_rc { ROBOT_OK, ROBOT_ERROR };

typedef struct robot_state_s {
  bool connected;
  bool in_control;		// false while freeplay owns the robot
  bool on_charger;
  double left_wheel_speed;	// mm/s
  double right_wheel_speed;
  double left_wheel_accel;	// mm/s^2
  double right_wheel_accel;
  double lift_speed;		// rad/s
  double head_speed;
  double battery_volts;
  std::string last_spoken;
  std::string last_animation;
} robot_state_t;

/*
 * Robot
 *   the operations the robot SDK exposes; calls returning int give
 *   ROBOT_OK or ROBOT_ERROR with a description in error
 */
class Robot
{
 public:
  virtual ~Robot() {}

  virtual int connect(std::string &error) = 0;
  virtual void disconnect() = 0;

  virtual int say_text(const std::string &text, std::string &error) = 0;
  virtual std::vector<std::string> animations() = 0;
  virtual int play_animation(const std::string &name, std::string &error) = 0;

  virtual int set_wheel_motors(double left, double right,
			       double left_accel, double right_accel,
			       std::string &error) = 0;
  virtual int set_lift_motor(double speed, std::string &error) = 0;
  virtual int set_head_motor(double speed, std::string &error) = 0;

  virtual int drive_off_charger(std::string &error) = 0;
  virtual int drive_on_charger(std::string &error) = 0;

  /* enable=false hands the robot back to its own freeplay behaviors */
  virtual void request_control(bool enable) = 0;

  virtual double battery_volts() = 0;
  virtual robot_state_t state() = 0;
};

#endif
