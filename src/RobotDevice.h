#ifndef ROBOTDEVICE_H
#define ROBOTDEVICE_H

#include <string>

#include "Device.h"
#include "Robot.h"
#include "CommandTable.h"

/*
 * RobotDevice
 *   Device whose commands resolve through the robot operation table;
 *   acquire connects, release disconnects
 */
class RobotDevice : public Device
{
  Robot *robot;
  CommandTable table;

 public:
  explicit RobotDevice(Robot *robot, std::string bound_name = "robot");

  int acquire(std::string &error) override;
  int evaluate(const std::string &text, std::string &result) override;
  void release() override;

  const CommandTable &commands(void) const { return table; }
};

/* animations hidden from list_animations and play_animation */
bool robot_animation_hidden(const std::string &name);

void add_robot_commands(CommandTable &table);

#endif
