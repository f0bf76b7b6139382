#ifndef COMMANDTABLE_H
#define COMMANDTABLE_H

#include <functional>
#include <map>
#include <string>
#include <vector>

#include "Robot.h"

/*
 * CommandTable
 *
 * Closed table of the operations a command line may name. A line is
 * split into words with Tcl list rules, so braces and quotes group
 * words but nothing is substituted or evaluated:
 *
 *   robot say_text {hello there}
 *   robot.set_wheel_motors 50 50
 *
 * or written as a call, arguments separated by commas, strings quoted
 * with '' or "" and numbers or booleans bare:
 *
 *   robot.say_text('hello there')
 *   robot.set_wheel_motors(50, 50)
 *
 * The first word must be the bound name, alone or as the prefix of the
 * operation word. Handlers return ROBOT_OK with the rendered value in
 * result, or ROBOT_ERROR with a description.
 */

typedef std::function<int(Robot &robot,
			  const std::vector<std::string> &args,
			  std::string &result)> robot_op_proc_t;

typedef struct robot_op_s {
  std::string name;
  int min_args;
  int max_args;			// -1 for no limit
  std::string usage;
  robot_op_proc_t proc;
} robot_op_t;

class CommandTable
{
  std::string bound_name_;
  std::map<std::string, robot_op_t> ops_;

  std::string names_phrase(void) const;
  bool call_form(const std::string &line, std::string &opname) const;
  static int parse_call_args(const std::string &line, size_t open,
			     std::vector<std::string> &args,
			     std::string &error);

 public:
  explicit CommandTable(std::string bound_name = "robot");

  const std::string &bound_name(void) const { return bound_name_; }

  void add(const std::string &name, int min_args, int max_args,
	   const std::string &usage, robot_op_proc_t proc);
  bool exists(const std::string &name) const;
  std::vector<std::string> names(void) const;

  static int split(const std::string &text,
		   std::vector<std::string> &words, std::string &error);
  static std::string merge(const std::vector<std::string> &words);

  int dispatch(Robot &robot, const std::string &text,
	       std::string &result) const;
};

#endif
