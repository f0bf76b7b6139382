#ifndef COMMANDEXECUTOR_H
#define COMMANDEXECUTOR_H

#include <atomic>
#include <functional>
#include <vector>

#include "Command.h"
#include "DeviceChannel.h"

/*
 * CommandExecutor
 *
 * Runs a queue snapshot, in order, against one device lease and
 * returns exactly one outcome per command in snapshot order. A failing
 * or timed out command never stops the batch. If the lease cannot be
 * taken every command fails with "unavailable device" and nothing is
 * evaluated. The cancel check runs before every command; once it
 * returns true the remaining commands fail with "cancelled" without
 * being evaluated.
 */

typedef std::function<bool(void)> cancel_proc_t;

class CommandExecutor
{
  DeviceChannel *channel;

 public:
  explicit CommandExecutor(DeviceChannel *channel): channel(channel) {}

  std::vector<command_outcome_t>
  execute(const std::vector<command_t> &snapshot,
	  const cancel_proc_t &cancelled = nullptr);

  std::vector<command_outcome_t>
  execute(const std::vector<command_t> &snapshot,
	  const std::atomic<bool> *cancel);
};

#endif
