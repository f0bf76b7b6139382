#include "CommandExecutor.h"
#include "rqserv.h"

#include <iostream>

static command_outcome_t success(const command_t &cmd, std::string result)
{
  command_outcome_t outcome;
  outcome.command = cmd.text;
  outcome.status = OUTCOME_SUCCESS;
  outcome.result = std::move(result);
  return outcome;
}

static command_outcome_t failure(const command_t &cmd, std::string error)
{
  command_outcome_t outcome;
  outcome.command = cmd.text;
  outcome.status = OUTCOME_FAILURE;
  outcome.error = std::move(error);
  return outcome;
}

std::vector<command_outcome_t>
CommandExecutor::execute(const std::vector<command_t> &snapshot,
			 const std::atomic<bool> *cancel)
{
  if (!cancel) return execute(snapshot, cancel_proc_t());
  return execute(snapshot, [cancel] { return cancel->load(); });
}

std::vector<command_outcome_t>
CommandExecutor::execute(const std::vector<command_t> &snapshot,
			 const cancel_proc_t &cancelled)
{
  std::vector<command_outcome_t> outcomes;
  if (snapshot.empty()) return outcomes;

  outcomes.reserve(snapshot.size());

  DeviceLease lease(*channel);
  if (!lease.held()) {
    std::cerr << "CommandExecutor: device acquisition failed: "
	      << lease.error() << std::endl;
    for (const auto &cmd : snapshot) {
      outcomes.push_back(failure(cmd, rq_status_string(RQ_DEVICE_UNAVAILABLE)));
    }
    return outcomes;
  }

  bool stop = false;
  for (const auto &cmd : snapshot) {
    if (!stop && cancelled) stop = cancelled();
    if (stop) {
      outcomes.push_back(failure(cmd, rq_status_string(RQ_CANCELLED)));
      continue;
    }

    std::string result;
    int rc = channel->evaluate(cmd.text, result);

    switch (rc) {
    case DEVICE_OK:
      outcomes.push_back(success(cmd, std::move(result)));
      break;
    case DEVICE_TIMEOUT:
      outcomes.push_back(failure(cmd, rq_status_string(RQ_TIMEOUT)));
      break;
    default:
      if (result.empty()) result = rq_status_string(RQ_EVALUATION_FAILURE);
      outcomes.push_back(failure(cmd, std::move(result)));
      break;
    }
  }

  return outcomes;
}
