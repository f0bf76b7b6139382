#ifndef COMMAND_H
#define COMMAND_H

#include <string>
#include <cstdint>

/*
 * command
 *   one queued line of text, seq is assigned by the owning queue and
 *   only ever increases, position is the index at snapshot time
 */

typedef struct command_s {
  uint64_t seq;
  int position;
  std::string text;
} command_t;

enum outcome_status_t { OUTCOME_SUCCESS, OUTCOME_FAILURE };

/*
 * command_outcome
 *   result holds the rendered value (possibly empty) of a success,
 *   error the description of a failure; the other one stays empty
 */

typedef struct command_outcome_s {
  std::string command;
  outcome_status_t status;
  std::string result;
  std::string error;

  bool ok() const { return status == OUTCOME_SUCCESS; }
} command_outcome_t;

#endif
