#ifndef COMMANDQUEUE_H
#define COMMANDQUEUE_H

#include <deque>
#include <mutex>
#include <string>
#include <vector>

#include "rqserv.h"
#include "Command.h"

class QueueStore;

/*
 * CommandQueue
 *
 * Ordered list of pending commands for one session. Every operation
 * holds the queue lock, so a drain only ever removes the commands of
 * the snapshot it was handed and appends made while a batch runs are
 * kept for the next one.
 */
class CommandQueue
{
 private:
  std::deque<command_t> commands_;
  uint64_t next_seq_ = 1;
  mutable std::mutex mutex_;

  void push_locked(std::string text);

 public:
  rq_status_t append(const std::string &text);
  void clear();
  std::vector<command_t> snapshot() const;

  /*
   * remove every command up to and including the last one in
   * snapshot, returns the number removed
   */
  int drain(const std::vector<command_t> &snapshot);

  void restore(const std::vector<std::string> &texts);
  std::vector<std::string> texts() const;

  int size() const;
  bool empty() const;

  // persistence, performed under the queue lock
  rq_status_t load_from(QueueStore &store, const std::string &session);
  rq_status_t save_to(QueueStore &store, const std::string &session) const;

  static std::string trim(const std::string &s);

  /*
   * non-empty after trimming and valid UTF-8, so every queued command
   * can be stored; Tcl's two byte NUL (C0 80) is refused as overlong
   */
  static bool valid_text(const std::string &text);
};

#endif
