#ifndef SESSIONTABLE_H
#define SESSIONTABLE_H

#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "rqserv.h"
#include "CommandQueue.h"
#include "CommandExecutor.h"
#include "QueueStore.h"

/*
 * Session
 *   per user state: the pending queue and a lock that keeps two
 *   executes for the same session from running at once
 */
class Session
{
 public:
  std::string id;
  CommandQueue queue;
  std::mutex exec_mutex;

  explicit Session(std::string id): id(std::move(id)) {}
};

/*
 * SessionTable
 *
 * A session starts with its first submit (or when a queue saved for it
 * is found in the store) and ends with remove(). Queues are loaded from
 * the store when a session starts and saved back after every change.
 * Looking at or executing an unknown session does not start one. The
 * table never owns the store or the device channel.
 */
class SessionTable
{
  std::unordered_map<std::string, std::shared_ptr<Session>> map_;
  std::mutex mutex_;
  QueueStore *store;

  std::shared_ptr<Session> lookup(const std::string &id, bool create);
  void save(Session &session);

 public:
  explicit SessionTable(QueueStore *store = nullptr): store(store) {}

  std::shared_ptr<Session> get(const std::string &id);
  /* the live session or, failing that, one with a stored queue */
  std::shared_ptr<Session> find(const std::string &id);
  bool exists(const std::string &id);
  void remove(const std::string &id);
  std::vector<std::string> names(void);

  /* on success length holds the new queue length */
  rq_status_t submit(const std::string &id, const std::string &text,
		     int *length = nullptr);
  void clear(const std::string &id);
  std::vector<std::string> queued(const std::string &id);

  /*
   * run the session's current queue against channel and drain the
   * executed commands; appends made meanwhile stay queued
   */
  std::vector<command_outcome_t>
  execute(const std::string &id, DeviceChannel &channel,
	  const cancel_proc_t &cancelled = nullptr);

  std::vector<command_outcome_t>
  execute(const std::string &id, DeviceChannel &channel,
	  const std::atomic<bool> *cancel);
};

#endif
