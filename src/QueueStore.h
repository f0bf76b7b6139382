#ifndef QUEUESTORE_H
#define QUEUESTORE_H

#include <string>
#include <vector>
#include <mutex>
#include <unordered_map>

#include "rqserv.h"

/*
 * QueueStore
 *   where session queues live between requests; the caller holds the
 *   queue lock around load/save so they are atomic with respect to
 *   append, clear and drain
 */
class QueueStore
{
 public:
  virtual ~QueueStore() {}

  /* a session never saved loads as an empty queue */
  virtual rq_status_t load(const std::string &session,
			   std::vector<std::string> &texts) = 0;
  virtual rq_status_t save(const std::string &session,
			   const std::vector<std::string> &texts) = 0;
  virtual rq_status_t remove(const std::string &session) = 0;
};

class MemoryQueueStore : public QueueStore
{
 private:
  std::unordered_map<std::string, std::vector<std::string>> map_;
  std::mutex mutex_;

 public:
  rq_status_t load(const std::string &session,
		   std::vector<std::string> &texts) override;
  rq_status_t save(const std::string &session,
		   const std::vector<std::string> &texts) override;
  rq_status_t remove(const std::string &session) override;
};

/*
 * JsonQueueStore
 *   one file per session in dir: {"session": id, "commands": [...]}
 *   written to a temporary file and renamed into place
 */
class JsonQueueStore : public QueueStore
{
 private:
  std::string dir;
  std::mutex mutex_;

  std::string path_for(const std::string &session) const;

 public:
  explicit JsonQueueStore(std::string dir);

  static bool valid_session_id(const std::string &session);

  rq_status_t load(const std::string &session,
		   std::vector<std::string> &texts) override;
  rq_status_t save(const std::string &session,
		   const std::vector<std::string> &texts) override;
  rq_status_t remove(const std::string &session) override;
};

#endif
