#include "SessionTable.h"

#include <iostream>

// caller holds mutex_
std::shared_ptr<Session> SessionTable::lookup(const std::string &id,
					      bool create)
{
  auto iter = map_.find(id);
  if (iter != map_.end()) return iter->second;

  auto session = std::make_shared<Session>(id);
  if (store) {
    if (session->queue.load_from(*store, id) != RQ_OK) {
      std::cerr << "SessionTable: could not load queue for session \""
		<< id << "\", starting empty" << std::endl;
    }
  }

  /* nothing stored and nothing asked to be added */
  if (!create && session->queue.empty()) return nullptr;

  map_[id] = session;
  return session;
}

std::shared_ptr<Session> SessionTable::get(const std::string &id)
{
  std::lock_guard<std::mutex> mlock(mutex_);
  return lookup(id, true);
}

std::shared_ptr<Session> SessionTable::find(const std::string &id)
{
  std::lock_guard<std::mutex> mlock(mutex_);
  return lookup(id, false);
}

bool SessionTable::exists(const std::string &id)
{
  std::lock_guard<std::mutex> mlock(mutex_);
  return map_.find(id) != map_.end();
}

void SessionTable::remove(const std::string &id)
{
  std::lock_guard<std::mutex> mlock(mutex_);
  map_.erase(id);
  if (store && store->remove(id) != RQ_OK) {
    std::cerr << "SessionTable: could not remove stored queue for \""
	      << id << "\"" << std::endl;
  }
}

std::vector<std::string> SessionTable::names(void)
{
  std::lock_guard<std::mutex> mlock(mutex_);
  std::vector<std::string> out;
  for (const auto & [ id, session ] : map_) out.push_back(id);
  return out;
}

/*
 * held under mutex_ so a session removed meanwhile, say while its batch
 * ran, is not written back to the store
 */
void SessionTable::save(Session &session)
{
  if (!store) return;

  std::lock_guard<std::mutex> mlock(mutex_);
  auto iter = map_.find(session.id);
  if (iter == map_.end() || iter->second.get() != &session) return;

  if (session.queue.save_to(*store, session.id) != RQ_OK) {
    std::cerr << "SessionTable: could not save queue for session \""
	      << session.id << "\"" << std::endl;
  }
}

rq_status_t SessionTable::submit(const std::string &id,
				 const std::string &text, int *length)
{
  /* refuse bad text before it can start a session */
  if (!CommandQueue::valid_text(text)) return RQ_INVALID_COMMAND;

  auto session = get(id);
  rq_status_t rc = session->queue.append(text);
  if (rc != RQ_OK) return rc;

  save(*session);
  if (length) *length = session->queue.size();
  return RQ_OK;
}

void SessionTable::clear(const std::string &id)
{
  auto session = find(id);
  if (!session) return;
  session->queue.clear();
  save(*session);
}

std::vector<std::string> SessionTable::queued(const std::string &id)
{
  auto session = find(id);
  if (!session) return std::vector<std::string>();
  return session->queue.texts();
}

std::vector<command_outcome_t>
SessionTable::execute(const std::string &id, DeviceChannel &channel,
		      const std::atomic<bool> *cancel)
{
  if (!cancel) return execute(id, channel, cancel_proc_t());
  return execute(id, channel, [cancel] { return cancel->load(); });
}

std::vector<command_outcome_t>
SessionTable::execute(const std::string &id, DeviceChannel &channel,
		      const cancel_proc_t &cancelled)
{
  auto session = find(id);
  if (!session) return std::vector<command_outcome_t>();

  /* a second execute for this session waits for the first */
  std::lock_guard<std::mutex> exec_lock(session->exec_mutex);

  std::vector<command_t> snapshot = session->queue.snapshot();
  if (snapshot.empty()) return std::vector<command_outcome_t>();

  CommandExecutor executor(&channel);
  std::vector<command_outcome_t> outcomes =
    executor.execute(snapshot, cancelled);

  session->queue.drain(snapshot);
  save(*session);

  return outcomes;
}
