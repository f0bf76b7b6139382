#include "CommandQueue.h"
#include "QueueStore.h"

#include <jansson.h>

std::string CommandQueue::trim(const std::string &s)
{
  const char *ws = " \t\n\r\f\v";
  size_t start = s.find_first_not_of(ws);
  if (start == std::string::npos) return std::string();
  size_t end = s.find_last_not_of(ws);
  return s.substr(start, end - start + 1);
}

bool CommandQueue::valid_text(const std::string &text)
{
  std::string trimmed = trim(text);
  if (trimmed.empty()) return false;

  /* jansson checks UTF-8 the same way the queue store will */
  json_t *j = json_stringn(trimmed.data(), trimmed.size());
  if (!j) return false;
  json_decref(j);
  return true;
}

// caller holds mutex_
void CommandQueue::push_locked(std::string text)
{
  command_t cmd;
  cmd.seq = next_seq_++;
  cmd.position = commands_.size();
  cmd.text = std::move(text);
  commands_.push_back(std::move(cmd));
}

rq_status_t CommandQueue::append(const std::string &text)
{
  if (!valid_text(text)) return RQ_INVALID_COMMAND;

  std::lock_guard<std::mutex> mlock(mutex_);
  push_locked(trim(text));
  return RQ_OK;
}

void CommandQueue::clear()
{
  std::lock_guard<std::mutex> mlock(mutex_);
  commands_.clear();
}

std::vector<command_t> CommandQueue::snapshot() const
{
  std::lock_guard<std::mutex> mlock(mutex_);
  std::vector<command_t> snap(commands_.begin(), commands_.end());
  for (size_t i = 0; i < snap.size(); i++) snap[i].position = i;
  return snap;
}

int CommandQueue::drain(const std::vector<command_t> &snapshot)
{
  if (snapshot.empty()) return 0;
  uint64_t high_water = snapshot.back().seq;

  std::lock_guard<std::mutex> mlock(mutex_);
  int removed = 0;

  /* seq increases along the queue so executed commands sit at the front */
  while (!commands_.empty() && commands_.front().seq <= high_water) {
    commands_.pop_front();
    removed++;
  }
  return removed;
}

void CommandQueue::restore(const std::vector<std::string> &texts)
{
  std::lock_guard<std::mutex> mlock(mutex_);
  commands_.clear();
  for (const auto &t : texts) {
    std::string trimmed = trim(t);
    if (!trimmed.empty()) push_locked(std::move(trimmed));
  }
}

std::vector<std::string> CommandQueue::texts() const
{
  std::lock_guard<std::mutex> mlock(mutex_);
  std::vector<std::string> out;
  out.reserve(commands_.size());
  for (const auto &c : commands_) out.push_back(c.text);
  return out;
}

int CommandQueue::size() const
{
  std::lock_guard<std::mutex> mlock(mutex_);
  return commands_.size();
}

bool CommandQueue::empty() const
{
  std::lock_guard<std::mutex> mlock(mutex_);
  return commands_.empty();
}

rq_status_t CommandQueue::load_from(QueueStore &store,
				    const std::string &session)
{
  std::vector<std::string> loaded;
  std::lock_guard<std::mutex> mlock(mutex_);

  rq_status_t rc = store.load(session, loaded);
  if (rc != RQ_OK) return rc;

  commands_.clear();
  for (const auto &t : loaded) {
    std::string trimmed = trim(t);
    if (!trimmed.empty()) push_locked(std::move(trimmed));
  }
  return RQ_OK;
}

rq_status_t CommandQueue::save_to(QueueStore &store,
				  const std::string &session) const
{
  std::lock_guard<std::mutex> mlock(mutex_);
  std::vector<std::string> out;
  out.reserve(commands_.size());
  for (const auto &c : commands_) out.push_back(c.text);
  return store.save(session, out);
}
