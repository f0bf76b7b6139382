#include "QueueStore.h"

#include <iostream>
#include <cstdio>
#include <cerrno>
#include <cstring>
#include <cctype>
#include <sys/stat.h>
#include <unistd.h>

#include <jansson.h>

/***************************** MemoryQueueStore ****************************/

rq_status_t MemoryQueueStore::load(const std::string &session,
				   std::vector<std::string> &texts)
{
  std::lock_guard<std::mutex> mlock(mutex_);
  auto iter = map_.find(session);
  if (iter != map_.end()) texts = iter->second;
  else texts.clear();
  return RQ_OK;
}

rq_status_t MemoryQueueStore::save(const std::string &session,
				   const std::vector<std::string> &texts)
{
  std::lock_guard<std::mutex> mlock(mutex_);
  map_[session] = texts;
  return RQ_OK;
}

rq_status_t MemoryQueueStore::remove(const std::string &session)
{
  std::lock_guard<std::mutex> mlock(mutex_);
  map_.erase(session);
  return RQ_OK;
}

/****************************** JsonQueueStore *****************************/

JsonQueueStore::JsonQueueStore(std::string dir): dir(std::move(dir))
{
  struct stat st;
  if (stat(this->dir.c_str(), &st) != 0) {
    if (mkdir(this->dir.c_str(), 0755) != 0) {
      std::cerr << "JsonQueueStore: cannot create " << this->dir
		<< ": " << strerror(errno) << std::endl;
    }
  }
}

bool JsonQueueStore::valid_session_id(const std::string &session)
{
  if (session.empty() || session.size() > 128) return false;
  if (session[0] == '.') return false;
  for (char c : session) {
    if (!(isalnum((unsigned char) c) || c == '_' || c == '-' || c == '.'))
      return false;
  }
  return true;
}

std::string JsonQueueStore::path_for(const std::string &session) const
{
  return dir + "/" + session + ".json";
}

rq_status_t JsonQueueStore::load(const std::string &session,
				 std::vector<std::string> &texts)
{
  texts.clear();
  if (!valid_session_id(session)) return RQ_ERROR;

  std::lock_guard<std::mutex> mlock(mutex_);
  std::string path = path_for(session);

  struct stat st;
  if (stat(path.c_str(), &st) != 0) return RQ_OK;

  json_error_t error;
  json_t *root = json_load_file(path.c_str(), 0, &error);
  if (!root) {
    std::cerr << "JsonQueueStore: " << path << ":" << error.line
	      << ": " << error.text << std::endl;
    return RQ_ERROR;
  }

  json_t *commands = json_object_get(root, "commands");
  if (!json_is_array(commands)) {
    std::cerr << "JsonQueueStore: " << path
	      << ": missing \"commands\" array" << std::endl;
    json_decref(root);
    return RQ_ERROR;
  }

  size_t index;
  json_t *value;
  json_array_foreach(commands, index, value) {
    if (json_is_string(value)) texts.push_back(json_string_value(value));
  }

  json_decref(root);
  return RQ_OK;
}

rq_status_t JsonQueueStore::save(const std::string &session,
				 const std::vector<std::string> &texts)
{
  if (!valid_session_id(session)) return RQ_ERROR;

  json_t *root = json_object();
  json_object_set_new(root, "session", json_string(session.c_str()));
  json_t *commands = json_array();
  for (const auto &t : texts) {
    json_t *text = json_stringn(t.data(), t.size());
    if (!text) {
      /* never write a queue that would come back shorter */
      std::cerr << "JsonQueueStore: non UTF-8 command in session "
		<< session << ", queue not saved" << std::endl;
      json_decref(root);
      json_decref(commands);
      return RQ_ERROR;
    }
    json_array_append_new(commands, text);
  }
  json_object_set_new(root, "commands", commands);

  std::lock_guard<std::mutex> mlock(mutex_);
  std::string path = path_for(session);
  std::string tmp_path = path + ".tmp";

  int rc = json_dump_file(root, tmp_path.c_str(), JSON_INDENT(2));
  json_decref(root);

  if (rc != 0) {
    std::cerr << "JsonQueueStore: cannot write " << tmp_path << std::endl;
    return RQ_ERROR;
  }
  if (rename(tmp_path.c_str(), path.c_str()) != 0) {
    std::cerr << "JsonQueueStore: cannot rename " << tmp_path
	      << ": " << strerror(errno) << std::endl;
    unlink(tmp_path.c_str());
    return RQ_ERROR;
  }
  return RQ_OK;
}

rq_status_t JsonQueueStore::remove(const std::string &session)
{
  if (!valid_session_id(session)) return RQ_ERROR;

  std::lock_guard<std::mutex> mlock(mutex_);
  std::string path = path_for(session);
  if (unlink(path.c_str()) != 0 && errno != ENOENT) {
    std::cerr << "JsonQueueStore: cannot remove " << path
	      << ": " << strerror(errno) << std::endl;
    return RQ_ERROR;
  }
  return RQ_OK;
}
