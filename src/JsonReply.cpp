#include "JsonReply.h"

#include <cstdlib>
#include <jansson.h>

/* json_string rejects invalid UTF-8, which clients can send */
static json_t *json_text(const std::string &s)
{
  json_t *j = json_stringn(s.data(), s.size());
  if (!j) j = json_string("<invalid utf-8>");
  return j;
}

static std::string dump_and_free(json_t *root)
{
  char *s = json_dumps(root, 0);
  json_decref(root);
  if (!s) return std::string();
  std::string out(s);
  free(s);
  return out;
}

std::string outcomes_to_json(const std::vector<command_outcome_t> &outcomes)
{
  json_t *array = json_array();
  for (const auto &o : outcomes) {
    json_t *entry = json_object();
    json_object_set_new(entry, "command", json_text(o.command));
    if (o.ok()) {
      json_object_set_new(entry, "status", json_string("ok"));
      json_object_set_new(entry, "result", json_text(o.result));
    }
    else {
      json_object_set_new(entry, "status", json_string("error"));
      json_object_set_new(entry, "error", json_text(o.error));
    }
    json_array_append_new(array, entry);
  }
  return dump_and_free(array);
}

std::string search_result_to_json(const search_result_t &result)
{
  json_t *root = json_object();
  json_object_set_new(root, "count", json_integer(result.count));

  json_t *matches = json_array();
  for (const auto &app : result.matches) {
    json_t *entry = json_object();
    json_object_set_new(entry, "name", json_text(app.name));
    json_object_set_new(entry, "description",
			json_text(app.description));
    json_object_set_new(entry, "author", json_text(app.author));
    json_array_append_new(matches, entry);
  }
  json_object_set_new(root, "matches", matches);

  return dump_and_free(root);
}

std::string strings_to_json(const std::vector<std::string> &strings)
{
  json_t *array = json_array();
  for (const auto &s : strings) {
    json_array_append_new(array, json_text(s));
  }
  return dump_and_free(array);
}
