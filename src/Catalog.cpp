#include "Catalog.h"

#include <algorithm>
#include <cctype>

#include <jansson.h>

static int records_from_json(json_t *root,
			     std::vector<application_record_t> &records,
			     std::string &error)
{
  json_t *apps = root;
  if (json_is_object(root)) apps = json_object_get(root, "applications");

  if (!json_is_array(apps)) {
    error = "catalog must be an array or hold an \"applications\" array";
    return Catalog::CATALOG_ERROR;
  }

  size_t index;
  json_t *app;
  json_array_foreach(apps, index, app) {
    if (!json_is_object(app)) {
      error = "catalog entry " + std::to_string(index) + " is not an object";
      return Catalog::CATALOG_ERROR;
    }
    json_t *name = json_object_get(app, "name");
    if (!json_is_string(name)) {
      error = "catalog entry " + std::to_string(index) + " has no name";
      return Catalog::CATALOG_ERROR;
    }
    json_t *description = json_object_get(app, "description");
    json_t *author = json_object_get(app, "author");

    application_record_t record;
    record.name = json_string_value(name);
    if (json_is_string(description))
      record.description = json_string_value(description);
    if (json_is_string(author))
      record.author = json_string_value(author);
    records.push_back(std::move(record));
  }
  return Catalog::CATALOG_OK;
}

int Catalog::load(const std::string &path, std::string &error)
{
  json_error_t jerror;
  json_t *root = json_load_file(path.c_str(), 0, &jerror);
  if (!root) {
    error = path + ":" + std::to_string(jerror.line) + ": " + jerror.text;
    return CATALOG_ERROR;
  }

  std::vector<application_record_t> records;
  int rc = records_from_json(root, records, error);
  json_decref(root);
  if (rc != CATALOG_OK) return rc;

  std::lock_guard<std::mutex> mlock(mutex_);
  records_ = std::move(records);
  return CATALOG_OK;
}

int Catalog::load_string(const std::string &json, std::string &error)
{
  json_error_t jerror;
  json_t *root = json_loads(json.c_str(), 0, &jerror);
  if (!root) {
    error = std::string("invalid JSON: ") + jerror.text;
    return CATALOG_ERROR;
  }

  std::vector<application_record_t> records;
  int rc = records_from_json(root, records, error);
  json_decref(root);
  if (rc != CATALOG_OK) return rc;

  std::lock_guard<std::mutex> mlock(mutex_);
  records_ = std::move(records);
  return CATALOG_OK;
}

void Catalog::add(const application_record_t &record)
{
  std::lock_guard<std::mutex> mlock(mutex_);
  records_.push_back(record);
}

void Catalog::clear(void)
{
  std::lock_guard<std::mutex> mlock(mutex_);
  records_.clear();
}

std::vector<application_record_t> Catalog::list(void) const
{
  std::lock_guard<std::mutex> mlock(mutex_);
  return records_;
}

int Catalog::size(void) const
{
  std::lock_guard<std::mutex> mlock(mutex_);
  return records_.size();
}

static std::string lower(const std::string &s)
{
  std::string out(s);
  std::transform(out.begin(), out.end(), out.begin(),
		 [](unsigned char c) { return std::tolower(c); });
  return out;
}

static bool contains(const std::string &field, const std::string &needle)
{
  return lower(field).find(needle) != std::string::npos;
}

search_result_t catalog_search(const std::vector<application_record_t> &catalog,
			       const search_query_t &query)
{
  search_result_t result;
  result.count = 0;

  /* no fields selected is its own request: show nothing */
  if ((query.fields & SEARCH_ALL) == 0) return result;

  std::string needle = lower(query.text);

  for (const auto &app : catalog) {
    if (needle.empty() ||
	((query.fields & SEARCH_NAME) && contains(app.name, needle)) ||
	((query.fields & SEARCH_DESCRIPTION) && contains(app.description, needle)) ||
	((query.fields & SEARCH_AUTHOR) && contains(app.author, needle))) {
      result.matches.push_back(app);
    }
  }
  result.count = result.matches.size();
  return result;
}

bool search_fields_from_names(const std::vector<std::string> &names,
			      unsigned int &fields, std::string &error)
{
  fields = 0;
  for (const auto &n : names) {
    if (n == "name") fields |= SEARCH_NAME;
    else if (n == "description") fields |= SEARCH_DESCRIPTION;
    else if (n == "author") fields |= SEARCH_AUTHOR;
    else {
      error = "bad field \"" + n + "\": must be name, description, or author";
      return false;
    }
  }
  return true;
}
