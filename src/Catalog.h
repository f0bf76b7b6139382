#ifndef CATALOG_H
#define CATALOG_H

#include <mutex>
#include <string>
#include <vector>

typedef struct application_record_s {
  std::string name;
  std::string description;
  std::string author;
} application_record_t;

/* fields a search may look at, combined as a set of bits */
enum search_field_t {
  SEARCH_NAME        = 0x1,
  SEARCH_DESCRIPTION = 0x2,
  SEARCH_AUTHOR      = 0x4
};
const unsigned int SEARCH_ALL = SEARCH_NAME | SEARCH_DESCRIPTION | SEARCH_AUTHOR;

typedef struct search_query_s {
  std::string text;
  unsigned int fields;		// no bits set matches nothing
} search_query_t;

typedef struct search_result_s {
  std::vector<application_record_t> matches;
  int count;
} search_result_t;

/*
 * Catalog
 *   application records in load order; list() hands out a copy so a
 *   search never sees a reload half way through
 */
class Catalog
{
  std::vector<application_record_t> records_;
  mutable std::mutex mutex_;

 public:
  enum catalog_rc { CATALOG_OK, CATALOG_ERROR };

  /*
   * JSON document is either an array of application objects or an
   * object holding them under "applications"; name is required,
   * description and author default to empty, other keys are ignored
   */
  int load(const std::string &path, std::string &error);
  int load_string(const std::string &json, std::string &error);

  void add(const application_record_t &record);
  void clear(void);
  std::vector<application_record_t> list(void) const;
  int size(void) const;
};

search_result_t catalog_search(const std::vector<application_record_t> &catalog,
			       const search_query_t &query);

/*
 * parse field names (name, description, author) into a field set,
 * returns false and sets error on an unknown name
 */
bool search_fields_from_names(const std::vector<std::string> &names,
			      unsigned int &fields, std::string &error);

#endif
