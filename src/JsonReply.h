#ifndef JSONREPLY_H
#define JSONREPLY_H

#include <string>
#include <vector>

#include "Command.h"
#include "Catalog.h"

/*
 * single line JSON replies for the control protocol
 *
 *   outcomes: [{"command": ..., "status": "ok", "result": ...},
 *              {"command": ..., "status": "error", "error": ...}]
 *   search:   {"count": n, "matches": [{"name", "description", "author"}]}
 *   strings:  ["a", "b"]
 */

std::string outcomes_to_json(const std::vector<command_outcome_t> &outcomes);
std::string search_result_to_json(const search_result_t &result);
std::string strings_to_json(const std::vector<std::string> &strings);

#endif
