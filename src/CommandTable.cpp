#include "CommandTable.h"
#include "TclCompat.h"

#include <cctype>

CommandTable::CommandTable(std::string bound_name):
  bound_name_(std::move(bound_name))
{
}

void CommandTable::add(const std::string &name, int min_args, int max_args,
		       const std::string &usage, robot_op_proc_t proc)
{
  robot_op_t op;
  op.name = name;
  op.min_args = min_args;
  op.max_args = max_args;
  op.usage = usage;
  op.proc = std::move(proc);
  ops_[name] = std::move(op);
}

bool CommandTable::exists(const std::string &name) const
{
  return ops_.find(name) != ops_.end();
}

std::vector<std::string> CommandTable::names(void) const
{
  std::vector<std::string> out;
  for (const auto & [ name, op ] : ops_) out.push_back(name);
  return out;
}

/* "a, b, or c" in the style of Tcl's bad option messages */
std::string CommandTable::names_phrase(void) const
{
  std::string phrase;
  size_t i = 0, n = ops_.size();
  for (const auto & [ name, op ] : ops_) {
    if (i > 0) phrase += (i == n-1) ? (n > 2 ? ", or " : " or ") : ", ";
    phrase += name;
    i++;
  }
  return phrase;
}

int CommandTable::split(const std::string &text,
			std::vector<std::string> &words, std::string &error)
{
  Tcl_Size argc;
  const char **argv;

  words.clear();
  if (Tcl_SplitList(NULL, text.c_str(), &argc, &argv) != TCL_OK) {
    error = "unbalanced braces or quotes in \"" + text + "\"";
    return ROBOT_ERROR;
  }
  for (Tcl_Size i = 0; i < argc; i++) words.push_back(argv[i]);
  Tcl_Free((char *) argv);
  return ROBOT_OK;
}

std::string CommandTable::merge(const std::vector<std::string> &words)
{
  std::vector<const char *> argv;
  for (const auto &w : words) argv.push_back(w.c_str());

  char *merged = Tcl_Merge(argv.size(), argv.data());
  std::string s(merged);
  Tcl_Free(merged);
  return s;
}

/*
 * "robot.op(" with op made of word characters marks the call form
 */
bool CommandTable::call_form(const std::string &line, std::string &opname) const
{
  const std::string prefix = bound_name_ + ".";
  if (line.compare(0, prefix.size(), prefix) != 0) return false;

  size_t open = line.find('(', prefix.size());
  if (open == std::string::npos || open == prefix.size()) return false;
  for (size_t i = prefix.size(); i < open; i++) {
    unsigned char c = line[i];
    if (!(isalnum(c) || c == '_')) return false;
  }
  opname = line.substr(prefix.size(), open - prefix.size());
  return true;
}

static size_t skip_space(const std::string &s, size_t i)
{
  while (i < s.size() && isspace((unsigned char) s[i])) i++;
  return i;
}

int CommandTable::parse_call_args(const std::string &line, size_t open,
				  std::vector<std::string> &args,
				  std::string &error)
{
  size_t i = skip_space(line, open + 1);
  bool closed = false;

  args.clear();
  while (i < line.size()) {
    if (line[i] == ')') {
      closed = true;
      i++;
      break;
    }

    std::string arg;
    if (line[i] == '\'' || line[i] == '"') {
      char quote = line[i++];
      bool terminated = false;
      while (i < line.size()) {
	char c = line[i++];
	if (c == quote) {
	  terminated = true;
	  break;
	}
	if (c == '\\' && i < line.size()) {
	  char e = line[i++];
	  switch (e) {
	  case 'n': arg += '\n'; break;
	  case 't': arg += '\t'; break;
	  case '\\': case '\'': case '"': arg += e; break;
	  default: arg += c; arg += e; break;
	  }
	}
	else {
	  arg += c;
	}
      }
      if (!terminated) {
	error = "unterminated string in \"" + line + "\"";
	return ROBOT_ERROR;
      }
    }
    else {
      size_t end = line.find_first_of(",)", i);
      if (end == std::string::npos) end = line.size();
      size_t last = end;
      while (last > i && isspace((unsigned char) line[last-1])) last--;
      arg = line.substr(i, last - i);
      if (arg.empty()) {
	error = "missing argument in \"" + line + "\"";
	return ROBOT_ERROR;
      }
      i = end;
    }
    args.push_back(std::move(arg));

    i = skip_space(line, i);
    if (i < line.size() && line[i] == ',') {
      i = skip_space(line, i + 1);
    }
    else if (i >= line.size() || line[i] != ')') {
      error = "expected \",\" or \")\" in \"" + line + "\"";
      return ROBOT_ERROR;
    }
  }

  if (!closed || skip_space(line, i) != line.size()) {
    error = "malformed call \"" + line + "\"";
    return ROBOT_ERROR;
  }
  return ROBOT_OK;
}

int CommandTable::dispatch(Robot &robot, const std::string &text,
			   std::string &result) const
{
  std::string opname;
  std::vector<std::string> args;

  size_t first = text.find_first_not_of(" \t\r\n");
  size_t last = text.find_last_not_of(" \t\r\n");
  std::string line = (first == std::string::npos) ?
    std::string() : text.substr(first, last - first + 1);

  if (call_form(line, opname)) {
    if (parse_call_args(line, bound_name_.size() + 1 + opname.size(),
			args, result) != ROBOT_OK)
      return ROBOT_ERROR;
  }
  else {
    std::vector<std::string> words;
    if (split(line, words, result) != ROBOT_OK) return ROBOT_ERROR;

    if (words.empty()) {
      result = "empty command";
      return ROBOT_ERROR;
    }

    const std::string prefix = bound_name_ + ".";

    if (words[0] == bound_name_) {
      if (words.size() < 2) {
	result = "wrong # args: should be \"" + bound_name_ +
	  " operation ?arg ...?\"";
	return ROBOT_ERROR;
      }
      opname = words[1];
      args.assign(words.begin() + 2, words.end());
    }
    else if (words[0].compare(0, prefix.size(), prefix) == 0) {
      opname = words[0].substr(prefix.size());
      args.assign(words.begin() + 1, words.end());
    }
    else {
      result = "invalid command name \"" + words[0] + "\"";
      return ROBOT_ERROR;
    }
  }

  auto iter = ops_.find(opname);
  if (iter == ops_.end()) {
    result = "unknown " + bound_name_ + " operation \"" + opname +
      "\": must be " + names_phrase();
    return ROBOT_ERROR;
  }

  const robot_op_t &op = iter->second;
  int nargs = args.size();
  if (nargs < op.min_args || (op.max_args >= 0 && nargs > op.max_args)) {
    result = "wrong # args: should be \"" + bound_name_ + " " + op.name;
    if (!op.usage.empty()) result += " " + op.usage;
    result += "\"";
    return ROBOT_ERROR;
  }

  result.clear();
  return op.proc(robot, args, result);
}
