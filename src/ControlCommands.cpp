#include "ControlCommands.h"
#include "TclCompat.h"
#include "SessionTable.h"
#include "Catalog.h"
#include "DeviceChannel.h"
#include "JsonReply.h"
#include "rqservConfig.h"

#include <string>
#include <vector>

#include <cerrno>
#include <poll.h>
#include <sys/socket.h>

static void set_string_result(Tcl_Interp *interp, const std::string &s)
{
  Tcl_SetObjResult(interp, Tcl_NewStringObj(s.c_str(), s.size()));
}

/****************************** cmdSubmit *****************************/

static int cmd_submit_command(ClientData data, Tcl_Interp *interp,
			      int objc, Tcl_Obj *const objv[])
{
  control_context_t *ctx = (control_context_t *) data;

  if (objc != 3) {
    Tcl_WrongNumArgs(interp, 1, objv, "session text");
    return TCL_ERROR;
  }

  int length = 0;
  rq_status_t rc = ctx->sessions->submit(Tcl_GetString(objv[1]),
					 Tcl_GetString(objv[2]), &length);
  if (rc != RQ_OK) {
    const char *why = CommandQueue::trim(Tcl_GetString(objv[2])).empty() ?
      "command text is empty" : "command text is not valid UTF-8";
    Tcl_AppendResult(interp, Tcl_GetString(objv[0]), ": ",
		     rq_status_string(rc), ": ", why, (char *) NULL);
    return TCL_ERROR;
  }

  Tcl_SetObjResult(interp, Tcl_NewIntObj(length));
  return TCL_OK;
}

/****************************** cmdClear ******************************/

static int cmd_clear_command(ClientData data, Tcl_Interp *interp,
			     int objc, Tcl_Obj *const objv[])
{
  control_context_t *ctx = (control_context_t *) data;

  if (objc != 2) {
    Tcl_WrongNumArgs(interp, 1, objv, "session");
    return TCL_ERROR;
  }

  ctx->sessions->clear(Tcl_GetString(objv[1]));
  return TCL_OK;
}

/****************************** cmdQueue ******************************/

static int cmd_queue_command(ClientData data, Tcl_Interp *interp,
			     int objc, Tcl_Obj *const objv[])
{
  control_context_t *ctx = (control_context_t *) data;

  if (objc != 2) {
    Tcl_WrongNumArgs(interp, 1, objv, "session");
    return TCL_ERROR;
  }

  set_string_result(interp,
		    strings_to_json(ctx->sessions->queued(Tcl_GetString(objv[1]))));
  return TCL_OK;
}

/***************************** cmdExecute *****************************/

/*
 * true once the client has gone: an orderly close reads as end of
 * file, a reset as an error; pipelined requests just leave data
 */
static bool peer_closed(int sockfd)
{
  struct pollfd pfd;
  pfd.fd = sockfd;
  pfd.events = POLLIN;
  pfd.revents = 0;

  if (poll(&pfd, 1, 0) <= 0) return false;
  if (pfd.revents & (POLLERR | POLLHUP | POLLNVAL)) return true;

  char c;
  ssize_t n = recv(sockfd, &c, 1, MSG_PEEK | MSG_DONTWAIT);
  if (n == 0) return true;
  return n < 0 && errno != EAGAIN && errno != EWOULDBLOCK && errno != EINTR;
}

static int cmd_execute_command(ClientData data, Tcl_Interp *interp,
			       int objc, Tcl_Obj *const objv[])
{
  control_context_t *ctx = (control_context_t *) data;

  if (objc != 2) {
    Tcl_WrongNumArgs(interp, 1, objv, "session");
    return TCL_ERROR;
  }

  cancel_proc_t cancelled = [ctx] {
    if (ctx->cancel && ctx->cancel->load()) return true;
    return ctx->sockfd >= 0 && peer_closed(ctx->sockfd);
  };

  std::vector<command_outcome_t> outcomes =
    ctx->sessions->execute(Tcl_GetString(objv[1]), *ctx->channel, cancelled);

  set_string_result(interp, outcomes_to_json(outcomes));
  return TCL_OK;
}

/******************************* cmdEnd *******************************/

static int cmd_end_command(ClientData data, Tcl_Interp *interp,
			   int objc, Tcl_Obj *const objv[])
{
  control_context_t *ctx = (control_context_t *) data;

  if (objc != 2) {
    Tcl_WrongNumArgs(interp, 1, objv, "session");
    return TCL_ERROR;
  }

  ctx->sessions->remove(Tcl_GetString(objv[1]));
  return TCL_OK;
}

/***************************** cmdSessions ****************************/

static int cmd_sessions_command(ClientData data, Tcl_Interp *interp,
				int objc, Tcl_Obj *const objv[])
{
  control_context_t *ctx = (control_context_t *) data;

  Tcl_Obj *list = Tcl_NewListObj(0, NULL);
  for (const auto &name : ctx->sessions->names()) {
    Tcl_ListObjAppendElement(interp, list,
			     Tcl_NewStringObj(name.c_str(), name.size()));
  }
  Tcl_SetObjResult(interp, list);
  return TCL_OK;
}

/****************************** appSearch *****************************/

static int app_search_command(ClientData data, Tcl_Interp *interp,
			      int objc, Tcl_Obj *const objv[])
{
  control_context_t *ctx = (control_context_t *) data;

  if (objc < 2 || objc > 3) {
    Tcl_WrongNumArgs(interp, 1, objv, "text ?fields?");
    return TCL_ERROR;
  }

  search_query_t query;
  query.text = Tcl_GetString(objv[1]);
  query.fields = SEARCH_ALL;

  if (objc == 3) {
    Tcl_Size nfields;
    Tcl_Obj **fieldv;
    if (Tcl_ListObjGetElements(interp, objv[2], &nfields, &fieldv) != TCL_OK)
      return TCL_ERROR;

    std::vector<std::string> names;
    for (Tcl_Size i = 0; i < nfields; i++) names.push_back(Tcl_GetString(fieldv[i]));

    std::string error;
    if (!search_fields_from_names(names, query.fields, error)) {
      set_string_result(interp, error);
      return TCL_ERROR;
    }
  }

  search_result_t result = catalog_search(ctx->catalog->list(), query);
  set_string_result(interp, search_result_to_json(result));
  return TCL_OK;
}

/******************************* appList ******************************/

static int app_list_command(ClientData data, Tcl_Interp *interp,
			    int objc, Tcl_Obj *const objv[])
{
  control_context_t *ctx = (control_context_t *) data;

  search_query_t query;
  query.fields = SEARCH_ALL;
  search_result_t result = catalog_search(ctx->catalog->list(), query);
  set_string_result(interp, search_result_to_json(result));
  return TCL_OK;
}

/***************************** rqservVersion **************************/

static int version_command(ClientData data, Tcl_Interp *interp,
			   int objc, Tcl_Obj *const objv[])
{
  Tcl_SetObjResult(interp, Tcl_NewStringObj(rqserv_VERSION, -1));
  return TCL_OK;
}

/***************************** catalogLoad ****************************/

static int catalog_load_command(ClientData data, Tcl_Interp *interp,
				int objc, Tcl_Obj *const objv[])
{
  control_context_t *ctx = (control_context_t *) data;

  if (objc != 2) {
    Tcl_WrongNumArgs(interp, 1, objv, "path");
    return TCL_ERROR;
  }

  std::string error;
  if (ctx->catalog->load(Tcl_GetString(objv[1]), error) != Catalog::CATALOG_OK) {
    set_string_result(interp, error);
    return TCL_ERROR;
  }

  Tcl_SetObjResult(interp, Tcl_NewIntObj(ctx->catalog->size()));
  return TCL_OK;
}

/**************************** deviceTimeout ***************************/

static int device_timeout_command(ClientData data, Tcl_Interp *interp,
				  int objc, Tcl_Obj *const objv[])
{
  control_context_t *ctx = (control_context_t *) data;

  if (objc > 2) {
    Tcl_WrongNumArgs(interp, 1, objv, "?ms?");
    return TCL_ERROR;
  }

  if (objc == 2) {
    int ms;
    if (Tcl_GetIntFromObj(interp, objv[1], &ms) != TCL_OK)
      return TCL_ERROR;
    if (ms <= 0) {
      Tcl_AppendResult(interp, "timeout must be positive", (char *) NULL);
      return TCL_ERROR;
    }
    ctx->channel->set_timeout(ms);
  }

  Tcl_SetObjResult(interp, Tcl_NewIntObj(ctx->channel->timeout()));
  return TCL_OK;
}

void add_control_commands(Tcl_Interp *interp, control_context_t *ctx)
{
  Tcl_CreateObjCommand(interp, "cmdSubmit",
		       cmd_submit_command, ctx, NULL);
  Tcl_CreateObjCommand(interp, "cmdClear",
		       cmd_clear_command, ctx, NULL);
  Tcl_CreateObjCommand(interp, "cmdQueue",
		       cmd_queue_command, ctx, NULL);
  Tcl_CreateObjCommand(interp, "cmdExecute",
		       cmd_execute_command, ctx, NULL);
  Tcl_CreateObjCommand(interp, "cmdEnd",
		       cmd_end_command, ctx, NULL);
  Tcl_CreateObjCommand(interp, "cmdSessions",
		       cmd_sessions_command, ctx, NULL);
  Tcl_CreateObjCommand(interp, "appSearch",
		       app_search_command, ctx, NULL);
  Tcl_CreateObjCommand(interp, "appList",
		       app_list_command, ctx, NULL);
  Tcl_CreateObjCommand(interp, "rqservVersion",
		       version_command, ctx, NULL);
}

void add_config_commands(Tcl_Interp *interp, control_context_t *ctx)
{
  Tcl_CreateObjCommand(interp, "catalogLoad",
		       catalog_load_command, ctx, NULL);
  Tcl_CreateObjCommand(interp, "deviceTimeout",
		       device_timeout_command, ctx, NULL);
}
