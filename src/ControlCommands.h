#ifndef CONTROLCOMMANDS_H
#define CONTROLCOMMANDS_H

#include <atomic>
#include <tcl.h>

class SessionTable;
class Catalog;
class DeviceChannel;

typedef struct control_context_s {
  SessionTable *sessions;
  Catalog *catalog;
  DeviceChannel *channel;
  const std::atomic<bool> *cancel;	// set when the server shuts down
  int sockfd;				// client connection, -1 if none
} control_context_t;

/*
 * user facing actions, available to every control interpreter:
 *   cmdSubmit session text      -> new queue length
 *   cmdClear session
 *   cmdQueue session            -> JSON array of queued commands
 *   cmdExecute session          -> JSON array of outcomes, cancelled
 *                                  once the server stops or the client
 *                                  hangs up
 *   cmdEnd session              -> end the session, dropping its queue
 *   cmdSessions                 -> list of known sessions
 *   appSearch text ?fields?     -> JSON search result
 *   appList                     -> JSON search result of every record
 *   rqservVersion
 */
void add_control_commands(Tcl_Interp *interp, control_context_t *ctx);

/*
 * server administration, only for the startup configuration script:
 *   catalogLoad path            -> number of records
 *   deviceTimeout ?ms?          -> current timeout
 */
void add_config_commands(Tcl_Interp *interp, control_context_t *ctx);

#endif
