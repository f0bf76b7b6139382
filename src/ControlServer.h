#ifndef CONTROLSERVER_H
#define CONTROLSERVER_H

#include <iostream>
#include <thread>
#include <atomic>
#include <mutex>
#include <condition_variable>
#include <set>
#include <string>
#include <unordered_map>

#include <netinet/in.h>
#include <netinet/tcp.h>
#include <sys/socket.h>
#include <arpa/inet.h>  // for inet_ntop
#include <unistd.h>

#include <tcl.h>

#include "ControlCommands.h"

class ControlServerConfig
{
public:
  std::string name = "rqserv";
  int port = 2580;		// 0 picks a free port, -1 disables the listener

  ControlServerConfig() {};
  ControlServerConfig(std::string name, int port): name(name), port(port) {};
};

/*
 * ControlServer
 *
 * CR/LF oriented listener for the user facing actions. Each client
 * gets its own thread and its own safe Tcl interpreter holding the
 * control commands; every line is evaluated there and answered with
 * one line, errors prefixed by "!TCL_ERROR ".
 */
class ControlServer
{
  std::thread net_thread;
  int listen_fd = -1;

private:
  std::atomic<int> active_connections{0};
  static const int MAX_TOTAL_CONNECTIONS = 128;      // Total server limit
  static const int MAX_CONNECTIONS_PER_IP = 8;       // Per-IP limit
  std::mutex connection_mutex;
  std::condition_variable connection_cond;
  std::set<int> active_sockets;
  std::unordered_map<int, std::string> socket_to_ip;     // socket -> IP mapping
  std::unordered_map<std::string, int> ip_connection_count;

  control_context_t context;

  int open_listener(void);

public:
  std::atomic<bool> m_bDone;	// flag to close accept loop and clients

  std::string name;		// name of this server
  int _port;

  ControlServer(ControlServerConfig cfg, SessionTable *sessions,
		Catalog *catalog, DeviceChannel *channel);
  ~ControlServer();

  int port(void) { return _port; }
  bool isListening(void) { return net_thread.joinable(); }
  void shutdown(void);
  bool isDone();

  control_context_t *getContext(void) { return &context; }

  bool accept_new_connection(const std::string& client_ip);
  bool register_connection(int sockfd, const std::string& client_ip);
  void unregister_connection(int sockfd);
  std::string get_client_ip(const struct sockaddr& addr);

  void start_tcp_server(void);

  static void
  tcp_client_process(ControlServer *server, int sock);

  /* create an interpreter holding the control commands */
  static Tcl_Interp *create_interp(control_context_t *ctx, bool safe);

  /* result string, or "!TCL_ERROR " followed by the error */
  static std::string eval(Tcl_Interp *interp, const std::string &script);
};

#endif  // CONTROLSERVER_H
