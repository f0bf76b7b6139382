#include "ControlServer.h"

#include <cstring>
#include <cstdio>
#include <chrono>

ControlServer::ControlServer(ControlServerConfig cfg, SessionTable *sessions,
			     Catalog *catalog, DeviceChannel *channel)
{
  m_bDone = false;
  name = cfg.name;
  _port = cfg.port;

  context.sessions = sessions;
  context.catalog = catalog;
  context.channel = channel;
  context.cancel = &m_bDone;
  context.sockfd = -1;

  // create a CR/LF tcp/ip listener if port is not -1
  if (_port >= 0 && open_listener() == 0)
    net_thread = std::thread(&ControlServer::start_tcp_server, this);
}

ControlServer::~ControlServer()
{
  shutdown();

  if (net_thread.joinable())
    net_thread.join();

  /* client threads are detached, wait for them to unregister */
  std::unique_lock<std::mutex> lock(connection_mutex);
  connection_cond.wait(lock, [this] { return active_connections.load() == 0; });
}

void ControlServer::shutdown(void)
{
  if (m_bDone.exchange(true)) return;

  if (listen_fd >= 0) {
    ::shutdown(listen_fd, SHUT_RDWR);
  }

  /* wake clients blocked in recv */
  std::lock_guard<std::mutex> lock(connection_mutex);
  for (int sockfd : active_sockets) {
    ::shutdown(sockfd, SHUT_RDWR);
  }
}

bool ControlServer::isDone()
{
  return m_bDone;
}

/*
 * bind and listen synchronously so the port is known (and any error
 * reported) before the constructor returns
 */
int ControlServer::open_listener(void)
{
  struct sockaddr_in address;
  int on = 1;

  /* Initialise IPv4 address. */
  memset(&address, 0, sizeof(struct sockaddr_in));
  address.sin_family = AF_INET;
  address.sin_port = htons(_port);
  address.sin_addr.s_addr = INADDR_ANY;

  /* Create TCP socket. */
  if ((listen_fd = socket(AF_INET, SOCK_STREAM, 0)) == -1) {
    perror("socket");
    return -1;
  }

  /* Allow this server to reuse the port immediately */
  setsockopt(listen_fd, SOL_SOCKET, SO_REUSEADDR, &on, sizeof(on));

  /* Bind address to socket. */
  if (bind(listen_fd, (const struct sockaddr *) &address,
	   sizeof (struct sockaddr)) == -1) {
    perror("bind");
    close(listen_fd);
    listen_fd = -1;
    return -1;
  }

  /* Listen on socket. */
  if (listen(listen_fd, 20) == -1) {
    perror("listen");
    close(listen_fd);
    listen_fd = -1;
    return -1;
  }

  /* report the real port when asked for any free one */
  socklen_t len = sizeof(address);
  if (getsockname(listen_fd, (struct sockaddr *) &address, &len) == 0) {
    _port = ntohs(address.sin_port);
  }
  return 0;
}

bool ControlServer::accept_new_connection(const std::string& client_ip)
{
  std::lock_guard<std::mutex> lock(connection_mutex);

  // Check total server limit
  if (active_connections.load() >= MAX_TOTAL_CONNECTIONS) {
    return false;
  }

  // Check per-IP limit
  auto ip_count_it = ip_connection_count.find(client_ip);
  int current_ip_connections = (ip_count_it != ip_connection_count.end()) ? ip_count_it->second : 0;

  return current_ip_connections < MAX_CONNECTIONS_PER_IP;
}

/*
 * checked under connection_mutex so a socket registered while shutdown
 * runs is either refused here or woken by shutdown()
 */
bool ControlServer::register_connection(int sockfd, const std::string& client_ip)
{
  std::lock_guard<std::mutex> lock(connection_mutex);
  if (m_bDone) return false;

  active_sockets.insert(sockfd);
  socket_to_ip[sockfd] = client_ip;
  ip_connection_count[client_ip]++;
  active_connections++;
#ifdef LOG_CONNECTIONS
  std::cout << "Client connected from " << client_ip
	    << " (IP connections: " << ip_connection_count[client_ip]
	    << "/" << MAX_CONNECTIONS_PER_IP
	    << ", total: " << active_connections.load()
	    << "/" << MAX_TOTAL_CONNECTIONS << ")" << std::endl;
#endif
  return true;
}

void ControlServer::unregister_connection(int sockfd)
{
  {
    std::lock_guard<std::mutex> lock(connection_mutex);
    auto ip_it = socket_to_ip.find(sockfd);
    std::string client_ip = (ip_it != socket_to_ip.end()) ? ip_it->second : "unknown";

    active_sockets.erase(sockfd);
    if (ip_it != socket_to_ip.end()) {
      socket_to_ip.erase(ip_it);
      if (--ip_connection_count[client_ip] <= 0) {
	ip_connection_count.erase(client_ip);  // Clean up zero counts
      }
    }

    active_connections--;
    close(sockfd);

#ifdef LOG_CONNECTIONS
    std::cout << "Client disconnected from " << client_ip
	      << " (total: " << active_connections.load()
	      << "/" << MAX_TOTAL_CONNECTIONS << ")" << std::endl;
#endif
  }
  connection_cond.notify_all();
}

std::string ControlServer::get_client_ip(const struct sockaddr& addr)
{
  struct sockaddr_in* addr_in = (struct sockaddr_in*)&addr;
  char ip_str[INET_ADDRSTRLEN];
  inet_ntop(AF_INET, &(addr_in->sin_addr), ip_str, INET_ADDRSTRLEN);
  return std::string(ip_str);
}

void ControlServer::start_tcp_server(void)
{
  struct sockaddr client_address;
  socklen_t client_address_len;
  int new_socket_fd;        // client socket
  int on = 1;

  while (!m_bDone) {
    /* Accept connection to client. */
    client_address_len = sizeof(client_address);
    new_socket_fd = accept(listen_fd, &client_address, &client_address_len);
    if (new_socket_fd == -1) {
      if (m_bDone) break;
      perror("accept");
      continue;
    }

    // Get client IP address
    std::string client_ip = get_client_ip(client_address);

    if (m_bDone || !accept_new_connection(client_ip)) {
      if (!m_bDone) {
	std::cout << "Connection limit reached, rejecting client from "
		  << client_ip << std::endl;
      }
      close(new_socket_fd);
      continue;
    }

    if (!register_connection(new_socket_fd, client_ip)) {
      close(new_socket_fd);
      break;
    }

    setsockopt(new_socket_fd, IPPROTO_TCP, TCP_NODELAY, &on, sizeof(on));

    std::thread thr(tcp_client_process, this, new_socket_fd);
    thr.detach();
  }

  close(listen_fd);
  listen_fd = -1;
}

Tcl_Interp *ControlServer::create_interp(control_context_t *ctx, bool safe)
{
  Tcl_Interp *interp = Tcl_CreateInterp();
  if (!interp) {
    std::cerr << "Error initializing tcl interpreter" << std::endl;
    return interp;
  }

  /* clients get no file, exec or socket access */
  if (safe && Tcl_MakeSafe(interp) != TCL_OK) {
    std::cerr << "Error making interpreter safe: "
	      << Tcl_GetStringResult(interp) << std::endl;
    Tcl_DeleteInterp(interp);
    return nullptr;
  }

  add_control_commands(interp, ctx);
  return interp;
}

std::string ControlServer::eval(Tcl_Interp *interp, const std::string &script)
{
  int retcode = Tcl_Eval(interp, script.c_str());
  const char *rcstr = Tcl_GetStringResult(interp);

  if (retcode == TCL_OK) {
    return rcstr ? std::string(rcstr) : std::string();
  }
  return "!TCL_ERROR " + std::string(rcstr ? rcstr : "");
}

/*
 * tcp_client_process is CR/LF oriented
 *  incoming messages are terminated by newlines and responses append these
 */
void
ControlServer::tcp_client_process(ControlServer *server, int sockfd)
{
  int rval;
  int wrval;
  char buf[1024];

  // each client has its own context and interpreter, owned by this thread
  control_context_t context = server->context;
  context.sockfd = sockfd;

  Tcl_Interp *interp = create_interp(&context, true);
  if (!interp) {
    server->unregister_connection(sockfd);
    return;
  }

  std::string script;

  while ((rval = recv(sockfd, buf, sizeof(buf), 0)) > 0) {
    for (int i = 0; i < rval; i++) {
      char c = buf[i];
      if (c == '\n') {
	// shutdown if main server has shutdown
	if (server->m_bDone) break;

	if (!script.empty() && script.back() == '\r') script.pop_back();

	if (script.length() > 0) {
	  std::string s;

	  // ignore certain commands, especially exit...
	  if (!script.compare(0, 4, "exit")) {
	    s = std::string("");
	  } else {
	    s = eval(interp, script);
	  }

	  // one reply line per request
	  s = s+"\n";
	  wrval = send(sockfd, s.c_str(), s.size(), MSG_NOSIGNAL);
	  if (wrval < 0) {      // couldn't send to client
	    break;
	  }
	}
	script = "";
      }
      else {
	script += c;
      }
    }
    if (server->m_bDone) break;
  }

  Tcl_DeleteInterp(interp);

  // close and unregister for proper limit tracking
  server->unregister_connection(sockfd);
}
