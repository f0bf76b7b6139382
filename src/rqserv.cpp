#include <iostream>
#include <chrono>
#include <thread>
#include <atomic>
#include <memory>
#include <csignal>

#include <tcl.h>

#include "cxxopts.hpp"

#include "rqserv.h"
#include "SimRobot.h"
#include "RobotDevice.h"
#include "DeviceChannel.h"
#include "Catalog.h"
#include "QueueStore.h"
#include "SessionTable.h"
#include "ControlCommands.h"
#include "ControlServer.h"

#include "rqservConfig.h"

static std::atomic<bool> shutdownRequested{false};

void signalHandler(int signum)
{
  // Prevent double execution
  if (shutdownRequested.exchange(true)) {
    std::_Exit(1);  // Immediate exit without destructors
  }
}

/*
 * source the configuration script in a trusted interpreter holding
 * both the control and the configuration commands
 */
static int run_configuration_script(const std::string &path,
				    control_context_t *ctx)
{
  Tcl_Interp *interp = Tcl_CreateInterp();
  if (!interp) {
    std::cerr << "Error initializing tcl interpreter" << std::endl;
    return TCL_ERROR;
  }
  if (Tcl_Init(interp) == TCL_ERROR) {
    std::cerr << "Tcl_Init failed: " << Tcl_GetStringResult(interp)
	      << " (continuing without Tcl library)" << std::endl;
  }

  add_control_commands(interp, ctx);
  add_config_commands(interp, ctx);

  int rc = Tcl_EvalFile(interp, path.c_str());
  if (rc != TCL_OK) {
    std::cerr << "!TCL_ERROR " << Tcl_GetStringResult(interp) << std::endl;
  }
  Tcl_DeleteInterp(interp);
  return rc;
}

/*
 * mainline
 */
int main(int argc, char *argv[])
{
  bool version = false;
  bool help = false;

  int port = 2580;
  int timeout_ms = DeviceChannel::DEFAULT_TIMEOUT_MS;
  std::string catalog_path;
  std::string store_path;
  std::string configuration_script;

  cxxopts::Options options("rqserv", "Robot command queue server");
  options.add_options()
    ("h,help", "Print help", cxxopts::value<bool>(help))
    ("v,version", "Version", cxxopts::value<bool>(version))
    ("p,port", "Control port (0 for any free port)",
     cxxopts::value<int>(port))
    ("t,timeout", "Per command timeout in ms",
     cxxopts::value<int>(timeout_ms))
    ("a,catalog", "Application catalog (JSON)",
     cxxopts::value<std::string>(catalog_path))
    ("s,store", "Directory for saved session queues",
     cxxopts::value<std::string>(store_path))
    ("c,cscript", "Configuration script path",
     cxxopts::value<std::string>(configuration_script));

  try {
    options.parse(argc, argv);
  } catch (const cxxopts::exceptions::exception& e) {
    std::cerr << "Error parsing options: " << e.what() << std::endl;
    // Explicit exit, rather than abort, for testing with ctest.
    exit(-1);
  }

  if (help) {
    std::cout << options.help() << std::endl;
    exit(0);
  }

  if (version) {
    std::cout << rqserv_VERSION << std::endl;
    exit(0);
  }

  if (timeout_ms <= 0) {
    std::cerr << "timeout must be positive" << std::endl;
    exit(-1);
  }

  Tcl_FindExecutable(argv[0]);

  std::signal(SIGINT, signalHandler);
  std::signal(SIGTERM, signalHandler);
  std::signal(SIGPIPE, SIG_IGN);

  // the robot and the one channel every session's batches go through
  SimRobot robot;
  RobotDevice device(&robot);
  DeviceChannel channel(&device, timeout_ms);

  Catalog catalog;
  if (!catalog_path.empty()) {
    std::string error;
    if (catalog.load(catalog_path, error) != Catalog::CATALOG_OK) {
      std::cerr << "Error loading catalog: " << error << std::endl;
      return -1;
    }
    std::cout << "Loaded " << catalog.size() << " applications from "
	      << catalog_path << std::endl;
  }

  std::unique_ptr<QueueStore> store;
  if (!store_path.empty())
    store = std::make_unique<JsonQueueStore>(store_path);
  else
    store = std::make_unique<MemoryQueueStore>();

  SessionTable sessions(store.get());

  ControlServer server(ControlServerConfig("rqserv", port),
		       &sessions, &catalog, &channel);

  if (!server.isListening()) {
    std::cerr << "Could not listen on port " << port << std::endl;
    return -1;
  }

  if (!configuration_script.empty()) {
    if (run_configuration_script(configuration_script,
				 server.getContext()) != TCL_OK) {
      return -1;
    }
  }

  std::cout << "rqserv version " << rqserv_VERSION
	    << " listening on port " << server.port() << std::endl;

  while (!shutdownRequested) {
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
  }

  std::cout << "\nShutting down gracefully..." << std::endl;
  server.shutdown();
  channel.shutdown();
  std::cout << "Clean shutdown complete." << std::endl;
  return 0;
}
